#include "bracketeer/core/runtime/TournamentLockRegistry.h"

#include <gtest/gtest.h>

#include <atomic>
#include <thread>
#include <vector>

namespace bracketeer::core::runtime {
namespace {

// std::mutex must not be try-locked by the thread that owns it.
bool CanLeaseFromAnotherThread(TournamentLockRegistry& registry, model::TournamentId tournament_id) {
    bool acquired = false;
    std::thread probe([&] { acquired = registry.TryAcquire(tournament_id).valid(); });
    probe.join();
    return acquired;
}

TEST(TournamentLockRegistryTest, SecondLeaseOnSameTournamentIsRefused) {
    TournamentLockRegistry registry;
    auto lease = registry.Acquire(1);
    EXPECT_TRUE(lease.valid());
    EXPECT_EQ(lease.tournament_id(), 1);

    EXPECT_FALSE(CanLeaseFromAnotherThread(registry, 1));
    EXPECT_TRUE(CanLeaseFromAnotherThread(registry, 2));

    lease.Release();
    EXPECT_FALSE(lease.valid());
    EXPECT_TRUE(CanLeaseFromAnotherThread(registry, 1));
}

TEST(TournamentLockRegistryTest, MovedLeaseKeepsTheLock) {
    TournamentLockRegistry registry;
    auto first = registry.Acquire(3);
    TournamentLease second = std::move(first);
    EXPECT_FALSE(first.valid());
    EXPECT_TRUE(second.valid());
    EXPECT_FALSE(CanLeaseFromAnotherThread(registry, 3));
    {
        TournamentLease scoped = std::move(second);
    }
    EXPECT_TRUE(CanLeaseFromAnotherThread(registry, 3));
}

TEST(TournamentLockRegistryTest, SerializesWorkOnOneTournament) {
    TournamentLockRegistry registry;
    int counter = 0;
    std::atomic<int> inside{0};
    std::atomic<bool> overlapped{false};

    std::vector<std::thread> workers;
    for (int t = 0; t < 4; ++t) {
        workers.emplace_back([&] {
            for (int i = 0; i < 500; ++i) {
                auto lease = registry.Acquire(9);
                if (inside.fetch_add(1) != 0) {
                    overlapped = true;
                }
                ++counter;
                inside.fetch_sub(1);
            }
        });
    }
    for (auto& worker : workers) {
        worker.join();
    }
    EXPECT_EQ(counter, 2000);
    EXPECT_FALSE(overlapped.load());
}

}  // namespace
}  // namespace bracketeer::core::runtime
