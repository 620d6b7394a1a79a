#pragma once

#include "bracketeer/core/model/BracketTypes.h"

#include <map>
#include <memory>
#include <mutex>

namespace bracketeer::core::runtime {

class TournamentLockRegistry;

// Holds the tournament's mutex until destroyed or released.
class TournamentLease {
public:
    TournamentLease() = default;
    TournamentLease(const TournamentLease&) = delete;
    TournamentLease& operator=(const TournamentLease&) = delete;
    TournamentLease(TournamentLease&& other) noexcept;
    TournamentLease& operator=(TournamentLease&& other) noexcept;
    ~TournamentLease();

    model::TournamentId tournament_id() const { return tournament_id_; }
    bool valid() const { return lock_.owns_lock(); }
    void Release();

private:
    friend class TournamentLockRegistry;
    TournamentLease(model::TournamentId tournament_id, std::unique_lock<std::mutex> lock);

    model::TournamentId tournament_id_ = 0;
    std::unique_lock<std::mutex> lock_;
};

class TournamentLockRegistry {
public:
    TournamentLockRegistry() = default;
    TournamentLockRegistry(const TournamentLockRegistry&) = delete;
    TournamentLockRegistry& operator=(const TournamentLockRegistry&) = delete;

    // Blocks while another lease for the same tournament is alive.
    TournamentLease Acquire(model::TournamentId tournament_id);
    TournamentLease TryAcquire(model::TournamentId tournament_id);

private:
    std::mutex& MutexFor(model::TournamentId tournament_id);

    std::mutex registry_mutex_;
    std::map<model::TournamentId, std::unique_ptr<std::mutex>> mutexes_;
};

}  // namespace bracketeer::core::runtime
