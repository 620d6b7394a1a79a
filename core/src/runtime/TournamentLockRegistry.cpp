#include "bracketeer/core/runtime/TournamentLockRegistry.h"

#include <utility>

namespace bracketeer::core::runtime {

TournamentLease::TournamentLease(model::TournamentId tournament_id, std::unique_lock<std::mutex> lock)
    : tournament_id_(tournament_id), lock_(std::move(lock)) {}

TournamentLease::TournamentLease(TournamentLease&& other) noexcept
    : tournament_id_(other.tournament_id_), lock_(std::move(other.lock_)) {}

TournamentLease& TournamentLease::operator=(TournamentLease&& other) noexcept {
    if (this != &other) {
        Release();
        tournament_id_ = other.tournament_id_;
        lock_ = std::move(other.lock_);
    }
    return *this;
}

TournamentLease::~TournamentLease() {
    Release();
}

void TournamentLease::Release() {
    if (lock_.owns_lock()) {
        lock_.unlock();
    }
}

TournamentLease TournamentLockRegistry::Acquire(model::TournamentId tournament_id) {
    std::unique_lock<std::mutex> lock(MutexFor(tournament_id));
    return TournamentLease(tournament_id, std::move(lock));
}

TournamentLease TournamentLockRegistry::TryAcquire(model::TournamentId tournament_id) {
    std::unique_lock<std::mutex> lock(MutexFor(tournament_id), std::try_to_lock);
    if (!lock.owns_lock()) {
        return TournamentLease();
    }
    return TournamentLease(tournament_id, std::move(lock));
}

std::mutex& TournamentLockRegistry::MutexFor(model::TournamentId tournament_id) {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    auto& slot = mutexes_[tournament_id];
    if (!slot) {
        slot = std::make_unique<std::mutex>();
    }
    return *slot;
}

}  // namespace bracketeer::core::runtime
