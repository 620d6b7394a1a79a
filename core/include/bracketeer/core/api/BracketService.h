#pragma once

#include "bracketeer/core/model/BracketTypes.h"
#include "bracketeer/core/propagation/ResultPropagation.h"
#include "bracketeer/core/runtime/TournamentLockRegistry.h"
#include "bracketeer/core/store/InMemoryStore.h"
#include "bracketeer/core/tournament/BuildError.h"
#include "bracketeer/core/tournament/RoundRobinScheduler.h"
#include "bracketeer/core/util/LogSink.h"

#include <deque>
#include <mutex>
#include <optional>
#include <string>

namespace bracketeer::core::api {

// Entry point for everything that mutates a tournament. Every operation holds
// the tournament's lease from its first read to its last write.
class BracketService {
public:
    explicit BracketService(store::InMemoryStore& store);

    BracketService(const BracketService&) = delete;
    BracketService& operator=(const BracketService&) = delete;

    // Every log line is also appended to this file when set.
    void SetLogPath(const std::string& path);
    // Extra sink, e.g. the console.
    void SetLogSink(util::LogFn sink);

    bool BuildStageItem(model::StageItemId stage_item_id, tournament::BuildError* error);
    // Builds every stage item of the tournament that has no rounds yet, in id
    // order.
    bool BuildTournament(model::TournamentId tournament_id, tournament::BuildError* error);

    bool PropagateResults(model::RoundId round_id, const propagation::MatchIdSet& match_ids, std::string* error);
    bool AutoAdvanceByes(model::StageItemId stage_item_id, int* resolved_count, std::string* error);

    // Stores the scores and overrides, re-sequences the match's court when an
    // override changed, then for elimination formats propagates the result,
    // advances byes and applies the grand final reset rule.
    bool ReportMatchScore(model::MatchId match_id,
                          int score1,
                          int score2,
                          std::optional<int> custom_duration_minutes,
                          std::optional<int> custom_margin_minutes,
                          std::string* error);

    bool ScheduleAllUnscheduled(model::TournamentId tournament_id, std::string* error);
    bool RescheduleMatch(model::TournamentId tournament_id,
                         model::MatchId match_id,
                         model::CourtId new_court_id,
                         int new_position,
                         std::string* error);
    bool RenormalizeSchedule(model::TournamentId tournament_id, std::string* error);

    std::string GetLastLogLines(int n) const;

private:
    bool TournamentOfMatch(model::MatchId match_id,
                           model::Match& match,
                           model::Round& round,
                           model::TournamentId& tournament_id,
                           std::string* error) const;
    util::LogFn Logger();
    void AppendLogLine(const std::string& line);

    store::InMemoryStore& store_;
    runtime::TournamentLockRegistry locks_;
    tournament::RoundRobinScheduler round_robin_generator_;

    mutable std::mutex log_mutex_;
    std::deque<std::string> log_lines_;
    size_t max_log_lines_ = 2000;
    std::string log_path_;
    util::LogFn log_sink_;
};

}  // namespace bracketeer::core::api
