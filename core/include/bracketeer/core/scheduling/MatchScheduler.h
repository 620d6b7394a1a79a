#pragma once

#include "bracketeer/core/model/BracketTypes.h"
#include "bracketeer/core/store/MatchStore.h"
#include "bracketeer/core/util/LogSink.h"

#include <map>
#include <string>
#include <vector>

namespace bracketeer::core::scheduling {

// A scheduled match with a position that may be fractional while a drag is
// being resolved.
struct MatchPosition {
    model::Match match;
    double position = 0.0;
};

std::vector<MatchPosition> ScheduledMatches(const std::vector<model::Stage>& stages);
// Per court, ordered by start time.
std::map<model::CourtId, std::vector<MatchPosition>> ScheduledMatchesPerCourt(const std::vector<model::Stage>& stages);

class MatchScheduler {
public:
    MatchScheduler(store::IMatchStore& store, const store::ITournamentDirectory& directory, util::LogFn log_fn = {});

    // Assigns every unscheduled match a court and a start time, round by
    // round, in batches of one match per court. Never fails for lack of
    // courts; later batches just start later.
    bool ScheduleAllUnscheduled(model::TournamentId tournament_id, std::string* error);

    // Drags a match to (new_court_id, new_position) and re-sequences the
    // courts involved, then normalizes the whole schedule.
    bool RescheduleMatch(model::TournamentId tournament_id,
                         model::MatchId match_id,
                         model::CourtId new_court_id,
                         int new_position,
                         std::string* error);

    // Lays the court's matches back to back from the tournament start in
    // position order, renumbering positions from 0.
    bool ReorderMatchesForCourt(const model::Tournament& tournament,
                                const std::vector<MatchPosition>& scheduled_matches,
                                model::CourtId court_id,
                                std::string* error);

    // Canonical recompute: matches sharing a position start together, each
    // slot lasts as long as its longest match, positions become dense.
    bool UpdateStartTimesOfMatches(model::TournamentId tournament_id, std::string* error);

private:
    store::IMatchStore& store_;
    const store::ITournamentDirectory& directory_;
    util::LogFn log_fn_;
};

}  // namespace bracketeer::core::scheduling
