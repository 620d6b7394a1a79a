#pragma once

#include "bracketeer/core/model/BracketTypes.h"

#include <optional>
#include <string>
#include <vector>

namespace bracketeer::core::store {

class IMatchStore {
public:
    virtual ~IMatchStore() = default;

    virtual std::optional<model::Round> CreateRound(model::StageItemId stage_item_id,
                                                    const std::string& name,
                                                    bool is_draft) = 0;
    virtual std::optional<model::Match> CreateMatch(const model::MatchSpec& spec) = 0;

    virtual bool UpdateMatchInputs(model::MatchId match_id,
                                   std::optional<model::StageItemInputId> input1_id,
                                   std::optional<model::StageItemInputId> input2_id) = 0;
    virtual bool UpdateMatchScores(model::MatchId match_id, int score1, int score2) = 0;
    virtual bool UpdateMatchOverrides(model::MatchId match_id,
                                      std::optional<int> custom_duration_minutes,
                                      std::optional<int> custom_margin_minutes) = 0;
    virtual bool UpdateMatchSchedule(model::MatchId match_id,
                                     model::CourtId court_id,
                                     model::TimePoint start_time,
                                     int position_in_schedule) = 0;
    virtual bool ClearMatchSchedule(model::MatchId match_id) = 0;

    virtual std::optional<model::Match> GetMatch(model::MatchId match_id) const = 0;
    virtual std::optional<model::Round> GetRound(model::RoundId round_id) const = 0;
    // Ordered by increasing round id.
    virtual std::vector<model::Round> GetRoundsForStageItem(model::StageItemId stage_item_id) const = 0;
    virtual std::optional<model::StageItem> GetStageItem(model::StageItemId stage_item_id) const = 0;
    // Ordered by stage id, stage items by id.
    virtual std::vector<model::Stage> GetStages(model::TournamentId tournament_id) const = 0;
    virtual std::optional<model::TournamentId> TournamentOfStageItem(model::StageItemId stage_item_id) const = 0;
};

class ITournamentDirectory {
public:
    virtual ~ITournamentDirectory() = default;

    virtual std::optional<model::Tournament> GetTournament(model::TournamentId tournament_id) const = 0;
    // Order defines court index assignment in bulk scheduling.
    virtual std::vector<model::Court> ListCourts(model::TournamentId tournament_id) const = 0;
};

}  // namespace bracketeer::core::store
