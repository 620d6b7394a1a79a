#pragma once

#include "bracketeer/core/store/MatchStore.h"

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace bracketeer::core::store {

// Id-indexed arena holding every entity of every tournament. Rounds, stage
// items and stages are stored flat and assembled into graphs on read.
class InMemoryStore final : public IMatchStore, public ITournamentDirectory {
public:
    struct Contents {
        std::vector<model::Tournament> tournaments;
        std::vector<model::Court> courts;
        std::vector<model::Stage> stages;
        std::vector<model::StageItem> stage_items;
        std::vector<model::StageItemInput> inputs;
        std::vector<model::Round> rounds;
        std::vector<model::Match> matches;
    };

    InMemoryStore() = default;
    InMemoryStore(const InMemoryStore&) = delete;
    InMemoryStore& operator=(const InMemoryStore&) = delete;

    std::optional<model::Tournament> AddTournament(model::Tournament tournament);
    std::optional<model::Court> AddCourt(model::TournamentId tournament_id, const std::string& name);
    std::optional<model::Stage> AddStage(model::TournamentId tournament_id, const std::string& name);
    std::optional<model::StageItem> AddStageItem(model::StageId stage_id,
                                                 const std::string& name,
                                                 model::StageType type,
                                                 int team_count);
    // Rejects a second input for the same (stage item, slot).
    std::optional<model::StageItemInput> AddStageItemInput(model::StageItemInput input);

    std::vector<model::Tournament> ListTournaments() const;
    std::vector<model::StageItemInput> GetInputsForStageItem(model::StageItemId stage_item_id) const;

    Contents Export() const;
    bool Import(const Contents& contents, std::string* error);

    std::optional<model::Round> CreateRound(model::StageItemId stage_item_id,
                                            const std::string& name,
                                            bool is_draft) override;
    std::optional<model::Match> CreateMatch(const model::MatchSpec& spec) override;

    bool UpdateMatchInputs(model::MatchId match_id,
                           std::optional<model::StageItemInputId> input1_id,
                           std::optional<model::StageItemInputId> input2_id) override;
    bool UpdateMatchScores(model::MatchId match_id, int score1, int score2) override;
    bool UpdateMatchOverrides(model::MatchId match_id,
                              std::optional<int> custom_duration_minutes,
                              std::optional<int> custom_margin_minutes) override;
    bool UpdateMatchSchedule(model::MatchId match_id,
                             model::CourtId court_id,
                             model::TimePoint start_time,
                             int position_in_schedule) override;
    bool ClearMatchSchedule(model::MatchId match_id) override;

    std::optional<model::Match> GetMatch(model::MatchId match_id) const override;
    std::optional<model::Round> GetRound(model::RoundId round_id) const override;
    std::vector<model::Round> GetRoundsForStageItem(model::StageItemId stage_item_id) const override;
    std::optional<model::StageItem> GetStageItem(model::StageItemId stage_item_id) const override;
    std::vector<model::Stage> GetStages(model::TournamentId tournament_id) const override;
    std::optional<model::TournamentId> TournamentOfStageItem(model::StageItemId stage_item_id) const override;

    std::optional<model::Tournament> GetTournament(model::TournamentId tournament_id) const override;
    std::vector<model::Court> ListCourts(model::TournamentId tournament_id) const override;

private:
    std::vector<model::Round> RoundsLocked(model::StageItemId stage_item_id) const;
    std::optional<model::StageItem> StageItemLocked(model::StageItemId stage_item_id) const;

    mutable std::mutex mutex_;
    std::map<model::TournamentId, model::Tournament> tournaments_;
    std::map<model::CourtId, model::Court> courts_;
    std::map<model::StageId, model::Stage> stages_;
    std::map<model::StageItemId, model::StageItem> stage_items_;
    std::map<model::StageItemInputId, model::StageItemInput> inputs_;
    std::map<model::RoundId, model::Round> rounds_;
    std::map<model::MatchId, model::Match> matches_;
    int next_id_ = 1;
};

}  // namespace bracketeer::core::store
