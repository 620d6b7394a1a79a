#include "bracketeer/core/tournament/DoubleEliminationBuilder.h"

#include "bracketeer/core/tournament/Seeding.h"
#include "bracketeer/core/tournament/SingleEliminationBuilder.h"

namespace bracketeer::core::tournament {

DoubleEliminationBuilder::DoubleEliminationBuilder(store::IMatchStore& store, util::LogFn log_fn)
    : store_(store), log_fn_(std::move(log_fn)) {}

bool DoubleEliminationBuilder::MatchesFromLosers(const std::vector<model::Match>& source_matches,
                                                 model::RoundId round_id,
                                                 std::vector<model::MatchSpec>& specs,
                                                 BuildError* error) {
    specs.clear();
    if (source_matches.size() % 2 != 0) {
        return Fail(error,
                    BuildFailure::OddMatchCount,
                    "Cannot generate losers round from an odd number of matches");
    }
    for (size_t i = 0; i < source_matches.size(); i += 2) {
        model::MatchSpec spec;
        spec.round_id = round_id;
        spec.input1 = model::MatchSide::LoserOf(source_matches[i].id);
        spec.input2 = model::MatchSide::LoserOf(source_matches[i + 1].id);
        specs.push_back(spec);
    }
    return true;
}

bool DoubleEliminationBuilder::LoserWinnerCrossMatches(const std::vector<model::Match>& losers_matches,
                                                       const std::vector<model::Match>& winners_matches,
                                                       model::RoundId round_id,
                                                       std::vector<model::MatchSpec>& specs,
                                                       BuildError* error) {
    specs.clear();
    if (losers_matches.size() != winners_matches.size()) {
        return Fail(error, BuildFailure::BracketShapeMismatch, "Double elimination bracket shape mismatch");
    }
    for (size_t i = 0; i < losers_matches.size(); ++i) {
        model::MatchSpec spec;
        spec.round_id = round_id;
        spec.input1 = model::MatchSide::WinnerOf(losers_matches[i].id);
        spec.input2 = model::MatchSide::LoserOf(winners_matches[i].id);
        specs.push_back(spec);
    }
    return true;
}

model::MatchSpec DoubleEliminationBuilder::GrandFinalMatch(const model::Match& winners_final,
                                                           const model::Match& losers_final,
                                                           model::RoundId round_id) {
    model::MatchSpec spec;
    spec.round_id = round_id;
    spec.input1 = model::MatchSide::WinnerOf(winners_final.id);
    spec.input2 = model::MatchSide::WinnerOf(losers_final.id);
    return spec;
}

model::MatchSpec DoubleEliminationBuilder::GrandFinalResetMatch(const model::Match& grand_final,
                                                                model::RoundId round_id) {
    model::MatchSpec spec;
    spec.round_id = round_id;
    spec.input1 = model::MatchSide::WinnerOf(grand_final.id);
    spec.input2 = model::MatchSide::LoserOf(grand_final.id);
    return spec;
}

bool DoubleEliminationBuilder::Build(const model::StageItem& stage_item, BuildError* error) {
    if (!ValidateTeamCount(stage_item.team_count, kMinDoubleEliminationTeamCount, error)) {
        return false;
    }
    const auto rounds = store_.GetRoundsForStageItem(stage_item.id);

    const int winners_round_count = SingleEliminationRoundCount(stage_item.team_count, error);
    if (winners_round_count < 0) {
        return false;
    }
    const int losers_round_count = LosersBracketRoundCount(winners_round_count);
    const int total_round_count = winners_round_count + losers_round_count + 2;
    if (winners_round_count < 1 || static_cast<int>(rounds.size()) != total_round_count) {
        return Fail(error,
                    BuildFailure::RoundCountMismatch,
                    "Double elimination for " + std::to_string(stage_item.team_count) + " teams expects " +
                        std::to_string(total_round_count) + " rounds");
    }

    const auto winners_begin = rounds.begin();
    const auto losers_begin = winners_begin + winners_round_count;
    const model::Round& grand_final_round = rounds[rounds.size() - 2];
    const model::Round& grand_final_reset_round = rounds[rounds.size() - 1];

    std::vector<std::vector<model::Match>> winners_matches_per_round;
    std::vector<model::Match> winners_matches;
    const int bracket_size = BracketSize(static_cast<int>(stage_item.inputs.size()));
    if (!CreateMatches(store_,
                       SingleEliminationBuilder::FirstRoundMatches(winners_begin->id, stage_item.inputs, bracket_size),
                       winners_matches,
                       error)) {
        return false;
    }
    winners_matches_per_round.push_back(winners_matches);

    std::vector<model::MatchSpec> specs;
    for (auto it = winners_begin + 1; it != losers_begin; ++it) {
        if (!SingleEliminationBuilder::SubsequentRoundMatches(winners_matches, it->id, specs, error) ||
            !CreateMatches(store_, specs, winners_matches, error)) {
            return false;
        }
        winners_matches_per_round.push_back(winners_matches);
    }

    int losers_round_cursor = 0;
    std::vector<model::Match> losers_matches;
    if (!MatchesFromLosers(winners_matches_per_round[0], losers_begin[losers_round_cursor].id, specs, error) ||
        !CreateMatches(store_, specs, losers_matches, error)) {
        return false;
    }
    ++losers_round_cursor;

    for (int winners_round_index = 1; winners_round_index < winners_round_count; ++winners_round_index) {
        if (losers_round_cursor >= losers_round_count) {
            return Fail(error, BuildFailure::BracketConstructionIncomplete, "Ran out of loser bracket rounds");
        }
        if (!LoserWinnerCrossMatches(losers_matches,
                                     winners_matches_per_round[static_cast<size_t>(winners_round_index)],
                                     losers_begin[losers_round_cursor].id,
                                     specs,
                                     error) ||
            !CreateMatches(store_, specs, losers_matches, error)) {
            return false;
        }
        ++losers_round_cursor;

        const bool is_last_winners_round = winners_round_index == winners_round_count - 1;
        if (!is_last_winners_round) {
            if (losers_round_cursor >= losers_round_count) {
                return Fail(error, BuildFailure::BracketConstructionIncomplete, "Ran out of loser bracket rounds");
            }
            if (!SingleEliminationBuilder::SubsequentRoundMatches(
                    losers_matches, losers_begin[losers_round_cursor].id, specs, error) ||
                !CreateMatches(store_, specs, losers_matches, error)) {
                return false;
            }
            ++losers_round_cursor;
        }
    }

    if (losers_round_cursor != losers_round_count) {
        return Fail(error,
                    BuildFailure::BracketConstructionIncomplete,
                    "Failed to construct all loser bracket rounds");
    }
    if (winners_matches_per_round.back().size() != 1 || losers_matches.size() != 1) {
        return Fail(error,
                    BuildFailure::BracketShapeMismatch,
                    "Winners and losers brackets must each end in a single final");
    }

    auto grand_final = store_.CreateMatch(GrandFinalMatch(
        winners_matches_per_round.back().front(), losers_matches.front(), grand_final_round.id));
    if (!grand_final) {
        return Fail(error, BuildFailure::StoreFailure, "Failed to create grand final");
    }
    if (!store_.CreateMatch(GrandFinalResetMatch(*grand_final, grand_final_reset_round.id))) {
        return Fail(error, BuildFailure::StoreFailure, "Failed to create grand final reset");
    }

    util::Emit(log_fn_,
               "[builder] Double elimination '" + stage_item.name + "' built: " +
                   std::to_string(winners_round_count) + " winners rounds, " +
                   std::to_string(losers_round_count) + " losers rounds");
    return true;
}

}  // namespace bracketeer::core::tournament
