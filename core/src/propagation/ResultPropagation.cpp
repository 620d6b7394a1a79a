#include "bracketeer/core/propagation/ResultPropagation.h"

#include <algorithm>
#include <vector>

namespace bracketeer::core::propagation {

namespace {

bool SetError(std::string* error, const std::string& message) {
    if (error) {
        *error = message;
    }
    return false;
}

std::vector<const model::Round*> SortedRounds(const model::StageItem& stage_item) {
    std::vector<const model::Round*> rounds;
    rounds.reserve(stage_item.rounds.size());
    for (const auto& round : stage_item.rounds) {
        rounds.push_back(&round);
    }
    std::sort(rounds.begin(), rounds.end(), [](const auto* a, const auto* b) { return a->id < b->id; });
    return rounds;
}

void ResolveSide(const model::MatchSide& side,
                 const std::map<model::MatchId, model::Match>& affected,
                 std::optional<model::StageItemInputId>& value) {
    if (side.source != model::MatchSide::Source::WinnerOf && side.source != model::MatchSide::Source::LoserOf) {
        return;
    }
    auto it = affected.find(side.ref_id);
    if (it == affected.end()) {
        return;
    }
    value = side.source == model::MatchSide::Source::WinnerOf ? it->second.winner() : it->second.loser();
}

// A side without an input is either waiting on an unplayed match or will
// never receive one. Only the latter makes the opposite side a bye.
class SideSettlement {
public:
    explicit SideSettlement(const model::StageItem& stage_item) {
        for (const auto& round : stage_item.rounds) {
            for (const auto& match : round.matches) {
                by_id_[match.id] = &match;
            }
        }
        max_depth_ = static_cast<int>(stage_item.rounds.size()) + 1;
    }

    bool IsSettledEmpty(const model::MatchSide& side) const { return IsSettledEmpty(side, 0); }

private:
    bool IsSettledEmpty(const model::MatchSide& side, int depth) const {
        if (side.has_input()) {
            return false;
        }
        if (side.source == model::MatchSide::Source::Empty || side.source == model::MatchSide::Source::Direct) {
            return true;
        }
        auto it = by_id_.find(side.ref_id);
        if (it == by_id_.end() || depth > max_depth_) {
            return true;
        }
        const model::Match& source = *it->second;
        if (source.is_decided()) {
            return true;
        }
        return IsSettledEmpty(source.input1, depth + 1) && IsSettledEmpty(source.input2, depth + 1);
    }

    std::map<model::MatchId, const model::Match*> by_id_;
    int max_depth_ = 0;
};

}  // namespace

std::map<model::MatchId, model::Match> InputsToUpdateInSubsequentRounds(model::RoundId current_round_id,
                                                                        const model::StageItem& stage_item,
                                                                        const MatchIdSet& match_ids) {
    std::map<model::MatchId, model::Match> affected;
    const model::Round* current_round = stage_item.FindRound(current_round_id);
    if (current_round == nullptr) {
        return affected;
    }

    std::set<model::MatchId> causes;
    for (const auto& match : current_round->matches) {
        if (!match_ids || match_ids->count(match.id) > 0) {
            affected[match.id] = match;
            causes.insert(match.id);
        }
    }

    for (const auto* round : SortedRounds(stage_item)) {
        if (round->id <= current_round->id) {
            continue;
        }
        for (const auto& match : round->matches) {
            auto input1 = match.input1.resolved_input_id;
            auto input2 = match.input2.resolved_input_id;
            ResolveSide(match.input1, affected, input1);
            ResolveSide(match.input2, affected, input2);
            if (input1 == match.input1.resolved_input_id && input2 == match.input2.resolved_input_id) {
                continue;
            }
            model::Match updated = match;
            updated.input1.resolved_input_id = input1;
            updated.input2.resolved_input_id = input2;
            affected[match.id] = updated;
        }
    }

    for (model::MatchId cause : causes) {
        affected.erase(cause);
    }
    return affected;
}

std::optional<model::Match> FindByeCandidate(const model::StageItem& stage_item) {
    const SideSettlement settlement(stage_item);
    for (const auto* round : SortedRounds(stage_item)) {
        for (const auto& match : round->matches) {
            const bool has_single_input = match.input1.has_input() != match.input2.has_input();
            const bool has_no_result_yet = match.score1 == match.score2;
            if (!has_single_input || !has_no_result_yet) {
                continue;
            }
            const auto& empty_side = match.input1.has_input() ? match.input2 : match.input1;
            if (settlement.IsSettledEmpty(empty_side)) {
                return match;
            }
        }
    }
    return std::nullopt;
}

ResultPropagator::ResultPropagator(store::IMatchStore& store, util::LogFn log_fn)
    : store_(store), log_fn_(std::move(log_fn)) {}

bool ResultPropagator::UpdateInputsInSubsequentRounds(model::RoundId current_round_id,
                                                      const model::StageItem& stage_item,
                                                      const MatchIdSet& match_ids,
                                                      std::string* error) {
    if (stage_item.FindRound(current_round_id) == nullptr) {
        return SetError(error,
                        "Round " + std::to_string(current_round_id) + " is not part of stage item " +
                            std::to_string(stage_item.id));
    }
    const auto updates = InputsToUpdateInSubsequentRounds(current_round_id, stage_item, match_ids);
    for (const auto& entry : updates) {
        const auto& match = entry.second;
        if (!store_.UpdateMatchInputs(match.id, match.input1.resolved_input_id, match.input2.resolved_input_id)) {
            return SetError(error, "Failed to update inputs of match " + std::to_string(match.id));
        }
    }
    if (!updates.empty()) {
        util::Emit(log_fn_,
                   "[propagation] Round " + std::to_string(current_round_id) + " updated " +
                       std::to_string(updates.size()) + " downstream matches");
    }
    return true;
}

bool ResultPropagator::UpdateInputsInCompleteStageItem(model::StageItemId stage_item_id, std::string* error) {
    auto stage_item = store_.GetStageItem(stage_item_id);
    if (!stage_item) {
        return SetError(error, "Unknown stage item " + std::to_string(stage_item_id));
    }

    std::vector<model::RoundId> round_ids;
    for (const auto& round : stage_item->rounds) {
        round_ids.push_back(round.id);
    }
    std::sort(round_ids.begin(), round_ids.end());

    for (model::RoundId round_id : round_ids) {
        stage_item = store_.GetStageItem(stage_item_id);
        if (!stage_item) {
            return SetError(error, "Stage item " + std::to_string(stage_item_id) + " disappeared");
        }
        const model::Round* round = stage_item->FindRound(round_id);
        if (round == nullptr) {
            return SetError(error, "Round " + std::to_string(round_id) + " disappeared");
        }
        std::set<model::MatchId> match_ids;
        for (const auto& match : round->matches) {
            match_ids.insert(match.id);
        }
        if (!UpdateInputsInSubsequentRounds(round_id, *stage_item, match_ids, error)) {
            return false;
        }
    }
    return true;
}

bool ResultPropagator::AutoAdvanceByes(model::StageItemId stage_item_id, int* resolved_count, std::string* error) {
    int resolved = 0;
    for (int iteration = 0; iteration < kMaxByeIterations; ++iteration) {
        auto stage_item = store_.GetStageItem(stage_item_id);
        if (!stage_item) {
            return SetError(error, "Unknown stage item " + std::to_string(stage_item_id));
        }
        const auto candidate = FindByeCandidate(*stage_item);
        if (!candidate) {
            if (resolved_count) {
                *resolved_count = resolved;
            }
            if (resolved > 0) {
                util::Emit(log_fn_,
                           "[propagation] Advanced " + std::to_string(resolved) + " byes in '" +
                               stage_item->name + "'");
            }
            return true;
        }

        const int score1 = candidate->input1.has_input() ? 1 : 0;
        const int score2 = candidate->input2.has_input() ? 1 : 0;
        if (!store_.UpdateMatchScores(candidate->id, score1, score2)) {
            return SetError(error, "Failed to score bye match " + std::to_string(candidate->id));
        }
        ++resolved;

        stage_item = store_.GetStageItem(stage_item_id);
        if (!stage_item) {
            return SetError(error, "Stage item " + std::to_string(stage_item_id) + " disappeared");
        }
        if (!UpdateInputsInSubsequentRounds(
                candidate->round_id, *stage_item, std::set<model::MatchId>{candidate->id}, error)) {
            return false;
        }
    }
    return SetError(error,
                    "Bye resolution did not settle within " + std::to_string(kMaxByeIterations) + " iterations");
}

bool ResultPropagator::MaybeAutoCompleteReset(model::StageItemId stage_item_id,
                                              model::MatchId updated_match_id,
                                              bool* completed,
                                              std::string* error) {
    if (completed) {
        *completed = false;
    }
    const auto stage_item = store_.GetStageItem(stage_item_id);
    if (!stage_item) {
        return SetError(error, "Unknown stage item " + std::to_string(stage_item_id));
    }
    const auto rounds = SortedRounds(*stage_item);
    if (rounds.size() < 2) {
        return true;
    }

    const model::Round& grand_final_round = *rounds[rounds.size() - 2];
    const model::Round& reset_round = *rounds[rounds.size() - 1];
    if (grand_final_round.matches.size() != 1 || reset_round.matches.size() != 1) {
        return true;
    }

    const model::Match& grand_final = grand_final_round.matches.front();
    const model::Match& reset = reset_round.matches.front();
    if (grand_final.id != updated_match_id || !grand_final.is_decided()) {
        return true;
    }
    const bool winners_bracket_champion_won = grand_final.score1 > grand_final.score2;
    if (!winners_bracket_champion_won || reset.is_played()) {
        return true;
    }

    if (!store_.UpdateMatchScores(reset.id, 1, 0)) {
        return SetError(error, "Failed to complete grand final reset " + std::to_string(reset.id));
    }
    if (completed) {
        *completed = true;
    }
    util::Emit(log_fn_, "[propagation] Grand final reset not needed in '" + stage_item->name + "'");
    return true;
}

}  // namespace bracketeer::core::propagation
