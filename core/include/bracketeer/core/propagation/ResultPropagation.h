#pragma once

#include "bracketeer/core/model/BracketTypes.h"
#include "bracketeer/core/store/MatchStore.h"
#include "bracketeer/core/util/LogSink.h"

#include <map>
#include <optional>
#include <set>
#include <string>

namespace bracketeer::core::propagation {

// Upper bound on bye resolutions per call; a 64-team double elimination
// bracket needs far fewer.
constexpr int kMaxByeIterations = 4096;

using MatchIdSet = std::optional<std::set<model::MatchId>>;

// Determines which matches in rounds after current_round_id get new resolved
// inputs once the matches of that round (restricted to match_ids when given)
// are taken as settled. Updates chain within one pass: a changed match feeds
// matches in later rounds. The restricting matches themselves are never part
// of the result.
std::map<model::MatchId, model::Match> InputsToUpdateInSubsequentRounds(model::RoundId current_round_id,
                                                                        const model::StageItem& stage_item,
                                                                        const MatchIdSet& match_ids);

// First match (earliest round first) with exactly one resolved input, equal
// scores, and an empty side that can never be filled: it has no source, or
// its source match finished (or can never be played) without yielding an
// input. A side still waiting on an unplayed match is not a bye.
std::optional<model::Match> FindByeCandidate(const model::StageItem& stage_item);

class ResultPropagator {
public:
    explicit ResultPropagator(store::IMatchStore& store, util::LogFn log_fn = {});

    bool UpdateInputsInSubsequentRounds(model::RoundId current_round_id,
                                        const model::StageItem& stage_item,
                                        const MatchIdSet& match_ids,
                                        std::string* error);

    // One pass per round, earliest first, reloading between rounds.
    bool UpdateInputsInCompleteStageItem(model::StageItemId stage_item_id, std::string* error);

    // Scores every bye 1-0 for the populated side and re-propagates from it,
    // restarting from the earliest round until no bye remains.
    bool AutoAdvanceByes(model::StageItemId stage_item_id, int* resolved_count, std::string* error);

    // Short-circuits the grand final reset with a 1-0 when the winners
    // bracket finalist (side 1) wins the grand final outright.
    bool MaybeAutoCompleteReset(model::StageItemId stage_item_id,
                                model::MatchId updated_match_id,
                                bool* completed,
                                std::string* error);

private:
    store::IMatchStore& store_;
    util::LogFn log_fn_;
};

}  // namespace bracketeer::core::propagation
