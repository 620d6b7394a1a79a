#pragma once

#include "bracketeer/core/model/BracketTypes.h"
#include "bracketeer/core/store/MatchStore.h"
#include "bracketeer/core/tournament/BuildError.h"
#include "bracketeer/core/util/LogSink.h"

#include <vector>

namespace bracketeer::core::tournament {

// Inserts the specs in order, returning the stored matches.
bool CreateMatches(store::IMatchStore& store,
                   const std::vector<model::MatchSpec>& specs,
                   std::vector<model::Match>& created,
                   BuildError* error);

class SingleEliminationBuilder {
public:
    explicit SingleEliminationBuilder(store::IMatchStore& store, util::LogFn log_fn = {});

    // Seeds the inputs (ordered by slot) into bracket_size positions. A pairing
    // with a single real input becomes a pre-resolved 1-0 bye with the input
    // in side 1; a pairing with no inputs produces no match.
    static std::vector<model::MatchSpec> FirstRoundMatches(model::RoundId round_id,
                                                           std::vector<model::StageItemInput> inputs,
                                                           int bracket_size);

    // Pairs matches (2i, 2i+1) into "winner of" / "winner of" matches.
    static bool SubsequentRoundMatches(const std::vector<model::Match>& previous_matches,
                                       model::RoundId round_id,
                                       std::vector<model::MatchSpec>& specs,
                                       BuildError* error);

    bool Build(const model::StageItem& stage_item, BuildError* error);

private:
    store::IMatchStore& store_;
    util::LogFn log_fn_;
};

}  // namespace bracketeer::core::tournament
