#pragma once

#include "bracketeer/core/model/BracketTypes.h"
#include "bracketeer/core/store/MatchStore.h"
#include "bracketeer/core/tournament/BuildError.h"
#include "bracketeer/core/util/LogSink.h"

#include <vector>

namespace bracketeer::core::tournament {

class DoubleEliminationBuilder {
public:
    explicit DoubleEliminationBuilder(store::IMatchStore& store, util::LogFn log_fn = {});

    // Losers round 1: pairs the losers of consecutive winners round 1 matches.
    static bool MatchesFromLosers(const std::vector<model::Match>& source_matches,
                                  model::RoundId round_id,
                                  std::vector<model::MatchSpec>& specs,
                                  BuildError* error);

    // One match per pair: winner of the losers match against the loser of the
    // winners match dropping down.
    static bool LoserWinnerCrossMatches(const std::vector<model::Match>& losers_matches,
                                        const std::vector<model::Match>& winners_matches,
                                        model::RoundId round_id,
                                        std::vector<model::MatchSpec>& specs,
                                        BuildError* error);

    static model::MatchSpec GrandFinalMatch(const model::Match& winners_final,
                                            const model::Match& losers_final,
                                            model::RoundId round_id);
    static model::MatchSpec GrandFinalResetMatch(const model::Match& grand_final, model::RoundId round_id);

    // Rounds are expected in order: winners rounds, losers rounds, grand final,
    // grand final reset.
    bool Build(const model::StageItem& stage_item, BuildError* error);

private:
    store::IMatchStore& store_;
    util::LogFn log_fn_;
};

}  // namespace bracketeer::core::tournament
