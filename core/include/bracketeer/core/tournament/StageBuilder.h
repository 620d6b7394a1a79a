#pragma once

#include "bracketeer/core/model/BracketTypes.h"
#include "bracketeer/core/store/MatchStore.h"
#include "bracketeer/core/tournament/BuildError.h"
#include "bracketeer/core/tournament/PairingGenerator.h"
#include "bracketeer/core/util/LogSink.h"

#include <string>
#include <vector>

namespace bracketeer::core::tournament {

class StageBuilder {
public:
    // round_robin_generator may be null; round robin items then only get
    // their rounds and the matches are left to the caller.
    StageBuilder(store::IMatchStore& store, IPairingGenerator* round_robin_generator, util::LogFn log_fn = {});

    // Validates the team count and names the rounds the format needs. Swiss
    // needs none up front.
    static bool RoundNamesForStageItem(const model::StageItem& stage_item,
                                       std::vector<std::string>& names,
                                       BuildError* error);

    // Checks the inputs against team_count and the format's bounds. Runs
    // before anything is written so a rejected item stays buildable.
    static bool ValidateInputCount(const model::StageItem& stage_item, BuildError* error);

    // Creates the rounds, the matches of the format, then settles the initial
    // byes of elimination formats.
    bool BuildMatchesForStageItem(model::StageItemId stage_item_id, BuildError* error);

private:
    bool CreateRounds(const model::StageItem& stage_item, const std::vector<std::string>& names, BuildError* error);
    bool BuildGeneratedMatches(const model::StageItem& stage_item, BuildError* error);
    bool SettleEliminationStageItem(const model::StageItem& stage_item, BuildError* error);

    store::IMatchStore& store_;
    IPairingGenerator* round_robin_generator_ = nullptr;
    util::LogFn log_fn_;
};

}  // namespace bracketeer::core::tournament
