#pragma once

#include "bracketeer/core/model/BracketTypes.h"

#include <map>
#include <vector>

namespace bracketeer::core::tournament {

struct InputOption {
    enum class Kind {
        Team,
        Tentative
    };

    Kind kind = Kind::Team;
    model::TeamId team_id = -1;
    model::StageItemId winner_from_stage_item_id = -1;
    int winner_position = 0;
    bool already_taken = false;
};

// Options offered when filling the inputs of each stage: every team, plus the
// "winner position N" outputs of round robin, regular season and Swiss items
// of earlier stages. Elimination items produce no outputs. already_taken is
// set for options used by any stage item input of the tournament.
std::map<model::StageId, std::vector<InputOption>> DetermineAvailableInputs(
    const std::vector<model::TeamId>& team_ids,
    const std::vector<model::Stage>& stages);

}  // namespace bracketeer::core::tournament
