#include "bracketeer/core/tournament/AvailableInputs.h"

#include <utility>

namespace bracketeer::core::tournament {

namespace {

using TentativeKey = std::pair<model::StageItemId, int>;

bool ProducesOutputs(model::StageType type) {
    return type == model::StageType::RoundRobin || type == model::StageType::RegularSeasonMatchup ||
           type == model::StageType::Swiss;
}

}  // namespace

std::map<model::StageId, std::vector<InputOption>> DetermineAvailableInputs(
    const std::vector<model::TeamId>& team_ids,
    const std::vector<model::Stage>& stages) {
    std::map<model::TeamId, InputOption> team_options;
    for (model::TeamId team_id : team_ids) {
        InputOption option;
        option.kind = InputOption::Kind::Team;
        option.team_id = team_id;
        team_options[team_id] = option;
    }

    std::map<TentativeKey, InputOption> tentative_options;
    for (const auto& stage : stages) {
        for (const auto& item : stage.stage_items) {
            if (!ProducesOutputs(item.type)) {
                continue;
            }
            for (int position = 1; position <= item.team_count; ++position) {
                InputOption option;
                option.kind = InputOption::Kind::Tentative;
                option.winner_from_stage_item_id = item.id;
                option.winner_position = position;
                tentative_options[{item.id, position}] = option;
            }
        }
    }

    for (const auto& stage : stages) {
        for (const auto& item : stage.stage_items) {
            for (const auto& input : item.inputs) {
                if (input.kind == model::StageItemInput::Kind::Final) {
                    auto it = team_options.find(input.team_id);
                    if (it != team_options.end()) {
                        it->second.already_taken = true;
                    }
                } else if (input.kind == model::StageItemInput::Kind::Tentative) {
                    auto it = tentative_options.find({input.winner_from_stage_item_id, input.winner_position});
                    if (it != tentative_options.end()) {
                        it->second.already_taken = true;
                    }
                }
            }
        }
    }

    // Tentative options only become available after the stage they originate from.
    std::map<model::StageId, std::vector<InputOption>> results;
    std::vector<InputOption> released_tentative;
    for (const auto& stage : stages) {
        auto& options = results[stage.id];
        for (const auto& entry : team_options) {
            options.push_back(entry.second);
        }
        options.insert(options.end(), released_tentative.begin(), released_tentative.end());

        for (const auto& item : stage.stage_items) {
            for (const auto& entry : tentative_options) {
                if (entry.first.first == item.id) {
                    released_tentative.push_back(entry.second);
                }
            }
        }
    }
    return results;
}

}  // namespace bracketeer::core::tournament
