#include "bracketeer/core/api/TournamentConfig.h"

#include "bracketeer/core/store/InMemoryStore.h"
#include "bracketeer/core/util/AtomicFileWriter.h"
#include "bracketeer/core/util/TimeFormat.h"

#include <nlohmann/json.hpp>

#include <fstream>
#include <map>
#include <sstream>

namespace bracketeer::core::api {

namespace {

bool ValidateSlotTimings(const TournamentSection& section, std::string* error) {
    if (section.duration_minutes < 0 || section.margin_minutes < 0) {
        if (error) {
            *error = "Tournament duration_minutes and margin_minutes must not be negative";
        }
        return false;
    }
    return true;
}

bool ReadFile(const std::string& path, std::string& payload, std::string* error) {
    std::ifstream input(path, std::ios::binary);
    if (!input) {
        if (error) {
            *error = "Failed to open config: " + path;
        }
        return false;
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();
    payload = buffer.str();
    return true;
}

bool ParseInput(const nlohmann::json& node, InputConfig& out, std::string* error) {
    if (!node.contains("slot")) {
        if (error) {
            *error = "Stage item input without a slot";
        }
        return false;
    }
    out.slot = node.at("slot").get<int>();
    out.team_id = node.value("team_id", out.team_id);
    out.winner_from_stage_item = node.value("winner_from_stage_item", out.winner_from_stage_item);
    out.winner_position = node.value("winner_position", out.winner_position);
    if (out.team_id >= 0 && !out.winner_from_stage_item.empty()) {
        if (error) {
            *error = "Input in slot " + std::to_string(out.slot) + " names both a team and a stage item";
        }
        return false;
    }
    return true;
}

bool ParseStageItem(const nlohmann::json& node, StageItemConfig& out, std::string* error) {
    out.name = node.value("name", out.name);
    out.type = node.value("type", out.type);
    model::StageType type;
    if (!model::ParseStageType(out.type, type)) {
        if (error) {
            *error = "Unknown stage item type: " + out.type;
        }
        return false;
    }
    if (node.contains("inputs")) {
        for (const auto& input_node : node.at("inputs")) {
            InputConfig input;
            if (!ParseInput(input_node, input, error)) {
                return false;
            }
            out.inputs.push_back(std::move(input));
        }
    }
    out.team_count = node.value("team_count", static_cast<int>(out.inputs.size()));
    return true;
}

nlohmann::json WriteInput(const InputConfig& input) {
    nlohmann::json node;
    node["slot"] = input.slot;
    if (input.team_id >= 0) {
        node["team_id"] = input.team_id;
    }
    if (!input.winner_from_stage_item.empty()) {
        node["winner_from_stage_item"] = input.winner_from_stage_item;
        node["winner_position"] = input.winner_position;
    }
    return node;
}

nlohmann::json BuildJson(const TournamentConfig& config) {
    nlohmann::json root;
    root["tournament"] = {
        {"id", config.tournament.id},
        {"name", config.tournament.name},
        {"start_time", config.tournament.start_time},
        {"duration_minutes", config.tournament.duration_minutes},
        {"margin_minutes", config.tournament.margin_minutes},
    };
    root["courts"] = config.courts;

    root["stages"] = nlohmann::json::array();
    for (const auto& stage : config.stages) {
        nlohmann::json stage_node;
        stage_node["name"] = stage.name;
        stage_node["items"] = nlohmann::json::array();
        for (const auto& item : stage.items) {
            nlohmann::json item_node;
            item_node["name"] = item.name;
            item_node["type"] = item.type;
            item_node["team_count"] = item.team_count;
            item_node["inputs"] = nlohmann::json::array();
            for (const auto& input : item.inputs) {
                item_node["inputs"].push_back(WriteInput(input));
            }
            stage_node["items"].push_back(std::move(item_node));
        }
        root["stages"].push_back(std::move(stage_node));
    }

    root["output"] = {
        {"snapshot_json", config.output.snapshot_json},
        {"log_path", config.output.log_path},
    };
    return root;
}

}  // namespace

bool TournamentConfig::LoadFromFile(const std::string& path, TournamentConfig& config, std::string* error) {
    std::string payload;
    if (!ReadFile(path, payload, error)) {
        return false;
    }
    return LoadFromString(payload, config, error);
}

bool TournamentConfig::LoadFromString(const std::string& payload, TournamentConfig& config, std::string* error) {
    config = TournamentConfig{};
    try {
        const auto root = nlohmann::json::parse(payload);

        if (root.contains("tournament")) {
            const auto& node = root.at("tournament");
            config.tournament.id = node.value("id", config.tournament.id);
            config.tournament.name = node.value("name", config.tournament.name);
            config.tournament.start_time = node.value("start_time", config.tournament.start_time);
            config.tournament.duration_minutes = node.value("duration_minutes", config.tournament.duration_minutes);
            config.tournament.margin_minutes = node.value("margin_minutes", config.tournament.margin_minutes);
        }
        if (!ValidateSlotTimings(config.tournament, error)) {
            return false;
        }
        model::TimePoint start_time;
        if (!util::ParseUtcTimestamp(config.tournament.start_time, start_time)) {
            if (error) {
                *error = "Invalid tournament start_time: " + config.tournament.start_time;
            }
            return false;
        }

        if (root.contains("courts")) {
            for (const auto& court : root.at("courts")) {
                config.courts.push_back(court.get<std::string>());
            }
        }

        if (root.contains("stages")) {
            for (const auto& stage_node : root.at("stages")) {
                StageConfig stage;
                stage.name = stage_node.value("name", stage.name);
                if (stage_node.contains("items")) {
                    for (const auto& item_node : stage_node.at("items")) {
                        StageItemConfig item;
                        if (!ParseStageItem(item_node, item, error)) {
                            return false;
                        }
                        stage.items.push_back(std::move(item));
                    }
                }
                config.stages.push_back(std::move(stage));
            }
        }

        if (root.contains("output")) {
            const auto& output = root.at("output");
            config.output.snapshot_json = output.value("snapshot_json", config.output.snapshot_json);
            config.output.log_path = output.value("log_path", config.output.log_path);
        }
    } catch (const std::exception& ex) {
        if (error) {
            *error = std::string("Failed to parse JSON: ") + ex.what();
        }
        return false;
    }
    return true;
}

bool TournamentConfig::SaveToFile(const std::string& path, const TournamentConfig& config, std::string* error) {
    return util::AtomicFileWriter::Write(path, BuildJson(config).dump(2), error);
}

std::string TournamentConfig::ToJsonString(const TournamentConfig& config) {
    return BuildJson(config).dump(2);
}

bool ApplyConfigToStore(const TournamentConfig& config,
                        store::InMemoryStore& store,
                        AppliedTournament& applied,
                        std::string* error) {
    applied = AppliedTournament{};
    if (!ValidateSlotTimings(config.tournament, error)) {
        return false;
    }

    model::Tournament tournament;
    tournament.id = config.tournament.id;
    tournament.name = config.tournament.name;
    tournament.duration_minutes = config.tournament.duration_minutes;
    tournament.margin_minutes = config.tournament.margin_minutes;
    if (!util::ParseUtcTimestamp(config.tournament.start_time, tournament.start_time)) {
        if (error) {
            *error = "Invalid tournament start_time: " + config.tournament.start_time;
        }
        return false;
    }
    const auto created = store.AddTournament(tournament);
    if (!created) {
        if (error) {
            *error = "Tournament " + std::to_string(tournament.id) + " already exists";
        }
        return false;
    }
    applied.tournament_id = created->id;

    for (const auto& court_name : config.courts) {
        if (!store.AddCourt(applied.tournament_id, court_name)) {
            if (error) {
                *error = "Failed to add court " + court_name;
            }
            return false;
        }
    }

    std::map<std::string, model::StageItemId> item_ids_by_name;
    for (const auto& stage_config : config.stages) {
        const auto stage = store.AddStage(applied.tournament_id, stage_config.name);
        if (!stage) {
            if (error) {
                *error = "Failed to add stage " + stage_config.name;
            }
            return false;
        }
        for (const auto& item_config : stage_config.items) {
            model::StageType type;
            if (!model::ParseStageType(item_config.type, type)) {
                if (error) {
                    *error = "Unknown stage item type: " + item_config.type;
                }
                return false;
            }
            const int team_count =
                item_config.team_count > 0 ? item_config.team_count : static_cast<int>(item_config.inputs.size());
            const auto item = store.AddStageItem(stage->id, item_config.name, type, team_count);
            if (!item) {
                if (error) {
                    *error = "Failed to add stage item " + item_config.name;
                }
                return false;
            }

            for (const auto& input_config : item_config.inputs) {
                model::StageItemInput input;
                input.stage_item_id = item->id;
                input.slot = input_config.slot;
                if (input_config.team_id >= 0) {
                    input.kind = model::StageItemInput::Kind::Final;
                    input.team_id = input_config.team_id;
                } else if (!input_config.winner_from_stage_item.empty()) {
                    const auto source = item_ids_by_name.find(input_config.winner_from_stage_item);
                    if (source == item_ids_by_name.end()) {
                        if (error) {
                            *error = "Stage item '" + item_config.name + "' refers to unknown stage item '" +
                                     input_config.winner_from_stage_item + "'";
                        }
                        return false;
                    }
                    input.kind = model::StageItemInput::Kind::Tentative;
                    input.winner_from_stage_item_id = source->second;
                    input.winner_position = input_config.winner_position;
                }
                if (!store.AddStageItemInput(input)) {
                    if (error) {
                        *error = "Duplicate slot " + std::to_string(input.slot) + " in stage item '" +
                                 item_config.name + "'";
                    }
                    return false;
                }
            }

            item_ids_by_name[item_config.name] = item->id;
            applied.stage_item_ids.push_back(item->id);
        }
    }
    return true;
}

}  // namespace bracketeer::core::api
