#pragma once

#include "bracketeer/core/model/BracketTypes.h"

#include <string>
#include <vector>

namespace bracketeer::core::store {
class InMemoryStore;
}

namespace bracketeer::core::api {

struct TournamentSection {
    model::TournamentId id = 0;
    std::string name = "Tournament";
    std::string start_time = "1970-01-01T00:00:00Z";
    int duration_minutes = 15;
    int margin_minutes = 5;
};

// A team input sets team_id; a tentative input names an earlier stage item
// and the final position taken from it; neither leaves the slot empty.
struct InputConfig {
    int slot = 0;
    model::TeamId team_id = -1;
    std::string winner_from_stage_item;
    int winner_position = 0;
};

struct StageItemConfig {
    std::string name;
    std::string type = "single_elimination";
    // 0 means the number of inputs.
    int team_count = 0;
    std::vector<InputConfig> inputs;
};

struct StageConfig {
    std::string name;
    std::vector<StageItemConfig> items;
};

struct OutputConfig {
    std::string snapshot_json = "out/snapshot.json";
    std::string log_path;
};

struct TournamentConfig {
    TournamentSection tournament;
    std::vector<std::string> courts;
    std::vector<StageConfig> stages;
    OutputConfig output;

    static bool LoadFromFile(const std::string& path, TournamentConfig& config, std::string* error);
    static bool LoadFromString(const std::string& payload, TournamentConfig& config, std::string* error);
    static bool SaveToFile(const std::string& path, const TournamentConfig& config, std::string* error);
    static std::string ToJsonString(const TournamentConfig& config);
};

struct AppliedTournament {
    model::TournamentId tournament_id = 0;
    // In declaration order across all stages.
    std::vector<model::StageItemId> stage_item_ids;
};

// Creates the tournament, its courts, stages, stage items and inputs.
// Tentative inputs are resolved by stage item name and may only refer to
// items declared before them.
bool ApplyConfigToStore(const TournamentConfig& config,
                        store::InMemoryStore& store,
                        AppliedTournament& applied,
                        std::string* error);

}  // namespace bracketeer::core::api
