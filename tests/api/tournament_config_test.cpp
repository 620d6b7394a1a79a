#include "bracketeer/core/api/TournamentConfig.h"

#include "bracketeer/core/store/InMemoryStore.h"
#include "bracketeer/core/util/TimeFormat.h"

#include <gtest/gtest.h>

#include <filesystem>

namespace bracketeer::core::api {
namespace {

const char* kTwoStageConfig = R"({
    "tournament": {"name": "Club Cup", "start_time": "2024-05-01T09:30:00Z", "duration_minutes": 25},
    "courts": ["Court 1", "Court 2"],
    "stages": [
        {"name": "Groups", "items": [
            {"name": "Group A", "type": "round_robin",
             "inputs": [{"slot": 1, "team_id": 1}, {"slot": 2, "team_id": 2}, {"slot": 3, "team_id": 3}]}
        ]},
        {"name": "Playoffs", "items": [
            {"name": "Bracket", "type": "single_elimination", "team_count": 4,
             "inputs": [
                {"slot": 1, "winner_from_stage_item": "Group A", "winner_position": 1},
                {"slot": 2, "winner_from_stage_item": "Group A", "winner_position": 2},
                {"slot": 3, "team_id": 9},
                {"slot": 4}
             ]}
        ]}
    ],
    "output": {"snapshot_json": "out/cup.json"},
    "unknown_section": {"ignored": true}
})";

TEST(TournamentConfigTest, ParsesSectionsWithDefaults) {
    TournamentConfig config;
    std::string error;
    ASSERT_TRUE(TournamentConfig::LoadFromString(kTwoStageConfig, config, &error)) << error;

    EXPECT_EQ(config.tournament.name, "Club Cup");
    EXPECT_EQ(config.tournament.duration_minutes, 25);
    EXPECT_EQ(config.tournament.margin_minutes, 5);
    EXPECT_EQ(config.courts, (std::vector<std::string>{"Court 1", "Court 2"}));
    ASSERT_EQ(config.stages.size(), 2u);
    EXPECT_EQ(config.stages[0].items[0].team_count, 3);
    EXPECT_EQ(config.stages[1].items[0].team_count, 4);
    EXPECT_EQ(config.stages[1].items[0].inputs[0].winner_from_stage_item, "Group A");
    EXPECT_EQ(config.output.snapshot_json, "out/cup.json");
    EXPECT_TRUE(config.output.log_path.empty());
}

TEST(TournamentConfigTest, RejectsBadInput) {
    TournamentConfig config;
    std::string error;
    EXPECT_FALSE(TournamentConfig::LoadFromString("{", config, &error));
    EXPECT_NE(error.find("Failed to parse JSON"), std::string::npos);

    EXPECT_FALSE(TournamentConfig::LoadFromString(
        R"({"stages": [{"name": "S", "items": [{"name": "I", "type": "ladder"}]}]})", config, &error));
    EXPECT_NE(error.find("ladder"), std::string::npos);

    EXPECT_FALSE(TournamentConfig::LoadFromString(R"({"tournament": {"start_time": "tomorrow"}})", config, &error));
    EXPECT_NE(error.find("start_time"), std::string::npos);
}

TEST(TournamentConfigTest, RejectsNegativeSlotTimings) {
    TournamentConfig config;
    std::string error;
    EXPECT_FALSE(TournamentConfig::LoadFromString(R"({"tournament": {"duration_minutes": -10}})", config, &error));
    EXPECT_NE(error.find("must not be negative"), std::string::npos);
    EXPECT_FALSE(TournamentConfig::LoadFromString(R"({"tournament": {"margin_minutes": -1}})", config, &error));
    EXPECT_NE(error.find("must not be negative"), std::string::npos);

    TournamentConfig built;
    built.tournament.margin_minutes = -5;
    store::InMemoryStore store;
    AppliedTournament applied;
    error.clear();
    EXPECT_FALSE(ApplyConfigToStore(built, store, applied, &error));
    EXPECT_NE(error.find("must not be negative"), std::string::npos);
    EXPECT_TRUE(store.ListTournaments().empty());
}

TEST(TournamentConfigTest, AppliesToStoreResolvingTentativeInputs) {
    TournamentConfig config;
    std::string error;
    ASSERT_TRUE(TournamentConfig::LoadFromString(kTwoStageConfig, config, &error)) << error;

    store::InMemoryStore store;
    AppliedTournament applied;
    ASSERT_TRUE(ApplyConfigToStore(config, store, applied, &error)) << error;
    ASSERT_EQ(applied.stage_item_ids.size(), 2u);

    const auto tournament = store.GetTournament(applied.tournament_id);
    ASSERT_TRUE(tournament.has_value());
    EXPECT_EQ(util::FormatUtcTimestamp(tournament->start_time), "2024-05-01T09:30:00Z");
    EXPECT_EQ(store.ListCourts(applied.tournament_id).size(), 2u);

    const auto bracket = store.GetStageItem(applied.stage_item_ids[1]);
    ASSERT_TRUE(bracket.has_value());
    ASSERT_EQ(bracket->inputs.size(), 4u);
    EXPECT_EQ(bracket->inputs[0].kind, model::StageItemInput::Kind::Tentative);
    EXPECT_EQ(bracket->inputs[0].winner_from_stage_item_id, applied.stage_item_ids[0]);
    EXPECT_EQ(bracket->inputs[1].winner_position, 2);
    EXPECT_EQ(bracket->inputs[2].kind, model::StageItemInput::Kind::Final);
    EXPECT_EQ(bracket->inputs[2].team_id, 9);
    EXPECT_EQ(bracket->inputs[3].kind, model::StageItemInput::Kind::Empty);
}

TEST(TournamentConfigTest, ForwardReferenceIsRejected) {
    TournamentConfig config;
    StageConfig stage;
    stage.name = "Only";
    StageItemConfig item;
    item.name = "Bracket";
    InputConfig input;
    input.slot = 1;
    input.winner_from_stage_item = "Later";
    input.winner_position = 1;
    item.inputs.push_back(input);
    stage.items.push_back(item);
    config.stages.push_back(stage);

    store::InMemoryStore store;
    AppliedTournament applied;
    std::string error;
    EXPECT_FALSE(ApplyConfigToStore(config, store, applied, &error));
    EXPECT_NE(error.find("Later"), std::string::npos);
}

TEST(TournamentConfigTest, SaveAndLoadAgree) {
    TournamentConfig config;
    std::string error;
    ASSERT_TRUE(TournamentConfig::LoadFromString(kTwoStageConfig, config, &error)) << error;

    const auto path = (std::filesystem::temp_directory_path() / "bracketeer_config_test" / "config.json").string();
    ASSERT_TRUE(TournamentConfig::SaveToFile(path, config, &error)) << error;
    TournamentConfig reloaded;
    ASSERT_TRUE(TournamentConfig::LoadFromFile(path, reloaded, &error)) << error;
    EXPECT_EQ(TournamentConfig::ToJsonString(reloaded), TournamentConfig::ToJsonString(config));
    std::filesystem::remove_all(std::filesystem::path(path).parent_path());
}

}  // namespace
}  // namespace bracketeer::core::api
