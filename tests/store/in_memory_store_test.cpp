#include "bracketeer/core/store/InMemoryStore.h"

#include "test_support/BracketFixtures.h"

#include <gtest/gtest.h>

namespace bracketeer::core::store {
namespace {

TEST(InMemoryStoreTest, AssignsIdsFromOneSequence) {
    InMemoryStore store;
    model::Tournament tournament;
    const auto created = store.AddTournament(tournament);
    ASSERT_TRUE(created.has_value());
    const auto court = store.AddCourt(created->id, "Centre");
    const auto stage = store.AddStage(created->id, "Groups");
    ASSERT_TRUE(court.has_value());
    ASSERT_TRUE(stage.has_value());
    EXPECT_LT(created->id, court->id);
    EXPECT_LT(court->id, stage->id);
}

TEST(InMemoryStoreTest, RejectsDuplicateTournamentIdAndOrphans) {
    InMemoryStore store;
    model::Tournament tournament;
    tournament.id = 7;
    ASSERT_TRUE(store.AddTournament(tournament).has_value());
    EXPECT_FALSE(store.AddTournament(tournament).has_value());
    EXPECT_FALSE(store.AddCourt(8, "Nowhere").has_value());
    EXPECT_FALSE(store.AddStageItem(99, "Item", model::StageType::Swiss, 4).has_value());

    // Explicit ids push the sequence past them.
    const auto stage = store.AddStage(7, "Stage");
    ASSERT_TRUE(stage.has_value());
    EXPECT_GT(stage->id, 7);
}

TEST(InMemoryStoreTest, RejectsSecondInputInTheSameSlot) {
    InMemoryStore store;
    const auto seeded = test::AddSeededStageItem(store, model::StageType::RoundRobin, 2);
    model::StageItemInput input;
    input.stage_item_id = seeded.stage_item_id;
    input.slot = 2;
    EXPECT_FALSE(store.AddStageItemInput(input).has_value());
    input.slot = 3;
    EXPECT_TRUE(store.AddStageItemInput(input).has_value());
}

TEST(InMemoryStoreTest, AssemblesStageItemGraph) {
    InMemoryStore store;
    const auto seeded = test::AddSeededStageItem(store, model::StageType::SingleElimination, 2);
    const auto second = store.CreateRound(seeded.stage_item_id, "Later", false);
    const auto first = store.CreateRound(seeded.stage_item_id, "Earlier", true);
    ASSERT_TRUE(first && second);

    model::MatchSpec spec;
    spec.round_id = second->id;
    spec.input1 = model::MatchSide::Direct(seeded.input_ids[0]);
    const auto match = store.CreateMatch(spec);
    ASSERT_TRUE(match.has_value());

    const auto item = store.GetStageItem(seeded.stage_item_id);
    ASSERT_TRUE(item.has_value());
    ASSERT_EQ(item->inputs.size(), 2u);
    EXPECT_EQ(item->inputs[0].slot, 1);
    ASSERT_EQ(item->rounds.size(), 2u);
    EXPECT_EQ(item->rounds[0].name, "Later");
    EXPECT_TRUE(item->rounds[1].is_draft);
    ASSERT_EQ(item->rounds[0].matches.size(), 1u);
    EXPECT_EQ(item->rounds[0].matches[0].input1.resolved_input_id, seeded.input_ids[0]);

    EXPECT_EQ(store.TournamentOfStageItem(seeded.stage_item_id), seeded.tournament_id);
    ASSERT_EQ(store.GetStages(seeded.tournament_id).size(), 1u);
    EXPECT_EQ(store.GetStages(seeded.tournament_id)[0].stage_items.size(), 1u);
    EXPECT_FALSE(store.CreateMatch(model::MatchSpec{}).has_value());
}

TEST(InMemoryStoreTest, ScheduleRequiresAKnownCourt) {
    InMemoryStore store;
    const auto seeded = test::AddSeededStageItem(store, model::StageType::SingleElimination, 2, 1);
    const auto round = store.CreateRound(seeded.stage_item_id, "Round 1", false);
    model::MatchSpec spec;
    spec.round_id = round->id;
    const auto match = store.CreateMatch(spec);

    EXPECT_FALSE(store.UpdateMatchSchedule(match->id, 4242, test::FixedStart(), 0));
    EXPECT_TRUE(store.UpdateMatchSchedule(match->id, seeded.court_ids[0], test::FixedStart(), 0));
    EXPECT_TRUE(store.GetMatch(match->id)->is_scheduled());
    EXPECT_TRUE(store.ClearMatchSchedule(match->id));
    EXPECT_FALSE(store.GetMatch(match->id)->is_scheduled());
    EXPECT_FALSE(store.GetMatch(match->id)->position_in_schedule.has_value());
}

TEST(InMemoryStoreTest, ImportRejectsDanglingMatches) {
    InMemoryStore store;
    InMemoryStore::Contents contents;
    model::Match match;
    match.id = 3;
    match.round_id = 77;
    contents.matches.push_back(match);
    std::string error;
    EXPECT_FALSE(store.Import(contents, &error));
    EXPECT_NE(error.find("unknown round"), std::string::npos);
}

TEST(InMemoryStoreTest, ExportImportKeepsTheIdSequence) {
    InMemoryStore source;
    const auto seeded = test::AddSeededStageItem(source, model::StageType::RoundRobin, 3);

    InMemoryStore copy;
    std::string error;
    ASSERT_TRUE(copy.Import(source.Export(), &error)) << error;
    const auto round = copy.CreateRound(seeded.stage_item_id, "Round 1", false);
    ASSERT_TRUE(round.has_value());
    EXPECT_GT(round->id, seeded.input_ids.back());
    EXPECT_EQ(copy.GetInputsForStageItem(seeded.stage_item_id).size(), 3u);
}

}  // namespace
}  // namespace bracketeer::core::store
