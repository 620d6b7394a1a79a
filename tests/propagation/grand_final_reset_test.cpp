#include "bracketeer/core/propagation/ResultPropagation.h"

#include "bracketeer/core/store/InMemoryStore.h"
#include "bracketeer/core/tournament/StageBuilder.h"
#include "test_support/BracketFixtures.h"

#include <gtest/gtest.h>

namespace bracketeer::core::propagation {
namespace {

// Four-team double elimination played up to the grand final: seed 1 wins the
// winners bracket, seed 2 comes back through the losers bracket.
class GrandFinalResetTest : public ::testing::Test {
protected:
    void SetUp() override {
        seeded_ = test::AddSeededStageItem(store_, model::StageType::DoubleElimination, 4);
        tournament::StageBuilder builder(store_, nullptr);
        tournament::BuildError error;
        ASSERT_TRUE(builder.BuildMatchesForStageItem(seeded_.stage_item_id, &error)) << error.message;

        const auto item = Item();
        Play(item.rounds[0].matches[0].id, 2, 0);
        Play(item.rounds[0].matches[1].id, 2, 0);
        Play(test::OnlyMatch(item.rounds[1]).id, 2, 1);
        Play(test::OnlyMatch(item.rounds[2]).id, 0, 2);
        Play(test::OnlyMatch(item.rounds[3]).id, 0, 2);

        grand_final_id_ = test::OnlyMatch(Item().rounds[4]).id;
        reset_id_ = test::OnlyMatch(Item().rounds[5]).id;
    }

    void Play(model::MatchId match_id, int score1, int score2) {
        test::PlayMatch(store_, seeded_.stage_item_id, match_id, score1, score2);
    }

    model::StageItem Item() const { return *store_.GetStageItem(seeded_.stage_item_id); }
    model::StageItemInputId Seed(int seed) const { return seeded_.input_ids[static_cast<size_t>(seed - 1)]; }

    store::InMemoryStore store_;
    test::SeededStageItem seeded_;
    model::MatchId grand_final_id_ = 0;
    model::MatchId reset_id_ = 0;
};

TEST_F(GrandFinalResetTest, GrandFinalHasBothFinalists) {
    const auto grand_final = store_.GetMatch(grand_final_id_);
    EXPECT_EQ(grand_final->input1.resolved_input_id, Seed(1));
    EXPECT_EQ(grand_final->input2.resolved_input_id, Seed(2));
}

TEST_F(GrandFinalResetTest, WinnersBracketChampionWinningSkipsTheReset) {
    Play(grand_final_id_, 3, 1);
    const auto reset = store_.GetMatch(reset_id_);
    EXPECT_EQ(reset->score1, 1);
    EXPECT_EQ(reset->score2, 0);
    EXPECT_EQ(reset->winner(), Seed(1));
}

TEST_F(GrandFinalResetTest, LosersBracketChampionWinningForcesTheReset) {
    Play(grand_final_id_, 1, 3);
    const auto reset = store_.GetMatch(reset_id_);
    EXPECT_FALSE(reset->is_played());
    EXPECT_EQ(reset->input1.resolved_input_id, Seed(2));
    EXPECT_EQ(reset->input2.resolved_input_id, Seed(1));
}

TEST_F(GrandFinalResetTest, OtherMatchesDoNotTriggerTheRule) {
    ASSERT_TRUE(store_.UpdateMatchScores(grand_final_id_, 3, 1));
    ResultPropagator propagator(store_);
    bool completed = true;
    std::string error;
    ASSERT_TRUE(propagator.MaybeAutoCompleteReset(seeded_.stage_item_id, reset_id_, &completed, &error));
    EXPECT_FALSE(completed);
    EXPECT_FALSE(store_.GetMatch(reset_id_)->is_played());
}

TEST_F(GrandFinalResetTest, PlayedResetIsLeftAlone) {
    ASSERT_TRUE(store_.UpdateMatchScores(reset_id_, 0, 2));
    ASSERT_TRUE(store_.UpdateMatchScores(grand_final_id_, 3, 1));
    ResultPropagator propagator(store_);
    bool completed = true;
    std::string error;
    ASSERT_TRUE(propagator.MaybeAutoCompleteReset(seeded_.stage_item_id, grand_final_id_, &completed, &error));
    EXPECT_FALSE(completed);
    EXPECT_EQ(store_.GetMatch(reset_id_)->score2, 2);
}

TEST_F(GrandFinalResetTest, TiedGrandFinalDoesNothing) {
    ASSERT_TRUE(store_.UpdateMatchScores(grand_final_id_, 2, 2));
    ResultPropagator propagator(store_);
    bool completed = true;
    std::string error;
    ASSERT_TRUE(propagator.MaybeAutoCompleteReset(seeded_.stage_item_id, grand_final_id_, &completed, &error));
    EXPECT_FALSE(completed);
}

}  // namespace
}  // namespace bracketeer::core::propagation
