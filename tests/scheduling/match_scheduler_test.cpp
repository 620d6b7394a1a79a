#include "bracketeer/core/scheduling/MatchScheduler.h"

#include "bracketeer/core/store/InMemoryStore.h"
#include "bracketeer/core/tournament/StageBuilder.h"
#include "test_support/BracketFixtures.h"

#include <gtest/gtest.h>

#include <chrono>

namespace bracketeer::core::scheduling {
namespace {

class MatchSchedulerTest : public ::testing::Test {
protected:
    void Build(int team_count, int court_count) {
        seeded_ = test::AddSeededStageItem(store_, model::StageType::SingleElimination, team_count, court_count);
        tournament::StageBuilder builder(store_, nullptr);
        tournament::BuildError error;
        ASSERT_TRUE(builder.BuildMatchesForStageItem(seeded_.stage_item_id, &error)) << error.message;
    }

    model::Match MatchAt(size_t round_index, size_t match_index) const {
        return test::MatchAt(store_, seeded_.stage_item_id, round_index, match_index);
    }

    static model::TimePoint At(int minutes) { return test::FixedStart() + std::chrono::minutes(minutes); }

    void ExpectStrictlyIncreasingPerCourt() const {
        for (const auto& entry : ScheduledMatchesPerCourt(store_.GetStages(seeded_.tournament_id))) {
            const auto& matches = entry.second;
            for (size_t i = 1; i < matches.size(); ++i) {
                EXPECT_LT(*matches[i - 1].match.start_time, *matches[i].match.start_time)
                    << "court " << entry.first << " index " << i;
                EXPECT_LT(*matches[i - 1].match.position_in_schedule, *matches[i].match.position_in_schedule);
            }
        }
    }

    store::InMemoryStore store_;
    test::SeededStageItem seeded_;
};

TEST_F(MatchSchedulerTest, SchedulesRoundsInCourtBatches) {
    Build(8, 2);
    MatchScheduler scheduler(store_, store_);
    std::string error;
    ASSERT_TRUE(scheduler.ScheduleAllUnscheduled(seeded_.tournament_id, &error)) << error;

    const auto court_a = seeded_.court_ids[0];
    const auto court_b = seeded_.court_ids[1];

    EXPECT_EQ(MatchAt(0, 0).court_id, court_a);
    EXPECT_EQ(MatchAt(0, 0).start_time, At(0));
    EXPECT_EQ(MatchAt(0, 1).court_id, court_b);
    EXPECT_EQ(MatchAt(0, 1).start_time, At(0));
    EXPECT_EQ(MatchAt(0, 2).court_id, court_a);
    EXPECT_EQ(MatchAt(0, 2).start_time, At(20));
    EXPECT_EQ(MatchAt(0, 3).position_in_schedule, 1);

    EXPECT_EQ(MatchAt(1, 0).start_time, At(40));
    EXPECT_EQ(MatchAt(1, 1).court_id, court_b);
    EXPECT_EQ(MatchAt(1, 1).position_in_schedule, 2);

    EXPECT_EQ(MatchAt(2, 0).court_id, court_a);
    EXPECT_EQ(MatchAt(2, 0).start_time, At(60));
    EXPECT_EQ(MatchAt(2, 0).position_in_schedule, 3);
}

TEST_F(MatchSchedulerTest, AlreadyScheduledMatchesAreKept) {
    Build(4, 2);
    const auto pinned = MatchAt(0, 1);
    ASSERT_TRUE(store_.UpdateMatchSchedule(pinned.id, seeded_.court_ids[0], At(0), 0));

    MatchScheduler scheduler(store_, store_);
    std::string error;
    ASSERT_TRUE(scheduler.ScheduleAllUnscheduled(seeded_.tournament_id, &error)) << error;

    EXPECT_EQ(MatchAt(0, 1).court_id, seeded_.court_ids[0]);
    EXPECT_EQ(MatchAt(0, 0).court_id, seeded_.court_ids[0]);
    EXPECT_EQ(MatchAt(1, 0).position_in_schedule, 1);
    EXPECT_EQ(MatchAt(1, 0).start_time, At(20));
}

TEST_F(MatchSchedulerTest, WithoutCourtsNothingIsScheduled) {
    Build(4, 0);
    MatchScheduler scheduler(store_, store_);
    std::string error;
    ASSERT_TRUE(scheduler.ScheduleAllUnscheduled(seeded_.tournament_id, &error));
    EXPECT_FALSE(MatchAt(0, 0).is_scheduled());
}

TEST_F(MatchSchedulerTest, CustomDurationStretchesItsSlot) {
    Build(4, 2);
    ASSERT_TRUE(store_.UpdateMatchOverrides(MatchAt(0, 1).id, 40, std::nullopt));
    MatchScheduler scheduler(store_, store_);
    std::string error;
    ASSERT_TRUE(scheduler.ScheduleAllUnscheduled(seeded_.tournament_id, &error)) << error;
    // The longest match of slot 0 takes 40 + 5 minutes.
    EXPECT_EQ(MatchAt(1, 0).start_time, At(45));
}

TEST_F(MatchSchedulerTest, RescheduleAcrossCourtsKeepsTimesIncreasing) {
    Build(8, 2);
    MatchScheduler scheduler(store_, store_);
    std::string error;
    ASSERT_TRUE(scheduler.ScheduleAllUnscheduled(seeded_.tournament_id, &error)) << error;

    const auto final_match = MatchAt(2, 0);
    ASSERT_EQ(final_match.court_id, seeded_.court_ids[0]);
    ASSERT_TRUE(scheduler.RescheduleMatch(seeded_.tournament_id, final_match.id, seeded_.court_ids[1], 0, &error))
        << error;

    const auto moved = *store_.GetMatch(final_match.id);
    EXPECT_EQ(moved.court_id, seeded_.court_ids[1]);
    EXPECT_EQ(moved.position_in_schedule, 0);
    EXPECT_EQ(moved.start_time, At(0));
    ExpectStrictlyIncreasingPerCourt();
}

TEST_F(MatchSchedulerTest, RescheduleAheadOfASingleMatchLeavesOnlyTheSlotGap) {
    Build(4, 2);
    MatchScheduler scheduler(store_, store_);
    std::string error;
    ASSERT_TRUE(scheduler.ScheduleAllUnscheduled(seeded_.tournament_id, &error)) << error;

    const auto occupant = MatchAt(0, 1);
    const auto final_match = MatchAt(1, 0);
    ASSERT_EQ(occupant.court_id, seeded_.court_ids[1]);
    ASSERT_EQ(final_match.court_id, seeded_.court_ids[0]);
    ASSERT_TRUE(scheduler.RescheduleMatch(seeded_.tournament_id, final_match.id, seeded_.court_ids[1], 0, &error))
        << error;

    const auto moved = *store_.GetMatch(final_match.id);
    const auto shifted = *store_.GetMatch(occupant.id);
    EXPECT_EQ(moved.position_in_schedule, 0);
    EXPECT_EQ(moved.start_time, At(0));
    EXPECT_EQ(shifted.position_in_schedule, 1);
    EXPECT_EQ(shifted.start_time, At(20));
    EXPECT_EQ(store_.GetMatch(MatchAt(0, 0).id)->start_time, At(0));
}

TEST_F(MatchSchedulerTest, RescheduleGapFollowsTheMovedMatchMargin) {
    Build(4, 2);
    MatchScheduler scheduler(store_, store_);
    std::string error;
    ASSERT_TRUE(scheduler.ScheduleAllUnscheduled(seeded_.tournament_id, &error)) << error;

    const auto occupant = MatchAt(0, 1);
    const auto final_match = MatchAt(1, 0);
    ASSERT_TRUE(store_.UpdateMatchOverrides(final_match.id, std::nullopt, 10));
    ASSERT_TRUE(scheduler.RescheduleMatch(seeded_.tournament_id, final_match.id, seeded_.court_ids[1], 0, &error))
        << error;

    EXPECT_EQ(store_.GetMatch(final_match.id)->start_time, At(0));
    EXPECT_EQ(store_.GetMatch(occupant.id)->start_time, At(25));
}

TEST_F(MatchSchedulerTest, MovingDownLandsAfterTheOccupant) {
    Build(8, 2);
    MatchScheduler scheduler(store_, store_);
    std::string error;
    ASSERT_TRUE(scheduler.ScheduleAllUnscheduled(seeded_.tournament_id, &error)) << error;

    // Court A holds R1 #1, R1 #3, R2 #1 and the final at positions 0..3.
    const auto opener = MatchAt(0, 0);
    const auto occupant = MatchAt(1, 0);
    ASSERT_EQ(occupant.position_in_schedule, 2);
    ASSERT_TRUE(scheduler.RescheduleMatch(seeded_.tournament_id, opener.id, seeded_.court_ids[0], 2, &error))
        << error;

    const auto moved = *store_.GetMatch(opener.id);
    const auto shifted = *store_.GetMatch(occupant.id);
    EXPECT_LT(*shifted.start_time, *moved.start_time);
    EXPECT_EQ(moved.position_in_schedule, 2);
    ExpectStrictlyIncreasingPerCourt();
}

TEST_F(MatchSchedulerTest, UnscheduledMatchCanBeDraggedIn) {
    Build(4, 1);
    const auto final_match = MatchAt(1, 0);
    ASSERT_TRUE(store_.UpdateMatchSchedule(MatchAt(0, 0).id, seeded_.court_ids[0], At(0), 0));
    ASSERT_TRUE(store_.UpdateMatchSchedule(MatchAt(0, 1).id, seeded_.court_ids[0], At(20), 1));

    MatchScheduler scheduler(store_, store_);
    std::string error;
    ASSERT_TRUE(scheduler.RescheduleMatch(seeded_.tournament_id, final_match.id, seeded_.court_ids[0], 1, &error))
        << error;
    EXPECT_EQ(store_.GetMatch(final_match.id)->position_in_schedule, 1);
    EXPECT_EQ(store_.GetMatch(MatchAt(0, 1).id)->position_in_schedule, 2);
    ExpectStrictlyIncreasingPerCourt();
}

TEST_F(MatchSchedulerTest, RescheduleRejectsForeignCourt) {
    Build(4, 1);
    MatchScheduler scheduler(store_, store_);
    std::string error;
    EXPECT_FALSE(scheduler.RescheduleMatch(seeded_.tournament_id, MatchAt(0, 0).id, 9999, 0, &error));
    EXPECT_FALSE(error.empty());
}

TEST_F(MatchSchedulerTest, NormalizationCompactsPositionsAndIsIdempotent) {
    Build(4, 2);
    ASSERT_TRUE(store_.UpdateMatchSchedule(MatchAt(0, 0).id, seeded_.court_ids[0], At(300), 4));
    ASSERT_TRUE(store_.UpdateMatchSchedule(MatchAt(0, 1).id, seeded_.court_ids[1], At(0), 4));
    ASSERT_TRUE(store_.UpdateMatchSchedule(MatchAt(1, 0).id, seeded_.court_ids[0], At(7), 9));

    MatchScheduler scheduler(store_, store_);
    std::string error;
    ASSERT_TRUE(scheduler.UpdateStartTimesOfMatches(seeded_.tournament_id, &error)) << error;

    EXPECT_EQ(MatchAt(0, 0).position_in_schedule, 0);
    EXPECT_EQ(MatchAt(0, 0).start_time, At(0));
    EXPECT_EQ(MatchAt(0, 1).start_time, At(0));
    EXPECT_EQ(MatchAt(1, 0).position_in_schedule, 1);
    EXPECT_EQ(MatchAt(1, 0).start_time, At(20));

    const auto before = store_.Export().matches;
    ASSERT_TRUE(scheduler.UpdateStartTimesOfMatches(seeded_.tournament_id, &error)) << error;
    const auto after = store_.Export().matches;
    ASSERT_EQ(before.size(), after.size());
    for (size_t i = 0; i < before.size(); ++i) {
        EXPECT_EQ(before[i].start_time, after[i].start_time);
        EXPECT_EQ(before[i].position_in_schedule, after[i].position_in_schedule);
        EXPECT_EQ(before[i].court_id, after[i].court_id);
    }
}

}  // namespace
}  // namespace bracketeer::core::scheduling
