#include "bracketeer/core/tournament/RoundRobinScheduler.h"

#include <algorithm>

namespace bracketeer::core::tournament {

namespace {

constexpr int kDummy = -1;

std::vector<int> BuildParticipantList(int participant_count) {
    std::vector<int> participants;
    participants.reserve(static_cast<size_t>(participant_count + 1));
    for (int i = 0; i < participant_count; ++i) {
        participants.push_back(i);
    }
    if (participant_count % 2 == 1) {
        participants.push_back(kDummy);
    }
    return participants;
}

void Rotate(std::vector<int>& participants) {
    if (participants.size() <= 2) {
        return;
    }
    const int last = participants.back();
    for (size_t i = participants.size() - 1; i > 1; --i) {
        participants[i] = participants[i - 1];
    }
    participants[1] = last;
}

}  // namespace

std::vector<Fixture> RoundRobinScheduler::BuildSchedule(int participant_count) {
    std::vector<Fixture> fixtures;
    if (participant_count < 2) {
        return fixtures;
    }

    auto participants = BuildParticipantList(participant_count);
    const int slots = static_cast<int>(participants.size());
    const int rounds = slots - 1;
    fixtures.reserve(static_cast<size_t>(rounds * slots / 2));

    for (int round = 0; round < rounds; ++round) {
        for (int i = 0; i < slots / 2; ++i) {
            const int a = participants[static_cast<size_t>(i)];
            const int b = participants[static_cast<size_t>(slots - 1 - i)];
            if (a == kDummy || b == kDummy) {
                continue;
            }
            // Alternate home side so the fixed participant is not always first.
            bool swap_sides = (round % 2 == 1);
            if (i == 0) {
                swap_sides = !swap_sides;
            }
            Fixture fixture;
            fixture.round_index = round;
            fixture.home_index = swap_sides ? b : a;
            fixture.away_index = swap_sides ? a : b;
            fixtures.push_back(fixture);
        }
        Rotate(participants);
    }
    return fixtures;
}

std::vector<GeneratedMatch> RoundRobinScheduler::BuildMatches(const model::StageItem& stage_item, int round_count) {
    auto inputs = stage_item.inputs;
    std::stable_sort(inputs.begin(), inputs.end(), [](const auto& a, const auto& b) {
        return a.slot < b.slot;
    });

    std::vector<GeneratedMatch> matches;
    for (const auto& fixture : BuildSchedule(static_cast<int>(inputs.size()))) {
        if (fixture.round_index >= round_count) {
            continue;
        }
        GeneratedMatch match;
        match.round_index = fixture.round_index;
        match.input1_id = inputs[static_cast<size_t>(fixture.home_index)].id;
        match.input2_id = inputs[static_cast<size_t>(fixture.away_index)].id;
        matches.push_back(match);
    }
    return matches;
}

}  // namespace bracketeer::core::tournament
