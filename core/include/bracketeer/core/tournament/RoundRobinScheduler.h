#pragma once

#include "bracketeer/core/tournament/PairingGenerator.h"

#include <vector>

namespace bracketeer::core::tournament {

struct Fixture {
    int round_index = 0;
    int home_index = -1;
    int away_index = -1;
};

// Circle method: one participant stays fixed, the rest rotate each round. Odd
// counts get a dummy participant whose pairings are dropped.
class RoundRobinScheduler final : public IPairingGenerator {
public:
    static std::vector<Fixture> BuildSchedule(int participant_count);

    std::vector<GeneratedMatch> BuildMatches(const model::StageItem& stage_item, int round_count) override;
};

}  // namespace bracketeer::core::tournament
