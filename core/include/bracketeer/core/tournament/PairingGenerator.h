#pragma once

#include "bracketeer/core/model/BracketTypes.h"

#include <vector>

namespace bracketeer::core::tournament {

// A ready-to-insert pairing produced outside the elimination builders.
// round_index is zero-based into the stage item's rounds.
struct GeneratedMatch {
    int round_index = 0;
    model::StageItemInputId input1_id = -1;
    model::StageItemInputId input2_id = -1;
};

class IPairingGenerator {
public:
    virtual ~IPairingGenerator() = default;
    virtual std::vector<GeneratedMatch> BuildMatches(const model::StageItem& stage_item, int round_count) = 0;
};

}  // namespace bracketeer::core::tournament
