#include "bracketeer/core/tournament/Seeding.h"

namespace bracketeer::core::tournament {

const char* BuildFailureToString(BuildFailure failure) {
    switch (failure) {
        case BuildFailure::None:
            return "none";
        case BuildFailure::TeamCountOutOfRange:
            return "team_count_out_of_range";
        case BuildFailure::OddMatchCount:
            return "odd_match_count";
        case BuildFailure::RoundCountMismatch:
            return "round_count_mismatch";
        case BuildFailure::BracketShapeMismatch:
            return "bracket_shape_mismatch";
        case BuildFailure::BracketConstructionIncomplete:
            return "bracket_construction_incomplete";
        case BuildFailure::MissingRound:
            return "missing_round";
        case BuildFailure::MissingStageItem:
            return "missing_stage_item";
        case BuildFailure::AlreadyBuilt:
            return "already_built";
        case BuildFailure::PropagationFailure:
            return "propagation_failure";
        case BuildFailure::StoreFailure:
            return "store_failure";
    }
    return "unknown";
}

int BracketSize(int team_count) {
    if (team_count < 1) {
        return 0;
    }
    int size = 1;
    while (size < team_count) {
        size <<= 1;
    }
    return size;
}

std::vector<int> SeedOrder(int bracket_size) {
    if (bracket_size <= 1) {
        return {1};
    }
    const auto previous = SeedOrder(bracket_size / 2);
    std::vector<int> order;
    order.reserve(static_cast<size_t>(bracket_size));
    for (int seed : previous) {
        order.push_back(seed);
        order.push_back(bracket_size + 1 - seed);
    }
    return order;
}

bool ValidateTeamCount(int team_count, int minimum, BuildError* error) {
    if (team_count < minimum || team_count > kMaxEliminationTeamCount) {
        return Fail(error,
                    BuildFailure::TeamCountOutOfRange,
                    "Number of teams invalid, should be between " + std::to_string(minimum) + " and " +
                        std::to_string(kMaxEliminationTeamCount));
    }
    return true;
}

int SingleEliminationRoundCount(int team_count, BuildError* error) {
    if (team_count < 1) {
        return 0;
    }
    if (!ValidateTeamCount(team_count, kMinSingleEliminationTeamCount, error)) {
        return -1;
    }
    int rounds = 0;
    for (int size = BracketSize(team_count); size > 1; size >>= 1) {
        ++rounds;
    }
    return rounds;
}

int LosersBracketRoundCount(int winners_round_count) {
    return 2 * winners_round_count - 2;
}

int DoubleEliminationRoundCount(int team_count, BuildError* error) {
    if (team_count < 1) {
        return 0;
    }
    if (!ValidateTeamCount(team_count, kMinDoubleEliminationTeamCount, error)) {
        return -1;
    }
    const int winners_round_count = SingleEliminationRoundCount(team_count, error);
    // Winners bracket, losers bracket, grand final and the potential reset.
    return winners_round_count + LosersBracketRoundCount(winners_round_count) + 2;
}

int RoundRobinRoundCount(int team_count) {
    if (team_count < 2) {
        return 0;
    }
    return team_count % 2 == 0 ? team_count - 1 : team_count;
}

}  // namespace bracketeer::core::tournament
