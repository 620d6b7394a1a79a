#pragma once

#include "bracketeer/core/tournament/BuildError.h"

#include <vector>

namespace bracketeer::core::tournament {

constexpr int kMaxEliminationTeamCount = 64;
constexpr int kMinSingleEliminationTeamCount = 2;
constexpr int kMinDoubleEliminationTeamCount = 3;

// Smallest power of two >= team_count, 0 for fewer than one team.
int BracketSize(int team_count);

// Classic seed order: seed 1 meets the lowest seed, seeds 1 and 2 can only
// meet in the final. bracket_size must be a power of two >= 1.
std::vector<int> SeedOrder(int bracket_size);

bool ValidateTeamCount(int team_count, int minimum, BuildError* error);

// The round count helpers return 0 for team_count < 1 and -1 (with error set)
// when the team count is outside the supported range.
int SingleEliminationRoundCount(int team_count, BuildError* error = nullptr);
int LosersBracketRoundCount(int winners_round_count);
int DoubleEliminationRoundCount(int team_count, BuildError* error = nullptr);
int RoundRobinRoundCount(int team_count);

}  // namespace bracketeer::core::tournament
