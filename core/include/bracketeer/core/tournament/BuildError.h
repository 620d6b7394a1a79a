#pragma once

#include <string>
#include <utility>

namespace bracketeer::core::tournament {

enum class BuildFailure {
    None,
    TeamCountOutOfRange,
    OddMatchCount,
    RoundCountMismatch,
    BracketShapeMismatch,
    BracketConstructionIncomplete,
    MissingRound,
    MissingStageItem,
    AlreadyBuilt,
    PropagationFailure,
    StoreFailure
};

struct BuildError {
    BuildFailure failure = BuildFailure::None;
    std::string message;
};

const char* BuildFailureToString(BuildFailure failure);

inline bool Fail(BuildError* error, BuildFailure failure, std::string message) {
    if (error) {
        error->failure = failure;
        error->message = std::move(message);
    }
    return false;
}

}  // namespace bracketeer::core::tournament
