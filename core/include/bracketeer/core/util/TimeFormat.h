#pragma once

#include "bracketeer/core/model/BracketTypes.h"

#include <string>

namespace bracketeer::core::util {

// ISO-8601 UTC with a trailing Z, second precision.
std::string FormatUtcTimestamp(model::TimePoint time);
bool ParseUtcTimestamp(const std::string& text, model::TimePoint& time);

}  // namespace bracketeer::core::util
