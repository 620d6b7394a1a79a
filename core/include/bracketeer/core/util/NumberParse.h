#pragma once

#include <string>

namespace bracketeer::core::util {

// Whole-string base-10 parse. Fails on trailing text and on values outside
// the range of int.
bool ParseInt(const std::string& text, int& value);

}  // namespace bracketeer::core::util
