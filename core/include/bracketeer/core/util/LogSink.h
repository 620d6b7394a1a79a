#pragma once

#include <functional>
#include <string>

namespace bracketeer::core::util {

using LogFn = std::function<void(const std::string&)>;

inline void Emit(const LogFn& log_fn, const std::string& line) {
    if (log_fn) {
        log_fn(line);
    }
}

}  // namespace bracketeer::core::util
