#pragma once

#include <string>

namespace bracketeer::core::util {

class AtomicFileWriter {
public:
    // Writes to "<path>.tmp" and renames over path, creating parent
    // directories first.
    static bool Write(const std::string& path, const std::string& contents, std::string* error = nullptr);
};

}  // namespace bracketeer::core::util
