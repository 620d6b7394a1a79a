#include "bracketeer/core/util/AtomicFileWriter.h"

#include <filesystem>
#include <fstream>
#include <system_error>

namespace bracketeer::core::util {

namespace {

bool SetError(std::string* error, const std::string& message) {
    if (error) {
        *error = message;
    }
    return false;
}

}  // namespace

bool AtomicFileWriter::Write(const std::string& path, const std::string& contents, std::string* error) {
    const std::filesystem::path target(path);
    std::error_code ec;
    if (!target.parent_path().empty()) {
        std::filesystem::create_directories(target.parent_path(), ec);
        if (ec) {
            return SetError(error, "Failed to create directory " + target.parent_path().string() + ": " + ec.message());
        }
    }

    const std::filesystem::path temp_path(path + ".tmp");
    {
        std::ofstream output(temp_path, std::ios::binary | std::ios::trunc);
        if (!output) {
            return SetError(error, "Failed to open temp file: " + temp_path.string());
        }
        output.write(contents.data(), static_cast<std::streamsize>(contents.size()));
        output.flush();
        if (!output) {
            return SetError(error, "Failed to write temp file: " + temp_path.string());
        }
    }

    // rename() replaces an existing target on POSIX; Windows needs it gone first.
#ifdef _WIN32
    std::filesystem::remove(target, ec);
#endif
    std::filesystem::rename(temp_path, target, ec);
    if (ec) {
        return SetError(error, "Rename failed for " + path + ": " + ec.message());
    }
    return true;
}

}  // namespace bracketeer::core::util
