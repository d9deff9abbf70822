#pragma once

#include <string>
#include <filesystem>

namespace replaylab {
namespace utils {

class PathUtils {
public:
    // Directory of the running executable (current directory if unknown)
    static std::filesystem::path getExecutableDir();

    static std::filesystem::path resolveRelativePath(const std::string& relative_path);

    static std::filesystem::path getConfigDir();
};

} // namespace utils
} // namespace replaylab
