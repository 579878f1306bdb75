// PathUtils Header
#pragma once
#include <string>
#include <filesystem>

namespace marklens::infrastructure {

class PathUtils {
public:
    static std::filesystem::path GetConfigHome();

    /** @brief Directory for ephemeral preview pages. Created on demand. */
    static std::filesystem::path GetPreviewDir();

    /** @brief Filesystem-safe version of a file stem; never empty. */
    static std::string SanitizeStem(const std::string& stem);
};

} // namespace marklens::infrastructure
