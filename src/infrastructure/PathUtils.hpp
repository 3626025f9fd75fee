// PathUtils Header
#pragma once
#include <string>
#include <filesystem>

namespace casegraph::infrastructure {

class PathUtils {
public:
    static std::filesystem::path GetDataHome();

    /** @brief Default home of snapshot and cursor files, created on demand. */
    static std::filesystem::path GetWorkspacesDir();

    /** @brief Creates @p dir if missing; logs and returns false on failure. */
    static bool EnsureDirectory(const std::filesystem::path& dir);
};

} // namespace casegraph::infrastructure
