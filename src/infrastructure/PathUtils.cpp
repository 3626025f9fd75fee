#include "infrastructure/PathUtils.hpp"
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <system_error>

namespace casegraph::infrastructure {

namespace fs = std::filesystem;

namespace {

fs::path XdgDir(const char* variable, const fs::path& homeRelative) {
    const char* value = std::getenv(variable);
    if (value && *value) {
        return fs::path(value);
    }
    const char* home = std::getenv("HOME");
    if (home && *home) {
        return fs::path(home) / homeRelative;
    }
    return fs::current_path(); // Fallback
}

} // namespace

fs::path PathUtils::GetDataHome() {
    return XdgDir("XDG_DATA_HOME", fs::path(".local") / "share");
}

bool PathUtils::EnsureDirectory(const fs::path& dir) {
    std::error_code ec;
    if (fs::exists(dir, ec)) return true;
    fs::create_directories(dir, ec);
    if (ec) {
        std::cerr << "[PathUtils] Cannot create " << dir << ": " << ec.message() << std::endl;
        return false;
    }
    return true;
}

fs::path PathUtils::GetWorkspacesDir() {
    fs::path base = GetDataHome() / "casegraph" / "workspaces";
    EnsureDirectory(base);
    return base;
}

} // namespace casegraph::infrastructure
