#include "util/paths.hpp"

#include <cstdlib>
#include <pwd.h>
#include <unistd.h>
#include <fmt/core.h>

namespace lnk::paths {

std::optional<std::filesystem::path> getHomeDir() {
    if (const char* home = std::getenv("HOME"); home && *home) return std::filesystem::path(home);
    if (const passwd* pw = ::getpwuid(::getuid()); pw && pw->pw_dir && *pw->pw_dir)
        return std::filesystem::path(pw->pw_dir);
    return std::nullopt;
}

std::filesystem::path getConfigHome() {
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) return xdg;
    if (const auto home = getHomeDir()) return *home / ".config";
    return ".";
}

std::filesystem::path getRepoPath() { return getConfigHome() / kProjectName; }

std::filesystem::path getConfigPath() { return getConfigHome() / fmt::format("{}.yaml", kProjectName); }

}
