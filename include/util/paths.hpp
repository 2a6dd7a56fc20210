#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace lnk::paths {

inline constexpr const char* kProjectName = "lnk";

// $HOME, falling back to the passwd entry of the current user.
std::optional<std::filesystem::path> getHomeDir();

// ${XDG_CONFIG_HOME} when set and non-empty, else ~/.config, else ".".
std::filesystem::path getConfigHome();

// Repository root: <config home>/lnk
std::filesystem::path getRepoPath();

// Optional YAML config beside the repository: <config home>/lnk.yaml
std::filesystem::path getConfigPath();

}
