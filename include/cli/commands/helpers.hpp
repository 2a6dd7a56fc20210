#pragma once

#include "cli/types.hpp"

#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace lnk::core {
class Lnk;
}

namespace lnk::cli {
struct Output;
}

namespace lnk::cli::commands {

// Builds the facade for a profile; tests swap in explicit paths.
using LnkFactory = std::function<core::Lnk(const std::string& profile)>;

CommandResult ok(std::string out);
CommandResult ok(std::string out, nlohmann::json data);
// Usage error: exit code 2, message on stderr, optional help text on stdout
CommandResult invalid(const Output& out, const std::string& msg, std::string usageText = {});

std::optional<std::string> optVal(const CommandCall& c, const std::string& key);
std::optional<std::string> optVal(const CommandCall& c, const std::vector<std::string>& keys);

[[nodiscard]] bool hasFlag(const CommandCall& c, const std::string& key);
[[nodiscard]] bool hasFlag(const CommandCall& c, const std::vector<std::string>& keys);

// -H/--host value, empty for the common profile
std::string profileFor(const CommandCall& c);

// "~/x" for paths under home
std::string displayPath(const std::filesystem::path& path, const std::filesystem::path& home);

std::string profileLabel(const std::string& profile);

}
