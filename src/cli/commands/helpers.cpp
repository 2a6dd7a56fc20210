#include "cli/commands/helpers.hpp"
#include "cli/Output.hpp"
#include "util/fsPath.hpp"

#include <algorithm>
#include <fmt/format.h>

namespace lnk::cli::commands {

CommandResult ok(std::string out) { return {0, std::move(out), ""}; }

CommandResult ok(std::string out, nlohmann::json data) {
    return {0, std::move(out), "", std::move(data), true};
}

CommandResult invalid(const Output& out, const std::string& msg, std::string usageText) {
    return {2, std::move(usageText), out.error(msg)};
}

std::optional<std::string> optVal(const CommandCall& c, const std::string& key) {
    for (const auto& [k, v] : c.options) if (k == key) return v.value_or(std::string{});
    return std::nullopt;
}

std::optional<std::string> optVal(const CommandCall& c, const std::vector<std::string>& keys) {
    for (const auto& k : keys) if (const auto v = optVal(c, k)) return v;
    return std::nullopt;
}

bool hasFlag(const CommandCall& c, const std::string& key) {
    for (const auto& [k, v] : c.options) if (k == key) return !v.has_value();
    return false;
}

bool hasFlag(const CommandCall& c, const std::vector<std::string>& keys) {
    return std::ranges::any_of(keys, [&c](const std::string& k) { return hasFlag(c, k); });
}

std::string profileFor(const CommandCall& c) {
    return optVal(c, std::vector<std::string>{"host", "H"}).value_or(std::string{});
}

std::string displayPath(const std::filesystem::path& path, const std::filesystem::path& home) {
    const auto abs = util::absolutize(path);
    if (util::isWithin(abs, home)) {
        const auto rel = util::homeRelative(abs, home);
        return rel == "." ? "~" : "~/" + rel;
    }
    return abs.string();
}

std::string profileLabel(const std::string& profile) {
    return profile.empty() ? "common" : fmt::format("host: {}", profile);
}

}
