#include "cli/Router.hpp"
#include "cli/Token.hpp"
#include "cli/Parser.hpp"
#include "cli/CommandUsage.hpp"
#include "cli/Output.hpp"
#include "cli/usages.hpp"
#include "cli/commands/helpers.hpp"
#include "config/ConfigRegistry.hpp"
#include "error/Error.hpp"
#include "log/Registry.hpp"
#include "version.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <cctype>
#include <string>
#include <algorithm>

using namespace lnk::cli;
using namespace lnk::cli::commands;

Router::Router() {
    registerCommand(usage::help(), [this](const CommandCall& call) { return handleHelp(call); });
}

void Router::registerCommand(const std::shared_ptr<CommandUsage>& usage, CommandHandler handler) {
    const std::string key = normalize(usage->primary());

    for (const std::string& alias : usage->aliases) {
        const auto a = normalize(alias);
        if (aliasMap_.contains(a) && aliasMap_.at(a) != key) {
            log::Registry::shell()->warn("Alias '{}' already mapped to '{}'; skipping duplicate for '{}'",
                                         a, aliasMap_.at(a), key);
            continue;
        }
        aliasMap_[a] = key;
        log::Registry::shell()->trace("Alias '{}' mapped to '{}'", a, key);
    }

    if (!commands_.contains(key)) ordered_.push_back(usage);
    else std::ranges::replace(ordered_, commands_.at(key).usage, usage);
    commands_[key] = CommandInfo{usage, std::move(handler)};
}

std::string Router::canonicalFor(const std::string& nameOrAlias) const {
    const std::string n = normalize(nameOrAlias);
    if (commands_.contains(n)) return n;
    if (aliasMap_.contains(n)) return aliasMap_.at(n);
    return n; // unknown; let caller error
}

std::shared_ptr<CommandUsage> Router::usageFor(const std::string& nameOrAlias) const {
    const auto it = commands_.find(canonicalFor(nameOrAlias));
    return it == commands_.end() ? nullptr : it->second.usage;
}

std::string Router::overview(const Output& out) const {
    return renderOverview(ordered_, usage::globalFlags(), usage::globalOptions(), out.theme);
}

std::string Router::helpFor(const std::string& nameOrAlias, const Output& out) const {
    const auto usage = usageFor(nameOrAlias);
    if (!usage) return {};
    auto copy = *usage;
    copy.theme = out.theme;
    return copy.str();
}

CommandResult Router::handleHelp(const CommandCall& call) const {
    const auto& out = *call.out;
    if (call.positionals.empty()) return ok(overview(out));
    const auto text = helpFor(call.positionals.front(), out);
    if (text.empty()) return invalid(out, fmt::format("Unknown command '{}'", call.positionals.front()));
    return ok(text);
}

bool Router::isGlobalKey(const std::string& key) {
    const auto known = [&](const auto& entries) {
        return std::ranges::any_of(entries, [&](const auto& e) {
            return std::ranges::find(e.aliases, key) != e.aliases.end();
        });
    };
    return known(usage::globalFlags()) || known(usage::globalOptions());
}

bool Router::isGlobalValueKey(const std::string& key) {
    return std::ranges::any_of(usage::globalOptions(), [&](const Option& o) {
        return std::ranges::find(o.aliases, key) != o.aliases.end();
    });
}

CommandResult Router::execute(const std::vector<std::string>& args, std::ostream* live) const {
    log::Registry::shell()->debug("[Router] Executing: '{}'", fmt::join(args, " "));

    auto call = parseTokens(tokenize(args), [this](const std::string& cmd, const std::string& key) {
        if (isGlobalValueKey(key)) return true;
        if (cmd.empty()) return false;
        const auto usage = usageFor(cmd);
        return usage && usage->takesValue(key);
    });

    if (hasFlag(call, "verbose")) log::Registry::setConsoleLevel(spdlog::level::debug);

    const auto& outCfg = config::ConfigRegistry::get().output;
    auto colorMode = outCfg.colors;
    if (const auto mode = optVal(call, "colors")) {
        try {
            colorMode = config::parseColorMode(*mode);
        } catch (const error::Error& e) {
            return invalid(Output(config::ColorMode::Never, false), e.message());
        }
    }

    const Output out(colorMode, outCfg.emoji && !hasFlag(call, "no-emoji"));
    call.out = &out;
    call.json = hasFlag(call, "json");
    call.live = live;

    if (hasFlag(call, "version")) return ok(fmt::format("{} {}\n", CommandUsage::BIN_NAME, VERSION));

    if (call.name.empty()) return ok(overview(out));

    const auto canonical = canonicalFor(call.name);
    if (!commands_.contains(canonical))
        return invalid(out, fmt::format("Unknown command '{}'. Run 'lnk help' for a list of commands.", call.name));

    const auto& info = commands_.at(canonical);

    if (hasFlag(call, std::vector<std::string>{"h", "help"})) return ok(helpFor(canonical, out));

    for (const auto& [key, value] : call.options) {
        const auto dashed = fmt::format("{}{}", key.size() == 1 ? "-" : "--", key);
        if (!isGlobalKey(key) && !info.usage->knowsKey(key))
            return invalid(out, fmt::format("Unknown option '{}' for '{}'", dashed, canonical), helpFor(canonical, out));
        if (info.usage->takesValue(key) && (!value || value->empty()))
            return invalid(out, fmt::format("Option '{}' requires a value", dashed), helpFor(canonical, out));
    }

    log::Registry::shell()->debug("[Router] Executing command: '{}'", canonical);

    CommandResult result;
    try {
        result = info.handler(call);
    } catch (const error::Error& e) {
        log::Registry::shell()->debug("[Router] {} failed ({}): {}", canonical, error::to_string(e.kind()), e.what());
        return {1, "", out.error(e)};
    }

    if (call.json && result.has_data && result.exit_code == 0) result.stdout_text = result.data.dump(2) + "\n";
    return result;
}

std::string Router::normalize(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (const unsigned char c : s) out.push_back(static_cast<char>(std::tolower(c)));
    return out;
}
