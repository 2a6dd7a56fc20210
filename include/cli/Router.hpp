#pragma once

#include "cli/types.hpp"

#include <memory>
#include <ostream>
#include <string>
#include <unordered_map>
#include <vector>

namespace lnk::cli {

class CommandUsage;

struct CommandInfo {
    std::shared_ptr<CommandUsage> usage;
    CommandHandler handler;
};

class Router {
public:
    Router();

    void registerCommand(const std::shared_ptr<CommandUsage>& usage, CommandHandler handler);

    // args excludes the program name. lnk::Error thrown by a handler becomes
    // exit code 1 with the error rendered on stderr.
    CommandResult execute(const std::vector<std::string>& args, std::ostream* live = nullptr) const;

    [[nodiscard]] std::shared_ptr<CommandUsage> usageFor(const std::string& nameOrAlias) const;
    [[nodiscard]] std::string canonicalFor(const std::string& nameOrAlias) const;

    [[nodiscard]] std::string overview(const Output& out) const;
    [[nodiscard]] std::string helpFor(const std::string& nameOrAlias, const Output& out) const;

private:
    std::unordered_map<std::string, CommandInfo> commands_;
    std::unordered_map<std::string, std::string> aliasMap_; // alias -> canonical
    std::vector<std::shared_ptr<CommandUsage>> ordered_;     // registration order, for help

    CommandResult handleHelp(const CommandCall& call) const;

    static std::string normalize(const std::string& s);
    static bool isGlobalKey(const std::string& key);
    static bool isGlobalValueKey(const std::string& key);
};

} // namespace lnk::cli
