#pragma once

#include <functional>
#include <optional>
#include <ostream>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace lnk::cli {

struct FlagKV {
    std::string key;
    std::optional<std::string> value;
};

struct Output;

struct CommandCall {
    std::string name;
    std::vector<FlagKV> options;
    std::vector<std::string> positionals;

    // global options, resolved by the Router before dispatch
    const Output* out = nullptr;
    bool json = false;

    // if set, progress and output that must precede a child process go here
    std::ostream* live = nullptr;
};

struct CommandResult {
    int exit_code = 0;                 // 0 = success, 1 = failure, 2 = usage
    std::string stdout_text;
    std::string stderr_text;
    nlohmann::json data;               // optional machine-readable payload
    bool has_data = false;
};

using CommandHandler = std::function<CommandResult(const CommandCall&)>;

}
