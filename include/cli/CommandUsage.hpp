#pragma once

#include "cli/ColorTheme.hpp"

#include <string>
#include <vector>
#include <optional>
#include <cstddef>
#include <memory>

namespace lnk::cli {

struct Entry {
    std::string label;
    std::string desc;
};

struct Positional : Entry {
    bool optional = false;
    bool variadic = false;
};

// Boolean switch, e.g. -f/--force
struct Flag : Entry {
    std::vector<std::string> aliases; // without dashes; single letters render as -x
};

// Switch that takes a value, e.g. -H/--host <name>
struct Option : Entry {
    std::vector<std::string> aliases;
    std::string value_label = "value";
};

struct Example {
    std::string cmd;
    std::string desc;
};

class CommandUsage {
public:
    std::vector<std::string> aliases;      // aliases[0] is the canonical name
    std::string description;
    std::optional<std::string> synopsis;   // if empty, synthesized
    std::vector<Positional> positionals;
    std::vector<Flag> flags;
    std::vector<Option> options;
    std::vector<Example> examples;

    int term_width = 100;         // target width for str()
    std::size_t max_key_col = 30; // cap left column width
    ColorTheme theme{};

    [[nodiscard]] std::string primary() const;

    // Flag or option key (short or long) that consumes a value
    [[nodiscard]] bool takesValue(const std::string& key) const;
    [[nodiscard]] bool knowsKey(const std::string& key) const;

    // Full help page
    [[nodiscard]] std::string str() const;
    // One line for command listings
    [[nodiscard]] std::string basicStr() const;

    [[nodiscard]] std::string buildSynopsis() const;

    static constexpr const char* BIN_NAME = "lnk";
};

// Root page: global options plus one line per command.
std::string renderOverview(const std::vector<std::shared_ptr<CommandUsage>>& commands,
                           const std::vector<Flag>& globalFlags,
                           const std::vector<Option>& globalOptions,
                           const ColorTheme& theme, int termWidth = 100);

}
