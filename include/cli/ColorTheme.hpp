#pragma once

#include "config/Config.hpp"

#include <string>

namespace lnk::cli {

// ANSI escapes for usage text and command output; every accessor
// returns "" when colors are off.
struct ColorTheme {
    bool enabled = true;

    std::string header = "\033[1;36m";  // section titles
    std::string command = "\033[1;32m"; // command names, success lines
    std::string key = "\033[33m";       // option keys, warnings
    std::string dim = "\033[2m";        // hints, captured git output
    std::string error = "\033[1;31m";
    std::string strong = "\033[1m";
    std::string reset = "\033[0m";

    // Auto follows isatty(stdout)
    static ColorTheme forMode(config::ColorMode mode);

    [[nodiscard]] std::string maybe(const std::string& code) const { return enabled ? code : ""; }
    [[nodiscard]] std::string H() const { return maybe(header); }
    [[nodiscard]] std::string C() const { return maybe(command); }
    [[nodiscard]] std::string K() const { return maybe(key); }
    [[nodiscard]] std::string D() const { return maybe(dim); }
    [[nodiscard]] std::string E() const { return maybe(error); }
    [[nodiscard]] std::string B() const { return maybe(strong); }
    [[nodiscard]] std::string R() const { return maybe(reset); }

    [[nodiscard]] std::string wrap(const std::string& code, const std::string& text) const {
        return enabled ? code + text + reset : text;
    }
};

}
