#pragma once

#include "cli/ColorTheme.hpp"
#include "config/Config.hpp"

#include <string>

namespace lnk::error {
class Error;
}

namespace lnk::cli {

// Message styling for command output. Every helper returns a line ending in '\n'.
struct Output {
    ColorTheme theme{};
    bool emoji = true;

    Output() = default;
    Output(config::ColorMode colors, bool emoji);

    [[nodiscard]] bool colors() const { return theme.enabled; }

    // icon is dropped when emoji are disabled
    [[nodiscard]] std::string line(const std::string& icon, const std::string& text) const;
    [[nodiscard]] std::string detail(const std::string& icon, const std::string& text, int indent = 3) const;

    [[nodiscard]] std::string success(const std::string& text) const;
    [[nodiscard]] std::string info(const std::string& text) const;
    [[nodiscard]] std::string warning(const std::string& text) const;
    [[nodiscard]] std::string hint(const std::string& text) const;

    [[nodiscard]] std::string bold(const std::string& text) const;
    [[nodiscard]] std::string dim(const std::string& text) const;

    // message, path and suggestion on separate lines
    [[nodiscard]] std::string error(const error::Error& e) const;
    [[nodiscard]] std::string error(const std::string& message) const;
};

}
