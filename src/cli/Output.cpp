#include "cli/Output.hpp"
#include "error/Error.hpp"

#include <unistd.h>
#include <fmt/format.h>

using namespace lnk::cli;

ColorTheme ColorTheme::forMode(const config::ColorMode mode) {
    ColorTheme theme;
    switch (mode) {
        case config::ColorMode::Always: theme.enabled = true; break;
        case config::ColorMode::Never: theme.enabled = false; break;
        case config::ColorMode::Auto: theme.enabled = ::isatty(STDOUT_FILENO) == 1; break;
    }
    return theme;
}

Output::Output(const config::ColorMode colors, const bool emoji) : theme(ColorTheme::forMode(colors)), emoji(emoji) {}

std::string Output::line(const std::string& icon, const std::string& text) const {
    if (!emoji || icon.empty()) return text + "\n";
    return fmt::format("{} {}\n", icon, text);
}

std::string Output::detail(const std::string& icon, const std::string& text, const int indent) const {
    return std::string(static_cast<size_t>(indent), ' ') + line(icon, text);
}

std::string Output::success(const std::string& text) const {
    return line("✨", theme.wrap(theme.command, text));
}

std::string Output::info(const std::string& text) const { return line("ℹ️ ", text); }

std::string Output::warning(const std::string& text) const {
    return line("⚠️ ", theme.wrap(theme.key, text));
}

std::string Output::hint(const std::string& text) const { return detail("💡", dim(text)); }

std::string Output::bold(const std::string& text) const {
    return theme.wrap(theme.strong, text);
}

std::string Output::dim(const std::string& text) const { return theme.wrap(theme.dim, text); }

std::string Output::error(const std::string& message) const {
    return line("❌", fmt::format("{}Error:{} {}", theme.E(), theme.R(), message));
}

std::string Output::error(const error::Error& e) const {
    auto out = error(e.message());
    if (!e.path().empty()) out += detail("📁", e.path());
    if (!e.output().empty()) out += detail("", dim(e.output()));
    if (!e.suggestion().empty()) out += hint(e.suggestion());
    return out;
}
