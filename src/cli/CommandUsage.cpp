#include "cli/CommandUsage.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <string>
#include <vector>
#include <stdexcept>

#include <fmt/format.h>
#include <fmt/ranges.h>

namespace lnk::cli {

namespace {

std::string trimRight(std::string s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.pop_back();
    return s;
}

std::vector<std::string> wrap(const std::string& s, int width) {
    const int W = std::max(20, width);
    std::vector<std::string> out;
    std::size_t i = 0, n = s.size();
    while (i < n) {
        // skip leading spaces
        while (i < n && std::isspace(static_cast<unsigned char>(s[i])) && s[i] != '\n') ++i;

        // hard break at newline
        if (i < n && s[i] == '\n') {
            out.emplace_back("");
            ++i;
            continue;
        }

        if (i >= n) break;

        const std::size_t end = std::min<std::size_t>(i + W, n);
        std::size_t break_pos = end;

        // prefer last space before end
        if (end < n && s[end] != ' ') {
            auto sp = s.rfind(' ', end);
            if (sp != std::string::npos && sp >= i) break_pos = sp;
        }

        if (break_pos == i) break_pos = end; // no space found

        out.push_back(trimRight(s.substr(i, break_pos - i)));

        if (break_pos < n && s[break_pos] == ' ') i = break_pos + 1;
        else i = break_pos;
    }
    if (out.empty()) out.emplace_back("");
    return out;
}

std::string padRight(const std::string& s, std::size_t width) {
    if (s.size() >= width) return s;
    return s + std::string(width - s.size(), ' ');
}

std::string dashifyToken(const std::string& t) {
    if (t.empty()) return t;
    return (t.size() == 1 ? "-" : "--") + t;
}

std::vector<std::string> dashifyTokens(const std::vector<std::string>& toks) {
    std::vector<std::string> out;
    out.reserve(toks.size());
    for (auto& t : toks) out.push_back(dashifyToken(t));
    return out;
}

struct KeyDesc {
    std::string key;
    std::string desc;
};

KeyDesc renderPositional(const Positional& p) {
    auto key = fmt::format("<{}>", p.label);
    if (p.variadic) key += "...";
    return { p.optional ? fmt::format("[{}]", key) : key, p.desc };
}

KeyDesc renderFlag(const Flag& f) {
    const auto toks = f.aliases.empty() ? std::vector<std::string>{f.label} : f.aliases;
    return { fmt::format("{}", fmt::join(dashifyTokens(toks), ", ")), f.desc };
}

KeyDesc renderOption(const Option& o) {
    const auto toks = o.aliases.empty() ? std::vector<std::string>{o.label} : o.aliases;
    return { fmt::format("{} <{}>", fmt::join(dashifyTokens(toks), ", "), o.value_label), o.desc };
}

template <class T, class F>
std::size_t visibleKeyWidth(const std::vector<T>& items, std::size_t cap, F&& render) {
    std::size_t w = 0;
    for (const auto& it : items) w = std::max<std::size_t>(w, render(it).key.size());
    return std::min(w, cap);
}

void emitTwoCol(std::ostringstream& out, const std::vector<KeyDesc>& rows,
                std::size_t indent, std::size_t gap, int width, std::size_t keyw,
                const ColorTheme& theme) {
    const int rightw = width - static_cast<int>(indent + keyw + gap);
    for (const auto& kd : rows) {
        const auto desc_lines = wrap(kd.desc, std::max(20, rightw));

        out << std::string(indent, ' ');
        out << theme.K() << padRight(kd.key, keyw) << theme.R();
        // keys wider than the column get their description on the next line
        if (kd.key.size() > keyw) out << "\n" << std::string(indent + keyw, ' ');
        out << std::string(gap, ' ');

        out << desc_lines[0] << "\n";
        for (std::size_t i = 1; i < desc_lines.size(); ++i)
            out << std::string(indent + keyw + gap, ' ') << desc_lines[i] << "\n";
    }
}

template <class T, class F>
void emitTwoColSection(std::ostringstream& out, const std::string& title, const std::vector<T>& items,
                       int width, std::size_t max_key_col, const ColorTheme& theme, F&& render) {
    if (items.empty()) return;
    out << theme.H() << title << theme.R() << "\n";
    std::vector<KeyDesc> rows;
    rows.reserve(items.size());
    for (const auto& it : items) rows.push_back(render(it));
    emitTwoCol(out, rows, 2, 2, width, visibleKeyWidth(items, max_key_col, render), theme);
    out << "\n";
}

}

std::string CommandUsage::primary() const {
    if (aliases.empty()) throw std::runtime_error("CommandUsage::primary() called with no aliases");
    return aliases[0];
}

bool CommandUsage::takesValue(const std::string& key) const {
    return std::ranges::any_of(options, [&](const Option& o) {
        return o.label == key || std::ranges::find(o.aliases, key) != o.aliases.end();
    });
}

bool CommandUsage::knowsKey(const std::string& key) const {
    if (takesValue(key)) return true;
    return std::ranges::any_of(flags, [&](const Flag& f) {
        return f.label == key || std::ranges::find(f.aliases, key) != f.aliases.end();
    });
}

std::string CommandUsage::buildSynopsis() const {
    if (synopsis) return *synopsis;

    std::ostringstream syn;
    syn << BIN_NAME << ' ' << primary();

    for (const auto& o : options) {
        const auto toks = o.aliases.empty() ? std::vector<std::string>{o.label} : o.aliases;
        syn << " [" << dashifyToken(toks.front()) << " <" << o.value_label << ">]";
    }

    for (const auto& f : flags) {
        const auto toks = f.aliases.empty() ? std::vector<std::string>{f.label} : f.aliases;
        syn << " [" << dashifyToken(toks.front()) << ']';
    }

    for (const auto& p : positionals) syn << ' ' << renderPositional(p).key;

    return syn.str();
}

std::string CommandUsage::basicStr() const {
    return fmt::format("{}{}{}  {}", theme.C(), primary(), theme.R(), description);
}

std::string CommandUsage::str() const {
    std::ostringstream out;

    out << theme.H() << "Usage:" << theme.R() << "\n";
    out << "  " << theme.C() << buildSynopsis() << theme.R() << "\n\n";

    if (!description.empty()) {
        for (const auto& line : wrap(description, term_width - 2)) out << "  " << line << "\n";
        out << "\n";
    }

    if (aliases.size() > 1) {
        const std::vector rest(aliases.begin() + 1, aliases.end());
        out << theme.H() << "Aliases:" << theme.R() << "\n  " << fmt::format("{}", fmt::join(rest, ", ")) << "\n\n";
    }

    emitTwoColSection(out, "Arguments:", positionals, term_width, max_key_col, theme, renderPositional);
    emitTwoColSection(out, "Options:", options, term_width, max_key_col, theme, renderOption);
    emitTwoColSection(out, "Flags:", flags, term_width, max_key_col, theme, renderFlag);

    if (!examples.empty()) {
        out << theme.H() << "Examples:" << theme.R() << "\n";
        for (const auto& ex : examples) {
            out << "  " << theme.C() << ex.cmd << theme.R() << "\n";
            if (!ex.desc.empty()) out << "      " << theme.D() << ex.desc << theme.R() << "\n";
        }
        out << "\n";
    }

    return trimRight(out.str()) + "\n";
}

std::string renderOverview(const std::vector<std::shared_ptr<CommandUsage>>& commands,
                           const std::vector<Flag>& globalFlags,
                           const std::vector<Option>& globalOptions,
                           const ColorTheme& theme, const int termWidth) {
    std::ostringstream out;

    out << theme.H() << "Usage:" << theme.R() << "\n";
    out << "  " << theme.C() << CommandUsage::BIN_NAME << " [global options] <command> [args]" << theme.R() << "\n\n";
    out << "  Manage dotfiles with symlinks and git.\n\n";

    std::vector<KeyDesc> rows;
    for (const auto& c : commands) rows.push_back({ c->primary(), c->description });
    std::size_t keyw = 0;
    for (const auto& r : rows) keyw = std::max(keyw, r.key.size());

    out << theme.H() << "Commands:" << theme.R() << "\n";
    emitTwoCol(out, rows, 2, 2, termWidth, std::min<std::size_t>(keyw, 30), theme);
    out << "\n";

    emitTwoColSection(out, "Global options:", globalOptions, termWidth, 30, theme, renderOption);
    emitTwoColSection(out, "Global flags:", globalFlags, termWidth, 30, theme, renderFlag);

    out << theme.D() << "Run '" << CommandUsage::BIN_NAME << " help <command>' for details on a command." << theme.R() << "\n";
    return out.str();
}

}
