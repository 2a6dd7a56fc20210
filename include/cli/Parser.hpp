#pragma once

#include "cli/Token.hpp"
#include "cli/types.hpp"

#include <functional>
#include <string>
#include <vector>
#include <optional>

namespace lnk::cli {

// (command name, flag key) -> whether the flag consumes the next word.
// The command name is empty for flags seen before the command.
using ValueFlagResolver = std::function<bool(const std::string&, const std::string&)>;

// Upsert a flag (last wins)
inline void setOpt(CommandCall& c,
                   const std::string& key,
                   const std::optional<std::string>& val) {
    for (auto& [k, v] : c.options) if (k == key) { v = val; return; }
    c.options.push_back(FlagKV{key, val});
}

inline CommandCall parseTokens(const std::vector<Token>& toks, const ValueFlagResolver& takesValue = nullptr) {
    CommandCall call;
    call.options.reserve(8);
    call.positionals.reserve(8);

    bool stop_flags = false;

    for (size_t i = 0; i < toks.size(); ++i) {
        const Token& t = toks[i];

        // Sentinel: "--" arrives as a Word from the tokenizer
        if (!stop_flags && t.type == TokenType::Word && t.text == "--") {
            stop_flags = true;
            continue;
        }

        if (!stop_flags && t.type == TokenType::Flag) {
            const auto& key = t.text;
            const bool wantsValue = takesValue && takesValue(call.name, key);
            if (wantsValue && i + 1 < toks.size() && toks[i+1].type == TokenType::Word) {
                setOpt(call, key, toks[i+1].text);
                ++i; // consumed value
            } else {
                setOpt(call, key, std::nullopt);
            }
            continue;
        }

        // Command name = first Word
        if (call.name.empty() && !stop_flags) {
            call.name = t.text;
            continue;
        }

        call.positionals.push_back(t.text);
    }

    return call;
}

}
