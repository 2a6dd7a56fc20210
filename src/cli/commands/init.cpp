#include "cli/commands/all.hpp"
#include "cli/Router.hpp"
#include "cli/Output.hpp"
#include "cli/usages.hpp"
#include "core/Lnk.hpp"

#include <fmt/format.h>

namespace lnk::cli::commands {

static CommandResult handle_init(const CommandCall& call, const LnkFactory& make) {
    const auto& out = *call.out;
    if (!call.positionals.empty())
        return invalid(out, fmt::format("Unexpected argument '{}'", call.positionals.front()), usage::init()->str());

    const auto remote = optVal(call, std::vector<std::string>{"remote", "r"}).value_or(std::string{});
    const auto lnk = make({});
    lnk.init(remote, hasFlag(call, "force"));

    const auto repo = lnk.repoPath().string();
    nlohmann::json data = {{"repository", repo}, {"remote", remote}};

    if (remote.empty()) {
        auto text = out.line("🎯", out.bold("Initialized empty lnk repository"));
        text += out.detail("📁", "Location: " + repo);
        text += out.hint("Use 'lnk add <file>' to start managing files");
        return ok(text, data);
    }

    auto text = out.line("🎯", out.bold("Initialized lnk repository"));
    text += out.detail("📦", "Cloned from: " + remote);
    text += out.detail("📁", "Location: " + repo);

    const auto script = lnk.findBootstrapScript();
    data["bootstrap"] = script;

    if (!script.empty()) {
        if (hasFlag(call, "no-bootstrap")) {
            text += out.hint(fmt::format("Found {}; run 'lnk bootstrap' to execute it", script));
        } else {
            text += out.line("🔧", "Running bootstrap script: " + script);
            // the script writes straight to the terminal; keep ordering
            if (call.live) {
                *call.live << text << std::flush;
                text.clear();
            }
            lnk.runBootstrapScript(script);
            text += out.success("Bootstrap completed");
        }
    }

    text += out.hint("Run 'lnk pull' to create symlinks for the managed files");
    return ok(text, data);
}

void registerInitCommand(Router& r, const LnkFactory& factory) {
    r.registerCommand(usage::init(), [factory](const CommandCall& call) { return handle_init(call, factory); });
}

}
