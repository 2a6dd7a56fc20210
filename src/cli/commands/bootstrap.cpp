#include "cli/commands/all.hpp"
#include "cli/Router.hpp"
#include "cli/Output.hpp"
#include "cli/usages.hpp"
#include "core/Lnk.hpp"

#include <ostream>

namespace lnk::cli::commands {

static CommandResult handle_bootstrap(const CommandCall& call, const LnkFactory& make) {
    const auto& out = *call.out;
    const auto lnk = make({});

    const auto script = lnk.findBootstrapScript();
    if (script.empty()) {
        auto text = out.info("No bootstrap script found");
        text += out.hint("Create bootstrap.sh at the repository root to automate setup");
        return ok(text, {{"bootstrap", nullptr}});
    }

    auto text = out.line("🔧", "Running bootstrap script: " + script);
    if (call.live) {
        *call.live << text << std::flush;
        text.clear();
    }

    lnk.runBootstrapScript(script);
    text += out.success("Bootstrap completed");
    return ok(text, {{"bootstrap", script}});
}

void registerBootstrapCommand(Router& r, const LnkFactory& factory) {
    r.registerCommand(usage::bootstrap(), [factory](const CommandCall& call) { return handle_bootstrap(call, factory); });
}

}
