#include "cli/commands/all.hpp"
#include "cli/Router.hpp"
#include "cli/Output.hpp"
#include "cli/usages.hpp"
#include "config/ConfigRegistry.hpp"
#include "core/Lnk.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>

namespace lnk::cli::commands {

static CommandResult handle_status(const CommandCall& call, const LnkFactory& make) {
    const auto& out = *call.out;
    const auto st = make({}).status();

    auto text = out.line("📊", out.bold("Repository status"));
    text += out.detail("🌐", "Remote: " + st.remote);

    if (st.ahead == 0 && st.behind == 0) text += out.detail("✅", "Up to date with remote");
    if (st.ahead > 0)
        text += out.detail("⬆️ ", fmt::format("{} commit{} ahead", st.ahead, st.ahead == 1 ? "" : "s"));
    if (st.behind > 0)
        text += out.detail("⬇️ ", fmt::format("{} commit{} behind", st.behind, st.behind == 1 ? "" : "s"));

    if (st.dirty) text += out.warning("Uncommitted changes present");

    if (st.dirty || st.ahead > 0) text += out.hint("Run 'lnk push' to sync your changes");
    else if (st.behind > 0) text += out.hint("Run 'lnk pull' to get the latest changes");

    return ok(text, {{"remote", st.remote}, {"ahead", st.ahead}, {"behind", st.behind}, {"dirty", st.dirty}});
}

static CommandResult handle_diff(const CommandCall& call, const LnkFactory& make) {
    const auto& out = *call.out;
    const auto diff = make({}).diff(out.colors());
    if (diff.empty()) return ok(out.success("No uncommitted changes"));
    return ok(diff);
}

static CommandResult handle_push(const CommandCall& call, const LnkFactory& make) {
    const auto& out = *call.out;
    const auto message = call.positionals.empty()
        ? config::ConfigRegistry::get().git.sync_message
        : fmt::format("{}", fmt::join(call.positionals, " "));

    make({}).push(message);

    auto text = out.line("🚀", out.bold("Pushed changes to remote"));
    text += out.detail("💬", "Message: " + message);
    return ok(text, {{"message", message}});
}

static CommandResult handle_pull(const CommandCall& call, const LnkFactory& make) {
    const auto& out = *call.out;
    const auto lnk = make(profileFor(call));
    const auto restored = lnk.pull();

    auto text = out.line("⬇️ ", out.bold(fmt::format("Pulled changes from remote ({})", profileLabel(lnk.profile()))));
    if (restored.empty()) text += out.detail("✨", "All symlinks already in place");
    else {
        text += out.detail("🔗", fmt::format("Restored {} symlink{}:", restored.size(), restored.size() == 1 ? "" : "s"));
        for (const auto& rel : restored) text += out.detail("", rel, 6);
    }
    return ok(text, {{"profile", lnk.profile()}, {"restored", restored}});
}

void registerSyncCommands(Router& r, const LnkFactory& factory) {
    r.registerCommand(usage::status(), [factory](const CommandCall& call) { return handle_status(call, factory); });
    r.registerCommand(usage::diff(), [factory](const CommandCall& call) { return handle_diff(call, factory); });
    r.registerCommand(usage::push(), [factory](const CommandCall& call) { return handle_push(call, factory); });
    r.registerCommand(usage::pull(), [factory](const CommandCall& call) { return handle_pull(call, factory); });
}

}
