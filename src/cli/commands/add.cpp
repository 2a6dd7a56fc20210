#include "cli/commands/all.hpp"
#include "cli/Router.hpp"
#include "cli/Output.hpp"
#include "cli/usages.hpp"
#include "core/Lnk.hpp"
#include "util/fsPath.hpp"

#include <fmt/format.h>

namespace lnk::cli::commands {

static std::vector<std::filesystem::path> toPaths(const std::vector<std::string>& args) {
    return {args.begin(), args.end()};
}

static CommandResult handle_dry_run(const CommandCall& call, const core::Lnk& lnk, const bool recursive) {
    const auto& out = *call.out;
    const auto& home = lnk.context().home;
    const auto files = lnk.previewAdd(toPaths(call.positionals), recursive);

    nlohmann::json list = nlohmann::json::array();
    auto text = out.line("🔍", out.bold(fmt::format("Would add {} file{} to lnk ({}):", files.size(),
                                                    files.size() == 1 ? "" : "s", profileLabel(lnk.profile()))));
    for (const auto& f : files) {
        text += out.detail("📄", displayPath(f, home));
        list.push_back(f.string());
    }
    text += out.hint("Run the command without --dry-run to add them");
    return ok(text, {{"profile", lnk.profile()}, {"would_add", list}});
}

static CommandResult handle_add(const CommandCall& call, const LnkFactory& make) {
    const auto& out = *call.out;
    if (call.positionals.empty()) return invalid(out, "No paths given", usage::add()->str());

    const auto lnk = make(profileFor(call));
    const auto& home = lnk.context().home;
    const bool recursive = hasFlag(call, std::vector<std::string>{"recursive", "r"});

    if (hasFlag(call, std::vector<std::string>{"dry-run", "n"})) return handle_dry_run(call, lnk, recursive);

    const auto paths = toPaths(call.positionals);
    nlohmann::json added = nlohmann::json::array();

    if (recursive) {
        bool reported = false;
        const auto files = lnk.addRecursive(paths, [&](const std::size_t i, const std::size_t n, const std::string& name) {
            if (!call.live) return;
            // redraw in place; \033[K clears what is left of a longer previous name
            *call.live << '\r' << (out.emoji ? "⏳ " : "") << fmt::format("Processing {}/{}: {}", i, n, name)
                       << "\033[K" << std::flush;
            reported = true;
        });
        if (reported) *call.live << "\n";

        for (const auto& f : files) added.push_back(f.string());
        auto text = out.success(fmt::format("Added {} file{} recursively to lnk ({})", files.size(),
                                            files.size() == 1 ? "" : "s", profileLabel(lnk.profile())));
        if (!files.empty()) text += out.detail("📁", "Storage: " + lnk.context().layout.storageRoot.string());
        return ok(text, {{"profile", lnk.profile()}, {"added", added}});
    }

    if (paths.size() == 1) {
        lnk.add(paths.front());
        const auto link = util::absolutize(paths.front());
        const auto stored = lnk.context().layout.storagePath(lnk.context().relativeToHome(link));
        added.push_back(link.string());

        auto text = out.success(fmt::format("Added {} to lnk ({})", link.filename().string(), profileLabel(lnk.profile())));
        text += out.detail("🔗", fmt::format("{} -> {}", displayPath(link, home), stored.string()));
        text += out.hint("Use 'lnk push' to sync to remote");
        return ok(text, {{"profile", lnk.profile()}, {"added", added}});
    }

    lnk.addMultiple(paths);
    auto text = out.success(fmt::format("Added {} items to lnk ({})", paths.size(), profileLabel(lnk.profile())));
    for (const auto& p : paths) {
        text += out.detail("🔗", displayPath(p, home));
        added.push_back(util::absolutize(p).string());
    }
    text += out.hint("Use 'lnk push' to sync to remote");
    return ok(text, {{"profile", lnk.profile()}, {"added", added}});
}

void registerAddCommand(Router& r, const LnkFactory& factory) {
    r.registerCommand(usage::add(), [factory](const CommandCall& call) { return handle_add(call, factory); });
}

}
