#include "cli/commands/all.hpp"
#include "cli/Router.hpp"
#include "cli/Output.hpp"
#include "cli/usages.hpp"
#include "core/Lnk.hpp"

#include <fmt/format.h>

namespace lnk::cli::commands {

static std::string plural(const std::size_t n, const char* one, const char* many) {
    return fmt::format("{} {}", n, n == 1 ? one : many);
}

static CommandResult handle_doctor(const CommandCall& call, const LnkFactory& make) {
    const auto& out = *call.out;
    const auto lnk = make(profileFor(call));
    const bool dryRun = hasFlag(call, std::vector<std::string>{"dry-run", "n"});

    const auto result = dryRun ? lnk.previewDoctor() : lnk.fixDoctor();
    const nlohmann::json data = {
        {"profile", lnk.profile()},
        {"invalid_entries", result.invalidEntries},
        {"broken_symlinks", result.brokenSymlinks},
        {"fixed", !dryRun && result.hasIssues()},
    };

    if (!result.hasIssues())
        return ok(out.line("✅", fmt::format("No issues found ({})", profileLabel(lnk.profile()))), data);

    std::string text;
    if (dryRun) {
        text = out.line("🩺", out.bold(fmt::format("Found {}:", plural(result.totalIssues(), "issue", "issues"))));
        for (const auto& rel : result.invalidEntries) text += out.detail("❌", "Invalid entry: " + rel);
        for (const auto& rel : result.brokenSymlinks) text += out.detail("🔗", "Broken symlink: " + rel);
        text += out.hint("Run 'lnk doctor' without --dry-run to fix them");
        return ok(text, data);
    }

    text = out.line("🩺", out.bold(fmt::format("Fixed {}:", plural(result.totalIssues(), "issue", "issues"))));
    if (!result.brokenSymlinks.empty()) {
        text += out.detail("🔗", "Relinked " + plural(result.brokenSymlinks.size(), "entry", "entries"));
        for (const auto& rel : result.brokenSymlinks) text += out.detail("", rel, 6);
    }
    if (!result.invalidEntries.empty()) {
        text += out.detail("🧹", "Removed " + plural(result.invalidEntries.size(), "invalid entry", "invalid entries"));
        for (const auto& rel : result.invalidEntries) text += out.detail("", rel, 6);
    }
    return ok(text, data);
}

void registerDoctorCommand(Router& r, const LnkFactory& factory) {
    r.registerCommand(usage::doctor(), [factory](const CommandCall& call) { return handle_doctor(call, factory); });
}

}
