#include "cli/commands/all.hpp"
#include "cli/Router.hpp"
#include "cli/Output.hpp"
#include "cli/usages.hpp"
#include "core/Lnk.hpp"

#include <fmt/format.h>

namespace lnk::cli::commands {

static CommandResult handle_rm(const CommandCall& call, const LnkFactory& make) {
    const auto& out = *call.out;
    if (call.positionals.size() != 1)
        return invalid(out, fmt::format("Expected exactly one path, got {}", call.positionals.size()), usage::rm()->str());

    const auto lnk = make(profileFor(call));
    const std::filesystem::path path = call.positionals.front();
    const auto shown = displayPath(path, lnk.context().home);
    const auto name = path.filename().string();

    if (hasFlag(call, std::vector<std::string>{"force", "f"})) {
        lnk.removeForce(path);
        auto text = out.line("🗑️ ", out.bold(fmt::format("Force removed {} from lnk ({})", name, profileLabel(lnk.profile()))));
        text += out.detail("📋", "Entry removed from tracking and the stored copy deleted");
        return ok(text, {{"removed", shown}, {"force", true}});
    }

    lnk.remove(path);
    auto text = out.line("🗑️ ", out.bold(fmt::format("Removed {} from lnk ({})", name, profileLabel(lnk.profile()))));
    text += out.detail("↩️ ", fmt::format("{} is a regular file again", shown));
    return ok(text, {{"removed", shown}, {"force", false}});
}

void registerRemoveCommand(Router& r, const LnkFactory& factory) {
    r.registerCommand(usage::rm(), [factory](const CommandCall& call) { return handle_rm(call, factory); });
}

}
