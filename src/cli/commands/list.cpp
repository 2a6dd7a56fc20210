#include "cli/commands/all.hpp"
#include "cli/Router.hpp"
#include "cli/Output.hpp"
#include "cli/usages.hpp"
#include "core/Lnk.hpp"

#include <fmt/format.h>

namespace lnk::cli::commands {

static std::string renderProfile(const Output& out, const std::string& profile, const std::vector<std::string>& entries) {
    if (entries.empty()) return out.line("📋", fmt::format("No files currently managed by lnk ({})", profileLabel(profile)));

    auto text = out.line("📋", out.bold(fmt::format("Files managed by lnk ({}) ({} item{}):", profileLabel(profile),
                                                    entries.size(), entries.size() == 1 ? "" : "s")));
    for (const auto& e : entries) text += out.detail("📄", e);
    return text;
}

static CommandResult handle_list(const CommandCall& call, const LnkFactory& make) {
    const auto& out = *call.out;
    if (!call.positionals.empty())
        return invalid(out, fmt::format("Unexpected argument '{}'", call.positionals.front()), usage::list()->str());

    if (!hasFlag(call, std::vector<std::string>{"all", "a"})) {
        const auto lnk = make(profileFor(call));
        const auto entries = lnk.list();

        auto text = renderProfile(out, lnk.profile(), entries);
        if (entries.empty()) text += out.hint("Use 'lnk add <file>' to start managing files");
        return ok(text, {{"profile", lnk.profile()}, {"entries", entries}});
    }

    const auto common = make({});
    auto text = renderProfile(out, {}, common.list());
    nlohmann::json data = {{"common", common.list()}, {"hosts", nlohmann::json::object()}};

    for (const auto& host : common.listHosts()) {
        const auto entries = make(host).list();
        text += "\n" + renderProfile(out, host, entries);
        data["hosts"][host] = entries;
    }

    return ok(text, data);
}

void registerListCommand(Router& r, const LnkFactory& factory) {
    r.registerCommand(usage::list(), [factory](const CommandCall& call) { return handle_list(call, factory); });
}

}
