#include "core/Rollback.hpp"
#include "core/Context.hpp"
#include "fs/Filesystem.hpp"
#include "vcs/Driver.hpp"
#include "error/Error.hpp"
#include "log/Registry.hpp"

#include <ranges>
#include <fmt/format.h>

using namespace lnk::core;
using namespace lnk::core::rollback;
using lnk::fs::Filesystem;

namespace {

template<class... Ts>
struct Overloaded : Ts... { using Ts::operator()...; };

}

std::string rollback::describe(const Action& action) {
    return std::visit(Overloaded{
        [](const MoveBack& a) { return fmt::format("move {} back to {}", a.from.string(), a.to.string()); },
        [](const RemoveLink& a) { return fmt::format("remove symlink {}", a.link.string()); },
        [](const RestoreLink& a) { return fmt::format("restore symlink {} -> {}", a.link.string(), a.target.string()); },
        [](const Untrack& a) { return fmt::format("untrack {}", a.rel); },
        [](const Retrack& a) { return fmt::format("track {} again", a.rel); },
        [](const Unstage& a) { return fmt::format("unstage {}", a.vcsPath.string()); },
        [](const Restage& a) { return fmt::format("stage {} again", a.vcsPath.string()); },
    }, action);
}

void RollbackStack::apply(const Action& action) const {
    std::visit(Overloaded{
        [](const MoveBack& a) {
            // the link created in its place must be gone before renaming back
            if (Filesystem::isSymlink(a.to)) Filesystem::remove(a.to);
            Filesystem::move(a.from, a.to);
        },
        [](const RemoveLink& a) {
            if (Filesystem::isSymlink(a.link)) Filesystem::remove(a.link);
        },
        [](const RestoreLink& a) {
            if (!Filesystem::exists(a.link)) Filesystem::createRelativeSymlink(a.target, a.link);
        },
        [this](const Untrack& a) { ctx_.tracker().remove(a.rel); },
        [this](const Retrack& a) { ctx_.tracker().add(a.rel); },
        [this](const Unstage& a) { ctx_.vcs->rm(a.vcsPath); },
        [this](const Restage& a) { ctx_.vcs->add(a.vcsPath); },
    }, action);
}

std::size_t RollbackStack::unwind() {
    std::size_t failures = 0;

    for (const auto& action : std::views::reverse(actions_)) {
        log::Registry::core()->warn("[Rollback] {}", describe(action));
        try {
            apply(action);
        } catch (const std::exception& e) {
            ++failures;
            log::Registry::core()->error("[Rollback] Failed to {}: {}", describe(action), e.what());
        }
    }

    actions_.clear();
    return failures;
}
