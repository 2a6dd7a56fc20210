#include "cli/commands/all.hpp"
#include "cli/Router.hpp"
#include "core/Lnk.hpp"

using namespace lnk::cli;

commands::LnkFactory commands::defaultFactory() {
    return [](const std::string& profile) { return core::Lnk(profile); };
}

void commands::registerAllCommands(Router& r, const LnkFactory& factory) {
    registerInitCommand(r, factory);
    registerAddCommand(r, factory);
    registerRemoveCommand(r, factory);
    registerListCommand(r, factory);
    registerSyncCommands(r, factory);
    registerDoctorCommand(r, factory);
    registerBootstrapCommand(r, factory);
}
