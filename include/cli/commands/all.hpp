#pragma once

#include "cli/commands/helpers.hpp"

namespace lnk::cli {
class Router;
}

namespace lnk::cli::commands {

// Defaults to facades resolved from the environment.
LnkFactory defaultFactory();

void registerAllCommands(Router& r, const LnkFactory& factory = defaultFactory());

void registerInitCommand(Router& r, const LnkFactory& factory);
void registerAddCommand(Router& r, const LnkFactory& factory);
void registerRemoveCommand(Router& r, const LnkFactory& factory);
void registerListCommand(Router& r, const LnkFactory& factory);
void registerSyncCommands(Router& r, const LnkFactory& factory);
void registerDoctorCommand(Router& r, const LnkFactory& factory);
void registerBootstrapCommand(Router& r, const LnkFactory& factory);

}
