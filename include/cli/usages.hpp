#pragma once

#include "cli/CommandUsage.hpp"

#include <memory>
#include <vector>

namespace lnk::cli::usage {

std::shared_ptr<CommandUsage> init();
std::shared_ptr<CommandUsage> add();
std::shared_ptr<CommandUsage> rm();
std::shared_ptr<CommandUsage> list();
std::shared_ptr<CommandUsage> status();
std::shared_ptr<CommandUsage> diff();
std::shared_ptr<CommandUsage> push();
std::shared_ptr<CommandUsage> pull();
std::shared_ptr<CommandUsage> doctor();
std::shared_ptr<CommandUsage> bootstrap();
std::shared_ptr<CommandUsage> help();

const std::vector<Flag>& globalFlags();
const std::vector<Option>& globalOptions();

}
