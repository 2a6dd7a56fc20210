#include "cli/Router.hpp"
#include "cli/commands/all.hpp"
#include "config/ConfigRegistry.hpp"
#include "error/Error.hpp"
#include "log/Registry.hpp"

#include <iostream>
#include <string>
#include <vector>

using namespace lnk;

static std::string ensureNewLine(const std::string& s) {
    if (s.empty() || s.back() != '\n') return s + '\n';
    return s;
}

int main(int argc, char** argv) {
    try {
        config::ConfigRegistry::init();
    } catch (const error::Error& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    log::Registry::init();

    cli::Router router;
    cli::commands::registerAllCommands(router);

    const std::vector<std::string> args(argv + 1, argv + argc);

    cli::CommandResult res;
    try {
        res = router.execute(args, &std::cout);
    } catch (const std::exception& e) {
        log::Registry::lnk()->error("Unhandled error: {}", e.what());
        std::cerr << "Error: " << e.what() << "\n";
        log::Registry::shutdown();
        return 1;
    }

    if (!res.stdout_text.empty()) std::cout << ensureNewLine(res.stdout_text);
    if (!res.stderr_text.empty()) std::cerr << ensureNewLine(res.stderr_text);

    log::Registry::shutdown();
    return res.exit_code;
}
