#include "core/Bootstrapper.hpp"
#include "fs/Filesystem.hpp"
#include "error/Error.hpp"
#include "log/Registry.hpp"
#include "util/Process.hpp"

#include <fmt/format.h>

using namespace lnk::core;
using namespace lnk::error;

Bootstrapper::Bootstrapper(std::filesystem::path repoRoot) : repoRoot_(std::move(repoRoot)) {}

std::string Bootstrapper::find() const {
    std::error_code ec;
    if (std::filesystem::is_regular_file(repoRoot_ / BOOTSTRAP_SCRIPT, ec)) return BOOTSTRAP_SCRIPT;
    return {};
}

void Bootstrapper::run(const std::string& script) const {
    const auto path = repoRoot_ / script;
    if (!fs::Filesystem::exists(path))
        throw Error(Kind::BootstrapNotFound, "Bootstrap script not found", path.string(),
                    fmt::format("create {} at the repository root", BOOTSTRAP_SCRIPT));

    using std::filesystem::perms;
    std::error_code ec;
    std::filesystem::permissions(path,
                                 perms::owner_all | perms::group_read | perms::group_exec |
                                 perms::others_read | perms::others_exec, ec);
    if (ec)
        throw Error(Kind::BootstrapPerms, fmt::format("Failed to make bootstrap script executable ({})", ec.message()),
                    path.string());

    log::Registry::core()->info("[Bootstrapper] Running {}", path.string());

    const auto res = util::runProcess({ .argv = {"bash", path.string()}, .cwd = repoRoot_, .captureOutput = false });
    if (!res.ok())
        throw Error(Kind::BootstrapFailed, fmt::format("Bootstrap script failed with exit status {}", res.exitCode),
                    path.string());
}
