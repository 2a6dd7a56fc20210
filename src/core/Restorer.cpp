#include "core/Restorer.hpp"
#include "fs/Filesystem.hpp"
#include "log/Registry.hpp"
#include "util/fsPath.hpp"

using namespace lnk::core;
using lnk::fs::Filesystem;

Restorer::Restorer(const Context& ctx) : ctx_(ctx) {}

std::vector<std::string> Restorer::restoreSymlinks() const {
    ctx_.requireRepository();

    std::vector<std::string> restored;

    for (const auto& rel : ctx_.tracker().load()) {
        if (util::escapesRoot(rel)) {
            log::Registry::core()->debug("[Restorer] Skipping malformed entry {}", rel);
            continue;
        }

        const auto repoItem = ctx_.layout.storagePath(rel);
        if (!Filesystem::exists(repoItem)) {
            log::Registry::core()->debug("[Restorer] Skipping {} (not in repository)", rel);
            continue;
        }

        const auto link = ctx_.homeLink(rel);
        if (Filesystem::isValidSymlink(link, repoItem)) continue;

        const auto norm = link.lexically_normal();
        if (norm == ctx_.home.lexically_normal() || util::isWithin(ctx_.layout.repoRoot, norm)) {
            log::Registry::core()->warn("[Restorer] Refusing to replace {} for entry {}", norm.string(), rel);
            continue;
        }

        Filesystem::mkdir(link.parent_path());
        if (Filesystem::exists(link)) {
            log::Registry::core()->debug("[Restorer] Replacing {}", link.string());
            Filesystem::removeAll(link);
        }

        Filesystem::createRelativeSymlink(repoItem, link);
        restored.push_back(rel);
    }

    if (!restored.empty()) log::Registry::core()->info("[Restorer] Restored {} symlink(s)", restored.size());
    return restored;
}
