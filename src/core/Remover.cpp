#include "core/Remover.hpp"
#include "core/Rollback.hpp"
#include "fs/Filesystem.hpp"
#include "vcs/Driver.hpp"
#include "error/Error.hpp"
#include "log/Registry.hpp"
#include "util/fsPath.hpp"

using namespace lnk::core;
using namespace lnk::error;
using lnk::fs::Filesystem;

Remover::Remover(const Context& ctx) : ctx_(ctx) {}

void Remover::remove(const std::filesystem::path& path) const {
    ctx_.requireRepository();

    const auto link = util::absolutize(path);
    const auto target = Filesystem::validateSymlinkForRemove(link, ctx_.layout.repoRoot);

    const auto rel = ctx_.relativeToHome(link);
    const auto tracker = ctx_.tracker();
    if (!tracker.contains(rel)) throw notManaged(link.string());

    // storage must be there before anything is touched
    const auto info = Filesystem::stat(target);
    log::Registry::core()->debug("[Remover] {} -> {} ({})", link.string(), target.string(),
                                 info.isDirectory() ? "directory" : "file");

    const auto basename = link.filename().string();
    const auto vcsPath = ctx_.layout.vcsPath(rel);

    RollbackStack rollback(ctx_);
    try {
        Filesystem::remove(link);
        rollback.push(rollback::RestoreLink{ .target = target, .link = link });

        tracker.remove(rel);
        rollback.push(rollback::Retrack{ .rel = rel });

        ctx_.vcs->rm(vcsPath);
        rollback.push(rollback::Restage{ .vcsPath = vcsPath });

        ctx_.vcs->add(ctx_.layout.trackingFileName());
        ctx_.vcs->commit(Context::commitMessage("removed " + basename));
        rollback.discard();
    } catch (const std::exception& e) {
        log::Registry::core()->warn("[Remover] Removing {} failed, rolling back: {}", rel, e.what());
        rollback.unwind();

        // the index may hold the shortened tracking file
        try {
            ctx_.vcs->add(ctx_.layout.trackingFileName());
        } catch (const Error& restage) {
            log::Registry::core()->debug("[Remover] Could not restage tracking file: {}", restage.what());
        }
        throw;
    }

    // committed; the item is known to exist so a failure here is reported as is
    Filesystem::move(target, link);
    log::Registry::core()->info("[Remover] Removed {}", rel);
}

void Remover::removeForce(const std::filesystem::path& path) const {
    ctx_.requireRepository();

    const auto link = util::absolutize(path);
    const auto rel = ctx_.relativeToHome(link);
    const auto tracker = ctx_.tracker();
    if (!tracker.contains(rel)) throw notManaged(link.string());

    if (Filesystem::isSymlink(link)) {
        try {
            Filesystem::remove(link);
        } catch (const Error& e) {
            log::Registry::core()->debug("[Remover::force] Ignoring failed unlink: {}", e.what());
        }
    } else log::Registry::core()->debug("[Remover::force] No symlink at {}", link.string());

    tracker.remove(rel);

    const auto vcsPath = ctx_.layout.vcsPath(rel);
    try {
        ctx_.vcs->rm(vcsPath);
    } catch (const Error& e) {
        log::Registry::core()->debug("[Remover::force] Ignoring failed rm of {}: {}", vcsPath.string(), e.what());
    }

    ctx_.vcs->add(ctx_.layout.trackingFileName());
    ctx_.vcs->commit(Context::commitMessage("force removed " + link.filename().string()));

    if (const auto stored = ctx_.layout.storagePath(rel); Filesystem::exists(stored)) Filesystem::removeAll(stored);

    log::Registry::core()->info("[Remover::force] Removed {}", rel);
}
