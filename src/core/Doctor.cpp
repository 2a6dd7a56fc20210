#include "core/Doctor.hpp"
#include "core/Restorer.hpp"
#include "fs/Filesystem.hpp"
#include "vcs/Driver.hpp"
#include "log/Registry.hpp"
#include "util/fsPath.hpp"

#include <fmt/format.h>

using namespace lnk::core;
using lnk::fs::Filesystem;

Doctor::Doctor(const Context& ctx) : ctx_(ctx) {}

DoctorResult Doctor::preview() const {
    ctx_.requireRepository();

    DoctorResult result;
    for (const auto& rel : ctx_.tracker().load()) {
        if (util::escapesRoot(rel) || !Filesystem::exists(ctx_.layout.storagePath(rel))) {
            result.invalidEntries.push_back(rel);
            continue;
        }

        if (!Filesystem::isValidSymlink(ctx_.homeLink(rel), ctx_.layout.storagePath(rel)))
            result.brokenSymlinks.push_back(rel);
    }

    log::Registry::core()->debug("[Doctor] {} invalid, {} broken", result.invalidEntries.size(),
                                 result.brokenSymlinks.size());
    return result;
}

DoctorResult Doctor::fix() const {
    auto result = preview();

    if (!result.brokenSymlinks.empty()) {
        const auto restored = Restorer(ctx_).restoreSymlinks();
        log::Registry::core()->info("[Doctor] Relinked {} entr{}", restored.size(), restored.size() == 1 ? "y" : "ies");
    }

    if (!result.invalidEntries.empty()) {
        const auto tracker = ctx_.tracker();
        auto entries = tracker.load();
        for (const auto& rel : result.invalidEntries) entries.erase(rel);
        tracker.overwrite(entries);

        const auto n = result.invalidEntries.size();
        ctx_.vcs->add(ctx_.layout.trackingFileName());
        ctx_.vcs->commit(Context::commitMessage(fmt::format("cleaned {} invalid entr{}", n, n == 1 ? "y" : "ies")));
    }

    return result;
}
