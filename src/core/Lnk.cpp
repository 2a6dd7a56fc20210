#include "core/Lnk.hpp"
#include "core/Bootstrapper.hpp"
#include "core/Remover.hpp"
#include "core/Restorer.hpp"
#include "vcs/GitDriver.hpp"
#include "fs/Filesystem.hpp"
#include "config/ConfigRegistry.hpp"
#include "error/Error.hpp"
#include "log/Registry.hpp"
#include "util/paths.hpp"

#include <algorithm>

using namespace lnk::core;
using namespace lnk::error;
using lnk::fs::Filesystem;

namespace {

std::filesystem::path resolveHome() {
    const auto home = lnk::paths::getHomeDir();
    if (!home) throw Error(Kind::Path, "Cannot determine the home directory", {}, "set HOME");
    return *home;
}

}

Lnk::Lnk(const std::string& profile)
    : Lnk(paths::getRepoPath(), profile, resolveHome(),
          std::make_shared<vcs::GitDriver>(paths::getRepoPath(), config::ConfigRegistry::get().git)) {}

Lnk::Lnk(const std::filesystem::path& repoRoot, const std::string& profile, const std::filesystem::path& home,
         std::shared_ptr<vcs::Driver> driver)
    : ctx_(types::Layout(repoRoot, profile), home, std::move(driver),
           config::ConfigRegistry::get().add.progress_threshold) {
    log::Registry::core()->debug("[Lnk] repo: {}, profile: '{}', home: {}", ctx_.layout.repoRoot.string(),
                                 ctx_.layout.profile, ctx_.home.string());
}

void Lnk::init(const std::string& remote, const bool force) const {
    if (remote.empty()) {
        Filesystem::mkdir(ctx_.layout.repoRoot);

        if (ctx_.vcs->isRepository()) {
            if (ctx_.vcs->isManagedRepository()) {
                log::Registry::core()->debug("[Lnk::init] Repository already initialized");
                return;
            }
            throw Error(Kind::ExistingForeignRepo, "Directory contains a git repository not managed by lnk",
                        ctx_.layout.repoRoot.string(), "back it up and remove it, or point lnk at another location");
        }

        ctx_.vcs->init();
        log::Registry::core()->info("[Lnk::init] Initialized {}", ctx_.layout.repoRoot.string());
        return;
    }

    if (hasUserContent() && !force)
        throw Error(Kind::ManagedFilesExist, "Repository already contains managed files",
                    ctx_.layout.repoRoot.string(),
                    "use 'lnk pull' to update it, or 'lnk init --force' to replace it with the remote");

    ctx_.vcs->clone(remote);
    log::Registry::core()->info("[Lnk::init] Cloned {}", remote);
}

bool Lnk::hasUserContent() const {
    const auto& root = ctx_.layout.repoRoot;
    if (Filesystem::exists(root / types::TRACKING_FILE_NAME)) return true;

    if (!ctx_.layout.isCommon()) return Filesystem::exists(ctx_.layout.trackingPath);

    return !listHosts().empty();
}

void Lnk::add(const std::filesystem::path& path) const { Adder(ctx_).add(path); }

void Lnk::addMultiple(const std::vector<std::filesystem::path>& paths, const ProgressCallback& progress) const {
    Adder(ctx_).addMultiple(paths, progress);
}

std::vector<std::filesystem::path> Lnk::addRecursive(const std::vector<std::filesystem::path>& paths,
                                                     const ProgressCallback& progress) const {
    return Adder(ctx_).addRecursive(paths, progress);
}

std::vector<std::filesystem::path> Lnk::previewAdd(const std::vector<std::filesystem::path>& paths,
                                                   const bool recursive) const {
    return Adder(ctx_).preview(paths, recursive);
}

void Lnk::remove(const std::filesystem::path& path) const { Remover(ctx_).remove(path); }

void Lnk::removeForce(const std::filesystem::path& path) const { Remover(ctx_).removeForce(path); }

std::vector<std::string> Lnk::list() const {
    ctx_.requireRepository();
    const auto entries = ctx_.tracker().load();
    return {entries.begin(), entries.end()};
}

std::vector<std::string> Lnk::listHosts() const {
    std::vector<std::string> hosts;

    std::error_code ec;
    if (!std::filesystem::is_directory(ctx_.layout.repoRoot, ec)) return hosts;

    const std::string prefix = std::string(types::TRACKING_FILE_NAME) + ".";
    for (const auto& entry : std::filesystem::directory_iterator(ctx_.layout.repoRoot, ec)) {
        const auto name = entry.path().filename().string();
        if (name.size() > prefix.size() && name.starts_with(prefix) && entry.is_regular_file(ec))
            hosts.push_back(name.substr(prefix.size()));
    }
    if (ec) throw io("list repository", ctx_.layout.repoRoot, ec.message());

    std::ranges::sort(hosts);
    return hosts;
}

lnk::vcs::Status Lnk::status() const {
    ctx_.requireRepository();
    return ctx_.vcs->status();
}

std::string Lnk::diff(const bool color) const {
    ctx_.requireRepository();
    return ctx_.vcs->diff(color);
}

void Lnk::push(const std::string& message) const {
    ctx_.requireRepository();

    ctx_.vcs->addAll();
    if (ctx_.vcs->hasChanges())
        ctx_.vcs->commit(message.empty() ? config::ConfigRegistry::get().git.sync_message : message);
    else log::Registry::core()->debug("[Lnk::push] Nothing to commit");

    ctx_.vcs->push();
}

std::vector<std::string> Lnk::pull() const {
    ctx_.requireRepository();
    ctx_.vcs->pull();
    return restoreSymlinks();
}

std::vector<std::string> Lnk::restoreSymlinks() const { return Restorer(ctx_).restoreSymlinks(); }

DoctorResult Lnk::previewDoctor() const { return Doctor(ctx_).preview(); }

DoctorResult Lnk::fixDoctor() const { return Doctor(ctx_).fix(); }

std::string Lnk::findBootstrapScript() const {
    ctx_.requireRepository();
    return Bootstrapper(ctx_.layout.repoRoot).find();
}

void Lnk::runBootstrapScript(const std::string& script) const {
    ctx_.requireRepository();
    Bootstrapper(ctx_.layout.repoRoot).run(script);
}

std::vector<std::string> Lnk::getCommits() const {
    ctx_.requireRepository();
    return ctx_.vcs->getCommits();
}
