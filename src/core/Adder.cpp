#include "core/Adder.hpp"
#include "core/DirectoryWalker.hpp"
#include "core/Rollback.hpp"
#include "vcs/Driver.hpp"
#include "error/Error.hpp"
#include "log/Registry.hpp"
#include "util/fsPath.hpp"

#include <unordered_set>
#include <fmt/format.h>

using namespace lnk::core;
using namespace lnk::error;
using lnk::fs::Filesystem;

namespace {

std::string basenameOf(const std::string& rel) {
    return std::filesystem::path(rel).filename().string();
}

}

Adder::Adder(const Context& ctx) : ctx_(ctx) {}

std::vector<std::filesystem::path> Adder::expand(const std::vector<std::filesystem::path>& paths) const {
    std::vector<std::filesystem::path> out;
    const DirectoryWalker walker(true);

    for (const auto& p : paths) {
        const auto abs = util::absolutize(p);
        std::error_code ec;
        const auto st = std::filesystem::symlink_status(abs, ec);

        if (std::filesystem::is_directory(st)) {
            auto files = walker.walk(abs);
            log::Registry::core()->debug("[Adder::expand] {} -> {} files", abs.string(), files.size());
            out.insert(out.end(), std::make_move_iterator(files.begin()), std::make_move_iterator(files.end()));
        } else out.push_back(abs);
    }

    return out;
}

std::vector<Adder::Candidate> Adder::validate(const std::vector<std::filesystem::path>& paths,
                                              const bool allowSymlinks) const {
    const auto tracker = ctx_.tracker();
    const auto repoRoot = util::absolutize(ctx_.layout.repoRoot);

    std::vector<Candidate> candidates;
    std::unordered_set<std::string> seen;
    candidates.reserve(paths.size());

    for (const auto& p : paths) {
        const auto source = util::absolutize(p);

        // a link we created reports as managed, not as an unsupported symlink
        if (Filesystem::isSymlink(source)) {
            if (auto rel = ctx_.relativeToHome(source); tracker.contains(rel)) throw alreadyManaged(rel);
        }

        fs::FileInfo info;
        if (allowSymlinks && Filesystem::isSymlink(source)) info.type = std::filesystem::file_type::symlink;
        else info = Filesystem::validateForAdd(source);

        if (source == ctx_.home)
            throw Error(Kind::UnsupportedType, "Cannot manage the home directory itself", source.string(),
                        "add the files inside it instead");

        if (util::isWithin(source, repoRoot) || util::isWithin(repoRoot, source))
            throw Error(Kind::UnsupportedType, "Cannot manage a path that overlaps the lnk repository",
                        source.string());

        auto rel = ctx_.relativeToHome(source);

        if (!seen.insert(rel).second || tracker.contains(rel)) throw alreadyManaged(rel);

        if (Filesystem::exists(ctx_.layout.storagePath(rel)))
            throw Error(Kind::AlreadyManaged, "Repository already contains an item at this location",
                        ctx_.layout.storagePath(rel).string(), "run 'lnk doctor' to inspect the repository");

        candidates.push_back({ .source = source, .rel = std::move(rel), .info = info });
    }

    return candidates;
}

void Adder::apply(const Candidate& c, RollbackStack& rollback) const {
    const auto dest = ctx_.layout.storagePath(c.rel);

    Filesystem::mkdir(dest.parent_path());

    Filesystem::move(c.source, dest);
    rollback.push(rollback::MoveBack{ .from = dest, .to = c.source });

    Filesystem::createRelativeSymlink(dest, c.source);
    rollback.push(rollback::RemoveLink{ .link = c.source });

    ctx_.tracker().add(c.rel);
    rollback.push(rollback::Untrack{ .rel = c.rel });
}

void Adder::commit(const std::vector<Candidate>& candidates, const std::string& message, RollbackStack& rollback) const {
    for (const auto& c : candidates) {
        const auto vcsPath = ctx_.layout.vcsPath(c.rel);
        ctx_.vcs->add(vcsPath);
        rollback.push(rollback::Unstage{ .vcsPath = vcsPath });
    }

    ctx_.vcs->add(ctx_.layout.trackingFileName());
    ctx_.vcs->commit(message);
}

void Adder::run(const std::vector<Candidate>& candidates, const std::string& message,
                const ProgressCallback& progress) const {
    RollbackStack rollback(ctx_);
    bool committing = false;

    try {
        for (std::size_t i = 0; i < candidates.size(); ++i) {
            if (progress) progress(i + 1, candidates.size(), candidates[i].source.filename().string());
            apply(candidates[i], rollback);
        }

        committing = true;
        commit(candidates, message, rollback);
        rollback.discard();
    } catch (const std::exception& e) {
        log::Registry::core()->warn("[Adder] {} failed, rolling back {} step(s): {}",
                                    committing ? "Commit" : "Apply", rollback.actions().size(), e.what());
        rollback.unwind();

        if (committing) {
            // the tracking file is back to its previous content; match the index to it
            try {
                ctx_.vcs->add(ctx_.layout.trackingFileName());
            } catch (const Error& restage) {
                log::Registry::core()->debug("[Adder] Could not restage tracking file: {}", restage.what());
            }
        }
        throw;
    }

    log::Registry::core()->info("[Adder] {}", message);
}

std::string Adder::batchMessage(const std::vector<Candidate>& candidates) {
    if (candidates.size() == 1) return Context::commitMessage("added " + basenameOf(candidates.front().rel));
    return Context::commitMessage(fmt::format("added {} files", candidates.size()));
}

void Adder::add(const std::filesystem::path& path) const {
    ctx_.requireRepository();
    const auto candidates = validate({path}, false);
    run(candidates, Context::commitMessage("added " + basenameOf(candidates.front().rel)), nullptr);
}

void Adder::addMultiple(const std::vector<std::filesystem::path>& paths, const ProgressCallback& progress) const {
    ctx_.requireRepository();
    if (paths.empty()) throw Error(Kind::EmptyInput, "No files to add");

    const auto candidates = validate(paths, false);
    run(candidates, batchMessage(candidates), progress);
}

std::vector<std::filesystem::path> Adder::addRecursive(const std::vector<std::filesystem::path>& paths,
                                                       const ProgressCallback& progress) const {
    ctx_.requireRepository();

    for (const auto& p : paths) Filesystem::validateForAdd(util::absolutize(p));

    const auto files = expand(paths);
    if (files.empty())
        throw Error(Kind::EmptyInput, "No files found to add",
                    paths.empty() ? std::string{} : paths.front().string(),
                    "the directory contains no regular files or symlinks");

    const auto candidates = validate(files, true);

    // small batches and callers without a callback go through the plain batch path
    if (candidates.size() <= ctx_.progressThreshold || !progress) {
        run(candidates, batchMessage(candidates), nullptr);
        return files;
    }

    run(candidates, Context::commitMessage(fmt::format("added {} files recursively", candidates.size())), progress);
    return files;
}

std::vector<std::filesystem::path> Adder::preview(const std::vector<std::filesystem::path>& paths,
                                                  const bool recursive) const {
    ctx_.requireRepository();

    std::vector<std::filesystem::path> inputs;
    if (recursive) {
        for (const auto& p : paths) Filesystem::validateForAdd(util::absolutize(p));
        inputs = expand(paths);
        if (inputs.empty()) throw Error(Kind::EmptyInput, "No files found to add");
    } else inputs = paths;

    std::vector<std::filesystem::path> out;
    for (auto& c : validate(inputs, recursive)) out.push_back(std::move(c.source));
    return out;
}
