#include "vcs/GitDriver.hpp"
#include "error/Error.hpp"
#include "fs/Filesystem.hpp"
#include "log/Registry.hpp"
#include "util/fsPath.hpp"

#include <sstream>
#include <fmt/format.h>

using namespace lnk::vcs;
using namespace lnk::util;
using lnk::fs::Filesystem;

namespace {

std::string trimmed(std::string s) {
    while (!s.empty() && (s.back() == '\n' || s.back() == '\r' || s.back() == ' ')) s.pop_back();
    const auto first = s.find_first_not_of(" \n");
    return first == std::string::npos ? std::string{} : s.substr(first);
}

std::vector<std::string> splitLines(const std::string& s) {
    std::vector<std::string> lines;
    std::istringstream in(s);
    for (std::string line; std::getline(in, line);)
        if (!line.empty()) lines.push_back(line);
    return lines;
}

int toCount(const std::string& s) {
    try {
        return std::stoi(trimmed(s));
    } catch (const std::exception&) {
        return 0;
    }
}

}

GitDriver::GitDriver(std::filesystem::path repoPath, lnk::config::GitConfig cfg)
    : repoPath_(std::move(repoPath)), cfg_(std::move(cfg)) {}

ProcessResult GitDriver::exec(const std::vector<std::string>& args, const Timeout timeout,
                              const std::filesystem::path& cwd) const {
    ProcessOptions opts;
    opts.argv.reserve(args.size() + 1);
    opts.argv.push_back(cfg_.binary);
    opts.argv.insert(opts.argv.end(), args.begin(), args.end());
    opts.cwd = cwd.empty() ? repoPath_ : cwd;
    opts.timeout = timeout == Timeout::Long ? cfg_.long_timeout : cfg_.short_timeout;
    opts.env = {{"GIT_TERMINAL_PROMPT", "0"}, {"LC_ALL", "C"}};
    return runProcess(opts);
}

ProcessResult GitDriver::run(const std::string& operation, const std::vector<std::string>& args,
                             const Timeout timeout, const std::filesystem::path& cwd) const {
    auto res = exec(args, timeout, cwd);

    if (res.timedOut)
        throw error::vcs(operation, fmt::format("git {} timed out", operation), res.output,
                         "check your network connection and try again");

    if (res.exitCode == 127 && res.output.empty())
        throw error::vcs(operation, fmt::format("Failed to run '{}'", cfg_.binary), {},
                         "make sure git is installed and on your PATH");

    if (!res.ok()) {
        log::Registry::vcs()->debug("[GitDriver] git {} failed ({}): {}", operation, res.exitCode, trimmed(res.output));
        throw error::vcs(operation, fmt::format("git {} failed", operation), trimmed(res.output));
    }

    return res;
}

void GitDriver::init() {
    Filesystem::mkdir(repoPath_);

    if (exec({"init", "-b", cfg_.default_branch}).ok()) return;

    // git < 2.28 has no -b
    run("init", {"init"});
    run("init", {"symbolic-ref", "HEAD", "refs/heads/" + cfg_.default_branch});
}

void GitDriver::clone(const std::string& url) {
    if (Filesystem::exists(repoPath_)) Filesystem::removeAll(repoPath_);

    const auto parent = absolutize(repoPath_).parent_path();
    Filesystem::mkdir(parent);

    run("clone", {"clone", url, absolutize(repoPath_).string()}, Timeout::Long, parent);
    setupUpstreamAfterClone();
}

void GitDriver::setupUpstreamAfterClone() const {
    for (const auto* branch : {"main", "master"}) {
        const auto ref = fmt::format("{}/{}", cfg_.remote, branch);
        if (!exec({"rev-parse", "--verify", "--quiet", ref}).ok()) continue;
        if (exec({"branch", "--set-upstream-to=" + ref}).ok()) return;
    }

    const auto head = exec({"symbolic-ref", "--short", "refs/remotes/" + cfg_.remote + "/HEAD"});
    if (head.ok()) {
        if (const auto ref = trimmed(head.output); !exec({"branch", "--set-upstream-to=" + ref}).ok())
            log::Registry::vcs()->debug("[GitDriver::clone] Could not track {}", ref);
        return;
    }

    log::Registry::vcs()->debug("[GitDriver::clone] No upstream branch found for {}", cfg_.remote);
}

std::optional<std::string> GitDriver::getRemoteUrl(const std::string& name) const {
    if (!isRepository()) return std::nullopt;
    const auto res = exec({"remote", "get-url", name});
    if (!res.ok()) return std::nullopt;
    auto url = trimmed(res.output);
    if (url.empty()) return std::nullopt;
    return url;
}

void GitDriver::addRemote(const std::string& name, const std::string& url) {
    if (const auto existing = getRemoteUrl(name)) {
        if (*existing == url) {
            log::Registry::vcs()->debug("[GitDriver::addRemote] {} already points to {}", name, url);
            return;
        }
        throw error::vcs("remote add", fmt::format("Remote '{}' is already configured with a different repository", name),
                         *existing, fmt::format("run 'git remote set-url {} {}' in the repository", name, url));
    }
    run("remote add", {"remote", "add", name, url});
}

bool GitDriver::isRepository() const { return Filesystem::exists(repoPath_ / ".git"); }

bool GitDriver::isManagedRepository() const {
    if (!isRepository()) return false;
    const std::string prefix = trimmed(COMMIT_PREFIX);
    for (const auto& subject : getCommits())
        if (!subject.starts_with(prefix)) return false;
    return true;
}

bool GitDriver::hasChanges() const {
    return !trimmed(run("status", {"status", "--porcelain"}).output).empty();
}

std::string GitDriver::repoRelative(const std::filesystem::path& path) const {
    if (!path.is_absolute()) return path.generic_string();
    const auto root = absolutize(repoPath_);
    if (isWithin(path, root)) {
        const auto rel = path.lexically_normal().lexically_relative(root);
        return rel.empty() ? "." : rel.generic_string();
    }
    return path.string();
}

void GitDriver::add(const std::filesystem::path& path) {
    run("add", {"add", "--", repoRelative(path)});
}

void GitDriver::addAll() {
    run("add", {"add", "-A"});
}

void GitDriver::rm(const std::filesystem::path& path) {
    const auto rel = repoRelative(path);
    std::vector<std::string> args{"rm", "--cached"};

    std::error_code ec;
    if (std::filesystem::is_directory(std::filesystem::symlink_status(repoPath_ / rel, ec))) args.emplace_back("-r");

    args.emplace_back("--");
    args.push_back(rel);
    run("rm", args);
}

void GitDriver::ensureIdentity() const {
    if (!exec({"config", "user.name"}).ok()) run("config", {"config", "user.name", cfg_.user_name});
    if (!exec({"config", "user.email"}).ok()) run("config", {"config", "user.email", cfg_.user_email});
}

void GitDriver::commit(const std::string& message) {
    ensureIdentity();
    run("commit", {"commit", "-m", message});
    log::Registry::vcs()->debug("[GitDriver::commit] {}", message);
}

bool GitDriver::hasCommits() const {
    return exec({"rev-parse", "--verify", "--quiet", "HEAD"}).ok();
}

std::vector<std::string> GitDriver::getCommits() const {
    if (!hasCommits()) return {};
    return splitLines(run("log", {"log", "--format=%s"}).output);
}

void GitDriver::requireRemote(const std::string& operation) const {
    if (!getRemoteUrl(cfg_.remote))
        throw error::vcs(operation, "No remote configured", {},
                         fmt::format("add one with 'git remote add {} <url>' in the repository", cfg_.remote));
}

std::optional<std::string> GitDriver::upstream() const {
    const auto res = exec({"rev-parse", "--abbrev-ref", "--symbolic-full-name", "@{u}"});
    if (!res.ok()) return std::nullopt;
    auto ref = trimmed(res.output);
    if (ref.empty()) return std::nullopt;
    return ref;
}

std::string GitDriver::currentBranch() const {
    const auto res = exec({"symbolic-ref", "--short", "HEAD"});
    if (!res.ok()) return cfg_.default_branch;
    auto branch = trimmed(res.output);
    return branch.empty() ? cfg_.default_branch : branch;
}

Status GitDriver::status() const {
    requireRemote("status");

    Status st;
    st.dirty = hasChanges();

    if (const auto up = upstream()) {
        st.remote = *up;
        st.ahead = toCount(run("rev-list", {"rev-list", "--count", *up + "..HEAD"}).output);
        st.behind = toCount(run("rev-list", {"rev-list", "--count", "HEAD.." + *up}).output);
        return st;
    }

    st.remote = fmt::format("{}/{}", cfg_.remote, cfg_.default_branch);
    if (!hasCommits()) return st;

    // no upstream yet: everything local counts as ahead of the fallback ref
    const auto ahead = exec({"rev-list", "--count", st.remote + "..HEAD"});
    st.ahead = ahead.ok() ? toCount(ahead.output) : toCount(run("rev-list", {"rev-list", "--count", "HEAD"}).output);
    return st;
}

std::string GitDriver::diff(const bool color) const {
    return run("diff", {"diff", color ? "--color=always" : "--color=never"}).output;
}

void GitDriver::push() {
    requireRemote("push");
    run("push", {"push", "-u", cfg_.remote, "HEAD"}, Timeout::Long);
}

void GitDriver::pull() {
    requireRemote("pull");
    if (upstream()) run("pull", {"pull", "--no-rebase", cfg_.remote}, Timeout::Long);
    else run("pull", {"pull", "--no-rebase", cfg_.remote, currentBranch()}, Timeout::Long);
}
