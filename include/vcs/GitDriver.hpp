#pragma once

#include "vcs/Driver.hpp"
#include "config/Config.hpp"
#include "util/Process.hpp"

namespace lnk::vcs {

class GitDriver final : public Driver {
public:
    explicit GitDriver(std::filesystem::path repoPath, config::GitConfig cfg = {});

    void init() override;
    void clone(const std::string& url) override;
    void addRemote(const std::string& name, const std::string& url) override;
    [[nodiscard]] std::optional<std::string> getRemoteUrl(const std::string& name) const override;

    [[nodiscard]] bool isRepository() const override;
    [[nodiscard]] bool isManagedRepository() const override;
    [[nodiscard]] bool hasChanges() const override;

    void add(const std::filesystem::path& path) override;
    void addAll() override;
    void rm(const std::filesystem::path& path) override;
    void commit(const std::string& message) override;

    [[nodiscard]] Status status() const override;
    [[nodiscard]] std::string diff(bool color) const override;
    [[nodiscard]] std::vector<std::string> getCommits() const override;

    void push() override;
    void pull() override;

    [[nodiscard]] const std::filesystem::path& repoPath() const override { return repoPath_; }

private:
    std::filesystem::path repoPath_;
    config::GitConfig cfg_;

    enum class Timeout { Short, Long };

    [[nodiscard]] util::ProcessResult exec(const std::vector<std::string>& args, Timeout timeout = Timeout::Short,
                                           const std::filesystem::path& cwd = {}) const;

    // exec() that throws a Vcs error named after operation on non-zero exit.
    util::ProcessResult run(const std::string& operation, const std::vector<std::string>& args,
                            Timeout timeout = Timeout::Short, const std::filesystem::path& cwd = {}) const;

    void ensureIdentity() const;
    void requireRemote(const std::string& operation) const;
    [[nodiscard]] bool hasCommits() const;
    [[nodiscard]] std::optional<std::string> upstream() const;
    [[nodiscard]] std::string currentBranch() const;
    [[nodiscard]] std::string repoRelative(const std::filesystem::path& path) const;
    void setupUpstreamAfterClone() const;
};

}
