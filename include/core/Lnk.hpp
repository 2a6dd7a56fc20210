#pragma once

#include "core/Context.hpp"
#include "core/Adder.hpp"
#include "core/Doctor.hpp"
#include "vcs/Driver.hpp"

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace lnk::core {

// Entry point for every command; one instance per profile.
class Lnk {
public:
    // Repository, home directory and git driver resolved from the environment
    // and the active configuration.
    explicit Lnk(const std::string& profile = {});

    Lnk(const std::filesystem::path& repoRoot, const std::string& profile, const std::filesystem::path& home,
        std::shared_ptr<vcs::Driver> driver);

    // Without remote: create or adopt the repository. With remote: clone it,
    // refusing to replace tracked content unless forced.
    void init(const std::string& remote = {}, bool force = false) const;

    [[nodiscard]] bool hasUserContent() const;

    void add(const std::filesystem::path& path) const;
    void addMultiple(const std::vector<std::filesystem::path>& paths, const ProgressCallback& progress = nullptr) const;
    std::vector<std::filesystem::path> addRecursive(const std::vector<std::filesystem::path>& paths,
                                                    const ProgressCallback& progress = nullptr) const;
    [[nodiscard]] std::vector<std::filesystem::path> previewAdd(const std::vector<std::filesystem::path>& paths,
                                                                bool recursive) const;

    void remove(const std::filesystem::path& path) const;
    void removeForce(const std::filesystem::path& path) const;

    [[nodiscard]] std::vector<std::string> list() const;
    [[nodiscard]] std::vector<std::string> listHosts() const;

    [[nodiscard]] vcs::Status status() const;
    [[nodiscard]] std::string diff(bool color) const;

    // Stage everything, commit when something changed, push.
    void push(const std::string& message) const;

    // Pull, then relink. Returns the restored entries.
    std::vector<std::string> pull() const;

    std::vector<std::string> restoreSymlinks() const;

    [[nodiscard]] DoctorResult previewDoctor() const;
    DoctorResult fixDoctor() const;

    [[nodiscard]] std::string findBootstrapScript() const;
    void runBootstrapScript(const std::string& script) const;

    [[nodiscard]] std::vector<std::string> getCommits() const;

    [[nodiscard]] const Context& context() const { return ctx_; }
    [[nodiscard]] const std::filesystem::path& repoPath() const { return ctx_.layout.repoRoot; }
    [[nodiscard]] const std::string& profile() const { return ctx_.layout.profile; }

private:
    Context ctx_;
};

}
