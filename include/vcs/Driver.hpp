#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace lnk::vcs {

inline constexpr const char* COMMIT_PREFIX = "lnk: ";

struct Status {
    int ahead = 0;
    int behind = 0;
    std::string remote;
    bool dirty = false;
};

// Repository operations the engine depends on. All failures throw
// error::Error with Kind::Vcs carrying the operation and captured output.
class Driver {
public:
    virtual ~Driver() = default;

    virtual void init() = 0;
    virtual void clone(const std::string& url) = 0;
    virtual void addRemote(const std::string& name, const std::string& url) = 0;
    [[nodiscard]] virtual std::optional<std::string> getRemoteUrl(const std::string& name) const = 0;

    [[nodiscard]] virtual bool isRepository() const = 0;
    // Repository whose commits all carry COMMIT_PREFIX, or which has none.
    [[nodiscard]] virtual bool isManagedRepository() const = 0;
    [[nodiscard]] virtual bool hasChanges() const = 0;

    virtual void add(const std::filesystem::path& path) = 0;
    virtual void addAll() = 0;
    // Unstages only; the working copy is left alone.
    virtual void rm(const std::filesystem::path& path) = 0;
    virtual void commit(const std::string& message) = 0;

    [[nodiscard]] virtual Status status() const = 0;
    [[nodiscard]] virtual std::string diff(bool color) const = 0;
    // Subjects, newest first.
    [[nodiscard]] virtual std::vector<std::string> getCommits() const = 0;

    virtual void push() = 0;
    virtual void pull() = 0;

    [[nodiscard]] virtual const std::filesystem::path& repoPath() const = 0;
};

}
