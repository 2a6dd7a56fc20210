#pragma once

#include <filesystem>
#include <set>
#include <string>

namespace lnk::core {

// Sorted, deduplicated set of home-relative paths backed by one tracking file.
// Every call re-reads the file; nothing is cached between operations.
class Tracker {
public:
    using Entries = std::set<std::string>;

    explicit Tracker(std::filesystem::path trackingPath);

    // Absent file and empty file both load as an empty set. Lines are trimmed,
    // blank lines skipped; path syntax is not checked here.
    [[nodiscard]] Entries load() const;

    [[nodiscard]] bool contains(const std::string& rel) const;

    // Idempotent
    void add(const std::string& rel) const;
    void remove(const std::string& rel) const;

    // Sort-then-rewrite through a temporary sibling and rename.
    void overwrite(const Entries& entries) const;

    [[nodiscard]] const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

}
