#pragma once

#include "core/Context.hpp"
#include "fs/Filesystem.hpp"

#include <filesystem>
#include <functional>
#include <string>
#include <vector>

namespace lnk::core {

class RollbackStack;

// (current, total, basename); current counts from 1
using ProgressCallback = std::function<void(std::size_t, std::size_t, const std::string&)>;

// Moves items into the repository, links them back and commits, as one
// all-or-nothing transaction per call.
class Adder {
public:
    explicit Adder(const Context& ctx);

    void add(const std::filesystem::path& path) const;

    void addMultiple(const std::vector<std::filesystem::path>& paths, const ProgressCallback& progress = nullptr) const;

    // Directories are expanded to the regular files and symlinks below them.
    // Returns the absolute paths that were added.
    std::vector<std::filesystem::path> addRecursive(const std::vector<std::filesystem::path>& paths,
                                                    const ProgressCallback& progress = nullptr) const;

    // Validation only; returns the absolute paths an add would touch.
    [[nodiscard]] std::vector<std::filesystem::path> preview(const std::vector<std::filesystem::path>& paths,
                                                             bool recursive) const;

private:
    struct Candidate {
        std::filesystem::path source; // absolute
        std::string rel;
        fs::FileInfo info;
    };

    const Context& ctx_;

    [[nodiscard]] std::vector<std::filesystem::path> expand(const std::vector<std::filesystem::path>& paths) const;
    [[nodiscard]] std::vector<Candidate> validate(const std::vector<std::filesystem::path>& paths,
                                                  bool allowSymlinks) const;
    void apply(const Candidate& c, RollbackStack& rollback) const;
    void commit(const std::vector<Candidate>& candidates, const std::string& message, RollbackStack& rollback) const;
    void run(const std::vector<Candidate>& candidates, const std::string& message, const ProgressCallback& progress) const;

    [[nodiscard]] static std::string batchMessage(const std::vector<Candidate>& candidates);
};

}
