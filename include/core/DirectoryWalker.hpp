#pragma once

#include <vector>
#include <filesystem>
#include <functional>

namespace lnk::core {

    class DirectoryWalker {
    public:
        explicit DirectoryWalker(bool recursive = true);

        // Regular files and symlinks below root, sorted by path. Directories are
        // descended into but never returned; symlinked directories are not followed.
        std::vector<std::filesystem::path> walk(const std::filesystem::path& root,
                                                std::function<bool(const std::filesystem::directory_entry&)> filter = nullptr) const;

    private:
        bool recursive;
    };

} // namespace lnk::core
