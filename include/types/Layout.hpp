#pragma once

#include <filesystem>
#include <string>

namespace lnk::types {

inline constexpr const char* TRACKING_FILE_NAME = ".lnk";
inline constexpr const char* HOST_STORAGE_SUFFIX = ".lnk";

// Maps a profile (empty = common, otherwise a host name) onto the
// repository: which tracking file it uses and where its items are stored.
struct Layout {
    const std::filesystem::path repoRoot;
    const std::string profile;
    const std::filesystem::path trackingPath, storageRoot;

    // Throws error::Kind::InvalidProfile when profile contains a path separator.
    explicit Layout(const std::filesystem::path& repoRoot, const std::string& profile = {});

    [[nodiscard]] bool isCommon() const { return profile.empty(); }

    // ".lnk" or ".lnk.<profile>", relative to repoRoot
    [[nodiscard]] std::string trackingFileName() const;

    // storageRoot / rel
    [[nodiscard]] std::filesystem::path storagePath(const std::filesystem::path& rel) const;

    // Path of an item relative to the repository root, as handed to the VCS.
    [[nodiscard]] std::filesystem::path vcsPath(const std::filesystem::path& rel) const;

    [[nodiscard]] static std::string trackingFileNameFor(const std::string& profile);
};

}
