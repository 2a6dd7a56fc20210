#pragma once

#include <filesystem>
#include <cstdint>
#include <sys/types.h>

namespace lnk::fs {

struct FileInfo {
    std::filesystem::file_type type = std::filesystem::file_type::none;
    std::filesystem::perms perms = std::filesystem::perms::unknown;
    std::uintmax_t size = 0;

    [[nodiscard]] bool isDirectory() const { return type == std::filesystem::file_type::directory; }
    [[nodiscard]] bool isSymlink() const { return type == std::filesystem::file_type::symlink; }
};

class Filesystem {
public:
    // lstat-based: regular files and directories pass; symlinks, sockets,
    // devices and FIFOs are rejected as unsupported.
    static FileInfo validateForAdd(const std::filesystem::path& path);

    // Requires a symlink whose target lies lexically inside repoRoot.
    // Returns the absolute, normalized target.
    static std::filesystem::path validateSymlinkForRemove(const std::filesystem::path& link,
                                                          const std::filesystem::path& repoRoot);

    // Rename only. Cross-device moves surface the underlying error.
    static void move(const std::filesystem::path& src, const std::filesystem::path& dst);

    static void createRelativeSymlink(const std::filesystem::path& target, const std::filesystem::path& link);

    // True when link is a symlink whose resolved target is expectedTarget.
    [[nodiscard]] static bool isValidSymlink(const std::filesystem::path& link,
                                             const std::filesystem::path& expectedTarget);

    // Absolute target of a symlink, resolved against the link's directory.
    [[nodiscard]] static std::filesystem::path resolveLink(const std::filesystem::path& link);

    static FileInfo stat(const std::filesystem::path& path);

    static void mkdir(const std::filesystem::path& path, mode_t mode = 0755);

    // Does not follow a trailing symlink.
    [[nodiscard]] static bool exists(const std::filesystem::path& path);
    [[nodiscard]] static bool isSymlink(const std::filesystem::path& path);

    static void remove(const std::filesystem::path& path);
    static void removeAll(const std::filesystem::path& path);

private:
    static FileInfo toInfo(const std::filesystem::path& path, const std::filesystem::file_status& st);
};

}
