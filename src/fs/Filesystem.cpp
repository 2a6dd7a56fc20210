#include "fs/Filesystem.hpp"
#include "error/Error.hpp"
#include "log/Registry.hpp"
#include "util/fsPath.hpp"

#include <cerrno>
#include <cstring>
#include <vector>
#include <ranges>
#include <sys/stat.h>
#include <fmt/core.h>

using namespace lnk::fs;
using namespace lnk::error;

FileInfo Filesystem::toInfo(const std::filesystem::path& path, const std::filesystem::file_status& st) {
    FileInfo info{ .type = st.type(), .perms = st.permissions() };
    if (info.type == std::filesystem::file_type::regular) {
        std::error_code ec;
        const auto size = std::filesystem::file_size(path, ec);
        if (!ec) info.size = size;
    }
    return info;
}

FileInfo Filesystem::validateForAdd(const std::filesystem::path& path) {
    std::error_code ec;
    const auto st = std::filesystem::symlink_status(path, ec);

    if (ec || st.type() == std::filesystem::file_type::not_found) {
        if (!ec || ec == std::errc::no_such_file_or_directory || ec == std::errc::not_a_directory)
            throw notFound(path);
        throw Error(Kind::Access, fmt::format("Cannot access file ({})", ec.message()), path.string());
    }

    const auto type = st.type();
    if (type != std::filesystem::file_type::regular && type != std::filesystem::file_type::directory) {
        log::Registry::fs()->debug("[Filesystem::validateForAdd] Rejecting {} (not a regular file or directory)",
                                   path.string());
        throw Error(Kind::UnsupportedType, "Only regular files and directories can be managed", path.string(),
                    type == std::filesystem::file_type::symlink
                        ? "the path is already a symlink; add the file it points to instead"
                        : "sockets, devices and pipes cannot be managed");
    }

    return toInfo(path, st);
}

std::filesystem::path Filesystem::resolveLink(const std::filesystem::path& link) {
    std::error_code ec;
    const auto target = std::filesystem::read_symlink(link, ec);
    if (ec) throw io("read symlink", link, ec.message());

    if (target.is_absolute()) return target.lexically_normal();

    // resolve against the physical directory holding the link, not the link itself
    auto dir = std::filesystem::weakly_canonical(util::absolutize(link).parent_path(), ec);
    if (ec) dir = util::absolutize(link).parent_path();
    return (dir / target).lexically_normal();
}

std::filesystem::path Filesystem::validateSymlinkForRemove(const std::filesystem::path& link,
                                                           const std::filesystem::path& repoRoot) {
    if (!isSymlink(link)) throw notManaged(link.string());

    const auto target = resolveLink(link);

    std::error_code ec;
    auto root = std::filesystem::weakly_canonical(repoRoot, ec);
    if (ec) root = util::absolutize(repoRoot);

    if (!util::isWithin(target, root)) {
        log::Registry::fs()->debug("[Filesystem::validateSymlinkForRemove] {} -> {} is outside {}",
                                   link.string(), target.string(), root.string());
        throw notManaged(link.string());
    }

    return target;
}

void Filesystem::move(const std::filesystem::path& src, const std::filesystem::path& dst) {
    log::Registry::fs()->debug("[Filesystem::move] {} -> {}", src.string(), dst.string());

    if (dst.has_parent_path()) mkdir(dst.parent_path());

    std::error_code ec;
    std::filesystem::rename(src, dst, ec);
    if (ec) throw io(fmt::format("move to {}", dst.string()), src, ec.message());
}

void Filesystem::createRelativeSymlink(const std::filesystem::path& target, const std::filesystem::path& link) {
    std::error_code ec;
    const auto absLink = util::absolutize(link);

    auto parent = std::filesystem::weakly_canonical(absLink.parent_path(), ec);
    if (ec) parent = absLink.parent_path();

    auto absTarget = std::filesystem::weakly_canonical(target, ec);
    if (ec) absTarget = util::absolutize(target);

    const auto rel = absTarget.lexically_relative(parent);
    if (rel.empty())
        throw Error(Kind::Path, fmt::format("Cannot compute a relative path from {} to {}",
                                            parent.string(), absTarget.string()), link.string());

    std::filesystem::create_symlink(rel, absLink, ec);
    if (ec) throw io("create symlink", link, ec.message());

    log::Registry::fs()->debug("[Filesystem::createRelativeSymlink] {} -> {}", link.string(), rel.string());
}

bool Filesystem::isValidSymlink(const std::filesystem::path& link, const std::filesystem::path& expectedTarget) {
    if (!isSymlink(link)) return false;

    std::filesystem::path resolved;
    try {
        resolved = resolveLink(link);
    } catch (const Error& e) {
        log::Registry::fs()->debug("[Filesystem::isValidSymlink] {}", e.what());
        return false;
    }

    std::error_code ec;
    auto lhs = std::filesystem::weakly_canonical(resolved, ec);
    if (ec) lhs = resolved;
    auto rhs = std::filesystem::weakly_canonical(expectedTarget, ec);
    if (ec) rhs = util::absolutize(expectedTarget);
    return lhs == rhs;
}

FileInfo Filesystem::stat(const std::filesystem::path& path) {
    std::error_code ec;
    const auto st = std::filesystem::status(path, ec);
    if (ec) throw io("stat", path, ec.message());
    return toInfo(path, st);
}

void Filesystem::mkdir(const std::filesystem::path& path, const mode_t mode) {
    if (path.empty()) return;

    std::vector<std::filesystem::path> toCreate;
    for (auto cur = util::absolutize(path); !exists(cur); cur = cur.parent_path()) {
        toCreate.push_back(cur);
        if (cur == cur.root_path()) break;
    }

    for (const auto& p : std::views::reverse(toCreate)) {
        if (::mkdir(p.c_str(), mode) != 0 && errno != EEXIST)
            throw io("create directory", p, std::strerror(errno));
        log::Registry::fs()->debug("[Filesystem::mkdir] Created {}", p.string());
    }
}

bool Filesystem::exists(const std::filesystem::path& path) {
    std::error_code ec;
    return std::filesystem::exists(std::filesystem::symlink_status(path, ec));
}

bool Filesystem::isSymlink(const std::filesystem::path& path) {
    std::error_code ec;
    return std::filesystem::is_symlink(std::filesystem::symlink_status(path, ec));
}

void Filesystem::remove(const std::filesystem::path& path) {
    std::error_code ec;
    std::filesystem::remove(path, ec);
    if (ec) throw io("remove", path, ec.message());
    log::Registry::fs()->debug("[Filesystem::remove] {}", path.string());
}

void Filesystem::removeAll(const std::filesystem::path& path) {
    std::error_code ec;
    std::filesystem::remove_all(path, ec);
    if (ec) throw io("remove", path, ec.message());
    log::Registry::fs()->debug("[Filesystem::removeAll] {}", path.string());
}
