#pragma once

#include <filesystem>
#include <string>

namespace lnk::util {

// "/etc/foo" -> "etc/foo"; relative input is only normalized
inline std::filesystem::path stripLeadingSlash(const std::filesystem::path& path) {
    auto norm = path.lexically_normal();
    if (norm.empty()) return norm;
    auto s = norm.string();
    const auto first = s.find_first_not_of('/');
    if (first == std::string::npos) return {};
    return {s.substr(first)};
}

// Lexical containment: true when path == root or path lies below root.
inline bool isWithin(const std::filesystem::path& path, const std::filesystem::path& root) {
    const auto p = path.lexically_normal();
    const auto r = root.lexically_normal();

    auto pit = p.begin();
    for (auto rit = r.begin(); rit != r.end(); ++rit) {
        // trailing separator of a directory path yields an empty final element
        if (rit->empty() && std::next(rit) == r.end()) break;
        if (pit == p.end() || *pit != *rit) return false;
        ++pit;
    }
    return true;
}

// Encodes an absolute path as the key stored in a tracking file:
// relative to home when under it, "." for home itself, otherwise the
// absolute path with its leading separator stripped.
inline std::string homeRelative(const std::filesystem::path& absPath, const std::filesystem::path& home) {
    const auto abs = absPath.lexically_normal();
    const auto h = home.lexically_normal();
    if (abs == h) return ".";
    if (isWithin(abs, h)) return abs.lexically_relative(h).generic_string();
    return stripLeadingSlash(abs).generic_string();
}

// A tracked path is malformed when normalization leaves it absolute,
// walking up past the storage root, or naming the storage root itself.
inline bool escapesRoot(const std::filesystem::path& rel) {
    if (rel.empty()) return true;
    const auto norm = rel.lexically_normal();
    if (norm.empty() || norm == ".") return true;
    if (norm.is_absolute() || norm.has_root_directory()) return true;
    const auto first = norm.begin();
    return first != norm.end() && *first == "..";
}

inline std::filesystem::path absolutize(const std::filesystem::path& path) {
    auto abs = std::filesystem::absolute(path).lexically_normal();
    // "/a/b/" -> "/a/b"
    if (!abs.has_filename() && abs != abs.root_path()) abs = abs.parent_path();
    return abs;
}

}
