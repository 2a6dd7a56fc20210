#include "error/Error.hpp"

#include <fmt/core.h>

namespace lnk::error {

std::string_view to_string(const Kind kind) {
    switch (kind) {
        case Kind::NotFound: return "not-found";
        case Kind::Access: return "access";
        case Kind::UnsupportedType: return "unsupported-type";
        case Kind::NotManaged: return "not-managed";
        case Kind::AlreadyManaged: return "already-managed";
        case Kind::NotInitialized: return "not-initialized";
        case Kind::ExistingForeignRepo: return "existing-foreign-repo";
        case Kind::ManagedFilesExist: return "managed-files-exist";
        case Kind::EmptyInput: return "empty-input";
        case Kind::BootstrapNotFound: return "bootstrap-not-found";
        case Kind::BootstrapPerms: return "bootstrap-perms";
        case Kind::BootstrapFailed: return "bootstrap-failed";
        case Kind::Path: return "path";
        case Kind::Io: return "io";
        case Kind::Vcs: return "vcs";
        case Kind::InvalidProfile: return "invalid-profile";
        case Kind::Config: return "config";
    }
    return "unknown";
}

Error::Error(const Kind kind, std::string message, std::string path, std::string suggestion)
    : std::runtime_error(compose(message, path)),
      kind_(kind),
      message_(std::move(message)),
      path_(std::move(path)),
      suggestion_(std::move(suggestion)) {}

Error& Error::withOperation(std::string op, std::string output) {
    operation_ = std::move(op);
    output_ = std::move(output);
    return *this;
}

std::string Error::compose(const std::string& message, const std::string& path) {
    if (path.empty()) return message;
    return fmt::format("{}: {}", message, path);
}

Error notFound(const std::filesystem::path& path) {
    return {Kind::NotFound, "File or directory not found", path.string()};
}

Error notManaged(const std::string& path) {
    return {Kind::NotManaged, "File is not managed by lnk", path, "use 'lnk add' to manage this file first"};
}

Error alreadyManaged(const std::string& relPath) {
    return {Kind::AlreadyManaged, "File is already managed by lnk", relPath};
}

Error notInitialized() {
    return {Kind::NotInitialized, "Lnk repository not initialized", {}, "run 'lnk init' first"};
}

Error io(const std::string& operation, const std::filesystem::path& path, const std::string& cause) {
    const auto msg = cause.empty() ? fmt::format("Failed to {}", operation)
                                   : fmt::format("Failed to {} ({})", operation, cause);
    return {Kind::Io, msg, path.string()};
}

Error vcs(const std::string& operation, const std::string& message, const std::string& output,
          const std::string& suggestion) {
    Error e(Kind::Vcs, message, {}, suggestion);
    e.withOperation(operation, output);
    return e;
}

}
