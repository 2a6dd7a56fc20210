#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>
#include <string_view>

namespace lnk::error {

enum class Kind {
    NotFound,
    Access,
    UnsupportedType,
    NotManaged,
    AlreadyManaged,
    NotInitialized,
    ExistingForeignRepo,
    ManagedFilesExist,
    EmptyInput,
    BootstrapNotFound,
    BootstrapPerms,
    BootstrapFailed,
    Path,
    Io,
    Vcs,
    InvalidProfile,
    Config
};

[[nodiscard]] std::string_view to_string(Kind kind);

class Error : public std::runtime_error {
public:
    Error(Kind kind, std::string message, std::string path = {}, std::string suggestion = {});

    [[nodiscard]] Kind kind() const noexcept { return kind_; }
    [[nodiscard]] const std::string& message() const noexcept { return message_; }
    [[nodiscard]] const std::string& path() const noexcept { return path_; }
    [[nodiscard]] const std::string& suggestion() const noexcept { return suggestion_; }

    // Only set for Kind::Vcs
    [[nodiscard]] const std::string& operation() const noexcept { return operation_; }
    [[nodiscard]] const std::string& output() const noexcept { return output_; }

    Error& withOperation(std::string op, std::string output = {});

private:
    Kind kind_;
    std::string message_, path_, suggestion_;
    std::string operation_, output_;

    static std::string compose(const std::string& message, const std::string& path);
};

[[nodiscard]] Error notFound(const std::filesystem::path& path);
[[nodiscard]] Error notManaged(const std::string& path);
[[nodiscard]] Error alreadyManaged(const std::string& relPath);
[[nodiscard]] Error notInitialized();
[[nodiscard]] Error io(const std::string& operation, const std::filesystem::path& path, const std::string& cause = {});
[[nodiscard]] Error vcs(const std::string& operation, const std::string& message, const std::string& output = {},
                        const std::string& suggestion = {});

}

namespace lnk {
using Error = error::Error;
using ErrorKind = error::Kind;
}
