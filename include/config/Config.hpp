#pragma once

#include <chrono>
#include <filesystem>
#include <string>
#include <spdlog/spdlog.h>

namespace lnk::config {

constexpr static unsigned int DEFAULT_PROGRESS_THRESHOLD = 10;

struct SubsystemLogLevelsConfig {
    spdlog::level::level_enum lnk     = spdlog::level::info;   // Command lifecycle
    spdlog::level::level_enum fs      = spdlog::level::info;   // Moves, symlinks, directory creation
    spdlog::level::level_enum tracker = spdlog::level::info;   // Tracking file reads and rewrites
    spdlog::level::level_enum vcs     = spdlog::level::info;   // git invocations and their output
    spdlog::level::level_enum core    = spdlog::level::info;   // Add/remove transactions, rollback, doctor
    spdlog::level::level_enum shell   = spdlog::level::info;   // Argument parsing and routing
};

struct LogLevelsConfig {
    spdlog::level::level_enum console_log_level = spdlog::level::warn;
    spdlog::level::level_enum file_log_level = spdlog::level::info;
    SubsystemLogLevelsConfig subsystem_levels;
};

struct LoggingConfig {
    std::filesystem::path log_dir{};    // empty disables the file sink
    LogLevelsConfig levels;
};

struct GitConfig {
    std::string binary = "git";
    std::string remote = "origin";
    std::string default_branch = "main";
    std::string user_name = "Lnk User";
    std::string user_email = "lnk@localhost";
    std::chrono::seconds short_timeout{30};     // status, add, commit, ...
    std::chrono::seconds long_timeout{300};     // clone, push, pull
    std::string sync_message = "lnk: sync configuration files";
};

struct AddConfig {
    unsigned int progress_threshold = DEFAULT_PROGRESS_THRESHOLD;
};

enum class ColorMode { Auto, Always, Never };

struct OutputConfig {
    ColorMode colors = ColorMode::Auto;
    bool emoji = true;
};

struct Config {
    LoggingConfig logging;
    GitConfig git;
    AddConfig add;
    OutputConfig output;
};

Config loadConfig(const std::filesystem::path& path);

ColorMode parseColorMode(const std::string& s);
std::string to_string(ColorMode mode);

}
