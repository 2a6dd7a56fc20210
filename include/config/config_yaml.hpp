#pragma once

#include "config/Config.hpp"
#include <yaml-cpp/yaml.h>

namespace YAML {

using namespace lnk::config;

static std::string to_std_string(const spdlog::string_view_t sv) { return {sv.data(), sv.size()}; }

template<>
struct convert<SubsystemLogLevelsConfig> {
    static Node encode(const SubsystemLogLevelsConfig& rhs) {
        Node node;
        node["lnk"]     = to_std_string(spdlog::level::to_string_view(rhs.lnk));
        node["fs"]      = to_std_string(spdlog::level::to_string_view(rhs.fs));
        node["tracker"] = to_std_string(spdlog::level::to_string_view(rhs.tracker));
        node["vcs"]     = to_std_string(spdlog::level::to_string_view(rhs.vcs));
        node["core"]    = to_std_string(spdlog::level::to_string_view(rhs.core));
        node["shell"]   = to_std_string(spdlog::level::to_string_view(rhs.shell));
        return node;
    }

    static bool decode(const Node& node, SubsystemLogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.lnk = spdlog::level::from_str(node["lnk"].as<std::string>("info"));
        rhs.fs = spdlog::level::from_str(node["fs"].as<std::string>("info"));
        rhs.tracker = spdlog::level::from_str(node["tracker"].as<std::string>("info"));
        rhs.vcs = spdlog::level::from_str(node["vcs"].as<std::string>("info"));
        rhs.core = spdlog::level::from_str(node["core"].as<std::string>("info"));
        rhs.shell = spdlog::level::from_str(node["shell"].as<std::string>("info"));
        return true;
    }
};

template<>
struct convert<LoggingConfig> {
    static Node encode(const LoggingConfig& rhs) {
        Node node;
        node["log_dir"] = rhs.log_dir.string();
        node["console_level"] = to_std_string(spdlog::level::to_string_view(rhs.levels.console_log_level));
        node["file_level"] = to_std_string(spdlog::level::to_string_view(rhs.levels.file_log_level));
        node["levels"] = rhs.levels.subsystem_levels;
        return node;
    }

    static bool decode(const Node& node, LoggingConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.log_dir = node["log_dir"].as<std::string>("");
        rhs.levels.console_log_level = spdlog::level::from_str(node["console_level"].as<std::string>("warn"));
        rhs.levels.file_log_level = spdlog::level::from_str(node["file_level"].as<std::string>("info"));
        if (const auto levels = node["levels"]) convert<SubsystemLogLevelsConfig>::decode(levels, rhs.levels.subsystem_levels);
        return true;
    }
};

template<>
struct convert<GitConfig> {
    static Node encode(const GitConfig& rhs) {
        Node node;
        node["binary"] = rhs.binary;
        node["remote"] = rhs.remote;
        node["default_branch"] = rhs.default_branch;
        node["user_name"] = rhs.user_name;
        node["user_email"] = rhs.user_email;
        node["short_timeout_seconds"] = rhs.short_timeout.count();
        node["long_timeout_seconds"] = rhs.long_timeout.count();
        node["sync_message"] = rhs.sync_message;
        return node;
    }

    static bool decode(const Node& node, GitConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.binary = node["binary"].as<std::string>("git");
        rhs.remote = node["remote"].as<std::string>("origin");
        rhs.default_branch = node["default_branch"].as<std::string>("main");
        rhs.user_name = node["user_name"].as<std::string>("Lnk User");
        rhs.user_email = node["user_email"].as<std::string>("lnk@localhost");
        rhs.short_timeout = std::chrono::seconds(node["short_timeout_seconds"].as<long>(30));
        rhs.long_timeout = std::chrono::seconds(node["long_timeout_seconds"].as<long>(300));
        rhs.sync_message = node["sync_message"].as<std::string>("lnk: sync configuration files");
        return true;
    }
};

template<>
struct convert<AddConfig> {
    static Node encode(const AddConfig& rhs) {
        Node node;
        node["progress_threshold"] = rhs.progress_threshold;
        return node;
    }

    static bool decode(const Node& node, AddConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.progress_threshold = node["progress_threshold"].as<unsigned int>(DEFAULT_PROGRESS_THRESHOLD);
        return true;
    }
};

template<>
struct convert<OutputConfig> {
    static Node encode(const OutputConfig& rhs) {
        Node node;
        node["colors"] = to_string(rhs.colors);
        node["emoji"] = rhs.emoji;
        return node;
    }

    static bool decode(const Node& node, OutputConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.colors = parseColorMode(node["colors"].as<std::string>("auto"));
        rhs.emoji = node["emoji"].as<bool>(true);
        return true;
    }
};

}
