#include "config/Config.hpp"
#include "config/config_yaml.hpp"
#include "error/Error.hpp"

#include <yaml-cpp/yaml.h>
#include <fmt/core.h>

namespace lnk::config {

Config loadConfig(const std::filesystem::path& path) {
    Config cfg;
    if (path.empty() || !std::filesystem::exists(path)) return cfg;

    try {
        const YAML::Node root = YAML::LoadFile(path.string());
        if (!root || root.IsNull()) return cfg;
        if (!root.IsMap()) throw error::Error(error::Kind::Config, "Config root must be a mapping", path.string());

        if (auto node = root["logging"]) YAML::convert<LoggingConfig>::decode(node, cfg.logging);
        if (auto node = root["git"]) YAML::convert<GitConfig>::decode(node, cfg.git);
        if (auto node = root["add"]) YAML::convert<AddConfig>::decode(node, cfg.add);
        if (auto node = root["output"]) YAML::convert<OutputConfig>::decode(node, cfg.output);
    } catch (const YAML::Exception& e) {
        throw error::Error(error::Kind::Config, fmt::format("Failed to parse config ({})", e.what()), path.string());
    }

    return cfg;
}

ColorMode parseColorMode(const std::string& s) {
    if (s == "auto") return ColorMode::Auto;
    if (s == "always") return ColorMode::Always;
    if (s == "never") return ColorMode::Never;
    throw error::Error(error::Kind::Config, fmt::format("Invalid color mode '{}' (expected auto, always or never)", s));
}

std::string to_string(const ColorMode mode) {
    switch (mode) {
        case ColorMode::Always: return "always";
        case ColorMode::Never: return "never";
        case ColorMode::Auto: break;
    }
    return "auto";
}

}
