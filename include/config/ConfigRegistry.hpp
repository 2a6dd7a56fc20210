#pragma once

#include "config/Config.hpp"
#include "util/paths.hpp"

#include <mutex>

namespace lnk::config {

class ConfigRegistry {
public:
    static void init(const std::filesystem::path& path = paths::getConfigPath());
    static void init(Config config);
    static const Config& get();
    static Config& mut();

    [[nodiscard]] static bool isInitialized();

private:
    static void ensureInitialized();

    static inline Config config_;
    static inline bool initialized_ = false;
    static inline std::mutex mutex_;
};

} // namespace lnk::config
