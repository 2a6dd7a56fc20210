#include "config/ConfigRegistry.hpp"

namespace lnk::config {

void ConfigRegistry::init(const std::filesystem::path& path) {
    init(loadConfig(path));
}

void ConfigRegistry::init(Config config) {
    std::scoped_lock lock(mutex_);
    config_ = std::move(config);
    initialized_ = true;
}

const Config& ConfigRegistry::get() {
    ensureInitialized();
    return config_;
}

Config& ConfigRegistry::mut() {
    ensureInitialized();
    return config_;
}

bool ConfigRegistry::isInitialized() { return initialized_; }

// Library callers that never loaded a file get the built-in defaults.
void ConfigRegistry::ensureInitialized() {
    std::scoped_lock lock(mutex_);
    if (!initialized_) {
        config_ = Config{};
        initialized_ = true;
    }
}

} // namespace lnk::config
