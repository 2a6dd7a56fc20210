#include "log/Registry.hpp"
#include "config/ConfigRegistry.hpp"

#include <mutex>
#include <vector>

namespace lnk::log {

namespace {
std::recursive_mutex registryMutex;
}

void Registry::init() {
    std::scoped_lock lock(registryMutex);
    if (initialized_) shutdown();

    const auto& cnf = config::ConfigRegistry::get().logging;

    console_sink_ = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console_sink_->set_level(cnf.levels.console_log_level);
    console_sink_->set_color_mode(spdlog::color_mode::automatic);
    console_sink_->set_pattern(LOG_FORMAT);

    std::error_code ec;
    if (!cnf.log_dir.empty()) {
        namespace fs = std::filesystem;
        fs::create_directories(cnf.log_dir, ec);
        if (!ec) {
            main_log_path_ = cnf.log_dir / "lnk.log";
            main_file_sink_ = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                main_log_path_.string(), main_max_bytes_, main_max_files_);
            main_file_sink_->set_level(cnf.levels.file_log_level);
            main_file_sink_->set_pattern(FILE_LOG_FORMAT);
        }
    }

    const auto& sub_levels = cnf.levels.subsystem_levels;
    makeLogger("lnk",     sub_levels.lnk);
    makeLogger("fs",      sub_levels.fs);
    makeLogger("tracker", sub_levels.tracker);
    makeLogger("vcs",     sub_levels.vcs);
    makeLogger("core",    sub_levels.core);
    makeLogger("shell",   sub_levels.shell);

    initialized_ = true;
    if (ec) spdlog::get("lnk")->warn("[log::Registry] Unable to create log directory {}: {}",
                                     cnf.log_dir.string(), ec.message());
    spdlog::get("lnk")->debug("[log::Registry] Initialized");
}

void Registry::makeLogger(const std::string& name, const spdlog::level::level_enum level) {
    std::vector<spdlog::sink_ptr> sinks{console_sink_};
    if (main_file_sink_) sinks.push_back(main_file_sink_);

    const auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
    logger->set_level(level);
    logger->flush_on(spdlog::level::warn);
    spdlog::drop(name);
    spdlog::register_logger(logger);
}

std::shared_ptr<spdlog::logger> Registry::get(const std::string& name) {
    std::scoped_lock lock(registryMutex);
    if (!initialized_) init();

    auto logger = spdlog::get(name);
    if (!logger) throw std::runtime_error("[log::Registry] Logger not found: " + name);
    return logger;
}

bool Registry::isInitialized() { return initialized_; }

void Registry::setConsoleLevel(const spdlog::level::level_enum level) {
    std::scoped_lock lock(registryMutex);
    if (!initialized_) init();
    console_sink_->set_level(level);
    // loggers filter before sinks do
    spdlog::apply_all([level](const std::shared_ptr<spdlog::logger>& lg) {
        if (lg->level() > level) lg->set_level(level);
    });
}

void Registry::shutdown() {
    std::scoped_lock lock(registryMutex);
    spdlog::apply_all([](const std::shared_ptr<spdlog::logger>& lg) { lg->flush(); });
    for (const auto* name : {"lnk", "fs", "tracker", "vcs", "core", "shell"}) spdlog::drop(name);
    console_sink_.reset();
    main_file_sink_.reset();
    initialized_ = false;
}

}
