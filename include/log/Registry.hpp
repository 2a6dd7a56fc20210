#pragma once

#include <memory>
#include <string>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <filesystem>

namespace lnk::log {

class Registry {
public:
    // Initialize all loggers with sinks/levels from ConfigRegistry.
    static void init();

    // Generic access by name; falls back to a console-only setup when init() was never called.
    static std::shared_ptr<spdlog::logger> get(const std::string& name);

    // Subsystem shorthands
    static std::shared_ptr<spdlog::logger> lnk()     { return get("lnk"); }
    static std::shared_ptr<spdlog::logger> fs()      { return get("fs"); }
    static std::shared_ptr<spdlog::logger> tracker() { return get("tracker"); }
    static std::shared_ptr<spdlog::logger> vcs()     { return get("vcs"); }
    static std::shared_ptr<spdlog::logger> core()    { return get("core"); }
    static std::shared_ptr<spdlog::logger> shell()   { return get("shell"); }

    [[nodiscard]] static bool isInitialized();

    // --verbose
    static void setConsoleLevel(spdlog::level::level_enum level);

    static void shutdown();

private:
    static constexpr const auto* LOG_FORMAT = "[%H:%M:%S.%e] [%^%l%$] [%n] %v";
    static constexpr const auto* FILE_LOG_FORMAT = "[%Y-%m-%d %H:%M:%S.%e] [%l] [%n] %v";

    static inline bool initialized_ = false;

    static inline std::filesystem::path main_log_path_;

    // stderr: stdout belongs to command output
    static inline std::shared_ptr<spdlog::sinks::stderr_color_sink_mt> console_sink_;
    static inline std::shared_ptr<spdlog::sinks::rotating_file_sink_mt> main_file_sink_;

    static inline size_t main_max_bytes_ = 5 * 1024 * 1024; // 5 MiB
    static inline size_t main_max_files_ = 5;

    static void makeLogger(const std::string& name, spdlog::level::level_enum level);
};

}
