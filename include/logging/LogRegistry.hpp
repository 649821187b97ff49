#pragma once

#include "config/Config.hpp"

#include <filesystem>
#include <memory>
#include <string>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

namespace ferry::logging {

class LogRegistry {
public:
    // Initialize all loggers with sinks/levels. A second call is ignored.
    static void init(const std::filesystem::path& logDir, const config::LoggingConfig& cnf = {});

    // Generic access by name
    static std::shared_ptr<spdlog::logger> get(const std::string& name);

    // Subsystem shorthands
    static std::shared_ptr<spdlog::logger> ferry()   { return get("ferry"); }
    static std::shared_ptr<spdlog::logger> sync()    { return get("sync"); }
    static std::shared_ptr<spdlog::logger> cmd()     { return get("cmd"); }
    static std::shared_ptr<spdlog::logger> stats()   { return get("stats"); }
    static std::shared_ptr<spdlog::logger> config()  { return get("config"); }
    static std::shared_ptr<spdlog::logger> fs()      { return get("fs"); }
    static std::shared_ptr<spdlog::logger> db()      { return get("db"); }

    [[nodiscard]] static bool isInitialized();

    // --verbose
    static void setConsoleLevel(spdlog::level::level_enum level);

private:
    static constexpr const auto* LOG_FORMAT = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] %v";

    static inline bool initialized_ = false;
    static inline std::filesystem::path main_log_path_;

    static inline std::shared_ptr<spdlog::sinks::stderr_color_sink_mt> console_sink_;
    static inline std::shared_ptr<spdlog::sinks::rotating_file_sink_mt> main_file_sink_;

    static inline size_t main_max_bytes_ = 5 * 1024 * 1024; // 5 MiB
    static inline size_t main_max_files_ = 3;
};

}
