#pragma once

#include <string>
#include <memory>
#include <spdlog/spdlog.h>
#include "config_types.hpp"

namespace neo {

enum class LogLevel {
    TRACE = 0,
    DEBUG = 1,
    INFO = 2,
    WARN = 3,
    ERROR = 4,
    CRITICAL = 5
};

class Logger {
public:
    static void initialize(const LoggingConfig& config, LogLevel level = LogLevel::INFO);
    static void shutdown();

    static void set_level(LogLevel level);
    static LogLevel get_level();
    static bool is_enabled(LogLevel level);

    // Never null: falls back to spdlog's default logger before initialize()
    static std::shared_ptr<spdlog::logger> get();

    // Parses "debug", "INFO", "warning", ...; unknown names map to INFO
    static LogLevel parse_level(const std::string& name);

private:
    static spdlog::level::level_enum to_spdlog_level(LogLevel level);

    static std::shared_ptr<spdlog::logger> logger_;
    static LogLevel current_level_;
};

#define NEO_LOG_TRACE(...) neo::Logger::get()->trace(__VA_ARGS__)
#define NEO_LOG_DEBUG(...) neo::Logger::get()->debug(__VA_ARGS__)
#define NEO_LOG_INFO(...) neo::Logger::get()->info(__VA_ARGS__)
#define NEO_LOG_WARN(...) neo::Logger::get()->warn(__VA_ARGS__)
#define NEO_LOG_ERROR(...) neo::Logger::get()->error(__VA_ARGS__)
#define NEO_LOG_CRITICAL(...) neo::Logger::get()->critical(__VA_ARGS__)

} // namespace neo
