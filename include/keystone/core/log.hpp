#pragma once

/// @file log.hpp
/// @brief Named spdlog loggers for keystone
///
/// Every subsystem logs through its own named logger ("keystone_core",
/// "keystone_state"). configure_logging() decides which sinks those loggers
/// write to and at what level; it may be called again at any time and
/// rebuilds the sinks of loggers that already exist.

#include <spdlog/spdlog.h>

#include <chrono>
#include <cstddef>
#include <map>
#include <memory>
#include <optional>
#include <string>

#define KEYSTONE_LOG_TRACE(logger, ...) (logger)->trace(__VA_ARGS__)
#define KEYSTONE_LOG_DEBUG(logger, ...) (logger)->debug(__VA_ARGS__)
#define KEYSTONE_LOG_INFO(logger, ...) (logger)->info(__VA_ARGS__)
#define KEYSTONE_LOG_WARN(logger, ...) (logger)->warn(__VA_ARGS__)
#define KEYSTONE_LOG_ERROR(logger, ...) (logger)->error(__VA_ARGS__)

namespace keystone_core {

using LogLevel = spdlog::level::level_enum;
using LoggerPtr = std::shared_ptr<spdlog::logger>;

/// Sink and level settings shared by every keystone logger
struct LogConfig {
    bool console_enabled = true;
    bool file_enabled = false;
    /// One rotating "<logger>.log" file per logger is created here
    std::string log_directory;
    std::size_t max_file_size = 10 * 1024 * 1024;
    std::size_t max_files = 5;
    LogLevel level = spdlog::level::info;
};

/// Console-only logging at info
void init_logging();

void configure_logging(const LogConfig& config);

/// Get or create the logger registered under name
LoggerPtr get_logger(const std::string& name);

LoggerPtr core_logger();
LoggerPtr state_logger();

// Levels

void set_global_log_level(LogLevel level);
void set_logger_level(const std::string& name, LogLevel level);
LogLevel get_global_log_level();

/// Accepts trace, debug, info, warn/warning, error/err, critical/fatal, off
std::optional<LogLevel> parse_log_level(const std::string& name);
const char* log_level_name(LogLevel level);

/// Write `message {key="value", ...}` with fields in key order
void log_structured(LogLevel level, const std::string& logger_name, const std::string& message,
                    const std::map<std::string, std::string>& fields);

/// Traces entry and exit of a block with its duration in microseconds
class LogScope {
public:
    explicit LogScope(std::string name, const std::string& logger_name = "keystone_core");
    ~LogScope();

    LogScope(const LogScope&) = delete;
    LogScope& operator=(const LogScope&) = delete;

private:
    std::string m_name;
    LoggerPtr m_logger;
    std::chrono::steady_clock::time_point m_start;
};

#define KEYSTONE_LOG_CONCAT_INNER(a, b) a##b
#define KEYSTONE_LOG_CONCAT(a, b) KEYSTONE_LOG_CONCAT_INNER(a, b)
#define KEYSTONE_LOG_SCOPE(name, logger) \
    ::keystone_core::LogScope KEYSTONE_LOG_CONCAT(keystone_log_scope_, __LINE__)(name, logger)

void flush_all_loggers();

/// Flush, unregister and forget every keystone logger
void shutdown_logging();

} // namespace keystone_core
