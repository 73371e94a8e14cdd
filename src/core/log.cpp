/// @file log.cpp
/// @brief Logger registry for keystone_core

#include <keystone/core/log.hpp>

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <filesystem>
#include <mutex>
#include <sstream>
#include <vector>

namespace keystone_core {

namespace {

constexpr const char* k_console_pattern = "[%H:%M:%S.%e] [%^%l%$] [%n] %v";
constexpr const char* k_file_pattern = "[%Y-%m-%d %H:%M:%S.%e] [%l] [%n] %v";

class LoggerRegistry {
public:
    static LoggerRegistry& instance() {
        static LoggerRegistry registry;
        return registry;
    }

    void apply(const LogConfig& config) {
        std::scoped_lock lock(m_mutex);
        m_config = config;
        for (auto& [name, logger] : m_loggers) {
            logger->sinks() = make_sinks(name);
            logger->set_level(m_config.level);
        }
        spdlog::set_level(m_config.level);
    }

    LoggerPtr acquire(const std::string& name) {
        std::scoped_lock lock(m_mutex);
        if (auto it = m_loggers.find(name); it != m_loggers.end()) {
            return it->second;
        }

        auto sinks = make_sinks(name);
        auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
        logger->set_level(m_config.level);
        if (!spdlog::get(name)) {
            spdlog::register_logger(logger);
        }
        m_loggers.emplace(name, logger);
        return logger;
    }

    void set_level(LogLevel level) {
        std::scoped_lock lock(m_mutex);
        m_config.level = level;
        for (auto& [name, logger] : m_loggers) {
            logger->set_level(level);
        }
        spdlog::set_level(level);
    }

    void set_level(const std::string& name, LogLevel level) {
        std::scoped_lock lock(m_mutex);
        if (auto it = m_loggers.find(name); it != m_loggers.end()) {
            it->second->set_level(level);
        }
    }

    LogLevel level() {
        std::scoped_lock lock(m_mutex);
        return m_config.level;
    }

    void flush() {
        std::scoped_lock lock(m_mutex);
        for (auto& [name, logger] : m_loggers) {
            logger->flush();
        }
    }

    void drop_all() {
        std::scoped_lock lock(m_mutex);
        for (auto& [name, logger] : m_loggers) {
            logger->flush();
            spdlog::drop(name);
        }
        m_loggers.clear();
    }

private:
    std::vector<spdlog::sink_ptr> make_sinks(const std::string& name) const {
        std::vector<spdlog::sink_ptr> sinks;

        if (m_config.console_enabled) {
            auto console = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
            console->set_pattern(k_console_pattern);
            sinks.push_back(std::move(console));
        }

        if (m_config.file_enabled && !m_config.log_directory.empty()) {
            auto file = std::filesystem::path(m_config.log_directory) / (name + ".log");
            try {
                auto rotating = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                    file.string(), m_config.max_file_size, m_config.max_files);
                rotating->set_pattern(k_file_pattern);
                sinks.push_back(std::move(rotating));
            } catch (const spdlog::spdlog_ex& e) {
                spdlog::warn("Cannot open log file {} for '{}': {}", file.string(), name, e.what());
            }
        }

        return sinks;
    }

    std::mutex m_mutex;
    LogConfig m_config;
    std::map<std::string, LoggerPtr> m_loggers;
};

} // anonymous namespace

void init_logging() {
    spdlog::set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
    configure_logging(LogConfig{});
}

void configure_logging(const LogConfig& config) {
    LoggerRegistry::instance().apply(config);
}

LoggerPtr get_logger(const std::string& name) {
    return LoggerRegistry::instance().acquire(name);
}

LoggerPtr core_logger() {
    return get_logger("keystone_core");
}

LoggerPtr state_logger() {
    return get_logger("keystone_state");
}

void set_global_log_level(LogLevel level) {
    LoggerRegistry::instance().set_level(level);
}

void set_logger_level(const std::string& name, LogLevel level) {
    LoggerRegistry::instance().set_level(name, level);
}

LogLevel get_global_log_level() {
    return LoggerRegistry::instance().level();
}

std::optional<LogLevel> parse_log_level(const std::string& name) {
    static const std::map<std::string, LogLevel> levels = {
        {"trace", spdlog::level::trace},
        {"debug", spdlog::level::debug},
        {"info", spdlog::level::info},
        {"warn", spdlog::level::warn},
        {"warning", spdlog::level::warn},
        {"error", spdlog::level::err},
        {"err", spdlog::level::err},
        {"critical", spdlog::level::critical},
        {"fatal", spdlog::level::critical},
        {"off", spdlog::level::off},
    };
    if (auto it = levels.find(name); it != levels.end()) {
        return it->second;
    }
    return std::nullopt;
}

const char* log_level_name(LogLevel level) {
    switch (level) {
        case spdlog::level::trace: return "trace";
        case spdlog::level::debug: return "debug";
        case spdlog::level::info: return "info";
        case spdlog::level::warn: return "warn";
        case spdlog::level::err: return "error";
        case spdlog::level::critical: return "critical";
        case spdlog::level::off: return "off";
        default: return "unknown";
    }
}

void log_structured(LogLevel level, const std::string& logger_name, const std::string& message,
                    const std::map<std::string, std::string>& fields) {
    auto logger = get_logger(logger_name);
    if (!logger->should_log(level)) {
        return;
    }

    std::ostringstream line;
    line << message;
    if (!fields.empty()) {
        const char* separator = " {";
        for (const auto& [key, value] : fields) {
            line << separator << key << "=\"" << value << '"';
            separator = ", ";
        }
        line << '}';
    }
    logger->log(level, line.str());
}

// =============================================================================
// LogScope
// =============================================================================

LogScope::LogScope(std::string name, const std::string& logger_name)
    : m_name(std::move(name))
    , m_logger(get_logger(logger_name))
    , m_start(std::chrono::steady_clock::now()) {
    m_logger->trace(">>> Entering {}", m_name);
}

LogScope::~LogScope() {
    auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - m_start);
    m_logger->trace("<<< Exiting {} ({}us)", m_name, elapsed.count());
}

void flush_all_loggers() {
    LoggerRegistry::instance().flush();
    spdlog::default_logger()->flush();
}

void shutdown_logging() {
    LoggerRegistry::instance().drop_all();
}

} // namespace keystone_core
