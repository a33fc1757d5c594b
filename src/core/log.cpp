/// @file log.cpp
/// @brief Logging system implementation for impulse_core
///
/// All named loggers share one console sink and, when enabled, one rotating
/// file `impulse.log` in the configured directory. Lines carry the logger
/// name, so physics and core output stay distinguishable in a single file.

#include <impulse/core/log.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <mutex>
#include <vector>

namespace impulse_core {

namespace {

constexpr const char* k_console_pattern = "[%H:%M:%S.%e] [%^%l%$] [%n] %v";
constexpr const char* k_file_pattern = "[%Y-%m-%d %H:%M:%S.%e] [%l] [%n] %v";
constexpr const char* k_log_file_name = "impulse.log";

// =============================================================================
// Logger Registry
// =============================================================================

class LoggerRegistry {
public:
    static LoggerRegistry& instance() {
        static LoggerRegistry registry;
        return registry;
    }

    void configure(const LogConfig& config) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_config = config;
        rebuild_sinks();

        for (auto& [name, logger] : m_loggers) {
            logger->sinks() = m_sinks;
            logger->set_level(m_config.level);
        }
        spdlog::set_level(m_config.level);
    }

    std::shared_ptr<spdlog::logger> find_or_create(const std::string& name) {
        std::lock_guard<std::mutex> lock(m_mutex);

        if (auto it = m_loggers.find(name); it != m_loggers.end()) {
            return it->second;
        }

        if (!m_sinks_ready) {
            rebuild_sinks();
        }

        auto logger = std::make_shared<spdlog::logger>(name, m_sinks.begin(), m_sinks.end());
        logger->set_level(m_config.level);
        m_loggers.emplace(name, logger);

        if (!spdlog::get(name)) {
            spdlog::register_logger(logger);
        }
        return logger;
    }

    void set_level(spdlog::level::level_enum level) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_config.level = level;
        for (auto& [name, logger] : m_loggers) {
            logger->set_level(level);
        }
        spdlog::set_level(level);
    }

    void set_level(const std::string& name, spdlog::level::level_enum level) {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (auto it = m_loggers.find(name); it != m_loggers.end()) {
            it->second->set_level(level);
        }
    }

    spdlog::level::level_enum level() {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_config.level;
    }

    void flush() {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (auto& [name, logger] : m_loggers) {
            logger->flush();
        }
        spdlog::default_logger()->flush();
    }

    void drop_all() {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (auto& [name, logger] : m_loggers) {
            logger->flush();
            spdlog::drop(name);
        }
        m_loggers.clear();
        m_sinks.clear();
        m_sinks_ready = false;
    }

private:
    /// Caller holds m_mutex
    void rebuild_sinks() {
        m_sinks.clear();

        if (m_config.console_enabled) {
            auto console = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
            console->set_pattern(k_console_pattern);
            m_sinks.push_back(std::move(console));
        }

        if (m_config.file_enabled && !m_config.log_directory.empty()) {
            auto path = std::filesystem::path(m_config.log_directory) / k_log_file_name;
            try {
                auto file = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                    path.string(), m_config.max_file_size, m_config.max_files);
                file->set_pattern(k_file_pattern);
                m_sinks.push_back(std::move(file));
            } catch (const spdlog::spdlog_ex& ex) {
                spdlog::warn("Cannot open log file '{}', console only: {}", path.string(), ex.what());
            }
        }

        m_sinks_ready = true;
    }

    std::mutex m_mutex;
    LogConfig m_config;
    std::vector<spdlog::sink_ptr> m_sinks;
    bool m_sinks_ready = false;
    std::map<std::string, std::shared_ptr<spdlog::logger>> m_loggers;
};

} // anonymous namespace

// =============================================================================
// Configuration and Named Loggers
// =============================================================================

void configure_logging(const LogConfig& config) {
    LoggerRegistry::instance().configure(config);
}

std::shared_ptr<spdlog::logger> get_logger(const std::string& name) {
    return LoggerRegistry::instance().find_or_create(name);
}

// Looked up on every call so a shutdown and reconfigure is picked up
std::shared_ptr<spdlog::logger> core_logger() {
    return get_logger("impulse");
}

std::shared_ptr<spdlog::logger> physics_logger() {
    return get_logger("physics");
}

// =============================================================================
// Log Level Management
// =============================================================================

void set_global_log_level(spdlog::level::level_enum level) {
    LoggerRegistry::instance().set_level(level);
}

void set_logger_level(const std::string& name, spdlog::level::level_enum level) {
    LoggerRegistry::instance().set_level(name, level);
}

spdlog::level::level_enum get_global_log_level() {
    return LoggerRegistry::instance().level();
}

std::optional<spdlog::level::level_enum> parse_log_level(const std::string& str) {
    std::string name = str;
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (name == "warning") return spdlog::level::warn;
    if (name == "error") return spdlog::level::err;

    auto level = spdlog::level::from_str(name);
    // from_str maps unknown names to off
    if (level == spdlog::level::off && name != "off") {
        return std::nullopt;
    }
    return level;
}

const char* log_level_name(spdlog::level::level_enum level) {
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

// =============================================================================
// Structured Logging
// =============================================================================

void log_structured(
    spdlog::level::level_enum level,
    const std::string& logger_name,
    const std::string& message,
    const std::map<std::string, std::string>& fields)
{
    auto logger = get_logger(logger_name);
    if (!logger->should_log(level)) {
        return;
    }

    std::string line = message;
    for (const auto& [key, value] : fields) {
        line += ' ';
        line += key;
        line += '=';
        line += value;
    }
    logger->log(level, line);
}

// =============================================================================
// Log Scoping
// =============================================================================

LogScope::LogScope(const std::string& name, const std::string& logger_name)
    : m_name(name)
    , m_logger(get_logger(logger_name))
    , m_start(std::chrono::steady_clock::now())
{
    m_logger->trace(">>> {}", m_name);
}

LogScope::~LogScope() {
    auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - m_start);
    m_logger->trace("<<< {} ({}us)", m_name, elapsed.count());
}

// =============================================================================
// Lifecycle
// =============================================================================

void flush_all_loggers() {
    LoggerRegistry::instance().flush();
}

void shutdown_logging() {
    LoggerRegistry::instance().drop_all();
}

} // namespace impulse_core
