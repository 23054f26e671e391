/// @file log.cpp
/// @brief Subsystem logger registry for keystone_core

#include <keystone/core/log.hpp>

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <array>
#include <filesystem>
#include <mutex>
#include <unordered_map>
#include <utility>
#include <vector>

namespace keystone_core {

namespace {

constexpr std::array<std::pair<const char*, spdlog::level::level_enum>, 9> k_level_names{{
    {"trace", spdlog::level::trace},
    {"debug", spdlog::level::debug},
    {"info", spdlog::level::info},
    {"warn", spdlog::level::warn},
    {"warning", spdlog::level::warn},
    {"error", spdlog::level::err},
    {"err", spdlog::level::err},
    {"critical", spdlog::level::critical},
    {"off", spdlog::level::off},
}};

/// Process-wide set of keystone loggers and the configuration new ones are built with
class LoggerTable {
public:
    static LoggerTable& instance() {
        static LoggerTable table;
        return table;
    }

    void configure(const LogConfig& config) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_config = config;
        apply_level(config.level);
    }

    std::shared_ptr<spdlog::logger> get(const std::string& name) {
        std::lock_guard<std::mutex> lock(m_mutex);

        if (auto it = m_loggers.find(name); it != m_loggers.end()) {
            return it->second;
        }

        // Registered by the application before first use: adopt it as-is
        if (auto existing = spdlog::get(name)) {
            m_loggers.emplace(name, existing);
            return existing;
        }

        auto sinks = make_sinks(name);
        auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
        logger->set_level(m_config.level);
        spdlog::register_logger(logger);
        m_loggers.emplace(name, logger);
        return logger;
    }

    void set_level(spdlog::level::level_enum level) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_config.level = level;
        apply_level(level);
    }

    bool set_level(const std::string& name, spdlog::level::level_enum level) {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_loggers.find(name);
        if (it == m_loggers.end()) {
            return false;
        }
        it->second->set_level(level);
        return true;
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
    }

    void drop_all() {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (auto& [name, logger] : m_loggers) {
            logger->flush();
            spdlog::drop(name);
        }
        m_loggers.clear();
    }

private:
    void apply_level(spdlog::level::level_enum level) {
        for (auto& [name, logger] : m_loggers) {
            logger->set_level(level);
        }
        spdlog::set_level(level);
    }

    std::vector<spdlog::sink_ptr> make_sinks(const std::string& name) const {
        std::vector<spdlog::sink_ptr> sinks;

        if (m_config.console_enabled) {
            auto console = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
            console->set_pattern("[%H:%M:%S.%e] [%^%l%$] [%n] %v");
            sinks.push_back(std::move(console));
        }

        if (m_config.file_enabled && !m_config.log_directory.empty()) {
            const auto path = std::filesystem::path(m_config.log_directory) / (name + ".log");
            try {
                auto file = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                    path.string(), m_config.max_file_size, m_config.max_files);
                file->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%n] %v");
                sinks.push_back(std::move(file));
            } catch (const spdlog::spdlog_ex& e) {
                spdlog::warn("Logger '{}' falls back to console, cannot open {}: {}", name, path.string(), e.what());
            }
        }

        return sinks;
    }

    std::mutex m_mutex;
    LogConfig m_config;
    std::unordered_map<std::string, std::shared_ptr<spdlog::logger>> m_loggers;
};

} // anonymous namespace

void configure_logging(const LogConfig& config) {
    LoggerTable::instance().configure(config);
}

const char* subsystem_logger_name(Subsystem subsystem) {
    switch (subsystem) {
        case Subsystem::Core: return "keystone_core";
        case Subsystem::Registry: return "keystone_registry";
        case Subsystem::Events: return "keystone_events";
        default: return "keystone";
    }
}

std::shared_ptr<spdlog::logger> get_logger(const std::string& name) {
    return LoggerTable::instance().get(name);
}

std::shared_ptr<spdlog::logger> subsystem_logger(Subsystem subsystem) {
    return get_logger(subsystem_logger_name(subsystem));
}

std::shared_ptr<spdlog::logger> registry_logger(const std::string& registry_name) {
    return get_logger(std::string(subsystem_logger_name(Subsystem::Registry)) + "." + registry_name);
}

void set_global_log_level(spdlog::level::level_enum level) {
    LoggerTable::instance().set_level(level);
}

bool set_logger_level(const std::string& name, spdlog::level::level_enum level) {
    return LoggerTable::instance().set_level(name, level);
}

spdlog::level::level_enum get_global_log_level() {
    return LoggerTable::instance().level();
}

std::optional<spdlog::level::level_enum> parse_log_level(const std::string& str) {
    for (const auto& [name, level] : k_level_names) {
        if (str == name) {
            return level;
        }
    }
    return std::nullopt;
}

const char* log_level_name(spdlog::level::level_enum level) {
    // First entry per level is the canonical name
    for (const auto& [name, value] : k_level_names) {
        if (value == level) {
            return name;
        }
    }
    return "unknown";
}

LogScope::LogScope(std::string name, std::shared_ptr<spdlog::logger> logger)
    : m_name(std::move(name))
    , m_logger(std::move(logger))
    , m_start(std::chrono::steady_clock::now())
{
    m_logger->debug("{} started", m_name);
}

LogScope::~LogScope() {
    auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - m_start);
    m_logger->debug("{} finished in {}us", m_name, elapsed.count());
}

void flush_all_loggers() {
    LoggerTable::instance().flush();
    spdlog::default_logger()->flush();
}

void shutdown_logging() {
    LoggerTable::instance().drop_all();
    spdlog::shutdown();
}

} // namespace keystone_core
