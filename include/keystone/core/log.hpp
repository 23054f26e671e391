#pragma once

/// @file log.hpp
/// @brief Named spdlog loggers for the keystone subsystems
///
/// Every subsystem logs through its own named logger so its level can be tuned
/// independently (the registry applies `RegistryConfig::log_level` to its logger).
/// Loggers registered with spdlog before first use are adopted unchanged, which lets
/// applications and tests route a subsystem to their own sinks.

#include <spdlog/spdlog.h>

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

// =============================================================================
// Logging Macros
// =============================================================================

#define KEYSTONE_LOG_TRACE(...) ::keystone_core::core_logger()->trace(__VA_ARGS__)
#define KEYSTONE_LOG_DEBUG(...) ::keystone_core::core_logger()->debug(__VA_ARGS__)
#define KEYSTONE_LOG_INFO(...) ::keystone_core::core_logger()->info(__VA_ARGS__)
#define KEYSTONE_LOG_WARN(...) ::keystone_core::core_logger()->warn(__VA_ARGS__)
#define KEYSTONE_LOG_ERROR(...) ::keystone_core::core_logger()->error(__VA_ARGS__)
#define KEYSTONE_LOG_CRITICAL(...) ::keystone_core::core_logger()->critical(__VA_ARGS__)

namespace keystone_core {

// =============================================================================
// Configuration
// =============================================================================

/// Sinks and level used for loggers created after `configure_logging`
struct LogConfig {
    bool console_enabled = true;
    /// Rotating file per logger in `log_directory` (ignored when the directory is empty)
    bool file_enabled = false;
    std::string log_directory;
    std::size_t max_file_size = 10 * 1024 * 1024;
    std::size_t max_files = 5;
    spdlog::level::level_enum level = spdlog::level::info;
};

/// Apply a logging configuration. Existing loggers keep their sinks but take the new level.
void configure_logging(const LogConfig& config);

// =============================================================================
// Subsystem Loggers
// =============================================================================

/// Keystone subsystems with a dedicated logger
enum class Subsystem : std::uint8_t {
    Core,      ///< "keystone_core"
    Registry,  ///< "keystone_registry"
    Events,    ///< "keystone_events"
};

/// Logger name of a subsystem
[[nodiscard]] const char* subsystem_logger_name(Subsystem subsystem);

/// Get or create a named logger
std::shared_ptr<spdlog::logger> get_logger(const std::string& name);

/// Get a subsystem logger
std::shared_ptr<spdlog::logger> subsystem_logger(Subsystem subsystem);

inline std::shared_ptr<spdlog::logger> core_logger() { return subsystem_logger(Subsystem::Core); }
inline std::shared_ptr<spdlog::logger> registry_logger() { return subsystem_logger(Subsystem::Registry); }
inline std::shared_ptr<spdlog::logger> events_logger() { return subsystem_logger(Subsystem::Events); }

/// Logger of one named registry ("keystone_registry.<name>"); registries sharing a name share it
std::shared_ptr<spdlog::logger> registry_logger(const std::string& registry_name);

// =============================================================================
// Levels
// =============================================================================

/// Set the level of every known logger and of loggers created later
void set_global_log_level(spdlog::level::level_enum level);

/// Set the level of one logger; returns false if no logger has that name
bool set_logger_level(const std::string& name, spdlog::level::level_enum level);

/// Level applied to newly created loggers
[[nodiscard]] spdlog::level::level_enum get_global_log_level();

/// Parse a level name ("trace", "debug", "info", "warn", "error", "critical", "off")
[[nodiscard]] std::optional<spdlog::level::level_enum> parse_log_level(const std::string& str);

/// Canonical level name, accepted by parse_log_level
[[nodiscard]] const char* log_level_name(spdlog::level::level_enum level);

// =============================================================================
// Timed Scope
// =============================================================================

/// Logs entry and exit of a lifecycle pass at debug level, with its duration
class LogScope {
public:
    LogScope(std::string name, std::shared_ptr<spdlog::logger> logger);
    ~LogScope();

    LogScope(const LogScope&) = delete;
    LogScope& operator=(const LogScope&) = delete;

private:
    std::string m_name;
    std::shared_ptr<spdlog::logger> m_logger;
    std::chrono::steady_clock::time_point m_start;
};

// =============================================================================
// Lifecycle
// =============================================================================

/// Flush every known logger
void flush_all_loggers();

/// Flush and drop every known logger
void shutdown_logging();

} // namespace keystone_core
