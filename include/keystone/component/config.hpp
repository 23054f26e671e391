#pragma once

/// @file config.hpp
/// @brief Registry configuration loaded from JSON
///
/// @code{.json}
/// {
///   "name": "game-server",
///   "reload_after_initialize": true,
///   "teardown_failure": "continue",
///   "log_level": "debug"
/// }
/// @endcode

#include "fwd.hpp"

#include <keystone/core/error.hpp>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <filesystem>
#include <optional>
#include <string>

namespace keystone_component {

/// Outcome of a teardown failure policy
enum class TeardownDecision : std::uint8_t {
    Continue,  ///< Log and move on to the next batch member
    Abort,     ///< Stop the batch and return the failure
};

/// Get teardown decision name ("continue" / "abort")
[[nodiscard]] const char* teardown_decision_name(TeardownDecision decision);

/// Parse a teardown decision name
[[nodiscard]] std::optional<TeardownDecision> parse_teardown_decision(const std::string& str);

/// Registry configuration
struct RegistryConfig {
    /// Registry name used in log messages
    std::string name = "registry";
    /// Run a reload pass at the end of initialize_all
    bool reload_after_initialize = true;
    /// Decision of the default teardown policy after logging a failure
    TeardownDecision teardown_failure = TeardownDecision::Continue;
    /// Level applied to this registry's logger, "keystone_registry.<name>" (unchanged when empty)
    std::optional<spdlog::level::level_enum> log_level;
};

/// Build a config from a JSON object. Unknown keys are ignored.
[[nodiscard]] keystone_core::Result<RegistryConfig> registry_config_from_json(const nlohmann::json& j);

/// Parse a config from JSON text
[[nodiscard]] keystone_core::Result<RegistryConfig> parse_registry_config(const std::string& text);

/// Load a config from a JSON file
[[nodiscard]] keystone_core::Result<RegistryConfig> load_registry_config(const std::filesystem::path& path);

/// Serialize a config
[[nodiscard]] nlohmann::json registry_config_to_json(const RegistryConfig& config);

} // namespace keystone_component
