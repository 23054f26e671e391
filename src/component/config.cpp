/// @file config.cpp
/// @brief Registry configuration parsing for keystone_component

#include <keystone/component/config.hpp>
#include <keystone/core/log.hpp>

#include <fstream>
#include <sstream>

namespace keystone_component {

using keystone_core::Err;
using keystone_core::Error;
using keystone_core::ErrorCode;
using keystone_core::Result;

const char* teardown_decision_name(TeardownDecision decision) {
    switch (decision) {
        case TeardownDecision::Continue: return "continue";
        case TeardownDecision::Abort: return "abort";
        default: return "unknown";
    }
}

std::optional<TeardownDecision> parse_teardown_decision(const std::string& str) {
    if (str == "continue") return TeardownDecision::Continue;
    if (str == "abort") return TeardownDecision::Abort;
    return std::nullopt;
}

Result<RegistryConfig> registry_config_from_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        return Err<RegistryConfig>(Error(ErrorCode::ParseError, "Registry config must be a JSON object"));
    }

    RegistryConfig config;

    if (j.contains("name")) {
        if (!j["name"].is_string()) {
            return Err<RegistryConfig>(Error(ErrorCode::ParseError, "'name' must be a string"));
        }
        config.name = j["name"].get<std::string>();
    }

    if (j.contains("reload_after_initialize")) {
        if (!j["reload_after_initialize"].is_boolean()) {
            return Err<RegistryConfig>(Error(ErrorCode::ParseError, "'reload_after_initialize' must be a boolean"));
        }
        config.reload_after_initialize = j["reload_after_initialize"].get<bool>();
    }

    if (j.contains("teardown_failure")) {
        if (!j["teardown_failure"].is_string()) {
            return Err<RegistryConfig>(Error(ErrorCode::ParseError, "'teardown_failure' must be a string"));
        }
        std::string value = j["teardown_failure"].get<std::string>();
        auto decision = parse_teardown_decision(value);
        if (!decision) {
            return Err<RegistryConfig>(Error(ErrorCode::ParseError,
                "Invalid teardown_failure: " + value + " (expected continue or abort)"));
        }
        config.teardown_failure = *decision;
    }

    if (j.contains("log_level")) {
        if (!j["log_level"].is_string()) {
            return Err<RegistryConfig>(Error(ErrorCode::ParseError, "'log_level' must be a string"));
        }
        std::string value = j["log_level"].get<std::string>();
        auto level = keystone_core::parse_log_level(value);
        if (!level) {
            return Err<RegistryConfig>(Error(ErrorCode::ParseError, "Invalid log_level: " + value));
        }
        config.log_level = *level;
    }

    return keystone_core::Ok(std::move(config));
}

Result<RegistryConfig> parse_registry_config(const std::string& text) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        return Err<RegistryConfig>(Error(ErrorCode::ParseError,
            std::string("JSON parse error in registry config: ") + e.what()));
    }
    return registry_config_from_json(j);
}

Result<RegistryConfig> load_registry_config(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return Err<RegistryConfig>(Error(ErrorCode::IOError,
            "Failed to open registry config: " + path.string()));
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    auto result = parse_registry_config(buffer.str());
    if (!result) {
        keystone_core::core_logger()->warn("Registry config {} rejected: {}", path.string(),
                                           result.error().message());
    }
    return result;
}

nlohmann::json registry_config_to_json(const RegistryConfig& config) {
    nlohmann::json j;
    j["name"] = config.name;
    j["reload_after_initialize"] = config.reload_after_initialize;
    j["teardown_failure"] = teardown_decision_name(config.teardown_failure);
    if (config.log_level) {
        j["log_level"] = keystone_core::log_level_name(*config.log_level);
    }
    return j;
}

} // namespace keystone_component
