/// @file test_config.cpp
/// @brief Tests for RegistryConfig parsing and application

#include <catch2/catch_test_macros.hpp>
#include "test_components.hpp"

#include <keystone/component/config.hpp>
#include <keystone/core/log.hpp>

#include <filesystem>
#include <fstream>

using namespace keystone_test;
using keystone_core::ErrorCode;

TEST_CASE("RegistryConfig: defaults", "[component][config]") {
    RegistryConfig config;
    REQUIRE(config.name == "registry");
    REQUIRE(config.reload_after_initialize);
    REQUIRE(config.teardown_failure == TeardownDecision::Continue);
    REQUIRE_FALSE(config.log_level.has_value());

    auto parsed = parse_registry_config("{}");
    REQUIRE(parsed.is_ok());
    REQUIRE(parsed->name == "registry");
    REQUIRE(parsed->reload_after_initialize);
}

TEST_CASE("RegistryConfig: parse every field", "[component][config]") {
    auto result = parse_registry_config(R"({
        "name": "game-server",
        "reload_after_initialize": false,
        "teardown_failure": "abort",
        "log_level": "debug",
        "plugins_dir": "ignored"
    })");

    REQUIRE(result.is_ok());
    REQUIRE(result->name == "game-server");
    REQUIRE_FALSE(result->reload_after_initialize);
    REQUIRE(result->teardown_failure == TeardownDecision::Abort);
    REQUIRE(result->log_level == spdlog::level::debug);
}

TEST_CASE("RegistryConfig: rejected input", "[component][config]") {
    SECTION("malformed JSON") {
        auto result = parse_registry_config("{ \"name\": ");
        REQUIRE(result.is_err());
        REQUIRE(result.error().code() == ErrorCode::ParseError);
    }

    SECTION("not an object") {
        auto result = parse_registry_config("[1, 2]");
        REQUIRE(result.is_err());
        REQUIRE(result.error().code() == ErrorCode::ParseError);
    }

    SECTION("wrong type") {
        auto result = parse_registry_config(R"({"reload_after_initialize": "yes"})");
        REQUIRE(result.is_err());
        REQUIRE(result.error().message().find("reload_after_initialize") != std::string::npos);
    }

    SECTION("unknown teardown decision") {
        auto result = parse_registry_config(R"({"teardown_failure": "retry"})");
        REQUIRE(result.is_err());
        REQUIRE(result.error().message().find("retry") != std::string::npos);
    }

    SECTION("unknown log level") {
        auto result = parse_registry_config(R"({"log_level": "chatty"})");
        REQUIRE(result.is_err());
        REQUIRE(result.error().code() == ErrorCode::ParseError);
    }
}

TEST_CASE("RegistryConfig: teardown decision names", "[component][config]") {
    REQUIRE(std::string(teardown_decision_name(TeardownDecision::Continue)) == "continue");
    REQUIRE(std::string(teardown_decision_name(TeardownDecision::Abort)) == "abort");
    REQUIRE(parse_teardown_decision("abort") == TeardownDecision::Abort);
    REQUIRE_FALSE(parse_teardown_decision("Abort").has_value());
}

TEST_CASE("RegistryConfig: load from file", "[component][config]") {
    const auto path = std::filesystem::temp_directory_path() / "keystone_registry_config_test.json";

    SECTION("existing file") {
        {
            std::ofstream file(path);
            file << R"({"name": "from-file", "teardown_failure": "abort"})";
        }

        auto result = load_registry_config(path);
        std::filesystem::remove(path);

        REQUIRE(result.is_ok());
        REQUIRE(result->name == "from-file");
        REQUIRE(result->teardown_failure == TeardownDecision::Abort);
    }

    SECTION("missing file") {
        std::filesystem::remove(path);
        auto result = load_registry_config(path);
        REQUIRE(result.is_err());
        REQUIRE(result.error().code() == ErrorCode::IOError);
    }
}

TEST_CASE("RegistryConfig: to_json", "[component][config]") {
    RegistryConfig config;
    config.name = "svc";
    config.teardown_failure = TeardownDecision::Abort;

    auto j = registry_config_to_json(config);
    REQUIRE(j["name"].get<std::string>() == "svc");
    REQUIRE(j["reload_after_initialize"].get<bool>());
    REQUIRE(j["teardown_failure"].get<std::string>() == "abort");
    REQUIRE_FALSE(j.contains("log_level"));

    config.log_level = spdlog::level::warn;
    auto parsed = registry_config_from_json(registry_config_to_json(config));
    REQUIRE(parsed.is_ok());
    REQUIRE(parsed->log_level == spdlog::level::warn);
}

TEST_CASE("RegistryConfig: applied by the registry", "[component][config]") {
    auto config = parse_registry_config(R"({"name": "svc", "log_level": "error"})");
    REQUIRE(config.is_ok());

    const auto shared_level = keystone_core::registry_logger()->level();

    ComponentRegistry registry(*config);
    REQUIRE(registry.config().name == "svc");
    REQUIRE(keystone_core::registry_logger("svc")->name() == "keystone_registry.svc");
    REQUIRE(keystone_core::registry_logger("svc")->level() == spdlog::level::err);

    auto text = debug::format_registry_state(registry);
    REQUIRE(text.find("ComponentRegistry 'svc'") == 0);

    SECTION("other registries keep their own level") {
        RegistryConfig quiet;
        quiet.name = "svc-quiet";
        quiet.log_level = spdlog::level::off;
        ComponentRegistry other(quiet);

        REQUIRE(keystone_core::registry_logger("svc")->level() == spdlog::level::err);
        REQUIRE(keystone_core::registry_logger("svc-quiet")->level() == spdlog::level::off);
        REQUIRE(keystone_core::registry_logger()->level() == shared_level);
    }
}
