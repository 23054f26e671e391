/// @file test_component_type.cpp
/// @brief Tests for ComponentType and component capabilities

#include <catch2/catch_test_macros.hpp>
#include "test_components.hpp"

#include <unordered_set>

using namespace keystone_test;

TEST_CASE("ComponentType: identity", "[component][type]") {
    auto config = ComponentType::of<Config>();
    auto commands = ComponentType::of<Commands>();

    REQUIRE(config == ComponentType::of<Config>());
    REQUIRE_FALSE(config == commands);
    REQUIRE(config.hash() == ComponentType::of<Config>().hash());
    REQUIRE(&config.descriptor() == &ComponentType::of<Config>().descriptor());

    std::unordered_set<ComponentType> set{config, commands, ComponentType::of<Config>()};
    REQUIRE(set.size() == 2);
}

TEST_CASE("ComponentType: names", "[component][type]") {
    SECTION("declared component_name") {
        REQUIRE(ComponentType::of<Config>().name() == "Config");
    }

    SECTION("demangled type name without component_name") {
        REQUIRE(ComponentType::of<Unnamed>().name().find("Unnamed") != std::string::npos);
    }
}

TEST_CASE("ComponentType: construction path", "[component][type]") {
    REQUIRE(ComponentType::of<Config>().construction() == ConstructionPath::Default);
    REQUIRE(ComponentType::of<Commands>().construction() == ConstructionPath::WithHost);
    REQUIRE(ComponentType::of<NeedsPort>().construction() == ConstructionPath::None);
    REQUIRE_FALSE(ComponentType::of<NeedsPort>().is_constructible());

    BasicHost host("type-test");
    SECTION("constructs with the host when T(HostContext&) exists") {
        auto instance = ComponentType::of<Commands>().construct(host);
        REQUIRE(instance != nullptr);
        REQUIRE(static_cast<Commands*>(instance.get())->constructed_for() == "type-test");
    }

    SECTION("no construction path yields nothing") {
        REQUIRE(ComponentType::of<NeedsPort>().construct(host) == nullptr);
    }
}

TEST_CASE("ComponentType: declared dependencies", "[component][type]") {
    REQUIRE_FALSE(ComponentType::of<Config>().declares_dependencies());
    REQUIRE(ComponentType::of<Config>().declared_dependencies().empty());

    auto deps = ComponentType::of<Commands>().declared_dependencies();
    REQUIRE(deps.size() == 1);
    REQUIRE(deps[0] == ComponentType::of<Config>());

    auto cycle = ComponentType::of<CycleA>().declared_dependencies();
    REQUIRE(cycle == std::vector<ComponentType>{ComponentType::of<CycleB>()});
}

TEST_CASE("InstanceHandle: equality by type and generation", "[component][type]") {
    InstanceHandle a{ComponentType::of<Config>(), 1};
    InstanceHandle b{ComponentType::of<Config>(), 2};
    InstanceHandle c{ComponentType::of<Config>(), 1};

    REQUIRE(a == c);
    REQUIRE_FALSE(a == b);

    std::unordered_set<InstanceHandle> handles{a, b, c};
    REQUIRE(handles.size() == 2);
}

TEST_CASE("Component: host access before wiring", "[component][host]") {
    HostProbe probe;
    REQUIRE_FALSE(probe.is_wired());
    REQUIRE(probe.host_threw_in_constructor);
    REQUIRE_THROWS_AS(probe.host(), std::logic_error);
}

TEST_CASE("BasicHost", "[component][host]") {
    BasicHost host("server");
    REQUIRE(host.name() == "server");
    REQUIRE(host.logger() != nullptr);
    REQUIRE(host.logger()->name() == "server");
    REQUIRE(host.events().handler_count() == 0);
}
