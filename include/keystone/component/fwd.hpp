#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for keystone_component

#include <cstdint>

namespace keystone_component {

// Identity
struct ComponentDescriptor;
class ComponentType;
struct InstanceHandle;
enum class ConstructionPath : std::uint8_t;

// Lifecycle interfaces
class Component;
class Initializable;
class Unloadable;
class Reloadable;
class HostContext;
class BasicHost;

// Bookkeeping
class DependencyGraph;
class LifecycleState;

// Registry
struct RegistryConfig;
enum class TeardownDecision : std::uint8_t;
enum class ComponentState : std::uint8_t;
enum class ComponentEventType : std::uint8_t;
struct ComponentEvent;
class TeardownHandle;
class ComponentRegistry;

} // namespace keystone_component
