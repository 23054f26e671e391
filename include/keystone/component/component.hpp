#pragma once

/// @file component.hpp
/// @brief Component base class and optional lifecycle capabilities
///
/// A component derives from `Component` and any subset of:
/// - `Initializable`: `init()` runs after construction and host wiring
/// - `Unloadable`: `unload()` runs during teardown
/// - `Reloadable`: `reload()` runs during reload passes
/// - `keystone_event::EventListener`: subscribed to the host's event bus while active
///
/// Dependencies are declared statically:
/// @code
/// class Commands : public Component, public Initializable {
/// public:
///     static constexpr const char* component_name = "Commands";
///     static std::vector<ComponentType> dependencies() { return depends_on<Config>(); }
///     explicit Commands(HostContext& host);
///     keystone_core::Result<void> init() override;
/// };
/// @endcode

#include "fwd.hpp"
#include "component_type.hpp"
#include "host.hpp"

#include <keystone/core/error.hpp>
#include <keystone/event/event_bus.hpp>

#include <stdexcept>
#include <string>

namespace keystone_component {

// =============================================================================
// Component
// =============================================================================

/// Base class of every component managed by a ComponentRegistry
class Component {
public:
    virtual ~Component() = default;

    Component(const Component&) = delete;
    Component& operator=(const Component&) = delete;

    /// Host this instance was wired to.
    /// @throws std::logic_error when called before wiring (e.g. from a T() constructor)
    [[nodiscard]] HostContext& host() const {
        if (!m_host) {
            throw std::logic_error("Component host accessed before it was initialized");
        }
        return *m_host;
    }

    /// Check whether the registry has wired the host into this instance
    [[nodiscard]] bool is_wired() const noexcept { return m_host != nullptr; }

    /// Host downcast to a concrete host type
    /// @throws std::logic_error when unwired or when the host is not an H
    template<typename H>
    [[nodiscard]] H& host_as() const {
        auto* typed = dynamic_cast<H*>(&host());
        if (!typed) {
            throw std::logic_error("Component host is not of the requested type");
        }
        return *typed;
    }

protected:
    Component() = default;

private:
    friend class ComponentRegistry;

    void wire(HostContext& host) noexcept { m_host = &host; }

    HostContext* m_host = nullptr;
};

// =============================================================================
// Capabilities
// =============================================================================

/// Post-construction initialization hook
class Initializable {
public:
    virtual ~Initializable() = default;
    virtual keystone_core::Result<void> init() = 0;
};

/// Teardown hook
class Unloadable {
public:
    virtual ~Unloadable() = default;
    virtual keystone_core::Result<void> unload() = 0;
};

/// Reload hook, run after initialize_all and on demand
class Reloadable {
public:
    virtual ~Reloadable() = default;
    virtual keystone_core::Result<void> reload() = 0;
};

} // namespace keystone_component
