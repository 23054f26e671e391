#pragma once

/// @file registry.hpp
/// @brief Component lifecycle registry
///
/// The registry owns every active component instance. It:
/// - Resolves declared dependencies and initializes dependencies first
/// - Detects dependency cycles through per-registry pending flags
/// - Refuses to tear down a component while a dependent is active
/// - Tears the whole set down, newest first, through a one-shot TeardownHandle
/// - Runs reload passes in dependency order
///
/// All operations run on the host's control thread; the registry does no locking.

#include "fwd.hpp"
#include "component.hpp"
#include "component_type.hpp"
#include "config.hpp"
#include "dependency_graph.hpp"
#include "host.hpp"
#include "lifecycle_state.hpp"

#include <keystone/core/error.hpp>

#include <spdlog/spdlog.h>

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace keystone_component {

// =============================================================================
// State & Events
// =============================================================================

/// Lifecycle state of one component type within a registry
enum class ComponentState : std::uint8_t {
    Unregistered,   ///< Unknown to the registry
    Registered,     ///< Registered, not active
    PendingInit,    ///< Being initialized
    Active,         ///< Initialized and live
    PendingDeinit,  ///< Being torn down
};

/// Get component state name
[[nodiscard]] const char* component_state_name(ComponentState state);

/// Events emitted by the component registry
enum class ComponentEventType : std::uint8_t {
    Registered,            ///< Type added to the registration set
    Unregistered,          ///< Type removed from the registration set
    Initialized,           ///< Instance became active
    InitializationFailed,  ///< Initialization failed, type stays registered
    Deinitialized,         ///< Instance torn down and released
    Reloaded,              ///< Instance reloaded
};

/// Get component event name
[[nodiscard]] const char* component_event_name(ComponentEventType type);

/// Component event data
struct ComponentEvent {
    ComponentEventType type;
    ComponentType component;
    std::string message;
    std::chrono::steady_clock::time_point timestamp;

    [[nodiscard]] static ComponentEvent create(
        ComponentEventType t, const ComponentType& component, std::string msg = {}) {
        return {t, component, std::move(msg), std::chrono::steady_clock::now()};
    }
};

/// Component event callback
using ComponentEventCallback = std::function<void(const ComponentEvent&)>;

/// Decides whether a batch teardown continues after a member failed
using TeardownPolicy = std::function<TeardownDecision(const keystone_core::Error&)>;

// =============================================================================
// TeardownHandle
// =============================================================================

/// One-shot handle that tears down everything one `initialize_all` activated.
///
/// Move-only. Runs at most once; a second run, or a run after the registry
/// was destroyed, returns an InvalidBinding error.
class TeardownHandle {
public:
    TeardownHandle(TeardownHandle&& other) noexcept;
    TeardownHandle& operator=(TeardownHandle&& other) noexcept;
    ~TeardownHandle() = default;

    TeardownHandle(const TeardownHandle&) = delete;
    TeardownHandle& operator=(const TeardownHandle&) = delete;

    /// Tear down with the registry's default policy
    keystone_core::Result<void> run();

    /// Tear down with a caller-supplied policy (an empty policy aborts on the first failure)
    keystone_core::Result<void> run(const TeardownPolicy& policy);

    /// Check whether run() would reach a bound registry
    [[nodiscard]] bool is_valid() const noexcept;

private:
    friend class ComponentRegistry;

    TeardownHandle(ComponentRegistry& registry, std::weak_ptr<const bool> alive, std::uint64_t session);

    ComponentRegistry* m_registry;
    std::weak_ptr<const bool> m_alive;
    std::uint64_t m_session;
    bool m_used = false;
};

// =============================================================================
// ComponentRegistry
// =============================================================================

/// Component lifecycle registry
class ComponentRegistry {
public:
    ComponentRegistry();
    explicit ComponentRegistry(RegistryConfig config, DependencyProvider provider = declared_dependencies);
    explicit ComponentRegistry(DependencyProvider provider);

    /// Tears down anything still bound, newest first, logging failures
    ~ComponentRegistry();

    ComponentRegistry(const ComponentRegistry&) = delete;
    ComponentRegistry& operator=(const ComponentRegistry&) = delete;
    ComponentRegistry(ComponentRegistry&&) = delete;
    ComponentRegistry& operator=(ComponentRegistry&&) = delete;

    // =========================================================================
    // Registration
    // =========================================================================

    /// Add a type to the registration set (no-op if present).
    /// While bound, the type is initialized immediately and that result returned.
    keystone_core::Result<void> register_component(const ComponentType& type);

    template<typename T>
    keystone_core::Result<void> register_component() {
        return register_component(ComponentType::of<T>());
    }

    /// Tear down the type if active (fails while dependents are active), then
    /// remove it from the registration set
    keystone_core::Result<void> unregister(const ComponentType& type);

    template<typename T>
    keystone_core::Result<void> unregister() {
        return unregister(ComponentType::of<T>());
    }

    [[nodiscard]] bool is_registered(const ComponentType& type) const;

    template<typename T>
    [[nodiscard]] bool is_registered() const {
        return is_registered(ComponentType::of<T>());
    }

    /// Registered types in registration order
    [[nodiscard]] const std::vector<ComponentType>& registered() const noexcept { return m_registered; }

    // =========================================================================
    // Queries
    // =========================================================================

    [[nodiscard]] bool is_active(const ComponentType& type) const;

    template<typename T>
    [[nodiscard]] bool is_active() const {
        return is_active(ComponentType::of<T>());
    }

    /// Active instance of `type`, or a NotFound error
    [[nodiscard]] keystone_core::Result<Component*> get_active(const ComponentType& type) const;

    /// Active instance of T, or a NotFound error
    template<typename T>
    [[nodiscard]] keystone_core::Result<T*> get() const {
        auto result = get_active(ComponentType::of<T>());
        if (!result) {
            return keystone_core::Err<T*>(result.error());
        }
        return keystone_core::Ok(static_cast<T*>(*result));
    }

    /// Lifecycle state of `type`
    [[nodiscard]] ComponentState state(const ComponentType& type) const;

    /// Active types, oldest activation first
    [[nodiscard]] std::vector<ComponentType> active_types() const;

    [[nodiscard]] std::size_t active_count() const noexcept { return m_active.size(); }

    /// Check whether a host is bound
    [[nodiscard]] bool is_bound() const noexcept { return m_host != nullptr; }

    /// Bound host, or nullptr
    [[nodiscard]] HostContext* host() const noexcept { return m_host; }

    [[nodiscard]] const RegistryConfig& config() const noexcept { return m_config; }
    [[nodiscard]] const DependencyGraph& graph() const noexcept { return m_graph; }

    // =========================================================================
    // Lifecycle
    // =========================================================================

    /// Bind `host`, initialize every registered inactive type in registration
    /// order, then run a reload pass (when configured).
    /// On failure the registry stays bound and earlier components stay active.
    keystone_core::Result<TeardownHandle> initialize_all(HostContext& host);

    /// Reload every live Reloadable instance, dependencies first, each at most once
    keystone_core::Result<void> reload_all();

    // =========================================================================
    // Events
    // =========================================================================

    /// Set event callback
    void set_event_callback(ComponentEventCallback callback) {
        m_event_callback = std::move(callback);
    }

private:
    friend class TeardownHandle;

    struct ActiveEntry {
        std::unique_ptr<Component> instance;
        std::uint64_t generation;
        HostContext* host;
    };

    /// Members of one teardown operation; all members see each other
    struct TeardownBatch {
        std::unordered_set<InstanceHandle> members;
        std::unordered_set<InstanceHandle> completed;
    };

    keystone_core::Result<void> initialize(const ComponentType& type);
    keystone_core::Result<void> construct_and_activate(const ComponentType& type);
    keystone_core::Result<void> deinitialize(const InstanceHandle& handle, TeardownBatch* batch);
    keystone_core::Result<void> deinitialize_all(const TeardownPolicy& policy);
    keystone_core::Result<void> reload_instance(const InstanceHandle& handle,
                                                std::unordered_set<InstanceHandle>& reloaded);

    /// Remove the instance if the active map still holds exactly `handle`
    bool retire(const InstanceHandle& handle);

    [[nodiscard]] std::optional<InstanceHandle> handle_of(const ComponentType& type) const;
    [[nodiscard]] bool is_live(const InstanceHandle& handle) const;
    [[nodiscard]] Component* instance_of(const InstanceHandle& handle) const;
    [[nodiscard]] std::vector<InstanceHandle> handles_newest_first() const;

    TeardownDecision default_teardown_decision(const keystone_core::Error& error) const;
    void release_remaining();
    void emit_event(const ComponentEvent& event);

    RegistryConfig m_config;
    DependencyGraph m_graph;
    LifecycleState m_state;
    std::vector<ComponentType> m_registered;
    std::unordered_map<ComponentType, ActiveEntry> m_active;
    std::vector<InstanceHandle> m_reload_candidates;
    HostContext* m_host = nullptr;
    std::uint64_t m_next_generation = 1;
    std::uint64_t m_session = 0;
    ComponentEventCallback m_event_callback;
    std::shared_ptr<const bool> m_alive;
    std::shared_ptr<spdlog::logger> m_logger;
};

// =============================================================================
// Debug Utilities
// =============================================================================

namespace debug {

/// Multi-line summary of registered types, their states and dependents
[[nodiscard]] std::string format_registry_state(const ComponentRegistry& registry);

} // namespace debug

} // namespace keystone_component
