/// @file registry.cpp
/// @brief ComponentRegistry implementation for keystone_component

#include <keystone/component/registry.hpp>
#include <keystone/core/log.hpp>

#include <algorithm>
#include <sstream>

namespace keystone_component {

using keystone_core::ComponentError;
using keystone_core::Err;
using keystone_core::Error;
using keystone_core::ErrorCode;
using keystone_core::Ok;
using keystone_core::Result;

namespace {

/// Run a component hook, converting escaped exceptions to errors
template<typename F>
Result<void> invoke_hook(const char* hook, const ComponentType& type, F&& fn) {
    try {
        return fn();
    } catch (const std::exception& e) {
        return Err(Error(ErrorCode::Unknown, type.name() + "::" + hook + " threw: " + e.what()));
    } catch (...) {
        return Err(Error(ErrorCode::Unknown, type.name() + "::" + hook + " threw a non-standard exception"));
    }
}

/// Record and return a failure
Result<void> fail(Error error) {
    keystone_core::debug::record_error(error);
    return Err(std::move(error));
}

} // anonymous namespace

// =============================================================================
// Names
// =============================================================================

const char* component_state_name(ComponentState state) {
    switch (state) {
        case ComponentState::Unregistered: return "Unregistered";
        case ComponentState::Registered: return "Registered";
        case ComponentState::PendingInit: return "PendingInit";
        case ComponentState::Active: return "Active";
        case ComponentState::PendingDeinit: return "PendingDeinit";
        default: return "Unknown";
    }
}

const char* component_event_name(ComponentEventType type) {
    switch (type) {
        case ComponentEventType::Registered: return "Registered";
        case ComponentEventType::Unregistered: return "Unregistered";
        case ComponentEventType::Initialized: return "Initialized";
        case ComponentEventType::InitializationFailed: return "InitializationFailed";
        case ComponentEventType::Deinitialized: return "Deinitialized";
        case ComponentEventType::Reloaded: return "Reloaded";
        default: return "Unknown";
    }
}

// =============================================================================
// TeardownHandle
// =============================================================================

TeardownHandle::TeardownHandle(ComponentRegistry& registry, std::weak_ptr<const bool> alive, std::uint64_t session)
    : m_registry(&registry)
    , m_alive(std::move(alive))
    , m_session(session)
{
}

TeardownHandle::TeardownHandle(TeardownHandle&& other) noexcept
    : m_registry(other.m_registry)
    , m_alive(std::move(other.m_alive))
    , m_session(other.m_session)
    , m_used(other.m_used)
{
    other.m_registry = nullptr;
    other.m_used = true;
}

TeardownHandle& TeardownHandle::operator=(TeardownHandle&& other) noexcept {
    if (this != &other) {
        m_registry = other.m_registry;
        m_alive = std::move(other.m_alive);
        m_session = other.m_session;
        m_used = other.m_used;
        other.m_registry = nullptr;
        other.m_used = true;
    }
    return *this;
}

bool TeardownHandle::is_valid() const noexcept {
    return !m_used && m_registry != nullptr && !m_alive.expired() &&
           m_registry->is_bound() && m_registry->m_session == m_session;
}

Result<void> TeardownHandle::run() {
    if (!is_valid()) {
        return run(TeardownPolicy{});
    }
    const ComponentRegistry* registry = m_registry;
    return run([registry](const Error& error) { return registry->default_teardown_decision(error); });
}

Result<void> TeardownHandle::run(const TeardownPolicy& policy) {
    if (!is_valid()) {
        return fail(ComponentError::invalid_binding("teardown handle has already run or its registry is gone"));
    }
    m_used = true;
    return m_registry->deinitialize_all(policy);
}

// =============================================================================
// Construction
// =============================================================================

ComponentRegistry::ComponentRegistry()
    : ComponentRegistry(RegistryConfig{}, declared_dependencies)
{
}

ComponentRegistry::ComponentRegistry(DependencyProvider provider)
    : ComponentRegistry(RegistryConfig{}, std::move(provider))
{
}

ComponentRegistry::ComponentRegistry(RegistryConfig config, DependencyProvider provider)
    : m_config(std::move(config))
    , m_graph(std::move(provider))
    , m_alive(std::make_shared<const bool>(true))
    , m_logger(keystone_core::registry_logger(m_config.name))
{
    if (m_config.log_level) {
        m_logger->set_level(*m_config.log_level);
    }
}

ComponentRegistry::~ComponentRegistry() {
    if (m_host) {
        m_logger->debug("[{}] Destroyed while bound to '{}', tearing down", m_config.name, m_host->name());
        auto result = deinitialize_all([this](const Error& error) {
            m_logger->warn("[{}] {}", m_config.name, keystone_core::build_error_chain(error));
            return TeardownDecision::Continue;
        });
        if (!result) {
            m_logger->error("[{}] Teardown on destruction failed: {}", m_config.name, result.error().message());
        }
    }
    release_remaining();
}

void ComponentRegistry::release_remaining() {
    for (const auto& handle : handles_newest_first()) {
        m_logger->warn("[{}] Releasing {} without a completed teardown", m_config.name, handle.type.name());
        m_active.erase(handle.type);
    }
}

// =============================================================================
// Registration
// =============================================================================

Result<void> ComponentRegistry::register_component(const ComponentType& type) {
    if (is_registered(type)) {
        return Ok();
    }

    m_registered.push_back(type);
    m_logger->debug("[{}] Registered {}", m_config.name, type.name());
    emit_event(ComponentEvent::create(ComponentEventType::Registered, type));

    if (m_host && !is_active(type)) {
        return initialize(type);
    }
    return Ok();
}

Result<void> ComponentRegistry::unregister(const ComponentType& type) {
    if (auto handle = handle_of(type)) {
        auto result = deinitialize(*handle, nullptr);
        if (!result) {
            if (result.error().is<ComponentError>()) {
                return result;
            }
            return fail(ComponentError::teardown_failed(type.name(), result.error()));
        }
        retire(*handle);
    }

    auto it = std::find(m_registered.begin(), m_registered.end(), type);
    if (it == m_registered.end()) {
        return Ok();
    }

    m_registered.erase(it);
    m_graph.prune([this](const ComponentType& dependent) { return is_registered(dependent); });

    m_logger->debug("[{}] Unregistered {}", m_config.name, type.name());
    emit_event(ComponentEvent::create(ComponentEventType::Unregistered, type));
    return Ok();
}

bool ComponentRegistry::is_registered(const ComponentType& type) const {
    return std::find(m_registered.begin(), m_registered.end(), type) != m_registered.end();
}

// =============================================================================
// Queries
// =============================================================================

bool ComponentRegistry::is_active(const ComponentType& type) const {
    return m_active.find(type) != m_active.end();
}

Result<Component*> ComponentRegistry::get_active(const ComponentType& type) const {
    auto it = m_active.find(type);
    if (it == m_active.end()) {
        return Err<Component*>(ComponentError::not_found(type.name()));
    }
    return Ok(it->second.instance.get());
}

ComponentState ComponentRegistry::state(const ComponentType& type) const {
    if (m_state.is_pending_init(type)) {
        return ComponentState::PendingInit;
    }
    if (auto handle = handle_of(type)) {
        return m_state.is_pending_deinit(*handle) ? ComponentState::PendingDeinit : ComponentState::Active;
    }
    return is_registered(type) ? ComponentState::Registered : ComponentState::Unregistered;
}

std::vector<ComponentType> ComponentRegistry::active_types() const {
    auto handles = handles_newest_first();
    std::vector<ComponentType> types;
    types.reserve(handles.size());
    for (auto it = handles.rbegin(); it != handles.rend(); ++it) {
        types.push_back(it->type);
    }
    return types;
}

std::optional<InstanceHandle> ComponentRegistry::handle_of(const ComponentType& type) const {
    auto it = m_active.find(type);
    if (it == m_active.end()) {
        return std::nullopt;
    }
    return InstanceHandle{type, it->second.generation};
}

bool ComponentRegistry::is_live(const InstanceHandle& handle) const {
    auto it = m_active.find(handle.type);
    return it != m_active.end() && it->second.generation == handle.generation;
}

Component* ComponentRegistry::instance_of(const InstanceHandle& handle) const {
    auto it = m_active.find(handle.type);
    if (it == m_active.end() || it->second.generation != handle.generation) {
        return nullptr;
    }
    return it->second.instance.get();
}

std::vector<InstanceHandle> ComponentRegistry::handles_newest_first() const {
    std::vector<InstanceHandle> handles;
    handles.reserve(m_active.size());
    for (const auto& [type, entry] : m_active) {
        handles.push_back(InstanceHandle{type, entry.generation});
    }
    std::sort(handles.begin(), handles.end(),
        [](const InstanceHandle& a, const InstanceHandle& b) { return a.generation > b.generation; });
    return handles;
}

// =============================================================================
// Initialization
// =============================================================================

Result<TeardownHandle> ComponentRegistry::initialize_all(HostContext& host) {
    if (m_host) {
        auto error = Error(ComponentError::invalid_binding(
            "registry '" + m_config.name + "' is already bound to host '" + m_host->name() + "'"));
        keystone_core::debug::record_error(error);
        return Err<TeardownHandle>(std::move(error));
    }

    m_host = &host;
    ++m_session;
    keystone_core::LogScope scope("[" + m_config.name + "] initialize_all", m_logger);
    m_logger->info("[{}] Initializing {} component(s) for host '{}'",
                   m_config.name, m_registered.size(), host.name());

    // Resolution may append dependencies to the registration set
    for (std::size_t i = 0; i < m_registered.size(); ++i) {
        ComponentType type = m_registered[i];
        if (is_active(type)) {
            continue;
        }
        auto result = initialize(type);
        if (!result) {
            m_logger->error("[{}] Initialization stopped at {}: {}",
                            m_config.name, type.name(), result.error().message());
            Error error = result.error();
            error.with_context("registry", m_config.name).with_context("host", host.name());
            return Err<TeardownHandle>(std::move(error));
        }
    }

    if (m_config.reload_after_initialize) {
        auto result = reload_all();
        if (!result) {
            return Err<TeardownHandle>(result.error());
        }
    }

    m_logger->info("[{}] {} component(s) active", m_config.name, m_active.size());
    return Ok(TeardownHandle(*this, m_alive, m_session));
}

Result<void> ComponentRegistry::initialize(const ComponentType& type) {
    if (is_active(type)) {
        return fail(ComponentError::already_active(type.name()));
    }
    if (m_state.is_pending_init(type)) {
        return fail(ComponentError::circular_dependency(type.name(), "initialization"));
    }

    Result<void> result = Ok();
    {
        LifecycleState::PendingInitScope pending(m_state, type);
        result = construct_and_activate(type);
    }

    if (!result) {
        m_graph.release_dependent(type);
        m_logger->warn("[{}] Failed to initialize {}: {}", m_config.name, type.name(), result.error().message());
        emit_event(ComponentEvent::create(ComponentEventType::InitializationFailed, type,
                                          result.error().message()));
        return result;
    }

    emit_event(ComponentEvent::create(ComponentEventType::Initialized, type));
    return result;
}

Result<void> ComponentRegistry::construct_and_activate(const ComponentType& type) {
    std::vector<ComponentType> dependencies;
    try {
        dependencies = m_graph.resolve_dependencies(type);
    } catch (const std::exception& e) {
        return fail(ComponentError::construction_failed(type.name(),
            Error(ErrorCode::InvalidArgument, "dependency declaration threw: " + std::string(e.what()))));
    } catch (...) {
        return fail(ComponentError::construction_failed(type.name(),
            Error(ErrorCode::InvalidArgument, "dependency declaration threw a non-standard exception")));
    }

    for (const auto& dependency : dependencies) {
        m_graph.register_dependent(dependency, type);

        if (!is_registered(dependency)) {
            m_registered.push_back(dependency);
            m_logger->debug("[{}] Registered {} as a dependency of {}", m_config.name, dependency.name(), type.name());
            emit_event(ComponentEvent::create(ComponentEventType::Registered, dependency));
        }

        if (!is_active(dependency)) {
            auto result = initialize(dependency);
            if (!result) {
                return result;
            }
        }
    }

    if (!type.is_constructible()) {
        return fail(ComponentError::no_construction_path(type.name()));
    }

    std::unique_ptr<Component> instance;
    try {
        instance = type.construct(*m_host);
    } catch (const std::exception& e) {
        return fail(ComponentError::construction_failed(type.name(),
            Error(ErrorCode::Unknown, type.name() + " constructor threw: " + e.what())));
    } catch (...) {
        return fail(ComponentError::construction_failed(type.name(),
            Error(ErrorCode::Unknown, type.name() + " constructor threw a non-standard exception")));
    }

    instance->wire(*m_host);

    if (auto* initializable = dynamic_cast<Initializable*>(instance.get())) {
        auto result = invoke_hook("init", type, [initializable] { return initializable->init(); });
        if (!result) {
            return fail(ComponentError::construction_failed(type.name(), result.error()));
        }
    }

    // Subscribed before activation so a throwing register_handlers discards the instance
    if (auto* listener = dynamic_cast<keystone_event::EventListener*>(instance.get())) {
        auto result = invoke_hook("register_handlers", type, [this, listener]() -> Result<void> {
            m_host->events().subscribe(*listener);
            return Ok();
        });
        if (!result) {
            return fail(ComponentError::construction_failed(type.name(), result.error()));
        }
    }

    const std::uint64_t generation = m_next_generation++;
    Component* raw = instance.get();
    m_active.emplace(type, ActiveEntry{std::move(instance), generation, m_host});

    if (dynamic_cast<Reloadable*>(raw)) {
        m_reload_candidates.push_back(InstanceHandle{type, generation});
    }

    m_logger->debug("[{}] Initialized {} (generation {})", m_config.name, type.name(), generation);
    return Ok();
}

// =============================================================================
// Deinitialization
// =============================================================================

Result<void> ComponentRegistry::deinitialize(const InstanceHandle& handle, TeardownBatch* batch) {
    const ComponentType& type = handle.type;

    if (m_state.is_pending_deinit(handle)) {
        return fail(ComponentError::circular_dependency(type.name(), "deinitialization"));
    }
    if (!is_live(handle)) {
        return fail(ComponentError::not_found(type.name()));
    }

    LifecycleState::PendingDeinitScope pending(m_state, handle);

    auto dependents = m_graph.active_dependents_of(type,
        [this](const ComponentType& dependent) { return is_active(dependent); });

    if (!dependents.empty()) {
        if (!batch) {
            return fail(ComponentError::dependents_active(type.name(), dependents.front().name()));
        }

        // Nothing is torn down unless every active dependent belongs to the batch
        for (const auto& dependent : dependents) {
            auto dependent_handle = handle_of(dependent);
            if (!dependent_handle || m_state.is_pending_deinit(*dependent_handle)) {
                continue;
            }
            if (batch->members.find(*dependent_handle) == batch->members.end()) {
                return fail(ComponentError::dependents_active(type.name(), dependent.name()));
            }
        }

        for (const auto& dependent : dependents) {
            auto dependent_handle = handle_of(dependent);
            if (!dependent_handle || m_state.is_pending_deinit(*dependent_handle)) {
                continue;
            }
            auto result = deinitialize(*dependent_handle, batch);
            if (!result) {
                return result;
            }
            retire(*dependent_handle);
            batch->completed.insert(*dependent_handle);
        }
    }

    Component* instance = instance_of(handle);

    if (auto* unloadable = dynamic_cast<Unloadable*>(instance)) {
        auto result = invoke_hook("unload", type, [unloadable] { return unloadable->unload(); });
        if (!result) {
            return result;
        }
    }

    if (auto* listener = dynamic_cast<keystone_event::EventListener*>(instance)) {
        auto it = m_active.find(type);
        it->second.host->events().unsubscribe_all(*listener);
    }

    return Ok();
}

bool ComponentRegistry::retire(const InstanceHandle& handle) {
    auto it = m_active.find(handle.type);
    if (it == m_active.end() || it->second.generation != handle.generation) {
        return false;
    }

    // Keep the instance alive until its bookkeeping is gone
    auto instance = std::move(it->second.instance);
    m_active.erase(it);
    m_graph.release_dependent(handle.type);

    m_logger->debug("[{}] Deinitialized {} (generation {})", m_config.name, handle.type.name(), handle.generation);
    emit_event(ComponentEvent::create(ComponentEventType::Deinitialized, handle.type));
    return true;
}

Result<void> ComponentRegistry::deinitialize_all(const TeardownPolicy& policy) {
    if (!m_host) {
        return fail(ComponentError::invalid_binding("registry '" + m_config.name + "' is not bound to a host"));
    }

    keystone_core::LogScope scope("[" + m_config.name + "] teardown", m_logger);
    TeardownBatch batch;
    const auto order = handles_newest_first();
    batch.members.insert(order.begin(), order.end());

    m_logger->info("[{}] Tearing down {} component(s)", m_config.name, order.size());

    Result<void> outcome = Ok();
    for (const auto& handle : order) {
        if (batch.completed.find(handle) != batch.completed.end() || !is_live(handle)) {
            continue;
        }

        auto result = deinitialize(handle, &batch);
        if (result) {
            retire(handle);
            batch.completed.insert(handle);
            continue;
        }

        Error error = ComponentError::teardown_failed(handle.type.name(), result.error());
        keystone_core::debug::record_error(error);

        const TeardownDecision decision = policy ? policy(error) : TeardownDecision::Abort;
        if (decision == TeardownDecision::Abort) {
            m_logger->error("[{}] Teardown aborted at {}", m_config.name, handle.type.name());
            outcome = Result<void>(std::move(error));
            break;
        }
    }

    std::erase_if(m_reload_candidates, [this](const InstanceHandle& handle) { return !is_live(handle); });

    m_logger->info("[{}] Unbound from host '{}', {} component(s) still active",
                   m_config.name, m_host->name(), m_active.size());
    m_host = nullptr;
    return outcome;
}

TeardownDecision ComponentRegistry::default_teardown_decision(const Error& error) const {
    if (m_host) {
        m_host->logger()->warn("[{}] {}", m_config.name, keystone_core::build_error_chain(error));
    } else {
        m_logger->warn("[{}] {}", m_config.name, keystone_core::build_error_chain(error));
    }
    return m_config.teardown_failure;
}

// =============================================================================
// Reload
// =============================================================================

Result<void> ComponentRegistry::reload_all() {
    keystone_core::LogScope scope("[" + m_config.name + "] reload_all", m_logger);
    std::erase_if(m_reload_candidates, [this](const InstanceHandle& handle) { return !is_live(handle); });

    const auto candidates = m_reload_candidates;
    std::unordered_set<InstanceHandle> reloaded;

    for (const auto& handle : candidates) {
        if (!is_live(handle) || reloaded.find(handle) != reloaded.end()) {
            continue;
        }
        auto result = reload_instance(handle, reloaded);
        if (!result) {
            return result;
        }
    }

    m_logger->debug("[{}] Reloaded {} component(s)", m_config.name, reloaded.size());
    return Ok();
}

Result<void> ComponentRegistry::reload_instance(const InstanceHandle& handle,
                                                std::unordered_set<InstanceHandle>& reloaded) {
    reloaded.insert(handle);

    const auto dependencies = m_graph.resolve_dependencies(handle.type);
    for (const auto& dependency : dependencies) {
        auto dependency_handle = handle_of(dependency);
        if (!dependency_handle || reloaded.find(*dependency_handle) != reloaded.end()) {
            continue;
        }
        if (!dynamic_cast<Reloadable*>(instance_of(*dependency_handle))) {
            continue;
        }
        auto result = reload_instance(*dependency_handle, reloaded);
        if (!result) {
            return result;
        }
    }

    auto* reloadable = dynamic_cast<Reloadable*>(instance_of(handle));
    if (!reloadable) {
        return Ok();
    }

    auto result = invoke_hook("reload", handle.type, [reloadable] { return reloadable->reload(); });
    if (!result) {
        m_logger->warn("[{}] Reload of {} failed: {}", m_config.name, handle.type.name(), result.error().message());
        return fail(ComponentError::reload_failed(handle.type.name(), result.error()));
    }

    emit_event(ComponentEvent::create(ComponentEventType::Reloaded, handle.type));
    return Ok();
}

// =============================================================================
// Events
// =============================================================================

void ComponentRegistry::emit_event(const ComponentEvent& event) {
    if (m_event_callback) {
        m_event_callback(event);
    }
}

// =============================================================================
// Debug Utilities
// =============================================================================

namespace debug {

std::string format_registry_state(const ComponentRegistry& registry) {
    std::ostringstream oss;
    oss << "ComponentRegistry '" << registry.config().name << "': "
        << registry.registered().size() << " registered, "
        << registry.active_count() << " active, "
        << (registry.is_bound() ? "bound to '" + registry.host()->name() + "'" : std::string("unbound"))
        << "\n";

    for (const auto& type : registry.registered()) {
        oss << "  " << type.name() << " [" << component_state_name(registry.state(type)) << "]";

        auto dependents = registry.graph().dependents_of(type);
        if (!dependents.empty()) {
            oss << " dependents:";
            for (const auto& dependent : dependents) {
                oss << " " << dependent.name();
            }
        }
        oss << "\n";
    }

    return oss.str();
}

} // namespace debug

} // namespace keystone_component
