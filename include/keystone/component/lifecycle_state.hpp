#pragma once

/// @file lifecycle_state.hpp
/// @brief Re-entrancy guards for component initialization and teardown

#include "fwd.hpp"
#include "component_type.hpp"

#include <cstddef>
#include <unordered_set>

namespace keystone_component {

// =============================================================================
// LifecycleState
// =============================================================================

/// Pending-initialization flags (by type) and pending-deinitialization flags
/// (by instance handle), owned by one registry
class LifecycleState {
public:
    [[nodiscard]] bool is_pending_init(const ComponentType& type) const;
    void set_pending_init(const ComponentType& type, bool pending);

    [[nodiscard]] bool is_pending_deinit(const InstanceHandle& handle) const;
    void set_pending_deinit(const InstanceHandle& handle, bool pending);

    [[nodiscard]] std::size_t pending_init_count() const noexcept { return m_pending_init.size(); }
    [[nodiscard]] std::size_t pending_deinit_count() const noexcept { return m_pending_deinit.size(); }

    /// RAII guard holding a type's pending-init flag for one scope
    class PendingInitScope {
    public:
        PendingInitScope(LifecycleState& state, const ComponentType& type);
        ~PendingInitScope();

        PendingInitScope(const PendingInitScope&) = delete;
        PendingInitScope& operator=(const PendingInitScope&) = delete;

    private:
        LifecycleState& m_state;
        ComponentType m_type;
    };

    /// RAII guard holding an instance's pending-deinit flag for one scope
    class PendingDeinitScope {
    public:
        PendingDeinitScope(LifecycleState& state, const InstanceHandle& handle);
        ~PendingDeinitScope();

        PendingDeinitScope(const PendingDeinitScope&) = delete;
        PendingDeinitScope& operator=(const PendingDeinitScope&) = delete;

    private:
        LifecycleState& m_state;
        InstanceHandle m_handle;
    };

private:
    std::unordered_set<ComponentType> m_pending_init;
    std::unordered_set<InstanceHandle> m_pending_deinit;
};

} // namespace keystone_component
