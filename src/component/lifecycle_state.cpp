/// @file lifecycle_state.cpp
/// @brief LifecycleState implementation for keystone_component

#include <keystone/component/lifecycle_state.hpp>

namespace keystone_component {

bool LifecycleState::is_pending_init(const ComponentType& type) const {
    return m_pending_init.find(type) != m_pending_init.end();
}

void LifecycleState::set_pending_init(const ComponentType& type, bool pending) {
    if (pending) {
        m_pending_init.insert(type);
    } else {
        m_pending_init.erase(type);
    }
}

bool LifecycleState::is_pending_deinit(const InstanceHandle& handle) const {
    return m_pending_deinit.find(handle) != m_pending_deinit.end();
}

void LifecycleState::set_pending_deinit(const InstanceHandle& handle, bool pending) {
    if (pending) {
        m_pending_deinit.insert(handle);
    } else {
        m_pending_deinit.erase(handle);
    }
}

LifecycleState::PendingInitScope::PendingInitScope(LifecycleState& state, const ComponentType& type)
    : m_state(state)
    , m_type(type)
{
    m_state.set_pending_init(m_type, true);
}

LifecycleState::PendingInitScope::~PendingInitScope() {
    m_state.set_pending_init(m_type, false);
}

LifecycleState::PendingDeinitScope::PendingDeinitScope(LifecycleState& state, const InstanceHandle& handle)
    : m_state(state)
    , m_handle(handle)
{
    m_state.set_pending_deinit(m_handle, true);
}

LifecycleState::PendingDeinitScope::~PendingDeinitScope() {
    m_state.set_pending_deinit(m_handle, false);
}

} // namespace keystone_component
