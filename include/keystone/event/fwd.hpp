#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for keystone_event

#include <cstdint>

namespace keystone_event {

// Priority
enum class Priority : std::uint8_t;

// IDs
struct SubscriberId;

// Core types
class EventEnvelope;
class EventBus;

// Listener subscription
class EventListener;
class ListenerRegistrar;

} // namespace keystone_event
