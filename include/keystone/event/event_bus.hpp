#pragma once

/// @file event_bus.hpp
/// @brief Host event bus for keystone_event
///
/// Event system with:
/// - Immediate (emit) and queued (publish + process) delivery
/// - Priority-based handler ordering
/// - Listener objects whose handlers are subscribed and removed as a group

#include "fwd.hpp"

#include <algorithm>
#include <any>
#include <cstddef>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <typeindex>
#include <vector>

namespace keystone_event {

// =============================================================================
// Priority
// =============================================================================

/// Event priority for ordering delivery
enum class Priority : std::uint8_t {
    Low = 0,
    Normal = 1,
    High = 2,
    Critical = 3
};

// =============================================================================
// SubscriberId
// =============================================================================

/// Unique identifier for a subscription
struct SubscriberId {
    std::uint64_t id = 0;

    constexpr SubscriberId() = default;
    constexpr explicit SubscriberId(std::uint64_t value) : id(value) {}

    [[nodiscard]] constexpr bool is_valid() const noexcept { return id != 0; }

    constexpr auto operator<=>(const SubscriberId&) const noexcept = default;
    constexpr bool operator==(const SubscriberId&) const noexcept = default;
};

// =============================================================================
// EventEnvelope
// =============================================================================

/// Event envelope containing metadata and type-erased data
class EventEnvelope {
public:
    /// Event type identifier
    std::type_index type_id;
    /// Event data (type-erased)
    std::any data;
    /// Event priority
    Priority priority;
    /// Sequence number assigned at publish time
    std::uint64_t sequence;

    /// Create envelope from typed event
    template<typename E>
    static EventEnvelope create(E&& event, Priority prio, std::uint64_t seq) {
        EventEnvelope env;
        env.type_id = std::type_index(typeid(std::decay_t<E>));
        env.data = std::forward<E>(event);
        env.priority = prio;
        env.sequence = seq;
        return env;
    }

    /// Try to get the event as a specific type
    template<typename E>
    [[nodiscard]] const E* try_get() const {
        return std::any_cast<E>(&data);
    }

private:
    EventEnvelope() : type_id(typeid(void)), priority(Priority::Normal), sequence(0) {}
};

// =============================================================================
// EventListener
// =============================================================================

/// An object that owns a group of event handlers.
///
/// `EventBus::subscribe(listener)` calls `register_handlers` once; every handler
/// registered through the registrar is tagged with the listener and removed by
/// `EventBus::unsubscribe_all(listener)`.
class EventListener {
public:
    virtual ~EventListener() = default;

    /// Register this listener's handlers
    virtual void register_handlers(ListenerRegistrar& registrar) = 0;
};

// =============================================================================
// EventBus
// =============================================================================

/// Dynamic handler type
using DynamicHandler = std::function<void(const std::any&)>;

/// Event bus for publishing and subscribing to events
class EventBus {
public:
    EventBus() = default;
    ~EventBus() = default;

    // Non-copyable, non-movable
    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;
    EventBus(EventBus&&) = delete;
    EventBus& operator=(EventBus&&) = delete;

    // =========================================================================
    // Publishing
    // =========================================================================

    /// Dispatch an event to current subscribers immediately
    template<typename E>
    void emit(const E& event) {
        dispatch(std::type_index(typeid(E)), std::any(event));
    }

    /// Queue an event with default (Normal) priority
    template<typename E>
    void publish(E&& event) {
        publish_with_priority(std::forward<E>(event), Priority::Normal);
    }

    /// Queue an event with specified priority
    template<typename E>
    void publish_with_priority(E&& event, Priority priority) {
        std::lock_guard<std::mutex> lock(m_queue_mutex);
        m_queue.push_back(EventEnvelope::create(std::forward<E>(event), priority, m_next_sequence++));
    }

    // =========================================================================
    // Subscribing
    // =========================================================================

    /// Subscribe to an event type with default (Normal) priority
    template<typename E, typename F>
    SubscriberId subscribe(F&& handler) {
        return subscribe_with_priority<E>(std::forward<F>(handler), Priority::Normal);
    }

    /// Subscribe to an event type with specified priority
    template<typename E, typename F>
    SubscriberId subscribe_with_priority(F&& handler, Priority priority) {
        return add_handler(std::type_index(typeid(E)), priority, wrap<E>(std::forward<F>(handler)), nullptr);
    }

    /// Subscribe a listener; returns the number of handlers it registered
    std::size_t subscribe(EventListener& listener);

    /// Unsubscribe a single handler
    bool unsubscribe(SubscriberId id);

    /// Unsubscribe every handler owned by a listener; returns the number removed
    std::size_t unsubscribe_all(const EventListener& listener);

    /// Check whether a listener has at least one live handler
    [[nodiscard]] bool is_subscribed(const EventListener& listener) const;

    /// Total number of handlers
    [[nodiscard]] std::size_t handler_count() const;

    /// Number of handlers for one event type
    template<typename E>
    [[nodiscard]] std::size_t handler_count() const {
        return handler_count(std::type_index(typeid(E)));
    }

    // =========================================================================
    // Processing
    // =========================================================================

    /// Dispatch all queued events, higher priority first, then publish order
    void process();

    /// Dispatch up to max_events queued events
    void process_batch(std::size_t max_events);

    // =========================================================================
    // Queue Management
    // =========================================================================

    /// Clear all pending events without processing
    void clear();

    /// Get pending event count
    [[nodiscard]] std::size_t pending_count() const;

    /// Check if there are pending events
    [[nodiscard]] bool has_pending() const;

private:
    friend class ListenerRegistrar;

    struct HandlerEntry {
        SubscriberId id;
        Priority priority;
        const EventListener* owner;
        DynamicHandler handler;
    };

    template<typename E, typename F>
    static DynamicHandler wrap(F&& handler) {
        return [h = std::forward<F>(handler)](const std::any& data) {
            if (const E* event = std::any_cast<E>(&data)) {
                h(*event);
            }
        };
    }

    SubscriberId add_handler(std::type_index type, Priority priority, DynamicHandler handler,
                             const EventListener* owner);
    void dispatch(const std::type_index& type, const std::any& data);
    void dispatch_envelopes(std::vector<EventEnvelope>& events);
    [[nodiscard]] std::size_t handler_count(const std::type_index& type) const;

    std::map<std::type_index, std::vector<HandlerEntry>> m_handlers;
    mutable std::mutex m_handlers_mutex;
    std::uint64_t m_next_subscriber_id = 1;

    std::deque<EventEnvelope> m_queue;
    mutable std::mutex m_queue_mutex;
    std::uint64_t m_next_sequence = 0;
};

// =============================================================================
// ListenerRegistrar
// =============================================================================

/// Handed to `EventListener::register_handlers`; tags handlers with their owner
class ListenerRegistrar {
public:
    ListenerRegistrar(const ListenerRegistrar&) = delete;
    ListenerRegistrar& operator=(const ListenerRegistrar&) = delete;

    /// Register a handler for event type E
    template<typename E, typename F>
    SubscriberId on(F&& handler, Priority priority = Priority::Normal) {
        ++m_count;
        return m_bus.add_handler(std::type_index(typeid(E)), priority,
                                 EventBus::wrap<E>(std::forward<F>(handler)), &m_owner);
    }

    /// Number of handlers registered so far
    [[nodiscard]] std::size_t count() const noexcept { return m_count; }

private:
    friend class EventBus;

    ListenerRegistrar(EventBus& bus, const EventListener& owner)
        : m_bus(bus), m_owner(owner) {}

    EventBus& m_bus;
    const EventListener& m_owner;
    std::size_t m_count = 0;
};

} // namespace keystone_event
