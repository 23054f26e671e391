/// @file event_bus.cpp
/// @brief EventBus implementation for keystone_event
///
/// Handlers are copied out of the handler table under the lock and invoked
/// outside it, so a handler may subscribe, unsubscribe or publish freely.

#include <keystone/event/event_bus.hpp>
#include <keystone/core/log.hpp>

namespace keystone_event {

// =============================================================================
// Subscribing
// =============================================================================

SubscriberId EventBus::add_handler(std::type_index type, Priority priority, DynamicHandler handler,
                                   const EventListener* owner) {
    std::lock_guard<std::mutex> lock(m_handlers_mutex);

    SubscriberId sub_id(m_next_subscriber_id++);

    auto& handlers = m_handlers[type];
    handlers.push_back(HandlerEntry{sub_id, priority, owner, std::move(handler)});

    // Higher priority first, subscription order within a priority
    std::stable_sort(handlers.begin(), handlers.end(),
        [](const HandlerEntry& a, const HandlerEntry& b) {
            return static_cast<int>(a.priority) > static_cast<int>(b.priority);
        });

    return sub_id;
}

std::size_t EventBus::subscribe(EventListener& listener) {
    ListenerRegistrar registrar(*this, listener);
    try {
        listener.register_handlers(registrar);
    } catch (...) {
        // Drop the handlers added before the throw, then let the caller see it
        unsubscribe_all(listener);
        throw;
    }

    keystone_core::events_logger()->trace("Listener subscribed with {} handler(s)", registrar.count());
    return registrar.count();
}

bool EventBus::unsubscribe(SubscriberId id) {
    std::lock_guard<std::mutex> lock(m_handlers_mutex);

    bool removed = false;
    for (auto it = m_handlers.begin(); it != m_handlers.end();) {
        auto& handlers = it->second;
        auto before = handlers.size();
        handlers.erase(
            std::remove_if(handlers.begin(), handlers.end(),
                [id](const HandlerEntry& entry) { return entry.id == id; }),
            handlers.end());
        removed = removed || handlers.size() != before;

        if (handlers.empty()) {
            it = m_handlers.erase(it);
        } else {
            ++it;
        }
    }
    return removed;
}

std::size_t EventBus::unsubscribe_all(const EventListener& listener) {
    std::size_t removed = 0;
    {
        std::lock_guard<std::mutex> lock(m_handlers_mutex);

        for (auto it = m_handlers.begin(); it != m_handlers.end();) {
            auto& handlers = it->second;
            auto before = handlers.size();
            handlers.erase(
                std::remove_if(handlers.begin(), handlers.end(),
                    [&listener](const HandlerEntry& entry) { return entry.owner == &listener; }),
                handlers.end());
            removed += before - handlers.size();

            if (handlers.empty()) {
                it = m_handlers.erase(it);
            } else {
                ++it;
            }
        }
    }

    keystone_core::events_logger()->trace("Listener unsubscribed, {} handler(s) removed", removed);
    return removed;
}

bool EventBus::is_subscribed(const EventListener& listener) const {
    std::lock_guard<std::mutex> lock(m_handlers_mutex);

    for (const auto& [type, handlers] : m_handlers) {
        for (const auto& entry : handlers) {
            if (entry.owner == &listener) {
                return true;
            }
        }
    }
    return false;
}

std::size_t EventBus::handler_count() const {
    std::lock_guard<std::mutex> lock(m_handlers_mutex);

    std::size_t count = 0;
    for (const auto& [type, handlers] : m_handlers) {
        count += handlers.size();
    }
    return count;
}

std::size_t EventBus::handler_count(const std::type_index& type) const {
    std::lock_guard<std::mutex> lock(m_handlers_mutex);

    auto it = m_handlers.find(type);
    return it != m_handlers.end() ? it->second.size() : 0;
}

// =============================================================================
// Dispatch
// =============================================================================

void EventBus::dispatch(const std::type_index& type, const std::any& data) {
    std::vector<DynamicHandler> snapshot;
    {
        std::lock_guard<std::mutex> lock(m_handlers_mutex);
        auto it = m_handlers.find(type);
        if (it == m_handlers.end()) {
            return;
        }
        snapshot.reserve(it->second.size());
        for (const auto& entry : it->second) {
            snapshot.push_back(entry.handler);
        }
    }

    for (const auto& handler : snapshot) {
        handler(data);
    }
}

void EventBus::dispatch_envelopes(std::vector<EventEnvelope>& events) {
    std::stable_sort(events.begin(), events.end(),
        [](const EventEnvelope& a, const EventEnvelope& b) {
            return static_cast<int>(a.priority) > static_cast<int>(b.priority);
        });

    for (const auto& envelope : events) {
        dispatch(envelope.type_id, envelope.data);
    }
}

void EventBus::process() {
    std::vector<EventEnvelope> events;
    {
        std::lock_guard<std::mutex> lock(m_queue_mutex);
        events.reserve(m_queue.size());
        while (!m_queue.empty()) {
            events.push_back(std::move(m_queue.front()));
            m_queue.pop_front();
        }
    }

    dispatch_envelopes(events);
}

void EventBus::process_batch(std::size_t max_events) {
    std::vector<EventEnvelope> events;
    {
        std::lock_guard<std::mutex> lock(m_queue_mutex);
        while (!m_queue.empty() && events.size() < max_events) {
            events.push_back(std::move(m_queue.front()));
            m_queue.pop_front();
        }
    }

    dispatch_envelopes(events);
}

// =============================================================================
// Queue Management
// =============================================================================

void EventBus::clear() {
    std::lock_guard<std::mutex> lock(m_queue_mutex);
    m_queue.clear();
}

std::size_t EventBus::pending_count() const {
    std::lock_guard<std::mutex> lock(m_queue_mutex);
    return m_queue.size();
}

bool EventBus::has_pending() const {
    std::lock_guard<std::mutex> lock(m_queue_mutex);
    return !m_queue.empty();
}

} // namespace keystone_event
