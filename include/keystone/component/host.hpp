#pragma once

/// @file host.hpp
/// @brief Host context shared by every component of one registry binding

#include "fwd.hpp"

#include <keystone/event/event_bus.hpp>

#include <spdlog/spdlog.h>

#include <memory>
#include <string>

namespace keystone_component {

// =============================================================================
// HostContext
// =============================================================================

/// Long-lived host application context.
///
/// Supplied once to `ComponentRegistry::initialize_all`, passed to `T(HostContext&)`
/// constructors and wired into every instance. Must outlive the binding.
class HostContext {
public:
    virtual ~HostContext() = default;

    /// Host name (used in log messages)
    [[nodiscard]] virtual const std::string& name() const = 0;

    /// Logger used for component diagnostics and the default teardown policy
    [[nodiscard]] virtual std::shared_ptr<spdlog::logger> logger() const = 0;

    /// Event bus that event-listening components are subscribed to
    [[nodiscard]] virtual keystone_event::EventBus& events() = 0;
};

// =============================================================================
// BasicHost
// =============================================================================

/// Ready-made host with its own event bus
class BasicHost : public HostContext {
public:
    /// Host logging through the named logger `name`
    explicit BasicHost(std::string name);

    /// Host logging through a caller-supplied logger
    BasicHost(std::string name, std::shared_ptr<spdlog::logger> logger);

    BasicHost(const BasicHost&) = delete;
    BasicHost& operator=(const BasicHost&) = delete;

    [[nodiscard]] const std::string& name() const override { return m_name; }
    [[nodiscard]] std::shared_ptr<spdlog::logger> logger() const override { return m_logger; }
    [[nodiscard]] keystone_event::EventBus& events() override { return m_events; }

private:
    std::string m_name;
    std::shared_ptr<spdlog::logger> m_logger;
    keystone_event::EventBus m_events;
};

} // namespace keystone_component
