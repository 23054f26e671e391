#pragma once

/// @file test_components.hpp
/// @brief Component types shared by the registry tests

#include <keystone/component/registry.hpp>

#include <algorithm>
#include <stdexcept>
#include <string>
#include <vector>

namespace keystone_test {

using namespace keystone_component;
using keystone_core::Err;
using keystone_core::Error;
using keystone_core::Ok;
using keystone_core::Result;

// =============================================================================
// Journal
// =============================================================================

/// Ordered record of lifecycle calls made by the test components
inline std::vector<std::string>& journal() {
    static std::vector<std::string> entries;
    return entries;
}

inline void record(const std::string& entry) {
    journal().push_back(entry);
}

/// Position of an entry, or -1 when absent
inline long position(const std::string& entry) {
    const auto& entries = journal();
    auto it = std::find(entries.begin(), entries.end(), entry);
    return it == entries.end() ? -1 : static_cast<long>(it - entries.begin());
}

inline long occurrences(const std::string& entry) {
    const auto& entries = journal();
    return static_cast<long>(std::count(entries.begin(), entries.end(), entry));
}

// =============================================================================
// Config / Commands
// =============================================================================

class Config : public Component, public Initializable, public Unloadable, public Reloadable {
public:
    static constexpr const char* component_name = "Config";

    Config() { record("Config::construct"); }

    Result<void> init() override {
        record("Config::init");
        return Ok();
    }

    Result<void> unload() override {
        record("Config::unload");
        return Ok();
    }

    Result<void> reload() override {
        record("Config::reload");
        return Ok();
    }
};

class Commands : public Component, public Initializable, public Unloadable, public Reloadable {
public:
    static constexpr const char* component_name = "Commands";

    static std::vector<ComponentType> dependencies() { return depends_on<Config>(); }

    explicit Commands(HostContext& host) : m_host_name(host.name()) {
        record("Commands::construct");
    }

    Result<void> init() override {
        record("Commands::init");
        return Ok();
    }

    Result<void> unload() override {
        record("Commands::unload");
        return Ok();
    }

    Result<void> reload() override {
        record("Commands::reload");
        return Ok();
    }

    [[nodiscard]] const std::string& constructed_for() const { return m_host_name; }

private:
    std::string m_host_name;
};

// =============================================================================
// Shared dependency with three dependents
// =============================================================================

class Storage : public Component, public Unloadable, public Reloadable {
public:
    static constexpr const char* component_name = "Storage";

    Result<void> unload() override {
        record("Storage::unload");
        return Ok();
    }

    Result<void> reload() override {
        record("Storage::reload");
        return Ok();
    }
};

class Chat : public Component, public Unloadable, public Reloadable {
public:
    static constexpr const char* component_name = "Chat";
    static std::vector<ComponentType> dependencies() { return depends_on<Storage>(); }

    Result<void> unload() override {
        record("Chat::unload");
        return Ok();
    }

    Result<void> reload() override {
        record("Chat::reload");
        return Ok();
    }
};

class Economy : public Component, public Unloadable, public Reloadable {
public:
    static constexpr const char* component_name = "Economy";
    static std::vector<ComponentType> dependencies() { return depends_on<Storage, Storage>(); }

    Result<void> unload() override {
        record("Economy::unload");
        return Ok();
    }

    Result<void> reload() override {
        record("Economy::reload");
        return Ok();
    }
};

class Permissions : public Component, public Unloadable, public Reloadable {
public:
    static constexpr const char* component_name = "Permissions";
    static std::vector<ComponentType> dependencies() { return depends_on<Storage>(); }

    Result<void> unload() override {
        record("Permissions::unload");
        return Ok();
    }

    Result<void> reload() override {
        record("Permissions::reload");
        return Ok();
    }
};

// =============================================================================
// Cycles
// =============================================================================

class CycleA : public Component {
public:
    static constexpr const char* component_name = "CycleA";
    static std::vector<ComponentType> dependencies();
};

class CycleB : public Component {
public:
    static constexpr const char* component_name = "CycleB";
    static std::vector<ComponentType> dependencies();
};

inline std::vector<ComponentType> CycleA::dependencies() { return depends_on<CycleB>(); }
inline std::vector<ComponentType> CycleB::dependencies() { return depends_on<CycleA>(); }

class SelfDependent : public Component {
public:
    static constexpr const char* component_name = "SelfDependent";
    static std::vector<ComponentType> dependencies() { return depends_on<SelfDependent>(); }
};

// =============================================================================
// Failures
// =============================================================================

/// Independent component with no hooks
class Metrics : public Component {
public:
    static constexpr const char* component_name = "Metrics";
    Metrics() { record("Metrics::construct"); }
};

class Exploding : public Component {
public:
    static constexpr const char* component_name = "Exploding";
    Exploding() { throw std::runtime_error("boom"); }
};

/// Depends on a component whose constructor throws
class Fuse : public Component {
public:
    static constexpr const char* component_name = "Fuse";
    static std::vector<ComponentType> dependencies() { return depends_on<Exploding>(); }
};

class BrokenInit : public Component, public Initializable {
public:
    static constexpr const char* component_name = "BrokenInit";

    Result<void> init() override {
        return Err(Error(keystone_core::ErrorCode::IOError, "disk full"));
    }
};

class StickyUnload : public Component, public Unloadable {
public:
    static constexpr const char* component_name = "StickyUnload";

    Result<void> unload() override {
        record("StickyUnload::unload");
        return Err(Error("handle still open"));
    }
};

class ThrowingUnload : public Component, public Unloadable {
public:
    static constexpr const char* component_name = "ThrowingUnload";

    Result<void> unload() override {
        throw std::runtime_error("unload exploded");
    }
};

class FlakyReload : public Component, public Reloadable {
public:
    static constexpr const char* component_name = "FlakyReload";

    Result<void> reload() override {
        record("FlakyReload::reload");
        return Err(Error("stale cache"));
    }
};

/// Constructor throws something that is not a std::exception
class ThrowsInt : public Component {
public:
    static constexpr const char* component_name = "ThrowsInt";
    ThrowsInt() { throw 42; }
};

/// Only constructible with an argument the registry cannot supply
class NeedsPort : public Component {
public:
    static constexpr const char* component_name = "NeedsPort";
    explicit NeedsPort(int port) : m_port(port) {}

    [[nodiscard]] int port() const { return m_port; }

private:
    int m_port;
};

// =============================================================================
// Host access
// =============================================================================

class HostProbe : public Component, public Initializable {
public:
    static constexpr const char* component_name = "HostProbe";

    HostProbe() {
        wired_in_constructor = is_wired();
        try {
            (void)host();
        } catch (const std::logic_error&) {
            host_threw_in_constructor = true;
        }
    }

    Result<void> init() override {
        host_name_in_init = host().name();
        return Ok();
    }

    bool wired_in_constructor = true;
    bool host_threw_in_constructor = false;
    std::string host_name_in_init;
};

/// Component without a component_name
class Unnamed : public Component {};

// =============================================================================
// Events
// =============================================================================

struct ChatMessage {
    std::string text;
};

class ChatListener : public Component, public keystone_event::EventListener {
public:
    static constexpr const char* component_name = "ChatListener";

    void register_handlers(keystone_event::ListenerRegistrar& registrar) override {
        registrar.on<ChatMessage>([this](const ChatMessage& message) { received.push_back(message.text); });
    }

    std::vector<std::string> received;
};

/// Registers one handler, then fails
class BrokenListener : public Component, public Unloadable, public keystone_event::EventListener {
public:
    static constexpr const char* component_name = "BrokenListener";

    void register_handlers(keystone_event::ListenerRegistrar& registrar) override {
        registrar.on<ChatMessage>([](const ChatMessage&) { record("BrokenListener::handle"); });
        throw std::runtime_error("handlers unavailable");
    }

    Result<void> unload() override {
        record("BrokenListener::unload");
        return Ok();
    }
};

} // namespace keystone_test
