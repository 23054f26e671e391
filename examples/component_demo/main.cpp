/// @file main.cpp
/// @brief Component Registry Demo
///
/// Registers a small chat server made of components, initializes it against a host,
/// reloads it, and tears it down through the returned handle.
///
/// Usage: component_demo [registry.json]

#include <keystone/component/config.hpp>
#include <keystone/component/registry.hpp>
#include <keystone/core/log.hpp>

#include <string>
#include <vector>

namespace {

using keystone_component::ComponentType;
using keystone_component::HostContext;
using keystone_core::Ok;
using keystone_core::Result;

struct PlayerJoined {
    std::string player;
};

class Storage : public keystone_component::Component,
                public keystone_component::Initializable,
                public keystone_component::Unloadable,
                public keystone_component::Reloadable {
public:
    static constexpr const char* component_name = "Storage";

    Result<void> init() override {
        host().logger()->info("Storage: opening database");
        return Ok();
    }

    Result<void> unload() override {
        host().logger()->info("Storage: flushing {} record(s)", m_records.size());
        return Ok();
    }

    Result<void> reload() override {
        host().logger()->info("Storage: reloading schema");
        return Ok();
    }

    void save(const std::string& record) { m_records.push_back(record); }

private:
    std::vector<std::string> m_records;
};

class Chat : public keystone_component::Component,
             public keystone_component::Unloadable,
             public keystone_component::Reloadable,
             public keystone_event::EventListener {
public:
    static constexpr const char* component_name = "Chat";
    static std::vector<ComponentType> dependencies() { return keystone_component::depends_on<Storage>(); }

    explicit Chat(HostContext& host) : m_motd("Welcome to " + host.name()) {}

    void register_handlers(keystone_event::ListenerRegistrar& registrar) override {
        registrar.on<PlayerJoined>([this](const PlayerJoined& event) {
            host().logger()->info("Chat: {} -> {}", m_motd, event.player);
        });
    }

    Result<void> unload() override {
        host().logger()->info("Chat: closing channels");
        return Ok();
    }

    Result<void> reload() override {
        host().logger()->info("Chat: reloading filters");
        return Ok();
    }

private:
    std::string m_motd;
};

class Economy : public keystone_component::Component, public keystone_event::EventListener {
public:
    static constexpr const char* component_name = "Economy";
    static std::vector<ComponentType> dependencies() { return keystone_component::depends_on<Storage>(); }

    void register_handlers(keystone_event::ListenerRegistrar& registrar) override {
        registrar.on<PlayerJoined>([this](const PlayerJoined& event) {
            host_as<HostContext>().logger()->info("Economy: opening wallet for {}", event.player);
        });
    }
};

} // anonymous namespace

int main(int argc, char** argv) {
    keystone_core::LogConfig log_config;
    log_config.level = spdlog::level::debug;
    keystone_core::configure_logging(log_config);

    keystone_component::RegistryConfig config;
    config.name = "chat-server";
    if (argc > 1) {
        auto loaded = keystone_component::load_registry_config(argv[1]);
        if (!loaded) {
            KEYSTONE_LOG_ERROR("Could not load {}: {}", argv[1], loaded.error().message());
            return 1;
        }
        config = std::move(loaded).value();
    }

    keystone_component::BasicHost host("demo-host");
    keystone_component::ComponentRegistry registry(config);

    registry.set_event_callback([](const keystone_component::ComponentEvent& event) {
        KEYSTONE_LOG_DEBUG("event: {} {}", keystone_component::component_event_name(event.type),
                      event.component.name());
    });

    if (auto result = registry.register_component<Chat>(); !result) {
        KEYSTONE_LOG_ERROR("{}", keystone_core::build_error_chain(result.error()));
        return 1;
    }
    if (auto result = registry.register_component<Economy>(); !result) {
        KEYSTONE_LOG_ERROR("{}", keystone_core::build_error_chain(result.error()));
        return 1;
    }

    auto handle = registry.initialize_all(host);
    if (!handle) {
        KEYSTONE_LOG_ERROR("Initialization failed: {}", keystone_core::build_error_chain(handle.error()));
        return 1;
    }

    KEYSTONE_LOG_INFO("\n{}", keystone_component::debug::format_registry_state(registry));

    if (auto storage = registry.get<Storage>()) {
        (*storage)->save("motd");
    }

    host.events().publish(PlayerJoined{"alice"});
    host.events().publish(PlayerJoined{"bob"});
    host.events().process();

    if (auto result = registry.reload_all(); !result) {
        KEYSTONE_LOG_WARN("Reload failed: {}", keystone_core::build_error_chain(result.error()));
    }

    auto teardown = handle->run();
    if (!teardown) {
        KEYSTONE_LOG_ERROR("Teardown failed: {}", keystone_core::build_error_chain(teardown.error()));
        return 1;
    }

    KEYSTONE_LOG_INFO("\n{}", keystone_component::debug::format_registry_state(registry));
    keystone_core::shutdown_logging();
    return 0;
}
