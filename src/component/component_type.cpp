/// @file component_type.cpp
/// @brief ComponentType implementation for keystone_component

#include <keystone/component/component_type.hpp>
#include <keystone/component/component.hpp>

#include <cstdlib>

#if defined(__GNUG__)
#include <cxxabi.h>
#endif

namespace keystone_component {

const char* construction_path_name(ConstructionPath path) {
    switch (path) {
        case ConstructionPath::WithHost: return "WithHost";
        case ConstructionPath::Default: return "Default";
        case ConstructionPath::None: return "None";
        default: return "Unknown";
    }
}

namespace detail {

std::string demangle(const char* mangled) {
#if defined(__GNUG__)
    int status = 0;
    std::unique_ptr<char, void (*)(void*)> demangled(
        abi::__cxa_demangle(mangled, nullptr, nullptr, &status), std::free);
    if (status == 0 && demangled) {
        return demangled.get();
    }
#endif
    return mangled;
}

} // namespace detail

// =============================================================================
// ComponentType
// =============================================================================

const std::string& ComponentType::name() const noexcept {
    return m_descriptor->name;
}

std::type_index ComponentType::type_index() const noexcept {
    return m_descriptor->type;
}

ConstructionPath ComponentType::construction() const noexcept {
    return m_descriptor->construction;
}

bool ComponentType::is_constructible() const noexcept {
    return m_descriptor->factory != nullptr;
}

std::unique_ptr<Component> ComponentType::construct(HostContext& host) const {
    if (!m_descriptor->factory) {
        return nullptr;
    }
    return m_descriptor->factory(host);
}

bool ComponentType::declares_dependencies() const noexcept {
    return m_descriptor->dependencies != nullptr;
}

std::vector<ComponentType> ComponentType::declared_dependencies() const {
    if (!m_descriptor->dependencies) {
        return {};
    }
    return m_descriptor->dependencies();
}

} // namespace keystone_component
