#pragma once

/// @file component_type.hpp
/// @brief Component identity, descriptors and declared dependencies

#include "fwd.hpp"

#include <concepts>
#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <type_traits>
#include <typeindex>
#include <typeinfo>
#include <vector>

namespace keystone_component {

// =============================================================================
// ConstructionPath
// =============================================================================

/// How the registry builds an instance of a component type
enum class ConstructionPath : std::uint8_t {
    WithHost,  ///< T(HostContext&)
    Default,   ///< T()
    None,      ///< Not constructible
};

/// Get construction path name
[[nodiscard]] const char* construction_path_name(ConstructionPath path);

/// Factory producing a fresh instance for the given host
using ComponentFactory = std::unique_ptr<Component> (*)(HostContext&);

// =============================================================================
// ComponentType
// =============================================================================

/// Opaque handle naming a component kind.
///
/// Obtained with `ComponentType::of<T>()`. Two handles compare equal iff they
/// name the same C++ type; the handle is cheap to copy and usable as a key.
class ComponentType {
public:
    /// Get the type handle for T
    template<typename T>
    [[nodiscard]] static ComponentType of();

    /// Human-readable name (`T::component_name` or the demangled type name)
    [[nodiscard]] const std::string& name() const noexcept;

    /// Underlying C++ type
    [[nodiscard]] std::type_index type_index() const noexcept;

    /// Construction path chosen at compile time
    [[nodiscard]] ConstructionPath construction() const noexcept;

    /// Check whether the registry can build an instance
    [[nodiscard]] bool is_constructible() const noexcept;

    /// Build an instance (may throw whatever the constructor throws)
    [[nodiscard]] std::unique_ptr<Component> construct(HostContext& host) const;

    /// Check whether the type declares `static dependencies()`
    [[nodiscard]] bool declares_dependencies() const noexcept;

    /// Read the type's static dependency declaration (empty when undeclared)
    [[nodiscard]] std::vector<ComponentType> declared_dependencies() const;

    /// Get the full descriptor
    [[nodiscard]] const ComponentDescriptor& descriptor() const noexcept { return *m_descriptor; }

    [[nodiscard]] bool operator==(const ComponentType& other) const noexcept {
        return type_index() == other.type_index();
    }

    [[nodiscard]] bool operator<(const ComponentType& other) const noexcept {
        return type_index() < other.type_index();
    }

    [[nodiscard]] std::size_t hash() const noexcept {
        return type_index().hash_code();
    }

private:
    explicit ComponentType(const ComponentDescriptor* descriptor) noexcept : m_descriptor(descriptor) {}

    const ComponentDescriptor* m_descriptor;
};

// =============================================================================
// ComponentDescriptor
// =============================================================================

/// Static metadata captured once per component type
struct ComponentDescriptor {
    std::string name;
    std::type_index type;
    ConstructionPath construction;
    ComponentFactory factory;                         ///< nullptr when None
    std::vector<ComponentType> (*dependencies)();     ///< nullptr when undeclared
};

// =============================================================================
// InstanceHandle
// =============================================================================

/// Names one activation of a component type
struct InstanceHandle {
    ComponentType type;
    std::uint64_t generation;

    [[nodiscard]] bool operator==(const InstanceHandle& other) const noexcept {
        return generation == other.generation && type == other.type;
    }

    [[nodiscard]] std::size_t hash() const noexcept {
        return type.hash() ^ (std::hash<std::uint64_t>{}(generation) + 0x9e3779b97f4a7c15ULL +
                              (type.hash() << 6) + (type.hash() >> 2));
    }
};

// =============================================================================
// Descriptor Construction
// =============================================================================

/// Satisfied by types declaring `static std::vector<ComponentType> dependencies()`
template<typename T>
concept DeclaresDependencies = requires {
    { T::dependencies() } -> std::convertible_to<std::vector<ComponentType>>;
};

/// Satisfied by types declaring a `component_name`
template<typename T>
concept NamedComponent = requires {
    { T::component_name } -> std::convertible_to<std::string_view>;
};

namespace detail {

/// Demangle a compiler type name
[[nodiscard]] std::string demangle(const char* mangled);

template<typename T>
std::unique_ptr<Component> construct_component(HostContext& host) {
    if constexpr (std::is_constructible_v<T, HostContext&>) {
        return std::make_unique<T>(host);
    } else {
        return std::make_unique<T>();
    }
}

template<typename T>
std::vector<ComponentType> declared_dependencies_of() {
    return T::dependencies();
}

template<typename T>
ComponentDescriptor make_descriptor() {
    ComponentDescriptor descriptor{
        {},
        std::type_index(typeid(T)),
        ConstructionPath::None,
        nullptr,
        nullptr,
    };

    if constexpr (NamedComponent<T>) {
        descriptor.name = std::string(std::string_view(T::component_name));
    } else {
        descriptor.name = demangle(typeid(T).name());
    }

    if constexpr (std::is_constructible_v<T, HostContext&>) {
        descriptor.construction = ConstructionPath::WithHost;
        descriptor.factory = &construct_component<T>;
    } else if constexpr (std::is_default_constructible_v<T>) {
        descriptor.construction = ConstructionPath::Default;
        descriptor.factory = &construct_component<T>;
    }

    if constexpr (DeclaresDependencies<T>) {
        descriptor.dependencies = &declared_dependencies_of<T>;
    }

    return descriptor;
}

template<typename T>
const ComponentDescriptor& descriptor_for() {
    static const ComponentDescriptor descriptor = make_descriptor<T>();
    return descriptor;
}

} // namespace detail

template<typename T>
ComponentType ComponentType::of() {
    static_assert(std::is_base_of_v<Component, T>, "component types must derive from Component");
    return ComponentType(&detail::descriptor_for<T>());
}

/// Build a dependency declaration: `return depends_on<Config, Storage>();`
template<typename... Ts>
[[nodiscard]] std::vector<ComponentType> depends_on() {
    return {ComponentType::of<Ts>()...};
}

} // namespace keystone_component

// =============================================================================
// Hash Specializations
// =============================================================================

template<>
struct std::hash<keystone_component::ComponentType> {
    std::size_t operator()(const keystone_component::ComponentType& type) const noexcept {
        return type.hash();
    }
};

template<>
struct std::hash<keystone_component::InstanceHandle> {
    std::size_t operator()(const keystone_component::InstanceHandle& handle) const noexcept {
        return handle.hash();
    }
};
