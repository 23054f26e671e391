#pragma once

/// @file dependency_graph.hpp
/// @brief Declared dependencies and reverse dependent edges between component types

#include "fwd.hpp"
#include "component_type.hpp"

#include <cstddef>
#include <functional>
#include <unordered_map>
#include <vector>

namespace keystone_component {

/// Source of a type's dependency declaration
using DependencyProvider = std::function<std::vector<ComponentType>(const ComponentType&)>;

/// Predicate over component types
using TypePredicate = std::function<bool(const ComponentType&)>;

/// Default provider: the type's static `dependencies()` declaration
[[nodiscard]] std::vector<ComponentType> declared_dependencies(const ComponentType& type);

// =============================================================================
// DependencyGraph
// =============================================================================

/// Tracks forward dependencies (cached per type) and reverse dependent edges.
///
/// Edges hold plain ComponentType values; whether a dependent is alive is
/// decided by the caller at query time.
class DependencyGraph {
public:
    explicit DependencyGraph(DependencyProvider provider = declared_dependencies);

    /// Dependencies of `type`, read once through the provider and cached.
    /// Duplicates are dropped, first occurrence wins.
    const std::vector<ComponentType>& resolve_dependencies(const ComponentType& type);

    /// Record that `dependent` requires `dependency`. Returns false if already recorded.
    bool register_dependent(const ComponentType& dependency, const ComponentType& dependent);

    /// Remove one edge. Returns false if it was not present.
    bool unregister_dependent(const ComponentType& dependency, const ComponentType& dependent);

    /// Remove every edge naming `dependent`. Returns the number of edges removed.
    std::size_t release_dependent(const ComponentType& dependent);

    /// Remove every edge whose dependent fails `keep`. Returns the number removed.
    std::size_t prune(const TypePredicate& keep);

    /// Dependents of `type` for which `is_active` holds, in edge order
    [[nodiscard]] std::vector<ComponentType> active_dependents_of(
        const ComponentType& type, const TypePredicate& is_active) const;

    /// All recorded dependents of `type`, in edge order
    [[nodiscard]] std::vector<ComponentType> dependents_of(const ComponentType& type) const;

    [[nodiscard]] bool has_dependents(const ComponentType& type) const;
    [[nodiscard]] bool is_resolved(const ComponentType& type) const;
    [[nodiscard]] std::size_t resolved_count() const noexcept { return m_resolved.size(); }
    [[nodiscard]] std::size_t edge_count() const noexcept;

private:
    DependencyProvider m_provider;
    std::unordered_map<ComponentType, std::vector<ComponentType>> m_resolved;
    std::unordered_map<ComponentType, std::vector<ComponentType>> m_dependents;
};

} // namespace keystone_component
