/// @file dependency_graph.cpp
/// @brief DependencyGraph implementation for keystone_component

#include <keystone/component/dependency_graph.hpp>

#include <algorithm>

namespace keystone_component {

std::vector<ComponentType> declared_dependencies(const ComponentType& type) {
    return type.declared_dependencies();
}

DependencyGraph::DependencyGraph(DependencyProvider provider)
    : m_provider(provider ? std::move(provider) : DependencyProvider(declared_dependencies))
{
}

const std::vector<ComponentType>& DependencyGraph::resolve_dependencies(const ComponentType& type) {
    auto it = m_resolved.find(type);
    if (it != m_resolved.end()) {
        return it->second;
    }

    std::vector<ComponentType> unique;
    for (const auto& dependency : m_provider(type)) {
        if (std::find(unique.begin(), unique.end(), dependency) == unique.end()) {
            unique.push_back(dependency);
        }
    }

    return m_resolved.emplace(type, std::move(unique)).first->second;
}

bool DependencyGraph::register_dependent(const ComponentType& dependency, const ComponentType& dependent) {
    auto& dependents = m_dependents[dependency];
    if (std::find(dependents.begin(), dependents.end(), dependent) != dependents.end()) {
        return false;
    }
    dependents.push_back(dependent);
    return true;
}

bool DependencyGraph::unregister_dependent(const ComponentType& dependency, const ComponentType& dependent) {
    auto it = m_dependents.find(dependency);
    if (it == m_dependents.end()) {
        return false;
    }

    auto& dependents = it->second;
    auto pos = std::find(dependents.begin(), dependents.end(), dependent);
    if (pos == dependents.end()) {
        return false;
    }

    dependents.erase(pos);
    if (dependents.empty()) {
        m_dependents.erase(it);
    }
    return true;
}

std::size_t DependencyGraph::release_dependent(const ComponentType& dependent) {
    return prune([&dependent](const ComponentType& type) { return !(type == dependent); });
}

std::size_t DependencyGraph::prune(const TypePredicate& keep) {
    std::size_t removed = 0;
    for (auto it = m_dependents.begin(); it != m_dependents.end();) {
        auto& dependents = it->second;
        auto before = dependents.size();
        dependents.erase(
            std::remove_if(dependents.begin(), dependents.end(),
                [&keep](const ComponentType& type) { return !keep(type); }),
            dependents.end());
        removed += before - dependents.size();

        if (dependents.empty()) {
            it = m_dependents.erase(it);
        } else {
            ++it;
        }
    }
    return removed;
}

std::vector<ComponentType> DependencyGraph::active_dependents_of(
    const ComponentType& type, const TypePredicate& is_active) const {
    std::vector<ComponentType> result;
    auto it = m_dependents.find(type);
    if (it == m_dependents.end()) {
        return result;
    }

    for (const auto& dependent : it->second) {
        if (is_active(dependent)) {
            result.push_back(dependent);
        }
    }
    return result;
}

std::vector<ComponentType> DependencyGraph::dependents_of(const ComponentType& type) const {
    auto it = m_dependents.find(type);
    return it != m_dependents.end() ? it->second : std::vector<ComponentType>{};
}

bool DependencyGraph::has_dependents(const ComponentType& type) const {
    return m_dependents.find(type) != m_dependents.end();
}

bool DependencyGraph::is_resolved(const ComponentType& type) const {
    return m_resolved.find(type) != m_resolved.end();
}

std::size_t DependencyGraph::edge_count() const noexcept {
    std::size_t count = 0;
    for (const auto& [type, dependents] : m_dependents) {
        count += dependents.size();
    }
    return count;
}

} // namespace keystone_component
