#include "ecs/Entity.hpp"
#include "engine/Log.hpp"

#include <atomic>
#include <cstdint>

namespace skyraid {

Entity::Entity(std::string id)
    : m_id(id.empty() ? generateId() : std::move(id)) {}

bool Entity::addComponent(std::shared_ptr<Component> component) {
    if (!component) {
        LOG_WARN("Entity {}: ignoring null component", m_id);
        return false;
    }

    entt::id_type id = component->typeId();
    if (m_index.find(id) != m_index.end()) {
        LOG_WARN("Entity {} already has component of type {}", m_id, component->typeName());
        return false;
    }

    m_index.emplace(id, m_components.size());
    m_components.push_back(std::move(component));
    return true;
}

Component* Entity::find(entt::id_type id) const {
    auto it = m_index.find(id);
    return it != m_index.end() ? m_components[it->second].get() : nullptr;
}

bool Entity::remove(entt::id_type id) {
    auto it = m_index.find(id);
    if (it == m_index.end()) {
        return false;
    }

    // Keep the component alive through its own teardown
    std::shared_ptr<Component> component = m_components[it->second];
    component->destroy();

    // destroy() may have re-entered this entity, so look the slot up again
    it = m_index.find(id);
    if (it != m_index.end()) {
        m_components.erase(m_components.begin() + static_cast<std::ptrdiff_t>(it->second));
        reindex();
    }
    return true;
}

void Entity::reindex() {
    m_index.clear();
    for (size_t i = 0; i < m_components.size(); ++i) {
        m_index.emplace(m_components[i]->typeId(), i);
    }
}

void Entity::update(float deltaTimeMs) {
    if (!m_active) {
        return;
    }

    // Iterate a copy: an update hook may add or remove components
    auto components = m_components;
    for (auto& component : components) {
        component->update(deltaTimeMs);
    }
}

void Entity::destroy() {
    if (!m_active && m_components.empty()) {
        return;
    }

    m_active = false;

    auto components = m_components;
    for (auto& component : components) {
        component->destroy();
    }

    m_components.clear();
    m_index.clear();
}

std::vector<std::string> Entity::getComponentTypes() const {
    std::vector<std::string> types;
    types.reserve(m_components.size());
    for (const auto& component : m_components) {
        types.push_back(component->typeName());
    }
    return types;
}

std::string Entity::generateId() {
    static std::atomic<uint64_t> s_nextId{0};
    return "entity_" + std::to_string(++s_nextId);
}

} // namespace skyraid
