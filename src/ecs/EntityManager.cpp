#include "ecs/EntityManager.hpp"
#include "engine/Log.hpp"

#include <algorithm>

namespace skyraid {

Entity* EntityManager::createEntity(const std::string& id) {
    std::string entityId = id;
    if (entityId.empty()) {
        // Skip counter values already taken by caller-supplied ids
        do {
            entityId = Entity::generateId();
        } while (m_index.count(entityId) != 0);
    }

    auto entity = std::make_unique<Entity>(std::move(entityId));
    if (m_index.find(entity->getId()) != m_index.end()) {
        LOG_WARN("EntityManager: entity id '{}' is already in use", entity->getId());
        return nullptr;
    }

    Entity* ptr = entity.get();
    m_index.emplace(ptr->getId(), ptr);
    m_entities.push_back(std::move(entity));
    return ptr;
}

Entity* EntityManager::getEntity(const std::string& id) const {
    auto it = m_index.find(id);
    return it != m_index.end() ? it->second : nullptr;
}

std::vector<Entity*> EntityManager::getAllEntities() const {
    std::vector<Entity*> result;
    result.reserve(m_entities.size());
    for (const auto& entity : m_entities) {
        if (entity->isActive()) {
            result.push_back(entity.get());
        }
    }
    return result;
}

std::vector<Entity*> EntityManager::getEntitiesWithComponent(ComponentType type) const {
    std::vector<Entity*> result;
    for (const auto& entity : m_entities) {
        if (entity->isActive() && entity->hasComponent(type)) {
            result.push_back(entity.get());
        }
    }
    return result;
}

std::vector<Entity*> EntityManager::getEntitiesWithComponents(const std::vector<ComponentType>& types) const {
    std::vector<Entity*> result;
    for (const auto& entity : m_entities) {
        if (!entity->isActive()) continue;
        bool hasAll = std::all_of(types.begin(), types.end(),
            [&entity](const ComponentType& type) { return entity->hasComponent(type); });
        if (hasAll) {
            result.push_back(entity.get());
        }
    }
    return result;
}

bool EntityManager::removeEntity(const std::string& id) {
    Entity* entity = getEntity(id);
    if (!entity) {
        return false;
    }
    markForRemoval(*entity);
    return true;
}

void EntityManager::markForRemoval(Entity& entity) {
    entity.destroy();
    if (m_toRemoveSet.insert(entity.getId()).second) {
        m_toRemove.push_back(entity.getId());
    }
}

void EntityManager::update(float deltaTimeMs) {
    // Index loop: an update hook may create entities
    for (size_t i = 0; i < m_entities.size(); ++i) {
        Entity* entity = m_entities[i].get();
        if (entity->isActive()) {
            entity->update(deltaTimeMs);
        }
    }
}

std::vector<std::string> EntityManager::cleanup() {
    std::vector<std::string> removed;
    if (m_toRemove.empty()) {
        return removed;
    }

    for (const auto& id : m_toRemove) {
        if (m_index.erase(id) > 0) {
            removed.push_back(id);
        }
    }

    m_entities.erase(
        std::remove_if(m_entities.begin(), m_entities.end(),
            [this](const std::unique_ptr<Entity>& entity) {
                return m_toRemoveSet.count(entity->getId()) > 0;
            }),
        m_entities.end());

    m_toRemove.clear();
    m_toRemoveSet.clear();
    return removed;
}

size_t EntityManager::getActiveEntityCount() const {
    return static_cast<size_t>(std::count_if(m_entities.begin(), m_entities.end(),
        [](const std::unique_ptr<Entity>& entity) { return entity->isActive(); }));
}

void EntityManager::clear() {
    for (auto& entity : m_entities) {
        entity->destroy();
    }
    m_entities.clear();
    m_index.clear();
    m_toRemove.clear();
    m_toRemoveSet.clear();
}

} // namespace skyraid
