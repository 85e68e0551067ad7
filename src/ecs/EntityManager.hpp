#pragma once

#include "ecs/Entity.hpp"

#include <memory>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace skyraid {

/// Owns every entity of a scene and hands out active ones in creation order.
///
/// Removal is deferred: removeEntity() destroys the entity immediately but the
/// object stays addressable until cleanup(), normally called at end of frame,
/// so pointers captured earlier in the tick remain valid.
class EntityManager {
public:
    EntityManager() = default;
    ~EntityManager() = default;

    EntityManager(const EntityManager&) = delete;
    EntityManager& operator=(const EntityManager&) = delete;

    /// Create an entity. Returns nullptr (with a warning) if the id is taken.
    Entity* createEntity(const std::string& id = "");

    Entity* getEntity(const std::string& id) const;
    bool hasEntity(const std::string& id) const { return m_index.find(id) != m_index.end(); }

    /// Active entities in creation order
    std::vector<Entity*> getAllEntities() const;

    std::vector<Entity*> getEntitiesWithComponent(ComponentType type) const;
    std::vector<Entity*> getEntitiesWithComponents(const std::vector<ComponentType>& types) const;

    /// Destroy an entity and schedule it for cleanup. Returns false if unknown.
    bool removeEntity(const std::string& id);

    void markForRemoval(Entity& entity);

    /// Update every active entity
    void update(float deltaTimeMs);

    /// Drop entities scheduled for removal. Returns the ids that were dropped.
    std::vector<std::string> cleanup();

    size_t getTotalEntityCount() const { return m_entities.size(); }
    size_t getActiveEntityCount() const;
    size_t getPendingRemovalCount() const { return m_toRemove.size(); }

    /// Destroy and drop everything
    void clear();

private:
    std::vector<std::unique_ptr<Entity>> m_entities;
    std::unordered_map<std::string, Entity*> m_index;
    std::vector<std::string> m_toRemove;
    std::unordered_set<std::string> m_toRemoveSet;
};

} // namespace skyraid
