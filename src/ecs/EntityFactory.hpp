#pragma once

#include "ecs/EntityManager.hpp"
#include "engine/Vec2.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace skyraid {

class CollisionLayerRegistry;

/// Data-driven blueprint for one kind of actor (player ship, enemy, gate...)
///
/// Every spawned entity receives a Transform.  A Collider is only attached
/// when colliderSize is set, and a Health only when health or maxHealth is.
struct EntityDefinition {
    std::string type;
    std::string name;

    std::optional<Vec2> velocity;

    std::optional<Vec2> colliderSize;
    std::optional<Vec2> colliderOffset;
    std::optional<uint32_t> colliderLayer;      // Default: Player
    std::optional<uint32_t> colliderMask;       // Default: All
    bool isTrigger = false;
    bool colliderEnabled = true;

    std::optional<float> health;
    std::optional<float> maxHealth;
    bool invulnerable = false;
    std::optional<float> invulnerabilityDuration;   // Seconds
};

/// Builds entities from EntityDefinitions registered in code or loaded from JSON.
///
/// Accepted documents are a single definition object, an array of them, or
/// an object holding the array under "entities".  Layer and mask values go
/// through the CollisionLayerRegistry, so names, name lists and raw bitmasks
/// all work.
class EntityFactory {
public:
    /// Runs after the definition's components are attached
    using SpawnCallback = std::function<void(Entity&, const EntityDefinition&)>;

    EntityFactory() = default;
    explicit EntityFactory(const CollisionLayerRegistry* layers) : m_layers(layers) {}

    void setLayerRegistry(const CollisionLayerRegistry* layers) { m_layers = layers; }

    void registerDefinition(const EntityDefinition& def) { m_definitions[def.type] = def; }
    bool registerFromJson(const nlohmann::json& json);

    bool loadFromFile(const std::string& path);
    bool loadFromString(const std::string& jsonStr);

    bool hasDefinition(const std::string& type) const { return m_definitions.count(type) != 0; }
    const EntityDefinition* getDefinition(const std::string& type) const;

    /// Sorted list of registered types
    std::vector<std::string> getDefinitionTypes() const;

    void registerSpawnCallback(const std::string& type, SpawnCallback callback) {
        m_spawnCallbacks[type] = std::move(callback);
    }

    /// Create an entity of the given type at position.  Returns nullptr for
    /// an unknown type or when the manager rejects the id.
    Entity* spawn(EntityManager& manager, const std::string& type, Vec2 position,
                  const std::string& id = "");

    void clear() {
        m_definitions.clear();
        m_spawnCallbacks.clear();
    }

private:
    bool registerDocument(const nlohmann::json& json, const std::string& source);
    bool readCollider(const nlohmann::json& json, EntityDefinition& def) const;
    bool readHealth(const nlohmann::json& json, EntityDefinition& def) const;
    void attachComponents(Entity& entity, Vec2 position, const EntityDefinition& def) const;

    /// Layer/mask value to bits; without a registry only integers are accepted
    uint32_t resolveLayerValue(const nlohmann::json& value) const;

    std::unordered_map<std::string, EntityDefinition> m_definitions;
    std::unordered_map<std::string, SpawnCallback> m_spawnCallbacks;
    const CollisionLayerRegistry* m_layers = nullptr;
};

} // namespace skyraid
