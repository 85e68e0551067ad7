#include "ecs/EntityFactory.hpp"
#include "components/Collider.hpp"
#include "components/Health.hpp"
#include "components/Transform.hpp"
#include "physics/CollisionLayers.hpp"
#include "engine/Log.hpp"

#include <algorithm>
#include <fstream>

namespace skyraid {

namespace {

/// [x, y] or {"x": .., "y": ..}; anything else reads as zero
Vec2 readVec2(const nlohmann::json& json) {
    if (json.is_array() && json.size() >= 2) {
        return Vec2(json[0].get<float>(), json[1].get<float>());
    }
    if (json.is_object()) {
        return Vec2(json.value("x", 0.0f), json.value("y", 0.0f));
    }
    return Vec2();
}

} // namespace

bool EntityFactory::readCollider(const nlohmann::json& json, EntityDefinition& def) const {
    auto size = json.find("size");
    if (size == json.end()) {
        LOG_ERROR("EntityFactory: '{}' collider has no size", def.type);
        return false;
    }
    def.colliderSize = readVec2(*size);

    if (auto offset = json.find("offset"); offset != json.end()) {
        def.colliderOffset = readVec2(*offset);
    }
    if (auto layer = json.find("layer"); layer != json.end()) {
        def.colliderLayer = resolveLayerValue(*layer);
    }
    if (auto mask = json.find("mask"); mask != json.end()) {
        def.colliderMask = resolveLayerValue(*mask);
    }
    def.isTrigger = json.value("trigger", false);
    def.colliderEnabled = json.value("enabled", true);
    return true;
}

bool EntityFactory::readHealth(const nlohmann::json& json, EntityDefinition& def) const {
    if (json.is_number()) {
        def.maxHealth = json.get<float>();
        def.health = def.maxHealth;
        return true;
    }
    if (!json.is_object()) {
        LOG_ERROR("EntityFactory: '{}' health must be a number or an object", def.type);
        return false;
    }

    def.maxHealth = json.value("max", 100.0f);
    def.health = json.value("current", *def.maxHealth);
    def.invulnerable = json.value("invulnerable", false);
    if (auto window = json.find("invulnerability"); window != json.end()) {
        def.invulnerabilityDuration = window->get<float>();
    }
    return true;
}

bool EntityFactory::registerFromJson(const nlohmann::json& json) {
    if (!json.is_object() || !json.contains("type")) {
        LOG_ERROR("EntityFactory: definition without a 'type'");
        return false;
    }

    try {
        EntityDefinition def;
        def.type = json.at("type").get<std::string>();
        def.name = json.value("name", def.type);

        if (auto velocity = json.find("velocity"); velocity != json.end()) {
            def.velocity = readVec2(*velocity);
        }
        if (auto collider = json.find("collider"); collider != json.end() && !readCollider(*collider, def)) {
            return false;
        }
        if (auto health = json.find("health"); health != json.end() && !readHealth(*health, def)) {
            return false;
        }

        registerDefinition(def);
        LOG_DEBUG("EntityFactory: registered '{}'", def.type);
        return true;
    } catch (const nlohmann::json::exception& e) {
        LOG_ERROR("EntityFactory: bad definition {}: {}", json.dump(), e.what());
        return false;
    }
}

bool EntityFactory::registerDocument(const nlohmann::json& json, const std::string& source) {
    if (!json.is_array() && !(json.is_object() && json.contains("entities"))) {
        return registerFromJson(json);
    }

    const nlohmann::json& list = json.is_array() ? json : json.at("entities");
    if (!list.is_array()) {
        LOG_ERROR("EntityFactory: 'entities' in {} is not an array", source);
        return false;
    }

    size_t failed = 0;
    for (const auto& entry : list) {
        if (!registerFromJson(entry)) {
            ++failed;
        }
    }
    if (failed > 0) {
        LOG_WARN("EntityFactory: {} of {} definition(s) in {} rejected", failed, list.size(), source);
    }
    return failed == 0;
}

bool EntityFactory::loadFromFile(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        LOG_ERROR("EntityFactory: cannot open '{}'", path);
        return false;
    }

    nlohmann::json doc;
    try {
        in >> doc;
    } catch (const nlohmann::json::parse_error& e) {
        LOG_ERROR("EntityFactory: '{}' is not valid JSON: {}", path, e.what());
        return false;
    }

    bool ok = registerDocument(doc, path);
    LOG_INFO("EntityFactory: loaded definitions from '{}'", path);
    return ok;
}

bool EntityFactory::loadFromString(const std::string& jsonStr) {
    nlohmann::json doc;
    try {
        doc = nlohmann::json::parse(jsonStr);
    } catch (const nlohmann::json::parse_error& e) {
        LOG_ERROR("EntityFactory: inline definitions are not valid JSON: {}", e.what());
        return false;
    }
    return registerDocument(doc, "inline document");
}

const EntityDefinition* EntityFactory::getDefinition(const std::string& type) const {
    auto found = m_definitions.find(type);
    return found == m_definitions.end() ? nullptr : &found->second;
}

std::vector<std::string> EntityFactory::getDefinitionTypes() const {
    std::vector<std::string> types;
    types.reserve(m_definitions.size());
    for (const auto& entry : m_definitions) {
        types.push_back(entry.first);
    }
    std::sort(types.begin(), types.end());
    return types;
}

Entity* EntityFactory::spawn(EntityManager& manager, const std::string& type, Vec2 position,
                             const std::string& id) {
    const EntityDefinition* def = getDefinition(type);
    if (!def) {
        LOG_WARN("EntityFactory: unknown type '{}'", type);
        return nullptr;
    }

    Entity* entity = manager.createEntity(id);
    if (!entity) {
        return nullptr;
    }
    attachComponents(*entity, position, *def);

    if (auto hook = m_spawnCallbacks.find(type); hook != m_spawnCallbacks.end()) {
        hook->second(*entity, *def);
    }

    LOG_DEBUG("EntityFactory: spawned {} '{}' at ({}, {})", type, entity->getId(), position.x, position.y);
    return entity;
}

void EntityFactory::attachComponents(Entity& entity, Vec2 position, const EntityDefinition& def) const {
    const Vec2 velocity = def.velocity.value_or(Vec2());
    entity.emplace<Transform>(position.x, position.y, velocity.x, velocity.y);

    if (def.colliderSize) {
        const Vec2 offset = def.colliderOffset.value_or(Vec2());
        Collider* collider = entity.emplace<Collider>(
            def.colliderSize->x, def.colliderSize->y, offset.x, offset.y,
            def.colliderLayer.value_or(CollisionLayer::Player),
            def.colliderMask.value_or(CollisionLayer::All));
        if (collider) {
            collider->setTrigger(def.isTrigger);
            collider->setEnabled(def.colliderEnabled);
        }
    }

    if (def.health || def.maxHealth) {
        const float maxHealth = def.maxHealth.value_or(100.0f);
        entity.emplace<Health>(maxHealth, def.health.value_or(maxHealth), def.invulnerable,
                               def.invulnerabilityDuration.value_or(0.0f));
    }
}

uint32_t EntityFactory::resolveLayerValue(const nlohmann::json& value) const {
    if (m_layers) {
        return m_layers->resolve(value);
    }
    if (value.is_number_integer()) {
        return value.get<uint32_t>();
    }
    LOG_WARN("EntityFactory: no layer registry to resolve {}", value.dump());
    return 0;
}

} // namespace skyraid
