#include "engine/Simulation.hpp"
#include "engine/Log.hpp"
#include "components/Collider.hpp"
#include "components/Health.hpp"
#include "components/Transform.hpp"

#include <filesystem>

namespace skyraid {

namespace {

/// Stock scene used when the configuration does not provide one
const char* kDefaultDefinitions = R"({
    "entities": [
        {
            "type": "player",
            "name": "Player",
            "velocity": [120, 0],
            "collider": { "size": [28, 28], "layer": "player",
                          "mask": ["enemy", "obstacle", "powerup", "boundary"] },
            "health": { "max": 100, "current": 60, "invulnerability": 0.5 }
        },
        {
            "type": "enemy",
            "name": "Scout",
            "velocity": [-40, 0],
            "collider": { "size": [28, 28], "layer": "enemy",
                          "mask": ["player", "projectile", "obstacle"] },
            "health": { "max": 30, "invulnerability": 0.25 }
        },
        {
            "type": "shield_gate",
            "name": "Shield Gate",
            "collider": { "size": [20, 60], "layer": "powerup", "mask": "player",
                          "trigger": true }
        }
    ]
})";

const char* kDefaultScene = R"([
    { "type": "player",      "id": "player", "position": [100, 100] },
    { "type": "shield_gate", "id": "gate",   "position": [180, 100] },
    { "type": "enemy",       "id": "scout",  "position": [300, 100] }
])";

} // namespace

bool Simulation::init(const std::string& configPath) {
    if (!configPath.empty() && !m_config.loadFromFile(configPath)) {
        Log::init("", "info");
        LOG_WARN("Could not load config from '{}', using defaults", configPath);
    }

    // Per-device overrides: "skyraid.json" -> "skyraid.local.json"
    if (!configPath.empty()) {
        namespace fs = std::filesystem;
        fs::path base(configPath);
        fs::path localFile = base.parent_path()
            / (base.stem().string() + ".local" + base.extension().string());
        if (fs::exists(localFile) && m_config.mergeFromFile(localFile.string())) {
            LOG_INFO("Local config merged from '{}'", localFile.string());
        }
    }

    m_settings = SimulationSettings::fromConfig(m_config);
    Log::init(m_settings.logFile, m_settings.logLevel);
    LOG_INFO("Skyraid simulation v{} starting...", kSkyraidVersion);

    if (const auto* layers = m_config.section("collision.layers")) {
        size_t count = m_layers.loadFromJson(*layers);
        LOG_INFO("Registered {} collision layer(s) from config", count);
    }

    m_contactDamage = m_config.getFloat("gameplay.contact_damage", m_contactDamage);
    m_pickupHeal = m_config.getFloat("gameplay.pickup_heal", m_pickupHeal);

    // Movement runs through EntityManager::update before the systems, so the
    // collision system sees this tick's positions
    m_collision = m_systems.addSystem<CollisionSystem>();
    m_collision->setDebugRender(m_settings.debugRender);
    m_collision->setDebugDraw(&m_debugDraw);
    m_collision->setImpactCallback([this](Vec2 position) {
        ++m_impacts;
        GAME_LOG_DEBUG("Impact at ({:.1f}, {:.1f})", position.x, position.y);
    });

    if (!loadDefinitions() || !spawnScene()) {
        LOG_ERROR("Failed to build the scene");
        return false;
    }

    LOG_INFO("Scene ready: {} entities, tick {} ms, {} ticks",
             m_entities.getActiveEntityCount(), m_settings.tickMs, m_settings.ticks);
    m_initialized = true;
    return true;
}

bool Simulation::loadDefinitions() {
    if (const auto* defs = m_config.section("entities")) {
        return m_factory.loadFromString(defs->dump());
    }
    return m_factory.loadFromString(kDefaultDefinitions);
}

bool Simulation::spawnScene() {
    nlohmann::json scene;
    if (const auto* configured = m_config.section("scene")) {
        scene = *configured;
    } else {
        scene = nlohmann::json::parse(kDefaultScene);
    }

    if (!scene.is_array()) {
        LOG_ERROR("'scene' must be an array of spawn entries");
        return false;
    }

    for (const auto& entry : scene) {
        if (!entry.is_object() || !entry.contains("type") || !entry["type"].is_string()) {
            LOG_WARN("Skipping scene entry without a type: {}", entry.dump());
            continue;
        }

        try {
            Vec2 position;
            if (auto pos = entry.find("position"); pos != entry.end()) {
                if (!pos->is_array() || pos->size() < 2) {
                    LOG_WARN("Skipping scene entry with a malformed position: {}", entry.dump());
                    continue;
                }
                position = Vec2((*pos)[0].get<float>(), (*pos)[1].get<float>());
            }

            Entity* entity = m_factory.spawn(m_entities, entry["type"].get<std::string>(), position,
                                             entry.value("id", std::string()));
            if (!entity) {
                LOG_WARN("Could not spawn scene entry: {}", entry.dump());
                continue;
            }
            wireGameplay(*entity);
        } catch (const nlohmann::json::exception& e) {
            LOG_WARN("Skipping malformed scene entry {}: {}", entry.dump(), e.what());
        }
    }
    return m_entities.getActiveEntityCount() > 0;
}

void Simulation::wireGameplay(Entity& entity) {
    auto* collider = entity.getComponent<Collider>();
    auto* health = entity.getComponent<Health>();
    const std::string id = entity.getId();

    if (health) {
        health->setDamageCallback([id](const DamageEvent& event, float remaining) {
            GAME_LOG_INFO("{} took {} damage from {} ({} left)",
                          id, event.damage, event.sourceEntityId, remaining);
        });
        // Deaths are resolved after the tick; the entity stays intact until then
        health->setDeathCallback([this, id](const std::string& source) {
            GAME_LOG_INFO("{} destroyed by {}", id, source);
            m_killed.push_back(id);
        });
    }

    if (!collider) {
        return;
    }

    if (collider->isTrigger()) {
        collider->setTriggerEnterCallback([this, id](const CollisionEvent& event) {
            GAME_LOG_INFO("{} entered {}", event.otherEntityId, id);
            Entity* other = m_entities.getEntity(event.otherEntityId);
            auto* otherHealth = other ? other->getComponent<Health>() : nullptr;
            if (otherHealth && otherHealth->isAlive()) {
                float restored = otherHealth->heal(m_pickupHeal);
                GAME_LOG_INFO("{} restored {} health to {}", id, restored, event.otherEntityId);
            }
        });
        collider->setTriggerExitCallback([id](const CollisionEvent& event) {
            GAME_LOG_INFO("{} left {}", event.otherEntityId, id);
        });
    } else if (health) {
        collider->setCollisionCallback([this, id](const CollisionEvent& event) {
            if (event.otherCollider && event.otherCollider->isTrigger()) {
                return;
            }
            Entity* self = m_entities.getEntity(id);
            auto* selfHealth = self ? self->getComponent<Health>() : nullptr;
            if (selfHealth && selfHealth->isAlive()) {
                selfHealth->takeDamage(m_contactDamage, event.otherEntityId, "contact");
            }
        });
    }
}

void Simulation::step() {
    if (!m_initialized) {
        LOG_ERROR("Simulation::step called before a successful init");
        return;
    }

    const float dt = m_settings.tickMs;

    m_entities.update(dt);
    m_systems.update(m_entities, dt);

    const auto& stats = m_collision->getStats();
    LOG_DEBUG("Tick {}: {} collidables, {} pairs tested, {} colliding ({} solid, {} trigger), "
              "{} enter / {} exit, {:.3f} ms",
              m_tick, stats.collidables, stats.pairsTested, stats.pairsColliding,
              stats.solidPairs, stats.triggerPairs, stats.triggerEnters, stats.triggerExits,
              stats.updateTimeMs);

    if (m_settings.debugRender) {
        auto commands = m_debugDraw.take();
        LOG_TRACE("Tick {}: {} debug draw command(s)", m_tick, commands.size());
    }

    resolveDeaths();
    ++m_tick;
}

void Simulation::resolveDeaths() {
    for (const auto& id : m_killed) {
        m_entities.removeEntity(id);
    }
    m_killed.clear();

    for (const auto& id : m_entities.cleanup()) {
        m_collision->forgetEntity(id);
        LOG_DEBUG("Removed entity {}", id);
    }
}

void Simulation::run() {
    if (!m_initialized) {
        LOG_ERROR("Simulation::run called before a successful init");
        return;
    }

    LOG_INFO("Running {} tick(s)", m_settings.ticks);
    for (int i = 0; i < m_settings.ticks; ++i) {
        step();
    }

    for (Entity* entity : m_entities.getAllEntities()) {
        auto* transform = entity->getComponent<Transform>();
        auto* health = entity->getComponent<Health>();
        if (transform && health) {
            GAME_LOG_INFO("{} at ({:.1f}, {:.1f}) with {}/{} health", entity->getId(),
                          transform->position.x, transform->position.y,
                          health->getCurrentHealth(), health->getMaxHealth());
        } else if (transform) {
            GAME_LOG_INFO("{} at ({:.1f}, {:.1f})", entity->getId(),
                          transform->position.x, transform->position.y);
        }
    }
    LOG_INFO("Finished after {} tick(s), {} impact(s), {} entities remaining",
             m_tick, m_impacts, m_entities.getActiveEntityCount());
}

void Simulation::shutdown() {
    LOG_INFO("Shutting down...");
    m_systems.shutdown();
    m_collision = nullptr;
    m_entities.clear();
    m_factory.clear();
    m_initialized = false;
}

} // namespace skyraid
