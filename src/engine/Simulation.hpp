#pragma once

#include "engine/Config.hpp"
#include "ecs/EntityManager.hpp"
#include "ecs/Systems.hpp"
#include "ecs/EntityFactory.hpp"
#include "physics/CollisionLayers.hpp"
#include "physics/CollisionSystem.hpp"
#include "physics/DebugDraw.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace skyraid {

/// Version string reported at startup
inline constexpr const char* kSkyraidVersion = "0.1.0";

/// Headless fixed-step host for the simulation core.
///
/// Loads settings, spawns a scene through the EntityFactory, wires the stock
/// gameplay reactions into collider callbacks and steps the SystemScheduler
/// a fixed number of ticks.  Nothing is rendered; debug outlines are counted
/// and logged.
class Simulation {
public:
    Simulation() = default;
    ~Simulation() = default;

    Simulation(const Simulation&) = delete;
    Simulation& operator=(const Simulation&) = delete;

    /// Load configuration (missing file means defaults), initialise logging and
    /// build the scene. Returns false when the scene cannot be built.
    bool init(const std::string& configPath = "");

    /// Run the configured number of ticks
    void run();

    /// Advance exactly one fixed tick
    void step();

    void shutdown();

    Config& getConfig() { return m_config; }
    const SimulationSettings& getSettings() const { return m_settings; }
    EntityManager& getEntityManager() { return m_entities; }
    SystemScheduler& getSystemScheduler() { return m_systems; }
    EntityFactory& getEntityFactory() { return m_factory; }
    CollisionLayerRegistry& getCollisionLayers() { return m_layers; }
    CollisionSystem* getCollisionSystem() { return m_collision; }
    DebugDraw& getDebugDraw() { return m_debugDraw; }

    uint64_t getTickCount() const { return m_tick; }
    size_t getImpactCount() const { return m_impacts; }

private:
    bool loadDefinitions();
    bool spawnScene();

    /// Attach contact damage, pickup and death handling to a spawned entity
    void wireGameplay(Entity& entity);

    /// Remove entities killed during the tick, then drop them from the manager
    void resolveDeaths();

    Config m_config;
    SimulationSettings m_settings;

    EntityManager m_entities;
    SystemScheduler m_systems;
    CollisionLayerRegistry m_layers;
    EntityFactory m_factory{&m_layers};
    DebugDraw m_debugDraw;
    CollisionSystem* m_collision = nullptr;   // Owned by m_systems

    float m_contactDamage = 10.0f;
    float m_pickupHeal = 25.0f;

    std::vector<std::string> m_killed;
    uint64_t m_tick = 0;
    size_t m_impacts = 0;
    bool m_initialized = false;
};

} // namespace skyraid
