#pragma once

#include "ecs/Entity.hpp"
#include "ecs/EntityManager.hpp"

#include <algorithm>
#include <memory>
#include <string>
#include <vector>

namespace skyraid {

/// Base class for all per-tick systems
class System {
public:
    explicit System(const std::string& name, int priority = 0)
        : m_name(name), m_priority(priority) {}
    virtual ~System() = default;

    // Non-copyable
    System(const System&) = delete;
    System& operator=(const System&) = delete;

    /// Called once when the system is added to a scheduler
    virtual void init() {}

    /// Which entities this system wants to see (default: all)
    virtual bool filter(const Entity& /*entity*/) const { return true; }

    /// Process one tick, deltaTimeMs in milliseconds
    virtual void update(const std::vector<Entity*>& entities, float deltaTimeMs) = 0;

    /// Called when the system is removed or the scheduler shuts down
    virtual void shutdown() {}

    const std::string& getName() const { return m_name; }

    /// Execution priority (lower = earlier)
    int getPriority() const { return m_priority; }

    void setEnabled(bool enabled) { m_enabled = enabled; }
    bool isEnabled() const { return m_enabled; }

private:
    std::string m_name;
    int m_priority = 0;
    bool m_enabled = true;
};

/// Runs registered systems in priority order against an entity manager
class SystemScheduler {
public:
    SystemScheduler() = default;
    ~SystemScheduler() { shutdown(); }

    // Non-copyable
    SystemScheduler(const SystemScheduler&) = delete;
    SystemScheduler& operator=(const SystemScheduler&) = delete;

    /// Construct and register a system
    template<typename T, typename... Args>
    T* addSystem(Args&&... args) {
        auto system = std::make_unique<T>(std::forward<Args>(args)...);
        T* ptr = system.get();
        addSystem(std::move(system));
        return ptr;
    }

    /// Register an existing system instance
    void addSystem(std::unique_ptr<System> system) {
        system->init();
        m_systems.push_back(std::move(system));
        // Stable: equal priorities keep registration order
        std::stable_sort(m_systems.begin(), m_systems.end(),
            [](const auto& a, const auto& b) {
                return a->getPriority() < b->getPriority();
            });
    }

    /// Get a system by type
    template<typename T>
    T* getSystem() {
        for (auto& system : m_systems) {
            if (T* typed = dynamic_cast<T*>(system.get())) {
                return typed;
            }
        }
        return nullptr;
    }

    /// Get a system by name
    System* getSystem(const std::string& name) {
        for (auto& system : m_systems) {
            if (system->getName() == name) {
                return system.get();
            }
        }
        return nullptr;
    }

    /// Remove a system by name
    bool removeSystem(const std::string& name) {
        auto it = std::find_if(m_systems.begin(), m_systems.end(),
            [&name](const auto& sys) { return sys->getName() == name; });
        if (it == m_systems.end()) {
            return false;
        }
        (*it)->shutdown();
        m_systems.erase(it);
        return true;
    }

    /// Run every enabled system on the manager's active entities
    void update(EntityManager& manager, float deltaTimeMs) {
        update(manager.getAllEntities(), deltaTimeMs);
    }

    /// Run every enabled system on an explicit entity list
    void update(const std::vector<Entity*>& entities, float deltaTimeMs) {
        for (auto& system : m_systems) {
            if (!system->isEnabled()) {
                continue;
            }
            std::vector<Entity*> matching;
            matching.reserve(entities.size());
            for (Entity* entity : entities) {
                if (entity && entity->isActive() && system->filter(*entity)) {
                    matching.push_back(entity);
                }
            }
            system->update(matching, deltaTimeMs);
        }
    }

    /// Shutdown all systems
    void shutdown() {
        for (auto& system : m_systems) {
            system->shutdown();
        }
        m_systems.clear();
    }

    size_t getSystemCount() const { return m_systems.size(); }

    /// Enable/disable a system by name
    void setSystemEnabled(const std::string& name, bool enabled) {
        if (System* sys = getSystem(name)) {
            sys->setEnabled(enabled);
        }
    }

private:
    std::vector<std::unique_ptr<System>> m_systems;
};

} // namespace skyraid
