#include "physics/CollisionSystem.hpp"
#include "engine/Log.hpp"

#include <algorithm>
#include <chrono>

namespace skyraid {

namespace {

constexpr float kDebugOutlineThickness = 2.0f;
constexpr float kDebugCenterRadius = 3.0f;

/// Invoke a collider callback through a copy, so a callback that replaces
/// itself does not destroy the function object it is running in
void dispatch(const CollisionCallback& callback, const CollisionEvent& event) {
    if (callback) {
        CollisionCallback invoke = callback;
        invoke(event);
    }
}

} // namespace

bool CollisionSystem::filter(const Entity& entity) const {
    return entity.isActive() &&
           entity.hasComponent<Transform>() &&
           entity.hasComponent<Collider>();
}

void CollisionSystem::update(const std::vector<Entity*>& entities, float /*deltaTimeMs*/) {
    auto startTime = std::chrono::steady_clock::now();
    m_stats = Stats{};

    std::vector<Collidable> collidables = gatherCollidables(entities);
    m_stats.collidables = collidables.size();

    // Trigger contacts are rebuilt from scratch every tick
    clearTriggerContacts(collidables);

    std::vector<CollisionPair> pairs = findCollisionPairs(collidables);
    processCollisions(collidables, pairs);
    processTriggerEvents(collidables);

    if (m_debugRender && m_debugDraw) {
        renderDebug(collidables);
    }

    auto endTime = std::chrono::steady_clock::now();
    m_stats.updateTimeMs = std::chrono::duration<float, std::milli>(endTime - startTime).count();
}

std::vector<CollisionSystem::Collidable> CollisionSystem::gatherCollidables(
    const std::vector<Entity*>& entities) const {
    std::vector<Collidable> collidables;
    collidables.reserve(entities.size());

    for (Entity* entity : entities) {
        if (!entity || !filter(*entity)) {
            continue;
        }
        Collidable collidable;
        collidable.entity = entity;
        collidable.transform = entity->getShared<Transform>();
        collidable.collider = entity->getShared<Collider>();
        collidables.push_back(std::move(collidable));
    }
    return collidables;
}

void CollisionSystem::clearTriggerContacts(const std::vector<Collidable>& collidables) {
    for (const auto& collidable : collidables) {
        if (collidable.collider->isTrigger()) {
            collidable.collider->clearTriggerContacts();
        }
    }
}

std::vector<CollisionSystem::CollisionPair> CollisionSystem::findCollisionPairs(
    const std::vector<Collidable>& collidables) {
    std::vector<CollisionPair> pairs;

    // Brute-force O(n^2); the enumeration order defines the callback order
    for (size_t i = 0; i < collidables.size(); ++i) {
        for (size_t j = i + 1; j < collidables.size(); ++j) {
            const Collider& colliderA = *collidables[i].collider;
            const Collider& colliderB = *collidables[j].collider;

            if (!colliderA.isEnabled() || !colliderB.isEnabled()) {
                continue;
            }

            // Either side's mask is enough to authorise the pair
            if (!colliderA.canCollideWith(colliderB.getLayer()) &&
                !colliderB.canCollideWith(colliderA.getLayer())) {
                continue;
            }

            ++m_stats.pairsTested;

            Rect boundsA = worldBounds(collidables[i]);
            Rect boundsB = worldBounds(collidables[j]);
            if (!boundsA.intersects(boundsB)) {
                continue;
            }

            pairs.push_back({i, j, Rect::intersection(boundsA, boundsB)});
        }
    }

    m_stats.pairsColliding = pairs.size();
    return pairs;
}

void CollisionSystem::processCollisions(const std::vector<Collidable>& collidables,
                                        const std::vector<CollisionPair>& pairs) {
    for (const auto& pair : pairs) {
        const Collidable& a = collidables[pair.a];
        const Collidable& b = collidables[pair.b];

        // An earlier callback this tick may have destroyed or stripped either side
        if (!isAttached(a) || !isAttached(b)) {
            LOG_TRACE("CollisionSystem: skipping stale pair {} / {}",
                      a.entity->getId(), b.entity->getId());
            continue;
        }

        if (a.collider->isTrigger() || b.collider->isTrigger()) {
            ++m_stats.triggerPairs;
            handleTriggerCollision(a, b, pair.intersection);
        } else {
            ++m_stats.solidPairs;
            handleSolidCollision(a, b, pair.intersection);
        }
    }
}

void CollisionSystem::handleTriggerCollision(const Collidable& a, const Collidable& b,
                                             const Rect& intersection) {
    Collider& colliderA = *a.collider;
    Collider& colliderB = *b.collider;

    if (colliderA.isTrigger()) {
        colliderA.addTriggerContact(b.entity->getId());
    }
    if (colliderB.isTrigger()) {
        colliderB.addTriggerContact(a.entity->getId());
    }

    // Only trigger sides are told; a solid partner gets no callback
    if (colliderA.isTrigger()) {
        dispatch(colliderA.getCollisionCallback(),
                 CollisionEvent{b.entity->getId(), &colliderB, intersection});
    }
    if (!isAttached(a) || !isAttached(b)) {
        return;
    }
    if (colliderB.isTrigger()) {
        dispatch(colliderB.getCollisionCallback(),
                 CollisionEvent{a.entity->getId(), &colliderA, intersection});
    }
}

void CollisionSystem::handleSolidCollision(const Collidable& a, const Collidable& b,
                                           const Rect& intersection) {
    dispatch(a.collider->getCollisionCallback(),
             CollisionEvent{b.entity->getId(), b.collider.get(), intersection});
    if (!isAttached(a) || !isAttached(b)) {
        return;
    }
    dispatch(b.collider->getCollisionCallback(),
             CollisionEvent{a.entity->getId(), a.collider.get(), intersection});

    if (m_impactCallback) {
        m_impactCallback(intersection.center());
    }
}

void CollisionSystem::processTriggerEvents(const std::vector<Collidable>& collidables) {
    std::unordered_map<std::string, size_t> indexById;
    indexById.reserve(collidables.size());
    for (size_t i = 0; i < collidables.size(); ++i) {
        indexById.emplace(collidables[i].entity->getId(), i);
    }

    auto resolve = [&indexById](const std::string& id, std::vector<size_t>& out) {
        auto it = indexById.find(id);
        if (it != indexById.end()) {
            out.push_back(it->second);
        }
    };

    for (const auto& trigger : collidables) {
        const std::string& triggerId = trigger.entity->getId();

        // Solid colliders (including ones that just left trigger mode) and
        // colliders detached mid-tick keep no memory
        if (!isAttached(trigger) || !trigger.collider->isTrigger()) {
            m_previousTriggerContacts.erase(triggerId);
            continue;
        }

        std::unordered_set<std::string> current = trigger.collider->triggerContacts();
        std::unordered_set<std::string> previous;
        auto prevIt = m_previousTriggerContacts.find(triggerId);
        if (prevIt != m_previousTriggerContacts.end()) {
            previous = std::move(prevIt->second);
        }
        m_previousTriggerContacts[triggerId] = current;

        // Only ids that resolve to an entity in this tick's list raise events;
        // events go out in entity-list order
        std::vector<size_t> entered;
        std::vector<size_t> exited;
        for (const auto& id : current) {
            if (previous.find(id) == previous.end()) {
                resolve(id, entered);
            }
        }
        for (const auto& id : previous) {
            if (current.find(id) == current.end()) {
                resolve(id, exited);
            }
        }
        std::sort(entered.begin(), entered.end());
        std::sort(exited.begin(), exited.end());

        for (size_t index : entered) {
            const Collidable& other = collidables[index];
            ++m_stats.triggerEnters;
            LOG_TRACE("CollisionSystem: {} entered trigger {}", other.entity->getId(), triggerId);
            dispatch(trigger.collider->getTriggerEnterCallback(),
                     CollisionEvent{other.entity->getId(), other.collider.get(), Rect()});
        }
        for (size_t index : exited) {
            const Collidable& other = collidables[index];
            ++m_stats.triggerExits;
            LOG_TRACE("CollisionSystem: {} left trigger {}", other.entity->getId(), triggerId);
            dispatch(trigger.collider->getTriggerExitCallback(),
                     CollisionEvent{other.entity->getId(), other.collider.get(), Rect()});
        }
    }
}

void CollisionSystem::renderDebug(const std::vector<Collidable>& collidables) {
    for (const auto& collidable : collidables) {
        if (!collidable.collider->isEnabled()) {
            continue;
        }

        Rect bounds = worldBounds(collidable);
        Color color = collidable.collider->isTrigger() ? Color::Green() : Color::Red();
        m_debugDraw->drawRectOutline(bounds, color, kDebugOutlineThickness);
        m_debugDraw->drawPoint(bounds.center(), color, kDebugCenterRadius);
    }
}

void CollisionSystem::forgetEntity(const std::string& entityId) {
    m_previousTriggerContacts.erase(entityId);
    for (auto& [triggerId, contacts] : m_previousTriggerContacts) {
        contacts.erase(entityId);
    }
}

const std::unordered_set<std::string>* CollisionSystem::getPreviousContacts(
    const std::string& entityId) const {
    auto it = m_previousTriggerContacts.find(entityId);
    return it != m_previousTriggerContacts.end() ? &it->second : nullptr;
}

bool CollisionSystem::isAttached(const Collidable& collidable) {
    const Entity& entity = *collidable.entity;
    return entity.isActive() &&
           entity.getComponent<Collider>() == collidable.collider.get() &&
           entity.getComponent<Transform>() == collidable.transform.get();
}

} // namespace skyraid
