#pragma once

#include "ecs/Systems.hpp"
#include "components/Collider.hpp"
#include "components/Transform.hpp"
#include "physics/DebugDraw.hpp"

#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace skyraid {

/// Called with the centre of the overlap after each solid/solid hit
using ImpactCallback = std::function<void(Vec2 position)>;

/// Per-tick collision detection and event dispatch.
///
/// Every tick the system takes the entities that expose both a Transform and
/// a Collider, tests every unordered pair (i < j, in list order) with a strict
/// AABB overlap, and dispatches:
///   - trigger pairs: the trigger side(s) record the other entity as a contact
///     and receive onCollision; a solid partner receives nothing
///   - solid pairs: both sides receive onCollision
/// Afterwards each trigger's contact set is diffed against what it touched on
/// the previous tick to raise onTriggerEnter / onTriggerExit.
///
/// The pair list is built completely before any callback runs.  A pair whose
/// entity was destroyed, or whose collider was detached, by an earlier callback
/// in the same tick is skipped, and so is the second half of a pair whose first
/// callback detached either side.  Exceptions thrown by callbacks are not caught.
///
/// The only state kept between ticks is the previous trigger contact map, which
/// belongs to this instance; independent simulations use independent systems.
class CollisionSystem : public System {
public:
    /// Per-tick counters, reset at the start of every update
    struct Stats {
        size_t collidables = 0;
        size_t pairsTested = 0;
        size_t pairsColliding = 0;
        size_t triggerPairs = 0;
        size_t solidPairs = 0;
        size_t triggerEnters = 0;
        size_t triggerExits = 0;
        float updateTimeMs = 0.0f;
    };

    explicit CollisionSystem(int priority = 100)
        : System("CollisionSystem", priority) {}

    /// Active entities with both a Transform and a Collider
    bool filter(const Entity& entity) const override;

    void update(const std::vector<Entity*>& entities, float deltaTimeMs) override;

    void shutdown() override { clearState(); }

    /// Queue collider outlines into the attached DebugDraw each tick
    void setDebugRender(bool enabled) { m_debugRender = enabled; }
    bool isDebugRender() const { return m_debugRender; }

    /// Target queue for debug outlines (non-owning, may be null)
    void setDebugDraw(DebugDraw* debugDraw) { m_debugDraw = debugDraw; }

    void setImpactCallback(ImpactCallback callback) { m_impactCallback = std::move(callback); }

    /// Forget all cross-tick trigger memory (scene transitions)
    void clearState() { m_previousTriggerContacts.clear(); }

    /// Forget an entity both as a trigger and as a remembered contact.
    /// No exit events are raised for it.
    void forgetEntity(const std::string& entityId);

    /// Contacts remembered for a trigger entity, or nullptr
    const std::unordered_set<std::string>* getPreviousContacts(const std::string& entityId) const;

    size_t getTrackedTriggerCount() const { return m_previousTriggerContacts.size(); }

    const Stats& getStats() const { return m_stats; }

private:
    /// Snapshot of one participating entity for the duration of a tick
    struct Collidable {
        Entity* entity = nullptr;
        std::shared_ptr<Transform> transform;
        std::shared_ptr<Collider> collider;
    };

    /// Overlapping pair, indices into the collidable list
    struct CollisionPair {
        size_t a = 0;
        size_t b = 0;
        Rect intersection;
    };

    std::vector<Collidable> gatherCollidables(const std::vector<Entity*>& entities) const;
    void clearTriggerContacts(const std::vector<Collidable>& collidables);
    std::vector<CollisionPair> findCollisionPairs(const std::vector<Collidable>& collidables);
    void processCollisions(const std::vector<Collidable>& collidables,
                           const std::vector<CollisionPair>& pairs);
    void handleTriggerCollision(const Collidable& a, const Collidable& b, const Rect& intersection);
    void handleSolidCollision(const Collidable& a, const Collidable& b, const Rect& intersection);
    void processTriggerEvents(const std::vector<Collidable>& collidables);
    void renderDebug(const std::vector<Collidable>& collidables);

    /// Still active and still carrying the snapshotted components
    static bool isAttached(const Collidable& collidable);

    static Rect worldBounds(const Collidable& collidable) {
        return collidable.collider->getWorldBounds(collidable.transform->position);
    }

    std::unordered_map<std::string, std::unordered_set<std::string>> m_previousTriggerContacts;
    bool m_debugRender = false;
    DebugDraw* m_debugDraw = nullptr;
    ImpactCallback m_impactCallback;
    Stats m_stats;
};

} // namespace skyraid
