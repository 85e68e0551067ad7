#pragma once

#include "ecs/Component.hpp"
#include "engine/Rect.hpp"
#include "engine/Vec2.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <unordered_set>
#include <vector>

namespace skyraid {

/// Collision layer flags ("what am I")
namespace CollisionLayer {
    constexpr uint32_t None       = 0;
    constexpr uint32_t Player     = 1 << 0;
    constexpr uint32_t Enemy      = 1 << 1;
    constexpr uint32_t Projectile = 1 << 2;
    constexpr uint32_t Obstacle   = 1 << 3;
    constexpr uint32_t PowerUp    = 1 << 4;
    constexpr uint32_t Boundary   = 1 << 5;
    constexpr uint32_t All        = 0xFFFFFFFF;
}

/// Standard masks ("what can hit me") for the stock entity kinds
namespace CollisionMask {
    constexpr uint32_t Player          = CollisionLayer::Enemy | CollisionLayer::Obstacle |
                                         CollisionLayer::PowerUp | CollisionLayer::Boundary;
    constexpr uint32_t Enemy           = CollisionLayer::Player | CollisionLayer::Projectile |
                                         CollisionLayer::Obstacle;
    constexpr uint32_t PlayerProjectile = CollisionLayer::Enemy | CollisionLayer::Obstacle |
                                          CollisionLayer::Boundary;
    constexpr uint32_t EnemyProjectile = CollisionLayer::Player | CollisionLayer::Obstacle |
                                         CollisionLayer::Boundary;
    constexpr uint32_t Obstacle        = CollisionLayer::Player | CollisionLayer::Enemy |
                                         CollisionLayer::Projectile;
    constexpr uint32_t PowerUp         = CollisionLayer::Player;
    constexpr uint32_t Boundary        = CollisionLayer::Player | CollisionLayer::Projectile;
}

class Collider;

/// Passed to collider callbacks; describes the other side of the contact.
/// Built fresh for each invocation and only valid during it.
struct CollisionEvent {
    std::string otherEntityId;
    Collider* otherCollider = nullptr;   // Non-owning, never null when dispatched
    Rect intersection;                   // Zero rect for trigger enter/exit
};

using CollisionCallback = std::function<void(const CollisionEvent&)>;

/// Axis-aligned box collider, centred on the owner's position plus an offset.
///
/// Trigger colliders additionally keep the set of entity ids they currently
/// touch; the collision system rebuilds that set every tick.  Disabling the
/// collider or leaving trigger mode empties it immediately.
class Collider : public Component {
public:
    static constexpr ComponentType Type = ComponentTypes::Collider;

    Collider(float width, float height, float offsetX = 0.0f, float offsetY = 0.0f,
             uint32_t layer = 1, uint32_t mask = CollisionLayer::All);

    ComponentType type() const override { return Type; }

    /// Bounds in world space for an owner at (entityX, entityY). Not cached.
    Rect getWorldBounds(float entityX, float entityY) const;
    Rect getWorldBounds(const Vec2& entityPosition) const {
        return getWorldBounds(entityPosition.x, entityPosition.y);
    }

    /// One-directional check: does my mask accept the other layer?
    bool canCollideWith(uint32_t otherLayer) const { return (m_mask & otherLayer) != 0; }

    // Callbacks
    void setCollisionCallback(CollisionCallback callback) { m_onCollision = std::move(callback); }
    void setTriggerEnterCallback(CollisionCallback callback) { m_onTriggerEnter = std::move(callback); }
    void setTriggerExitCallback(CollisionCallback callback) { m_onTriggerExit = std::move(callback); }
    const CollisionCallback& getCollisionCallback() const { return m_onCollision; }
    const CollisionCallback& getTriggerEnterCallback() const { return m_onTriggerEnter; }
    const CollisionCallback& getTriggerExitCallback() const { return m_onTriggerExit; }

    // Trigger contacts
    void addTriggerContact(const std::string& entityId) { m_triggerContacts.insert(entityId); }
    void removeTriggerContact(const std::string& entityId) { m_triggerContacts.erase(entityId); }
    bool hasTriggerContact(const std::string& entityId) const {
        return m_triggerContacts.find(entityId) != m_triggerContacts.end();
    }
    void clearTriggerContacts() { m_triggerContacts.clear(); }
    std::vector<std::string> getTriggerContacts() const {
        return {m_triggerContacts.begin(), m_triggerContacts.end()};
    }
    const std::unordered_set<std::string>& triggerContacts() const { return m_triggerContacts; }

    // Configuration
    void setSize(float width, float height) { m_width = width; m_height = height; }
    void setOffset(float x, float y) { m_offset = Vec2(x, y); }
    void setLayer(uint32_t layer) { m_layer = layer; }
    void setMask(uint32_t mask) { m_mask = mask; }
    void setEnabled(bool enabled);
    void setTrigger(bool isTrigger);

    float getWidth() const { return m_width; }
    float getHeight() const { return m_height; }
    Vec2 getOffset() const { return m_offset; }
    uint32_t getLayer() const { return m_layer; }
    uint32_t getMask() const { return m_mask; }
    bool isEnabled() const { return m_enabled; }
    bool isTrigger() const { return m_isTrigger; }

    /// Copy of the configuration and callbacks; contacts are not copied
    std::shared_ptr<Collider> clone() const;

private:
    float m_width;
    float m_height;
    Vec2 m_offset;
    uint32_t m_layer;
    uint32_t m_mask;
    bool m_isTrigger = false;
    bool m_enabled = true;

    CollisionCallback m_onCollision;
    CollisionCallback m_onTriggerEnter;
    CollisionCallback m_onTriggerExit;

    std::unordered_set<std::string> m_triggerContacts;
};

} // namespace skyraid
