#pragma once

#include "ecs/Component.hpp"
#include "engine/Vec2.hpp"

#include <memory>

namespace skyraid {

/// World-space placement of an entity.
/// Velocity is in units per second; rotation in radians.
class Transform : public Component {
public:
    static constexpr ComponentType Type = ComponentTypes::Transform;

    Transform() = default;
    Transform(float x, float y, float vx = 0.0f, float vy = 0.0f,
              float rotation = 0.0f, float scaleX = 1.0f, float scaleY = 1.0f)
        : position(x, y), velocity(vx, vy), rotation(rotation), scale(scaleX, scaleY) {}

    ComponentType type() const override { return Type; }

    /// Integrate position from velocity
    void update(float deltaTimeMs) override;

    void setPosition(float x, float y) { position = Vec2(x, y); }
    void setVelocity(float vx, float vy) { velocity = Vec2(vx, vy); }
    void addVelocity(float vx, float vy) { velocity += Vec2(vx, vy); }
    void setRotation(float radians) { rotation = radians; }
    void addRotation(float radians) { rotation += radians; }
    void setScale(float uniform) { scale = Vec2(uniform, uniform); }
    void setScale(float scaleX, float scaleY) { scale = Vec2(scaleX, scaleY); }

    float distanceTo(const Transform& other) const { return Vec2::distance(position, other.position); }
    float distanceSquaredTo(const Transform& other) const { return Vec2::distanceSquared(position, other.position); }

    std::shared_ptr<Transform> clone() const { return std::make_shared<Transform>(*this); }

    Vec2 position{0.0f, 0.0f};
    Vec2 velocity{0.0f, 0.0f};
    float rotation = 0.0f;
    Vec2 scale{1.0f, 1.0f};
};

} // namespace skyraid
