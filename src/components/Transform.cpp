#include "components/Transform.hpp"

namespace skyraid {

void Transform::update(float deltaTimeMs) {
    float seconds = deltaTimeMs / 1000.0f;
    position.x += velocity.x * seconds;
    position.y += velocity.y * seconds;
}

} // namespace skyraid
