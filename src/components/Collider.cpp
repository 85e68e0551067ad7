#include "components/Collider.hpp"

namespace skyraid {

Collider::Collider(float width, float height, float offsetX, float offsetY,
                   uint32_t layer, uint32_t mask)
    : m_width(width)
    , m_height(height)
    , m_offset(offsetX, offsetY)
    , m_layer(layer)
    , m_mask(mask) {}

Rect Collider::getWorldBounds(float entityX, float entityY) const {
    return Rect(
        entityX + m_offset.x - m_width * 0.5f,
        entityY + m_offset.y - m_height * 0.5f,
        m_width,
        m_height
    );
}

void Collider::setEnabled(bool enabled) {
    m_enabled = enabled;
    if (!enabled) {
        clearTriggerContacts();
    }
}

void Collider::setTrigger(bool isTrigger) {
    m_isTrigger = isTrigger;
    if (!isTrigger) {
        clearTriggerContacts();
    }
}

std::shared_ptr<Collider> Collider::clone() const {
    auto copy = std::make_shared<Collider>(m_width, m_height, m_offset.x, m_offset.y, m_layer, m_mask);
    copy->m_isTrigger = m_isTrigger;
    copy->m_enabled = m_enabled;
    copy->m_onCollision = m_onCollision;
    copy->m_onTriggerEnter = m_onTriggerEnter;
    copy->m_onTriggerExit = m_onTriggerExit;
    return copy;
}

} // namespace skyraid
