#include "components/Health.hpp"

#include <algorithm>

namespace skyraid {

Health::Health(float maxHealth, std::optional<float> currentHealth,
               bool invulnerable, float invulnerabilityDuration)
    : m_maxHealth(std::max(1.0f, maxHealth))
    , m_currentHealth(0.0f)
    , m_invulnerable(invulnerable)
    , m_invulnerabilityDuration(std::max(0.0f, invulnerabilityDuration)) {
    m_currentHealth = std::clamp(currentHealth.value_or(m_maxHealth), 0.0f, m_maxHealth);
}

void Health::update(float deltaTimeMs) {
    if (m_invulnerabilityTimer > 0.0f) {
        m_invulnerabilityTimer -= deltaTimeMs / 1000.0f;
        if (m_invulnerabilityTimer < 0.0f) {
            m_invulnerabilityTimer = 0.0f;
        }
    }
}

bool Health::takeDamage(float damage, const std::string& sourceEntityId,
                        const std::string& damageType) {
    if (isInvulnerable() || m_currentHealth <= 0.0f) {
        return false;
    }

    float actualDamage = std::max(0.0f, damage);
    float previousHealth = m_currentHealth;
    m_currentHealth = std::max(0.0f, m_currentHealth - actualDamage);

    if (m_invulnerabilityDuration > 0.0f && m_currentHealth > 0.0f) {
        m_invulnerabilityTimer = m_invulnerabilityDuration;
    }

    if (m_onDamage && actualDamage > 0.0f) {
        m_onDamage(DamageEvent{actualDamage, sourceEntityId, damageType}, m_currentHealth);
    }

    bool killed = previousHealth > 0.0f && m_currentHealth <= 0.0f;
    if (killed && m_onDeath) {
        m_onDeath(sourceEntityId.empty() ? "unknown" : sourceEntityId);
    }
    return killed;
}

float Health::heal(float amount) {
    if (m_currentHealth <= 0.0f) {
        return 0.0f;
    }
    float previousHealth = m_currentHealth;
    m_currentHealth = std::min(m_maxHealth, m_currentHealth + std::max(0.0f, amount));
    return m_currentHealth - previousHealth;
}

void Health::setHealth(float health) {
    float previousHealth = m_currentHealth;
    m_currentHealth = std::clamp(health, 0.0f, m_maxHealth);
    if (previousHealth > 0.0f && m_currentHealth <= 0.0f && m_onDeath) {
        m_onDeath("direct");
    }
}

void Health::setMaxHealth(float maxHealth) {
    m_maxHealth = std::max(1.0f, maxHealth);
    m_currentHealth = std::min(m_currentHealth, m_maxHealth);
}

void Health::resetHealth() {
    m_currentHealth = m_maxHealth;
    m_invulnerabilityTimer = 0.0f;
}

} // namespace skyraid
