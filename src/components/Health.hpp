#pragma once

#include "ecs/Component.hpp"

#include <functional>
#include <optional>
#include <string>

namespace skyraid {

/// Details of a hit that actually removed health
struct DamageEvent {
    float damage = 0.0f;
    std::string sourceEntityId;
    std::string damageType;
};

/// Called with the entity id that dealt the killing blow ("direct" for setHealth)
using DeathCallback = std::function<void(const std::string& sourceEntityId)>;
using DamageCallback = std::function<void(const DamageEvent& event, float remainingHealth)>;

/// Hit points for damageable entities. Gameplay collision callbacks apply
/// damage through takeDamage(); the collision system itself never does.
class Health : public Component {
public:
    static constexpr ComponentType Type = ComponentTypes::Health;

    /// maxHealth is raised to at least 1; currentHealth defaults to max and is clamped
    explicit Health(float maxHealth, std::optional<float> currentHealth = std::nullopt,
                    bool invulnerable = false, float invulnerabilityDuration = 0.0f);

    ComponentType type() const override { return Type; }

    /// Counts down the invulnerability window
    void update(float deltaTimeMs) override;

    /// Apply damage. Returns true only when this hit took health to zero.
    bool takeDamage(float damage, const std::string& sourceEntityId = "",
                    const std::string& damageType = "");

    /// Restore health (not for dead entities). Returns the amount restored.
    float heal(float amount);

    void setHealth(float health);
    void setMaxHealth(float maxHealth);
    void resetHealth();

    float getCurrentHealth() const { return m_currentHealth; }
    float getMaxHealth() const { return m_maxHealth; }
    float getHealthPercentage() const { return m_maxHealth > 0.0f ? m_currentHealth / m_maxHealth : 0.0f; }
    bool isAlive() const { return m_currentHealth > 0.0f; }
    bool isDead() const { return m_currentHealth <= 0.0f; }

    bool isInvulnerable() const { return m_invulnerable || m_invulnerabilityTimer > 0.0f; }
    void setInvulnerable(bool invulnerable) { m_invulnerable = invulnerable; }
    float getRemainingInvulnerabilityTime() const { return m_invulnerabilityTimer; }
    float getInvulnerabilityDuration() const { return m_invulnerabilityDuration; }

    void setDeathCallback(DeathCallback callback) { m_onDeath = std::move(callback); }
    void setDamageCallback(DamageCallback callback) { m_onDamage = std::move(callback); }
    void clearDeathCallback() { m_onDeath = nullptr; }
    void clearDamageCallback() { m_onDamage = nullptr; }

private:
    float m_maxHealth;
    float m_currentHealth;
    bool m_invulnerable;
    float m_invulnerabilityDuration;     // Seconds
    float m_invulnerabilityTimer = 0.0f; // Seconds remaining

    DeathCallback m_onDeath;
    DamageCallback m_onDamage;
};

} // namespace skyraid
