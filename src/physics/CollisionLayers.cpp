#include "physics/CollisionLayers.hpp"
#include "engine/Log.hpp"

#include <map>

namespace skyraid {

CollisionLayerRegistry::CollisionLayerRegistry() {
    registerLayer("player",     0);   // CollisionLayer::Player
    registerLayer("enemy",      1);   // CollisionLayer::Enemy
    registerLayer("projectile", 2);   // CollisionLayer::Projectile
    registerLayer("obstacle",   3);   // CollisionLayer::Obstacle
    registerLayer("powerup",    4);   // CollisionLayer::PowerUp
    registerLayer("boundary",   5);   // CollisionLayer::Boundary
}

bool CollisionLayerRegistry::registerLayer(const std::string& name, int bit) {
    if (bit < 0 || bit > 31) {
        LOG_WARN("CollisionLayerRegistry: bit {} out of range for '{}'", bit, name);
        return false;
    }
    if (name == "all" || name == "none") {
        LOG_WARN("CollisionLayerRegistry: '{}' is reserved", name);
        return false;
    }
    m_nameToBit[name] = bit;
    return true;
}

size_t CollisionLayerRegistry::loadFromJson(const nlohmann::json& layers) {
    if (!layers.is_object()) {
        LOG_WARN("CollisionLayerRegistry: layer table must be an object");
        return 0;
    }

    size_t registered = 0;
    for (auto it = layers.begin(); it != layers.end(); ++it) {
        if (!it->is_number_integer()) {
            LOG_WARN("CollisionLayerRegistry: bit for '{}' is not an integer", it.key());
            continue;
        }
        if (registerLayer(it.key(), it->get<int>())) {
            ++registered;
        }
    }
    return registered;
}

uint32_t CollisionLayerRegistry::getLayerBit(const std::string& name) const {
    auto it = m_nameToBit.find(name);
    if (it == m_nameToBit.end()) {
        LOG_WARN("CollisionLayerRegistry: unknown layer '{}'", name);
        return 0;
    }
    return static_cast<uint32_t>(1) << it->second;
}

uint32_t CollisionLayerRegistry::getMask(const std::vector<std::string>& names) const {
    uint32_t mask = 0;
    for (const auto& name : names) {
        mask |= getLayerBit(name);
    }
    return mask;
}

uint32_t CollisionLayerRegistry::resolve(const nlohmann::json& value) const {
    if (value.is_number_unsigned() || value.is_number_integer()) {
        return value.get<uint32_t>();
    }
    if (value.is_string()) {
        const auto& name = value.get_ref<const std::string&>();
        if (name == "all") return CollisionLayer::All;
        if (name == "none") return CollisionLayer::None;
        return getLayerBit(name);
    }
    if (value.is_array()) {
        uint32_t mask = 0;
        for (const auto& entry : value) {
            mask |= resolve(entry);
        }
        return mask;
    }
    LOG_WARN("CollisionLayerRegistry: cannot resolve layer value {}", value.dump());
    return 0;
}

bool CollisionLayerRegistry::hasLayer(const std::string& name) const {
    return m_nameToBit.find(name) != m_nameToBit.end();
}

int CollisionLayerRegistry::getBitPosition(const std::string& name) const {
    auto it = m_nameToBit.find(name);
    return it != m_nameToBit.end() ? it->second : -1;
}

std::vector<std::string> CollisionLayerRegistry::describe(uint32_t bits) const {
    std::map<int, std::string> byBit;
    for (const auto& [name, bit] : m_nameToBit) {
        if (bits & (static_cast<uint32_t>(1) << bit)) {
            // Several names may share a bit; keep the alphabetically first
            auto it = byBit.find(bit);
            if (it == byBit.end() || name < it->second) {
                byBit[bit] = name;
            }
        }
    }

    std::vector<std::string> names;
    names.reserve(byBit.size());
    for (auto& [bit, name] : byBit) {
        names.push_back(std::move(name));
    }
    return names;
}

void CollisionLayerRegistry::setLayer(Collider& collider, const std::string& name) const {
    collider.setLayer(getLayerBit(name));
}

void CollisionLayerRegistry::setMask(Collider& collider, const std::vector<std::string>& names) const {
    collider.setMask(getMask(names));
}

void CollisionLayerRegistry::addMask(Collider& collider, const std::string& name) const {
    collider.setMask(collider.getMask() | getLayerBit(name));
}

void CollisionLayerRegistry::removeMask(Collider& collider, const std::string& name) const {
    collider.setMask(collider.getMask() & ~getLayerBit(name));
}

} // namespace skyraid
