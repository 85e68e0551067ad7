#pragma once

#include "components/Collider.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace skyraid {

/// Named collision layer registry.
///
/// Maps human-readable layer names ("player", "enemy") to bit positions in the
/// 32-bit layer/mask words.  Pre-populated with the stock layers so that the
/// names agree with the CollisionLayer constants; data files may register more.
class CollisionLayerRegistry {
public:
    CollisionLayerRegistry();

    // -----------------------------------------------------------------
    // Registration
    // -----------------------------------------------------------------

    /// Register (or re-register) a named layer at a bit position (0-31)
    bool registerLayer(const std::string& name, int bit);

    /// Register every "name": bit pair of a JSON object.
    /// Returns the number of layers registered.
    size_t loadFromJson(const nlohmann::json& layers);

    // -----------------------------------------------------------------
    // Queries
    // -----------------------------------------------------------------

    /// Single-bit mask for a name, 0 (with a warning) when unknown
    uint32_t getLayerBit(const std::string& name) const;

    /// OR of the named layers
    uint32_t getMask(const std::vector<std::string>& names) const;

    /// Resolve a JSON layer/mask value: a number, a layer name, or an array of
    /// names. The special names "all" and "none" map to every and no bit.
    uint32_t resolve(const nlohmann::json& value) const;

    bool hasLayer(const std::string& name) const;

    /// Bit position for a name, or -1
    int getBitPosition(const std::string& name) const;

    /// Names of the layers set in a bit word, in bit order
    std::vector<std::string> describe(uint32_t bits) const;

    // -----------------------------------------------------------------
    // Collider helpers
    // -----------------------------------------------------------------

    void setLayer(Collider& collider, const std::string& name) const;
    void setMask(Collider& collider, const std::vector<std::string>& names) const;
    void addMask(Collider& collider, const std::string& name) const;
    void removeMask(Collider& collider, const std::string& name) const;

private:
    std::unordered_map<std::string, int> m_nameToBit;
};

} // namespace skyraid
