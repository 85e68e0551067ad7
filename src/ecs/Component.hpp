#pragma once

#include <entt/core/hashed_string.hpp>

#include <string>
#include <string_view>

namespace skyraid {

/// Component type tag. Compile-time hashed name; the hash keys component lookup.
using ComponentType = entt::hashed_string;

/// Hash a runtime tag name the same way ComponentType hashes its literal
inline entt::id_type componentTypeId(std::string_view name) {
    return entt::hashed_string::value(name.data(), name.size());
}

/// Well-known component tags
namespace ComponentTypes {
    inline constexpr ComponentType Transform{"transform"};
    inline constexpr ComponentType Collider{"collider"};
    inline constexpr ComponentType Health{"health"};
}

/// Base class for every attachable behaviour.
///
/// Derived classes report a stable tag through type().  update() and destroy()
/// are optional hooks: the defaults do nothing, so components that neither
/// tick nor own resources only implement type().
class Component {
public:
    virtual ~Component() = default;

    virtual ComponentType type() const = 0;

    /// Per-frame hook, deltaTimeMs in milliseconds
    virtual void update(float /*deltaTimeMs*/) {}

    /// Teardown hook, called when the component is removed or its entity destroyed
    virtual void destroy() {}

    entt::id_type typeId() const { return type().value(); }
    std::string typeName() const { return type().data(); }
};

} // namespace skyraid
