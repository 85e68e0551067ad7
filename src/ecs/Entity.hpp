#pragma once

#include "ecs/Component.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace skyraid {

/// A game object: a stable string id plus at most one component per type tag.
///
/// Components are kept in insertion order; update() visits them in that order.
/// Ownership is shared so that a system can hold a component alive for the
/// remainder of a tick even if a callback removes it from the entity.
class Entity {
public:
    /// Create an entity; an empty id generates "entity_<n>"
    explicit Entity(std::string id = {});
    ~Entity() = default;

    Entity(const Entity&) = delete;
    Entity& operator=(const Entity&) = delete;

    const std::string& getId() const { return m_id; }
    bool isActive() const { return m_active; }

    /// Attach a component. A second component with the same tag is rejected
    /// with a warning and the original is kept. Returns true when stored.
    bool addComponent(std::shared_ptr<Component> component);

    /// Construct and attach a component of type T. Returns nullptr on conflict.
    template<typename T, typename... Args>
    T* emplace(Args&&... args) {
        auto component = std::make_shared<T>(std::forward<Args>(args)...);
        T* ptr = component.get();
        return addComponent(std::move(component)) ? ptr : nullptr;
    }

    Component* getComponent(ComponentType type) const { return find(type.value()); }
    Component* getComponent(std::string_view type) const { return find(componentTypeId(type)); }

    /// Typed lookup through T::Type (nullptr when absent)
    template<typename T>
    T* getComponent() const {
        return static_cast<T*>(find(T::Type.value()));
    }

    /// Typed lookup returning shared ownership
    template<typename T>
    std::shared_ptr<T> getShared() const {
        auto it = m_index.find(T::Type.value());
        if (it == m_index.end()) {
            return nullptr;
        }
        return std::static_pointer_cast<T>(m_components[it->second]);
    }

    bool hasComponent(ComponentType type) const { return find(type.value()) != nullptr; }
    bool hasComponent(std::string_view type) const { return find(componentTypeId(type)) != nullptr; }

    template<typename T>
    bool hasComponent() const { return hasComponent(T::Type); }

    /// Tear down and evict a component. Returns whether one was removed.
    bool removeComponent(ComponentType type) { return remove(type.value()); }
    bool removeComponent(std::string_view type) { return remove(componentTypeId(type)); }

    template<typename T>
    bool removeComponent() { return removeComponent(T::Type); }

    /// Run every component's update hook in insertion order (no-op when inactive)
    void update(float deltaTimeMs);

    /// Deactivate, tear down every component and clear them. Safe to call twice.
    void destroy();

    size_t getComponentCount() const { return m_components.size(); }

    /// Tag names in insertion order
    std::vector<std::string> getComponentTypes() const;

    /// Next "entity_<n>" from the process-wide counter
    static std::string generateId();

private:
    Component* find(entt::id_type id) const;
    bool remove(entt::id_type id);
    void reindex();

    std::string m_id;
    bool m_active = true;
    std::vector<std::shared_ptr<Component>> m_components;
    std::unordered_map<entt::id_type, size_t> m_index;
};

} // namespace skyraid
