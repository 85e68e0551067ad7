#include <gtest/gtest.h>
#include "ecs/Systems.hpp"
#include "components/Transform.hpp"
#include "components/Collider.hpp"

#include <memory>
#include <string>
#include <vector>

using namespace skyraid;

namespace {

class RecordingSystem : public System {
public:
    RecordingSystem(std::string name, int priority, std::vector<std::string>* order)
        : System(std::move(name), priority), m_order(order) {}

    void init() override { initialized = true; }

    void update(const std::vector<Entity*>& entities, float deltaTimeMs) override {
        m_order->push_back(getName());
        seen = entities.size();
        lastDelta = deltaTimeMs;
    }

    void shutdown() override { ++shutdownCount; }

    bool initialized = false;
    size_t seen = 0;
    float lastDelta = 0.0f;
    int shutdownCount = 0;

private:
    std::vector<std::string>* m_order;
};

/// Only sees entities carrying a collider
class ColliderOnlySystem : public System {
public:
    ColliderOnlySystem() : System("ColliderOnly") {}

    bool filter(const Entity& entity) const override {
        return entity.hasComponent<Collider>();
    }

    void update(const std::vector<Entity*>& entities, float) override {
        ids.clear();
        for (Entity* entity : entities) {
            ids.push_back(entity->getId());
        }
    }

    std::vector<std::string> ids;
};

} // namespace

TEST(SystemSchedulerTest, AddSystemCallsInit) {
    std::vector<std::string> order;
    SystemScheduler scheduler;
    auto* system = scheduler.addSystem<RecordingSystem>("A", 0, &order);

    EXPECT_TRUE(system->initialized);
    EXPECT_EQ(scheduler.getSystemCount(), 1u);
}

TEST(SystemSchedulerTest, RunsInPriorityOrder) {
    std::vector<std::string> order;
    SystemScheduler scheduler;
    scheduler.addSystem<RecordingSystem>("late", 100, &order);
    scheduler.addSystem<RecordingSystem>("early", -5, &order);
    scheduler.addSystem<RecordingSystem>("middle", 10, &order);
    scheduler.addSystem<RecordingSystem>("middle2", 10, &order);

    EntityManager manager;
    scheduler.update(manager, 16.0f);

    std::vector<std::string> expected{"early", "middle", "middle2", "late"};
    EXPECT_EQ(order, expected);
}

TEST(SystemSchedulerTest, FilterSelectsEntities) {
    SystemScheduler scheduler;
    auto* system = scheduler.addSystem<ColliderOnlySystem>();

    EntityManager manager;
    manager.createEntity("plain")->emplace<Transform>(0.0f, 0.0f);
    manager.createEntity("boxed")->emplace<Collider>(1.0f, 1.0f);
    Entity* gone = manager.createEntity("gone");
    gone->emplace<Collider>(1.0f, 1.0f);
    manager.removeEntity("gone");

    scheduler.update(manager, 16.0f);

    ASSERT_EQ(system->ids.size(), 1u);
    EXPECT_EQ(system->ids[0], "boxed");
}

TEST(SystemSchedulerTest, DisabledSystemSkipped) {
    std::vector<std::string> order;
    SystemScheduler scheduler;
    scheduler.addSystem<RecordingSystem>("A", 0, &order);
    scheduler.addSystem<RecordingSystem>("B", 1, &order);

    scheduler.setSystemEnabled("A", false);
    EntityManager manager;
    scheduler.update(manager, 16.0f);

    EXPECT_EQ(order, std::vector<std::string>{"B"});
    EXPECT_FALSE(scheduler.getSystem("A")->isEnabled());
}

TEST(SystemSchedulerTest, LookupByTypeAndName) {
    std::vector<std::string> order;
    SystemScheduler scheduler;
    auto* recording = scheduler.addSystem<RecordingSystem>("rec", 0, &order);
    auto* colliders = scheduler.addSystem<ColliderOnlySystem>();

    EXPECT_EQ(scheduler.getSystem<RecordingSystem>(), recording);
    EXPECT_EQ(scheduler.getSystem<ColliderOnlySystem>(), colliders);
    EXPECT_EQ(scheduler.getSystem("ColliderOnly"), colliders);
    EXPECT_EQ(scheduler.getSystem("missing"), nullptr);
}

TEST(SystemSchedulerTest, RemoveSystemShutsItDown) {
    std::vector<std::string> order;
    SystemScheduler scheduler;
    scheduler.addSystem<RecordingSystem>("A", 0, &order);

    EXPECT_TRUE(scheduler.removeSystem("A"));
    EXPECT_FALSE(scheduler.removeSystem("A"));
    EXPECT_EQ(scheduler.getSystemCount(), 0u);
}

TEST(SystemSchedulerTest, UpdatePassesDelta) {
    std::vector<std::string> order;
    SystemScheduler scheduler;
    auto* system = scheduler.addSystem<RecordingSystem>("A", 0, &order);

    EntityManager manager;
    manager.createEntity("one");
    manager.createEntity("two");
    scheduler.update(manager, 33.0f);

    EXPECT_EQ(system->seen, 2u);
    EXPECT_FLOAT_EQ(system->lastDelta, 33.0f);
}

TEST(SystemSchedulerTest, ShutdownClearsSystems) {
    std::vector<std::string> order;
    SystemScheduler scheduler;
    scheduler.addSystem<RecordingSystem>("A", 0, &order);
    scheduler.shutdown();
    EXPECT_EQ(scheduler.getSystemCount(), 0u);
}
