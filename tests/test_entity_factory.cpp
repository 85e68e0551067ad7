#include <gtest/gtest.h>
#include "ecs/EntityFactory.hpp"
#include "components/Collider.hpp"
#include "components/Health.hpp"
#include "components/Transform.hpp"
#include "physics/CollisionLayers.hpp"

#include <cstdio>
#include <filesystem>
#include <fstream>

using namespace skyraid;

class EntityFactoryTest : public ::testing::Test {
protected:
    CollisionLayerRegistry layers;
    EntityFactory factory{&layers};
    EntityManager manager;
};

TEST_F(EntityFactoryTest, RegisterFromJson) {
    ASSERT_TRUE(factory.registerFromJson(nlohmann::json::parse(R"({
        "type": "scout",
        "name": "Scout Drone",
        "velocity": [-40, 0],
        "collider": {
            "size": [28, 24],
            "offset": {"x": 1, "y": 2},
            "layer": "enemy",
            "mask": ["player", "projectile"]
        },
        "health": {"max": 30, "current": 20, "invulnerability": 0.25}
    })")));

    ASSERT_TRUE(factory.hasDefinition("scout"));
    const EntityDefinition* def = factory.getDefinition("scout");
    ASSERT_NE(def, nullptr);
    EXPECT_EQ(def->name, "Scout Drone");
    EXPECT_EQ(*def->velocity, Vec2(-40.0f, 0.0f));
    EXPECT_EQ(*def->colliderSize, Vec2(28.0f, 24.0f));
    EXPECT_EQ(*def->colliderOffset, Vec2(1.0f, 2.0f));
    EXPECT_EQ(*def->colliderLayer, CollisionLayer::Enemy);
    EXPECT_EQ(*def->colliderMask, CollisionLayer::Player | CollisionLayer::Projectile);
    EXPECT_FALSE(def->isTrigger);
    EXPECT_TRUE(def->colliderEnabled);
    EXPECT_FLOAT_EQ(*def->maxHealth, 30.0f);
    EXPECT_FLOAT_EQ(*def->health, 20.0f);
    EXPECT_FLOAT_EQ(*def->invulnerabilityDuration, 0.25f);
}

TEST_F(EntityFactoryTest, NameDefaultsToType) {
    ASSERT_TRUE(factory.registerFromJson(nlohmann::json::parse(R"({"type": "rock"})")));
    EXPECT_EQ(factory.getDefinition("rock")->name, "rock");
}

TEST_F(EntityFactoryTest, RejectsInvalidDefinitions) {
    EXPECT_FALSE(factory.registerFromJson(nlohmann::json::parse(R"({"name": "no type"})")));
    EXPECT_FALSE(factory.registerFromJson(nlohmann::json::parse(R"({"type": 5})")));
    EXPECT_FALSE(factory.registerFromJson(nlohmann::json::parse(R"({"type": "x", "collider": {"trigger": true}})")));
    EXPECT_FALSE(factory.registerFromJson(nlohmann::json::parse(R"({"type": "y", "health": "lots"})")));
    EXPECT_FALSE(factory.registerFromJson(nlohmann::json::array()));
    EXPECT_TRUE(factory.getDefinitionTypes().empty());
}

TEST_F(EntityFactoryTest, LoadFromStringFormats) {
    EXPECT_TRUE(factory.loadFromString(R"([{"type": "a"}, {"type": "b"}])"));
    EXPECT_TRUE(factory.loadFromString(R"({"entities": [{"type": "c"}]})"));
    EXPECT_TRUE(factory.loadFromString(R"({"type": "d"})"));
    EXPECT_FALSE(factory.loadFromString("{not json"));

    std::vector<std::string> expected{"a", "b", "c", "d"};
    EXPECT_EQ(factory.getDefinitionTypes(), expected);
}

TEST_F(EntityFactoryTest, LoadFromStringReportsBadEntries) {
    EXPECT_FALSE(factory.loadFromString(R"([{"type": "good"}, {"oops": true}])"));
    EXPECT_TRUE(factory.hasDefinition("good"));
}

TEST_F(EntityFactoryTest, LoadFromFile) {
    std::string path = (std::filesystem::temp_directory_path() / "skyraid_entities.json").string();
    {
        std::ofstream out(path);
        out << R"({"entities": [{"type": "mine", "collider": {"size": [8, 8], "layer": "obstacle"}}]})";
    }

    EXPECT_TRUE(factory.loadFromFile(path));
    EXPECT_TRUE(factory.hasDefinition("mine"));
    std::remove(path.c_str());

    EXPECT_FALSE(factory.loadFromFile("/nonexistent/entities.json"));
}

TEST_F(EntityFactoryTest, SpawnBuildsComponents) {
    ASSERT_TRUE(factory.loadFromString(R"({
        "type": "player",
        "velocity": [120, 0],
        "collider": {"size": [28, 28], "layer": "player", "mask": "all"},
        "health": 100
    })"));

    Entity* entity = factory.spawn(manager, "player", Vec2(100.0f, 50.0f), "hero");
    ASSERT_NE(entity, nullptr);
    EXPECT_EQ(entity->getId(), "hero");
    EXPECT_EQ(manager.getEntity("hero"), entity);

    auto* transform = entity->getComponent<Transform>();
    ASSERT_NE(transform, nullptr);
    EXPECT_EQ(transform->position, Vec2(100.0f, 50.0f));
    EXPECT_EQ(transform->velocity, Vec2(120.0f, 0.0f));

    auto* collider = entity->getComponent<Collider>();
    ASSERT_NE(collider, nullptr);
    EXPECT_FLOAT_EQ(collider->getWidth(), 28.0f);
    EXPECT_EQ(collider->getLayer(), CollisionLayer::Player);
    EXPECT_EQ(collider->getMask(), CollisionLayer::All);
    EXPECT_FALSE(collider->isTrigger());

    auto* health = entity->getComponent<Health>();
    ASSERT_NE(health, nullptr);
    EXPECT_FLOAT_EQ(health->getMaxHealth(), 100.0f);
    EXPECT_FLOAT_EQ(health->getCurrentHealth(), 100.0f);
}

TEST_F(EntityFactoryTest, SpawnTriggerAndDisabledCollider) {
    ASSERT_TRUE(factory.loadFromString(R"([
        {"type": "gate", "collider": {"size": [20, 60], "layer": "powerup", "mask": "player", "trigger": true}},
        {"type": "dormant", "collider": {"size": [4, 4], "enabled": false}}
    ])"));

    Entity* gate = factory.spawn(manager, "gate", Vec2());
    ASSERT_NE(gate, nullptr);
    EXPECT_TRUE(gate->getComponent<Collider>()->isTrigger());
    EXPECT_EQ(gate->getComponent<Collider>()->getMask(), CollisionLayer::Player);
    EXPECT_FALSE(gate->hasComponent<Health>());

    Entity* dormant = factory.spawn(manager, "dormant", Vec2());
    ASSERT_NE(dormant, nullptr);
    EXPECT_FALSE(dormant->getComponent<Collider>()->isEnabled());
    EXPECT_EQ(dormant->getComponent<Collider>()->getLayer(), CollisionLayer::Player);
}

TEST_F(EntityFactoryTest, SpawnWithoutColliderHasTransformOnly) {
    ASSERT_TRUE(factory.loadFromString(R"({"type": "marker"})"));
    Entity* entity = factory.spawn(manager, "marker", Vec2(1.0f, 2.0f));
    ASSERT_NE(entity, nullptr);
    EXPECT_EQ(entity->getComponentCount(), 1u);
    EXPECT_TRUE(entity->hasComponent<Transform>());
}

TEST_F(EntityFactoryTest, SpawnUnknownTypeFails) {
    EXPECT_EQ(factory.spawn(manager, "dragon", Vec2()), nullptr);
    EXPECT_EQ(manager.getTotalEntityCount(), 0u);
}

TEST_F(EntityFactoryTest, SpawnDuplicateIdFails) {
    ASSERT_TRUE(factory.loadFromString(R"({"type": "rock"})"));
    EXPECT_NE(factory.spawn(manager, "rock", Vec2(), "r1"), nullptr);
    EXPECT_EQ(factory.spawn(manager, "rock", Vec2(), "r1"), nullptr);
}

TEST_F(EntityFactoryTest, SpawnCallback) {
    ASSERT_TRUE(factory.loadFromString(R"({"type": "boss", "health": 500})"));

    std::string seenType;
    factory.registerSpawnCallback("boss", [&](Entity& entity, const EntityDefinition& def) {
        seenType = def.type;
        entity.getComponent<Health>()->setInvulnerable(true);
    });

    Entity* boss = factory.spawn(manager, "boss", Vec2());
    ASSERT_NE(boss, nullptr);
    EXPECT_EQ(seenType, "boss");
    EXPECT_TRUE(boss->getComponent<Health>()->isInvulnerable());
}

TEST_F(EntityFactoryTest, CustomLayerNames) {
    layers.registerLayer("shield", 6);
    ASSERT_TRUE(factory.loadFromString(R"({"type": "bubble", "collider": {"size": [4, 4], "layer": "shield", "mask": 3}})"));

    const EntityDefinition* def = factory.getDefinition("bubble");
    EXPECT_EQ(*def->colliderLayer, 1u << 6);
    EXPECT_EQ(*def->colliderMask, 3u);
}

TEST(EntityFactoryNoLayersTest, OnlyNumericLayersWithoutRegistry) {
    EntityFactory factory;
    ASSERT_TRUE(factory.loadFromString(R"({"type": "a", "collider": {"size": [4, 4], "layer": 2, "mask": "enemy"}})"));

    const EntityDefinition* def = factory.getDefinition("a");
    EXPECT_EQ(*def->colliderLayer, 2u);
    EXPECT_EQ(*def->colliderMask, 0u);
}

TEST_F(EntityFactoryTest, Clear) {
    ASSERT_TRUE(factory.loadFromString(R"({"type": "a"})"));
    factory.clear();
    EXPECT_FALSE(factory.hasDefinition("a"));
    EXPECT_EQ(factory.getDefinition("a"), nullptr);
}
