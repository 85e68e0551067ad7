#include <gtest/gtest.h>
#include "engine/Config.hpp"

#include <cstdio>
#include <filesystem>
#include <fstream>

using namespace skyraid;

namespace {

const char* kSampleConfig = R"({
    "log": {"level": "warn", "file": "skyraid.log"},
    "simulation": {"tick_ms": 20, "ticks": 240},
    "collision": {"debug_render": true, "layers": {"shield": 6, "mine": 7}},
    "gameplay": {"contact_damage": 12.5, "pickup_heal": 30}
})";

} // namespace

TEST(ConfigTest, ReadsNestedSimulationKeys) {
    Config cfg;
    ASSERT_TRUE(cfg.loadFromString(kSampleConfig));

    EXPECT_EQ(cfg.getString("log.level"), "warn");
    EXPECT_EQ(cfg.getString("log.file"), "skyraid.log");
    EXPECT_FLOAT_EQ(cfg.getFloat("simulation.tick_ms"), 20.0f);
    EXPECT_EQ(cfg.getInt("simulation.ticks"), 240);
    EXPECT_TRUE(cfg.getBool("collision.debug_render"));
    EXPECT_FLOAT_EQ(cfg.getFloat("gameplay.contact_damage"), 12.5f);
}

TEST(ConfigTest, RejectsMalformedDocumentAndKeepsPreviousData) {
    Config cfg;
    ASSERT_TRUE(cfg.loadFromString(kSampleConfig));

    EXPECT_FALSE(cfg.loadFromString(R"({"simulation": {"ticks": )"));
    EXPECT_EQ(cfg.getInt("simulation.ticks"), 240);
}

TEST(ConfigTest, UnreadableFileFails) {
    Config cfg;
    EXPECT_FALSE(cfg.loadFromFile("/nonexistent/skyraid.json"));
    EXPECT_FALSE(cfg.hasKey("simulation"));
}

TEST(ConfigTest, AbsentKeysUseCallerDefaults) {
    Config cfg;

    EXPECT_EQ(cfg.getString("log.level", "info"), "info");
    EXPECT_EQ(cfg.getInt("simulation.ticks", 180), 180);
    EXPECT_FLOAT_EQ(cfg.getFloat("gameplay.pickup_heal", 25.0f), 25.0f);
    EXPECT_FALSE(cfg.getBool("collision.debug_render"));
}

TEST(ConfigTest, KeyPathLookup) {
    Config cfg;
    ASSERT_TRUE(cfg.loadFromString(kSampleConfig));

    EXPECT_TRUE(cfg.hasKey("collision"));
    EXPECT_TRUE(cfg.hasKey("collision.layers.shield"));
    EXPECT_FALSE(cfg.hasKey("collision.layers.laser"));
    // Descending through a scalar finds nothing
    EXPECT_FALSE(cfg.hasKey("simulation.ticks.max"));
    EXPECT_FALSE(cfg.hasKey("audio"));
}

TEST(ConfigTest, WrongTypeUsesCallerDefault) {
    Config cfg;
    ASSERT_TRUE(cfg.loadFromString(R"({
        "simulation": {"ticks": "many", "tick_ms": [16]},
        "collision": {"debug_render": 1}
    })"));

    EXPECT_EQ(cfg.getInt("simulation.ticks", 180), 180);
    EXPECT_FLOAT_EQ(cfg.getFloat("simulation.tick_ms", 16.0f), 16.0f);
    EXPECT_TRUE(cfg.getBool("collision.debug_render", true));
    EXPECT_EQ(cfg.getString("simulation", "none"), "none");
}

TEST(ConfigTest, FractionalTickIsNotAnInt) {
    Config cfg;
    ASSERT_TRUE(cfg.loadFromString(R"({"simulation": {"tick_ms": 16.6, "ticks": 60}})"));

    EXPECT_NEAR(cfg.getFloat("simulation.tick_ms"), 16.6f, 0.001f);
    EXPECT_EQ(cfg.getInt("simulation.tick_ms", -1), -1);
    EXPECT_FLOAT_EQ(cfg.getFloat("simulation.ticks"), 60.0f);
}

// =============================================================================
// Setters
// =============================================================================

TEST(ConfigTest, SettersBuildNestedKeys) {
    Config cfg;
    cfg.setString("log.level", "debug");
    cfg.setInt("simulation.ticks", 30);
    cfg.setFloat("gameplay.contact_damage", 7.5f);
    cfg.setBool("collision.debug_render", true);

    EXPECT_EQ(cfg.getString("log.level"), "debug");
    EXPECT_EQ(cfg.getInt("simulation.ticks"), 30);
    EXPECT_FLOAT_EQ(cfg.getFloat("gameplay.contact_damage"), 7.5f);
    EXPECT_TRUE(cfg.getBool("collision.debug_render"));
    EXPECT_TRUE(cfg.hasKey("simulation"));
}

TEST(ConfigTest, SetterOverwritesScalarParent) {
    Config cfg;
    ASSERT_TRUE(cfg.loadFromString(R"({"collision": false})"));

    cfg.setBool("collision.debug_render", true);
    EXPECT_TRUE(cfg.getBool("collision.debug_render"));
    EXPECT_TRUE(cfg.section("collision")->is_object());
}

// =============================================================================
// Sections and raw access
// =============================================================================

TEST(ConfigTest, LayerSection) {
    Config cfg;
    ASSERT_TRUE(cfg.loadFromString(kSampleConfig));

    const auto* layers = cfg.section("collision.layers");
    ASSERT_NE(layers, nullptr);
    ASSERT_TRUE(layers->is_object());
    EXPECT_EQ(layers->size(), 2u);
    EXPECT_EQ(layers->at("mine").get<int>(), 7);

    EXPECT_EQ(cfg.section("scene"), nullptr);
    EXPECT_EQ(cfg.raw().at("gameplay").at("pickup_heal").get<int>(), 30);
}

// =============================================================================
// Merge
// =============================================================================

class ConfigMergeTest : public ::testing::Test {
protected:
    std::string overlayPath;

    void SetUp() override {
        overlayPath = (std::filesystem::temp_directory_path() / "skyraid_config_overlay.json").string();
    }

    void TearDown() override {
        std::remove(overlayPath.c_str());
    }

    void writeOverlay(const std::string& contents) {
        std::ofstream out(overlayPath);
        out << contents;
    }
};

TEST_F(ConfigMergeTest, MergesObjectsRecursively) {
    Config cfg;
    ASSERT_TRUE(cfg.loadFromString(R"({"simulation": {"tick_ms": 16, "ticks": 100}, "log": {"level": "info"}})"));
    writeOverlay(R"({"simulation": {"ticks": 5}})");

    ASSERT_TRUE(cfg.mergeFromFile(overlayPath));
    EXPECT_EQ(cfg.getInt("simulation.ticks"), 5);
    EXPECT_EQ(cfg.getInt("simulation.tick_ms"), 16);
    EXPECT_EQ(cfg.getString("log.level"), "info");
}

TEST_F(ConfigMergeTest, MissingOverlayLeavesDataUntouched) {
    Config cfg;
    ASSERT_TRUE(cfg.loadFromString(R"({"simulation": {"ticks": 90}})"));
    EXPECT_FALSE(cfg.mergeFromFile("/nonexistent/skyraid.local.json"));
    EXPECT_EQ(cfg.getInt("simulation.ticks"), 90);
}

TEST_F(ConfigMergeTest, InvalidOverlayLeavesDataUntouched) {
    Config cfg;
    ASSERT_TRUE(cfg.loadFromString(R"({"simulation": {"ticks": 90}})"));
    writeOverlay(R"({"simulation": {"ticks": )");

    EXPECT_FALSE(cfg.mergeFromFile(overlayPath));
    EXPECT_EQ(cfg.getInt("simulation.ticks"), 90);
}

// =============================================================================
// SimulationSettings
// =============================================================================

TEST(SimulationSettingsTest, Defaults) {
    Config cfg;
    auto settings = SimulationSettings::fromConfig(cfg);

    EXPECT_EQ(settings.logLevel, "info");
    EXPECT_TRUE(settings.logFile.empty());
    EXPECT_FLOAT_EQ(settings.tickMs, 16.0f);
    EXPECT_EQ(settings.ticks, 180);
    EXPECT_FALSE(settings.debugRender);
}

TEST(SimulationSettingsTest, ReadsConfiguredValues) {
    Config cfg;
    ASSERT_TRUE(cfg.loadFromString(R"({
        "log": {"level": "trace", "file": "sim.log"},
        "simulation": {"tick_ms": 33.3, "ticks": 12},
        "collision": {"debug_render": true}
    })"));
    auto settings = SimulationSettings::fromConfig(cfg);

    EXPECT_EQ(settings.logLevel, "trace");
    EXPECT_EQ(settings.logFile, "sim.log");
    EXPECT_NEAR(settings.tickMs, 33.3f, 0.001f);
    EXPECT_EQ(settings.ticks, 12);
    EXPECT_TRUE(settings.debugRender);
}

TEST(SimulationSettingsTest, InvalidValuesAreClamped) {
    Config cfg;
    ASSERT_TRUE(cfg.loadFromString(R"({"simulation": {"tick_ms": -5, "ticks": -1}})"));
    auto settings = SimulationSettings::fromConfig(cfg);

    EXPECT_FLOAT_EQ(settings.tickMs, 16.0f);
    EXPECT_EQ(settings.ticks, 0);
}
