/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#define BOOST_TEST_MODULE SettingsManagerTests
#include <boost/test/unit_test.hpp>
#include "collisions/CollisionConfig.hpp"
#include "managers/SettingsManager.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <thread>
#include <vector>

using namespace Ironclad;

// Test fixture for setup/cleanup
struct SettingsTestFixture {
    const std::string testFile = "test_data/test_settings.json";

    SettingsTestFixture() {
        std::filesystem::create_directories("test_data");
        SettingsManager::Instance().clearAll();
    }

    ~SettingsTestFixture() {
        std::error_code ec;
        std::filesystem::remove(testFile, ec);
        SettingsManager::Instance().clearAll();
    }

    void createTestFile(const std::string& content) {
        std::ofstream file(testFile);
        file << content;
    }
};

BOOST_FIXTURE_TEST_SUITE(SettingsManagerTestSuite, SettingsTestFixture)

BOOST_AUTO_TEST_CASE(TestGetSetInt) {
    auto& settings = SettingsManager::Instance();

    BOOST_CHECK(settings.set("arena", "frames", 600));
    BOOST_CHECK_EQUAL(settings.get<int>("arena", "frames", 0), 600);

    // Default value when key doesn't exist
    BOOST_CHECK_EQUAL(settings.get<int>("arena", "nonexistent", 42), 42);
}

BOOST_AUTO_TEST_CASE(TestGetSetFloatAndWidening) {
    auto& settings = SettingsManager::Instance();

    BOOST_CHECK(settings.set("collision", "min_resolve_distance", 0.01f));
    BOOST_CHECK_CLOSE(settings.get<float>("collision", "min_resolve_distance", 0.0f), 0.01f, 1e-4f);

    settings.set("collision", "stage_radius", 40);
    BOOST_CHECK_CLOSE(settings.get<float>("collision", "stage_radius", 0.0f), 40.0f, 1e-4f);

    // No narrowing the other way
    BOOST_CHECK_EQUAL(settings.get<int>("collision", "min_resolve_distance", -1), -1);
}

BOOST_AUTO_TEST_CASE(TestGetSetBoolAndString) {
    auto& settings = SettingsManager::Instance();

    settings.set("arena", "debug_draw", true);
    settings.set("arena", "name", "Dust Bowl");
    BOOST_CHECK(settings.get<bool>("arena", "debug_draw", false));
    BOOST_CHECK_EQUAL(settings.get<std::string>("arena", "name", ""), "Dust Bowl");

    // Type mismatch returns the default
    BOOST_CHECK_EQUAL(settings.get<int>("arena", "name", 7), 7);
}

BOOST_AUTO_TEST_CASE(TestHasRemoveAndKeys) {
    auto& settings = SettingsManager::Instance();

    settings.set("arena", "a", 1);
    settings.set("arena", "b", 2);
    BOOST_CHECK(settings.has("arena", "a"));

    std::vector<std::string> keys = settings.getKeys("arena");
    std::sort(keys.begin(), keys.end());
    BOOST_REQUIRE_EQUAL(keys.size(), 2u);
    BOOST_CHECK_EQUAL(keys[0], "a");

    BOOST_CHECK(settings.remove("arena", "a"));
    BOOST_CHECK(!settings.remove("arena", "a"));
    BOOST_CHECK(!settings.has("arena", "a"));
    BOOST_CHECK(settings.getKeys("missing").empty());

    settings.clearAll();
    BOOST_CHECK(!settings.has("arena", "b"));
}

BOOST_AUTO_TEST_CASE(TestLoadFromFile) {
    createTestFile(R"({
        "collision": {
            "min_resolve_distance": 0.005,
            "stage_radius": 35,
            "log_contacts": false
        },
        "arena": { "frames": 300 }
    })");

    auto& settings = SettingsManager::Instance();
    BOOST_REQUIRE(settings.loadFromFile(testFile));
    BOOST_CHECK_CLOSE(settings.get<float>("collision", "min_resolve_distance", 0.0f), 0.005f, 1e-3f);
    BOOST_CHECK_EQUAL(settings.get<int>("collision", "stage_radius", 0), 35);
    BOOST_CHECK(!settings.get<bool>("collision", "log_contacts", true));
    BOOST_CHECK_EQUAL(settings.get<int>("arena", "frames", 0), 300);
}

BOOST_AUTO_TEST_CASE(TestLoadMergesIntoExisting) {
    auto& settings = SettingsManager::Instance();
    settings.set("arena", "frames", 100);
    settings.set("arena", "name", "keep");

    BOOST_REQUIRE(settings.loadFromString(R"({"arena": {"frames": 900}})"));
    BOOST_CHECK_EQUAL(settings.get<int>("arena", "frames", 0), 900);
    BOOST_CHECK_EQUAL(settings.get<std::string>("arena", "name", ""), "keep");
}

BOOST_AUTO_TEST_CASE(TestLoadFailures) {
    auto& settings = SettingsManager::Instance();

    BOOST_CHECK(!settings.loadFromFile("test_data/nonexistent.json"));
    BOOST_CHECK(!settings.loadFromString("{ invalid json }"));
    BOOST_CHECK(!settings.loadFromString("[1, 2, 3]"));

    // Non-object categories and unsupported values are skipped
    BOOST_CHECK(settings.loadFromString(R"({"bad": 5, "arena": {"list": [1], "frames": 10}})"));
    BOOST_CHECK(!settings.has("bad", ""));
    BOOST_CHECK(!settings.has("arena", "list"));
    BOOST_CHECK_EQUAL(settings.get<int>("arena", "frames", 0), 10);
}

BOOST_AUTO_TEST_CASE(TestConcurrentAccess) {
    auto& settings = SettingsManager::Instance();
    settings.set("collision", "stage_radius", 10.0f);

    std::vector<std::thread> threads;
    for (int i = 0; i < 4; ++i) {
        threads.emplace_back([&settings, i]() {
            for (int j = 0; j < 100; ++j) {
                settings.set("thread", "value" + std::to_string(i), j);
                settings.get<float>("collision", "stage_radius", 0.0f);
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    BOOST_CHECK_EQUAL(settings.getKeys("thread").size(), 4u);
    BOOST_CHECK_EQUAL(settings.get<int>("thread", "value0", 0), 99);
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// Collision configuration
// ============================================================================

BOOST_FIXTURE_TEST_SUITE(CollisionConfigTests, SettingsTestFixture)

BOOST_AUTO_TEST_CASE(TestDefaultsWithoutSettings) {
    CollisionConfig config = CollisionConfig::fromSettings(SettingsManager::Instance());
    BOOST_CHECK_CLOSE(config.minResolveDistance, CollisionConfig::DEFAULT_MIN_RESOLVE_DISTANCE, 1e-4f);
    BOOST_CHECK_CLOSE(config.stationarySpeedEpsilon, CollisionConfig::DEFAULT_STATIONARY_SPEED_EPSILON, 1e-4f);
    BOOST_CHECK_EQUAL(config.stageRadius, CollisionConfig::DEFAULT_STAGE_RADIUS);
    BOOST_CHECK_EQUAL(config.overlapCapacity, CollisionConfig::DEFAULT_OVERLAP_CAPACITY);
}

BOOST_AUTO_TEST_CASE(TestValuesFromJson) {
    auto& settings = SettingsManager::Instance();
    BOOST_REQUIRE(settings.loadFromString(R"({
        "collision": {
            "min_resolve_distance": 0.02,
            "stationary_speed_epsilon": 0.0001,
            "stage_radius": 50,
            "default_overlap_capacity": 64
        }
    })"));

    CollisionConfig config = CollisionConfig::fromSettings(settings);
    BOOST_CHECK_CLOSE(config.minResolveDistance, 0.02f, 1e-3f);
    BOOST_CHECK_CLOSE(config.stationarySpeedEpsilon, 0.0001f, 1e-3f);
    BOOST_CHECK_CLOSE(config.stageRadius, 50.0f, 1e-4f);
    BOOST_CHECK_EQUAL(config.overlapCapacity, 64);
}

BOOST_AUTO_TEST_CASE(TestNegativeValuesFallBack) {
    auto& settings = SettingsManager::Instance();
    settings.set("collision", "min_resolve_distance", -1.0f);
    settings.set("collision", "stage_radius", -5);
    settings.set("collision", "default_overlap_capacity", -8);

    CollisionConfig config = CollisionConfig::fromSettings(settings);
    BOOST_CHECK_CLOSE(config.minResolveDistance, CollisionConfig::DEFAULT_MIN_RESOLVE_DISTANCE, 1e-4f);
    BOOST_CHECK_EQUAL(config.stageRadius, CollisionConfig::DEFAULT_STAGE_RADIUS);
    BOOST_CHECK_EQUAL(config.overlapCapacity, CollisionConfig::DEFAULT_OVERLAP_CAPACITY);
}

BOOST_AUTO_TEST_SUITE_END()
