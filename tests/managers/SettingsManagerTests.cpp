/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#define BOOST_TEST_MODULE SettingsManagerTests
#include <boost/test/unit_test.hpp>
#include "core/GameConfig.hpp"
#include "core/Logger.hpp"
#include "managers/SettingsManager.hpp"
#include <filesystem>
#include <fstream>
#include <thread>

using namespace SoloAdventure;

// Test fixture for setup/cleanup
struct SettingsTestFixture {
    const std::string testFile = "tests/test_data/settings/test_settings.json";

    SettingsTestFixture() {
        SOLO_ENABLE_QUIET_MODE();
        std::filesystem::create_directories("tests/test_data/settings");
    }

    ~SettingsTestFixture() {
        std::error_code ec;
        std::filesystem::remove_all("tests/test_data/settings", ec);
    }

    void createTestFile(const std::string& content) {
        std::ofstream file(testFile);
        file << content;
    }

    SettingsManager settings;
};

// ============================================================================
// STORE TESTS
// ============================================================================

BOOST_FIXTURE_TEST_SUITE(SettingsManagerTestSuite, SettingsTestFixture)

BOOST_AUTO_TEST_CASE(TestGetSetInt) {
    BOOST_CHECK(settings.set("game", "inventory_limit", 12));
    BOOST_CHECK_EQUAL(settings.get<int>("game", "inventory_limit", 0), 12);

    // Default value when key doesn't exist
    BOOST_CHECK_EQUAL(settings.get<int>("game", "nonexistent", 42), 42);
}

BOOST_AUTO_TEST_CASE(TestGetSetFloat) {
    BOOST_CHECK(settings.set("narration", "temperature", 0.7f));
    BOOST_CHECK_CLOSE(settings.get<float>("narration", "temperature", 0.0f), 0.7f, 0.001f);
}

BOOST_AUTO_TEST_CASE(TestGetSetBool) {
    BOOST_CHECK(settings.set("narration", "enabled", true));
    BOOST_CHECK_EQUAL(settings.get<bool>("narration", "enabled", false), true);

    settings.set("narration", "enabled", false);
    BOOST_CHECK_EQUAL(settings.get<bool>("narration", "enabled", true), false);
}

BOOST_AUTO_TEST_CASE(TestGetSetString) {
    BOOST_CHECK(settings.set("player", "name", std::string("Aria")));
    BOOST_CHECK_EQUAL(settings.get<std::string>("player", "name", ""), "Aria");

    // String literals are stored as strings
    BOOST_CHECK(settings.set("player", "class", "Wizard"));
    BOOST_CHECK_EQUAL(settings.get<std::string>("player", "class", ""), "Wizard");
}

BOOST_AUTO_TEST_CASE(TestHasAndRemove) {
    settings.set("game", "seed", 7);
    BOOST_CHECK(settings.has("game", "seed"));
    BOOST_CHECK(!settings.has("game", "missing"));
    BOOST_CHECK(!settings.has("nowhere", "seed"));

    BOOST_CHECK(settings.remove("game", "seed"));
    BOOST_CHECK(!settings.has("game", "seed"));
    BOOST_CHECK(!settings.remove("game", "seed"));

    // Removing the last key drops the category
    BOOST_CHECK(settings.getCategories().empty());
}

BOOST_AUTO_TEST_CASE(TestClearAll) {
    settings.set("game", "seed", 1);
    settings.set("player", "name", std::string("Aria"));
    settings.clearAll();

    BOOST_CHECK(!settings.has("game", "seed"));
    BOOST_CHECK(settings.getCategories().empty());
}

BOOST_AUTO_TEST_CASE(TestCategoriesAndKeysSorted) {
    settings.set("player", "name", std::string("Aria"));
    settings.set("game", "seed", 1);
    settings.set("game", "campaign", std::string("lost_crypt"));
    settings.set("game", "companion", std::string("mara"));

    auto categories = settings.getCategories();
    BOOST_REQUIRE_EQUAL(categories.size(), 2u);
    BOOST_CHECK_EQUAL(categories[0], "game");
    BOOST_CHECK_EQUAL(categories[1], "player");

    auto keys = settings.getKeys("game");
    BOOST_REQUIRE_EQUAL(keys.size(), 3u);
    BOOST_CHECK_EQUAL(keys[0], "campaign");
    BOOST_CHECK_EQUAL(keys[2], "seed");

    BOOST_CHECK(settings.getKeys("nonexistent").empty());
}

BOOST_AUTO_TEST_CASE(TestTypeMismatch) {
    settings.set("test", "value", 42);

    // Ints widen to float, other mismatches return the default
    BOOST_CHECK_CLOSE(settings.get<float>("test", "value", 99.9f), 42.0f, 0.001f);
    BOOST_CHECK_EQUAL(settings.get<bool>("test", "value", true), true);
    BOOST_CHECK_EQUAL(settings.get<std::string>("test", "value", "default"), "default");

    settings.set("test", "ratio", 0.5f);
    BOOST_CHECK_EQUAL(settings.get<int>("test", "ratio", -1), -1);
}

BOOST_AUTO_TEST_CASE(TestThreadSafety) {
    const int numThreads = 8;
    const int operationsPerThread = 100;

    std::vector<std::thread> threads;
    for (int t = 0; t < numThreads; ++t) {
        threads.emplace_back([this, t, count = operationsPerThread]() {
            for (int i = 0; i < count; ++i) {
                const std::string category = "category" + std::to_string(t);
                const std::string key = "key" + std::to_string(i);
                settings.set(category, key, i * t);
                settings.get<int>(category, key, -1);
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    // Checks happen on the main thread; Boost.Test assertions are not thread safe
    for (int t = 0; t < numThreads; ++t) {
        const std::string category = "category" + std::to_string(t);
        BOOST_CHECK_EQUAL(settings.getKeys(category).size(), static_cast<size_t>(operationsPerThread));
        BOOST_CHECK_EQUAL(settings.get<int>(category, "key10", -1), 10 * t);
    }
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// FILE TESTS
// ============================================================================

BOOST_FIXTURE_TEST_SUITE(SettingsFileTests, SettingsTestFixture)

BOOST_AUTO_TEST_CASE(TestLoadFromFile) {
    createTestFile(R"({
  "game": {
    "campaign": "lost_crypt",
    "inventory_limit": 8,
    "hardcore": true
  },
  "narration": {
    "temperature": 0.8
  },
  "ignored": 5,
  "player": {
    "nested": {"skip": true},
    "name": "Brok"
  }
})");

    BOOST_REQUIRE(settings.loadFromFile(testFile));

    BOOST_CHECK_EQUAL(settings.get<std::string>("game", "campaign", ""), "lost_crypt");
    BOOST_CHECK_EQUAL(settings.get<int>("game", "inventory_limit", 0), 8);
    BOOST_CHECK_EQUAL(settings.get<bool>("game", "hardcore", false), true);
    BOOST_CHECK_CLOSE(settings.get<float>("narration", "temperature", 0.0f), 0.8f, 0.001f);
    BOOST_CHECK_EQUAL(settings.get<std::string>("player", "name", ""), "Brok");

    // Non-object categories and nested objects are skipped
    BOOST_CHECK(!settings.has("ignored", ""));
    BOOST_CHECK(!settings.has("player", "nested"));
}

BOOST_AUTO_TEST_CASE(TestLoadMergesOverExisting) {
    settings.set("game", "seed", 99);
    settings.set("game", "campaign", std::string("ruined_watchtower"));
    createTestFile(R"({"game": {"campaign": "lost_crypt"}})");

    BOOST_REQUIRE(settings.loadFromFile(testFile));
    BOOST_CHECK_EQUAL(settings.get<std::string>("game", "campaign", ""), "lost_crypt");
    BOOST_CHECK_EQUAL(settings.get<int>("game", "seed", 0), 99);
}

BOOST_AUTO_TEST_CASE(TestSaveToFile) {
    settings.set("game", "inventory_limit", 10);
    settings.set("narration", "enabled", true);
    settings.set("narration", "temperature", 0.9f);
    settings.set("player", "name", std::string("Aria"));

    BOOST_REQUIRE(settings.saveToFile(testFile));
    BOOST_CHECK(std::filesystem::exists(testFile));

    SettingsManager reloaded;
    BOOST_REQUIRE(reloaded.loadFromFile(testFile));
    BOOST_CHECK_EQUAL(reloaded.get<int>("game", "inventory_limit", 0), 10);
    BOOST_CHECK_EQUAL(reloaded.get<bool>("narration", "enabled", false), true);
    BOOST_CHECK_CLOSE(reloaded.get<float>("narration", "temperature", 0.0f), 0.9f, 0.001f);
    BOOST_CHECK_EQUAL(reloaded.get<std::string>("player", "name", ""), "Aria");
}

BOOST_AUTO_TEST_CASE(TestInvalidFile) {
    BOOST_CHECK(!settings.loadFromFile("tests/test_data/settings/nonexistent_file.json"));

    createTestFile("{ invalid json }");
    BOOST_CHECK(!settings.loadFromFile(testFile));

    createTestFile("[1, 2, 3]");
    BOOST_CHECK(!settings.loadFromFile(testFile));
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// GAME CONFIG TESTS
// ============================================================================

BOOST_FIXTURE_TEST_SUITE(GameConfigTests, SettingsTestFixture)

BOOST_AUTO_TEST_CASE(TestShippedSettings) {
    BOOST_REQUIRE(settings.loadFromFile("res/settings.json"));
    settings.set("paths", "save_file", std::string("tests/test_data/settings/save.json"));
    settings.set("paths", "roster_dir", std::string("tests/test_data/settings/roster"));

    auto config = GameConfig::fromSettings(settings);
    BOOST_CHECK_EQUAL(config.contentDir, "res/campaigns");
    BOOST_CHECK_EQUAL(config.profilesFile, "res/profiles.json");
    BOOST_CHECK_EQUAL(config.saveFile, "tests/test_data/settings/save.json");
    BOOST_CHECK_EQUAL(config.campaignId, "ruined_watchtower");
    BOOST_CHECK_EQUAL(config.inventoryLimit, 10);
    BOOST_CHECK_EQUAL(config.player.name, "Aria");
    BOOST_CHECK_EQUAL(statValue(config.player.stats, Stat::DEX), 1);
    BOOST_CHECK_EQUAL(statValue(config.player.stats, Stat::WIS), 1);
    BOOST_CHECK_EQUAL(config.narration.timeout.count(), 30000);
    BOOST_CHECK_EQUAL(config.narration.maxRetries, 3);
}

BOOST_AUTO_TEST_CASE(TestOutOfRangeValuesClamped) {
    settings.set("paths", "save_file", std::string("save.json"));
    settings.set("paths", "roster_dir", std::string("roster"));
    settings.set("game", "seed", -5);
    settings.set("game", "inventory_limit", 0);
    settings.set("narration", "max_retries", 0);
    settings.set("narration", "timeout_ms", -1);
    settings.set("narration", "backoff_ms", -100);

    auto config = GameConfig::fromSettings(settings);
    BOOST_CHECK_EQUAL(config.seed, 0u);
    BOOST_CHECK_EQUAL(config.inventoryLimit, 1);
    BOOST_CHECK_EQUAL(config.narration.maxRetries, 1);
    BOOST_CHECK_EQUAL(config.narration.timeout.count(), 1);
    BOOST_CHECK_EQUAL(config.narration.backoff.count(), 0);
}

BOOST_AUTO_TEST_CASE(TestEmptyPathsUseUserData) {
    auto config = GameConfig::fromSettings(settings);

    BOOST_CHECK(!config.saveFile.empty());
    BOOST_CHECK_EQUAL(std::filesystem::path(config.saveFile).filename().string(), "game_state.json");
    BOOST_CHECK_EQUAL(std::filesystem::path(config.rosterDir).filename().string(), "characters");
    BOOST_CHECK_EQUAL(config.player.className, "Fighter");
    BOOST_CHECK(config.campaignId.empty());
}

BOOST_AUTO_TEST_SUITE_END()
