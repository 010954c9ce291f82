/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE NarrationManagerTests
#include <boost/test/unit_test.hpp>

#include "controllers/common/ControllerTestFixture.hpp"
#include "managers/NarrationManager.hpp"
#include <algorithm>
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace std::chrono_literals;

// ============================================================================
// Test Backends
// ============================================================================

// Answers with a fixed line and keeps every request it was given
class RecordingBackend : public NarrationBackend {
public:
    explicit RecordingBackend(std::string reply) : m_reply(std::move(reply)) {}

    std::string narrate(const NarrationRequest& request) override {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_requests.push_back(request);
        return m_reply;
    }

    std::vector<NarrationRequest> requests() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_requests;
    }

private:
    std::string m_reply;
    mutable std::mutex m_mutex;
    std::vector<NarrationRequest> m_requests;
};

// Throws for the first failures calls, then answers
class FlakyBackend : public NarrationBackend {
public:
    explicit FlakyBackend(int failures) : m_failures(failures) {}

    std::string narrate(const NarrationRequest&) override {
        int call = ++m_calls;
        if (call <= m_failures) {
            throw std::runtime_error("service unavailable");
        }
        return "The wind howls through the arrow slits.";
    }

    int calls() const { return m_calls.load(); }

private:
    int m_failures;
    std::atomic<int> m_calls{0};
};

class SlowBackend : public NarrationBackend {
public:
    std::string narrate(const NarrationRequest&) override {
        ++m_calls;
        std::this_thread::sleep_for(300ms);
        return "Too late.";
    }

    int calls() const { return m_calls.load(); }

private:
    std::atomic<int> m_calls{0};
};

// Blocks until released, like a generator that never answers
class HangingBackend : public NarrationBackend {
public:
    std::string narrate(const NarrationRequest&) override {
        while (!m_released.load()) {
            std::this_thread::sleep_for(5ms);
        }
        return "Finally.";
    }

    void release() { m_released = true; }

private:
    std::atomic<bool> m_released{false};
};

// ============================================================================
// Test Fixture
// ============================================================================

class NarrationFixture : public ControllerTestFixture {
public:
    NarrationFixture() {
        config.timeout = 2000ms;
        config.maxRetries = 2;
        config.backoff = 0ms;
    }

    bool isCannedLine(const NarrationResult& result, NarrationRole role,
                      const std::string& speaker = "") const {
        const auto& lines = role == NarrationRole::Companion
                                ? StubNarrationBackend::companionLines()
                                : StubNarrationBackend::gameMasterLines();
        return std::any_of(lines.begin(), lines.end(), [&](const std::string& line) {
            std::string expected = line;
            auto pos = expected.find("{name}");
            if (pos != std::string::npos) {
                expected.replace(pos, 6, speaker);
            }
            return expected == result.text;
        });
    }

    NarrationConfig config;
};

// ============================================================================
// BACKEND SELECTION TESTS
// ============================================================================

BOOST_FIXTURE_TEST_SUITE(BackendTests, NarrationFixture)

BOOST_AUTO_TEST_CASE(TestMissingBackendFallsBackToStub) {
    NarrationManager narration(registry, nullptr, config);
    auto result = narration.narrateTurn(state, "look", "You look around.");

    BOOST_CHECK_EQUAL(result.source, "stub");
    BOOST_CHECK(isCannedLine(result, NarrationRole::GameMaster));
}

BOOST_AUTO_TEST_CASE(TestStubCompanionLineNamesSpeaker) {
    NarrationManager narration(registry, std::make_shared<StubNarrationBackend>(7u), config);
    auto result = narration.companionSuggest(state);

    BOOST_REQUIRE(result.has_value());
    BOOST_CHECK_EQUAL(result->source, "stub");
    BOOST_CHECK(result->text.find("Mara") != std::string::npos);
    BOOST_CHECK(isCannedLine(*result, NarrationRole::Companion, "Mara"));
}

BOOST_AUTO_TEST_CASE(TestGeneratedTextIsTrimmed) {
    auto backend = std::make_shared<RecordingBackend>("  The torch gutters.  \n");
    NarrationManager narration(registry, backend, config);

    auto result = narration.narrateTurn(state, "look", "You look around.");
    BOOST_CHECK_EQUAL(result.source, "ai");
    BOOST_CHECK_EQUAL(result.text, "The torch gutters.");
    BOOST_CHECK_EQUAL(backend->requests().size(), 1u);
}

BOOST_AUTO_TEST_CASE(TestRetriesAfterFailure) {
    auto backend = std::make_shared<FlakyBackend>(1);
    NarrationManager narration(registry, backend, config);

    auto result = narration.narrateTurn(state, "rest", "You rest.");
    BOOST_CHECK_EQUAL(result.source, "ai");
    BOOST_CHECK_EQUAL(backend->calls(), 2);
}

BOOST_AUTO_TEST_CASE(TestFallbackAfterEveryAttemptFails) {
    auto backend = std::make_shared<FlakyBackend>(10);
    NarrationManager narration(registry, backend, config);

    auto result = narration.narrateTurn(state, "rest", "You rest.");
    BOOST_CHECK_EQUAL(result.source, "fallback");
    BOOST_CHECK(isCannedLine(result, NarrationRole::GameMaster));
    BOOST_CHECK_EQUAL(backend->calls(), 2);
}

BOOST_AUTO_TEST_CASE(TestEmptyTextCountsAsFailure) {
    auto backend = std::make_shared<RecordingBackend>("   ");
    NarrationManager narration(registry, backend, config);

    auto result = narration.narrateTurn(state, "look", "You look around.");
    BOOST_CHECK_EQUAL(result.source, "fallback");
    BOOST_CHECK_EQUAL(backend->requests().size(), 2u);
}

BOOST_AUTO_TEST_CASE(TestSlowBackendTimesOut) {
    config.timeout = 20ms;
    config.maxRetries = 1;
    auto backend = std::make_shared<SlowBackend>();

    auto start = std::chrono::steady_clock::now();
    NarrationResult result;
    {
        NarrationManager narration(registry, backend, config);
        result = narration.narrateTurn(state, "look", "You look around.");
        BOOST_CHECK(std::chrono::steady_clock::now() - start < 250ms);
    }

    BOOST_CHECK_EQUAL(result.source, "fallback");
    BOOST_CHECK_EQUAL(backend->calls(), 1);
}

BOOST_AUTO_TEST_CASE(TestHungBackendDoesNotBlockShutdown) {
    config.timeout = 20ms;
    config.maxRetries = 1;
    auto backend = std::make_shared<HangingBackend>();

    auto start = std::chrono::steady_clock::now();
    {
        NarrationManager narration(registry, backend, config);
        auto result = narration.narrateTurn(state, "look", "You look around.");
        BOOST_CHECK_EQUAL(result.source, "fallback");
    }
    // The manager is gone while the call is still stuck
    BOOST_CHECK(std::chrono::steady_clock::now() - start < 500ms);

    backend->release();
}

BOOST_AUTO_TEST_CASE(TestRetryCountHasFloorOfOne) {
    config.maxRetries = 0;
    NarrationManager narration(registry, nullptr, config);
    BOOST_CHECK_EQUAL(narration.getConfig().maxRetries, 1);
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// PROMPT TESTS
// ============================================================================

BOOST_FIXTURE_TEST_SUITE(PromptTests, NarrationFixture)

BOOST_AUTO_TEST_CASE(TestTurnPromptCarriesInputAndResult) {
    auto backend = std::make_shared<RecordingBackend>("Dust settles.");
    NarrationManager narration(registry, backend, config);
    narration.narrateTurn(state, "talk", "Eryn stays guarded.");

    auto requests = backend->requests();
    BOOST_REQUIRE_EQUAL(requests.size(), 1u);
    const auto& req = requests.front();
    BOOST_CHECK(req.role == NarrationRole::GameMaster);
    BOOST_CHECK_EQUAL(req.systemPrompt, NarrationManager::gameMasterSystemPrompt());
    BOOST_CHECK_EQUAL(req.userPrompt.rfind("STATE\nRoom: Ruined Courtyard", 0), 0u);
    BOOST_CHECK(req.userPrompt.find("PLAYER INPUT\ntalk") != std::string::npos);
    BOOST_CHECK(req.userPrompt.find("RULES RESULT\nEryn stays guarded.") != std::string::npos);
}

BOOST_AUTO_TEST_CASE(TestCompanionPromptAtFullHp) {
    auto backend = std::make_shared<RecordingBackend>("Let's head down.");
    NarrationManager narration(registry, backend, config);
    auto result = narration.companionSuggest(state);

    BOOST_REQUIRE(result.has_value());
    auto requests = backend->requests();
    BOOST_REQUIRE_EQUAL(requests.size(), 1u);
    BOOST_CHECK(requests[0].role == NarrationRole::Companion);
    BOOST_CHECK_EQUAL(requests[0].speaker, "Mara");
    BOOST_CHECK(requests[0].systemPrompt.find("You are Mara") == 0);
    BOOST_CHECK(requests[0].userPrompt.find("Everyone at full HP.") != std::string::npos);
    BOOST_CHECK(requests[0].userPrompt.find(
                    "Available actions: " + NarrationManager::availableActions(false)) !=
                std::string::npos);
}

BOOST_AUTO_TEST_CASE(TestCompanionPromptWhenWounded) {
    state.player.hp = 5;
    beginFight("Big Rats");
    state.roomId = "cellar";

    auto backend = std::make_shared<RecordingBackend>("Drink something.");
    NarrationManager narration(registry, backend, config);
    narration.companionSuggest(state);

    const auto prompt = backend->requests().at(0).userPrompt;
    BOOST_CHECK(prompt.find("Everyone at full HP.") == std::string::npos);
    BOOST_CHECK(prompt.find(NarrationManager::availableActions(true)) != std::string::npos);
    BOOST_CHECK(prompt.find("Enemies: Big Rats HP") != std::string::npos);
}

BOOST_AUTO_TEST_CASE(TestNoCompanionNoSuggestion) {
    state.companions.clear();
    auto backend = std::make_shared<RecordingBackend>("unused");
    NarrationManager narration(registry, backend, config);

    BOOST_CHECK(!narration.companionSuggest(state).has_value());
    BOOST_CHECK(backend->requests().empty());
}

BOOST_AUTO_TEST_CASE(TestFullHpCheckCoversWholeParty) {
    BOOST_CHECK(NarrationManager::partyAtFullHp(state));
    state.companions.front().hp = 1;
    BOOST_CHECK(!NarrationManager::partyAtFullHp(state));
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// SNAPSHOT TESTS
// ============================================================================

BOOST_FIXTURE_TEST_SUITE(SnapshotTests, NarrationFixture)

BOOST_AUTO_TEST_CASE(TestGameMasterSnapshot) {
    NarrationManager narration(registry, nullptr, config);
    state.flags.markDefeated("cellar");
    state.flags.setMarker("scout_helped");
    state.lastEvent = "Eryn points the way.";

    auto snapshot = narration.gameMasterSnapshot(state);
    BOOST_CHECK_EQUAL(snapshot.rfind("Room: Ruined Courtyard\nRoom kind: social\n"
                                     "Player: Aria (Human Fighter) Level 1 HP 16/16",
                                     0),
                      0u);
    BOOST_CHECK(snapshot.find("Stats: STR 2 DEX 2 CON 2 INT 2 WIS 2 CHA 2") != std::string::npos);
    BOOST_CHECK(snapshot.find("Companion: Mara HP 10/10") != std::string::npos);
    BOOST_CHECK(snapshot.find("Inventory: (empty)") != std::string::npos);
    BOOST_CHECK(snapshot.find("In combat: false") != std::string::npos);
    BOOST_CHECK(snapshot.find("Last event: Eryn points the way.") != std::string::npos);
    BOOST_CHECK(snapshot.find("Flags: defeated_rooms=cellar, scout_helped=true") !=
                std::string::npos);
    BOOST_CHECK(snapshot.find("Enemies:") == std::string::npos);
}

BOOST_AUTO_TEST_CASE(TestCompanionSnapshotInCombat) {
    NarrationManager narration(registry, nullptr, config);
    state.roomId = "barracks";
    beginFight("Watchtower Bandit");
    state.inventory = {item("healing_potion")};

    auto snapshot = narration.companionSnapshot(state);
    BOOST_CHECK_EQUAL(snapshot.rfind("Room: Crumbling Barracks (combat)\n", 0), 0u);
    BOOST_CHECK(snapshot.find("Mara HP 10/10") != std::string::npos);
    BOOST_CHECK(snapshot.find("Inventory: Healing Potion") != std::string::npos);
    BOOST_CHECK(snapshot.find("In combat: true") != std::string::npos);
    BOOST_CHECK(snapshot.find("Enemies: Watchtower Bandit HP 12/12") != std::string::npos);
}

BOOST_AUTO_TEST_SUITE_END()
