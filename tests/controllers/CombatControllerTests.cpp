/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE CombatControllerTests
#include <boost/test/unit_test.hpp>

#include "common/ControllerGetNameTests.hpp"
#include "common/ControllerTestFixture.hpp"
#include <string>

namespace {
bool contains(const std::string& text, const std::string& part) {
    return text.find(part) != std::string::npos;
}
}

// ============================================================================
// Test Fixture
// ============================================================================

class CombatTestFixture : public ControllerTestFixture {
public:
    CombatTestFixture() {
        state.roomId = "barracks";
        beginFight("Watchtower Bandit");
    }

    SoloAdventure::Enemy& bandit() { return state.enemies.front(); }
    SoloAdventure::Companion& mara() { return state.companions.front(); }
};

INSTANTIATE_CONTROLLER_GET_NAME_TESTS(combat, CombatTestFixture, "CombatController")

// ============================================================================
// PLAYER ATTACK TESTS
// ============================================================================

BOOST_FIXTURE_TEST_SUITE(PlayerAttackTests, CombatTestFixture)

BOOST_AUTO_TEST_CASE(TestAttackHitAppliesDamage) {
    // +3 with a 15 against AC 13 hits; 1d8+1 with a 4 deals 5
    random.push({15, 4});
    auto outcome = combat.playerTurn(CombatCommand::Attack);

    BOOST_CHECK(outcome.success);
    BOOST_CHECK_EQUAL(outcome.message,
                      "Hit Watchtower Bandit (roll 15 -> 18) for 5 (4+1) damage.");
    BOOST_CHECK_EQUAL(bandit().hp, 7);
    BOOST_CHECK_EQUAL(random.remaining(), 0u);
}

BOOST_AUTO_TEST_CASE(TestAttackMissLeavesEnemyUntouched) {
    random.push({9});
    auto outcome = combat.playerTurn(CombatCommand::Attack);

    BOOST_CHECK(outcome.success);
    BOOST_CHECK_EQUAL(outcome.message, "Miss Watchtower Bandit (roll 9 -> 12).");
    BOOST_CHECK_EQUAL(bandit().hp, 12);
    BOOST_CHECK_EQUAL(random.calls(), 1);
}

BOOST_AUTO_TEST_CASE(TestTotalEqualToArmorClassHits) {
    random.push({10, 1});
    auto outcome = combat.playerTurn(CombatCommand::Attack);
    BOOST_CHECK(contains(outcome.message, "Hit Watchtower Bandit (roll 10 -> 13)"));
}

BOOST_AUTO_TEST_CASE(TestFighterPowerStrikeAddsDamage) {
    random.push({10, 4});
    auto outcome = combat.playerTurn(CombatCommand::Special);

    BOOST_CHECK(outcome.success);
    BOOST_CHECK_EQUAL(outcome.message, "You drive a heavy power strike. Hit Watchtower Bandit "
                                       "(roll 10 -> 13) for 7 (4+1+2) damage.");
    BOOST_CHECK_EQUAL(bandit().hp, 5);
}

BOOST_AUTO_TEST_CASE(TestRoguePreciseStrikeAddsToHit) {
    beginCampaign(WATCHTOWER, "barracks", "Rogue");
    beginFight("Watchtower Bandit");

    // Rogue +2, precise +2: a 9 reaches 13
    random.push({9, 3});
    auto outcome = combat.playerTurn(CombatCommand::Special);

    BOOST_CHECK(contains(outcome.message, "You line up a precise shot."));
    BOOST_CHECK(contains(outcome.message, "(roll 9 -> 13) for 4 (3+1) damage."));
    BOOST_CHECK_EQUAL(bandit().hp, 8);
}

BOOST_AUTO_TEST_CASE(TestDefendSetsStance) {
    auto outcome = combat.playerTurn(CombatCommand::Defend);

    BOOST_CHECK(outcome.success);
    BOOST_CHECK_EQUAL(outcome.message, "Aria takes a defensive stance (+2 AC until next attack).");
    BOOST_CHECK(state.playerDefending);
    BOOST_CHECK_EQUAL(random.calls(), 0);
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// TARGET SELECTION TESTS
// ============================================================================

BOOST_FIXTURE_TEST_SUITE(TargetSelectionTests, CombatTestFixture)

BOOST_AUTO_TEST_CASE(TestEmptyQueryPicksLowestHp) {
    state.roomId = "cellar";
    random.push({2, 4});
    beginFight("Big Rats");
    BOOST_REQUIRE_EQUAL(state.enemies.size(), 2u);
    BOOST_CHECK_EQUAL(state.enemies[0].hp, 1);
    BOOST_CHECK_EQUAL(state.enemies[1].hp, 3);

    auto lookup = combat.selectEnemy("");
    BOOST_CHECK(lookup.enemy == &state.enemies[0]);

    lookup = combat.selectEnemy("2");
    BOOST_CHECK(lookup.enemy == &state.enemies[1]);
}

BOOST_AUTO_TEST_CASE(TestNumbersCountLivingEnemiesOnly) {
    state.roomId = "cellar";
    random.push({3, 3});
    beginFight("Big Rats");
    state.enemies[0].hp = 0;

    auto lookup = combat.selectEnemy("1");
    BOOST_CHECK(lookup.enemy == &state.enemies[1]);

    lookup = combat.selectEnemy("2");
    BOOST_CHECK(lookup.enemy == nullptr);
    BOOST_CHECK_EQUAL(lookup.error, "That target doesn't exist.");
}

BOOST_AUTO_TEST_CASE(TestNameLookupErrors) {
    state.roomId = "cellar";
    random.push({3, 3});
    beginFight("Big Rats");

    BOOST_CHECK_EQUAL(combat.selectEnemy("rat").error, "Be more specific.");
    BOOST_CHECK_EQUAL(combat.selectEnemy("goblin").error, "No such target.");
    BOOST_CHECK_EQUAL(combat.selectEnemy("0").error, "That target doesn't exist.");

    for (auto& enemy : state.enemies) {
        enemy.hp = 0;
    }
    BOOST_CHECK_EQUAL(combat.selectEnemy("").error, "There's nothing to attack.");
}

BOOST_AUTO_TEST_CASE(TestUnknownTargetFailsWithoutRolling) {
    auto outcome = combat.runRound(CombatCommand::Attack, "dragon");

    BOOST_CHECK(!outcome.success);
    BOOST_CHECK_EQUAL(outcome.message, "No such target.");
    BOOST_CHECK_EQUAL(random.calls(), 0);
    BOOST_CHECK_EQUAL(bandit().hp, 12);
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// SPELL TESTS
// ============================================================================

BOOST_FIXTURE_TEST_SUITE(SpellTests, CombatTestFixture)

BOOST_AUTO_TEST_CASE(TestCastValidation) {
    BOOST_CHECK_EQUAL(combat.playerTurn(CombatCommand::Cast, "", "").message, "Cast which spell?");
    BOOST_CHECK_EQUAL(combat.playerTurn(CombatCommand::Cast, "", "Spark").message,
                      "You don't know that spell.");

    state.player.learnedSpells.push_back("Shield");
    auto outcome = combat.playerTurn(CombatCommand::Cast, "", "shield");
    BOOST_CHECK(!outcome.success);
    BOOST_CHECK_EQUAL(outcome.message, "Shield has no combat effect yet.");
    BOOST_CHECK_EQUAL(random.calls(), 0);
}

BOOST_AUTO_TEST_CASE(TestWizardCastsSpark) {
    beginCampaign(WATCHTOWER, "barracks", "Wizard");
    beginFight("Watchtower Bandit");
    BOOST_REQUIRE_EQUAL(state.player.maxMana, 6);

    // +1 attack, +2 INT: a 10 reaches 13; Spark is 1d4
    random.push({10, 3});
    auto outcome = combat.playerTurn(CombatCommand::Cast, "", "Spark");

    BOOST_CHECK(outcome.success);
    BOOST_CHECK_EQUAL(outcome.message,
                      "You channel Spark. Hit Watchtower Bandit (roll 10 -> 13) for 3 (3) damage.");
    BOOST_CHECK_EQUAL(state.player.mana, 4);
    BOOST_CHECK_EQUAL(bandit().hp, 9);
}

BOOST_AUTO_TEST_CASE(TestOutOfManaChangesNothing) {
    beginCampaign(WATCHTOWER, "barracks", "Wizard");
    beginFight("Watchtower Bandit");
    state.player.mana = 1;

    auto outcome = combat.runRound(CombatCommand::Cast, "", "Spark");

    BOOST_CHECK(!outcome.success);
    BOOST_CHECK_EQUAL(outcome.message, "You are out of mana.");
    BOOST_CHECK_EQUAL(state.player.mana, 1);
    BOOST_CHECK_EQUAL(random.calls(), 0);
}

BOOST_AUTO_TEST_CASE(TestWizardSpecialUsesBestDamageSpell) {
    beginCampaign(WATCHTOWER, "barracks", "Wizard");
    beginFight("Watchtower Bandit");
    state.player.learnedSpells.push_back("Magic Missile");

    random.push({1});
    auto outcome = combat.playerTurn(CombatCommand::Special);

    BOOST_CHECK(contains(outcome.message, "You channel Magic Missile."));
    BOOST_CHECK_EQUAL(state.player.mana, 4);
}

BOOST_AUTO_TEST_CASE(TestClericSpecialIsWeaponAttack) {
    beginCampaign(WATCHTOWER, "barracks", "Cleric");
    beginFight("Watchtower Bandit");
    const int mana = state.player.mana;

    // Cure Wounds deals no damage, so the mace swings: +2, 1d6+1
    random.push({12, 3});
    auto outcome = combat.playerTurn(CombatCommand::Special);

    BOOST_CHECK(outcome.success);
    BOOST_CHECK_EQUAL(outcome.message, "Hit Watchtower Bandit (roll 12 -> 14) for 4 (3+1) damage.");
    BOOST_CHECK_EQUAL(bandit().hp, 8);
    BOOST_CHECK_EQUAL(state.player.mana, mana);
}

BOOST_AUTO_TEST_CASE(TestRoundRegeneratesMana) {
    beginCampaign(WATCHTOWER, "barracks", "Wizard");
    beginFight("Watchtower Bandit");

    // Spark hits for 3, Mara misses, the bandit misses
    random.push({10, 3, 1, 1});
    auto outcome = combat.runRound(CombatCommand::Cast, "", "Spark");

    BOOST_CHECK(outcome.success);
    BOOST_CHECK(contains(outcome.message, "Mara misses Watchtower Bandit (roll 1 -> 3)."));
    BOOST_CHECK(contains(outcome.message, "Watchtower Bandit misses Aria (roll 1 -> 4)."));
    BOOST_CHECK_EQUAL(state.player.mana, 5);
    BOOST_CHECK_EQUAL(random.remaining(), 0u);
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// COMPANION TESTS
// ============================================================================

BOOST_FIXTURE_TEST_SUITE(CompanionTests, CombatTestFixture)

BOOST_AUTO_TEST_CASE(TestCompanionAttacks) {
    random.push({11, 5});
    auto result = combat.companionTurn();

    BOOST_REQUIRE(result.has_value());
    BOOST_CHECK_EQUAL(*result, "Mara strikes Watchtower Bandit (roll 11 -> 13) for 5 (5) damage.");
    BOOST_CHECK_EQUAL(bandit().hp, 7);
}

BOOST_AUTO_TEST_CASE(TestCompanionDefendsAtThreshold) {
    mara().hp = 3;
    auto result = combat.companionTurn();

    BOOST_REQUIRE(result.has_value());
    BOOST_CHECK_EQUAL(*result, "Mara keeps their distance and braces (+2 AC).");
    BOOST_CHECK(state.companionDefending);
    BOOST_CHECK_EQUAL(random.calls(), 0);
}

BOOST_AUTO_TEST_CASE(TestDownedCompanionCannotAct) {
    mara().hp = 0;
    auto result = combat.companionTurn();

    BOOST_REQUIRE(result.has_value());
    BOOST_CHECK_EQUAL(*result, "Mara is down and cannot act.");
}

BOOST_AUTO_TEST_CASE(TestNoCompanionSkipsTurn) {
    state.companions.clear();
    BOOST_CHECK(!combat.companionTurn().has_value());
}

BOOST_AUTO_TEST_CASE(TestCasterCompanionSpendsMana) {
    beginCampaign(CRYPT, "antechamber");
    beginFight("Crypt Wight");
    auto& eldrin = state.companions.front();
    BOOST_REQUIRE_EQUAL(eldrin.name, "Eldrin");
    BOOST_REQUIRE_EQUAL(eldrin.mana, 6);

    // Magic Missile is preferred over Spark
    random.push({20, 6});
    auto result = combat.companionTurn();

    BOOST_REQUIRE(result.has_value());
    BOOST_CHECK(contains(*result, "Eldrin channels Magic Missile."));
    BOOST_CHECK(contains(*result, "for 6 (6) damage."));
    BOOST_CHECK_EQUAL(eldrin.mana, 4);
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// ENEMY TURN TESTS
// ============================================================================

BOOST_FIXTURE_TEST_SUITE(EnemyTurnTests, CombatTestFixture)

BOOST_AUTO_TEST_CASE(TestEnemyHitsPlayer) {
    random.push({13, 3});
    auto results = combat.enemyTurn();

    BOOST_REQUIRE_EQUAL(results.size(), 1u);
    BOOST_CHECK_EQUAL(results[0], "Watchtower Bandit strikes Aria (roll 13 -> 16) for 3 (3) damage.");
    BOOST_CHECK_EQUAL(state.player.hp, 13);
}

BOOST_AUTO_TEST_CASE(TestDefendingAddsArmorClass) {
    state.playerDefending = true;
    random.push({13});
    auto results = combat.enemyTurn();

    BOOST_REQUIRE_EQUAL(results.size(), 1u);
    BOOST_CHECK_EQUAL(results[0], "Watchtower Bandit misses Aria (roll 13 -> 16).");
    BOOST_CHECK_EQUAL(state.player.hp, state.player.maxHp);
}

BOOST_AUTO_TEST_CASE(TestStancesClearAfterRound) {
    random.push({1, 1});
    auto outcome = combat.runRound(CombatCommand::Defend);

    BOOST_CHECK(outcome.success);
    BOOST_CHECK(contains(outcome.message, "Watchtower Bandit misses Aria"));
    BOOST_CHECK(!state.playerDefending);
    BOOST_CHECK(!state.companionDefending);
}

BOOST_AUTO_TEST_CASE(TestFocusPlayerSwitchesWhenPlayerIsDown) {
    state.player.hp = 0;
    random.push({20, 2});
    auto results = combat.enemyTurn();

    BOOST_REQUIRE_EQUAL(results.size(), 1u);
    BOOST_CHECK_EQUAL(results[0], "Watchtower Bandit lashes at Mara (roll 20 -> 23) for 2 (2) damage.");
    BOOST_CHECK_EQUAL(mara().hp, 8);
}

BOOST_AUTO_TEST_CASE(TestFocusWeakestPicksLowerHp) {
    state.roomId = "cellar";
    random.push({3, 3});
    beginFight("Big Rats");
    state.enemies[1].hp = 0;

    mara().hp = 5;
    random.push({12, 2});
    auto results = combat.enemyTurn();
    BOOST_REQUIRE_EQUAL(results.size(), 1u);
    BOOST_CHECK_EQUAL(results[0], "Big Rats lashes at Mara (roll 12 -> 14) for 2 (2) damage.");
    BOOST_CHECK_EQUAL(mara().hp, 3);

    // Ties go to the player
    state.player.hp = 3;
    random.push({12});
    results = combat.enemyTurn();
    BOOST_REQUIRE_EQUAL(results.size(), 1u);
    BOOST_CHECK_EQUAL(results[0], "Big Rats misses Aria (roll 12 -> 14).");
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// END OF COMBAT TESTS
// ============================================================================

BOOST_FIXTURE_TEST_SUITE(EndOfCombatTests, CombatTestFixture)

BOOST_AUTO_TEST_CASE(TestVictoryRecordsCorpsesAndXp) {
    bandit().hp = 1;
    random.push({15, 1});
    auto outcome = combat.runRound(CombatCommand::Attack);

    BOOST_CHECK(outcome.success);
    BOOST_CHECK(contains(outcome.message, "Hit Watchtower Bandit (roll 15 -> 18) for 2 (1+1) damage."));
    BOOST_CHECK(contains(outcome.message, "Mara scans the room, weapon lowered."));
    BOOST_CHECK(contains(outcome.message,
                         "The foes fall. Corpses: 1. Watchtower Bandit. You can 'loot <number>' "
                         "or 'loot all'. The way forward is clear. XP +25."));

    BOOST_CHECK(!state.inCombat);
    BOOST_CHECK(state.enemies.empty());
    BOOST_CHECK(state.flags.isDefeated("barracks"));
    BOOST_REQUIRE_EQUAL(state.flags.corpses["barracks"].size(), 1u);
    BOOST_CHECK_EQUAL(state.flags.corpses["barracks"][0].id, 1);
    BOOST_CHECK_EQUAL(state.flags.nextCorpseId, 2);
    BOOST_CHECK_EQUAL(state.player.xp, 25);
}

BOOST_AUTO_TEST_CASE(TestEndCombatIsIdempotent) {
    bandit().hp = 0;
    auto first = combat.endCombatIfNeeded();
    BOOST_REQUIRE(first.has_value());

    auto second = combat.endCombatIfNeeded();
    BOOST_CHECK(!second.has_value());
    BOOST_CHECK_EQUAL(state.player.xp, 25);
    BOOST_CHECK_EQUAL(state.flags.defeatedRooms.size(), 1u);
    BOOST_CHECK_EQUAL(state.flags.corpses["barracks"].size(), 1u);
}

BOOST_AUTO_TEST_CASE(TestCombatContinuesWhileBothSidesStand) {
    BOOST_CHECK(!combat.endCombatIfNeeded().has_value());
    BOOST_CHECK(state.inCombat);
    BOOST_CHECK(!state.gameOver);
}

BOOST_AUTO_TEST_CASE(TestPlayerDefeatEndsGame) {
    state.player.hp = 0;
    auto result = combat.endCombatIfNeeded();

    BOOST_REQUIRE(result.has_value());
    BOOST_CHECK_EQUAL(*result, "You collapse from your wounds. The darkness claims another victim.");
    BOOST_CHECK(state.gameOver);
}

BOOST_AUTO_TEST_CASE(TestCorpseIdsKeepCounting) {
    state.flags.nextCorpseId = 3;
    state.roomId = "cellar";
    random.push({2, 2});
    beginFight("Big Rats");
    for (auto& enemy : state.enemies) {
        enemy.hp = 0;
    }

    auto result = combat.endCombatIfNeeded();
    BOOST_REQUIRE(result.has_value());
    BOOST_CHECK(contains(*result, "Corpses: 3. Big Rats, 4. Big Rats."));
    BOOST_CHECK(contains(*result, "XP +20."));
    BOOST_CHECK_EQUAL(state.flags.nextCorpseId, 5);
}

BOOST_AUTO_TEST_SUITE_END()
