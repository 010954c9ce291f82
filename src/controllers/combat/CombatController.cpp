/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "controllers/combat/CombatController.hpp"
#include "controllers/progression/ProgressionController.hpp"
#include "core/Logger.hpp"
#include "managers/ContentRegistry.hpp"
#include "utils/TextUtils.hpp"
#include <algorithm>
#include <boost/container/small_vector.hpp>

using SoloAdventure::AIPolicy;
using SoloAdventure::Combatant;
using SoloAdventure::CorpseRecord;
using SoloAdventure::DiceExpr;
using SoloAdventure::Enemy;
using SoloAdventure::SpecialKind;
using SoloAdventure::SpellDefinition;
namespace TextUtils = SoloAdventure::TextUtils;

namespace {
    std::string rollText(int roll, int total) {
        return "(roll " + std::to_string(roll) + " -> " + std::to_string(total) + ")";
    }
}

// ============================================================================
// ROUND FLOW
// ============================================================================

ActionOutcome CombatController::runRound(CombatCommand command, const std::string& target,
                                         const std::string& spell) {
    auto player = playerTurn(command, target, spell);
    if (!player.success) {
        return player;
    }
    return ActionOutcome::ok(finishRound(player.message));
}

std::string CombatController::finishRound(const std::string& playerResult) {
    std::vector<std::string> results{playerResult};

    if (auto companion = companionTurn()) {
        results.push_back(std::move(*companion));
    }
    auto enemyResults = enemyTurn();
    results.insert(results.end(), enemyResults.begin(), enemyResults.end());

    clearRoundStances();
    if (auto ending = endCombatIfNeeded()) {
        results.push_back(std::move(*ending));
    }
    m_progression.regeneratePartyMana(MANA_REGEN_PER_ROUND);

    return TextUtils::join(results, " ");
}

// ============================================================================
// PLAYER
// ============================================================================

ActionOutcome CombatController::playerTurn(CombatCommand command, const std::string& target,
                                           const std::string& spell) {
    auto& gs = state();
    auto& player = gs.player;

    if (command == CombatCommand::Defend) {
        gs.playerDefending = true;
        return ActionOutcome::ok(player.name + " takes a defensive stance (+2 AC until next attack).");
    }

    const SpellDefinition* castSpell = nullptr;
    if (command == CombatCommand::Cast) {
        const std::string wanted = TextUtils::toLower(TextUtils::trim(spell));
        if (wanted.empty()) {
            return ActionOutcome::fail("Cast which spell?");
        }
        auto known = std::find_if(player.learnedSpells.begin(), player.learnedSpells.end(),
                                  [&wanted](const std::string& name) {
                                      return TextUtils::toLower(name) == wanted;
                                  });
        if (known == player.learnedSpells.end()) {
            return ActionOutcome::fail("You don't know that spell.");
        }
        castSpell = registry().findSpell(*known);
        if (!castSpell || !castSpell->isDamageSpell()) {
            return ActionOutcome::fail(*known + " has no combat effect yet.");
        }
    }

    auto lookup = selectEnemy(target);
    if (!lookup.enemy) {
        return ActionOutcome::fail(lookup.error);
    }
    Enemy& enemy = *lookup.enemy;

    const auto& profile = registry().getClassProfile(player.className);
    // Casters without a damage spell swing their weapon instead
    if (command == CombatCommand::Special && profile.special == SpecialKind::Spellcast) {
        castSpell = registry().bestDamageSpell(player.learnedSpells);
    }
    if (castSpell) {
        return castDamageSpell(*castSpell, enemy);
    }

    int attackBonus = player.attackBonus;
    int damageBonus = 0;
    std::string flavor;
    if (command == CombatCommand::Special) {
        switch (profile.special) {
        case SpecialKind::PowerStrike:
            damageBonus = profile.specialBonus;
            flavor = "You drive a heavy power strike. ";
            break;
        case SpecialKind::PreciseStrike:
            attackBonus += profile.specialBonus;
            flavor = "You line up a precise shot. ";
            break;
        case SpecialKind::Spellcast:
        case SpecialKind::None:
            break;
        }
    }

    gs.playerDefending = false;
    const auto attack = attackRoll(attackBonus, enemy.ac, false);
    if (attack.hit) {
        const std::string damage = applyDamage(enemy, player.damage, damageBonus);
        return ActionOutcome::ok(flavor + "Hit " + enemy.name + " " +
                                 rollText(attack.roll, attack.total) + " for " + damage +
                                 " damage.");
    }
    return ActionOutcome::ok(flavor + "Miss " + enemy.name + " " +
                             rollText(attack.roll, attack.total) + ".");
}

ActionOutcome CombatController::castDamageSpell(const SpellDefinition& spell, Enemy& target) {
    auto& gs = state();
    auto& player = gs.player;
    if (player.mana < spell.manaCost) {
        return ActionOutcome::fail("You are out of mana.");
    }

    const auto& profile = registry().getClassProfile(player.className);
    player.mana -= spell.manaCost;
    gs.playerDefending = false;
    COMBAT_DEBUG(player.name + " casts " + spell.name + ", mana " + std::to_string(player.mana) +
                 "/" + std::to_string(player.maxMana));

    const std::string flavor = "You channel " + spell.name + ". ";
    const auto attack = attackRoll(player.attackBonus + player.stat(profile.manaStat), target.ac,
                                   false);
    if (attack.hit) {
        const std::string damage = applyDamage(target, *spell.damage);
        return ActionOutcome::ok(flavor + "Hit " + target.name + " " +
                                 rollText(attack.roll, attack.total) + " for " + damage +
                                 " damage.");
    }
    return ActionOutcome::ok(flavor + "Miss " + target.name + " " +
                             rollText(attack.roll, attack.total) + ".");
}

// ============================================================================
// COMPANION
// ============================================================================

std::optional<std::string> CombatController::companionTurn() {
    auto& gs = state();
    SoloAdventure::Companion* companion = gs.activeCompanion();
    if (!companion) {
        return std::nullopt;
    }
    if (companion->isDown()) {
        return companion->name + " is down and cannot act.";
    }

    gs.companionDefending = false;
    if (companion->hp <= companion->defendHpThreshold) {
        gs.companionDefending = true;
        return companion->name + " keeps their distance and braces (+2 AC).";
    }

    auto lookup = selectEnemy("");
    if (!lookup.enemy) {
        return companion->name + " scans the room, weapon lowered.";
    }
    Enemy& enemy = *lookup.enemy;

    const SpellDefinition* spell = registry().bestDamageSpell(companion->learnedSpells);
    if (spell && companion->hasManaPool() && companion->mana >= spell->manaCost) {
        companion->mana -= spell->manaCost;
        const auto attack = attackRoll(companion->attackBonus, enemy.ac, false);
        const std::string prefix = companion->name + " channels " + spell->name + ". ";
        if (attack.hit) {
            const std::string damage = applyDamage(enemy, *spell->damage);
            return prefix + "Hit " + enemy.name + " " + rollText(attack.roll, attack.total) +
                   " for " + damage + " damage.";
        }
        return prefix + "Miss " + enemy.name + " " + rollText(attack.roll, attack.total) + ".";
    }

    const auto attack = attackRoll(companion->attackBonus, enemy.ac, false);
    if (attack.hit) {
        const std::string damage = applyDamage(enemy, companion->damage);
        return companion->name + " strikes " + enemy.name + " " +
               rollText(attack.roll, attack.total) + " for " + damage + " damage.";
    }
    return companion->name + " misses " + enemy.name + " " + rollText(attack.roll, attack.total) +
           ".";
}

// ============================================================================
// ENEMIES
// ============================================================================

std::vector<std::string> CombatController::enemyTurn() {
    auto& gs = state();
    boost::container::small_vector<Enemy*, 8> alive;
    for (auto& enemy : gs.enemies) {
        if (!enemy.isDown()) {
            alive.push_back(&enemy);
        }
    }
    if (alive.empty()) {
        return {"The foes are down."};
    }

    std::vector<std::string> results;
    results.reserve(alive.size());
    for (Enemy* enemy : alive) {
        const auto* companion = gs.activeCompanion();
        const bool companionUp = companion && !companion->isDown();
        const auto policy = registry().getMobProfile(gs.campaignId, enemy->name).ai;

        bool targetPlayer = true;
        switch (policy) {
        case AIPolicy::FocusPlayer:
            targetPlayer = !gs.player.isDown() || !companionUp;
            break;
        case AIPolicy::FocusCompanion:
            targetPlayer = !companionUp;
            break;
        case AIPolicy::FocusWeakest:
            // Ties go to the player
            targetPlayer = !companionUp || gs.player.hp <= companion->hp;
            break;
        }
        results.push_back(enemyAttack(*enemy, targetPlayer));
    }
    return results;
}

std::string CombatController::enemyAttack(Enemy& enemy, bool targetPlayer) {
    auto& gs = state();
    Combatant& target = targetPlayer ? static_cast<Combatant&>(gs.player)
                                     : static_cast<Combatant&>(*gs.activeCompanion());
    const bool defending = targetPlayer ? gs.playerDefending : gs.companionDefending;

    const auto attack = attackRoll(enemy.attackBonus, target.ac, defending);
    if (!attack.hit) {
        return enemy.name + " misses " + target.name + " " + rollText(attack.roll, attack.total) +
               ".";
    }
    const std::string damage = applyDamage(target, enemy.damage);
    const std::string verb = targetPlayer ? " strikes " : " lashes at ";
    return enemy.name + verb + target.name + " " + rollText(attack.roll, attack.total) + " for " +
           damage + " damage.";
}

void CombatController::clearRoundStances() {
    state().playerDefending = false;
    state().companionDefending = false;
}

// ============================================================================
// END OF COMBAT
// ============================================================================

std::optional<std::string> CombatController::endCombatIfNeeded() {
    auto& gs = state();
    if (gs.enemies.empty()) {
        return std::nullopt;
    }

    const bool allDown = std::all_of(gs.enemies.begin(), gs.enemies.end(),
                                     [](const Enemy& enemy) { return enemy.isDown(); });
    if (!allDown) {
        if (gs.player.isDown()) {
            gs.gameOver = true;
            COMBAT_INFO(gs.player.name + " fell in " + gs.roomId);
            return std::string("You collapse from your wounds. The darkness claims another victim.");
        }
        return std::nullopt;
    }

    gs.inCombat = false;
    gs.flags.markDefeated(gs.roomId);

    int totalXp = 0;
    for (const auto& enemy : gs.enemies) {
        totalXp += registry().getMobProfile(gs.campaignId, enemy.name).xp;
    }

    std::vector<CorpseRecord> corpses;
    std::vector<std::string> corpseNames;
    corpses.reserve(gs.enemies.size());
    for (const auto& enemy : gs.enemies) {
        CorpseRecord record;
        record.id = gs.flags.takeCorpseId();
        record.name = enemy.name;
        corpseNames.push_back(std::to_string(record.id) + ". " + record.name);
        corpses.push_back(std::move(record));
    }
    gs.flags.corpses[gs.roomId] = std::move(corpses);
    gs.enemies.clear();
    COMBAT_INFO("Victory in " + gs.roomId + ", " + std::to_string(corpseNames.size()) +
                " corpses");

    std::vector<std::string> parts;
    parts.push_back("The foes fall. Corpses: " + TextUtils::join(corpseNames, ", ") +
                    ". You can 'loot <number>' or 'loot all'. The way forward is clear.");
    if (totalXp > 0) {
        parts.push_back("XP +" + std::to_string(totalXp) + ".");
        auto levelMessages = m_progression.grantXp(totalXp);
        parts.insert(parts.end(), levelMessages.begin(), levelMessages.end());
    }
    return TextUtils::join(parts, " ");
}

// ============================================================================
// HELPERS
// ============================================================================

CombatController::TargetLookup CombatController::selectEnemy(const std::string& query) {
    boost::container::small_vector<Enemy*, 8> alive;
    for (auto& enemy : state().enemies) {
        if (!enemy.isDown()) {
            alive.push_back(&enemy);
        }
    }
    if (alive.empty()) {
        return {nullptr, "There's nothing to attack."};
    }

    const std::string token = TextUtils::toLower(TextUtils::trim(query));
    if (token.empty()) {
        auto weakest = std::min_element(alive.begin(), alive.end(),
                                        [](const Enemy* a, const Enemy* b) { return a->hp < b->hp; });
        return {*weakest, {}};
    }
    if (TextUtils::isDigits(token)) {
        const size_t number = token.size() < 4 ? static_cast<size_t>(std::stoi(token)) : 0;
        if (number < 1 || number > alive.size()) {
            return {nullptr, "That target doesn't exist."};
        }
        return {alive[number - 1], {}};
    }

    Enemy* match = nullptr;
    int count = 0;
    for (Enemy* enemy : alive) {
        if (TextUtils::toLower(enemy->name).find(token) != std::string::npos) {
            match = enemy;
            ++count;
        }
    }
    if (count == 0) {
        return {nullptr, "No such target."};
    }
    if (count > 1) {
        return {nullptr, "Be more specific."};
    }
    return {match, {}};
}

CombatController::AttackRoll CombatController::attackRoll(int attackBonus, int targetAc,
                                                          bool targetDefending) {
    AttackRoll result;
    result.roll = dice().rollDie(20);
    result.total = result.roll + attackBonus;
    const int effectiveAc = targetAc + (targetDefending ? DEFEND_AC_BONUS : 0);
    result.hit = result.total >= effectiveAc;
    return result;
}

std::string CombatController::applyDamage(Combatant& target, const DiceExpr& damage, int bonus) {
    const auto roll = dice().roll(damage);
    std::string detail = roll.detail;
    if (bonus != 0) {
        detail += TextUtils::signedNumber(bonus);
    }
    const int amount = roll.total + bonus;
    target.applyDamage(amount);
    return std::to_string(amount) + " (" + detail + ")";
}
