/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "controllers/progression/ProgressionController.hpp"
#include "core/Logger.hpp"
#include "managers/ContentRegistry.hpp"
#include "utils/TextUtils.hpp"
#include <algorithm>

using SoloAdventure::PendingDecision;
namespace TextUtils = SoloAdventure::TextUtils;

std::vector<std::string> ProgressionController::grantXp(int amount) {
    std::vector<std::string> messages;
    if (amount <= 0) {
        return messages;
    }
    state().player.xp += amount;
    PROGRESSION_DEBUG("Granted " + std::to_string(amount) + " XP, total " +
                      std::to_string(state().player.xp));
    while (canLevelUp()) {
        messages.push_back(applyLevelUp());
    }
    return messages;
}

bool ProgressionController::canLevelUp() const {
    const auto& table = registry().xpTable();
    const int level = state().player.level;
    if (level < 1 || static_cast<size_t>(level) >= table.size()) {
        return false;
    }
    // table[i] is the XP needed for level i + 1
    return state().player.xp >= table[static_cast<size_t>(level)];
}

std::string ProgressionController::applyLevelUp() {
    auto& player = state().player;
    const auto& profile = registry().getClassProfile(player.className);

    player.level += 1;
    player.maxHp += profile.hpPerLevel;
    player.hp = std::min(player.maxHp, player.hp + profile.hpPerLevel);
    if (player.level % 2 == 0) {
        player.attackBonus += 1;
    }
    if (profile.isCaster()) {
        player.maxMana += 2;
        player.mana = player.maxMana;
    }

    auto choices = registry().spellChoicesForLevel(player.className, player.level,
                                                   player.learnedSpells);
    if (!choices.empty()) {
        PendingDecision decision;
        decision.type = "spell";
        decision.choices = std::move(choices);
        decision.level = player.level;
        state().pendingDecisions.push_back(std::move(decision));
    }

    PROGRESSION_INFO(player.name + " reached level " + std::to_string(player.level));
    return "Level up! " + player.name + " is now level " + std::to_string(player.level) + ".";
}

int ProgressionController::regeneratePartyMana(int amount) {
    int gained = SoloAdventure::regenerateMana(state().player, amount);
    for (auto& companion : state().companions) {
        gained += SoloAdventure::regenerateMana(companion, amount);
    }
    return gained;
}

RestOutcome ProgressionController::rest() {
    auto& gs = state();
    std::vector<std::string> parts;

    const int manaGained = regeneratePartyMana(1);
    int hpGained = 0;
    gs.restStreak += 1;
    if (gs.restStreak >= 2) {
        hpGained += gs.player.heal(1);
        for (auto& companion : gs.companions) {
            hpGained += companion.heal(1);
        }
        gs.restStreak = 0;
    }

    parts.emplace_back("You rest and regain your focus.");
    if (manaGained > 0) {
        parts.push_back("Mana +" + std::to_string(manaGained) + ".");
    }
    if (hpGained > 0) {
        parts.push_back("HP +" + std::to_string(hpGained) + ".");
    }

    RestOutcome outcome;
    outcome.message = TextUtils::join(parts, " ");
    outcome.pendingDecisions.assign(gs.pendingDecisions.begin(), gs.pendingDecisions.end());
    return outcome;
}

std::string ProgressionController::describePendingDecision() const {
    if (state().pendingDecisions.empty()) {
        return {};
    }
    const auto& decision = state().pendingDecisions.front();
    return "Choose a new " + decision.type + " (level " + std::to_string(decision.level) +
           "): " + TextUtils::join(decision.choices, ", ");
}

ActionOutcome ProgressionController::resolvePendingDecision(const std::string& option) {
    auto& queue = state().pendingDecisions;
    // Drop exhausted entries so they never block the queue
    while (!queue.empty() && queue.front().choices.empty()) {
        queue.pop_front();
    }
    if (queue.empty()) {
        return ActionOutcome::fail("There is nothing to choose right now.");
    }

    const auto& decision = queue.front();
    const std::string wanted = TextUtils::toLower(TextUtils::trim(option));
    std::string picked;
    if (TextUtils::isDigits(wanted) && wanted.size() < 4) {
        const size_t number = static_cast<size_t>(std::stoi(wanted));
        if (number >= 1 && number <= decision.choices.size()) {
            picked = decision.choices[number - 1];
        }
    } else {
        for (const auto& choice : decision.choices) {
            if (TextUtils::toLower(choice) == wanted) {
                picked = choice;
                break;
            }
        }
    }
    if (picked.empty()) {
        return ActionOutcome::fail("Choose one of: " + TextUtils::join(decision.choices, ", ") + ".");
    }

    queue.pop_front();
    state().player.learnedSpells.push_back(picked);
    PROGRESSION_INFO(state().player.name + " learned " + picked);
    return ActionOutcome::ok("You learn " + picked + ".");
}
