/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "controllers/exploration/ExplorationController.hpp"
#include "controllers/inventory/InventoryController.hpp"
#include "core/Logger.hpp"
#include "entities/EntityFactory.hpp"
#include "managers/ContentRegistry.hpp"
#include "utils/TextUtils.hpp"
#include <algorithm>
#include <initializer_list>
#include <set>

using SoloAdventure::CorpseRecord;
using SoloAdventure::Room;
using SoloAdventure::RoomKind;
namespace TextUtils = SoloAdventure::TextUtils;

namespace {
    constexpr const char* LOOT_TAKEN_FLAG = "loot_taken";
    constexpr const char* LOOT_FAILED_FLAG = "loot_failed";

    bool isOneOf(const std::string& action, std::initializer_list<const char*> words) {
        return std::any_of(words.begin(), words.end(),
                           [&action](const char* word) { return action == word; });
    }

    std::string rollText(int roll, int total) {
        return "(roll " + std::to_string(roll) + " -> " + std::to_string(total) + ")";
    }
}

bool ExplorationController::isMoveWord(const std::string& action) {
    return isOneOf(action, {"leave", "move", "continue", "go"});
}

// ============================================================================
// ROOM ENTRY AND MOVEMENT
// ============================================================================

std::string ExplorationController::startRoom() {
    auto& gs = state();
    const Room& room = registry().getRoom(gs.campaignId, gs.roomId);
    gs.markVisited(room.id);

    if (room.kind == RoomKind::Combat && !gs.flags.isDefeated(room.id)) {
        if (gs.enemies.empty()) {
            gs.enemies = m_factory.createEnemies(gs.campaignId, room.enemyName);
        }
        gs.inCombat = true;
        EXPLORE_INFO("Combat starts in " + room.id + " against " +
                     std::to_string(gs.enemies.size()) + " x " + room.enemyName);
        const std::string foes = room.enemyName.empty() ? "enemies" : room.enemyName;
        return "A fight breaks out with " + foes + ".";
    }
    return room.description;
}

std::vector<std::string> ExplorationController::exitDestinations() const {
    const auto& exits = registry().getExits(state().campaignId, state().roomId);
    std::set<std::string> unique;
    for (const auto& [word, target] : exits) {
        unique.insert(target);
    }
    return {unique.begin(), unique.end()};
}

ActionOutcome ExplorationController::move(const std::string& rawDestination) {
    auto& gs = state();
    const std::string destination = TextUtils::toLower(TextUtils::trim(rawDestination));
    const auto& exits = registry().getExits(gs.campaignId, gs.roomId);

    std::string target;
    if (auto it = exits.find(destination); it != exits.end()) {
        target = it->second;
    } else {
        for (const auto& [word, roomId] : exits) {
            if (roomId == destination) {
                target = roomId;
                break;
            }
        }
    }

    // Rooms without an exit map follow the campaign's room order
    if (target.empty() && exits.empty()) {
        auto next = registry().nextRoomId(gs.campaignId, gs.roomId);
        if (next && (destination == *next || isOneOf(destination, {"forward", "next", "onward"}))) {
            target = *next;
        } else if (next) {
            return ActionOutcome::fail("Can't go that way. Options: " + *next + ".");
        }
    }

    if (target.empty()) {
        if (!exits.empty()) {
            return ActionOutcome::fail("Can't go that way. Options: " +
                                       TextUtils::join(exitDestinations(), ", ") + ".");
        }
        return ActionOutcome::fail("There's nowhere to go from here.");
    }

    EXPLORE_DEBUG("Moving " + gs.roomId + " -> " + target);
    gs.roomId = target;
    return ActionOutcome::ok(startRoom());
}

// ============================================================================
// ROOM ACTIONS
// ============================================================================

ActionOutcome ExplorationController::applyAction(const std::string& rawAction) {
    const std::string action = TextUtils::toLower(TextUtils::trim(rawAction));
    const Room& room = registry().getRoom(state().campaignId, state().roomId);

    switch (room.kind) {
    case RoomKind::Social:
        return handleSocialRoom(room, action);
    case RoomKind::Loot:
        return handleLootRoom(room, action);
    case RoomKind::Combat:
        return handleDefeatedCombatRoom(room, action);
    case RoomKind::Passage:
        if (isOneOf(action, {"search", "inspect", "look"})) {
            return ActionOutcome::ok(room.description);
        }
        return ActionOutcome::ok("You press onward.");
    }
    return ActionOutcome::ok("The ruins are quiet.");
}

ActionOutcome ExplorationController::handleSocialRoom(const Room& room, const std::string& action) {
    auto& gs = state();
    const auto& cfg = room.social;

    if (isOneOf(action, {"talk", "speak", "parley", "approach"})) {
        const auto check = dice().check(gs.player.stat(cfg.stat), cfg.dc);
        gs.flags.setMarker(cfg.doneFlag);
        if (check.success && !cfg.successFlag.empty()) {
            gs.flags.setMarker(cfg.successFlag);
        }
        EXPLORE_DEBUG("Social check in " + room.id + ": " + std::to_string(check.total) + " vs DC " +
                      std::to_string(cfg.dc));

        const std::string& templ = check.success ? cfg.successMessage : cfg.failMessage;
        if (!templ.empty()) {
            return ActionOutcome::ok(TextUtils::formatRollTemplate(templ, check.roll, check.total));
        }
        return ActionOutcome::ok((check.success ? "You succeed " : "You fail ") +
                                 rollText(check.roll, check.total) + ".");
    }
    if (isMoveWord(action)) {
        return ActionOutcome::ok("You prepare to move on.");
    }
    const std::string npc = room.npc.empty() ? "Someone" : room.npc;
    return ActionOutcome::ok(npc + " waits, watching for your move.");
}

ActionOutcome ExplorationController::handleLootRoom(const Room& room, const std::string& action) {
    auto& gs = state();
    const auto& cfg = room.loot;

    if (isOneOf(action, {"search", "open", "loot", "inspect"})) {
        if (gs.flags.marker(LOOT_TAKEN_FLAG)) {
            return ActionOutcome::fail("The chest is already open and empty.");
        }

        const auto check = dice().check(gs.player.stat(cfg.stat), cfg.dc);
        if (!check.success) {
            gs.flags.setMarker(LOOT_FAILED_FLAG);
            if (!cfg.failMessage.empty()) {
                return ActionOutcome::ok(
                    TextUtils::formatRollTemplate(cfg.failMessage, check.roll, check.total));
            }
            return ActionOutcome::ok("Your tools slip " + rollText(check.roll, check.total) +
                                     ". The lock resists for now.");
        }

        std::string fullMessage;
        const std::string& winItemId = cfg.winItemId.empty() ? room.lootItemId : cfg.winItemId;
        if (!winItemId.empty()) {
            auto added = m_inventory.addItem(registry().itemFromId(gs.campaignId, winItemId));
            if (!added.success) {
                fullMessage = "You force the lock " + rollText(check.roll, check.total) +
                              " but inventory is full. You leave the prize behind.";
            }
        }
        gs.flags.setMarker(LOOT_TAKEN_FLAG);
        if (cfg.gameOver) {
            gs.gameOver = true;
        }
        EXPLORE_INFO("Loot room " + room.id + " opened");

        if (!fullMessage.empty()) {
            return ActionOutcome::ok(fullMessage);
        }
        if (!cfg.successMessage.empty()) {
            return ActionOutcome::ok(
                TextUtils::formatRollTemplate(cfg.successMessage, check.roll, check.total));
        }
        return ActionOutcome::ok("You work the lock free " + rollText(check.roll, check.total) +
                                 ".");
    }
    if (isMoveWord(action)) {
        return ActionOutcome::ok("There's nowhere left to go but the chest.");
    }
    return ActionOutcome::ok("Wind whistles through the spire. The chest waits.");
}

ActionOutcome ExplorationController::handleDefeatedCombatRoom(const Room& room,
                                                              const std::string& action) {
    if (!state().flags.isDefeated(room.id)) {
        return ActionOutcome::ok("The enemy blocks your way, ready to strike.");
    }
    if (TextUtils::startsWith(action, "loot")) {
        return lootCorpses(room, TextUtils::trim(action.substr(4)));
    }
    if (isOneOf(action, {"search", "inspect"})) {
        return ActionOutcome::ok("You search the " + TextUtils::toLower(room.name) +
                                 ". Most supplies are rotted or picked clean.");
    }
    return ActionOutcome::ok("The room falls silent after the fight.");
}

ActionOutcome ExplorationController::lootCorpses(const Room& room, const std::string& target) {
    auto& gs = state();
    auto found = gs.flags.corpses.find(room.id);
    if (found == gs.flags.corpses.end() || found->second.empty()) {
        return ActionOutcome::fail("Nothing here to loot.");
    }

    std::vector<CorpseRecord*> selected;
    for (auto& record : found->second) {
        if (!record.looted) {
            selected.push_back(&record);
        }
    }
    if (selected.empty()) {
        return ActionOutcome::fail("You already searched the corpses.");
    }

    if (TextUtils::isDigits(target)) {
        const size_t number = target.size() < 4 ? static_cast<size_t>(std::stoi(target)) : 0;
        if (number < 1 || number > selected.size()) {
            return ActionOutcome::fail("That corpse does not exist.");
        }
        selected = {selected[number - 1]};
    } else if (!target.empty() && target != "all") {
        std::vector<CorpseRecord*> matches;
        for (CorpseRecord* record : selected) {
            if (TextUtils::toLower(record->name).find(target) != std::string::npos) {
                matches.push_back(record);
            }
        }
        if (matches.empty()) {
            return ActionOutcome::fail("No such corpse.");
        }
        if (matches.size() > 1) {
            return ActionOutcome::fail("Be more specific.");
        }
        selected = std::move(matches);
    } else if (target.empty() && selected.size() > 1) {
        return ActionOutcome::fail("Multiple corpses here. Use 'loot <number>' or 'loot all'.");
    }

    int totalGold = 0;
    std::vector<std::string> itemTexts;
    for (CorpseRecord* record : selected) {
        const auto loot = m_inventory.rollLoot(record->name);
        totalGold += loot.gold;
        if (loot.itemId) {
            const auto item = registry().itemFromId(gs.campaignId, *loot.itemId);
            if (m_inventory.addItem(item).success) {
                itemTexts.push_back("You find " + item.name + ".");
            } else {
                itemTexts.push_back("You spot " + item.name + ", but inventory is full.");
            }
        }
        record->looted = true;
    }
    gs.player.gold += totalGold;
    EXPLORE_DEBUG("Looted " + std::to_string(selected.size()) + " corpses for " +
                  std::to_string(totalGold) + " gold");

    if (totalGold == 0 && itemTexts.empty()) {
        return ActionOutcome::ok("You search the corpse but find nothing.");
    }
    std::string message = "You loot the corpse and gain " + std::to_string(totalGold) + " gold.";
    if (!itemTexts.empty()) {
        message += " " + TextUtils::join(itemTexts, " ");
    }
    return ActionOutcome::ok(message);
}
