/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "controllers/inventory/InventoryController.hpp"
#include "core/Logger.hpp"
#include "managers/ContentRegistry.hpp"
#include "utils/TextUtils.hpp"
#include <algorithm>
#include <vector>

using SoloAdventure::EquipSlot;
using SoloAdventure::ItemDefinition;
using SoloAdventure::ItemKind;
namespace TextUtils = SoloAdventure::TextUtils;

namespace {
    bool matchesKindWord(ItemKind kind, const std::string& query) {
        if (kind == ItemKind::Potion) {
            return query == "potion" || query == "healing" || query == "heal";
        }
        if (kind == ItemKind::Armor) {
            return query == "armor" || query == "armour";
        }
        return false;
    }
}

// ============================================================================
// CAPACITY
// ============================================================================

int InventoryController::usedCapacity() const {
    const auto& inventory = state().inventory;
    return static_cast<int>(std::count_if(inventory.begin(), inventory.end(),
                                          [](const ItemDefinition& item) {
                                              return item.countsTowardLimit;
                                          }));
}

bool InventoryController::canAdd(const ItemDefinition& item) const {
    if (!item.countsTowardLimit) {
        return true;
    }
    return usedCapacity() < state().inventoryLimit;
}

ActionOutcome InventoryController::addItem(const ItemDefinition& item) {
    if (!canAdd(item)) {
        INVENTORY_DEBUG("Rejected " + item.id + ": inventory at limit " +
                        std::to_string(state().inventoryLimit));
        return ActionOutcome::fail("Inventory is full.");
    }
    state().inventory.push_back(item);
    return ActionOutcome::ok("Added " + item.name + " to your pack.");
}

// ============================================================================
// LOOKUP AND USE
// ============================================================================

InventoryController::ItemMatch
InventoryController::findItem(const std::string& rawQuery,
                              std::optional<ItemKind> kindFilter) const {
    const std::string query = TextUtils::toLower(TextUtils::trim(rawQuery));
    if (query.empty()) {
        return {std::nullopt, "Use what?"};
    }

    const auto& inventory = state().inventory;
    std::vector<size_t> matches;
    for (size_t i = 0; i < inventory.size(); ++i) {
        const auto& item = inventory[i];
        if (kindFilter && item.kind != *kindFilter) {
            continue;
        }
        const std::string name = TextUtils::toLower(item.name);
        const std::string id = TextUtils::toLower(item.id);
        if (query == id || name.find(query) != std::string::npos ||
            matchesKindWord(item.kind, query)) {
            matches.push_back(i);
        }
    }

    if (matches.empty()) {
        return {std::nullopt, "You don't have that."};
    }
    // Copies of one item are interchangeable
    const bool sameItem = std::all_of(matches.begin(), matches.end(), [&](size_t idx) {
        return inventory[idx].id == inventory[matches.front()].id;
    });
    if (matches.size() > 1 && !sameItem) {
        std::vector<std::string> names;
        names.reserve(matches.size());
        for (size_t idx : matches) {
            names.push_back(inventory[idx].name);
        }
        return {std::nullopt,
                "Be more specific or use an item number: " + TextUtils::join(names, ", ")};
    }
    return {matches.front(), {}};
}

ActionOutcome InventoryController::useItem(const std::string& query, const std::string& target) {
    auto match = findItem(query, ItemKind::Potion);
    if (!match.index) {
        return ActionOutcome::fail(match.error);
    }

    auto& gs = state();
    const ItemDefinition item = gs.inventory[*match.index];
    if (item.kind != ItemKind::Potion) {
        return ActionOutcome::fail(item.name + " can't be used right now.");
    }
    if (item.effect.type != SoloAdventure::EffectType::Heal) {
        return ActionOutcome::fail(item.name + " has no usable effect yet.");
    }

    SoloAdventure::Companion* companion = gs.activeCompanion();
    const std::string key = TextUtils::toLower(TextUtils::trim(target));
    const bool companionKeyword =
        key == "companion" || key == "her" || key == "him" ||
        (companion && !key.empty() && key == TextUtils::toLower(companion->name));
    const bool playerKeyword = key == "me" || key == "self" || key == "player" || key == "you";

    SoloAdventure::Combatant* recipient = &gs.player;
    if (companionKeyword) {
        if (!companion) {
            return ActionOutcome::fail("You have no companion with you.");
        }
        recipient = companion;
    } else if (!playerKeyword && companion && !companion->isDown() &&
               companion->hpRatio() < gs.player.hpRatio()) {
        recipient = companion;
    }

    const std::string healDice = item.effect.healDice.empty() ? "1d6" : item.effect.healDice;
    const auto roll = dice().roll(healDice);
    const int healed = recipient->heal(roll.total);

    gs.inventory.erase(gs.inventory.begin() + static_cast<std::ptrdiff_t>(*match.index));
    INVENTORY_DEBUG("Used " + item.id + " on " + recipient->name);
    return ActionOutcome::ok("You use " + item.name + " on " + recipient->name + ", healing " +
                             std::to_string(healed) + " (" + roll.detail + ").");
}

// ============================================================================
// EQUIPMENT
// ============================================================================

ActionOutcome InventoryController::equip(const std::string& rawQuery) {
    auto& gs = state();
    const std::string query = TextUtils::trim(rawQuery);

    size_t index = 0;
    if (TextUtils::isDigits(query)) {
        const long number = query.size() < 6 ? std::stol(query) : 0;
        if (number < 1 || static_cast<size_t>(number) > gs.inventory.size()) {
            return ActionOutcome::fail("That item number does not exist.");
        }
        index = static_cast<size_t>(number - 1);
        if (gs.inventory[index].kind != ItemKind::Armor) {
            return ActionOutcome::fail("That item is not armor.");
        }
    } else {
        auto match = findItem(query, ItemKind::Armor);
        if (!match.index) {
            return ActionOutcome::fail(match.error);
        }
        index = *match.index;
    }

    const ItemDefinition item = gs.inventory[index];
    if (!item.slot) {
        return ActionOutcome::fail("That armor can't be equipped.");
    }

    auto& slot = gs.equipped(*item.slot);
    std::optional<ItemDefinition> previous = slot;
    if (previous && !canAdd(*previous)) {
        return ActionOutcome::fail("Inventory is full; unequip something first.");
    }

    gs.inventory.erase(gs.inventory.begin() + static_cast<std::ptrdiff_t>(index));
    if (previous) {
        gs.inventory.push_back(std::move(*previous));
    }
    slot = item;
    syncArmorClass();

    const std::string slotName(SoloAdventure::toString(*item.slot));
    INVENTORY_DEBUG("Equipped " + item.id + " to " + slotName + ", AC now " +
                    std::to_string(gs.player.ac));
    return ActionOutcome::ok("Equipped " + item.name + " to " + slotName + ".");
}

ActionOutcome InventoryController::unequip(const std::string& slotName) {
    auto slotKind = SoloAdventure::equipSlotFromString(TextUtils::trim(slotName));
    if (!slotKind) {
        return ActionOutcome::fail("Unknown equipment slot.");
    }

    auto& gs = state();
    auto& slot = gs.equipped(*slotKind);
    if (!slot) {
        return ActionOutcome::fail("That slot is already empty.");
    }
    if (!canAdd(*slot)) {
        return ActionOutcome::fail("Inventory is full.");
    }

    const ItemDefinition removed = *slot;
    gs.inventory.push_back(removed);
    slot.reset();
    syncArmorClass();
    return ActionOutcome::ok("Removed " + removed.name + " from " +
                             std::string(SoloAdventure::toString(*slotKind)) + ".");
}

int InventoryController::equipmentAcBonus() const {
    int bonus = 0;
    for (const auto& slot : state().equipment) {
        if (slot) {
            bonus += slot->armorBonus();
        }
    }
    return bonus;
}

void InventoryController::syncArmorClass() {
    state().player.ac = state().player.baseAc + equipmentAcBonus();
}

void InventoryController::stripQuestItems() {
    auto& gs = state();
    const auto questIds = registry().questItemIds(gs.campaignId);
    if (questIds.empty()) {
        return;
    }
    auto isQuest = [&questIds](const ItemDefinition& item) {
        return std::find(questIds.begin(), questIds.end(), item.id) != questIds.end();
    };

    const size_t before = gs.inventory.size();
    gs.inventory.erase(std::remove_if(gs.inventory.begin(), gs.inventory.end(), isQuest),
                       gs.inventory.end());
    for (auto& slot : gs.equipment) {
        if (slot && isQuest(*slot)) {
            slot.reset();
        }
    }
    INVENTORY_INFO("Stripped " + std::to_string(before - gs.inventory.size()) +
                   " quest items from the pack");
}

// ============================================================================
// LOOT
// ============================================================================

InventoryController::LootRoll InventoryController::rollLoot(const std::string& mobName) {
    LootRoll result;
    if (mobName.empty()) {
        return result;
    }
    const auto& loot = registry().getMobProfile(state().campaignId, mobName).loot;
    if (loot.gold) {
        result.gold = dice().roll(*loot.gold).total;
    }
    if (!loot.itemIds.empty()) {
        const int pick = dice().rollDie(static_cast<int>(loot.itemIds.size())) - 1;
        result.itemId = loot.itemIds[static_cast<size_t>(pick)];
    }
    return result;
}

// ============================================================================
// DISPLAY
// ============================================================================

std::string InventoryController::formatInventory() const {
    const auto& inventory = state().inventory;
    if (inventory.empty()) {
        return "Inventory: (empty)";
    }
    // Group by name, first-seen order
    std::vector<std::pair<std::string, int>> counts;
    for (const auto& item : inventory) {
        auto it = std::find_if(counts.begin(), counts.end(),
                               [&item](const auto& entry) { return entry.first == item.name; });
        if (it == counts.end()) {
            counts.emplace_back(item.name, 1);
        } else {
            ++it->second;
        }
    }
    std::vector<std::string> parts;
    parts.reserve(counts.size());
    for (const auto& [name, count] : counts) {
        parts.push_back(count > 1 ? name + " x" + std::to_string(count) : name);
    }
    return "Inventory: " + TextUtils::join(parts, ", ");
}

std::string InventoryController::formatInventoryDetailed() const {
    const auto& inventory = state().inventory;
    if (inventory.empty()) {
        return "Inventory (detailed): (empty)";
    }
    std::string text = "Inventory (detailed):";
    for (size_t i = 0; i < inventory.size(); ++i) {
        const auto& item = inventory[i];
        std::string tag(SoloAdventure::toString(item.kind));
        if (item.kind == ItemKind::Armor && item.slot) {
            tag += " " + std::string(SoloAdventure::toString(*item.slot));
        }
        text += "\n" + std::to_string(i + 1) + ". " + item.name + " [" + tag + "]";
    }
    return text;
}

std::string InventoryController::formatEquipment() const {
    std::string text = "Equipment:";
    for (EquipSlot slot : SoloAdventure::ALL_EQUIP_SLOTS) {
        const auto& item = state().equipped(slot);
        text += "\n- " + std::string(SoloAdventure::toString(slot)) + ": " +
                (item ? item->name : std::string("(empty)"));
    }
    return text;
}

std::string InventoryController::formatGold() const {
    return "Gold: " + std::to_string(state().player.gold);
}
