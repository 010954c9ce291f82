/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef INVENTORY_CONTROLLER_HPP
#define INVENTORY_CONTROLLER_HPP

/**
 * @file InventoryController.hpp
 * @brief Capacity-limited pack, the six equipment slots and derived AC
 *
 * InventoryController handles:
 * - Capacity checks (quest items never count toward the limit)
 * - Item lookup by number, name, id or kind word ("potion", "armor")
 * - Potion use with player/companion target selection
 * - Equip/unequip with slot swapping and AC recomputation
 * - Loot rolls against a mob's loot table
 *
 * Ownership: GameSession owns the controller instance.
 */

#include "controllers/ControllerBase.hpp"
#include <optional>
#include <string>

class InventoryController : public ControllerBase {
public:
    InventoryController(SoloAdventure::GameState& state, const ContentRegistry& registry,
                        SoloAdventure::Dice& dice)
        : ControllerBase(state, registry, dice) {}

    ~InventoryController() override = default;

    [[nodiscard]] std::string_view getName() const override { return "InventoryController"; }

    // ========================================================================
    // CAPACITY
    // ========================================================================

    /**
     * @brief Number of carried items that count toward the inventory limit
     */
    [[nodiscard]] int usedCapacity() const;

    [[nodiscard]] bool canAdd(const SoloAdventure::ItemDefinition& item) const;

    /**
     * @brief Append an item to the pack
     * @return "Added <name> to your pack." or "Inventory is full."
     */
    ActionOutcome addItem(const SoloAdventure::ItemDefinition& item);

    // ========================================================================
    // LOOKUP AND USE
    // ========================================================================

    struct ItemMatch {
        std::optional<size_t> index; // position in GameState::inventory
        std::string error;
    };

    /**
     * @brief Resolve a free-text query against the pack
     * @param query Exact name/id, a substring of the name, or a kind word
     * @param kindFilter Only items of this kind are considered
     *
     * More than one match is an error listing the candidates.
     */
    [[nodiscard]] ItemMatch findItem(const std::string& query,
                                     std::optional<SoloAdventure::ItemKind> kindFilter =
                                         std::nullopt) const;

    /**
     * @brief Drink a healing potion
     * @param query Item query, potions only
     * @param target Optional target keyword or companion name
     *
     * Without a recognised target the side with the lower HP ratio is healed
     * (ties favour the player, a downed companion is never picked).
     */
    ActionOutcome useItem(const std::string& query, const std::string& target = "");

    // ========================================================================
    // EQUIPMENT
    // ========================================================================

    /**
     * @brief Equip armor by 1-based inventory number or by name
     *
     * Any item already in the slot goes back into the pack, so the swap
     * fails when the pack is full.
     */
    ActionOutcome equip(const std::string& query);

    ActionOutcome unequip(const std::string& slotName);

    [[nodiscard]] int equipmentAcBonus() const;

    // player.ac = player.baseAc + equipment bonus
    void syncArmorClass();

    /**
     * @brief Remove the campaign's quest items from pack and equipment
     */
    void stripQuestItems();

    // ========================================================================
    // LOOT
    // ========================================================================

    struct LootRoll {
        int gold{0};
        std::optional<std::string> itemId;
    };

    /**
     * @brief Roll a defeated mob's loot table: gold dice first, then the item index
     */
    LootRoll rollLoot(const std::string& mobName);

    // ========================================================================
    // DISPLAY
    // ========================================================================

    // "Inventory: Healing Potion x3, Leather Cap"
    [[nodiscard]] std::string formatInventory() const;
    [[nodiscard]] std::string formatInventoryDetailed() const;
    [[nodiscard]] std::string formatEquipment() const;
    [[nodiscard]] std::string formatGold() const;
};

#endif // INVENTORY_CONTROLLER_HPP
