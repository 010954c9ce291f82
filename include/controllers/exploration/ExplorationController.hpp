/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef EXPLORATION_CONTROLLER_HPP
#define EXPLORATION_CONTROLLER_HPP

/**
 * @file ExplorationController.hpp
 * @brief Room entry, movement and the per-room-kind action handlers
 *
 * Dispatch depends only on the current room's kind:
 * - Social: one stat check against the room's NPC or obstacle
 * - Loot: a locked container, retryable until opened
 * - Combat: corpse looting once the room's enemies are defeated
 * - Passage: flavor only
 *
 * Ownership: GameSession owns the controller instance.
 */

#include "controllers/ControllerBase.hpp"
#include <string>
#include <vector>

class EntityFactory;
class InventoryController;

class ExplorationController : public ControllerBase {
public:
    ExplorationController(SoloAdventure::GameState& state, const ContentRegistry& registry,
                          SoloAdventure::Dice& dice, EntityFactory& factory,
                          InventoryController& inventory)
        : ControllerBase(state, registry, dice), m_factory(factory), m_inventory(inventory) {}

    ~ExplorationController() override = default;

    [[nodiscard]] std::string_view getName() const override { return "ExplorationController"; }

    /**
     * @brief Enter the current room
     * @return Room description, or the fight announcement
     *
     * An undefeated combat room spawns its enemies (once) and switches the
     * state into combat. Defeated rooms never spawn again.
     */
    std::string startRoom();

    /**
     * @brief Resolve an exploration action in the current room
     * @param action Normalized, lower-case action text
     *
     * Failed outcomes (bad corpse reference, nothing left to loot) change
     * nothing.
     */
    ActionOutcome applyAction(const std::string& action);

    /**
     * @brief Move along an exit, by exit word or by destination room id
     * @return The entry text of the new room, or the available options
     */
    ActionOutcome move(const std::string& destination);

    // Sorted unique destination room ids of the current room
    [[nodiscard]] std::vector<std::string> exitDestinations() const;

    [[nodiscard]] static bool isMoveWord(const std::string& action);

private:
    ActionOutcome handleSocialRoom(const SoloAdventure::Room& room, const std::string& action);
    ActionOutcome handleLootRoom(const SoloAdventure::Room& room, const std::string& action);
    ActionOutcome handleDefeatedCombatRoom(const SoloAdventure::Room& room,
                                           const std::string& action);
    ActionOutcome lootCorpses(const SoloAdventure::Room& room, const std::string& target);

    EntityFactory& m_factory;
    InventoryController& m_inventory;
};

#endif // EXPLORATION_CONTROLLER_HPP
