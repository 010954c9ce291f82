/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef PROGRESSION_CONTROLLER_HPP
#define PROGRESSION_CONTROLLER_HPP

/**
 * @file ProgressionController.hpp
 * @brief XP, level-ups, resting and the deferred spell-choice queue
 *
 * Level-ups never block on a choice. When a level offers new spells a
 * PendingDecision is queued on the GameState; the caller presents it and
 * answers through resolvePendingDecision().
 *
 * Ownership: GameSession owns the controller instance.
 */

#include "controllers/ControllerBase.hpp"
#include <string>
#include <vector>

/**
 * @brief What a rest did, plus the decisions still waiting for an answer
 */
struct RestOutcome {
    std::string message;
    std::vector<SoloAdventure::PendingDecision> pendingDecisions;

    [[nodiscard]] bool hasPendingDecisions() const { return !pendingDecisions.empty(); }
};

class ProgressionController : public ControllerBase {
public:
    ProgressionController(SoloAdventure::GameState& state, const ContentRegistry& registry,
                          SoloAdventure::Dice& dice)
        : ControllerBase(state, registry, dice) {}

    ~ProgressionController() override = default;

    [[nodiscard]] std::string_view getName() const override { return "ProgressionController"; }

    /**
     * @brief Add XP and apply every level-up it pays for
     * @return One "Level up!" line per level gained
     */
    std::vector<std::string> grantXp(int amount);

    // Level is below the table length and XP reaches the next threshold
    [[nodiscard]] bool canLevelUp() const;

    /**
     * @brief +1 mana (capped) for the player and every companion with a pool
     * @return Total mana gained across the party
     */
    int regeneratePartyMana(int amount = 1);

    /**
     * @brief One rest action
     *
     * Regenerates mana, and every second consecutive rest heals 1 HP to each
     * wounded party member and restarts the streak.
     */
    RestOutcome rest();

    void resetRestStreak() { state().restStreak = 0; }

    [[nodiscard]] bool hasPendingDecision() const { return !state().pendingDecisions.empty(); }

    // "Choose a new spell (level 2): Magic Missile, Shield, Sleep"
    [[nodiscard]] std::string describePendingDecision() const;

    /**
     * @brief Answer the oldest queued decision
     * @param option 1-based option number or option name (case-insensitive)
     */
    ActionOutcome resolvePendingDecision(const std::string& option);

private:
    std::string applyLevelUp();
};

#endif // PROGRESSION_CONTROLLER_HPP
