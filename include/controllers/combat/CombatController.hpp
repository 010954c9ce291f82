/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef COMBAT_CONTROLLER_HPP
#define COMBAT_CONTROLLER_HPP

/**
 * @file CombatController.hpp
 * @brief Turn-based combat rounds for the party against the room's enemies
 *
 * CombatController handles:
 * - Player actions: attack, defend, class special, cast
 * - Companion AI (defend when low, best damage spell, else melee)
 * - Enemy AI per mob policy (focus weakest / player / companion)
 * - End-of-combat detection: corpses, XP, defeat
 *
 * One round = player, companion, each living enemy, clear defend stances,
 * end-of-combat check, then +1 mana for every caster in the party.
 *
 * Ownership: GameSession owns the controller instance.
 */

#include "controllers/ControllerBase.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

class ProgressionController;

enum class CombatCommand : uint8_t {
    Attack,
    Defend,
    Special, // class special: power strike, precise strike or best damage spell
    Cast     // a named learned spell
};

class CombatController : public ControllerBase
{
public:
    CombatController(SoloAdventure::GameState& state, const ContentRegistry& registry,
                     SoloAdventure::Dice& dice, ProgressionController& progression)
        : ControllerBase(state, registry, dice), m_progression(progression) {}

    ~CombatController() override = default;

    [[nodiscard]] std::string_view getName() const override { return "CombatController"; }

    // --- Round flow ---

    /**
     * @brief Resolve a full round started by a player command
     * @param command Player action
     * @param target Optional enemy number (among living enemies) or name
     * @param spell Spell name for CombatCommand::Cast
     * @return Failed outcome (nothing changed) or the joined round log
     */
    ActionOutcome runRound(CombatCommand command, const std::string& target = "",
                           const std::string& spell = "");

    /**
     * @brief Finish a round whose player step already happened elsewhere
     * @param playerResult Text of the player's step (e.g. drinking a potion)
     *
     * Used by item use in combat, which consumes the round.
     */
    std::string finishRound(const std::string& playerResult);

    // --- Individual steps ---

    ActionOutcome playerTurn(CombatCommand command, const std::string& target = "",
                             const std::string& spell = "");

    // nullopt when the party has no companion
    std::optional<std::string> companionTurn();

    std::vector<std::string> enemyTurn();

    void clearRoundStances();

    /**
     * @brief Victory or defeat check
     * @return Report text, or nullopt when combat goes on or was already settled
     *
     * Victory is checked first. Once the enemy list has been cleared the
     * call is a no-op.
     */
    std::optional<std::string> endCombatIfNeeded();

    // --- Helpers ---

    struct TargetLookup {
        SoloAdventure::Enemy* enemy{nullptr};
        std::string error;
    };

    /**
     * @brief Pick a living enemy by 1-based number, name substring or, when
     *        the query is empty, the lowest current HP
     */
    TargetLookup selectEnemy(const std::string& query);

    static constexpr int DEFEND_AC_BONUS{2};
    static constexpr int MANA_REGEN_PER_ROUND{1};

private:
    struct AttackRoll {
        bool hit{false};
        int roll{0};
        int total{0};
    };

    AttackRoll attackRoll(int attackBonus, int targetAc, bool targetDefending);

    // Rolls damage, applies it, returns "<damage> (<detail>)"
    std::string applyDamage(SoloAdventure::Combatant& target,
                            const SoloAdventure::DiceExpr& damage, int bonus = 0);

    ActionOutcome castDamageSpell(const SoloAdventure::SpellDefinition& spell,
                                  SoloAdventure::Enemy& target);

    std::string enemyAttack(SoloAdventure::Enemy& enemy, bool targetPlayer);

    ProgressionController& m_progression;
};

#endif // COMBAT_CONTROLLER_HPP
