/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef CONTROLLER_BASE_HPP
#define CONTROLLER_BASE_HPP

/**
 * @file ControllerBase.hpp
 * @brief Base class for the rules controllers
 *
 * Controllers are session-scoped helpers that resolve one family of player
 * actions against the GameState. They do NOT own data and should NOT
 * contain console or narration logic.
 *
 * Key characteristics:
 * - Owned by GameSession (not singletons)
 * - Borrow the state, the content registry and the dice for their lifetime
 * - Report user-input errors as a failed ActionOutcome, never by throwing
 *
 * A failed outcome leaves the state untouched and does not consume a turn.
 */

#include "core/Dice.hpp"
#include "core/GameState.hpp"
#include <string>
#include <string_view>
#include <utility>

class ContentRegistry;

/**
 * @brief Result of a player-facing rules operation
 */
struct ActionOutcome {
    bool success{false};
    std::string message;

    static ActionOutcome ok(std::string text) { return {true, std::move(text)}; }
    static ActionOutcome fail(std::string text) { return {false, std::move(text)}; }
};

class ControllerBase
{
public:
    virtual ~ControllerBase() = default;

    // Non-copyable (holds references into the session)
    ControllerBase(const ControllerBase&) = delete;
    ControllerBase& operator=(const ControllerBase&) = delete;

    /**
     * @brief Get controller name for debugging
     */
    [[nodiscard]] virtual std::string_view getName() const = 0;

    [[nodiscard]] SoloAdventure::GameState& state() { return m_state; }
    [[nodiscard]] const SoloAdventure::GameState& state() const { return m_state; }

protected:
    ControllerBase(SoloAdventure::GameState& state, const ContentRegistry& registry,
                   SoloAdventure::Dice& dice)
        : m_state(state), m_registry(registry), m_dice(dice) {}

    [[nodiscard]] const ContentRegistry& registry() const { return m_registry; }
    [[nodiscard]] SoloAdventure::Dice& dice() const { return m_dice; }

private:
    SoloAdventure::GameState& m_state;
    const ContentRegistry& m_registry;
    SoloAdventure::Dice& m_dice;
};

#endif // CONTROLLER_BASE_HPP
