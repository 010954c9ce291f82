/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef GAME_SESSION_HPP
#define GAME_SESSION_HPP

#include "controllers/combat/CombatController.hpp"
#include "controllers/exploration/ExplorationController.hpp"
#include "controllers/inventory/InventoryController.hpp"
#include "controllers/progression/ProgressionController.hpp"
#include "core/Dice.hpp"
#include "core/GameConfig.hpp"
#include "core/GameState.hpp"
#include "entities/EntityFactory.hpp"
#include "managers/CharacterRoster.hpp"
#include "managers/NarrationManager.hpp"
#include "managers/SaveGameManager.hpp"

#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

class ContentRegistry;

// What one submitted line did
struct TurnResult {
  bool success{false};
  bool consumedTurn{false};
  std::string message;
  std::optional<NarrationResult> narration; // only for resolved turns
};

/**
 * @brief The control loop around the two state machines
 *
 * Owns the GameState and every controller that mutates it. submit() takes one
 * line of player input, dispatches on the combat flag, does the turn
 * bookkeeping, persists the state plus the roster entry and finally asks for
 * narration. Nothing in here reads from the console.
 */
class GameSession {
public:
  GameSession(const ContentRegistry &registry, SoloAdventure::RandomSource &random,
              SoloAdventure::GameConfig config,
              std::shared_ptr<NarrationBackend> narrationBackend = nullptr);
  ~GameSession() = default;

  GameSession(const GameSession &) = delete;
  GameSession &operator=(const GameSession &) = delete;

  /**
   * @brief Begin a fresh run in a campaign
   * @param inventory Starting items; empty means the default kit
   * @param companionIds Empty means the campaign's default companions
   * @return Entry text of the first room
   */
  std::string startNewGame(const std::string &campaignId, SoloAdventure::Character player,
                           std::vector<SoloAdventure::ItemDefinition> inventory = {},
                           SoloAdventure::Equipment equipment = {},
                           const std::vector<std::string> &companionIds = {});

  // Load the configured save file; the state is untouched unless Ok
  LoadStatus resume();

  TurnResult submit(const std::string &rawInput);

  // Advice from the active companion for the current situation
  std::optional<NarrationResult> companionSuggestion();

  // Save the game and sync the player into the roster
  bool save();

  std::string helpText() const;
  std::string statusLine() const;
  bool isOver() const { return m_state.gameOver; }

  /**
   * @brief Lower-case, trim and strip filler words after movement verbs
   *
   * "Go to the Cellar" -> "go cellar"
   */
  static std::string normalizeAction(const std::string &raw);

  SoloAdventure::GameState &state() { return m_state; }
  const SoloAdventure::GameState &state() const { return m_state; }
  const SoloAdventure::GameConfig &config() const { return m_config; }

  EntityFactory &entities() { return m_factory; }
  InventoryController &inventory() { return m_inventory; }
  ProgressionController &progression() { return m_progression; }
  CombatController &combat() { return m_combat; }
  ExplorationController &exploration() { return m_exploration; }
  SaveGameManager &saves() { return m_saves; }
  CharacterRoster &roster() { return m_roster; }
  NarrationManager &narration() { return m_narration; }

  // Items every new character starts with, by id
  static const std::vector<std::string> &defaultKit();

private:
  TurnResult handleExploration(const std::string &action, const std::string &raw);
  TurnResult handleCombat(const std::string &action, const std::string &raw);
  // Commands that never take a turn: help, inventory, stats, gear, choose
  std::optional<TurnResult> handleMeta(const std::string &action);
  TurnResult handleRest(const std::string &action, const std::string &raw);
  TurnResult handleUse(const std::string &payload, const std::string &raw);
  TurnResult handleCast(const std::string &rest, const std::string &raw);
  std::optional<TurnResult> handleGear(const std::string &action);

  // Longest leading run of words naming a spell, plus the remaining words
  std::optional<std::pair<std::string, std::string>> matchSpell(const std::string &text) const;

  void recordTurn(const std::string &raw, const std::string &result);
  // Bookkeeping for one action: turn counter, log, streak, then concludeTurn()
  TurnResult finishTurn(const std::string &raw, std::string result);
  // Campaign completion, narration and persistence for a resolved turn
  TurnResult concludeTurn(const std::string &raw, std::string result);
  std::optional<std::string> completeCampaignIfOver();

  const ContentRegistry &m_registry;
  SoloAdventure::GameConfig m_config;
  SoloAdventure::GameState m_state;
  SoloAdventure::Dice m_dice;
  EntityFactory m_factory;
  InventoryController m_inventory;
  ProgressionController m_progression;
  CombatController m_combat;
  ExplorationController m_exploration;
  SaveGameManager m_saves;
  CharacterRoster m_roster;
  NarrationManager m_narration;
};

#endif // GAME_SESSION_HPP
