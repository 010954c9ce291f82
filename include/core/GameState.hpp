/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef GAME_STATE_HPP
#define GAME_STATE_HPP

#include "content/CampaignData.hpp"
#include "entities/Combatant.hpp"

#include <array>
#include <deque>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace SoloAdventure {

struct CorpseRecord {
  int id{0};
  std::string name; // mob profile key, used to roll its loot
  bool looted{false};
};

/**
 * @brief Typed room/quest progress for the running campaign
 *
 * markers holds the yes/no flags rooms set (social success and done flags,
 * "loot_taken", "loot_failed").
 */
struct CampaignFlags {
  std::vector<std::string> defeatedRooms; // insertion order, no duplicates
  std::map<std::string, std::vector<CorpseRecord>> corpses;
  int nextCorpseId{1};
  std::map<std::string, bool> markers;

  bool isDefeated(const std::string &roomId) const;
  // False when the room was already recorded
  bool markDefeated(const std::string &roomId);
  int takeCorpseId() { return nextCorpseId++; }

  bool marker(const std::string &name) const;
  void setMarker(const std::string &name, bool value = true) { markers[name] = value; }
};

struct PendingDecision {
  std::string type{"spell"};
  std::vector<std::string> choices;
  int level{0};
};

struct NarrationEntry {
  int turn{0};
  std::string playerInput;
  std::string rulesResult;
  std::string gmResponse;
  std::string gmSource;
};

using Equipment = std::array<std::optional<ItemDefinition>, EQUIP_SLOT_COUNT>;

/**
 * @brief Aggregate root of a running adventure
 *
 * Owned by the session loop and mutated only by the rules controllers.
 * The companion at index 0 is the one that fights; activeCompanion()
 * names that role explicitly.
 */
struct GameState {
  static constexpr int FORMAT_VERSION = 2;

  std::string campaignId;
  Character player;
  std::vector<Companion> companions;
  std::string roomId;
  std::vector<std::string> visited;

  std::vector<ItemDefinition> inventory;
  Equipment equipment{};
  int inventoryLimit{10};

  bool inCombat{false};
  std::vector<Enemy> enemies;
  bool playerDefending{false};
  bool companionDefending{false};

  int turn{0};
  std::vector<std::string> turnLog;
  std::string lastEvent;
  std::string lastPlayerInput;
  std::vector<NarrationEntry> narrationLog;

  bool gameOver{false};
  int restStreak{0};
  std::deque<PendingDecision> pendingDecisions;
  CampaignFlags flags;

  Companion *activeCompanion();
  const Companion *activeCompanion() const;

  std::optional<ItemDefinition> &equipped(EquipSlot slot) {
    return equipment[static_cast<size_t>(slot)];
  }
  const std::optional<ItemDefinition> &equipped(EquipSlot slot) const {
    return equipment[static_cast<size_t>(slot)];
  }

  void markVisited(const std::string &room);
  // Appends and trims the log to its trailing window
  void appendNarration(NarrationEntry entry, size_t window);
  int livingEnemyCount() const;
};

} // namespace SoloAdventure

#endif // GAME_STATE_HPP
