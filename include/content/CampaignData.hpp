/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef CAMPAIGN_DATA_HPP
#define CAMPAIGN_DATA_HPP

#include "content/ContentTypes.hpp"
#include "content/Profiles.hpp"

#include <boost/container/flat_map.hpp>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace SoloAdventure {

struct ItemEffect {
  EffectType type{EffectType::None};
  std::string healDice; // Heal
  int acBonus{0};       // ArmorClass
};

/**
 * @brief Catalog entry for an item. Inventory and equipment hold copies.
 */
struct ItemDefinition {
  std::string id;
  std::string name;
  ItemKind kind{ItemKind::Unknown};
  std::optional<EquipSlot> slot;
  ItemEffect effect;
  bool countsTowardLimit{true};

  int armorBonus() const {
    return effect.type == EffectType::ArmorClass ? effect.acBonus : 0;
  }
};

struct SocialCheckConfig {
  Stat stat{Stat::INT};
  int dc{13};
  std::string successFlag;
  std::string successMessage; // templates with {roll} and {total}
  std::string failMessage;
  std::string doneFlag{"social_done"};
};

struct LootCheckConfig {
  Stat stat{Stat::DEX};
  int dc{13};
  std::string winItemId; // falls back to Room::lootItemId
  bool gameOver{true};
  std::string successMessage;
  std::string failMessage;
};

// Command word -> destination room id
using ExitMap = boost::container::flat_map<std::string, std::string>;

struct Room {
  std::string id;
  std::string name;
  std::string description;
  RoomKind kind{RoomKind::Passage};
  std::string npc;
  std::string enemyName;  // mob profile key for combat rooms
  std::string lootItemId;
  SocialCheckConfig social;
  LootCheckConfig loot;
  ExitMap exits;
};

struct Campaign {
  std::string id;
  std::string name;
  std::string description;
  std::vector<std::string> roomOrder;
  std::unordered_map<std::string, Room> rooms;
  std::map<std::string, ItemDefinition> items;
  std::map<std::string, MobProfile> mobs;
  std::map<std::string, CompanionProfile> companions;
  std::vector<std::string> defaultCompanionIds;
  int completionXp{0};
};

} // namespace SoloAdventure

#endif // CAMPAIGN_DATA_HPP
