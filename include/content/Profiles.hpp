/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef PROFILES_HPP
#define PROFILES_HPP

#include "content/ContentTypes.hpp"
#include "core/Dice.hpp"

#include <array>
#include <optional>
#include <string>
#include <vector>

namespace SoloAdventure {

// Six-stat block, indexed by Stat
using StatBlock = std::array<int, STAT_COUNT>;

inline int statValue(const StatBlock &stats, Stat stat) {
  return stats[static_cast<size_t>(stat)];
}

struct ClassProfile {
  std::string name;
  ClassRole role{ClassRole::Melee};
  int baseHp{10};
  int baseAc{10};
  int attackBonus{0};
  DiceExpr damage;
  int hpPerLevel{1};
  std::vector<std::string> spells;          // known at creation
  std::vector<std::string> learnableSpells; // offered on even levels
  SpecialKind special{SpecialKind::None};
  int specialBonus{0};
  Stat manaStat{Stat::INT}; // governs the mana pool of casters
  std::string description;

  bool isCaster() const { return role == ClassRole::Caster; }
};

struct RaceProfile {
  std::string name;
  std::string description;
  StatBlock statMods{};
  std::vector<std::string> abilities;
  std::vector<std::string> proficiencies;
};

struct LootTable {
  std::optional<DiceExpr> gold;
  std::vector<std::string> itemIds;
};

struct MobProfile {
  std::string name;
  int hp{1};
  std::optional<DiceExpr> hpExpr; // rolled per unit when present
  int hpMin{1};
  int count{1};
  int ac{10};
  int attackBonus{0};
  DiceExpr damage;
  LootTable loot;
  AIPolicy ai{AIPolicy::FocusWeakest};
  int xp{0};
};

struct CompanionProfile {
  std::string id;
  std::string name;
  int hp{1};
  int maxHp{1};
  int ac{10};
  int attackBonus{0};
  DiceExpr damage;
  int defendHpThreshold{3}; // defends at or below this HP
  int mana{0};
  int maxMana{0};
  std::vector<std::string> spells;
};

struct SpellDefinition {
  std::string name;
  std::optional<DiceExpr> damage;
  int manaCost{0};

  bool isDamageSpell() const { return damage.has_value(); }
};

} // namespace SoloAdventure

#endif // PROFILES_HPP
