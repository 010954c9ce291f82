/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef COMBATANT_HPP
#define COMBATANT_HPP

#include "content/Profiles.hpp"
#include "core/Dice.hpp"

#include <algorithm>
#include <string>
#include <vector>

namespace SoloAdventure {

/**
 * @brief Shape shared by everything that can take part in a fight
 *
 * hp stays within [0, maxHp]; all changes go through applyDamage()/heal().
 */
struct Combatant {
  std::string name;
  int hp{0};
  int maxHp{0};
  int ac{10};
  int attackBonus{0};
  DiceExpr damage;

  bool isDown() const { return hp <= 0; }
  bool isWounded() const { return hp < maxHp; }

  // Returns the damage actually taken
  int applyDamage(int amount) {
    int before = hp;
    hp = std::clamp(hp - std::max(0, amount), 0, maxHp);
    return before - hp;
  }

  // Returns the HP actually restored
  int heal(int amount) {
    int before = hp;
    hp = std::clamp(hp + std::max(0, amount), 0, maxHp);
    return hp - before;
  }

  // Current HP over max HP; a zero max counts as one
  double hpRatio() const {
    return static_cast<double>(hp) / static_cast<double>(std::max(1, maxHp));
  }
};

// Player character. Persists across campaigns through the roster.
struct Character : Combatant {
  std::string race{"Human"};
  std::string className;
  StatBlock stats{};
  int baseAc{10};
  int mana{0};
  int maxMana{0};
  int gold{0};
  int xp{0};
  int level{1};
  std::vector<std::string> learnedSpells;

  int stat(Stat which) const { return statValue(stats, which); }
  bool hasManaPool() const { return maxMana > 0; }
};

struct Companion : Combatant {
  std::string id;
  int mana{0};
  int maxMana{0};
  std::vector<std::string> learnedSpells;
  int defendHpThreshold{3};

  bool hasManaPool() const { return maxMana > 0; }
};

struct Enemy : Combatant {
  bool asleep{false}; // part of the shape, no current content sets it
};

// Raises mana by amount, capped at max; returns the gain
template <typename Caster> int regenerateMana(Caster &caster, int amount) {
  if (caster.maxMana <= 0) {
    return 0;
  }
  int before = caster.mana;
  caster.mana = std::min(caster.maxMana, caster.mana + amount);
  return caster.mana - before;
}

} // namespace SoloAdventure

#endif // COMBATANT_HPP
