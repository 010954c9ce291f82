/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef ENTITY_FACTORY_HPP
#define ENTITY_FACTORY_HPP

#include "entities/Combatant.hpp"
#include <optional>
#include <string>
#include <vector>

class ContentRegistry;

/**
 * @brief Builds players, companions and enemies from registry templates
 */
class EntityFactory {
public:
  EntityFactory(const ContentRegistry &registry, SoloAdventure::Dice &dice)
      : m_registry(registry), m_dice(dice) {}

  // Race modifiers are added and the touched stats clamped into [0, 4]
  SoloAdventure::Character createPlayer(const std::string &name,
                                        const std::string &className,
                                        const SoloAdventure::StatBlock &rawStats,
                                        const std::string &race = "Human") const;

  SoloAdventure::StatBlock applyRaceMods(const SoloAdventure::StatBlock &stats,
                                         const std::string &race) const;

  static SoloAdventure::Companion
  createCompanionFromProfile(const SoloAdventure::CompanionProfile &profile);

  // No id picks the campaign default. Campaigns without companion data get
  // the stock sellsword companion.
  SoloAdventure::Companion
  createCompanion(const std::string &campaignId,
                  const std::optional<std::string> &companionId = std::nullopt) const;
  std::vector<SoloAdventure::Companion>
  createCampaignCompanions(const std::string &campaignId,
                           const std::vector<std::string> &companionIds = {}) const;

  // One enemy per unit of the mob's count, each with its own HP roll
  std::vector<SoloAdventure::Enemy> createEnemies(const std::string &campaignId,
                                                  const std::string &mobName);

  // Casters get 2 + 2 * max(0, governing stat)
  static int casterMana(const SoloAdventure::StatBlock &stats,
                        const SoloAdventure::ClassProfile &profile);

  // Repairs a loaded caster: empty pool is recomputed, overfull mana clamped
  void ensureCasterMana(SoloAdventure::Character &player) const;

private:
  const ContentRegistry &m_registry;
  SoloAdventure::Dice &m_dice;
};

#endif // ENTITY_FACTORY_HPP
