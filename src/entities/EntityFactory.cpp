/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "entities/EntityFactory.hpp"
#include "core/Logger.hpp"
#include "managers/ContentRegistry.hpp"

#include <algorithm>

using SoloAdventure::Character;
using SoloAdventure::Companion;
using SoloAdventure::CompanionProfile;
using SoloAdventure::Enemy;
using SoloAdventure::StatBlock;

StatBlock EntityFactory::applyRaceMods(const StatBlock &stats,
                                       const std::string &race) const {
  const SoloAdventure::RaceProfile &profile = m_registry.getRaceProfile(race);
  StatBlock result = stats;
  for (size_t i = 0; i < result.size(); ++i) {
    if (profile.statMods[i] != 0) {
      result[i] = std::clamp(result[i] + profile.statMods[i], 0, 4);
    }
  }
  return result;
}

int EntityFactory::casterMana(const StatBlock &stats,
                              const SoloAdventure::ClassProfile &profile) {
  int governing = std::max(0, SoloAdventure::statValue(stats, profile.manaStat));
  return 2 + governing * 2;
}

Character EntityFactory::createPlayer(const std::string &name, const std::string &className,
                                      const StatBlock &rawStats,
                                      const std::string &race) const {
  const SoloAdventure::ClassProfile &profile = m_registry.getClassProfile(className);

  Character player;
  player.name = name;
  player.race = m_registry.getRaceProfile(race).name;
  player.className = profile.name;
  player.stats = applyRaceMods(rawStats, race);

  int hp = profile.baseHp + std::max(0, player.stat(SoloAdventure::Stat::CON));
  player.hp = hp;
  player.maxHp = hp;
  player.ac = profile.baseAc;
  player.baseAc = profile.baseAc;
  player.attackBonus = profile.attackBonus;
  player.damage = profile.damage;
  player.learnedSpells = profile.spells;

  if (profile.isCaster()) {
    player.maxMana = casterMana(player.stats, profile);
    player.mana = player.maxMana;
  }

  ENTITY_INFO("Created " + player.race + " " + player.className + " '" + name + "' with " +
              std::to_string(hp) + " HP");
  return player;
}

Companion EntityFactory::createCompanionFromProfile(const CompanionProfile &profile) {
  Companion companion;
  companion.id = profile.id;
  companion.name = profile.name;
  companion.hp = profile.hp;
  companion.maxHp = profile.maxHp;
  companion.ac = profile.ac;
  companion.attackBonus = profile.attackBonus;
  companion.damage = profile.damage;
  companion.mana = profile.mana;
  companion.maxMana = profile.maxMana;
  companion.learnedSpells = profile.spells;
  companion.defendHpThreshold = profile.defendHpThreshold;
  return companion;
}

Companion EntityFactory::createCompanion(const std::string &campaignId,
                                         const std::optional<std::string> &companionId) const {
  const SoloAdventure::Campaign &campaign = m_registry.getCampaign(campaignId);
  if (campaign.companions.empty()) {
    CompanionProfile fallback;
    fallback.id = "mara";
    fallback.name = "Mara";
    fallback.hp = 10;
    fallback.maxHp = 10;
    fallback.ac = 13;
    fallback.attackBonus = 2;
    fallback.damage = SoloAdventure::DiceExpr{1, 6, 0};
    fallback.defendHpThreshold = 3;
    return createCompanionFromProfile(fallback);
  }

  std::string id;
  if (companionId && !companionId->empty()) {
    id = *companionId;
  } else if (!campaign.defaultCompanionIds.empty()) {
    id = campaign.defaultCompanionIds.front();
  } else {
    id = campaign.companions.begin()->first;
  }
  return createCompanionFromProfile(m_registry.getCompanionProfile(campaignId, id));
}

std::vector<Companion>
EntityFactory::createCampaignCompanions(const std::string &campaignId,
                                        const std::vector<std::string> &companionIds) const {
  const SoloAdventure::Campaign &campaign = m_registry.getCampaign(campaignId);
  if (campaign.companions.empty()) {
    return {createCompanion(campaignId)};
  }

  std::vector<std::string> ids = companionIds;
  if (ids.empty()) {
    ids = campaign.defaultCompanionIds;
  }
  if (ids.empty()) {
    ids.push_back(campaign.companions.begin()->first);
  }

  std::vector<Companion> party;
  party.reserve(ids.size());
  for (const auto &id : ids) {
    party.push_back(createCompanion(campaignId, id));
  }
  return party;
}

std::vector<Enemy> EntityFactory::createEnemies(const std::string &campaignId,
                                                const std::string &mobName) {
  const SoloAdventure::MobProfile &mob = m_registry.getMobProfile(campaignId, mobName);

  std::vector<Enemy> enemies;
  enemies.reserve(static_cast<size_t>(mob.count));
  for (int i = 0; i < mob.count; ++i) {
    int hp = mob.hp;
    if (mob.hpExpr) {
      hp = std::max(mob.hpMin, m_dice.roll(*mob.hpExpr).total);
    }

    Enemy enemy;
    enemy.name = mob.name;
    enemy.hp = hp;
    enemy.maxHp = hp;
    enemy.ac = mob.ac;
    enemy.attackBonus = mob.attackBonus;
    enemy.damage = mob.damage;
    enemies.push_back(std::move(enemy));
  }

  ENTITY_DEBUG("Spawned " + std::to_string(enemies.size()) + "x " + mobName);
  return enemies;
}

void EntityFactory::ensureCasterMana(Character &player) const {
  const SoloAdventure::ClassProfile *profile = m_registry.findClassProfile(player.className);
  if (!profile || !profile->isCaster()) {
    return;
  }
  if (player.maxMana <= 0) {
    player.maxMana = casterMana(player.stats, *profile);
    player.mana = player.maxMana;
  } else {
    player.mana = std::min(player.mana, player.maxMana);
  }
}
