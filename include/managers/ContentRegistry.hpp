/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef CONTENT_REGISTRY_HPP
#define CONTENT_REGISTRY_HPP

#include "content/CampaignData.hpp"
#include "content/Profiles.hpp"
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace SoloAdventure {
class JsonValue;
}

/**
 * @brief Read-only lookup tables for campaigns, items, creatures and classes
 *
 * Built once at startup and passed by const reference to the controllers.
 * Loading reports failures the usual way (bool + log). Lookups treat content
 * as trusted: an unknown campaign, room, mob, companion, class or race id
 * throws SoloAdventure::ContentError. Unknown items are the exception and
 * resolve to a synthetic "unknown" item so old inventories stay loadable.
 */
class ContentRegistry {
public:
  ContentRegistry() = default;

  // JSON loading methods
  bool loadProfilesFromJson(const std::string &filename);
  bool loadProfilesFromJsonString(const std::string &jsonString);
  bool loadCampaignFromJson(const std::string &filename);
  bool loadCampaignFromJsonString(const std::string &jsonString);
  // Loads every *.json campaign in the directory (sorted by file name)
  size_t loadCampaignsFromDirectory(const std::string &directory);
  // Campaign files the last directory load rejected
  size_t failedCampaignLoads() const { return m_failedCampaignLoads; }

  // Registers (or replaces) a campaign after validating its references
  bool registerCampaign(SoloAdventure::Campaign campaign);

  // Campaigns
  bool hasCampaign(const std::string &campaignId) const;
  const SoloAdventure::Campaign &getCampaign(const std::string &campaignId) const;
  std::vector<const SoloAdventure::Campaign *> listCampaigns() const;

  const SoloAdventure::Room &getRoom(const std::string &campaignId,
                                     const std::string &roomId) const;
  std::optional<std::string> nextRoomId(const std::string &campaignId,
                                        const std::string &roomId) const;
  const SoloAdventure::ExitMap &getExits(const std::string &campaignId,
                                         const std::string &roomId) const;

  SoloAdventure::ItemDefinition itemFromId(const std::string &campaignId,
                                           const std::string &itemId) const;
  SoloAdventure::ItemDefinition itemFromName(const std::string &campaignId,
                                             const std::string &name) const;
  std::vector<std::string> questItemIds(const std::string &campaignId) const;

  const SoloAdventure::MobProfile &getMobProfile(const std::string &campaignId,
                                                 const std::string &name) const;
  const SoloAdventure::CompanionProfile &
  getCompanionProfile(const std::string &campaignId, const std::string &companionId) const;

  // Classes, races, spells and progression
  const SoloAdventure::ClassProfile &getClassProfile(const std::string &name) const;
  const SoloAdventure::RaceProfile &getRaceProfile(const std::string &name) const;
  const SoloAdventure::ClassProfile *findClassProfile(const std::string &name) const;
  const SoloAdventure::RaceProfile *findRaceProfile(const std::string &name) const;
  const std::vector<std::string> &classNames() const { return m_classOrder; }
  const std::vector<std::string> &raceNames() const { return m_raceOrder; }

  const SoloAdventure::SpellDefinition *findSpell(const std::string &name) const;
  // First damage spell in preference order that appears in learned
  const SoloAdventure::SpellDefinition *
  bestDamageSpell(const std::vector<std::string> &learned) const;
  // Choices offered when a caster reaches level; empty when none
  std::vector<std::string> spellChoicesForLevel(const std::string &className, int level,
                                                const std::vector<std::string> &learned) const;

  const std::vector<int> &xpTable() const { return m_xpTable; }

private:
  void parseProfiles(const SoloAdventure::JsonValue &root);
  SoloAdventure::Campaign parseCampaign(const SoloAdventure::JsonValue &root) const;
  void validateCampaign(const SoloAdventure::Campaign &campaign) const;

  std::unordered_map<std::string, SoloAdventure::Campaign> m_campaigns;
  std::vector<std::string> m_campaignOrder;
  size_t m_failedCampaignLoads{0};

  std::unordered_map<std::string, SoloAdventure::ClassProfile> m_classes;
  std::unordered_map<std::string, SoloAdventure::RaceProfile> m_races;
  std::vector<std::string> m_classOrder;
  std::vector<std::string> m_raceOrder;
  std::vector<SoloAdventure::SpellDefinition> m_spells; // preference order
  std::vector<int> m_xpTable;
};

#endif // CONTENT_REGISTRY_HPP
