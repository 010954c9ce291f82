/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "managers/ContentRegistry.hpp"
#include "core/GameError.hpp"
#include "core/Logger.hpp"
#include "utils/JsonReader.hpp"
#include "utils/TextUtils.hpp"

#include <algorithm>
#include <filesystem>
#include <set>

using SoloAdventure::AIPolicy;
using SoloAdventure::Campaign;
using SoloAdventure::ClassProfile;
using SoloAdventure::CompanionProfile;
using SoloAdventure::ContentError;
using SoloAdventure::DiceExpr;
using SoloAdventure::ExitMap;
using SoloAdventure::ItemDefinition;
using SoloAdventure::ItemKind;
using SoloAdventure::JsonReader;
using SoloAdventure::JsonValue;
using SoloAdventure::MobProfile;
using SoloAdventure::RaceProfile;
using SoloAdventure::Room;
using SoloAdventure::SpellDefinition;
namespace TextUtils = SoloAdventure::TextUtils;

namespace {

std::vector<std::string> stringList(const JsonValue &value) {
  std::vector<std::string> out;
  if (const auto *arr = value.tryAsArray()) {
    for (const auto &entry : *arr) {
      if (entry.isString()) {
        out.push_back(entry.asString());
      }
    }
  }
  return out;
}

SoloAdventure::Stat parseStat(const JsonValue &owner, const std::string &key,
                              SoloAdventure::Stat fallback) {
  if (!owner.hasKey(key)) {
    return fallback;
  }
  auto stat = SoloAdventure::statFromString(owner.getString(key));
  if (!stat) {
    throw ContentError("Unknown stat '" + owner.getString(key) + "'");
  }
  return *stat;
}

ItemDefinition parseItem(const std::string &id, const JsonValue &json) {
  ItemDefinition item;
  item.id = id;
  item.name = json.getString("name", id);

  auto kind = SoloAdventure::itemKindFromString(json.getString("kind", "unknown"));
  if (!kind) {
    throw ContentError("Item '" + id + "' has unknown kind '" + json.getString("kind") + "'");
  }
  item.kind = *kind;

  // An unrecognized slot keeps the item loadable; equipping it is refused later
  if (json.hasKey("slot")) {
    item.slot = SoloAdventure::equipSlotFromString(json.getString("slot"));
  }

  const JsonValue &effect = json["effect"];
  if (effect.isObject()) {
    auto type = SoloAdventure::effectTypeFromString(effect.getString("type", "none"));
    if (!type) {
      throw ContentError("Item '" + id + "' has unknown effect '" + effect.getString("type") + "'");
    }
    item.effect.type = *type;
    item.effect.healDice = effect.getString("dice", "1d6");
    if (item.effect.type == SoloAdventure::EffectType::Heal) {
      DiceExpr::parse(item.effect.healDice);
    }
    item.effect.acBonus = effect.getInt("bonus", 0);
  }

  item.countsTowardLimit = json.getBool("counts_toward_limit", true);
  return item;
}

MobProfile parseMob(const std::string &name, const JsonValue &json) {
  MobProfile mob;
  mob.name = name;
  mob.hp = json.getInt("hp", 1);
  if (json.hasKey("hp_expr") && !json.getString("hp_expr").empty()) {
    mob.hpExpr = DiceExpr::parse(json.getString("hp_expr"));
  }
  mob.hpMin = json.getInt("hp_min", 1);
  mob.count = std::max(1, json.getInt("count", 1));
  mob.ac = json.getInt("ac", 10);
  mob.attackBonus = json.getInt("attack_bonus", 0);
  mob.damage = DiceExpr::parse(json.getString("damage", "1d4"));
  mob.xp = json.getInt("xp", 0);

  auto ai = SoloAdventure::aiPolicyFromString(json.getString("ai", "focus_weakest"));
  if (!ai) {
    throw ContentError("Mob '" + name + "' has unknown ai '" + json.getString("ai") + "'");
  }
  mob.ai = *ai;

  const JsonValue &loot = json["loot"];
  if (loot.isObject()) {
    if (loot.hasKey("gold")) {
      mob.loot.gold = DiceExpr::parse(loot.getString("gold"));
    }
    mob.loot.itemIds = stringList(loot["items"]);
  }
  return mob;
}

CompanionProfile parseCompanion(const std::string &id, const JsonValue &json) {
  CompanionProfile companion;
  companion.id = id;
  companion.name = json.getString("name", id);
  companion.hp = json.getInt("hp", 1);
  companion.maxHp = json.getInt("max_hp", companion.hp);
  companion.ac = json.getInt("ac", 10);
  companion.attackBonus = json.getInt("attack_bonus", 0);
  companion.damage = DiceExpr::parse(json.getString("damage", "1d4"));
  companion.defendHpThreshold = json.getInt("defend_hp_threshold", 3);
  companion.maxMana = json.getInt("max_mana", json.getInt("mana", 0));
  companion.mana = std::min(json.getInt("mana", companion.maxMana), companion.maxMana);
  companion.spells = stringList(json["spells"]);
  return companion;
}

Room parseRoom(const std::string &id, const JsonValue &json) {
  Room room;
  room.id = id;
  room.name = json.getString("name", id);
  room.description = json.getString("description");
  room.npc = json.getString("npc");
  room.enemyName = json.getString("enemy");
  room.lootItemId = json.getString("loot");

  auto kind = SoloAdventure::roomKindFromString(json.getString("kind"));
  if (!kind) {
    throw ContentError("Room '" + id + "' has unknown kind '" + json.getString("kind") + "'");
  }
  room.kind = *kind;

  const JsonValue &social = json["social"];
  if (social.isObject()) {
    room.social.stat = parseStat(social, "stat", room.social.stat);
    room.social.dc = social.getInt("dc", room.social.dc);
    room.social.successFlag = social.getString("success_flag");
    room.social.successMessage = social.getString("success_msg");
    room.social.failMessage = social.getString("fail_msg");
    room.social.doneFlag = social.getString("done_flag", room.social.doneFlag);
  }

  const JsonValue &loot = json["loot_check"];
  if (loot.isObject()) {
    room.loot.stat = parseStat(loot, "stat", room.loot.stat);
    room.loot.dc = loot.getInt("dc", room.loot.dc);
    room.loot.winItemId = loot.getString("win_item_id");
    room.loot.gameOver = loot.getBool("game_over", room.loot.gameOver);
    room.loot.successMessage = loot.getString("success_msg");
    room.loot.failMessage = loot.getString("fail_msg");
  }
  if (room.loot.winItemId.empty()) {
    room.loot.winItemId = room.lootItemId;
  }

  if (const auto *exits = json["exits"].tryAsObject()) {
    for (const auto &[word, target] : *exits) {
      if (target.isString()) {
        room.exits.emplace(TextUtils::toLower(word), target.asString());
      }
    }
  }
  return room;
}

ItemDefinition unknownItem(const std::string &label) {
  ItemDefinition item;
  item.id = "unknown";
  item.name = label;
  item.kind = ItemKind::Unknown;
  return item;
}

} // namespace

bool ContentRegistry::loadProfilesFromJson(const std::string &filename) {
  JsonReader reader;
  if (!reader.loadFromFile(filename)) {
    CONTENT_ERROR("ContentRegistry::loadProfilesFromJson - Failed to load file: " +
                  filename + " - " + reader.getLastError());
    return false;
  }

  try {
    parseProfiles(reader.getRoot());
  } catch (const ContentError &ex) {
    CONTENT_ERROR("ContentRegistry::loadProfilesFromJson - " + filename + ": " + ex.what());
    return false;
  }
  return true;
}

bool ContentRegistry::loadProfilesFromJsonString(const std::string &jsonString) {
  JsonReader reader;
  if (!reader.parse(jsonString)) {
    CONTENT_ERROR("ContentRegistry::loadProfilesFromJsonString - Failed to parse JSON: " +
                  reader.getLastError());
    return false;
  }

  try {
    parseProfiles(reader.getRoot());
  } catch (const ContentError &ex) {
    CONTENT_ERROR(std::string("ContentRegistry::loadProfilesFromJsonString - ") + ex.what());
    return false;
  }
  return true;
}

bool ContentRegistry::loadCampaignFromJson(const std::string &filename) {
  JsonReader reader;
  if (!reader.loadFromFile(filename)) {
    CONTENT_ERROR("ContentRegistry::loadCampaignFromJson - Failed to load file: " +
                  filename + " - " + reader.getLastError());
    return false;
  }

  try {
    return registerCampaign(parseCampaign(reader.getRoot()));
  } catch (const ContentError &ex) {
    CONTENT_ERROR("ContentRegistry::loadCampaignFromJson - " + filename + ": " + ex.what());
    return false;
  }
}

bool ContentRegistry::loadCampaignFromJsonString(const std::string &jsonString) {
  JsonReader reader;
  if (!reader.parse(jsonString)) {
    CONTENT_ERROR("ContentRegistry::loadCampaignFromJsonString - Failed to parse JSON: " +
                  reader.getLastError());
    return false;
  }

  try {
    return registerCampaign(parseCampaign(reader.getRoot()));
  } catch (const ContentError &ex) {
    CONTENT_ERROR(std::string("ContentRegistry::loadCampaignFromJsonString - ") + ex.what());
    return false;
  }
}

size_t ContentRegistry::loadCampaignsFromDirectory(const std::string &directory) {
  namespace fs = std::filesystem;

  m_failedCampaignLoads = 0;
  std::error_code ec;
  std::vector<fs::path> files;
  for (const auto &entry : fs::directory_iterator(directory, ec)) {
    if (entry.is_regular_file() && entry.path().extension() == ".json") {
      files.push_back(entry.path());
    }
  }
  if (ec) {
    CONTENT_ERROR("ContentRegistry::loadCampaignsFromDirectory - Cannot read " + directory +
                  ": " + ec.message());
    return 0;
  }

  std::sort(files.begin(), files.end());

  size_t loadedCount = 0;
  size_t failedCount = 0;
  for (const auto &file : files) {
    if (loadCampaignFromJson(file.string())) {
      ++loadedCount;
    } else {
      ++failedCount;
    }
  }

  CONTENT_INFO("ContentRegistry::loadCampaignsFromDirectory - Completed: " +
               std::to_string(loadedCount) + " loaded, " + std::to_string(failedCount) +
               " failed");
  m_failedCampaignLoads = failedCount;
  return loadedCount;
}

void ContentRegistry::parseProfiles(const JsonValue &root) {
  if (!root.isObject()) {
    throw ContentError("Profiles root is not an object");
  }

  std::vector<int> xpTable;
  if (const auto *table = root["xp_table"].tryAsArray()) {
    for (const auto &entry : *table) {
      if (!entry.isNumber()) {
        throw ContentError("xp_table entries must be numbers");
      }
      xpTable.push_back(entry.asInt());
    }
  }
  if (xpTable.empty() || !std::is_sorted(xpTable.begin(), xpTable.end())) {
    throw ContentError("xp_table must be a non-empty ascending list");
  }

  std::unordered_map<std::string, ClassProfile> classes;
  if (const auto *classObj = root["classes"].tryAsObject()) {
    for (const auto &[name, json] : *classObj) {
      ClassProfile profile;
      profile.name = name;
      auto role = SoloAdventure::classRoleFromString(json.getString("role", "melee"));
      if (!role) {
        throw ContentError("Class '" + name + "' has unknown role");
      }
      profile.role = *role;
      profile.baseHp = json.getInt("base_hp", 10);
      profile.baseAc = json.getInt("base_ac", 10);
      profile.attackBonus = json.getInt("attack_bonus", 0);
      profile.damage = DiceExpr::parse(json.getString("damage", "1d4"));
      profile.hpPerLevel = json.getInt("hp_per_level", 1);
      profile.spells = stringList(json["spells"]);
      profile.learnableSpells = stringList(json["learnable_spells"]);
      auto special = SoloAdventure::specialKindFromString(json.getString("special", "none"));
      if (!special) {
        throw ContentError("Class '" + name + "' has unknown special '" +
                           json.getString("special") + "'");
      }
      profile.special = *special;
      profile.specialBonus = json.getInt("special_bonus", 0);
      profile.manaStat = parseStat(json, "mana_stat", SoloAdventure::Stat::INT);
      profile.description = json.getString("description");
      classes.emplace(name, std::move(profile));
    }
  }

  std::unordered_map<std::string, RaceProfile> races;
  if (const auto *raceObj = root["races"].tryAsObject()) {
    for (const auto &[name, json] : *raceObj) {
      RaceProfile profile;
      profile.name = name;
      profile.description = json.getString("description");
      if (const auto *mods = json["stat_mods"].tryAsObject()) {
        for (const auto &[statName, value] : *mods) {
          auto stat = SoloAdventure::statFromString(statName);
          if (!stat || !value.isNumber()) {
            throw ContentError("Race '" + name + "' has invalid modifier '" + statName + "'");
          }
          profile.statMods[static_cast<size_t>(*stat)] = value.asInt();
        }
      }
      profile.abilities = stringList(json["abilities"]);
      profile.proficiencies = stringList(json["proficiencies"]);
      races.emplace(name, std::move(profile));
    }
  }

  std::vector<SpellDefinition> spells;
  if (const auto *spellArr = root["spells"].tryAsArray()) {
    for (const auto &json : *spellArr) {
      SpellDefinition spell;
      spell.name = json.getString("name");
      if (spell.name.empty()) {
        throw ContentError("Spell entry without a name");
      }
      if (json.hasKey("damage")) {
        spell.damage = DiceExpr::parse(json.getString("damage"));
      }
      spell.manaCost = json.getInt("mana", 0);
      spells.push_back(std::move(spell));
    }
  }

  auto orderOf = [&root](const std::string &key, const auto &table) {
    std::vector<std::string> order;
    for (const auto &name : stringList(root[key])) {
      if (table.count(name) > 0) {
        order.push_back(name);
      }
    }
    // Anything not named in the explicit order goes last, alphabetically
    std::vector<std::string> rest;
    for (const auto &[name, _] : table) {
      if (std::find(order.begin(), order.end(), name) == order.end()) {
        rest.push_back(name);
      }
    }
    std::sort(rest.begin(), rest.end());
    order.insert(order.end(), rest.begin(), rest.end());
    return order;
  };

  m_classOrder = orderOf("class_order", classes);
  m_raceOrder = orderOf("race_order", races);
  m_classes = std::move(classes);
  m_races = std::move(races);
  m_spells = std::move(spells);
  m_xpTable = std::move(xpTable);

  CONTENT_INFO("Loaded " + std::to_string(m_classes.size()) + " classes, " +
               std::to_string(m_races.size()) + " races, " +
               std::to_string(m_spells.size()) + " spells");
}

Campaign ContentRegistry::parseCampaign(const JsonValue &root) const {
  if (!root.isObject()) {
    throw ContentError("Campaign root is not an object");
  }

  Campaign campaign;
  campaign.id = root.getString("id");
  if (campaign.id.empty()) {
    throw ContentError("Campaign without an id");
  }
  campaign.name = root.getString("name", campaign.id);
  campaign.description = root.getString("description");
  campaign.roomOrder = stringList(root["room_order"]);
  campaign.defaultCompanionIds = stringList(root["default_companions"]);
  campaign.completionXp = root.getInt("completion_xp", 0);

  if (const auto *rooms = root["rooms"].tryAsObject()) {
    for (const auto &[id, json] : *rooms) {
      campaign.rooms.emplace(id, parseRoom(id, json));
    }
  }
  if (const auto *items = root["items"].tryAsObject()) {
    for (const auto &[id, json] : *items) {
      campaign.items.emplace(id, parseItem(id, json));
    }
  }
  if (const auto *mobs = root["mobs"].tryAsObject()) {
    for (const auto &[name, json] : *mobs) {
      campaign.mobs.emplace(name, parseMob(name, json));
    }
  }
  if (const auto *companions = root["companions"].tryAsObject()) {
    for (const auto &[id, json] : *companions) {
      campaign.companions.emplace(id, parseCompanion(id, json));
    }
  }
  return campaign;
}

void ContentRegistry::validateCampaign(const Campaign &campaign) const {
  const std::string prefix = "Campaign '" + campaign.id + "': ";

  if (campaign.roomOrder.empty()) {
    throw ContentError(prefix + "room_order is empty");
  }
  for (const auto &roomId : campaign.roomOrder) {
    if (campaign.rooms.count(roomId) == 0) {
      throw ContentError(prefix + "room_order names unknown room '" + roomId + "'");
    }
  }

  for (const auto &[roomId, room] : campaign.rooms) {
    for (const auto &[word, target] : room.exits) {
      if (campaign.rooms.count(target) == 0) {
        throw ContentError(prefix + "exit '" + word + "' of '" + roomId +
                           "' leads to unknown room '" + target + "'");
      }
    }
    if (room.kind == SoloAdventure::RoomKind::Combat &&
        campaign.mobs.count(room.enemyName) == 0) {
      throw ContentError(prefix + "combat room '" + roomId + "' has unknown enemy '" +
                         room.enemyName + "'");
    }
  }

  for (const auto &[name, mob] : campaign.mobs) {
    for (const auto &itemId : mob.loot.itemIds) {
      if (campaign.items.count(itemId) == 0) {
        throw ContentError(prefix + "mob '" + name + "' drops unknown item '" + itemId + "'");
      }
    }
  }

  for (const auto &companionId : campaign.defaultCompanionIds) {
    if (campaign.companions.count(companionId) == 0) {
      throw ContentError(prefix + "unknown default companion '" + companionId + "'");
    }
  }
}

bool ContentRegistry::registerCampaign(Campaign campaign) {
  try {
    validateCampaign(campaign);
  } catch (const ContentError &ex) {
    CONTENT_ERROR(std::string("ContentRegistry::registerCampaign - ") + ex.what());
    return false;
  }

  std::string id = campaign.id;
  if (m_campaigns.count(id) == 0) {
    m_campaignOrder.push_back(id);
  } else {
    CONTENT_WARN("Replacing campaign '" + id + "'");
  }
  CONTENT_INFO("Registered campaign '" + id + "' with " +
               std::to_string(campaign.rooms.size()) + " rooms");
  m_campaigns[id] = std::move(campaign);
  return true;
}

bool ContentRegistry::hasCampaign(const std::string &campaignId) const {
  return m_campaigns.count(campaignId) > 0;
}

const Campaign &ContentRegistry::getCampaign(const std::string &campaignId) const {
  auto it = m_campaigns.find(campaignId);
  if (it == m_campaigns.end()) {
    throw ContentError("Unknown campaign '" + campaignId + "'");
  }
  return it->second;
}

std::vector<const Campaign *> ContentRegistry::listCampaigns() const {
  std::vector<const Campaign *> out;
  out.reserve(m_campaignOrder.size());
  for (const auto &id : m_campaignOrder) {
    out.push_back(&m_campaigns.at(id));
  }
  return out;
}

const Room &ContentRegistry::getRoom(const std::string &campaignId,
                                     const std::string &roomId) const {
  const Campaign &campaign = getCampaign(campaignId);
  auto it = campaign.rooms.find(roomId);
  if (it == campaign.rooms.end()) {
    throw ContentError("Unknown room '" + roomId + "' in campaign '" + campaignId + "'");
  }
  return it->second;
}

std::optional<std::string> ContentRegistry::nextRoomId(const std::string &campaignId,
                                                       const std::string &roomId) const {
  const auto &order = getCampaign(campaignId).roomOrder;
  auto it = std::find(order.begin(), order.end(), roomId);
  if (it == order.end() || std::next(it) == order.end()) {
    return std::nullopt;
  }
  return *std::next(it);
}

const ExitMap &ContentRegistry::getExits(const std::string &campaignId,
                                         const std::string &roomId) const {
  return getRoom(campaignId, roomId).exits;
}

ItemDefinition ContentRegistry::itemFromId(const std::string &campaignId,
                                           const std::string &itemId) const {
  const Campaign &campaign = getCampaign(campaignId);
  auto it = campaign.items.find(itemId);
  if (it == campaign.items.end()) {
    CONTENT_WARN("Unknown item id '" + itemId + "' in campaign '" + campaignId + "'");
    return unknownItem(itemId);
  }
  return it->second;
}

ItemDefinition ContentRegistry::itemFromName(const std::string &campaignId,
                                             const std::string &name) const {
  const Campaign &campaign = getCampaign(campaignId);
  std::string wanted = TextUtils::toLower(name);
  for (const auto &[id, item] : campaign.items) {
    if (TextUtils::toLower(item.name) == wanted) {
      return item;
    }
  }
  return unknownItem(name);
}

std::vector<std::string> ContentRegistry::questItemIds(const std::string &campaignId) const {
  std::vector<std::string> ids;
  for (const auto &[id, item] : getCampaign(campaignId).items) {
    if (item.kind == ItemKind::Quest) {
      ids.push_back(id);
    }
  }
  return ids;
}

const MobProfile &ContentRegistry::getMobProfile(const std::string &campaignId,
                                                 const std::string &name) const {
  const Campaign &campaign = getCampaign(campaignId);
  auto it = campaign.mobs.find(name);
  if (it == campaign.mobs.end()) {
    throw ContentError("Unknown mob '" + name + "' in campaign '" + campaignId + "'");
  }
  return it->second;
}

const CompanionProfile &
ContentRegistry::getCompanionProfile(const std::string &campaignId,
                                     const std::string &companionId) const {
  const Campaign &campaign = getCampaign(campaignId);
  auto it = campaign.companions.find(companionId);
  if (it == campaign.companions.end()) {
    throw ContentError("Unknown companion '" + companionId + "' in campaign '" +
                       campaignId + "'");
  }
  return it->second;
}

const ClassProfile *ContentRegistry::findClassProfile(const std::string &name) const {
  auto it = m_classes.find(name);
  if (it != m_classes.end()) {
    return &it->second;
  }
  std::string wanted = TextUtils::toLower(name);
  for (const auto &[key, profile] : m_classes) {
    if (TextUtils::toLower(key) == wanted) {
      return &profile;
    }
  }
  return nullptr;
}

const RaceProfile *ContentRegistry::findRaceProfile(const std::string &name) const {
  auto it = m_races.find(name);
  if (it != m_races.end()) {
    return &it->second;
  }
  std::string wanted = TextUtils::toLower(name);
  for (const auto &[key, profile] : m_races) {
    if (TextUtils::toLower(key) == wanted) {
      return &profile;
    }
  }
  return nullptr;
}

const ClassProfile &ContentRegistry::getClassProfile(const std::string &name) const {
  const ClassProfile *profile = findClassProfile(name);
  if (!profile) {
    throw ContentError("Unknown class '" + name + "'");
  }
  return *profile;
}

const RaceProfile &ContentRegistry::getRaceProfile(const std::string &name) const {
  const RaceProfile *profile = findRaceProfile(name);
  if (!profile) {
    throw ContentError("Unknown race '" + name + "'");
  }
  return *profile;
}

const SpellDefinition *ContentRegistry::findSpell(const std::string &name) const {
  std::string wanted = TextUtils::toLower(name);
  for (const auto &spell : m_spells) {
    if (TextUtils::toLower(spell.name) == wanted) {
      return &spell;
    }
  }
  return nullptr;
}

const SpellDefinition *
ContentRegistry::bestDamageSpell(const std::vector<std::string> &learned) const {
  for (const auto &spell : m_spells) {
    if (spell.isDamageSpell() &&
        std::find(learned.begin(), learned.end(), spell.name) != learned.end()) {
      return &spell;
    }
  }
  return nullptr;
}

std::vector<std::string>
ContentRegistry::spellChoicesForLevel(const std::string &className, int level,
                                      const std::vector<std::string> &learned) const {
  const ClassProfile *profile = findClassProfile(className);
  if (!profile || profile->learnableSpells.empty()) {
    return {};
  }
  // Choices come at levels 2, 4, 6, ...
  if (level < 2 || level % 2 != 0) {
    return {};
  }
  std::vector<std::string> choices;
  for (const auto &spell : profile->learnableSpells) {
    if (std::find(learned.begin(), learned.end(), spell) == learned.end()) {
      choices.push_back(spell);
    }
  }
  return choices;
}
