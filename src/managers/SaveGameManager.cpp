/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "managers/SaveGameManager.hpp"
#include "core/Logger.hpp"
#include "managers/ContentRegistry.hpp"
#include "utils/JsonReader.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <ostream>
#include <sstream>

using SoloAdventure::Campaign;
using SoloAdventure::CampaignFlags;
using SoloAdventure::Character;
using SoloAdventure::Companion;
using SoloAdventure::CorpseRecord;
using SoloAdventure::DiceExpr;
using SoloAdventure::Enemy;
using SoloAdventure::Equipment;
using SoloAdventure::GameState;
using SoloAdventure::ItemDefinition;
using SoloAdventure::JsonArray;
using SoloAdventure::JsonObject;
using SoloAdventure::JsonReader;
using SoloAdventure::JsonValue;
using SoloAdventure::NarrationEntry;
using SoloAdventure::PendingDecision;

namespace {

constexpr size_t NARRATION_SAVE_WINDOW = 50;
constexpr const char *LEGACY_DEFAULT_CAMPAIGN = "ruined_watchtower";

// Required members throw, optional ones fall back
const JsonValue &require(const JsonValue &object, const std::string &key) {
  const JsonValue &value = object[key];
  if (value.isNull()) {
    throw SaveFormatError("missing field '" + key + "'");
  }
  return value;
}

int requireInt(const JsonValue &object, const std::string &key) {
  auto value = require(object, key).tryAsInt();
  if (!value) {
    throw SaveFormatError("field '" + key + "' is not a number");
  }
  return *value;
}

std::string requireString(const JsonValue &object, const std::string &key) {
  auto value = require(object, key).tryAsString();
  if (!value) {
    throw SaveFormatError("field '" + key + "' is not a string");
  }
  return *value;
}

DiceExpr requireDice(const JsonValue &object, const std::string &key) {
  const std::string text = requireString(object, key);
  auto expr = DiceExpr::tryParse(text);
  if (!expr) {
    throw SaveFormatError("field '" + key + "' is not a dice expression: " + text);
  }
  return *expr;
}

JsonValue stringArray(const std::vector<std::string> &values) {
  JsonArray array;
  array.reserve(values.size());
  for (const auto &value : values) {
    array.emplace_back(value);
  }
  return JsonValue(std::move(array));
}

std::vector<std::string> readStringArray(const JsonValue &value) {
  std::vector<std::string> out;
  if (const JsonArray *array = value.tryAsArray()) {
    for (const auto &entry : *array) {
      if (auto text = entry.tryAsString()) {
        out.push_back(*text);
      }
    }
  }
  return out;
}

void writeCombatant(JsonValue &out, const SoloAdventure::Combatant &combatant) {
  out.set("name", JsonValue(combatant.name));
  out.set("hp", JsonValue(combatant.hp));
  out.set("max_hp", JsonValue(combatant.maxHp));
  out.set("ac", JsonValue(combatant.ac));
  out.set("attack_bonus", JsonValue(combatant.attackBonus));
  out.set("damage", JsonValue(combatant.damage.toString()));
}

void readCombatant(const JsonValue &in, SoloAdventure::Combatant &combatant) {
  combatant.name = requireString(in, "name");
  combatant.maxHp = std::max(0, requireInt(in, "max_hp"));
  combatant.hp = std::clamp(requireInt(in, "hp"), 0, combatant.maxHp);
  combatant.ac = requireInt(in, "ac");
  combatant.attackBonus = requireInt(in, "attack_bonus");
  combatant.damage = requireDice(in, "damage");
}

JsonValue companionToJson(const Companion &companion) {
  JsonValue out;
  writeCombatant(out, companion);
  out.set("id", JsonValue(companion.id));
  out.set("mana", JsonValue(companion.mana));
  out.set("max_mana", JsonValue(companion.maxMana));
  out.set("learned_spells", stringArray(companion.learnedSpells));
  out.set("defend_hp_threshold", JsonValue(companion.defendHpThreshold));
  return out;
}

Companion companionFromJson(const JsonValue &in) {
  Companion companion;
  readCombatant(in, companion);
  companion.id = in.getString("id");
  companion.maxMana = std::max(0, in.getInt("max_mana", 0));
  companion.mana = std::clamp(in.getInt("mana", 0), 0, companion.maxMana);
  companion.learnedSpells = readStringArray(in["learned_spells"]);
  companion.defendHpThreshold = in.getInt("defend_hp_threshold", 3);
  return companion;
}

JsonValue enemyToJson(const Enemy &enemy) {
  JsonValue out;
  writeCombatant(out, enemy);
  out.set("asleep", JsonValue(enemy.asleep));
  return out;
}

Enemy enemyFromJson(const JsonValue &in) {
  Enemy enemy;
  readCombatant(in, enemy);
  enemy.asleep = in.getBool("asleep", false);
  return enemy;
}

JsonValue corpseListToJson(const std::vector<CorpseRecord> &records) {
  JsonArray array;
  for (const auto &record : records) {
    JsonValue entry;
    entry.set("id", JsonValue(record.id));
    entry.set("name", JsonValue(record.name));
    entry.set("looted", JsonValue(record.looted));
    array.push_back(std::move(entry));
  }
  return JsonValue(std::move(array));
}

// Accepts records, plain names, or a single name
std::vector<CorpseRecord> corpseListFromJson(const JsonValue &value) {
  std::vector<CorpseRecord> records;
  if (const JsonArray *array = value.tryAsArray()) {
    int nextId = 1;
    for (const auto &entry : *array) {
      CorpseRecord record;
      if (auto name = entry.tryAsString()) {
        record.id = nextId;
        record.name = *name;
      } else if (entry.isObject()) {
        record.id = entry.getInt("id", nextId);
        record.name = entry.getString("name");
        record.looted = entry.getBool("looted", false);
      } else {
        continue;
      }
      nextId = std::max(nextId, record.id) + 1;
      records.push_back(std::move(record));
    }
  } else if (auto name = value.tryAsString(); name && !name->empty()) {
    records.push_back(CorpseRecord{1, *name, false});
  }
  return records;
}

// Keeps fresh corpse ids above every id already handed out
void repairCorpseCounter(CampaignFlags &flags) {
  int highest = 0;
  for (const auto &[room, records] : flags.corpses) {
    for (const auto &record : records) {
      highest = std::max(highest, record.id);
    }
  }
  flags.nextCorpseId = std::max(flags.nextCorpseId, highest + 1);
}

} // namespace

const char *toString(LoadStatus status) {
  switch (status) {
  case LoadStatus::Ok:
    return "ok";
  case LoadStatus::NotFound:
    return "not found";
  case LoadStatus::Corrupt:
    return "corrupt";
  case LoadStatus::IoError:
    return "io error";
  }
  return "unknown";
}

std::ostream &operator<<(std::ostream &os, LoadStatus status) { return os << toString(status); }

// ============================================================================
// FILE OPERATIONS
// ============================================================================

std::string SaveGameManager::getFullSavePath(const std::string &saveFileName) const {
  std::filesystem::path path(saveFileName);
  if (path.is_absolute() || m_saveDirectory.empty()) {
    return path.string();
  }
  return (std::filesystem::path(m_saveDirectory) / path).string();
}

bool SaveGameManager::save(const GameState &state, const std::string &saveFileName) {
  const std::string fullPath = getFullSavePath(saveFileName);

  std::filesystem::path parentPath = std::filesystem::path(fullPath).parent_path();
  if (!parentPath.empty()) {
    std::error_code ec;
    std::filesystem::create_directories(parentPath, ec);
    if (ec) {
      m_lastError = "Could not create directory " + parentPath.string() + ": " + ec.message();
      SAVEGAME_ERROR(m_lastError);
      return false;
    }
  }

  std::string error;
  if (!SoloAdventure::writeJsonFile(fullPath, toJson(state), &error)) {
    m_lastError = "Failed to save game to " + fullPath + ": " + error;
    SAVEGAME_ERROR(m_lastError);
    return false;
  }

  m_lastError.clear();
  SAVEGAME_DEBUG("Saved turn " + std::to_string(state.turn) + " to " + fullPath);
  return true;
}

LoadStatus SaveGameManager::load(const std::string &saveFileName, GameState &out) {
  const std::string fullPath = getFullSavePath(saveFileName);

  std::error_code ec;
  if (!std::filesystem::exists(fullPath, ec)) {
    m_lastError = "Save file not found: " + fullPath;
    SAVEGAME_DEBUG(m_lastError);
    return LoadStatus::NotFound;
  }

  std::ifstream file(fullPath, std::ios::in | std::ios::binary);
  if (!file.is_open()) {
    m_lastError = "Failed to read save file " + fullPath;
    SAVEGAME_ERROR(m_lastError);
    return LoadStatus::IoError;
  }
  std::stringstream buffer;
  buffer << file.rdbuf();
  if (file.bad()) {
    m_lastError = "Failed to read save file " + fullPath;
    SAVEGAME_ERROR(m_lastError);
    return LoadStatus::IoError;
  }

  JsonReader reader;
  if (!reader.parse(buffer.str())) {
    m_lastError = "Save file is corrupt or invalid JSON: " + reader.getLastError();
    SAVEGAME_ERROR(m_lastError);
    return LoadStatus::Corrupt;
  }

  try {
    GameState loaded = fromJson(reader.getRoot());
    if (loaded.inventory.empty()) {
      for (int i = 0; i < MIN_POTIONS_AFTER_LOAD; ++i) {
        loaded.inventory.push_back(m_registry.itemFromId(loaded.campaignId, "healing_potion"));
      }
      SAVEGAME_INFO("Inventory was empty after load, re-stocked potions");
    }
    out = std::move(loaded);
  } catch (const SaveFormatError &e) {
    m_lastError = "Save file has invalid or incompatible format: " + std::string(e.what());
    SAVEGAME_ERROR(m_lastError);
    return LoadStatus::Corrupt;
  }

  m_lastError.clear();
  SAVEGAME_INFO("Loaded " + fullPath + " at turn " + std::to_string(out.turn));
  return LoadStatus::Ok;
}

bool SaveGameManager::deleteSave(const std::string &saveFileName) {
  const std::string fullPath = getFullSavePath(saveFileName);
  std::error_code ec;
  if (!std::filesystem::remove(fullPath, ec)) {
    m_lastError = ec ? ec.message() : "Save file not found: " + fullPath;
    SAVEGAME_WARN("Could not delete " + fullPath + ": " + m_lastError);
    return false;
  }
  return true;
}

bool SaveGameManager::saveExists(const std::string &saveFileName) const {
  std::error_code ec;
  return std::filesystem::is_regular_file(getFullSavePath(saveFileName), ec);
}

// ============================================================================
// DOCUMENT CODEC
// ============================================================================

JsonValue SaveGameManager::toJson(const GameState &state) const {
  JsonValue root;
  root.set("version", JsonValue(GameState::FORMAT_VERSION));
  root.set("campaign_id", JsonValue(state.campaignId));
  root.set("player", characterToJson(state.player));

  JsonArray companions;
  for (const auto &companion : state.companions) {
    companions.push_back(companionToJson(companion));
  }
  root.set("companions", JsonValue(std::move(companions)));

  root.set("room_id", JsonValue(state.roomId));
  root.set("visited", stringArray(state.visited));
  root.set("flags", flagsToJson(state.flags));

  JsonArray inventory;
  for (const auto &item : state.inventory) {
    inventory.push_back(itemToJson(item));
  }
  root.set("inventory", JsonValue(std::move(inventory)));
  root.set("equipment", equipmentToJson(state.equipment));
  root.set("inventory_limit", JsonValue(state.inventoryLimit));

  root.set("in_combat", JsonValue(state.inCombat));
  JsonArray enemies;
  for (const auto &enemy : state.enemies) {
    enemies.push_back(enemyToJson(enemy));
  }
  root.set("enemies", JsonValue(std::move(enemies)));
  root.set("player_defending", JsonValue(state.playerDefending));
  root.set("companion_defending", JsonValue(state.companionDefending));

  root.set("turn", JsonValue(state.turn));
  root.set("turn_log", stringArray(state.turnLog));
  root.set("last_event", JsonValue(state.lastEvent));
  root.set("last_player_input", JsonValue(state.lastPlayerInput));

  JsonArray narration;
  const size_t first = state.narrationLog.size() > NARRATION_SAVE_WINDOW
                           ? state.narrationLog.size() - NARRATION_SAVE_WINDOW
                           : 0;
  for (size_t i = first; i < state.narrationLog.size(); ++i) {
    const NarrationEntry &entry = state.narrationLog[i];
    JsonValue value;
    value.set("turn", JsonValue(entry.turn));
    value.set("player_input", JsonValue(entry.playerInput));
    value.set("rules_result", JsonValue(entry.rulesResult));
    value.set("gm_response", JsonValue(entry.gmResponse));
    value.set("gm_source", JsonValue(entry.gmSource));
    narration.push_back(std::move(value));
  }
  root.set("narration_log", JsonValue(std::move(narration)));

  root.set("game_over", JsonValue(state.gameOver));
  root.set("rest_streak", JsonValue(state.restStreak));

  JsonArray pending;
  for (const PendingDecision &decision : state.pendingDecisions) {
    JsonValue value;
    value.set("type", JsonValue(decision.type));
    value.set("choices", stringArray(decision.choices));
    value.set("level", JsonValue(decision.level));
    pending.push_back(std::move(value));
  }
  root.set("pending_decisions", JsonValue(std::move(pending)));
  return root;
}

GameState SaveGameManager::fromJson(const JsonValue &root) const {
  if (!root.isObject()) {
    throw SaveFormatError("document is not an object");
  }
  const int version = root.getInt("version", 1);
  if (version > GameState::FORMAT_VERSION) {
    throw SaveFormatError("unsupported save version " + std::to_string(version));
  }

  GameState state;
  state.campaignId = root.getString("campaign_id", LEGACY_DEFAULT_CAMPAIGN);
  if (!m_registry.hasCampaign(state.campaignId)) {
    throw SaveFormatError("unknown campaign '" + state.campaignId + "'");
  }
  state.player = characterFromJson(require(root, "player"));
  state.roomId = requireString(root, "room_id");
  const Campaign &campaign = m_registry.getCampaign(state.campaignId);
  if (campaign.rooms.find(state.roomId) == campaign.rooms.end()) {
    throw SaveFormatError("unknown room '" + state.roomId + "'");
  }

  // Version 1 saves may carry a single companion object
  if (const JsonArray *companions = root["companions"].tryAsArray();
      companions && !companions->empty()) {
    for (const auto &entry : *companions) {
      state.companions.push_back(companionFromJson(entry));
    }
  } else if (root["companion"].isObject()) {
    state.companions.push_back(companionFromJson(root["companion"]));
  }

  state.visited = readStringArray(root["visited"]);

  if (const JsonArray *inventory = root["inventory"].tryAsArray()) {
    for (const auto &entry : *inventory) {
      state.inventory.push_back(itemFromJson(entry, state.campaignId));
    }
  }
  state.equipment = equipmentFromJson(root["equipment"], state.campaignId);
  state.inventoryLimit = root.getInt("inventory_limit", 10);

  state.inCombat = root.getBool("in_combat", false);
  if (const JsonArray *enemies = root["enemies"].tryAsArray();
      enemies && !enemies->empty()) {
    for (const auto &entry : *enemies) {
      state.enemies.push_back(enemyFromJson(entry));
    }
  } else if (root["enemy"].isObject()) {
    state.enemies.push_back(enemyFromJson(root["enemy"]));
  }
  for (const Enemy &enemy : state.enemies) {
    if (campaign.mobs.find(enemy.name) == campaign.mobs.end()) {
      throw SaveFormatError("unknown enemy '" + enemy.name + "'");
    }
  }
  state.playerDefending = root.getBool("player_defending", false);
  state.companionDefending = root.getBool("companion_defending", false);

  state.turn = root.getInt("turn", 0);
  state.turnLog = readStringArray(root["turn_log"]);
  state.lastEvent = root.getString("last_event");
  state.lastPlayerInput = root.getString("last_player_input");

  // Version 1 called the narration log "response_log"
  const JsonValue &narration =
      root.hasKey("narration_log") ? root["narration_log"] : root["response_log"];
  if (const JsonArray *entries = narration.tryAsArray()) {
    for (const auto &entry : *entries) {
      NarrationEntry record;
      record.turn = entry.getInt("turn", 0);
      record.playerInput = entry.getString("player_input");
      record.rulesResult = entry.getString("rules_result");
      record.gmResponse = entry.getString("gm_response");
      record.gmSource = entry.getString("gm_source");
      state.appendNarration(std::move(record), NARRATION_SAVE_WINDOW);
    }
  }

  state.gameOver = root.getBool("game_over", false);
  state.restStreak = root.getInt("rest_streak", 0);

  const JsonValue &pending =
      root.hasKey("pending_decisions") ? root["pending_decisions"] : root["pending_level_choices"];
  if (const JsonArray *entries = pending.tryAsArray()) {
    for (const auto &entry : *entries) {
      PendingDecision decision;
      decision.type = entry.getString("type", "spell");
      decision.choices = readStringArray(entry["choices"]);
      decision.level = entry.getInt("level", 0);
      if (!decision.choices.empty()) {
        state.pendingDecisions.push_back(std::move(decision));
      }
    }
  }

  if (version < GameState::FORMAT_VERSION) {
    state.flags = migrateLegacyFlags(root["flags"], state.campaignId, state.roomId);
    SAVEGAME_INFO("Migrated version " + std::to_string(version) + " flags");
  } else {
    state.flags = flagsFromJson(root["flags"]);
  }
  return state;
}

JsonValue SaveGameManager::characterToJson(const Character &character) {
  JsonValue out;
  writeCombatant(out, character);
  out.set("race", JsonValue(character.race));
  out.set("cls", JsonValue(character.className));

  JsonValue stats;
  for (auto stat : SoloAdventure::ALL_STATS) {
    stats.set(std::string(SoloAdventure::toString(stat)), JsonValue(character.stat(stat)));
  }
  out.set("stats", std::move(stats));

  out.set("base_ac", JsonValue(character.baseAc));
  out.set("mana", JsonValue(character.mana));
  out.set("max_mana", JsonValue(character.maxMana));
  out.set("gold", JsonValue(character.gold));
  out.set("xp", JsonValue(character.xp));
  out.set("level", JsonValue(character.level));
  out.set("learned_spells", stringArray(character.learnedSpells));
  return out;
}

Character SaveGameManager::characterFromJson(const JsonValue &value) const {
  if (!value.isObject()) {
    throw SaveFormatError("player is not an object");
  }
  Character character;
  readCombatant(value, character);
  character.race = value.getString("race", "Human");
  character.className = requireString(value, "cls");

  const JsonValue &stats = value["stats"];
  for (auto stat : SoloAdventure::ALL_STATS) {
    character.stats[static_cast<size_t>(stat)] =
        stats.getInt(std::string(SoloAdventure::toString(stat)), 0);
  }

  character.baseAc = value.getInt("base_ac", character.ac);
  character.maxMana = std::max(0, value.getInt("max_mana", 0));
  character.mana = std::clamp(value.getInt("mana", 0), 0, character.maxMana);
  character.gold = value.getInt("gold", 0);
  character.xp = value.getInt("xp", 0);
  character.level = std::max(1, value.getInt("level", 1));

  if (value["learned_spells"].isArray()) {
    character.learnedSpells = readStringArray(value["learned_spells"]);
  } else if (const auto *profile = m_registry.findClassProfile(character.className)) {
    character.learnedSpells = profile->spells;
  }
  return character;
}

JsonValue SaveGameManager::itemToJson(const ItemDefinition &item) {
  JsonValue out;
  out.set("id", JsonValue(item.id));
  out.set("name", JsonValue(item.name));
  out.set("kind", JsonValue(std::string(SoloAdventure::toString(item.kind))));
  if (item.slot) {
    out.set("slot", JsonValue(std::string(SoloAdventure::toString(*item.slot))));
  }
  if (item.effect.type != SoloAdventure::EffectType::None) {
    JsonValue effect;
    effect.set("type", JsonValue(std::string(SoloAdventure::toString(item.effect.type))));
    if (item.effect.type == SoloAdventure::EffectType::Heal) {
      effect.set("dice", JsonValue(item.effect.healDice));
    } else {
      effect.set("bonus", JsonValue(item.effect.acBonus));
    }
    out.set("effect", std::move(effect));
  }
  out.set("counts_toward_limit", JsonValue(item.countsTowardLimit));
  return out;
}

ItemDefinition SaveGameManager::itemFromJson(const JsonValue &value,
                                             const std::string &campaignId) const {
  if (auto name = value.tryAsString()) {
    return m_registry.itemFromName(campaignId, *name);
  }
  if (!value.isObject()) {
    throw SaveFormatError("inventory entry is neither an item nor a name");
  }

  ItemDefinition item;
  item.id = value.getString("id", "unknown");
  item.name = value.getString("name", "Unknown Item");
  item.kind = SoloAdventure::itemKindFromString(value.getString("kind"))
                  .value_or(SoloAdventure::ItemKind::Unknown);
  if (value.hasKey("slot")) {
    item.slot = SoloAdventure::equipSlotFromString(value.getString("slot"));
  }
  const JsonValue &effect = value["effect"];
  if (effect.isObject()) {
    item.effect.type = SoloAdventure::effectTypeFromString(effect.getString("type"))
                           .value_or(SoloAdventure::EffectType::None);
    item.effect.healDice = effect.getString("dice");
    item.effect.acBonus = effect.getInt("bonus", 0);
  }
  item.countsTowardLimit = value.getBool("counts_toward_limit", true);
  return item;
}

JsonValue SaveGameManager::equipmentToJson(const Equipment &equipment) {
  JsonValue out{JsonObject{}};
  for (auto slot : SoloAdventure::ALL_EQUIP_SLOTS) {
    const auto &item = equipment[static_cast<size_t>(slot)];
    out.set(std::string(SoloAdventure::toString(slot)), item ? itemToJson(*item) : JsonValue());
  }
  return out;
}

Equipment SaveGameManager::equipmentFromJson(const JsonValue &value,
                                             const std::string &campaignId) const {
  Equipment equipment{};
  if (!value.isObject()) {
    return equipment;
  }
  for (auto slot : SoloAdventure::ALL_EQUIP_SLOTS) {
    const JsonValue &entry = value[std::string(SoloAdventure::toString(slot))];
    if (!entry.isNull()) {
      equipment[static_cast<size_t>(slot)] = itemFromJson(entry, campaignId);
    }
  }
  return equipment;
}

// ============================================================================
// FLAGS
// ============================================================================

JsonValue SaveGameManager::flagsToJson(const CampaignFlags &flags) {
  JsonValue out;
  out.set("defeated_rooms", stringArray(flags.defeatedRooms));

  JsonValue corpses{JsonObject{}};
  for (const auto &[room, records] : flags.corpses) {
    corpses.set(room, corpseListToJson(records));
  }
  out.set("corpses", std::move(corpses));
  out.set("next_corpse_id", JsonValue(flags.nextCorpseId));

  JsonValue markers{JsonObject{}};
  for (const auto &[name, value] : flags.markers) {
    markers.set(name, JsonValue(value));
  }
  out.set("markers", std::move(markers));
  return out;
}

CampaignFlags SaveGameManager::flagsFromJson(const JsonValue &value) {
  CampaignFlags flags;
  for (const auto &room : readStringArray(value["defeated_rooms"])) {
    flags.markDefeated(room);
  }
  if (const JsonObject *corpses = value["corpses"].tryAsObject()) {
    for (const auto &[room, list] : *corpses) {
      flags.corpses[room] = corpseListFromJson(list);
    }
  }
  flags.nextCorpseId = value.getInt("next_corpse_id", 1);
  if (const JsonObject *markers = value["markers"].tryAsObject()) {
    for (const auto &[name, marker] : *markers) {
      if (auto set = marker.tryAsBool()) {
        flags.markers[name] = *set;
      }
    }
  }
  repairCorpseCounter(flags);
  return flags;
}

CampaignFlags SaveGameManager::migrateLegacyFlags(const JsonValue &value,
                                                  const std::string &campaignId,
                                                  const std::string &roomId) {
  CampaignFlags flags;
  const JsonObject *bag = value.tryAsObject();
  if (!bag) {
    return flags;
  }

  for (const auto &room : readStringArray(value["defeated_rooms"])) {
    flags.markDefeated(room);
  }
  if (const JsonObject *corpses = value["corpses"].tryAsObject()) {
    for (const auto &[room, list] : *corpses) {
      auto records = corpseListFromJson(list);
      if (!records.empty()) {
        flags.corpses[room] = std::move(records);
      }
    }
  }
  flags.nextCorpseId = value.getInt("next_corpse_id", 1);

  // Single-bandit saves predate per-room combat tracking
  const bool legacyBandit = value.hasKey("bandit_defeated") || value.hasKey("bandit_looted") ||
                            value.hasKey("enemy_name");
  if (legacyBandit) {
    const std::string room = campaignId == LEGACY_DEFAULT_CAMPAIGN ? "barracks" : roomId;
    if (value.getBool("bandit_defeated", false)) {
      flags.markDefeated(room);
    }
    const std::string enemyName = value.getString("enemy_name");
    if (!enemyName.empty() && flags.corpses.find(room) == flags.corpses.end()) {
      flags.corpses[room] = {CorpseRecord{1, enemyName, false}};
    }
    if (value.getBool("bandit_looted", false)) {
      for (auto &record : flags.corpses[room]) {
        record.looted = true;
      }
    }
  }

  for (const auto &[key, entry] : *bag) {
    if (key == "bandit_defeated" || key == "bandit_looted") {
      continue;
    }
    if (auto set = entry.tryAsBool()) {
      flags.markers[key] = *set;
    }
  }

  repairCorpseCounter(flags);
  return flags;
}
