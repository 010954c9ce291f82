/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "managers/CharacterRoster.hpp"
#include "core/Logger.hpp"
#include "managers/ContentRegistry.hpp"
#include "utils/JsonReader.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <set>

using SoloAdventure::Character;
using SoloAdventure::Equipment;
using SoloAdventure::GameState;
using SoloAdventure::ItemDefinition;
using SoloAdventure::JsonArray;
using SoloAdventure::JsonReader;
using SoloAdventure::JsonValue;

namespace {
constexpr const char *POTION_ID = "healing_potion";
constexpr const char *ROSTER_EXTENSION = ".json";
} // namespace

CharacterRoster::CharacterRoster(const ContentRegistry &registry, std::string directory)
    : m_registry(registry), m_codec(registry), m_directory(std::move(directory)) {}

std::string CharacterRoster::slugify(const std::string &name) {
  std::string slug;
  bool pendingSeparator = false;
  for (char raw : name) {
    const auto c = static_cast<unsigned char>(raw);
    if (std::isspace(c) || raw == '-') {
      pendingSeparator = true;
      continue;
    }
    if (!std::isalnum(c) && raw != '_') {
      continue;
    }
    if (pendingSeparator) {
      slug += '_';
      pendingSeparator = false;
    }
    slug += static_cast<char>(std::tolower(c));
  }

  const auto first = slug.find_first_not_of('_');
  if (first == std::string::npos) {
    return "character";
  }
  const auto last = slug.find_last_not_of('_');
  return slug.substr(first, last - first + 1);
}

std::string CharacterRoster::pathFor(const std::string &name) const {
  return (std::filesystem::path(m_directory) / (slugify(name) + ROSTER_EXTENSION)).string();
}

std::vector<std::string> CharacterRoster::listCharacters() const {
  std::set<std::string> names;
  std::error_code ec;
  if (!std::filesystem::is_directory(m_directory, ec)) {
    return {};
  }

  for (const auto &entry : std::filesystem::directory_iterator(m_directory, ec)) {
    if (!entry.is_regular_file() || entry.path().extension() != ROSTER_EXTENSION) {
      continue;
    }
    JsonReader reader;
    if (!reader.loadFromFile(entry.path().string())) {
      ROSTER_WARN("Skipping unreadable roster file " + entry.path().string() + ": " +
                  reader.getLastError());
      continue;
    }
    const std::string name = reader.getRoot().getString("name");
    if (!name.empty()) {
      names.insert(name);
    }
  }
  if (ec) {
    ROSTER_WARN("Error while listing " + m_directory + ": " + ec.message());
  }
  return {names.begin(), names.end()};
}

bool CharacterRoster::exists(const std::string &name) const {
  std::error_code ec;
  return std::filesystem::is_regular_file(pathFor(name), ec);
}

bool CharacterRoster::saveCharacter(const Character &character,
                                    const std::vector<ItemDefinition> &inventory,
                                    const Equipment &equipment) {
  std::error_code ec;
  std::filesystem::create_directories(m_directory, ec);
  if (ec) {
    m_lastError = "Could not create roster directory " + m_directory + ": " + ec.message();
    ROSTER_ERROR(m_lastError);
    return false;
  }

  JsonValue document = SaveGameManager::characterToJson(character);
  document.set("version", JsonValue(ROSTER_FORMAT_VERSION));
  JsonArray items;
  for (const auto &item : inventory) {
    items.push_back(SaveGameManager::itemToJson(item));
  }
  document.set("inventory", JsonValue(std::move(items)));
  document.set("equipment", SaveGameManager::equipmentToJson(equipment));

  const std::string path = pathFor(character.name);
  std::string error;
  if (!SoloAdventure::writeJsonFile(path, document, &error)) {
    m_lastError = "Failed to write roster entry " + path + ": " + error;
    ROSTER_ERROR(m_lastError);
    return false;
  }
  ROSTER_DEBUG("Saved " + character.name + " to " + path);
  return true;
}

bool CharacterRoster::saveFromState(const GameState &state) {
  return saveCharacter(state.player, state.inventory, state.equipment);
}

LoadStatus CharacterRoster::loadCharacter(const std::string &name, const std::string &campaignId,
                                          RosterEntry &out) {
  const std::string path = pathFor(name);
  if (!exists(name)) {
    m_lastError = "No roster entry for " + name;
    return LoadStatus::NotFound;
  }

  JsonReader reader;
  if (!reader.loadFromFile(path)) {
    m_lastError = "Roster entry " + path + " is unreadable: " + reader.getLastError();
    ROSTER_ERROR(m_lastError);
    return LoadStatus::Corrupt;
  }

  RosterEntry entry;
  try {
    const JsonValue &root = reader.getRoot();
    entry.character = m_codec.characterFromJson(root);
    if (const JsonArray *items = root["inventory"].tryAsArray()) {
      for (const auto &item : *items) {
        entry.inventory.push_back(m_codec.itemFromJson(item, campaignId));
      }
    }
    entry.equipment = m_codec.equipmentFromJson(root["equipment"], campaignId);
  } catch (const SaveFormatError &e) {
    m_lastError = "Roster entry " + path + " is invalid: " + e.what();
    ROSTER_ERROR(m_lastError);
    return LoadStatus::Corrupt;
  }

  entry.character.hp = entry.character.maxHp;
  entry.character.mana = entry.character.maxMana;

  const auto potions = std::count_if(entry.inventory.begin(), entry.inventory.end(),
                                     [](const ItemDefinition &item) { return item.id == POTION_ID; });
  for (auto i = potions; i < MIN_ROSTER_POTIONS; ++i) {
    entry.inventory.push_back(m_registry.itemFromId(campaignId, POTION_ID));
  }

  out = std::move(entry);
  ROSTER_INFO("Loaded " + out.character.name + " from the roster");
  return LoadStatus::Ok;
}

bool CharacterRoster::deleteCharacter(const std::string &name) {
  std::error_code ec;
  if (!std::filesystem::remove(pathFor(name), ec)) {
    m_lastError = ec ? ec.message() : "No roster entry for " + name;
    return false;
  }
  return true;
}

std::string CharacterRoster::summary(const RosterEntry &entry) {
  const Character &c = entry.character;
  return c.name + " (" + c.race + " " + c.className + "), " + std::to_string(c.gold) +
         " gold, " + std::to_string(entry.inventory.size()) + " items";
}
