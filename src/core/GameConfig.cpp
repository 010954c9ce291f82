/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "core/GameConfig.hpp"
#include "core/Logger.hpp"
#include "managers/SettingsManager.hpp"
#include "utils/ResourcePath.hpp"
#include <algorithm>

namespace SoloAdventure {

namespace {
std::string pathOrUserData(const SettingsManager &settings, const std::string &key,
                           const std::string &fallbackName) {
  std::string value = settings.get<std::string>("paths", key, "");
  if (value.empty()) {
    return ResourcePath::userDataPath(fallbackName);
  }
  return value;
}
} // namespace

GameConfig GameConfig::fromSettings(const SettingsManager &settings) {
  GameConfig config;

  config.contentDir = settings.get<std::string>("paths", "content_dir", config.contentDir);
  config.profilesFile = settings.get<std::string>("paths", "profiles_file", config.profilesFile);
  config.saveFile = pathOrUserData(settings, "save_file", "game_state.json");
  config.rosterDir = pathOrUserData(settings, "roster_dir", "characters");

  config.campaignId = settings.get<std::string>("game", "campaign", "");
  config.companionId = settings.get<std::string>("game", "companion", "");
  config.seed = static_cast<uint32_t>(std::max(0, settings.get<int>("game", "seed", 0)));
  config.inventoryLimit = std::max(1, settings.get<int>("game", "inventory_limit", 10));
  config.maxRestRepeat = std::max(1, settings.get<int>("game", "max_rest_repeat", 20));

  config.player.name = settings.get<std::string>("player", "name", config.player.name);
  config.player.className = settings.get<std::string>("player", "class", config.player.className);
  config.player.race = settings.get<std::string>("player", "race", config.player.race);
  for (auto stat : ALL_STATS) {
    const std::string key(toString(stat));
    auto &value = config.player.stats[static_cast<size_t>(stat)];
    value = settings.get<int>("player", key, value);
  }

  const int timeoutMs = std::max(1, settings.get<int>("narration", "timeout_ms", 30000));
  const int backoffMs = std::max(0, settings.get<int>("narration", "backoff_ms", 1000));
  config.narration.timeout = std::chrono::milliseconds(timeoutMs);
  config.narration.backoff = std::chrono::milliseconds(backoffMs);
  config.narration.maxRetries = std::max(1, settings.get<int>("narration", "max_retries", 3));
  config.narration.logWindow =
      static_cast<size_t>(std::max(1, settings.get<int>("narration", "log_window", 50)));

  SESSION_DEBUG("Config: campaign '" + config.campaignId + "', save file " + config.saveFile);
  return config;
}

} // namespace SoloAdventure
