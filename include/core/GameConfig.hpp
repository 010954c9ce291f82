/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef GAME_CONFIG_HPP
#define GAME_CONFIG_HPP

#include "content/Profiles.hpp"
#include "managers/NarrationManager.hpp"

#include <cstdint>
#include <string>

namespace SoloAdventure {

class SettingsManager;

// Character used by the console driver when no roster entry is picked
struct PlayerSetup {
  std::string name{"Adventurer"};
  std::string className{"Fighter"};
  std::string race{"Human"};
  StatBlock stats{2, 2, 2, 2, 2, 2};
};

/**
 * @brief Typed view of the settings file
 *
 * Empty save and roster paths resolve to the per-user data directory.
 */
struct GameConfig {
  std::string contentDir{"res/campaigns"};
  std::string profilesFile{"res/profiles.json"};
  std::string saveFile{"game_state.json"};
  std::string rosterDir{"characters"};

  std::string campaignId; // empty: first registered campaign
  std::string companionId;
  uint32_t seed{0};       // 0: nondeterministic
  int inventoryLimit{10};
  int maxRestRepeat{20};

  PlayerSetup player;
  NarrationConfig narration;

  static GameConfig fromSettings(const SettingsManager &settings);
};

} // namespace SoloAdventure

#endif // GAME_CONFIG_HPP
