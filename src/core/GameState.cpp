/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "core/GameState.hpp"
#include <algorithm>

namespace SoloAdventure {

bool CampaignFlags::isDefeated(const std::string &roomId) const {
  return std::find(defeatedRooms.begin(), defeatedRooms.end(), roomId) != defeatedRooms.end();
}

bool CampaignFlags::markDefeated(const std::string &roomId) {
  if (isDefeated(roomId)) {
    return false;
  }
  defeatedRooms.push_back(roomId);
  return true;
}

bool CampaignFlags::marker(const std::string &name) const {
  auto it = markers.find(name);
  return it != markers.end() && it->second;
}

Companion *GameState::activeCompanion() {
  return companions.empty() ? nullptr : &companions.front();
}

const Companion *GameState::activeCompanion() const {
  return companions.empty() ? nullptr : &companions.front();
}

void GameState::markVisited(const std::string &room) {
  if (std::find(visited.begin(), visited.end(), room) == visited.end()) {
    visited.push_back(room);
  }
}

void GameState::appendNarration(NarrationEntry entry, size_t window) {
  narrationLog.push_back(std::move(entry));
  if (window > 0 && narrationLog.size() > window) {
    narrationLog.erase(narrationLog.begin(),
                       narrationLog.end() - static_cast<std::ptrdiff_t>(window));
  }
}

int GameState::livingEnemyCount() const {
  return static_cast<int>(std::count_if(enemies.begin(), enemies.end(),
                                        [](const Enemy &e) { return !e.isDown(); }));
}

} // namespace SoloAdventure
