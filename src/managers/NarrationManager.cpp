/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "managers/NarrationManager.hpp"
#include "core/Logger.hpp"
#include "managers/ContentRegistry.hpp"
#include "utils/TextUtils.hpp"
#include <algorithm>
#include <exception>
#include <future>
#include <thread>

using SoloAdventure::Companion;
using SoloAdventure::GameState;
using SoloAdventure::RandomSource;
using SoloAdventure::Room;
namespace TextUtils = SoloAdventure::TextUtils;

namespace {

constexpr const char *ACTIONS_COMBAT =
    "attack, defend, special, cast <spell> [target], use, inventory";
constexpr const char *ACTIONS_EXPLORATION = "talk, search, loot, move, rest, use, inventory";
constexpr const char *FULL_HP_NOTE =
    "Everyone at full HP. Suggest movement, exploration, or combat, not healing.";

std::string hpText(int hp, int maxHp) {
  return std::to_string(hp) + "/" + std::to_string(maxHp);
}

std::string inventoryNames(const GameState &state) {
  if (state.inventory.empty()) {
    return "(empty)";
  }
  std::vector<std::string> names;
  names.reserve(state.inventory.size());
  for (const auto &item : state.inventory) {
    names.push_back(item.name);
  }
  return TextUtils::join(names, ", ");
}

std::string enemyLine(const GameState &state) {
  std::vector<std::string> lines;
  for (const auto &enemy : state.enemies) {
    lines.push_back(enemy.name + " HP " + hpText(enemy.hp, enemy.maxHp));
  }
  return "Enemies: " + TextUtils::join(lines, " | ");
}

std::string flagLine(const SoloAdventure::CampaignFlags &flags) {
  std::vector<std::string> parts;
  if (!flags.defeatedRooms.empty()) {
    parts.push_back("defeated_rooms=" + TextUtils::join(flags.defeatedRooms, "|"));
  }
  for (const auto &[name, value] : flags.markers) {
    parts.push_back(name + "=" + (value ? "true" : "false"));
  }
  return parts.empty() ? std::string() : "Flags: " + TextUtils::join(parts, ", ");
}

const char *boolText(bool value) { return value ? "true" : "false"; }

} // namespace

// ============================================================================
// STUB BACKEND
// ============================================================================

const std::vector<std::string> &StubNarrationBackend::gameMasterLines() {
  static const std::vector<std::string> lines{
      "The ruin creaks with old stone. What do you do?",
      "You take a breath as the air shifts. What's your move?",
      "The watchtower looms, silent and watchful. What do you do next?",
  };
  return lines;
}

const std::vector<std::string> &StubNarrationBackend::companionLines() {
  static const std::vector<std::string> lines{
      "{name} whispers, 'Keep your distance and watch for traps.'",
      "{name} says, 'Let me cover you while you act.'",
      "{name} mutters, 'Slow and steady - no sudden moves.'",
  };
  return lines;
}

std::string StubNarrationBackend::cannedLine(const NarrationRequest &request,
                                             RandomSource &source) {
  const auto &lines =
      request.role == NarrationRole::Companion ? companionLines() : gameMasterLines();
  const int index = source.uniformInt(0, static_cast<int>(lines.size()) - 1);
  const std::string speaker = request.speaker.empty() ? "Your companion" : request.speaker;
  return TextUtils::replaceAll(lines[static_cast<size_t>(index)], "name", speaker);
}

std::string StubNarrationBackend::narrate(const NarrationRequest &request) {
  return cannedLine(request, m_source);
}

// ============================================================================
// MANAGER
// ============================================================================

NarrationManager::NarrationManager(const ContentRegistry &registry,
                                   std::shared_ptr<NarrationBackend> backend,
                                   NarrationConfig config)
    : m_registry(registry), m_backend(std::move(backend)), m_config(config) {
  if (!m_backend) {
    m_backend = std::make_shared<StubNarrationBackend>();
  }
  m_config.maxRetries = std::max(1, m_config.maxRetries);
}

const std::string &NarrationManager::gameMasterSystemPrompt() {
  static const std::string prompt =
      "You are the GM for a tiny solo fantasy adventure. Narrate outcomes that the rules engine "
      "already resolved. Do NOT invent new outcomes, rolls, damage, or state changes. Ask the "
      "player what they do next with a short question. Keep responses under 120 words.";
  return prompt;
}

std::string NarrationManager::companionSystemPrompt(const std::string &companionName) {
  return "You are " + companionName +
         ", a cautious companion on a solo fantasy adventure. Give a short, practical "
         "suggestion (1 sentence) based on the current situation. Do NOT narrate outcomes or "
         "change the game state. Only suggest actions that are actually available. Vary your "
         "suggestions between movement, exploration, combat actions and rest. Only suggest "
         "healing or potions when someone is wounded (HP below max) and it would help. When "
         "everyone is at full HP, never suggest healing.";
}

std::string NarrationManager::availableActions(bool inCombat) {
  return inCombat ? ACTIONS_COMBAT : ACTIONS_EXPLORATION;
}

bool NarrationManager::partyAtFullHp(const GameState &state) {
  if (state.player.isWounded()) {
    return false;
  }
  return std::none_of(state.companions.begin(), state.companions.end(),
                      [](const Companion &companion) { return companion.isWounded(); });
}

std::string NarrationManager::gameMasterSnapshot(const GameState &state) const {
  const Room &room = m_registry.getRoom(state.campaignId, state.roomId);
  const auto &player = state.player;

  std::vector<std::string> parts;
  parts.push_back("Room: " + room.name);
  parts.push_back("Room kind: " + std::string(SoloAdventure::toString(room.kind)));
  parts.push_back("Player: " + player.name + " (" + player.race + " " + player.className +
                  ") Level " + std::to_string(player.level) + " HP " +
                  hpText(player.hp, player.maxHp));

  std::vector<std::string> stats;
  for (auto stat : SoloAdventure::ALL_STATS) {
    stats.push_back(std::string(SoloAdventure::toString(stat)) + " " +
                    std::to_string(player.stat(stat)));
  }
  parts.push_back("Stats: " + TextUtils::join(stats, " "));
  parts.push_back("Mana: " + hpText(player.mana, player.maxMana));
  parts.push_back("Gold: " + std::to_string(player.gold));
  for (const auto &companion : state.companions) {
    parts.push_back("Companion: " + companion.name + " HP " + hpText(companion.hp, companion.maxHp));
  }
  parts.push_back("Inventory: " + inventoryNames(state));
  parts.push_back(std::string("In combat: ") + boolText(state.inCombat));

  if (!state.enemies.empty()) {
    parts.push_back(enemyLine(state));
  }
  if (!state.lastEvent.empty()) {
    parts.push_back("Last event: " + state.lastEvent);
  }
  if (auto flags = flagLine(state.flags); !flags.empty()) {
    parts.push_back(flags);
  }
  return TextUtils::join(parts, "\n");
}

std::string NarrationManager::companionSnapshot(const GameState &state) const {
  const Room &room = m_registry.getRoom(state.campaignId, state.roomId);
  const auto &player = state.player;

  std::vector<std::string> parts;
  parts.push_back("Room: " + room.name + " (" + std::string(SoloAdventure::toString(room.kind)) +
                  ")");
  parts.push_back("Player Level " + std::to_string(player.level) + " HP " +
                  hpText(player.hp, player.maxHp));
  for (const auto &companion : state.companions) {
    parts.push_back(companion.name + " HP " + hpText(companion.hp, companion.maxHp));
  }
  parts.push_back("Mana: " + hpText(player.mana, player.maxMana));
  parts.push_back("Gold: " + std::to_string(player.gold));
  parts.push_back("Inventory: " + inventoryNames(state));
  parts.push_back(std::string("In combat: ") + boolText(state.inCombat));
  if (!state.enemies.empty()) {
    parts.push_back(enemyLine(state));
  }
  if (!state.lastEvent.empty()) {
    parts.push_back("Last event: " + state.lastEvent);
  }
  return TextUtils::join(parts, "\n");
}

NarrationResult NarrationManager::narrateTurn(const GameState &state,
                                              const std::string &playerInput,
                                              const std::string &rulesResult) {
  NarrationRequest req;
  req.role = NarrationRole::GameMaster;
  req.systemPrompt = gameMasterSystemPrompt();
  req.userPrompt = "STATE\n" + gameMasterSnapshot(state) + "\n\nPLAYER INPUT\n" + playerInput +
                   "\n\nRULES RESULT\n" + rulesResult +
                   "\n\nAdd brief atmospheric flavor (do not repeat RULES RESULT verbatim) and "
                   "end with a short question prompting the player's next action.";
  return request(req);
}

std::optional<NarrationResult> NarrationManager::companionSuggest(const GameState &state) {
  const Companion *companion = state.activeCompanion();
  if (!companion) {
    return std::nullopt;
  }

  NarrationRequest req;
  req.role = NarrationRole::Companion;
  req.speaker = companion->name;
  req.systemPrompt = companionSystemPrompt(companion->name);
  req.userPrompt = "STATE\n" + companionSnapshot(state) + "\n";
  if (partyAtFullHp(state)) {
    req.userPrompt += std::string(FULL_HP_NOTE) + "\n";
  }
  req.userPrompt += "Available actions: " + availableActions(state.inCombat) +
                    "\nGive a brief suggestion.";
  return request(req);
}

NarrationResult NarrationManager::request(const NarrationRequest &req) {
  if (m_backend->isStub()) {
    return {m_backend->narrate(req), "stub"};
  }

  auto backoff = m_config.backoff;
  for (int attempt = 0; attempt < m_config.maxRetries; ++attempt) {
    // The worker owns copies of everything it touches, so a call that times out is
    // left running detached and never blocks this manager or process exit
    auto promise = std::make_shared<std::promise<std::string>>();
    std::future<std::string> future = promise->get_future();
    std::thread([backend = m_backend, req, promise]() {
      try {
        promise->set_value(backend->narrate(req));
      } catch (...) {
        promise->set_exception(std::current_exception());
      }
    }).detach();

    if (future.wait_for(m_config.timeout) == std::future_status::ready) {
      try {
        std::string text = TextUtils::trim(future.get());
        if (!text.empty()) {
          return {std::move(text), "ai"};
        }
        NARRATION_WARN("Empty narration on attempt " + std::to_string(attempt + 1));
      } catch (const std::exception &e) {
        NARRATION_WARN("Narration attempt " + std::to_string(attempt + 1) +
                       " failed: " + e.what());
      }
    } else {
      NARRATION_WARN("Narration attempt " + std::to_string(attempt + 1) + " timed out after " +
                     std::to_string(m_config.timeout.count()) + "ms");
    }

    if (attempt + 1 < m_config.maxRetries && backoff.count() > 0) {
      std::this_thread::sleep_for(backoff);
    }
    backoff *= 2;
  }

  NARRATION_ERROR("Narration failed after " + std::to_string(m_config.maxRetries) +
                  " attempts, using fallback");
  return {StubNarrationBackend::cannedLine(req, m_fallbackSource), "fallback"};
}

