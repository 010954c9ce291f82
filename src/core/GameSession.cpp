/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "core/GameSession.hpp"
#include "core/Logger.hpp"
#include "managers/ContentRegistry.hpp"
#include "utils/TextUtils.hpp"
#include <algorithm>
#include <initializer_list>

using SoloAdventure::Campaign;
using SoloAdventure::Character;
using SoloAdventure::Equipment;
using SoloAdventure::GameConfig;
using SoloAdventure::GameState;
using SoloAdventure::ItemDefinition;
using SoloAdventure::NarrationEntry;
using SoloAdventure::RandomSource;
namespace TextUtils = SoloAdventure::TextUtils;

namespace {

const char *const EXPLORATION_HINT =
    "Try: talk, search, loot [number|all], move <destination>, rest [N], use potion [on <name>], "
    "equip <item>, unequip <slot>, inventory, stats, help.";
const char *const COMBAT_HINT = "Choose attack, defend, special, or cast <spell> [target].";

bool isOneOf(const std::string &word, std::initializer_list<const char *> options) {
  return std::any_of(options.begin(), options.end(),
                     [&word](const char *option) { return word == option; });
}

// "attack 2" -> "2"; "attack" -> ""
std::string argumentAfter(const std::string &action, const std::string &verb) {
  if (action.size() <= verb.size()) {
    return {};
  }
  return TextUtils::trim(action.substr(verb.size()));
}

bool hasVerb(const std::string &action, const std::string &verb) {
  return action == verb || TextUtils::startsWith(action, verb + " ");
}

std::optional<std::string> moveTarget(const std::string &action) {
  if (isOneOf(action, {"up", "down", "north", "south", "east", "west", "back"})) {
    return action;
  }
  for (const char *verb : {"go", "move", "walk", "head", "enter", "travel", "leave"}) {
    if (TextUtils::startsWith(action, std::string(verb) + " ")) {
      return argumentAfter(action, verb);
    }
  }
  return std::nullopt;
}

TurnResult rejected(std::string message) {
  TurnResult result;
  result.message = std::move(message);
  return result;
}

TurnResult informational(std::string message) {
  TurnResult result;
  result.success = true;
  result.message = std::move(message);
  return result;
}

} // namespace

GameSession::GameSession(const ContentRegistry &registry, RandomSource &random, GameConfig config,
                         std::shared_ptr<NarrationBackend> narrationBackend)
    : m_registry(registry), m_config(std::move(config)), m_dice(random),
      m_factory(registry, m_dice), m_inventory(m_state, registry, m_dice),
      m_progression(m_state, registry, m_dice),
      m_combat(m_state, registry, m_dice, m_progression),
      m_exploration(m_state, registry, m_dice, m_factory, m_inventory), m_saves(registry),
      m_roster(registry, m_config.rosterDir),
      m_narration(registry, std::move(narrationBackend), m_config.narration) {}

const std::vector<std::string> &GameSession::defaultKit() {
  static const std::vector<std::string> kit{"healing_potion", "healing_potion", "healing_potion",
                                            "leather_cap", "worn_boots"};
  return kit;
}

std::string GameSession::normalizeAction(const std::string &raw) {
  auto tokens = TextUtils::splitWords(TextUtils::toLower(raw));
  if (tokens.empty()) {
    return {};
  }
  if (isOneOf(tokens.front(), {"go", "move", "walk", "head", "enter", "travel"})) {
    tokens.erase(std::remove_if(tokens.begin() + 1, tokens.end(),
                                [](const std::string &token) {
                                  return isOneOf(token,
                                                 {"to", "the", "a", "an", "towards", "toward"});
                                }),
                 tokens.end());
  }
  return TextUtils::join(tokens, " ");
}

// ============================================================================
// SESSION LIFECYCLE
// ============================================================================

std::string GameSession::startNewGame(const std::string &campaignId, Character player,
                                      std::vector<ItemDefinition> inventory, Equipment equipment,
                                      const std::vector<std::string> &companionIds) {
  const Campaign &campaign = m_registry.getCampaign(campaignId);

  m_state = GameState{};
  m_state.campaignId = campaign.id;
  m_state.player = std::move(player);
  m_state.inventoryLimit = m_config.inventoryLimit;
  m_state.roomId = campaign.roomOrder.front();

  std::vector<std::string> ids = companionIds;
  if (ids.empty() && !m_config.companionId.empty()) {
    ids.push_back(m_config.companionId);
  }
  m_state.companions = m_factory.createCampaignCompanions(campaign.id, ids);

  if (inventory.empty()) {
    for (const auto &itemId : defaultKit()) {
      inventory.push_back(m_registry.itemFromId(campaign.id, itemId));
    }
  }
  m_state.inventory = std::move(inventory);
  m_state.equipment = std::move(equipment);

  m_inventory.syncArmorClass();
  m_factory.ensureCasterMana(m_state.player);

  const std::string intro = m_exploration.startRoom();
  m_state.lastEvent = intro;
  SESSION_INFO("New game in " + campaign.id + " with " + m_state.player.name);
  save();
  return intro;
}

LoadStatus GameSession::resume() {
  GameState loaded;
  const LoadStatus status = m_saves.load(m_config.saveFile, loaded);
  if (status != LoadStatus::Ok) {
    SESSION_WARN("Could not resume from " + m_config.saveFile + ": " +
                 std::string(toString(status)));
    return status;
  }

  m_state = std::move(loaded);
  m_inventory.syncArmorClass();
  m_factory.ensureCasterMana(m_state.player);
  SESSION_INFO("Resumed " + m_state.player.name + " at turn " + std::to_string(m_state.turn));
  return status;
}

bool GameSession::save() {
  if (!m_saves.save(m_state, m_config.saveFile)) {
    SESSION_ERROR("Game save failed: " + m_saves.getLastError());
    return false;
  }
  // The roster is a convenience; a failed sync never fails the save
  if (!m_roster.saveFromState(m_state)) {
    SESSION_WARN("Roster sync failed: " + m_roster.getLastError());
  }
  return true;
}

// ============================================================================
// INPUT DISPATCH
// ============================================================================

TurnResult GameSession::submit(const std::string &rawInput) {
  const std::string raw = TextUtils::trim(rawInput);
  const std::string action = normalizeAction(raw);

  if (m_state.gameOver) {
    return rejected("The adventure is over.");
  }
  if (action.empty()) {
    return rejected(m_state.inCombat ? COMBAT_HINT : EXPLORATION_HINT);
  }
  if (auto meta = handleMeta(action)) {
    return *meta;
  }
  return m_state.inCombat ? handleCombat(action, raw) : handleExploration(action, raw);
}

std::optional<TurnResult> GameSession::handleMeta(const std::string &action) {
  if (isOneOf(action, {"help", "?"})) {
    return informational(helpText());
  }
  if (isOneOf(action, {"inventory", "inv", "i"})) {
    return informational(m_inventory.formatInventory() + "\n" + m_inventory.formatGold());
  }
  if (action == "stats") {
    const Character &player = m_state.player;
    std::vector<std::string> stats;
    for (auto stat : SoloAdventure::ALL_STATS) {
      stats.push_back(std::string(SoloAdventure::toString(stat)) + " " +
                      std::to_string(player.stat(stat)));
    }
    const std::string spells =
        player.learnedSpells.empty() ? "none" : TextUtils::join(player.learnedSpells, ", ");
    return informational("Race: " + player.race + "\nClass: " + player.className +
                         "\nLevel: " + std::to_string(player.level) +
                         " | XP: " + std::to_string(player.xp) + "\nSpells: " + spells +
                         "\nStats: " + TextUtils::join(stats, ", "));
  }
  if (hasVerb(action, "choose")) {
    auto outcome = m_progression.resolvePendingDecision(argumentAfter(action, "choose"));
    if (!outcome.success) {
      return rejected(outcome.message);
    }
    if (m_progression.hasPendingDecision()) {
      outcome.message += " " + m_progression.describePendingDecision();
    }
    save();
    return informational(outcome.message);
  }
  return handleGear(action);
}

std::optional<TurnResult> GameSession::handleGear(const std::string &action) {
  if (isOneOf(action, {"gear", "equipment"})) {
    return informational(m_inventory.formatEquipment() + "\n" +
                         m_inventory.formatInventoryDetailed() + "\n" +
                         m_inventory.formatGold());
  }

  ActionOutcome outcome;
  if (hasVerb(action, "equip")) {
    const std::string item = argumentAfter(action, "equip");
    if (item.empty()) {
      return rejected("Equip which item? " + m_inventory.formatInventoryDetailed());
    }
    outcome = m_inventory.equip(item);
  } else if (hasVerb(action, "unequip")) {
    outcome = m_inventory.unequip(argumentAfter(action, "unequip"));
  } else {
    return std::nullopt;
  }

  if (!outcome.success) {
    return rejected(outcome.message);
  }
  save();
  return informational(outcome.message);
}

TurnResult GameSession::handleExploration(const std::string &action, const std::string &raw) {
  if (hasVerb(action, "use") || hasVerb(action, "drink")) {
    const std::string verb = hasVerb(action, "use") ? "use" : "drink";
    return handleUse(argumentAfter(action, verb), raw);
  }
  if (hasVerb(action, "rest")) {
    return handleRest(action, raw);
  }

  if (auto destination = moveTarget(action)) {
    auto moved = m_exploration.move(*destination);
    if (!moved.success) {
      return rejected(moved.message);
    }
    return finishTurn(raw, moved.message);
  }
  if (isOneOf(action, {"move", "go", "leave", "continue"})) {
    const auto exits = m_exploration.exitDestinations();
    return rejected("Where to? Exits: " + (exits.empty() ? std::string("none")
                                                         : TextUtils::join(exits, ", ")));
  }

  const std::string verb = TextUtils::splitWords(action).front();
  if (isOneOf(verb, {"talk", "speak", "parley", "approach", "search", "open", "inspect", "look",
                     "loot"})) {
    auto outcome = m_exploration.applyAction(action);
    if (!outcome.success) {
      return rejected(outcome.message);
    }
    return finishTurn(raw, outcome.message);
  }
  return rejected(EXPLORATION_HINT);
}

TurnResult GameSession::handleCombat(const std::string &action, const std::string &raw) {
  if (hasVerb(action, "use") || hasVerb(action, "drink")) {
    const std::string verb = hasVerb(action, "use") ? "use" : "drink";
    return handleUse(argumentAfter(action, verb), raw);
  }
  if (hasVerb(action, "cast")) {
    return handleCast(argumentAfter(action, "cast"), raw);
  }

  ActionOutcome outcome;
  if (hasVerb(action, "attack")) {
    outcome = m_combat.runRound(CombatCommand::Attack, argumentAfter(action, "attack"));
  } else if (action == "defend") {
    outcome = m_combat.runRound(CombatCommand::Defend);
  } else if (hasVerb(action, "special")) {
    outcome = m_combat.runRound(CombatCommand::Special, argumentAfter(action, "special"));
  } else if (auto spell = matchSpell(action)) {
    // A learned spell name typed on its own casts it
    outcome = m_combat.runRound(CombatCommand::Cast, spell->second, spell->first);
  } else {
    return rejected(COMBAT_HINT);
  }

  if (!outcome.success) {
    return rejected(outcome.message);
  }
  return finishTurn(raw, outcome.message);
}

TurnResult GameSession::handleCast(const std::string &rest, const std::string &raw) {
  std::string spell = rest;
  std::string target;
  if (auto match = matchSpell(rest)) {
    spell = match->first;
    target = match->second;
  }
  auto outcome = m_combat.runRound(CombatCommand::Cast, target, spell);
  if (!outcome.success) {
    return rejected(outcome.message);
  }
  return finishTurn(raw, outcome.message);
}

TurnResult GameSession::handleUse(const std::string &payload, const std::string &raw) {
  std::string item = payload;
  std::string target;
  if (auto split = payload.find(" on "); split != std::string::npos) {
    item = TextUtils::trim(payload.substr(0, split));
    target = TextUtils::trim(payload.substr(split + 4));
  }

  auto outcome = m_inventory.useItem(item, target);
  if (!outcome.success) {
    return rejected(outcome.message);
  }
  std::string result = outcome.message;
  if (m_state.inCombat) {
    result = m_combat.finishRound(result);
  }
  return finishTurn(raw, std::move(result));
}

TurnResult GameSession::handleRest(const std::string &action, const std::string &raw) {
  int count = 1;
  const std::string argument = argumentAfter(action, "rest");
  if (TextUtils::isDigits(argument)) {
    count = argument.size() > 3 ? m_config.maxRestRepeat : std::stoi(argument);
  }
  count = std::clamp(count, 1, m_config.maxRestRepeat);

  std::vector<std::string> results;
  RestOutcome last;
  for (int i = 0; i < count; ++i) {
    last = m_progression.rest();
    m_state.turn += 1;
    m_state.lastEvent = last.message;
    recordTurn(raw, last.message);
    results.push_back(last.message);
  }

  std::string message = TextUtils::join(results, " | ");
  if (last.hasPendingDecisions()) {
    message += " " + m_progression.describePendingDecision();
  }
  m_state.lastEvent = message;
  return concludeTurn(raw, message);
}

std::optional<std::pair<std::string, std::string>>
GameSession::matchSpell(const std::string &text) const {
  const auto words = TextUtils::splitWords(text);
  const auto &learned = m_state.player.learnedSpells;
  for (size_t count = words.size(); count > 0; --count) {
    const std::string candidate =
        TextUtils::join(std::vector<std::string>(words.begin(), words.begin() + count), " ");
    const bool known =
        std::any_of(learned.begin(), learned.end(), [&candidate](const std::string &name) {
          return TextUtils::toLower(name) == candidate;
        });
    if (known || m_registry.findSpell(candidate)) {
      const std::string rest =
          TextUtils::join(std::vector<std::string>(words.begin() + count, words.end()), " ");
      return std::make_pair(candidate, rest);
    }
  }
  return std::nullopt;
}

// ============================================================================
// TURN BOOKKEEPING
// ============================================================================

void GameSession::recordTurn(const std::string &raw, const std::string &result) {
  m_state.lastPlayerInput = raw;
  m_state.turnLog.push_back("Turn " + std::to_string(m_state.turn) + ": input='" + raw +
                            "' | " + result);
}

TurnResult GameSession::finishTurn(const std::string &raw, std::string result) {
  m_state.turn += 1;
  m_state.lastEvent = result;
  m_progression.resetRestStreak();
  recordTurn(raw, result);
  return concludeTurn(raw, std::move(result));
}

TurnResult GameSession::concludeTurn(const std::string &raw, std::string result) {
  if (auto completion = completeCampaignIfOver()) {
    result += " " + *completion;
    m_state.lastEvent = result;
  }

  TurnResult turn;
  turn.success = true;
  turn.consumedTurn = true;

  NarrationResult narration = m_narration.narrateTurn(m_state, raw, result);
  NarrationEntry entry;
  entry.turn = m_state.turn;
  entry.playerInput = raw;
  entry.rulesResult = result;
  entry.gmResponse = narration.text;
  entry.gmSource = narration.source;
  m_state.appendNarration(std::move(entry), m_config.narration.logWindow);

  save();
  turn.message = std::move(result);
  turn.narration = std::move(narration);
  return turn;
}

std::optional<std::string> GameSession::completeCampaignIfOver() {
  if (!m_state.gameOver || m_state.player.isDown()) {
    return std::nullopt;
  }

  std::vector<std::string> parts;
  const int completionXp = m_registry.getCampaign(m_state.campaignId).completionXp;
  if (completionXp > 0) {
    parts.push_back("Campaign complete! XP +" + std::to_string(completionXp) + ".");
    auto levels = m_progression.grantXp(completionXp);
    parts.insert(parts.end(), levels.begin(), levels.end());
  }
  m_inventory.stripQuestItems();
  m_inventory.syncArmorClass();
  SESSION_INFO(m_state.player.name + " completed " + m_state.campaignId);

  if (parts.empty()) {
    return std::nullopt;
  }
  return TextUtils::join(parts, " ");
}

// ============================================================================
// PRESENTATION
// ============================================================================

std::optional<NarrationResult> GameSession::companionSuggestion() {
  if (m_state.gameOver) {
    return std::nullopt;
  }
  return m_narration.companionSuggest(m_state);
}

std::string GameSession::helpText() const {
  std::vector<std::string> lines;
  if (m_state.inCombat) {
    lines.emplace_back("Try: attack [target], defend, special [target], cast <spell> [target], "
                       "use potion [on <name>], inventory, help.");
    if (!m_state.player.learnedSpells.empty()) {
      lines.push_back("Spells: " + TextUtils::join(m_state.player.learnedSpells, ", "));
    }
    std::vector<std::string> targets;
    int index = 1;
    for (const auto &enemy : m_state.enemies) {
      if (!enemy.isDown()) {
        targets.push_back(std::to_string(index++) + ":" + enemy.name);
      }
    }
    if (!targets.empty()) {
      lines.push_back("Targets: " + TextUtils::join(targets, ", "));
    }
  } else {
    lines.emplace_back(EXPLORATION_HINT);
    const auto exits = m_exploration.exitDestinations();
    lines.push_back("Exits: " + (exits.empty() ? std::string("none") : TextUtils::join(exits, ", ")));
  }
  if (m_progression.hasPendingDecision()) {
    lines.push_back(m_progression.describePendingDecision() + " Use 'choose <option>'.");
  }
  return TextUtils::join(lines, "\n");
}

std::string GameSession::statusLine() const {
  const Character &player = m_state.player;
  std::vector<std::string> parts;
  parts.push_back(player.name + " HP " + std::to_string(player.hp) + "/" +
                  std::to_string(player.maxHp) + " AC " + std::to_string(player.ac) +
                  (m_state.playerDefending ? " (defending)" : ""));
  for (const auto &companion : m_state.companions) {
    parts.push_back(companion.name + " HP " + std::to_string(companion.hp) + "/" +
                    std::to_string(companion.maxHp));
  }
  parts.push_back("Level " + std::to_string(player.level) + " XP " + std::to_string(player.xp));
  if (player.hasManaPool()) {
    parts.push_back("Mana " + std::to_string(player.mana) + "/" + std::to_string(player.maxMana));
  }
  parts.push_back(m_inventory.formatGold());

  std::vector<std::string> enemies;
  int index = 1;
  for (const auto &enemy : m_state.enemies) {
    if (!enemy.isDown()) {
      enemies.push_back(std::to_string(index++) + ". " + enemy.name + " " +
                        std::to_string(enemy.hp) + "/" + std::to_string(enemy.maxHp));
    }
  }
  if (!enemies.empty()) {
    parts.push_back("Enemies: " + TextUtils::join(enemies, " | "));
  }
  return TextUtils::join(parts, " | ");
}
