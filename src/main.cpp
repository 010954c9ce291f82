/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "core/GameConfig.hpp"
#include "core/GameSession.hpp"
#include "core/Logger.hpp"
#include "managers/ContentRegistry.hpp"
#include "managers/SettingsManager.hpp"
#include "utils/ResourcePath.hpp"
#include "utils/TextUtils.hpp"
#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

using SoloAdventure::GameConfig;
using SoloAdventure::ResourcePath;
using SoloAdventure::SettingsManager;
namespace TextUtils = SoloAdventure::TextUtils;

namespace {

struct LaunchOptions {
  std::string settingsPath{"res/settings.json"};
  bool forceNewGame{false};
  bool quiet{false};
};

LaunchOptions parseArgs(int argc, char *argv[]) {
  LaunchOptions options;
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--new") {
      options.forceNewGame = true;
    } else if (arg == "--quiet") {
      options.quiet = true;
    } else if (arg == "--settings" && i + 1 < argc) {
      options.settingsPath = argv[++i];
    } else {
      SESSION_WARN("Ignoring unknown argument " + arg);
    }
  }
  return options;
}

// Returns false on end of input
bool readLine(const std::string &prompt, std::string &line) {
  std::cout << prompt << std::flush;
  if (!std::getline(std::cin, line)) {
    return false;
  }
  line = TextUtils::trim(line);
  return true;
}

bool askYesNo(const std::string &question) {
  std::string answer;
  while (readLine(question + " (y/n): ", answer)) {
    answer = TextUtils::toLower(answer);
    if (answer == "y" || answer == "yes") {
      return true;
    }
    if (answer == "n" || answer == "no") {
      return false;
    }
  }
  return false;
}

// Numbered menu; an empty answer picks the first option
std::string promptChoice(const std::string &question, const std::vector<std::string> &options) {
  if (options.size() == 1) {
    return options.front();
  }
  std::cout << question << "\n";
  for (size_t i = 0; i < options.size(); ++i) {
    std::cout << "  " << (i + 1) << ". " << options[i] << "\n";
  }

  std::string answer;
  while (readLine("> ", answer)) {
    if (answer.empty()) {
      return options.front();
    }
    if (TextUtils::isDigits(answer) && answer.size() < 4) {
      const size_t index = static_cast<size_t>(std::stoi(answer));
      if (index >= 1 && index <= options.size()) {
        return options[index - 1];
      }
    }
    for (const auto &option : options) {
      if (TextUtils::toLower(option) == TextUtils::toLower(answer)) {
        return option;
      }
    }
    std::cout << "Pick a number between 1 and " << options.size() << ".\n";
  }
  return options.front();
}

std::string chooseCampaign(const ContentRegistry &registry, const GameConfig &config) {
  if (!config.campaignId.empty() && registry.hasCampaign(config.campaignId)) {
    return config.campaignId;
  }
  std::vector<std::string> names;
  for (const auto *campaign : registry.listCampaigns()) {
    names.push_back(campaign->name);
  }
  const std::string picked = promptChoice("Choose a campaign", names);
  for (const auto *campaign : registry.listCampaigns()) {
    if (campaign->name == picked) {
      return campaign->id;
    }
  }
  return registry.listCampaigns().front()->id;
}

std::string newGame(GameSession &session, const ContentRegistry &registry,
                    const GameConfig &config) {
  const std::string campaignId = chooseCampaign(registry, config);
  std::cout << "Campaign selected: " << registry.getCampaign(campaignId).name << "\n";

  auto saved = session.roster().listCharacters();
  if (!saved.empty()) {
    std::vector<std::string> options{"Create new"};
    options.insert(options.end(), saved.begin(), saved.end());
    const std::string choice = promptChoice("Load character or create new?", options);
    if (choice != "Create new") {
      RosterEntry entry;
      const LoadStatus status = session.roster().loadCharacter(choice, campaignId, entry);
      if (status == LoadStatus::Ok) {
        std::cout << "Welcome back, " << CharacterRoster::summary(entry) << ".\n";
        return session.startNewGame(campaignId, entry.character, entry.inventory,
                                    entry.equipment);
      }
      std::cout << "Could not load " << choice << ": " << session.roster().getLastError()
                << "\n";
    }
  }

  std::string name;
  if (!readLine("Enter your character name [" + config.player.name + "]: ", name) ||
      name.empty()) {
    name = config.player.name;
  }
  const std::string className = promptChoice("Choose a class", registry.classNames());
  const std::string race = promptChoice("Choose a race", registry.raceNames());
  auto player = session.entities().createPlayer(name, className, config.player.stats, race);
  return session.startNewGame(campaignId, std::move(player));
}

void printTurn(const TurnResult &turn) {
  std::cout << "\n" << turn.message << "\n";
  if (turn.narration) {
    std::cout << "\n" << turn.narration->text << "\n";
  }
}

int run(const LaunchOptions &options) {
  ResourcePath::init();

  SettingsManager settings;
  const std::string settingsPath = ResourcePath::resolve(options.settingsPath);
  if (!settings.loadFromFile(settingsPath)) {
    SESSION_WARN("Failed to load " + settingsPath + " - using defaults");
  }
  GameConfig config = GameConfig::fromSettings(settings);

  ContentRegistry registry;
  if (!registry.loadProfilesFromJson(ResourcePath::resolve(config.profilesFile))) {
    SESSION_CRITICAL("Could not load class and race profiles from " + config.profilesFile);
    return EXIT_FAILURE;
  }
  const size_t campaignCount =
      registry.loadCampaignsFromDirectory(ResourcePath::resolve(config.contentDir));
  if (registry.failedCampaignLoads() > 0) {
    SESSION_CRITICAL("Invalid campaign content in " + config.contentDir + " (" +
                     std::to_string(registry.failedCampaignLoads()) + " file(s) rejected)");
    return EXIT_FAILURE;
  }
  if (campaignCount == 0) {
    SESSION_CRITICAL("No campaigns found in " + config.contentDir);
    return EXIT_FAILURE;
  }

  auto random = config.seed != 0 ? SoloAdventure::MersenneRandomSource(config.seed)
                                 : SoloAdventure::MersenneRandomSource();
  GameSession session(registry, random, config);

  std::cout << "Welcome to the Solo Adventure\n";
  std::string opening;
  bool resumed = false;
  if (!options.forceNewGame && session.saves().saveExists(config.saveFile) &&
      askYesNo("Found a saved game. Resume?")) {
    const LoadStatus status = session.resume();
    if (status == LoadStatus::Ok) {
      resumed = true;
      opening = session.state().lastEvent;
    } else {
      std::cout << "The save could not be loaded (" << toString(status)
                << "): " << session.saves().getLastError() << "\n";
      if (!askYesNo("Start a new game instead?")) {
        return EXIT_FAILURE;
      }
    }
  }
  if (!resumed) {
    opening = newGame(session, registry, config);
  }
  std::cout << "\n" << opening << "\n";

  std::string line;
  while (!session.isOver()) {
    std::cout << "\n" << session.statusLine() << "\n";
    if (auto advice = session.companionSuggestion()) {
      std::cout << session.state().activeCompanion()->name << " suggests: " << advice->text
                << "\n";
    }
    const char *prompt = session.state().inCombat
                             ? "Combat action (attack/defend/special/cast/use/help/quit): "
                             : "Action (talk/search/loot/move/rest [N]/use/help/quit): ";
    if (!readLine(prompt, line)) {
      break;
    }
    const std::string lowered = TextUtils::toLower(line);
    if (lowered == "quit" || lowered == "exit") {
      break;
    }
    printTurn(session.submit(line));
  }

  if (!session.save()) {
    std::cout << "Warning: the game could not be saved.\n";
  }
  if (session.isOver()) {
    std::cout << "\nGame over.\n";
  }
  return EXIT_SUCCESS;
}

} // namespace

int main(int argc, char *argv[]) {
  const LaunchOptions options = parseArgs(argc, argv);
  if (options.quiet) {
    SOLO_ENABLE_QUIET_MODE();
  }

  try {
    return run(options);
  } catch (const std::exception &e) {
    SESSION_CRITICAL(std::string("Fatal error: ") + e.what());
    std::cerr << "Fatal error: " << e.what() << "\n";
    return EXIT_FAILURE;
  }
}
