/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef LOGGER_HPP
#define LOGGER_HPP

// Required includes for logging system:
// - string: Used in macro expansions for std::string() conversions
// - cstdio: Required for printf() and fflush() functions
// - mutex: Console output is serialized
// - atomic: Quiet mode flag
#include <atomic> // IWYU pragma: keep - Required for std::atomic<bool> quiet mode flag
#include <cstdint> // IWYU pragma: keep - Required for uint8_t type
#include <cstdio> // IWYU pragma: keep - Required for printf() and fflush() functions
#include <mutex> // IWYU pragma: keep - Required for serialized logging
#include <string> // IWYU pragma: keep - Required for std::string() conversions in macros

namespace SoloAdventure {
enum class LogLevel : uint8_t {
  CRITICAL = 0,     // Always logs (written to the log file in release)
  ERROR_LEVEL = 1,  // Always logs (renamed to avoid macro conflicts)
  WARNING = 2,      // Debug only
  INFO = 3,         // Debug only
  DEBUG_LEVEL = 4   // Debug only (renamed to avoid macro conflicts)
};

#ifdef DEBUG
// Debug builds print everything to stdout
class Logger {
private:
  static std::atomic<bool> s_quietMode;
  static std::mutex s_logMutex;

public:
  static void SetQuietMode(bool enabled) {
    s_quietMode.store(enabled, std::memory_order_relaxed);
  }

  static bool IsQuietMode() {
    return s_quietMode.load(std::memory_order_relaxed);
  }

  static void Log(LogLevel level, const char *system,
                  const std::string &message) {
    Log(level, system, message.c_str());
  }

  static void Log(LogLevel level, const char *system, const char *message) {
    if (s_quietMode.load(std::memory_order_relaxed)) {
      return;
    }

    std::lock_guard<std::mutex> lock(s_logMutex);
    printf("SoloAdventure - [%s] %s: %s\n", system, getLevelString(level),
           message);
    fflush(stdout);
  }

private:
  static const char *getLevelString(LogLevel level) {
    switch (level) {
    case LogLevel::CRITICAL:
      return "CRITICAL";
    case LogLevel::ERROR_LEVEL:
      return "ERROR";
    case LogLevel::WARNING:
      return "WARNING";
    case LogLevel::INFO:
      return "INFO";
    case LogLevel::DEBUG_LEVEL:
      return "DEBUG";
    default:
      return "UNKNOWN";
    }
  }
};

#define SOLO_CRITICAL(system, msg)                                             \
  SoloAdventure::Logger::Log(SoloAdventure::LogLevel::CRITICAL, system, msg)
#define SOLO_ERROR(system, msg)                                                \
  SoloAdventure::Logger::Log(SoloAdventure::LogLevel::ERROR_LEVEL, system, msg)
#define SOLO_WARN(system, msg)                                                 \
  SoloAdventure::Logger::Log(SoloAdventure::LogLevel::WARNING, system, msg)
#define SOLO_INFO(system, msg)                                                 \
  SoloAdventure::Logger::Log(SoloAdventure::LogLevel::INFO, system, msg)
#define SOLO_DEBUG(system, msg)                                                \
  SoloAdventure::Logger::Log(SoloAdventure::LogLevel::DEBUG_LEVEL, system, msg)

#else
// Release builds - CRITICAL/ERROR go to a log file under the SDL pref path,
// everything else compiles away. Implemented in Logger.cpp.
class Logger {
private:
  static std::atomic<bool> s_quietMode;

public:
  static std::mutex s_logMutex; // Public for macro access

  static void SetQuietMode(bool enabled) {
    s_quietMode.store(enabled, std::memory_order_relaxed);
  }

  static bool IsQuietMode() {
    return s_quietMode.load(std::memory_order_relaxed);
  }

  static void Log(const char *level, const char *system,
                  const std::string &message);
  static void Log(const char *level, const char *system, const char *message);
};

#define SOLO_CRITICAL(system, msg)                                             \
  SoloAdventure::Logger::Log("CRITICAL", system, msg)

#define SOLO_ERROR(system, msg) SoloAdventure::Logger::Log("ERROR", system, msg)

#define SOLO_WARN(system, msg) ((void)0)  // Zero overhead
#define SOLO_INFO(system, msg) ((void)0)  // Zero overhead
#define SOLO_DEBUG(system, msg) ((void)0) // Zero overhead
#endif

inline std::atomic<bool> Logger::s_quietMode{false};
inline std::mutex Logger::s_logMutex{};

// Convenience macros for each rules system and manager

// Core Systems
#define DICE_CRITICAL(msg) SOLO_CRITICAL("Dice", msg)
#define DICE_ERROR(msg) SOLO_ERROR("Dice", msg)
#define DICE_WARN(msg) SOLO_WARN("Dice", msg)
#define DICE_INFO(msg) SOLO_INFO("Dice", msg)
#define DICE_DEBUG(msg) SOLO_DEBUG("Dice", msg)

#define SESSION_CRITICAL(msg) SOLO_CRITICAL("GameSession", msg)
#define SESSION_ERROR(msg) SOLO_ERROR("GameSession", msg)
#define SESSION_WARN(msg) SOLO_WARN("GameSession", msg)
#define SESSION_INFO(msg) SOLO_INFO("GameSession", msg)
#define SESSION_DEBUG(msg) SOLO_DEBUG("GameSession", msg)

// Manager Systems
#define CONTENT_CRITICAL(msg) SOLO_CRITICAL("ContentRegistry", msg)
#define CONTENT_ERROR(msg) SOLO_ERROR("ContentRegistry", msg)
#define CONTENT_WARN(msg) SOLO_WARN("ContentRegistry", msg)
#define CONTENT_INFO(msg) SOLO_INFO("ContentRegistry", msg)
#define CONTENT_DEBUG(msg) SOLO_DEBUG("ContentRegistry", msg)

#define SAVEGAME_CRITICAL(msg) SOLO_CRITICAL("SaveGameManager", msg)
#define SAVEGAME_ERROR(msg) SOLO_ERROR("SaveGameManager", msg)
#define SAVEGAME_WARN(msg) SOLO_WARN("SaveGameManager", msg)
#define SAVEGAME_INFO(msg) SOLO_INFO("SaveGameManager", msg)
#define SAVEGAME_DEBUG(msg) SOLO_DEBUG("SaveGameManager", msg)

#define ROSTER_CRITICAL(msg) SOLO_CRITICAL("CharacterRoster", msg)
#define ROSTER_ERROR(msg) SOLO_ERROR("CharacterRoster", msg)
#define ROSTER_WARN(msg) SOLO_WARN("CharacterRoster", msg)
#define ROSTER_INFO(msg) SOLO_INFO("CharacterRoster", msg)
#define ROSTER_DEBUG(msg) SOLO_DEBUG("CharacterRoster", msg)

#define NARRATION_CRITICAL(msg) SOLO_CRITICAL("NarrationManager", msg)
#define NARRATION_ERROR(msg) SOLO_ERROR("NarrationManager", msg)
#define NARRATION_WARN(msg) SOLO_WARN("NarrationManager", msg)
#define NARRATION_INFO(msg) SOLO_INFO("NarrationManager", msg)
#define NARRATION_DEBUG(msg) SOLO_DEBUG("NarrationManager", msg)

#define SETTINGS_CRITICAL(msg) SOLO_CRITICAL("SettingsManager", msg)
#define SETTINGS_ERROR(msg) SOLO_ERROR("SettingsManager", msg)
#define SETTINGS_WARNING(msg) SOLO_WARN("SettingsManager", msg)
#define SETTINGS_INFO(msg) SOLO_INFO("SettingsManager", msg)
#define SETTINGS_DEBUG(msg) SOLO_DEBUG("SettingsManager", msg)

// Entity Systems
#define ENTITY_CRITICAL(msg) SOLO_CRITICAL("Entity", msg)
#define ENTITY_ERROR(msg) SOLO_ERROR("Entity", msg)
#define ENTITY_WARN(msg) SOLO_WARN("Entity", msg)
#define ENTITY_INFO(msg) SOLO_INFO("Entity", msg)
#define ENTITY_DEBUG(msg) SOLO_DEBUG("Entity", msg)

// Rules Controllers
#define INVENTORY_CRITICAL(msg) SOLO_CRITICAL("InventoryController", msg)
#define INVENTORY_ERROR(msg) SOLO_ERROR("InventoryController", msg)
#define INVENTORY_WARN(msg) SOLO_WARN("InventoryController", msg)
#define INVENTORY_INFO(msg) SOLO_INFO("InventoryController", msg)
#define INVENTORY_DEBUG(msg) SOLO_DEBUG("InventoryController", msg)

#define EXPLORE_CRITICAL(msg) SOLO_CRITICAL("ExplorationController", msg)
#define EXPLORE_ERROR(msg) SOLO_ERROR("ExplorationController", msg)
#define EXPLORE_WARN(msg) SOLO_WARN("ExplorationController", msg)
#define EXPLORE_INFO(msg) SOLO_INFO("ExplorationController", msg)
#define EXPLORE_DEBUG(msg) SOLO_DEBUG("ExplorationController", msg)

#define COMBAT_CRITICAL(msg) SOLO_CRITICAL("CombatController", msg)
#define COMBAT_ERROR(msg) SOLO_ERROR("CombatController", msg)
#define COMBAT_WARN(msg) SOLO_WARN("CombatController", msg)
#define COMBAT_INFO(msg) SOLO_INFO("CombatController", msg)
#define COMBAT_DEBUG(msg) SOLO_DEBUG("CombatController", msg)

#define PROGRESSION_CRITICAL(msg) SOLO_CRITICAL("ProgressionController", msg)
#define PROGRESSION_ERROR(msg) SOLO_ERROR("ProgressionController", msg)
#define PROGRESSION_WARN(msg) SOLO_WARN("ProgressionController", msg)
#define PROGRESSION_INFO(msg) SOLO_INFO("ProgressionController", msg)
#define PROGRESSION_DEBUG(msg) SOLO_DEBUG("ProgressionController", msg)

// Quiet mode convenience macros (tests, scripted runs)
#define SOLO_ENABLE_QUIET_MODE() SoloAdventure::Logger::SetQuietMode(true)
#define SOLO_DISABLE_QUIET_MODE() SoloAdventure::Logger::SetQuietMode(false)

} // namespace SoloAdventure

#endif // LOGGER_HPP
