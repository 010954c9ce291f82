/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef NARRATION_MANAGER_HPP
#define NARRATION_MANAGER_HPP

/**
 * @file NarrationManager.hpp
 * @brief Flavor text around rules results that are already resolved
 *
 * The manager builds prompts from a read-only GameState snapshot, asks a
 * NarrationBackend for text and never feeds the answer back into the state.
 * Backend calls run under a timeout with bounded retries; when every attempt
 * fails a canned line is returned instead.
 */

#include "core/Dice.hpp"
#include "core/GameState.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

class ContentRegistry;

enum class NarrationRole : uint8_t { GameMaster = 0, Companion = 1 };

struct NarrationRequest {
  NarrationRole role{NarrationRole::GameMaster};
  std::string speaker; // companion name for companion requests
  std::string systemPrompt;
  std::string userPrompt;
};

struct NarrationResult {
  std::string text;
  std::string source; // "stub", "ai" or "fallback"
};

/**
 * @brief Text generator behind the narration manager
 *
 * Implementations may block and may throw; the manager bounds both.
 * Each call runs on its own detached thread, so narrate() must be safe to call
 * concurrently and must not touch state it does not own. A call that outlives its
 * timeout keeps running in the background until it returns.
 */
class NarrationBackend {
public:
  virtual ~NarrationBackend() = default;

  virtual std::string narrate(const NarrationRequest &request) = 0;

  // Stub backends answer directly, without retries or timeouts
  virtual bool isStub() const { return false; }
};

// Canned lines picked at random, used when no generator is configured
class StubNarrationBackend : public NarrationBackend {
public:
  StubNarrationBackend() = default;
  explicit StubNarrationBackend(uint32_t seed) : m_source(seed) {}

  std::string narrate(const NarrationRequest &request) override;
  bool isStub() const override { return true; }

  static const std::vector<std::string> &gameMasterLines();
  // Lines carry a {name} placeholder for the speaking companion
  static const std::vector<std::string> &companionLines();

  static std::string cannedLine(const NarrationRequest &request,
                                SoloAdventure::RandomSource &source);

private:
  SoloAdventure::MersenneRandomSource m_source;
};

struct NarrationConfig {
  std::chrono::milliseconds timeout{30000};
  int maxRetries{3};
  std::chrono::milliseconds backoff{1000}; // doubled after every failed attempt
  size_t logWindow{50};
};

class NarrationManager {
public:
  NarrationManager(const ContentRegistry &registry, std::shared_ptr<NarrationBackend> backend,
                   NarrationConfig config = {});

  NarrationManager(const NarrationManager &) = delete;
  NarrationManager &operator=(const NarrationManager &) = delete;

  // GM flavor for a resolved turn
  NarrationResult narrateTurn(const SoloAdventure::GameState &state,
                              const std::string &playerInput, const std::string &rulesResult);

  /**
   * @brief One-line advice from the active companion
   * @return nullopt when the party has no companion
   */
  std::optional<NarrationResult> companionSuggest(const SoloAdventure::GameState &state);

  std::string gameMasterSnapshot(const SoloAdventure::GameState &state) const;
  std::string companionSnapshot(const SoloAdventure::GameState &state) const;

  static std::string availableActions(bool inCombat);
  static bool partyAtFullHp(const SoloAdventure::GameState &state);

  static const std::string &gameMasterSystemPrompt();
  static std::string companionSystemPrompt(const std::string &companionName);

  const NarrationConfig &getConfig() const { return m_config; }

private:
  NarrationResult request(const NarrationRequest &request);

  const ContentRegistry &m_registry;
  std::shared_ptr<NarrationBackend> m_backend;
  NarrationConfig m_config;
  SoloAdventure::MersenneRandomSource m_fallbackSource;
};

#endif // NARRATION_MANAGER_HPP
