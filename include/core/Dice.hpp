/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef DICE_HPP
#define DICE_HPP

#include <cstdint>
#include <optional>
#include <random>
#include <string>

namespace SoloAdventure {

/**
 * @brief Source of uniform integers for every roll in the game
 *
 * Each call is an independent draw. Tests swap in a scripted source so
 * outcomes are reproducible.
 */
class RandomSource {
public:
  virtual ~RandomSource() = default;

  // Uniform integer in [lo, hi], both inclusive
  virtual int uniformInt(int lo, int hi) = 0;
};

class MersenneRandomSource : public RandomSource {
public:
  // Seeded from std::random_device
  MersenneRandomSource();
  explicit MersenneRandomSource(uint32_t seed);

  int uniformInt(int lo, int hi) override;

private:
  std::mt19937 m_engine;
};

// "NdM+B" style expression. sides == 0 marks a flat number (count unused).
struct DiceExpr {
  int count{1};
  int sides{0};
  int bonus{0};

  // Accepts "NdM", "NdM+B", "NdM-B", "dM" and plain integers; spaces ignored
  static std::optional<DiceExpr> tryParse(const std::string &text);
  // Same as tryParse but throws ContentError on malformed input
  static DiceExpr parse(const std::string &text);

  bool isFlat() const { return sides == 0; }
  std::string toString() const;
};

struct RollResult {
  int total{0};
  std::string detail; // faces joined by '+', then the signed bonus ("3+4+2")
};

struct CheckResult {
  bool success{false};
  int roll{0};
  int total{0};
};

class Dice {
public:
  explicit Dice(RandomSource &source) : m_source(source) {}

  int rollDie(int sides);
  RollResult roll(const DiceExpr &expr);
  RollResult roll(const std::string &expr);

  // d20 + statBonus against dc; success when total >= dc
  CheckResult check(int statBonus, int dc);

private:
  RandomSource &m_source;
};

} // namespace SoloAdventure

#endif // DICE_HPP
