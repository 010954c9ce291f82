/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "core/Dice.hpp"
#include "core/GameError.hpp"
#include "core/Logger.hpp"

#include <cctype>
#include <charconv>

namespace SoloAdventure {

namespace {
bool parseNumber(const std::string &text, size_t begin, size_t end, int &out) {
  if (begin >= end) {
    return false;
  }
  const char *first = text.data() + begin;
  const char *last = text.data() + end;
  auto [ptr, ec] = std::from_chars(first, last, out);
  return ec == std::errc() && ptr == last;
}
} // namespace

MersenneRandomSource::MersenneRandomSource() : m_engine(std::random_device{}()) {}

MersenneRandomSource::MersenneRandomSource(uint32_t seed) : m_engine(seed) {}

int MersenneRandomSource::uniformInt(int lo, int hi) {
  std::uniform_int_distribution<int> dist(lo, hi);
  return dist(m_engine);
}

std::optional<DiceExpr> DiceExpr::tryParse(const std::string &text) {
  std::string expr;
  expr.reserve(text.size());
  for (char c : text) {
    if (!std::isspace(static_cast<unsigned char>(c))) {
      expr += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
  }

  DiceExpr result;
  size_t d = expr.find('d');
  if (d == std::string::npos) {
    // Flat number, optionally signed
    size_t start = (!expr.empty() && expr[0] == '+') ? 1 : 0;
    int value = 0;
    if (!parseNumber(expr, start, expr.size(), value)) {
      return std::nullopt;
    }
    result.count = 0;
    result.sides = 0;
    result.bonus = value;
    return result;
  }

  if (d > 0 && !parseNumber(expr, 0, d, result.count)) {
    return std::nullopt;
  }

  size_t sign = expr.find_first_of("+-", d + 1);
  size_t sidesEnd = sign == std::string::npos ? expr.size() : sign;
  if (!parseNumber(expr, d + 1, sidesEnd, result.sides)) {
    return std::nullopt;
  }
  if (sign != std::string::npos) {
    if (!parseNumber(expr, sign + 1, expr.size(), result.bonus)) {
      return std::nullopt;
    }
    if (expr[sign] == '-') {
      result.bonus = -result.bonus;
    }
  }

  if (result.count < 0 || result.sides < 1) {
    return std::nullopt;
  }
  return result;
}

DiceExpr DiceExpr::parse(const std::string &text) {
  auto parsed = tryParse(text);
  if (!parsed) {
    throw ContentError("Malformed dice expression: '" + text + "'");
  }
  return *parsed;
}

std::string DiceExpr::toString() const {
  if (isFlat()) {
    return std::to_string(bonus);
  }
  std::string out = std::to_string(count) + "d" + std::to_string(sides);
  if (bonus > 0) {
    out += "+" + std::to_string(bonus);
  } else if (bonus < 0) {
    out += std::to_string(bonus);
  }
  return out;
}

int Dice::rollDie(int sides) {
  if (sides < 1) {
    throw ContentError("Cannot roll a die with " + std::to_string(sides) + " sides");
  }
  return m_source.uniformInt(1, sides);
}

RollResult Dice::roll(const DiceExpr &expr) {
  RollResult result;
  if (expr.isFlat()) {
    result.total = expr.bonus;
    result.detail = std::to_string(expr.bonus);
    return result;
  }

  for (int i = 0; i < expr.count; ++i) {
    int face = rollDie(expr.sides);
    result.total += face;
    if (i > 0) {
      result.detail += "+";
    }
    result.detail += std::to_string(face);
  }

  result.total += expr.bonus;
  if (expr.bonus > 0) {
    result.detail += "+" + std::to_string(expr.bonus);
  } else if (expr.bonus < 0) {
    result.detail += std::to_string(expr.bonus);
  }

  DICE_DEBUG("Rolled " + expr.toString() + " = " + std::to_string(result.total) +
             " (" + result.detail + ")");
  return result;
}

RollResult Dice::roll(const std::string &expr) {
  return roll(DiceExpr::parse(expr));
}

CheckResult Dice::check(int statBonus, int dc) {
  CheckResult result;
  result.roll = rollDie(20);
  result.total = result.roll + statBonus;
  result.success = result.total >= dc;
  return result;
}

} // namespace SoloAdventure
