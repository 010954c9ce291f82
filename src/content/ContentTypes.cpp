/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "content/ContentTypes.hpp"
#include "utils/TextUtils.hpp"

namespace SoloAdventure {

namespace {
// Linear lookup over a small name table; tables are indexed by enum value
template <typename Enum, size_t N>
std::optional<Enum> lookup(const std::array<std::string_view, N> &names,
                           std::string_view text) {
  std::string lowered = TextUtils::toLower(TextUtils::trim(text));
  for (size_t i = 0; i < N; ++i) {
    if (TextUtils::toLower(names[i]) == lowered) {
      return static_cast<Enum>(i);
    }
  }
  return std::nullopt;
}

constexpr std::array<std::string_view, 4> ROOM_KIND_NAMES{"social", "combat", "loot",
                                                          "passage"};
constexpr std::array<std::string_view, 3> AI_POLICY_NAMES{
    "focus_weakest", "focus_player", "focus_companion"};
constexpr std::array<std::string_view, 4> ITEM_KIND_NAMES{"potion", "armor", "quest",
                                                          "unknown"};
constexpr std::array<std::string_view, 3> EFFECT_TYPE_NAMES{"none", "heal", "ac"};
constexpr std::array<std::string_view, 2> CLASS_ROLE_NAMES{"melee", "caster"};
constexpr std::array<std::string_view, 4> SPECIAL_KIND_NAMES{"none", "power", "precise",
                                                             "spellcast"};
constexpr std::array<std::string_view, EQUIP_SLOT_COUNT> EQUIP_SLOT_NAMES{
    "head", "arms", "hands", "chest", "legs", "feet"};
constexpr std::array<std::string_view, STAT_COUNT> STAT_NAMES{"STR", "DEX", "CON",
                                                              "INT", "WIS", "CHA"};
} // namespace

std::string_view toString(RoomKind kind) {
  return ROOM_KIND_NAMES[static_cast<size_t>(kind)];
}
std::string_view toString(AIPolicy policy) {
  return AI_POLICY_NAMES[static_cast<size_t>(policy)];
}
std::string_view toString(ItemKind kind) {
  return ITEM_KIND_NAMES[static_cast<size_t>(kind)];
}
std::string_view toString(EffectType type) {
  return EFFECT_TYPE_NAMES[static_cast<size_t>(type)];
}
std::string_view toString(ClassRole role) {
  return CLASS_ROLE_NAMES[static_cast<size_t>(role)];
}
std::string_view toString(SpecialKind kind) {
  return SPECIAL_KIND_NAMES[static_cast<size_t>(kind)];
}
std::string_view toString(EquipSlot slot) {
  return EQUIP_SLOT_NAMES[static_cast<size_t>(slot)];
}
std::string_view toString(Stat stat) { return STAT_NAMES[static_cast<size_t>(stat)]; }

std::optional<RoomKind> roomKindFromString(std::string_view text) {
  return lookup<RoomKind>(ROOM_KIND_NAMES, text);
}

std::optional<AIPolicy> aiPolicyFromString(std::string_view text) {
  // Companion profiles carry flavor policies ("cautious", "aggressive") that
  // only matter for companions; mobs use the three focus policies.
  return lookup<AIPolicy>(AI_POLICY_NAMES, text);
}

std::optional<ItemKind> itemKindFromString(std::string_view text) {
  return lookup<ItemKind>(ITEM_KIND_NAMES, text);
}

std::optional<EffectType> effectTypeFromString(std::string_view text) {
  return lookup<EffectType>(EFFECT_TYPE_NAMES, text);
}

std::optional<ClassRole> classRoleFromString(std::string_view text) {
  return lookup<ClassRole>(CLASS_ROLE_NAMES, text);
}

std::optional<SpecialKind> specialKindFromString(std::string_view text) {
  return lookup<SpecialKind>(SPECIAL_KIND_NAMES, text);
}

std::optional<EquipSlot> equipSlotFromString(std::string_view text) {
  return lookup<EquipSlot>(EQUIP_SLOT_NAMES, text);
}

std::optional<Stat> statFromString(std::string_view text) {
  return lookup<Stat>(STAT_NAMES, text);
}

} // namespace SoloAdventure
