/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef CONTENT_TYPES_HPP
#define CONTENT_TYPES_HPP

#include <array>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

namespace SoloAdventure {

/**
 * @brief Behavioral category of a room. Decides the legal action set.
 */
enum class RoomKind : uint8_t {
  Social = 0,  // one stat check against an NPC or obstacle
  Combat = 1,  // spawns the room's mob, then corpse looting after victory
  Loot = 2,    // a locked container guarded by a stat check
  Passage = 3  // nothing to resolve, just a corridor
};

enum class AIPolicy : uint8_t {
  FocusWeakest = 0, // lower current HP between player and companion
  FocusPlayer = 1,
  FocusCompanion = 2
};

enum class ItemKind : uint8_t { Potion = 0, Armor = 1, Quest = 2, Unknown = 3 };

enum class EffectType : uint8_t { None = 0, Heal = 1, ArmorClass = 2 };

enum class ClassRole : uint8_t { Melee = 0, Caster = 1 };

// What the class-specific "special" combat action does
enum class SpecialKind : uint8_t {
  None = 0,
  PowerStrike = 1,   // flat bonus damage
  PreciseStrike = 2, // flat bonus to hit
  Spellcast = 3      // best known damage spell, costs mana
};

enum class EquipSlot : uint8_t {
  Head = 0,
  Arms = 1,
  Hands = 2,
  Chest = 3,
  Legs = 4,
  Feet = 5
};

constexpr size_t EQUIP_SLOT_COUNT = 6;

// Display order for equipment listings
constexpr std::array<EquipSlot, EQUIP_SLOT_COUNT> ALL_EQUIP_SLOTS{
    EquipSlot::Head,  EquipSlot::Arms, EquipSlot::Hands,
    EquipSlot::Chest, EquipSlot::Legs, EquipSlot::Feet};

enum class Stat : uint8_t { STR = 0, DEX = 1, CON = 2, INT = 3, WIS = 4, CHA = 5 };

constexpr size_t STAT_COUNT = 6;

constexpr std::array<Stat, STAT_COUNT> ALL_STATS{Stat::STR, Stat::DEX, Stat::CON,
                                                 Stat::INT, Stat::WIS, Stat::CHA};

// String conversions. The from* parsers are case-insensitive and return
// nullopt for unknown words; content loading turns that into a ContentError.
std::string_view toString(RoomKind kind);
std::string_view toString(AIPolicy policy);
std::string_view toString(ItemKind kind);
std::string_view toString(EffectType type);
std::string_view toString(ClassRole role);
std::string_view toString(SpecialKind kind);
std::string_view toString(EquipSlot slot);
std::string_view toString(Stat stat);

std::optional<RoomKind> roomKindFromString(std::string_view text);
std::optional<AIPolicy> aiPolicyFromString(std::string_view text);
std::optional<ItemKind> itemKindFromString(std::string_view text);
std::optional<EffectType> effectTypeFromString(std::string_view text);
std::optional<ClassRole> classRoleFromString(std::string_view text);
std::optional<SpecialKind> specialKindFromString(std::string_view text);
std::optional<EquipSlot> equipSlotFromString(std::string_view text);
std::optional<Stat> statFromString(std::string_view text);

// Stream operators for Boost.Test
inline std::ostream &operator<<(std::ostream &os, RoomKind v) { return os << toString(v); }
inline std::ostream &operator<<(std::ostream &os, AIPolicy v) { return os << toString(v); }
inline std::ostream &operator<<(std::ostream &os, ItemKind v) { return os << toString(v); }
inline std::ostream &operator<<(std::ostream &os, EquipSlot v) { return os << toString(v); }
inline std::ostream &operator<<(std::ostream &os, Stat v) { return os << toString(v); }

} // namespace SoloAdventure

#endif // CONTENT_TYPES_HPP
