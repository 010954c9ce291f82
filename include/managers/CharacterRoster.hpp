/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef CHARACTER_ROSTER_HPP
#define CHARACTER_ROSTER_HPP

#include "core/GameState.hpp"
#include "managers/SaveGameManager.hpp"
#include <string>
#include <vector>

class ContentRegistry;

// A character as the roster stores it, outside of any campaign run
struct RosterEntry {
    SoloAdventure::Character character;
    std::vector<SoloAdventure::ItemDefinition> inventory;
    SoloAdventure::Equipment equipment{};
};

/**
 * @brief Reusable characters kept between campaign runs
 *
 * One JSON file per character, named after the slug of the character name.
 * Field layout matches the player record of the game save.
 */
class CharacterRoster {
public:
    CharacterRoster(const ContentRegistry& registry, std::string directory);

    // "Sir Hugo-the Bold!" -> "sir_hugo_the_bold"; empty results become "character"
    static std::string slugify(const std::string& name);

    // Sorted unique names from every readable roster file
    std::vector<std::string> listCharacters() const;

    bool exists(const std::string& name) const;

    // Writes the player with the run's inventory and equipment
    bool saveCharacter(const SoloAdventure::Character& character,
                       const std::vector<SoloAdventure::ItemDefinition>& inventory,
                       const SoloAdventure::Equipment& equipment);
    bool saveFromState(const SoloAdventure::GameState& state);

    /**
     * @brief Read a roster entry for use in the given campaign
     *
     * HP and mana come back full, and the inventory holds at least
     * three healing potions. Item names resolve against campaignId.
     */
    LoadStatus loadCharacter(const std::string& name, const std::string& campaignId,
                             RosterEntry& out);

    bool deleteCharacter(const std::string& name);

    // "Aria (Human Fighter), 12 gold, 3 items"
    static std::string summary(const RosterEntry& entry);

    std::string pathFor(const std::string& name) const;
    const std::string& getDirectory() const { return m_directory; }
    const std::string& getLastError() const { return m_lastError; }

    static constexpr int ROSTER_FORMAT_VERSION{1};
    static constexpr int MIN_ROSTER_POTIONS{3};

private:
    const ContentRegistry& m_registry;
    SaveGameManager m_codec;
    std::string m_directory;
    std::string m_lastError;
};

#endif  // CHARACTER_ROSTER_HPP
