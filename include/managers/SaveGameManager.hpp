/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef SAVE_GAME_MANAGER_HPP
#define SAVE_GAME_MANAGER_HPP

#include "core/GameState.hpp"
#include <cstdint>
#include <iosfwd>
#include <stdexcept>
#include <string>

class ContentRegistry;

namespace SoloAdventure {
class JsonValue;
}

// Outcome of reading a save file
enum class LoadStatus : uint8_t {
    Ok = 0,
    NotFound = 1, // no file at the path
    Corrupt = 2,  // unreadable JSON or a document that is not a game state
    IoError = 3   // the file exists but could not be read
};

const char* toString(LoadStatus status);

// Stream operator for LoadStatus (for Boost.Test)
std::ostream& operator<<(std::ostream& os, LoadStatus status);

// Thrown by the document decoders when a required field is missing or mistyped
class SaveFormatError : public std::runtime_error {
public:
    explicit SaveFormatError(const std::string& message) : std::runtime_error(message) {}
};

/**
 * @brief JSON persistence for the running adventure
 *
 * One document per save file holding every GameState field plus a format
 * version. Version 1 and unversioned documents go through the legacy flag
 * migration once on load. The decoders are public so the character roster
 * shares the same field layout.
 */
class SaveGameManager {
public:
    explicit SaveGameManager(const ContentRegistry& registry) : m_registry(registry) {}
    ~SaveGameManager() = default;

    // Save the state to a file, creating parent directories
    // Returns true if save was successful
    bool save(const SoloAdventure::GameState& state, const std::string& saveFileName);

    /**
     * @brief Load a state from a file
     * @param out Receives the state only when the status is Ok
     *
     * After decoding: legacy flags are migrated, an empty inventory is
     * re-stocked with three healing potions.
     */
    LoadStatus load(const std::string& saveFileName, SoloAdventure::GameState& out);

    // Delete a save file
    // Returns true if deletion was successful
    bool deleteSave(const std::string& saveFileName);

    // Check if a save file exists
    bool saveExists(const std::string& saveFileName) const;

    // Set the base directory for relative save file names
    void setSaveDirectory(const std::string& directory) { m_saveDirectory = directory; }
    const std::string& getSaveDirectory() const { return m_saveDirectory; }
    std::string getFullSavePath(const std::string& saveFileName) const;

    const std::string& getLastError() const { return m_lastError; }

    // --- Document codec ---

    SoloAdventure::JsonValue toJson(const SoloAdventure::GameState& state) const;
    // Throws SaveFormatError on structural problems
    SoloAdventure::GameState fromJson(const SoloAdventure::JsonValue& root) const;

    static SoloAdventure::JsonValue characterToJson(const SoloAdventure::Character& character);
    SoloAdventure::Character characterFromJson(const SoloAdventure::JsonValue& value) const;

    static SoloAdventure::JsonValue itemToJson(const SoloAdventure::ItemDefinition& item);
    // Objects are decoded field by field; plain strings resolve by item name
    SoloAdventure::ItemDefinition itemFromJson(const SoloAdventure::JsonValue& value,
                                               const std::string& campaignId) const;

    static SoloAdventure::JsonValue equipmentToJson(const SoloAdventure::Equipment& equipment);
    SoloAdventure::Equipment equipmentFromJson(const SoloAdventure::JsonValue& value,
                                               const std::string& campaignId) const;

    /**
     * @brief Fold a version 1 flag bag into the typed flag store
     *
     * Handles the bandit-era keys (bandit_defeated, bandit_looted,
     * enemy_name), corpse lists of plain names and single-name corpses.
     * Any remaining boolean keys become markers.
     */
    static SoloAdventure::CampaignFlags migrateLegacyFlags(const SoloAdventure::JsonValue& flags,
                                                           const std::string& campaignId,
                                                           const std::string& roomId);

    static constexpr int MIN_POTIONS_AFTER_LOAD{3};

private:
    static SoloAdventure::JsonValue flagsToJson(const SoloAdventure::CampaignFlags& flags);
    static SoloAdventure::CampaignFlags flagsFromJson(const SoloAdventure::JsonValue& value);

    const ContentRegistry& m_registry;
    std::string m_saveDirectory;
    std::string m_lastError;
};

#endif  // SAVE_GAME_MANAGER_HPP
