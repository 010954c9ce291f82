/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef SETTINGS_MANAGER_HPP
#define SETTINGS_MANAGER_HPP

#include <mutex>
#include <shared_mutex>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <variant>
#include <vector>

namespace SoloAdventure {

/**
 * @brief Category/key settings store backed by a JSON file
 *
 * Owned by the console driver and handed to whoever needs configuration;
 * GameConfig::fromSettings() turns it into the typed values the rules use.
 *
 * Usage:
 *   SettingsManager settings;
 *   settings.loadFromFile("res/settings.json");
 *   int limit = settings.get<int>("game", "inventory_limit", 10);
 *   settings.set("player", "name", std::string("Aria"));
 *   settings.saveToFile("res/settings.json");
 */
class SettingsManager {
public:
    SettingsManager() = default;
    ~SettingsManager() = default;

    using SettingValue = std::variant<int, float, bool, std::string>;

    /**
     * @brief Loads settings from a JSON file, merging over existing values
     * @param filepath Path to the JSON settings file
     * @return true if loading successful, false otherwise
     */
    bool loadFromFile(const std::string& filepath);

    /**
     * @brief Saves current settings to a JSON file
     * @param filepath Path to save the JSON settings file
     * @return true if saving successful, false otherwise
     */
    bool saveToFile(const std::string& filepath) const;

    /**
     * @brief Gets a typed setting value
     * @return The stored value, or defaultValue when missing or of another type.
     *         An int setting read as float is widened.
     */
    template<typename T>
    T get(const std::string& category, const std::string& key, T defaultValue = T{}) const;

    template<typename T>
    bool set(const std::string& category, const std::string& key, const T& value);

    bool has(const std::string& category, const std::string& key) const;
    bool remove(const std::string& category, const std::string& key);
    void clearAll();

    std::vector<std::string> getCategories() const;
    std::vector<std::string> getKeys(const std::string& category) const;

private:
    using CategorySettings = std::unordered_map<std::string, SettingValue>;
    std::unordered_map<std::string, CategorySettings> m_settings;

    mutable std::shared_mutex m_settingsMutex;

    SettingsManager(const SettingsManager&) = delete;
    SettingsManager& operator=(const SettingsManager&) = delete;
};

template<typename T>
T SettingsManager::get(const std::string& category, const std::string& key, T defaultValue) const {
    std::shared_lock<std::shared_mutex> lock(m_settingsMutex);

    auto categoryIt = m_settings.find(category);
    if (categoryIt == m_settings.end()) {
        return defaultValue;
    }

    auto keyIt = categoryIt->second.find(key);
    if (keyIt == categoryIt->second.end()) {
        return defaultValue;
    }

    const SettingValue& stored = keyIt->second;
    if constexpr (std::is_same_v<T, float>) {
        if (const int* asInt = std::get_if<int>(&stored)) {
            return static_cast<float>(*asInt);
        }
    }
    if constexpr (std::is_same_v<T, int> || std::is_same_v<T, float> ||
                  std::is_same_v<T, bool> || std::is_same_v<T, std::string>) {
        if (const T* value = std::get_if<T>(&stored)) {
            return *value;
        }
    }
    return defaultValue;
}

template<typename T>
bool SettingsManager::set(const std::string& category, const std::string& key, const T& value) {
    SettingValue settingValue;

    if constexpr (std::is_same_v<T, int> || std::is_same_v<T, float> ||
                  std::is_same_v<T, bool> || std::is_same_v<T, std::string>) {
        settingValue = value;
    } else if constexpr (std::is_convertible_v<T, std::string>) {
        settingValue = std::string(value);
    } else {
        return false;
    }

    std::unique_lock<std::shared_mutex> lock(m_settingsMutex);
    m_settings[category][key] = std::move(settingValue);
    return true;
}

} // namespace SoloAdventure

#endif // SETTINGS_MANAGER_HPP
