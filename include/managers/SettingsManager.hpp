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

namespace OvermapAtlas {

/**
 * @brief Thread-safe tool settings with category organization
 *
 * Settings are read from a JSON file of the form
 * { "category": { "key": value, ... }, ... } where values are numbers,
 * booleans or strings. Command-line flags are layered on top with set().
 *
 * Usage:
 *   auto& settings = SettingsManager::Instance();
 *   settings.loadFromFile("res/atlas_settings.json");
 *   int z = settings.get<int>("render", "z_level", 0);
 *   settings.set("content", "game_path", std::string("/opt/cdda"));
 */
class SettingsManager {
public:
    ~SettingsManager() = default;

    static SettingsManager& Instance() {
        static SettingsManager instance;
        return instance;
    }

    using SettingValue = std::variant<int, float, bool, std::string>;

    /**
     * @brief Loads settings from a JSON file, merging into current values
     * @param filepath Path to the JSON settings file
     * @return true if loading successful, false otherwise
     */
    bool loadFromFile(const std::string& filepath);

    /**
     * @brief Gets a typed setting value with optional default
     * @return The setting value, or defaultValue when missing or of another type
     */
    template<typename T>
    T get(const std::string& category, const std::string& key, T defaultValue = T{}) const;

    template<typename T>
    bool set(const std::string& category, const std::string& key, const T& value);

    bool has(const std::string& category, const std::string& key) const;

    void clearAll();

    std::vector<std::string> getCategories() const;
    std::vector<std::string> getKeys(const std::string& category) const;

    /**
     * @brief Splits a comma separated string setting into trimmed, non-empty items
     */
    std::vector<std::string> getList(const std::string& category, const std::string& key,
                                     const std::vector<std::string>& defaultValue = {}) const;

private:
    using CategorySettings = std::unordered_map<std::string, SettingValue>;
    std::unordered_map<std::string, CategorySettings> m_settings;

    mutable std::shared_mutex m_settingsMutex;

    SettingsManager(const SettingsManager&) = delete;
    SettingsManager& operator=(const SettingsManager&) = delete;

    SettingsManager() = default;
};

// Template implementations must be in header for linking

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

    if constexpr (std::is_same_v<T, int> || std::is_same_v<T, float> ||
                  std::is_same_v<T, bool> || std::is_same_v<T, std::string>) {
        if (const T* value = std::get_if<T>(&keyIt->second)) {
            return *value;
        }
        // An integral value is an acceptable float
        if constexpr (std::is_same_v<T, float>) {
            if (const int* value = std::get_if<int>(&keyIt->second)) {
                return static_cast<float>(*value);
            }
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

} // namespace OvermapAtlas

#endif // SETTINGS_MANAGER_HPP
