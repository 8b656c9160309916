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

namespace KeeperEngine {

/**
 * @brief Thread-safe application settings grouped by category
 *
 * Read by the driver only (level list, pacing, autopilot); the simulation
 * core takes everything it needs from its LevelDefinition.
 *
 * Usage:
 *   auto& settings = SettingsManager::Instance();
 *   settings.loadFromFile("res/settings.json");
 *   int fps = settings.get<int>("loop", "target_fps", 60);
 */
class SettingsManager {
public:
    ~SettingsManager() = default;

    static SettingsManager& Instance() {
        static SettingsManager instance;
        return instance;
    }

    using StringList = std::vector<std::string>;

    /**
     * @brief Supported setting value types
     */
    using SettingValue = std::variant<int, float, bool, std::string, StringList>;

    /**
     * @brief Loads settings from a JSON file of { "category": { "key": value } }
     * @return true if loading successful, false otherwise
     *
     * Values already present are overwritten; others are kept.
     */
    bool loadFromFile(const std::string& filepath);

    /**
     * @brief Same as loadFromFile() for JSON text already in memory
     */
    bool loadFromString(const std::string& json);

    /**
     * @brief Gets a typed setting value with optional default
     * @tparam T int, float, bool, std::string or StringList
     * @return The setting value, or defaultValue if it is missing or holds
     *         another type. An int setting is accepted where a float is asked.
     *
     * Thread-safe for concurrent reads
     */
    template<typename T>
    T get(const std::string& category, const std::string& key, T defaultValue = T{}) const;

    /**
     * @brief Sets a typed setting value
     * @return true if set successful, false for unsupported types
     */
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

    /**
     * @brief Allows multiple concurrent reads or single write
     */
    mutable std::shared_mutex m_settingsMutex;

    bool applyJson(const std::string& json, const std::string& source);

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

    const SettingValue& value = keyIt->second;
    if constexpr (std::is_same_v<T, float>) {
        if (const int* whole = std::get_if<int>(&value)) {
            return static_cast<float>(*whole);
        }
    }

    if constexpr (std::is_same_v<T, int> || std::is_same_v<T, float> ||
                  std::is_same_v<T, bool> || std::is_same_v<T, std::string> ||
                  std::is_same_v<T, StringList>) {
        if (const T* typed = std::get_if<T>(&value)) {
            return *typed;
        }
    }
    // Type mismatch or unsupported type
    return defaultValue;
}

template<typename T>
bool SettingsManager::set(const std::string& category, const std::string& key, const T& value) {
    SettingValue settingValue;

    if constexpr (std::is_same_v<T, int> || std::is_same_v<T, float> ||
                  std::is_same_v<T, bool> || std::is_same_v<T, std::string> ||
                  std::is_same_v<T, StringList>) {
        settingValue = value;
    } else if constexpr (std::is_convertible_v<T, std::string>) {
        settingValue = std::string(value);
    } else {
        // Unsupported type
        return false;
    }

    std::unique_lock<std::shared_mutex> lock(m_settingsMutex);
    m_settings[category][key] = std::move(settingValue);
    return true;
}

} // namespace KeeperEngine

#endif // SETTINGS_MANAGER_HPP
