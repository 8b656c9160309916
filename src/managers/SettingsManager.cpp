/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "managers/SettingsManager.hpp"
#include "core/Logger.hpp"
#include "utils/JsonReader.hpp"
#include <fstream>
#include <sstream>

namespace KeeperEngine {

bool SettingsManager::loadFromFile(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        SETTINGS_ERROR("Failed to open settings file: " + filepath);
        return false;
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return applyJson(buffer.str(), filepath);
}

bool SettingsManager::loadFromString(const std::string& json) {
    return applyJson(json, "<string>");
}

bool SettingsManager::applyJson(const std::string& json, const std::string& source) {
    JsonReader reader;
    if (!reader.parse(json)) {
        SETTINGS_ERROR("Failed to load settings from " + source + " - " + reader.getLastError());
        return false;
    }

    const JsonValue& root = reader.getRoot();
    if (!root.isObject()) {
        SETTINGS_ERROR("Settings root is not a JSON object: " + source);
        return false;
    }

    std::unique_lock<std::shared_mutex> lock(m_settingsMutex);

    for (const auto& [categoryName, categoryValue] : root.asObject()) {
        if (!categoryValue.isObject()) {
            SETTINGS_WARNING("Category '" + categoryName + "' is not an object, skipping");
            continue;
        }

        for (const auto& [key, value] : categoryValue.asObject()) {
            SettingValue settingValue;

            if (value.isBool()) {
                settingValue = value.asBool();
            } else if (value.isNumber()) {
                double numValue = value.asNumber();
                if (numValue == static_cast<int>(numValue)) {
                    settingValue = static_cast<int>(numValue);
                } else {
                    settingValue = static_cast<float>(numValue);
                }
            } else if (value.isString()) {
                settingValue = value.asString();
            } else if (value.isArray()) {
                StringList list;
                bool allStrings = true;
                for (const JsonValue& item : value.asArray()) {
                    if (!item.isString()) {
                        allStrings = false;
                        break;
                    }
                    list.push_back(item.asString());
                }
                if (!allStrings) {
                    SETTINGS_WARNING("Array setting '" + categoryName + "." + key +
                                     "' must hold strings only, skipping");
                    continue;
                }
                settingValue = std::move(list);
            } else {
                SETTINGS_WARNING("Unsupported value type for setting '" + categoryName + "." + key + "', skipping");
                continue;
            }

            m_settings[categoryName][key] = std::move(settingValue);
        }
    }

    SETTINGS_INFO("Loaded settings from " + source);
    return true;
}

bool SettingsManager::has(const std::string& category, const std::string& key) const {
    std::shared_lock<std::shared_mutex> lock(m_settingsMutex);

    auto categoryIt = m_settings.find(category);
    if (categoryIt == m_settings.end()) {
        return false;
    }
    return categoryIt->second.find(key) != categoryIt->second.end();
}

bool SettingsManager::remove(const std::string& category, const std::string& key) {
    std::unique_lock<std::shared_mutex> lock(m_settingsMutex);

    auto categoryIt = m_settings.find(category);
    if (categoryIt == m_settings.end() || categoryIt->second.erase(key) == 0) {
        return false;
    }
    if (categoryIt->second.empty()) {
        m_settings.erase(categoryIt);
    }
    return true;
}

void SettingsManager::clearAll() {
    std::unique_lock<std::shared_mutex> lock(m_settingsMutex);
    m_settings.clear();
}

std::vector<std::string> SettingsManager::getCategories() const {
    std::shared_lock<std::shared_mutex> lock(m_settingsMutex);

    std::vector<std::string> categories;
    categories.reserve(m_settings.size());
    for (const auto& [category, _] : m_settings) {
        categories.push_back(category);
    }
    return categories;
}

std::vector<std::string> SettingsManager::getKeys(const std::string& category) const {
    std::shared_lock<std::shared_mutex> lock(m_settingsMutex);

    auto categoryIt = m_settings.find(category);
    if (categoryIt == m_settings.end()) {
        return {};
    }

    std::vector<std::string> keys;
    keys.reserve(categoryIt->second.size());
    for (const auto& [key, _] : categoryIt->second) {
        keys.push_back(key);
    }
    return keys;
}

} // namespace KeeperEngine
