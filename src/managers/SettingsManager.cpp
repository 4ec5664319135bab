/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "managers/SettingsManager.hpp"
#include "core/Logger.hpp"
#include "utils/JsonReader.hpp"

#include <cmath>

namespace Ironclad {

namespace {

bool mergeRoot(const JsonValue& root, const std::string& source,
               std::unordered_map<std::string,
                                  std::unordered_map<std::string, SettingsManager::SettingValue>>& out) {
    if (!root.isObject()) {
        SETTINGS_ERROR("Settings root is not a JSON object: " + source);
        return false;
    }

    for (const auto& [categoryName, categoryValue] : root.asObject()) {
        const JsonObject* category = categoryValue.tryAsObject();
        if (category == nullptr) {
            SETTINGS_WARNING("Category '" + categoryName + "' is not an object, skipping");
            continue;
        }

        for (const auto& [key, value] : *category) {
            if (value.isBool()) {
                out[categoryName][key] = value.asBool();
            } else if (value.isNumber()) {
                double number = value.asNumber();
                if (std::floor(number) == number && std::fabs(number) < 2147483647.0) {
                    out[categoryName][key] = static_cast<int>(number);
                } else {
                    out[categoryName][key] = static_cast<float>(number);
                }
            } else if (value.isString()) {
                out[categoryName][key] = value.asString();
            } else {
                SETTINGS_WARNING("Unsupported value type for setting '" + categoryName + "." + key + "', skipping");
            }
        }
    }
    return true;
}

} // anonymous namespace

bool SettingsManager::loadFromFile(const std::string& filepath) {
    JsonReader reader;
    if (!reader.loadFromFile(filepath)) {
        SETTINGS_ERROR("Failed to load settings from file: " + filepath + " - " + reader.getLastError());
        return false;
    }

    std::unique_lock<std::shared_mutex> lock(m_settingsMutex);
    if (!mergeRoot(reader.getRoot(), filepath, m_settings)) {
        return false;
    }
    SETTINGS_INFO("Loaded settings from file: " + filepath);
    return true;
}

bool SettingsManager::loadFromString(const std::string& json) {
    JsonReader reader;
    if (!reader.parse(json)) {
        SETTINGS_ERROR("Failed to parse settings: " + reader.getLastError());
        return false;
    }

    std::unique_lock<std::shared_mutex> lock(m_settingsMutex);
    return mergeRoot(reader.getRoot(), "<memory>", m_settings);
}

const SettingsManager::SettingValue* SettingsManager::find(const std::string& category,
                                                           const std::string& key) const {
    auto categoryIt = m_settings.find(category);
    if (categoryIt == m_settings.end()) {
        return nullptr;
    }
    auto keyIt = categoryIt->second.find(key);
    return keyIt == categoryIt->second.end() ? nullptr : &keyIt->second;
}

bool SettingsManager::has(const std::string& category, const std::string& key) const {
    std::shared_lock<std::shared_mutex> lock(m_settingsMutex);
    return find(category, key) != nullptr;
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

std::vector<std::string> SettingsManager::getKeys(const std::string& category) const {
    std::shared_lock<std::shared_mutex> lock(m_settingsMutex);

    std::vector<std::string> keys;
    auto categoryIt = m_settings.find(category);
    if (categoryIt == m_settings.end()) {
        return keys;
    }

    keys.reserve(categoryIt->second.size());
    for (const auto& [key, _] : categoryIt->second) {
        keys.push_back(key);
    }
    return keys;
}

} // namespace Ironclad
