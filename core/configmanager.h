/*
 * This file is part of PointView.
 * Copyright (C) 2025 Luisma Peramato
 *
 * PointView is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * PointView is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with PointView. If not, see <https://www.gnu.org/licenses/>.
 */
#pragma once

#include <map>
#include <optional>
#include <string>

// Application preferences. Viewer options are typed settings with a default
// and a valid range; anything else is kept as free text so files written by
// newer versions survive a load/save cycle.
class ConfigManager
{
public:
    enum class Kind { Flag, Number };

    struct Setting {
        Kind kind = Kind::Number;
        float defaultValue = 0.0f;
        float minValue = 0.0f;
        float maxValue = 0.0f;
        float value = 0.0f;
    };

    static ConfigManager& Get();

    // Registers a setting and resets it to its default
    void Define(const std::string& name, Kind kind, float defaultValue,
                float minValue, float maxValue);
    std::optional<Setting> Find(const std::string& name) const;

    // Unknown names read as 0 and are ignored when written
    float GetFloat(const std::string& name) const;
    void SetFloat(const std::string& name, float value);
    bool GetBool(const std::string& name) const { return GetFloat(name) != 0.0f; }
    void SetBool(const std::string& name, bool value) { SetFloat(name, value ? 1.0f : 0.0f); }

    // Parses text into a setting. Returns false and keeps the old value when
    // the name is unknown or the text is not a number.
    bool SetFromText(const std::string& name, const std::string& text);

    // Free text entries
    void SetText(const std::string& key, const std::string& value);
    std::optional<std::string> GetText(const std::string& key) const;
    bool HasKey(const std::string& key) const;
    void RemoveKey(const std::string& key);

    // Restores every setting to its default and drops free text entries
    void Reset();

    // Flags are written as JSON booleans, numbers as numbers. Loading resets
    // first, so keys missing from the file end up at their defaults. A file
    // that cannot be parsed leaves the current values untouched.
    bool LoadFromFile(const std::string& path);
    bool SaveToFile(const std::string& path) const;

    // <user data dir>/user_config.json, the directory is created on demand
    static std::string GetUserConfigFile();
    bool LoadUserConfig();
    bool SaveUserConfig() const;

private:
    ConfigManager();
    ConfigManager(const ConfigManager&) = delete;
    ConfigManager& operator=(const ConfigManager&) = delete;

    std::map<std::string, Setting> settings;
    std::map<std::string, std::string> extras;
};
