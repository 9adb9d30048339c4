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
#include "configmanager.h"
#include "logger.h"
#include <algorithm>
#include <charconv>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <string_view>
#include <wx/stdpaths.h>

namespace {
std::string_view Trim(std::string_view text) {
  const char *ws = " \t\r\n";
  size_t first = text.find_first_not_of(ws);
  if (first == std::string_view::npos)
    return {};
  size_t last = text.find_last_not_of(ws);
  return text.substr(first, last - first + 1);
}

// Whole token must be a number, surrounding blanks are tolerated
std::optional<float> ParseNumber(std::string_view text) {
  text = Trim(text);
  if (text.empty())
    return std::nullopt;
  float parsed = 0.0f;
  const char *stop = text.data() + text.size();
  auto [ptr, ec] = std::from_chars(text.data(), stop, parsed);
  if (ec != std::errc{} || ptr != stop)
    return std::nullopt;
  return parsed;
}

std::optional<float> NumberFromJson(const nlohmann::json &value) {
  if (value.is_boolean())
    return value.get<bool>() ? 1.0f : 0.0f;
  if (value.is_number())
    return value.get<float>();
  if (value.is_string())
    return ParseNumber(value.get<std::string>());
  return std::nullopt;
}
} // namespace

ConfigManager::ConfigManager() {
  Define("viewer_show_axes", Kind::Flag, 1.0f, 0.0f, 1.0f);
  Define("viewer_show_hud", Kind::Flag, 1.0f, 0.0f, 1.0f);
  Define("viewer_start_perspective", Kind::Flag, 0.0f, 0.0f, 1.0f);
  // Dark gray background
  Define("viewer_background_r", Kind::Number, 0.25f, 0.0f, 1.0f);
  Define("viewer_background_g", Kind::Number, 0.25f, 0.0f, 1.0f);
  Define("viewer_background_b", Kind::Number, 0.25f, 0.0f, 1.0f);
  Define("viewer_point_count", Kind::Number, 400.0f, 1.0f, 100000.0f);
}

ConfigManager &ConfigManager::Get() {
  static ConfigManager instance;
  return instance;
}

void ConfigManager::Define(const std::string &name, Kind kind,
                           float defaultValue, float minValue,
                           float maxValue) {
  Setting s;
  s.kind = kind;
  s.minValue = minValue;
  s.maxValue = maxValue;
  s.defaultValue = std::clamp(defaultValue, minValue, maxValue);
  s.value = s.defaultValue;
  settings[name] = s;
  extras.erase(name);
}

std::optional<ConfigManager::Setting>
ConfigManager::Find(const std::string &name) const {
  auto found = settings.find(name);
  if (found == settings.end())
    return std::nullopt;
  return found->second;
}

float ConfigManager::GetFloat(const std::string &name) const {
  auto found = settings.find(name);
  return found != settings.end() ? found->second.value : 0.0f;
}

void ConfigManager::SetFloat(const std::string &name, float value) {
  auto found = settings.find(name);
  if (found == settings.end())
    return;
  Setting &s = found->second;
  if (s.kind == Kind::Flag)
    value = value != 0.0f ? 1.0f : 0.0f;
  s.value = std::clamp(value, s.minValue, s.maxValue);
}

bool ConfigManager::SetFromText(const std::string &name,
                                const std::string &text) {
  if (settings.find(name) == settings.end())
    return false;
  auto parsed = ParseNumber(text);
  if (!parsed)
    return false;
  SetFloat(name, *parsed);
  return true;
}

void ConfigManager::SetText(const std::string &key, const std::string &value) {
  if (settings.count(key)) {
    SetFromText(key, value);
    return;
  }
  extras[key] = value;
}

std::optional<std::string>
ConfigManager::GetText(const std::string &key) const {
  auto found = extras.find(key);
  if (found == extras.end())
    return std::nullopt;
  return found->second;
}

bool ConfigManager::HasKey(const std::string &key) const {
  return settings.count(key) > 0 || extras.count(key) > 0;
}

void ConfigManager::RemoveKey(const std::string &key) { extras.erase(key); }

void ConfigManager::Reset() {
  for (auto &entry : settings)
    entry.second.value = entry.second.defaultValue;
  extras.clear();
}

bool ConfigManager::LoadFromFile(const std::string &path) {
  std::ifstream in(path);
  if (!in)
    return false;

  nlohmann::json doc;
  try {
    in >> doc;
  } catch (const nlohmann::json::exception &e) {
    Logger::Instance().Log("Preferences " + path + " unreadable: " + e.what());
    return false;
  }
  if (!doc.is_object()) {
    Logger::Instance().Log("Preferences " + path + " ignored, expected an object");
    return false;
  }

  Reset();
  for (const auto &item : doc.items()) {
    const std::string &key = item.key();
    if (settings.count(key)) {
      auto number = NumberFromJson(item.value());
      if (number)
        SetFloat(key, *number);
      else
        Logger::Instance().Log("Preference '" + key + "' has an invalid value");
    } else if (item.value().is_string()) {
      extras[key] = item.value().get<std::string>();
    }
  }
  return true;
}

bool ConfigManager::SaveToFile(const std::string &path) const {
  nlohmann::json doc = nlohmann::json::object();
  for (const auto &[name, s] : settings) {
    if (s.kind == Kind::Flag)
      doc[name] = s.value != 0.0f;
    else
      doc[name] = s.value;
  }
  for (const auto &[key, text] : extras)
    doc[key] = text;

  std::ofstream out(path);
  if (!out)
    return false;
  out << doc.dump(4);
  return static_cast<bool>(out);
}

std::string ConfigManager::GetUserConfigFile() {
  std::filesystem::path dir(
      wxStandardPaths::Get().GetUserDataDir().ToStdString());
  std::error_code ec;
  std::filesystem::create_directories(dir, ec);
  return (dir / "user_config.json").string();
}

bool ConfigManager::LoadUserConfig() {
  return LoadFromFile(GetUserConfigFile());
}

bool ConfigManager::SaveUserConfig() const {
  return SaveToFile(GetUserConfigFile());
}
