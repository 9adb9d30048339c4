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

#include <cmath>
#include <filesystem>
#include <fstream>
#include <iostream>

namespace {
bool Near(float a, float b) { return std::fabs(a - b) <= 1e-4f; }

void WriteFile(const std::string &path, const std::string &text) {
  std::ofstream out(path);
  out << text;
}
}

int main() {
  Logger::Instance().SetEchoToStderr(false);
  ConfigManager &cfg = ConfigManager::Get();
  cfg.Reset();

  if (!cfg.GetBool("viewer_show_axes") || !cfg.GetBool("viewer_show_hud") ||
      cfg.GetBool("viewer_start_perspective") ||
      !Near(cfg.GetFloat("viewer_point_count"), 400.0f)) {
    std::cerr << "Unexpected default preferences\n";
    return 1;
  }

  cfg.SetFloat("viewer_point_count", 1e6f);
  if (!Near(cfg.GetFloat("viewer_point_count"), 100000.0f)) {
    std::cerr << "Numbers must be clamped to their range\n";
    return 1;
  }
  if (!cfg.SetFromText("viewer_background_r", " 5 ") ||
      !Near(cfg.GetFloat("viewer_background_r"), 1.0f)) {
    std::cerr << "Text input must be parsed and clamped\n";
    return 1;
  }
  if (cfg.SetFromText("viewer_background_g", "dark") ||
      !Near(cfg.GetFloat("viewer_background_g"), 0.25f)) {
    std::cerr << "Unparsable text must keep the old value\n";
    return 1;
  }
  cfg.SetFloat("viewer_show_hud", 0.4f);
  if (!Near(cfg.GetFloat("viewer_show_hud"), 1.0f)) {
    std::cerr << "Flags store only 0 or 1\n";
    return 1;
  }
  auto setting = cfg.Find("viewer_point_count");
  if (!setting || !Near(setting->minValue, 1.0f) || cfg.Find("missing") ||
      cfg.GetFloat("missing") != 0.0f) {
    std::cerr << "Setting lookup mismatch\n";
    return 1;
  }

  const std::filesystem::path dir = std::filesystem::temp_directory_path();
  const std::string path = (dir / "pointview_config_test.json").string();

  cfg.Reset();
  cfg.SetBool("viewer_show_hud", false);
  cfg.SetBool("viewer_start_perspective", true);
  cfg.SetText("last_sample", "Clusters");
  if (!cfg.SaveToFile(path)) {
    std::cerr << "Could not write " << path << "\n";
    return 1;
  }

  cfg.Reset();
  if (!cfg.GetBool("viewer_show_hud") || cfg.HasKey("last_sample")) {
    std::cerr << "Reset must restore defaults\n";
    return 1;
  }
  if (!cfg.LoadFromFile(path) || cfg.GetBool("viewer_show_hud") ||
      !cfg.GetBool("viewer_start_perspective") ||
      cfg.GetText("last_sample") != std::string("Clusters")) {
    std::cerr << "Saved preferences did not load back\n";
    return 1;
  }

  // Strings, numbers and booleans are all accepted for settings
  WriteFile(path, "{\"viewer_show_axes\": false, \"viewer_point_count\": -3,"
                  " \"viewer_background_b\": \"0.5\"}");
  if (!cfg.LoadFromFile(path) || cfg.GetBool("viewer_show_axes") ||
      !Near(cfg.GetFloat("viewer_point_count"), 1.0f) ||
      !Near(cfg.GetFloat("viewer_background_b"), 0.5f)) {
    std::cerr << "Plain JSON values mismatch\n";
    return 1;
  }
  if (!cfg.GetBool("viewer_show_hud") || cfg.HasKey("last_sample")) {
    std::cerr << "Keys missing from the file must fall back to defaults\n";
    return 1;
  }

  WriteFile(path, "{ not json");
  if (cfg.LoadFromFile(path) || cfg.GetBool("viewer_show_axes")) {
    std::cerr << "Broken file must be rejected without side effects\n";
    return 1;
  }
  WriteFile(path, "[1, 2]");
  if (cfg.LoadFromFile(path)) {
    std::cerr << "Non-object file must be rejected\n";
    return 1;
  }
  if (cfg.LoadFromFile((dir / "pointview_missing_config.json").string())) {
    std::cerr << "Missing file must report failure\n";
    return 1;
  }

  std::filesystem::remove(path);
  cfg.Reset();
  return 0;
}
