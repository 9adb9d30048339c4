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
#include "mainwindow.h"
#include <wx/wx.h>

class PointViewApp : public wxApp {
public:
  virtual bool OnInit() override;
};

wxIMPLEMENT_APP(PointViewApp);

bool PointViewApp::OnInit() {
  SetAppName("PointView");

  // Initialize logging system (overwrites log file each launch)
  Logger::Instance().Log("PointView starting");

  // Missing preferences are normal on first launch
  if (!ConfigManager::Get().LoadUserConfig())
    Logger::Instance().Log("No user preferences loaded, using defaults");

  MainWindow *mainWindow = new MainWindow("PointView");
  mainWindow->Show(true);
  return true;
}
