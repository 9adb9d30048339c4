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

#include "pointitem.h"
#include <vector>
#include <wx/wx.h>

class PointCloudPanel;

class MainWindow : public wxFrame {
public:
  explicit MainWindow(const wxString &title);
  ~MainWindow();

private:
  void CreateMenuBar(); // Create menus
  void UpdateStatus();  // Refresh status bar fields

  // Replace the displayed items and rebind them to the panel
  void ShowItems(std::vector<PointItem> items, const wxString &name);

  void OnTogglePerspective(wxCommandEvent &event);
  void OnResetView(wxCommandEvent &event);
  void OnToggleAxes(wxCommandEvent &event);
  void OnToggleHud(wxCommandEvent &event);
  void OnSampleHelix(wxCommandEvent &event);
  void OnSampleClusters(wxCommandEvent &event);
  void OnSampleSinglePoint(wxCommandEvent &event);
  void OnSampleEmpty(wxCommandEvent &event);
  void OnShowAbout(wxCommandEvent &event);
  void OnClose(wxCommandEvent &event);
  void OnCloseWindow(wxCloseEvent &event);
  void OnViewChanged(wxCommandEvent &event);

  PointCloudPanel *viewerPanel = nullptr;
  std::vector<PointItem> items;
  PointItemAdapter adapter;
  wxString datasetName;

  wxDECLARE_EVENT_TABLE();
};
