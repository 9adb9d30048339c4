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
#include "mainwindow.h"

#include "configmanager.h"
#include "logger.h"
#include "pointcloudpanel.h"
#include "sampledata.h"
#include <wx/aboutdlg.h>

namespace {
enum MenuIds {
  ID_View_TogglePerspective = wxID_HIGHEST + 1,
  ID_View_ResetView,
  ID_View_ShowAxes,
  ID_View_ShowHud,
  ID_Data_Helix,
  ID_Data_Clusters,
  ID_Data_SinglePoint,
  ID_Data_Empty
};

size_t SampleSize() {
  return static_cast<size_t>(
      ConfigManager::Get().GetFloat("viewer_point_count"));
}
} // namespace

wxBEGIN_EVENT_TABLE(MainWindow, wxFrame)
    EVT_MENU(ID_View_TogglePerspective, MainWindow::OnTogglePerspective)
    EVT_MENU(ID_View_ResetView, MainWindow::OnResetView)
    EVT_MENU(ID_View_ShowAxes, MainWindow::OnToggleAxes)
    EVT_MENU(ID_View_ShowHud, MainWindow::OnToggleHud)
    EVT_MENU(ID_Data_Helix, MainWindow::OnSampleHelix)
    EVT_MENU(ID_Data_Clusters, MainWindow::OnSampleClusters)
    EVT_MENU(ID_Data_SinglePoint, MainWindow::OnSampleSinglePoint)
    EVT_MENU(ID_Data_Empty, MainWindow::OnSampleEmpty)
    EVT_MENU(wxID_ABOUT, MainWindow::OnShowAbout)
    EVT_MENU(wxID_EXIT, MainWindow::OnClose)
    EVT_CLOSE(MainWindow::OnCloseWindow)
wxEND_EVENT_TABLE()

MainWindow::MainWindow(const wxString &title)
    : wxFrame(nullptr, wxID_ANY, title, wxDefaultPosition, wxSize(1024, 768)) {
  CreateMenuBar();
  CreateStatusBar(2);

  viewerPanel = new PointCloudPanel(this);
  Bind(EVT_POINTCLOUD_VIEW_CHANGED, &MainWindow::OnViewChanged, this);

  auto *sizer = new wxBoxSizer(wxVERTICAL);
  sizer->Add(viewerPanel, 1, wxEXPAND);
  SetSizer(sizer);

  ShowItems(SampleData::MakeHelix(SampleSize()), "Helix");
}

MainWindow::~MainWindow() = default;

void MainWindow::CreateMenuBar() {
  ConfigManager &cfg = ConfigManager::Get();

  auto *fileMenu = new wxMenu();
  fileMenu->Append(wxID_EXIT, "E&xit\tCtrl+Q");

  auto *viewMenu = new wxMenu();
  viewMenu->Append(ID_View_TogglePerspective, "Toggle &Perspective\tP");
  viewMenu->Append(ID_View_ResetView, "&Reset View\tR");
  viewMenu->AppendSeparator();
  viewMenu->AppendCheckItem(ID_View_ShowAxes, "Show &Axes");
  viewMenu->AppendCheckItem(ID_View_ShowHud, "Show &HUD");
  viewMenu->Check(ID_View_ShowAxes, cfg.GetBool("viewer_show_axes"));
  viewMenu->Check(ID_View_ShowHud, cfg.GetBool("viewer_show_hud"));

  auto *dataMenu = new wxMenu();
  dataMenu->Append(ID_Data_Helix, "Sample: &Helix");
  dataMenu->Append(ID_Data_Clusters, "Sample: &Clusters");
  dataMenu->Append(ID_Data_SinglePoint, "Sample: &Single Point");
  dataMenu->Append(ID_Data_Empty, "&Empty");

  auto *helpMenu = new wxMenu();
  helpMenu->Append(wxID_ABOUT, "&About");

  auto *menuBar = new wxMenuBar();
  menuBar->Append(fileMenu, "&File");
  menuBar->Append(viewMenu, "&View");
  menuBar->Append(dataMenu, "&Data");
  menuBar->Append(helpMenu, "&Help");
  SetMenuBar(menuBar);
}

void MainWindow::ShowItems(std::vector<PointItem> newItems,
                           const wxString &name) {
  // The panel keeps a reference to the vector, so refill it in place
  items = std::move(newItems);
  datasetName = name;
  viewerPanel->SetDataset(items, adapter);
  Logger::Instance().Log("Showing sample '" + name.ToStdString() + "' (" +
                         std::to_string(items.size()) + " items)");
}

void MainWindow::UpdateStatus() {
  if (!viewerPanel)
    return;
  SetStatusText(wxString::Format("%s: %zu items", datasetName,
                                 viewerPanel->GetController().GetItemCount()),
                0);
  SetStatusText(viewerPanel->IsPerspectiveEnabled() ? "Perspective"
                                                    : "Orthographic",
                1);
}

void MainWindow::OnTogglePerspective(wxCommandEvent &WXUNUSED(event)) {
  viewerPanel->TogglePerspective();
}

void MainWindow::OnResetView(wxCommandEvent &WXUNUSED(event)) {
  viewerPanel->ResetView();
}

void MainWindow::OnToggleAxes(wxCommandEvent &event) {
  bool show = event.IsChecked();
  ConfigManager::Get().SetBool("viewer_show_axes", show);
  viewerPanel->SetShowAxes(show);
}

void MainWindow::OnToggleHud(wxCommandEvent &event) {
  bool show = event.IsChecked();
  ConfigManager::Get().SetBool("viewer_show_hud", show);
  viewerPanel->SetShowHud(show);
}

void MainWindow::OnSampleHelix(wxCommandEvent &WXUNUSED(event)) {
  ShowItems(SampleData::MakeHelix(SampleSize()), "Helix");
}

void MainWindow::OnSampleClusters(wxCommandEvent &WXUNUSED(event)) {
  ShowItems(SampleData::MakeClusters(SampleSize()), "Clusters");
}

void MainWindow::OnSampleSinglePoint(wxCommandEvent &WXUNUSED(event)) {
  ShowItems(SampleData::MakeSinglePoint(), "Single point");
}

void MainWindow::OnSampleEmpty(wxCommandEvent &WXUNUSED(event)) {
  ShowItems({}, "Empty");
}

void MainWindow::OnShowAbout(wxCommandEvent &WXUNUSED(event)) {
  wxAboutDialogInfo info;
  info.SetName("PointView");
  info.SetDescription("Point cloud viewer with orthographic and perspective "
                      "projection.\nDrag to rotate, use the wheel to zoom, "
                      "press P to switch projection.");
  info.SetLicence("GNU General Public License v3.0");
  wxAboutBox(info, this);
}

void MainWindow::OnClose(wxCommandEvent &WXUNUSED(event)) { Close(true); }

void MainWindow::OnCloseWindow(wxCloseEvent &event) {
  if (!ConfigManager::Get().SaveUserConfig())
    Logger::Instance().Log("Failed to save user preferences");
  event.Skip();
}

void MainWindow::OnViewChanged(wxCommandEvent &event) {
  UpdateStatus();
  event.Skip();
}
