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
/*
 * File: pointcloudpanel.h
 * Author: Luisma Peramato
 * License: GNU General Public License v3.0
 * Description: wxPanel that displays a point cloud with mouse rotation and
 * wheel zoom.
 */

#pragma once

#include "pointcloudcontroller.h"
#include <vector>
#include <wx/wx.h>

// Sent to the parent whenever the projection mode, the view or the dataset
// changes so status displays can refresh.
wxDECLARE_EVENT(EVT_POINTCLOUD_VIEW_CHANGED, wxCommandEvent);

class PointCloudPanel : public wxPanel {
public:
  explicit PointCloudPanel(wxWindow *parent);

  // The collection and adapter are borrowed and must outlive the panel or
  // the next SetDataset/ClearDataset call.
  template <typename T>
  void SetDataset(const std::vector<T> &items, const ItemAdapter<T> &adapter) {
    m_controller.SetDataset(items, adapter);
    NotifyViewChanged();
  }
  // Temporaries would be destroyed while still bound.
  template <typename T>
  void SetDataset(const std::vector<T> &&, const ItemAdapter<T> &) = delete;
  template <typename T>
  void SetDataset(const std::vector<T> &, const ItemAdapter<T> &&) = delete;
  template <typename T>
  void SetDataset(const std::vector<T> &&, const ItemAdapter<T> &&) = delete;
  void ClearDataset();
  // Call after modifying the bound collection in place.
  void DatasetChanged();

  void TogglePerspective();
  bool IsPerspectiveEnabled() const {
    return m_controller.IsPerspectiveEnabled();
  }
  void ResetView();

  void SetShowAxes(bool show);
  void SetShowHud(bool show);

  // Reads display preferences from ConfigManager
  void LoadOptionsFromConfig();

  const PointCloudController &GetController() const { return m_controller; }

private:
  void OnPaint(wxPaintEvent &event);
  void OnResize(wxSizeEvent &event);
  void OnMouseDown(wxMouseEvent &event);
  void OnMouseUp(wxMouseEvent &event);
  void OnMouseMove(wxMouseEvent &event);
  void OnMouseWheel(wxMouseEvent &event);
  void OnCaptureLost(wxMouseCaptureLostEvent &event);
  void OnKeyDown(wxKeyEvent &event);
  void OnMouseEnter(wxMouseEvent &event);

  void NotifyViewChanged();

  PointCloudController m_controller;

  wxDECLARE_EVENT_TABLE();
};
