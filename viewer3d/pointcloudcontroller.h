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
 * File: pointcloudcontroller.h
 * Author: Luisma Peramato
 * License: GNU General Public License v3.0
 * Description: Viewer state and per-frame rendering of the point cloud.
 */

#pragma once

#include "axisrenderer.h"
#include "canvas2d.h"
#include "inputcontroller.h"
#include "itemadapter.h"
#include "pointcloudcamera.h"
#include "scenebuilder.h"
#include "sceneextents.h"

#include <functional>
#include <memory>
#include <string>
#include <vector>

struct PointCloudRenderOptions {
  bool showAxes = true;
  bool showHud = true;
};

// Owns the dataset binding, the camera and the extents, and paints complete
// frames onto an ICanvas2D. All methods run on the UI thread; the host
// toolkit forwards its input and resize events here and supplies the redraw
// callback.
class PointCloudController {
public:
  static constexpr const char *kEmptyMessage = "No data to display.";
  static constexpr const char *kControlsHint =
      "Controls: Drag mouse (LMB) to rotate, use mouse wheel to zoom.";

  PointCloudController();

  // Replaces the dataset. Both arguments are borrowed and must outlive the
  // controller or the next SetDataset/ClearDataset call.
  template <typename T>
  void SetDataset(const std::vector<T> &items, const ItemAdapter<T> &adapter) {
    m_dataset = MakeDataset(items, adapter);
    DatasetChanged();
  }
  // Temporaries would be destroyed while still bound.
  template <typename T>
  void SetDataset(const std::vector<T> &&, const ItemAdapter<T> &) = delete;
  template <typename T>
  void SetDataset(const std::vector<T> &, const ItemAdapter<T> &&) = delete;
  template <typename T>
  void SetDataset(const std::vector<T> &&, const ItemAdapter<T> &&) = delete;
  void ClearDataset();

  // Re-reads extrema after the caller modified the bound collection.
  void DatasetChanged();

  void TogglePerspective();
  bool IsPerspectiveEnabled() const { return m_camera.IsPerspectiveEnabled(); }
  void ResetView();

  // Viewport size in pixels. Recomputes the base scale.
  void Resize(int width, int height);
  int GetWidth() const { return m_width; }
  int GetHeight() const { return m_height; }
  ScreenPoint GetCenter() const { return {m_width / 2, m_height / 2}; }

  void OnPress(int x, int y);
  void OnRelease();
  void OnDrag(int x, int y);
  void OnWheel(double notches);

  // Called whenever state changed and the surface should be repainted.
  void SetRedrawCallback(std::function<void()> callback) {
    m_redraw = std::move(callback);
  }

  void SetRenderOptions(const PointCloudRenderOptions &options);
  const PointCloudRenderOptions &GetRenderOptions() const { return m_options; }

  // Paints axes, points and HUD for the current state.
  void RenderFrame(ICanvas2D &canvas);

  const PointCloudCamera &GetCamera() const { return m_camera; }
  PointCloudCamera &GetCamera() { return m_camera; }
  const SceneExtents &GetExtents() const { return m_extents; }
  const InputController &GetInput() const { return m_input; }
  size_t GetItemCount() const { return m_extents.GetItemCount(); }
  bool HasData() const { return m_dataset && !m_dataset->Empty(); }

  // Points drawn in the last frame, in draw order.
  const std::vector<ProjectedPoint> &GetLastFramePoints() const {
    return m_builder.GetPoints();
  }

  std::vector<std::string> BuildHudLines() const;

private:
  void UpdateBaseScale();
  void RequestRedraw();

  void DrawPoints(ICanvas2D &canvas, const std::vector<ProjectedPoint> &points);
  void DrawHud(ICanvas2D &canvas);

  std::unique_ptr<IDataset> m_dataset;
  PointCloudCamera m_camera;
  SceneExtents m_extents;
  InputController m_input;
  SceneBuilder m_builder;
  AxisRenderer m_axisRenderer;
  PointCloudRenderOptions m_options;

  int m_width = 0;
  int m_height = 0;

  CanvasTextStyle m_labelStyle;
  CanvasTextStyle m_hintStyle;
  std::function<void()> m_redraw;
};
