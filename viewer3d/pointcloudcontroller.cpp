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
 * File: pointcloudcontroller.cpp
 * Author: Luisma Peramato
 * License: GNU General Public License v3.0
 * Description: Implementation of the point cloud viewer controller.
 */

#include "pointcloudcontroller.h"

#include "logger.h"
#include "stringutils.h"

#include <sstream>

namespace {
constexpr double kRadToDeg = 180.0 / 3.14159265358979323846;
constexpr CanvasColor kWhite{1.0f, 1.0f, 1.0f, 1.0f};

// HUD layout in pixels
constexpr int kHudLeft = 10;
constexpr int kHudFirstLine = 20;
constexpr int kHudLineSpacing = 20;
constexpr int kHintBottomMargin = 10;
constexpr int kEmptyMessageHalfWidth = 50;

CanvasColor ToCanvasColor(const RGBColor &c) {
  return {c.r / 255.0f, c.g / 255.0f, c.b / 255.0f, c.a / 255.0f};
}
} // namespace

PointCloudController::PointCloudController() {
  m_labelStyle.fontFamily = "Sans";
  m_labelStyle.fontSize = 12.0f;
  m_labelStyle.color = kWhite;

  m_hintStyle.fontFamily = "Arial";
  m_hintStyle.fontSize = 12.0f;
  m_hintStyle.bold = true;
  m_hintStyle.color = kWhite;
}

void PointCloudController::ClearDataset() {
  m_dataset.reset();
  DatasetChanged();
}

void PointCloudController::DatasetChanged() {
  m_extents.Update(m_dataset.get());
  UpdateBaseScale();

  std::ostringstream msg;
  msg << "Dataset changed: " << m_extents.GetItemCount() << " items";
  if (m_extents.HasData()) {
    msg << ", max range " << m_extents.MaxRange() << ", base scale "
        << m_camera.GetBaseScale();
  }
  Logger::Instance().Log(msg.str());
  RequestRedraw();
}

void PointCloudController::TogglePerspective() {
  if (m_input.OnTogglePerspective(m_camera))
    RequestRedraw();
}

void PointCloudController::ResetView() {
  m_camera.Reset();
  RequestRedraw();
}

void PointCloudController::Resize(int width, int height) {
  m_width = width;
  m_height = height;
  UpdateBaseScale();
  RequestRedraw();
}

void PointCloudController::OnPress(int x, int y) { m_input.OnPress(x, y); }

void PointCloudController::OnRelease() { m_input.OnRelease(); }

void PointCloudController::OnDrag(int x, int y) {
  if (m_input.OnDrag(x, y, m_camera))
    RequestRedraw();
}

void PointCloudController::OnWheel(double notches) {
  if (m_input.OnWheel(notches, m_camera))
    RequestRedraw();
}

void PointCloudController::SetRenderOptions(
    const PointCloudRenderOptions &options) {
  m_options = options;
  RequestRedraw();
}

void PointCloudController::UpdateBaseScale() {
  m_camera.SetBaseScale(m_extents.ComputeBaseScale(m_width, m_height));
}

void PointCloudController::RequestRedraw() {
  if (m_redraw)
    m_redraw();
}

void PointCloudController::RenderFrame(ICanvas2D &canvas) {
  canvas.BeginFrame();
  canvas.SetAntialias(true);

  const ScreenPoint center = GetCenter();

  // Axes first so they stay behind the data
  if (m_options.showAxes) {
    AxisOverlay overlay =
        m_axisRenderer.Build(m_extents.GetBounds(), m_camera, center);
    m_axisRenderer.Draw(overlay, canvas);
  }

  if (!HasData()) {
    m_builder.Clear();
    canvas.DrawText(static_cast<float>(m_width / 2 - kEmptyMessageHalfWidth),
                    static_cast<float>(m_height / 2), kEmptyMessage,
                    m_labelStyle);
    canvas.EndFrame();
    return;
  }

  const auto &points = m_builder.Build(*m_dataset, m_extents.GetBounds().mids,
                                       m_camera, center);
  DrawPoints(canvas, points);

  if (m_options.showHud)
    DrawHud(canvas);

  canvas.EndFrame();
}

void PointCloudController::DrawPoints(
    ICanvas2D &canvas, const std::vector<ProjectedPoint> &points) {
  CanvasStroke noOutline;
  noOutline.width = 0.0f;

  for (const auto &pp : points) {
    CanvasColor color = ToCanvasColor(pp.color);
    noOutline.color = color;
    CanvasFill fill{color};

    // Same pixel box as an oval filled at (x - size/2, y - size/2)
    // Offsets in float so saturated screen coordinates cannot overflow
    float radius = pp.size * 0.5f;
    float left = static_cast<float>(pp.screenX) - pp.size / 2;
    float top = static_cast<float>(pp.screenY) - pp.size / 2;
    canvas.DrawCircle(left + radius, top + radius, radius, noOutline, &fill);

    if (pp.label && !StringUtils::IsBlank(*pp.label)) {
      CanvasTextStyle style = m_labelStyle;
      style.color = color;
      canvas.DrawText(static_cast<float>(pp.screenX) + pp.size,
                      static_cast<float>(pp.screenY) - pp.size, *pp.label,
                      style);
    }
  }
}

std::vector<std::string> PointCloudController::BuildHudLines() const {
  using StringUtils::FormatFixedHalfUp;
  const std::string degree = "\xC2\xB0";
  std::vector<std::string> lines;
  lines.push_back("Rotation (Pitch/Yaw): " +
                  FormatFixedHalfUp(m_camera.GetPitch() * kRadToDeg, 1) +
                  degree + ", " +
                  FormatFixedHalfUp(m_camera.GetYaw() * kRadToDeg, 1) + degree);
  lines.push_back("Zoom: " + FormatFixedHalfUp(m_camera.GetUserZoom(), 2) + "x");
  lines.push_back(
      std::string("Projection: ") +
      (m_camera.IsPerspectiveEnabled() ? "Perspective" : "Orthographic") +
      " (D=" + FormatFixedHalfUp(PointCloudCamera::kViewerDistance, 1) + ")");
  return lines;
}

void PointCloudController::DrawHud(ICanvas2D &canvas) {
  const auto lines = BuildHudLines();
  int y = kHudFirstLine;
  for (const auto &line : lines) {
    canvas.DrawText(static_cast<float>(kHudLeft), static_cast<float>(y), line,
                    m_labelStyle);
    y += kHudLineSpacing;
  }
  canvas.DrawText(static_cast<float>(kHudLeft),
                  static_cast<float>(m_height - kHintBottomMargin),
                  kControlsHint, m_hintStyle);
}
