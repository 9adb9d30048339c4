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
 * File: pointcloudpanel.cpp
 * Author: Luisma Peramato
 * License: GNU General Public License v3.0
 * Description: Implementation of the point cloud panel.
 */

#include "pointcloudpanel.h"

#include "configmanager.h"
#include <algorithm>
#include <cmath>
#include <memory>
#include <wx/dcbuffer.h>
#include <wx/graphics.h>

wxDEFINE_EVENT(EVT_POINTCLOUD_VIEW_CHANGED, wxCommandEvent);

namespace {
wxColour ToWxColor(const CanvasColor &color) {
  auto clamp = [](float v) {
    return static_cast<unsigned char>(std::clamp(v, 0.0f, 1.0f) * 255.0f);
  };
  return wxColour(clamp(color.r), clamp(color.g), clamp(color.b),
                  clamp(color.a));
}

// Paints canvas commands with a wxGraphicsContext.
class WxGraphicsCanvas : public ICanvas2D {
public:
  explicit WxGraphicsCanvas(wxGraphicsContext &gc) : gc_(gc) {}

  void BeginFrame() override {}
  void EndFrame() override { gc_.Flush(); }

  void SetAntialias(bool enabled) override {
    gc_.SetAntialiasMode(enabled ? wxANTIALIAS_DEFAULT : wxANTIALIAS_NONE);
  }

  void DrawLine(float x0, float y0, float x1, float y1,
                const CanvasStroke &stroke) override {
    ApplyPen(stroke);
    gc_.StrokeLine(x0, y0, x1, y1);
  }

  void DrawCircle(float cx, float cy, float radius, const CanvasStroke &stroke,
                  const CanvasFill *fill) override {
    if (fill)
      gc_.SetBrush(wxBrush(ToWxColor(fill->color)));
    else
      gc_.SetBrush(*wxTRANSPARENT_BRUSH);
    ApplyPen(stroke);
    gc_.DrawEllipse(cx - radius, cy - radius, radius * 2.0, radius * 2.0);
  }

  void DrawText(float x, float y, const std::string &text,
                const CanvasTextStyle &style) override {
    int pixelSize = std::max(1, static_cast<int>(std::lround(style.fontSize)));
    wxFontInfo fontInfo(pixelSize);
    if (!style.fontFamily.empty())
      fontInfo.FaceName(wxString::FromUTF8(style.fontFamily));
    fontInfo.Bold(style.bold);
    wxFont font(fontInfo);
    gc_.SetFont(font, ToWxColor(style.color));

    // Callers pass the baseline, wxGraphicsContext expects the top edge
    wxString label = wxString::FromUTF8(text);
    double w = 0.0;
    double h = 0.0;
    double descent = 0.0;
    double externalLeading = 0.0;
    gc_.GetTextExtent(label, &w, &h, &descent, &externalLeading);
    gc_.DrawText(label, x, y - (h - descent));
  }

private:
  void ApplyPen(const CanvasStroke &stroke) {
    if (stroke.width <= 0.0f) {
      gc_.SetPen(*wxTRANSPARENT_PEN);
      return;
    }
    wxPen pen(ToWxColor(stroke.color),
              std::max(1, static_cast<int>(std::lround(stroke.width))));
    gc_.SetPen(pen);
  }

  wxGraphicsContext &gc_;
};
} // namespace

wxBEGIN_EVENT_TABLE(PointCloudPanel, wxPanel)
    EVT_PAINT(PointCloudPanel::OnPaint)
    EVT_SIZE(PointCloudPanel::OnResize)
    EVT_LEFT_DOWN(PointCloudPanel::OnMouseDown)
    EVT_LEFT_UP(PointCloudPanel::OnMouseUp)
    EVT_MOTION(PointCloudPanel::OnMouseMove)
    EVT_MOUSEWHEEL(PointCloudPanel::OnMouseWheel)
    EVT_MOUSE_CAPTURE_LOST(PointCloudPanel::OnCaptureLost)
    EVT_KEY_DOWN(PointCloudPanel::OnKeyDown)
    EVT_ENTER_WINDOW(PointCloudPanel::OnMouseEnter)
wxEND_EVENT_TABLE()

PointCloudPanel::PointCloudPanel(wxWindow *parent)
    : wxPanel(parent, wxID_ANY, wxDefaultPosition, wxDefaultSize,
              wxFULL_REPAINT_ON_RESIZE | wxWANTS_CHARS) {
  SetBackgroundStyle(wxBG_STYLE_PAINT);
  m_controller.SetRedrawCallback([this]() { Refresh(); });
  LoadOptionsFromConfig();
}

void PointCloudPanel::ClearDataset() {
  m_controller.ClearDataset();
  NotifyViewChanged();
}

void PointCloudPanel::DatasetChanged() {
  m_controller.DatasetChanged();
  NotifyViewChanged();
}

void PointCloudPanel::TogglePerspective() {
  m_controller.TogglePerspective();
  NotifyViewChanged();
}

void PointCloudPanel::ResetView() {
  m_controller.ResetView();
  NotifyViewChanged();
}

void PointCloudPanel::SetShowAxes(bool show) {
  PointCloudRenderOptions options = m_controller.GetRenderOptions();
  options.showAxes = show;
  m_controller.SetRenderOptions(options);
}

void PointCloudPanel::SetShowHud(bool show) {
  PointCloudRenderOptions options = m_controller.GetRenderOptions();
  options.showHud = show;
  m_controller.SetRenderOptions(options);
}

void PointCloudPanel::LoadOptionsFromConfig() {
  ConfigManager &cfg = ConfigManager::Get();
  PointCloudRenderOptions options;
  options.showAxes = cfg.GetBool("viewer_show_axes");
  options.showHud = cfg.GetBool("viewer_show_hud");
  m_controller.SetRenderOptions(options);
  m_controller.GetCamera().SetPerspective(
      cfg.GetBool("viewer_start_perspective"));

  auto channel = [&cfg](const char *name) {
    return static_cast<unsigned char>(cfg.GetFloat(name) * 255.0f);
  };
  SetBackgroundColour(wxColour(channel("viewer_background_r"),
                               channel("viewer_background_g"),
                               channel("viewer_background_b")));
  Refresh();
}

void PointCloudPanel::NotifyViewChanged() {
  wxCommandEvent evt(EVT_POINTCLOUD_VIEW_CHANGED, GetId());
  evt.SetEventObject(this);
  evt.SetInt(m_controller.IsPerspectiveEnabled() ? 1 : 0);
  ProcessWindowEvent(evt);
}

void PointCloudPanel::OnPaint(wxPaintEvent &WXUNUSED(event)) {
  wxAutoBufferedPaintDC dc(this);
  dc.SetBackground(wxBrush(GetBackgroundColour()));
  dc.Clear();

  std::unique_ptr<wxGraphicsContext> gc(wxGraphicsContext::Create(dc));
  if (!gc)
    return;

  WxGraphicsCanvas canvas(*gc);
  m_controller.RenderFrame(canvas);
}

void PointCloudPanel::OnResize(wxSizeEvent &event) {
  wxSize size = GetClientSize();
  m_controller.Resize(size.GetWidth(), size.GetHeight());
  event.Skip();
}

void PointCloudPanel::OnMouseDown(wxMouseEvent &event) {
  SetFocus();
  if (!HasCapture())
    CaptureMouse();
  m_controller.OnPress(event.GetX(), event.GetY());
}

void PointCloudPanel::OnMouseUp(wxMouseEvent &WXUNUSED(event)) {
  m_controller.OnRelease();
  if (HasCapture())
    ReleaseMouse();
}

void PointCloudPanel::OnMouseMove(wxMouseEvent &event) {
  if (event.Dragging() && event.LeftIsDown())
    m_controller.OnDrag(event.GetX(), event.GetY());
}

void PointCloudPanel::OnMouseWheel(wxMouseEvent &event) {
  int rotation = event.GetWheelRotation();
  int deltaWheel = event.GetWheelDelta();
  if (deltaWheel == 0)
    return;
  // wx reports positive rotation when scrolling up; positive notches zoom out
  double notches =
      -static_cast<double>(rotation) / static_cast<double>(deltaWheel);
  m_controller.OnWheel(notches);
}

void PointCloudPanel::OnCaptureLost(wxMouseCaptureLostEvent &WXUNUSED(event)) {
  m_controller.OnRelease();
}

void PointCloudPanel::OnKeyDown(wxKeyEvent &event) {
  switch (event.GetKeyCode()) {
  case 'P':
    TogglePerspective();
    break;
  case 'R':
    ResetView();
    break;
  default:
    event.Skip();
    return;
  }
}

void PointCloudPanel::OnMouseEnter(wxMouseEvent &event) {
  SetFocus();
  event.Skip();
}
