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
#include "logger.h"
#include "pointcloudcontroller.h"
#include "pointitem.h"
#include "sampledata.h"

#include <climits>
#include <cmath>
#include <iostream>
#include <type_traits>
#include <utility>

namespace {
const TextCommand *FindText(const std::vector<TextCommand> &texts,
                            const std::string &text) {
  for (const auto &cmd : texts) {
    if (cmd.text == text)
      return &cmd;
  }
  return nullptr;
}

bool Near(float a, float b, float eps = 1e-5f) { return std::fabs(a - b) <= eps; }

template <typename Items, typename Adapter, typename = void>
struct CanBind : std::false_type {};
template <typename Items, typename Adapter>
struct CanBind<Items, Adapter,
               std::void_t<decltype(std::declval<PointCloudController &>()
                                        .SetDataset(std::declval<Items>(),
                                                    std::declval<Adapter>()))>>
    : std::true_type {};

template <typename Items, typename Adapter, typename = void>
struct CanWrap : std::false_type {};
template <typename Items, typename Adapter>
struct CanWrap<Items, Adapter,
               std::void_t<decltype(MakeDataset(std::declval<Items>(),
                                                std::declval<Adapter>()))>>
    : std::true_type {};

using Items = std::vector<PointItem>;

// Only collections and adapters that outlive the binding are accepted
static_assert(CanBind<Items &, const PointItemAdapter &>::value,
              "lvalue dataset must bind");
static_assert(CanBind<const Items &, PointItemAdapter &>::value,
              "const lvalue dataset must bind");
static_assert(!CanBind<Items, const PointItemAdapter &>::value,
              "temporary collection must be rejected");
static_assert(!CanBind<const Items &, PointItemAdapter>::value,
              "temporary adapter must be rejected");
static_assert(!CanBind<Items, PointItemAdapter>::value,
              "temporary collection and adapter must be rejected");
static_assert(CanWrap<Items &, const PointItemAdapter &>::value,
              "lvalue dataset must wrap");
static_assert(!CanWrap<Items, const PointItemAdapter &>::value,
              "temporary collection must not wrap");
static_assert(!CanWrap<const Items &, PointItemAdapter>::value,
              "temporary adapter must not wrap");
}

int main() {
  Logger::Instance().SetEchoToStderr(false);

  PointItemAdapter adapter;
  int redraws = 0;
  PointCloudController controller;
  controller.SetRedrawCallback([&redraws]() { ++redraws; });

  controller.Resize(800, 600);
  if (redraws != 1) {
    std::cerr << "Resize must request a redraw\n";
    return 1;
  }

  CommandBuffer buffer;
  auto canvas = CreateRecordingCanvas(buffer);

  // Empty viewer shows the placeholder and no HUD
  controller.RenderFrame(*canvas);
  {
    auto texts = buffer.CommandsOfType<TextCommand>();
    const TextCommand *placeholder =
        FindText(texts, PointCloudController::kEmptyMessage);
    if (!placeholder || placeholder->x != 350.0f || placeholder->y != 300.0f) {
      std::cerr << "Placeholder text missing or misplaced\n";
      return 1;
    }
    if (FindText(texts, PointCloudController::kControlsHint) ||
        !buffer.CommandsOfType<CircleCommand>().empty()) {
      std::cerr << "Empty viewer must not draw points or HUD\n";
      return 1;
    }
    auto aa = buffer.CommandsOfType<AntialiasCommand>();
    if (aa.size() != 1 || !aa[0].enabled ||
        !std::holds_alternative<AntialiasCommand>(buffer.commands.front())) {
      std::cerr << "Frame must start by enabling antialiasing\n";
      return 1;
    }
  }

  auto single = SampleData::MakeSinglePoint();
  controller.SetDataset(single, adapter);
  if (redraws != 2 || controller.GetItemCount() != 1 ||
      controller.GetCamera().GetBaseScale() != 50.0) {
    std::cerr << "SetDataset must refresh extents and redraw\n";
    return 1;
  }

  controller.RenderFrame(*canvas);
  {
    if (buffer.frameCount != 2) {
      std::cerr << "Each frame must restart the recording\n";
      return 1;
    }
    auto circles = buffer.CommandsOfType<CircleCommand>();
    if (circles.size() != 1) {
      std::cerr << "Expected one point\n";
      return 1;
    }
    const CircleCommand &dot = circles[0];
    if (dot.cx != 400.0f || dot.cy != 300.0f || dot.radius != 3.0f ||
        !dot.hasFill || dot.stroke.width != 0.0f ||
        !Near(dot.fill.color.g, 160.0f / 255.0f)) {
      std::cerr << "Point circle mismatch\n";
      return 1;
    }

    auto texts = buffer.CommandsOfType<TextCommand>();
    const TextCommand *label = FindText(texts, "Only point");
    if (!label || label->x != 406.0f || label->y != 294.0f ||
        !Near(label->style.color.b, 0.0f)) {
      std::cerr << "Point label mismatch\n";
      return 1;
    }

    const TextCommand *rotation =
        FindText(texts, "Rotation (Pitch/Yaw): 30.0\xC2\xB0, 45.0\xC2\xB0");
    const TextCommand *zoom = FindText(texts, "Zoom: 1.00x");
    const TextCommand *projection =
        FindText(texts, "Projection: Orthographic (D=30.0)");
    const TextCommand *hint =
        FindText(texts, PointCloudController::kControlsHint);
    if (!rotation || !zoom || !projection || !hint) {
      std::cerr << "HUD lines missing\n";
      return 1;
    }
    if (rotation->x != 10.0f || rotation->y != 20.0f || zoom->y != 40.0f ||
        projection->y != 60.0f || hint->x != 10.0f || hint->y != 590.0f ||
        !hint->style.bold) {
      std::cerr << "HUD placement mismatch\n";
      return 1;
    }
    if (FindText(texts, PointCloudController::kEmptyMessage)) {
      std::cerr << "Placeholder must not be drawn with data\n";
      return 1;
    }
  }

  controller.OnWheel(1.0);
  controller.OnDrag(20, 20);
  if (redraws != 3) {
    std::cerr << "Wheel redraws, a drag without press does not\n";
    return 1;
  }
  controller.OnPress(0, 0);
  controller.OnDrag(10, 0);
  controller.OnRelease();
  controller.TogglePerspective();
  if (redraws != 5 || !controller.IsPerspectiveEnabled()) {
    std::cerr << "Drag and toggle must redraw\n";
    return 1;
  }
  {
    auto lines = controller.BuildHudLines();
    if (lines.size() != 3 || lines[1] != "Zoom: 0.90x" ||
        lines[2] != "Projection: Perspective (D=30.0)" ||
        lines[0] != "Rotation (Pitch/Yaw): 30.0\xC2\xB0, 50.7\xC2\xB0") {
      std::cerr << "HUD text after input mismatch\n";
      return 1;
    }
  }

  controller.ResetView();
  if (redraws != 6 || controller.GetCamera().GetUserZoom() != 1.0 ||
      !controller.IsPerspectiveEnabled()) {
    std::cerr << "Reset view must keep the projection mode\n";
    return 1;
  }

  PointCloudRenderOptions options;
  options.showAxes = false;
  options.showHud = false;
  controller.SetRenderOptions(options);
  controller.RenderFrame(*canvas);
  {
    auto texts = buffer.CommandsOfType<TextCommand>();
    if (!buffer.CommandsOfType<LineCommand>().empty() || texts.size() != 1 ||
        texts[0].text != "Only point") {
      std::cerr << "Disabled axes and HUD must not be drawn\n";
      return 1;
    }
  }

  {
    // Back to front ordering of the drawn circles
    PointCloudController ordered;
    ordered.Resize(400, 400);
    ordered.GetCamera().SetOrientation(0.0, 0.0);
    ordered.SetRenderOptions(options);

    std::vector<PointItem> items(3);
    items[0].position = Point3D(0, 0, 1);
    items[0].color = RGBColor(255, 0, 0);
    items[1].position = Point3D(0, 0, -1);
    items[1].color = RGBColor(0, 255, 0);
    items[2].position = Point3D(0, 0, 0);
    items[2].color = RGBColor(0, 0, 255);
    ordered.SetDataset(items, adapter);
    ordered.RenderFrame(*canvas);

    auto circles = buffer.CommandsOfType<CircleCommand>();
    if (circles.size() != 3 || circles[0].fill.color.g != 1.0f ||
        circles[1].fill.color.b != 1.0f || circles[2].fill.color.r != 1.0f) {
      std::cerr << "Circles must be drawn farthest first\n";
      return 1;
    }

    // In-place edit followed by a change notification
    items.pop_back();
    ordered.DatasetChanged();
    ordered.RenderFrame(*canvas);
    if (ordered.GetLastFramePoints().size() != 2) {
      std::cerr << "DatasetChanged must pick up in-place edits\n";
      return 1;
    }

    ordered.ClearDataset();
    ordered.RenderFrame(*canvas);
    if (ordered.HasData() || !ordered.GetLastFramePoints().empty() ||
        !FindText(buffer.CommandsOfType<TextCommand>(),
                  PointCloudController::kEmptyMessage)) {
      std::cerr << "Cleared viewer must show the placeholder\n";
      return 1;
    }
  }

  {
    // HUD numbers round ties away from zero
    PointCloudController hud;
    hud.GetCamera().SetUserZoom(0.125);
    auto lines = hud.BuildHudLines();
    if (lines.size() != 3 || lines[1] != "Zoom: 0.13x") {
      std::cerr << "HUD zoom must round half-up\n";
      return 1;
    }
  }

  {
    // Deep wheel zoom pushes both points far outside the int range
    PointCloudController zoomed;
    zoomed.Resize(800, 600);
    zoomed.GetCamera().SetOrientation(0.0, 0.0);

    std::vector<PointItem> items(2);
    items[0].position = Point3D(0, 0, 0);
    items[0].label = "left";
    items[1].position = Point3D(10, 0, 0);
    items[1].label = "right";
    zoomed.SetDataset(items, adapter);
    for (int i = 0; i < 200; ++i)
      zoomed.OnWheel(-1.0);
    zoomed.RenderFrame(*canvas);

    const auto &points = zoomed.GetLastFramePoints();
    if (points.size() != 2 || points[0].screenX != INT_MIN ||
        points[1].screenX != INT_MAX || points[0].screenY != 300 ||
        points[1].screenY != 300) {
      std::cerr << "Zoomed points must saturate to their own side\n";
      return 1;
    }
    auto circles = buffer.CommandsOfType<CircleCommand>();
    const TextCommand *rightLabel =
        FindText(buffer.CommandsOfType<TextCommand>(), "right");
    if (circles.size() != 2 || !(circles[0].cx < 0.0f) ||
        !(circles[1].cx > 0.0f) || !rightLabel || !(rightLabel->x > 0.0f)) {
      std::cerr << "Zoomed circles must be drawn on their own side\n";
      return 1;
    }
  }

  return 0;
}
