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
#include "axisrenderer.h"

#include "pointcloudcamera.h"
#include "stringutils.h"

#include <limits>

namespace {
// Label offsets relative to the projected anchor, in pixels
constexpr int kOriginLabelDx = -20;
constexpr int kOriginLabelDy = 15;
constexpr int kEndLabelDx = -8;
constexpr int kEndLabelDy = 15;

std::optional<ScreenPoint> ProjectRelative(const Point3D &p,
                                           const Point3D &origin,
                                           const PointCloudCamera &camera,
                                           const ScreenPoint &center) {
  auto sr = camera.Project(p.x - origin.x, p.y - origin.y, p.z - origin.z,
                           center);
  if (!sr)
    return std::nullopt;
  return ScreenPoint{sr->x, sr->y};
}

// Offset of the axis name drawn at the middle of each axis line.
ScreenPoint NameOffset(char axis) {
  if (axis == 'Y')
    return {8, 4};
  return {-4, -8};
}

double Coordinate(const Point3D &p, int axis) {
  switch (axis) {
  case 0:
    return p.x;
  case 1:
    return p.y;
  default:
    return p.z;
  }
}

void SetCoordinate(Point3D &p, int axis, double value) {
  switch (axis) {
  case 0:
    p.x = value;
    break;
  case 1:
    p.y = value;
    break;
  default:
    p.z = value;
    break;
  }
}
} // namespace

AxisRenderer::AxisRenderer() {
  const CanvasColor lightGray{192.0f / 255.0f, 192.0f / 255.0f,
                              192.0f / 255.0f, 1.0f};
  m_stroke.color = lightGray;
  m_stroke.width = 1.5f;
  m_textStyle.fontFamily = "Sans";
  m_textStyle.fontSize = 12.0f;
  m_textStyle.color = lightGray;
}

std::array<Point3D, 8> AxisRenderer::BoxCorners(const BoundingExtrema &bounds) {
  std::array<Point3D, 8> corners;
  for (size_t i = 0; i < corners.size(); ++i) {
    corners[i].x = (i & 1) ? bounds.maxs.x : bounds.mins.x;
    corners[i].y = (i & 2) ? bounds.maxs.y : bounds.mins.y;
    corners[i].z = (i & 4) ? bounds.maxs.z : bounds.mins.z;
  }
  return corners;
}

std::optional<size_t>
AxisRenderer::FindFarCorner(const BoundingExtrema &bounds,
                            const PointCloudCamera &camera,
                            const ScreenPoint &center) {
  const auto corners = BoxCorners(bounds);
  std::optional<size_t> farIndex;
  double minDepth = std::numeric_limits<double>::infinity();
  for (size_t i = 0; i < corners.size(); ++i) {
    const Point3D &c = corners[i];
    auto sr = camera.Project(c.x - bounds.mids.x, c.y - bounds.mids.y,
                             c.z - bounds.mids.z, center);
    if (sr && sr->depth < minDepth) {
      minDepth = sr->depth;
      farIndex = i;
    }
  }
  return farIndex;
}

AxisOverlay AxisRenderer::Build(const BoundingExtrema &bounds,
                                const PointCloudCamera &camera,
                                const ScreenPoint &center) const {
  AxisOverlay overlay;
  auto farIndex = FindFarCorner(bounds, camera, center);
  if (!farIndex)
    return overlay;

  const Point3D farCorner = BoxCorners(bounds)[*farIndex];
  auto origin = ProjectRelative(farCorner, bounds.mids, camera, center);
  if (!origin)
    return overlay;

  overlay.visible = true;
  overlay.farCorner = farCorner;
  overlay.origin = *origin;
  overlay.originLabel = "(" + StringUtils::FormatGrouped(farCorner.x) + ", " +
                        StringUtils::FormatGrouped(farCorner.y) + ", " +
                        StringUtils::FormatGrouped(farCorner.z) + ")";

  static const char kNames[3] = {'X', 'Y', 'Z'};
  for (int axis = 0; axis < 3; ++axis) {
    AxisGuide &guide = overlay.axes[axis];
    guide.name = kNames[axis];

    double farValue = Coordinate(farCorner, axis);
    double flipped = farValue == Coordinate(bounds.mins, axis)
                         ? Coordinate(bounds.maxs, axis)
                         : Coordinate(bounds.mins, axis);

    guide.end = farCorner;
    SetCoordinate(guide.end, axis, flipped);
    Point3D midpoint = farCorner;
    SetCoordinate(midpoint, axis, (farValue + flipped) / 2);

    guide.endScreen = ProjectRelative(guide.end, bounds.mids, camera, center);
    guide.midScreen = ProjectRelative(midpoint, bounds.mids, camera, center);
    guide.endLabel = StringUtils::FormatGrouped(flipped);
  }
  return overlay;
}

void AxisRenderer::Draw(const AxisOverlay &overlay, ICanvas2D &canvas) const {
  if (!overlay.visible)
    return;

  // Offsets are added in float, projected points may sit at the int limits
  const float ox = static_cast<float>(overlay.origin.x);
  const float oy = static_cast<float>(overlay.origin.y);
  canvas.DrawText(ox + kOriginLabelDx, oy + kOriginLabelDy, overlay.originLabel,
                  m_textStyle);

  for (const auto &guide : overlay.axes) {
    if (!guide.endScreen)
      continue;
    const float ex = static_cast<float>(guide.endScreen->x);
    const float ey = static_cast<float>(guide.endScreen->y);
    canvas.DrawLine(ox, oy, ex, ey, m_stroke);
    canvas.DrawText(ex + kEndLabelDx, ey + kEndLabelDy, guide.endLabel,
                    m_textStyle);
    if (guide.midScreen) {
      ScreenPoint offset = NameOffset(guide.name);
      canvas.DrawText(static_cast<float>(guide.midScreen->x) + offset.x,
                      static_cast<float>(guide.midScreen->y) + offset.y,
                      std::string(1, guide.name), m_textStyle);
    }
  }
}
