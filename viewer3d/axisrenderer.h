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
 * File: axisrenderer.h
 * Author: Luisma Peramato
 * License: GNU General Public License v3.0
 * Description: Bounding box axes anchored at the corner farthest from the
 * viewer.
 */

#pragma once

#include "canvas2d.h"
#include "pointcloud_types.h"

#include <array>
#include <optional>
#include <string>

class PointCloudCamera;

// One axis line running from the far corner to the corner obtained by
// flipping a single coordinate between min and max.
struct AxisGuide {
  char name = 'X';
  Point3D end;
  std::optional<ScreenPoint> endScreen; // Absent when the end is not visible
  std::optional<ScreenPoint> midScreen;
  std::string endLabel;
};

// Screen space description of the axes for one frame.
struct AxisOverlay {
  bool visible = false;
  Point3D farCorner;
  ScreenPoint origin;
  std::string originLabel;
  std::array<AxisGuide, 3> axes;
};

class AxisRenderer {
public:
  AxisRenderer();

  // The 8 corners of the bounding box. Bit 0 selects max x, bit 1 max y and
  // bit 2 max z.
  static std::array<Point3D, 8> BoxCorners(const BoundingExtrema &bounds);

  // Index of the corner with the smallest depth after rotation, which is the
  // corner farthest from the viewer. The first corner wins ties. Returns
  // std::nullopt when no corner can be projected.
  static std::optional<size_t> FindFarCorner(const BoundingExtrema &bounds,
                                             const PointCloudCamera &camera,
                                             const ScreenPoint &center);

  AxisOverlay Build(const BoundingExtrema &bounds,
                    const PointCloudCamera &camera,
                    const ScreenPoint &center) const;

  void Draw(const AxisOverlay &overlay, ICanvas2D &canvas) const;

  const CanvasStroke &GetStroke() const { return m_stroke; }
  const CanvasTextStyle &GetTextStyle() const { return m_textStyle; }

private:
  CanvasStroke m_stroke;
  CanvasTextStyle m_textStyle;
};
