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
 * File: scenebuilder.h
 * Author: Luisma Peramato
 * License: GNU General Public License v3.0
 * Description: Projects dataset items into depth ordered screen points.
 */

#pragma once

#include "itemadapter.h"
#include "pointcloud_types.h"

#include <vector>

class PointCloudCamera;

// Builds the list of drawable points for one frame. The point buffer is kept
// between frames so its capacity is reused; its contents are replaced on
// every Build call.
class SceneBuilder {
public:
  static constexpr int kBaseDotSize = 6;
  static constexpr int kMinDotSize = 2;
  static constexpr int kMaxDotSize = 15;

  // Projects every item of the dataset relative to origin. Items that cannot
  // be projected (behind the eye in perspective mode) are skipped. The result
  // is sorted back to front.
  const std::vector<ProjectedPoint> &Build(const IDataset &dataset,
                                           const Point3D &origin,
                                           const PointCloudCamera &camera,
                                           const ScreenPoint &center);

  const std::vector<ProjectedPoint> &GetPoints() const { return m_points; }
  void Clear() { m_points.clear(); }

  // Dot diameter for a perspective factor, truncated then clamped.
  static int DotSizeForFactor(double factor);

  // Painter's algorithm order: ascending depth so nearer points are drawn
  // last. Stable, items at equal depth keep their dataset order.
  static void SortByDepth(std::vector<ProjectedPoint> &points);

private:
  std::vector<ProjectedPoint> m_points;
};
