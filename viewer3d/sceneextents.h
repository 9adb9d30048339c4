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

#include "itemadapter.h"
#include "pointcloud_types.h"

#include <cstddef>

namespace extents {
// Base scale used while there is no data or the viewport has no area
inline constexpr double kDefaultScale = 1.0;
// Base scale for point clouds without volume (a single point, duplicates)
inline constexpr double kDegenerateScale = 50.0;
inline constexpr double kDegenerateRange = 1e-9;
// Share of the smaller viewport side the largest data range should cover
inline constexpr double kFitFraction = 0.80;

double ComputeBaseScale(const BoundingExtrema &bounds, bool hasData,
                        int viewportWidth, int viewportHeight);
} // namespace extents

// Keeps the bounding box of the current dataset. Must be refreshed on every
// dataset change; the base scale must additionally be recomputed on every
// viewport resize.
class SceneExtents {
public:
  // Reads the extrema from the dataset. A null or empty dataset collapses the
  // box to the origin.
  void Update(const IDataset *dataset);

  double ComputeBaseScale(int viewportWidth, int viewportHeight) const {
    return extents::ComputeBaseScale(m_bounds, m_itemCount > 0, viewportWidth,
                                     viewportHeight);
  }

  const BoundingExtrema &GetBounds() const { return m_bounds; }
  size_t GetItemCount() const { return m_itemCount; }
  bool HasData() const { return m_itemCount > 0; }

  // Largest per-axis range of the bounding box.
  double MaxRange() const;

private:
  BoundingExtrema m_bounds;
  size_t m_itemCount = 0;
};
