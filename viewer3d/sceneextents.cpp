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
#include "sceneextents.h"

#include <algorithm>

namespace {
double RangeOf(const BoundingExtrema &bounds) {
  double rangeX = bounds.maxs.x - bounds.mins.x;
  double rangeY = bounds.maxs.y - bounds.mins.y;
  double rangeZ = bounds.maxs.z - bounds.mins.z;
  return std::max(rangeX, std::max(rangeY, rangeZ));
}
} // namespace

namespace extents {
double ComputeBaseScale(const BoundingExtrema &bounds, bool hasData,
                        int viewportWidth, int viewportHeight) {
  if (viewportWidth == 0 || viewportHeight == 0 || !hasData)
    return kDefaultScale;

  double maxRange = RangeOf(bounds);
  if (maxRange < kDegenerateRange)
    return kDegenerateScale;

  double target = std::min(viewportWidth, viewportHeight) * kFitFraction;
  return target / maxRange;
}
} // namespace extents

void SceneExtents::Update(const IDataset *dataset) {
  if (dataset && !dataset->Empty()) {
    m_itemCount = dataset->Size();
    m_bounds.mins = dataset->GetMin();
    m_bounds.maxs = dataset->GetMax();
  } else {
    m_itemCount = 0;
    m_bounds.mins = Point3D(0, 0, 0);
    m_bounds.maxs = Point3D(0, 0, 0);
  }

  m_bounds.mids.x = (m_bounds.mins.x + m_bounds.maxs.x) / 2.0;
  m_bounds.mids.y = (m_bounds.mins.y + m_bounds.maxs.y) / 2.0;
  m_bounds.mids.z = (m_bounds.mins.z + m_bounds.maxs.z) / 2.0;
}

double SceneExtents::MaxRange() const { return RangeOf(m_bounds); }
