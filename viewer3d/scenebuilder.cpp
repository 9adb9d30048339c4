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
#include "scenebuilder.h"

#include "pointcloudcamera.h"

#include <algorithm>
#include <utility>

const std::vector<ProjectedPoint> &
SceneBuilder::Build(const IDataset &dataset, const Point3D &origin,
                    const PointCloudCamera &camera, const ScreenPoint &center) {
  m_points.clear();
  const size_t count = dataset.Size();
  m_points.reserve(count);

  for (size_t i = 0; i < count; ++i) {
    Point3D p = dataset.GetItem(i);
    auto sr = camera.Project(p.x - origin.x, p.y - origin.y, p.z - origin.z,
                             center);
    if (!sr)
      continue;

    ProjectedPoint pp;
    pp.screenX = sr->x;
    pp.screenY = sr->y;
    pp.depth = sr->depth;
    pp.size = DotSizeForFactor(sr->perspectiveFactor);
    pp.color = dataset.GetColor(i);
    pp.label = dataset.GetLabel(i);
    m_points.push_back(std::move(pp));
  }

  SortByDepth(m_points);
  return m_points;
}

int SceneBuilder::DotSizeForFactor(double factor) {
  int size = static_cast<int>(kBaseDotSize * factor);
  return std::max(kMinDotSize, std::min(kMaxDotSize, size));
}

void SceneBuilder::SortByDepth(std::vector<ProjectedPoint> &points) {
  std::stable_sort(points.begin(), points.end(),
                   [](const ProjectedPoint &a, const ProjectedPoint &b) {
                     return a.depth < b.depth;
                   });
}
