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

#include <string>
#include <vector>

// Plain labelled point, used by the sample data and by callers that have no
// item type of their own.
struct PointItem {
  Point3D position;
  RGBColor color;
  std::string label; // Empty when the point has no label
};

// Adapter for PointItem collections. Extrema are computed by scanning the
// whole collection on every call.
class PointItemAdapter : public ItemAdapter<PointItem> {
public:
  Point3D GetItem(const std::vector<PointItem> &items,
                  size_t index) const override;
  RGBColor GetColor(const std::vector<PointItem> &items,
                    size_t index) const override;
  std::optional<std::string> GetLabel(const std::vector<PointItem> &items,
                                      size_t index) const override;
  Point3D GetMin(const std::vector<PointItem> &items) const override;
  Point3D GetMax(const std::vector<PointItem> &items) const override;
};
