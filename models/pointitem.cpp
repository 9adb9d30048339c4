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
#include "pointitem.h"

#include <algorithm>

Point3D PointItemAdapter::GetItem(const std::vector<PointItem> &items,
                                  size_t index) const {
  return items[index].position;
}

RGBColor PointItemAdapter::GetColor(const std::vector<PointItem> &items,
                                    size_t index) const {
  return items[index].color;
}

std::optional<std::string>
PointItemAdapter::GetLabel(const std::vector<PointItem> &items,
                           size_t index) const {
  const std::string &label = items[index].label;
  if (label.empty())
    return std::nullopt;
  return label;
}

Point3D PointItemAdapter::GetMin(const std::vector<PointItem> &items) const {
  if (items.empty())
    return {};
  Point3D result = items.front().position;
  for (const auto &item : items) {
    result.x = std::min(result.x, item.position.x);
    result.y = std::min(result.y, item.position.y);
    result.z = std::min(result.z, item.position.z);
  }
  return result;
}

Point3D PointItemAdapter::GetMax(const std::vector<PointItem> &items) const {
  if (items.empty())
    return {};
  Point3D result = items.front().position;
  for (const auto &item : items) {
    result.x = std::max(result.x, item.position.x);
    result.y = std::max(result.y, item.position.y);
    result.z = std::max(result.z, item.position.z);
  }
  return result;
}
