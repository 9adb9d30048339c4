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

#include <cstdint>

// Position of an item in model space. Double precision is required by the
// projection math so large coordinates survive the midpoint subtraction.
struct Point3D {
  double x = 0.0;
  double y = 0.0;
  double z = 0.0;

  constexpr Point3D() = default;
  constexpr Point3D(double px, double py, double pz) : x(px), y(py), z(pz) {}

  bool operator==(const Point3D &other) const {
    return x == other.x && y == other.y && z == other.z;
  }
  bool operator!=(const Point3D &other) const { return !(*this == other); }
};

// 8-bit color reported by item adapters.
struct RGBColor {
  uint8_t r = 255;
  uint8_t g = 255;
  uint8_t b = 255;
  uint8_t a = 255;

  constexpr RGBColor() = default;
  constexpr RGBColor(uint8_t red, uint8_t green, uint8_t blue,
                     uint8_t alpha = 255)
      : r(red), g(green), b(blue), a(alpha) {}
};
