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

#include "point3d.h"

#include <optional>
#include <string>

// Integer position on the drawing surface.
struct ScreenPoint {
  int x = 0;
  int y = 0;
};

// Component-wise extrema of the current dataset. mids is the projection
// origin so data is centered regardless of its absolute coordinates.
struct BoundingExtrema {
  Point3D mins;
  Point3D maxs;
  Point3D mids;
};

// Rotation, scale and projection mode shared by input handling and rendering.
struct CameraState {
  double rotationX = 0.0; // Pitch in radians, unbounded
  double rotationY = 0.0; // Yaw in radians, unbounded
  double baseScale = 1.0; // Auto-fit factor
  double userZoom = 1.0;  // Wheel controlled, never below the minimum zoom
  bool perspective = false;

  double EffectiveScale() const { return baseScale * userZoom; }
};

// Result of projecting one model point. depth is the rotated z coordinate;
// smaller values are farther from the viewer.
struct ScreenResult {
  int x = 0;
  int y = 0;
  double depth = 0.0;
  double perspectiveFactor = 1.0;
};

// Drawable point built for a single frame.
struct ProjectedPoint {
  int screenX = 0;
  int screenY = 0;
  double depth = 0.0;
  int size = 0; // Dot diameter in pixels
  RGBColor color;
  std::optional<std::string> label;
};
