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
#include "pointcloudcamera.h"

#include <climits>
#include <cmath>
#include <iostream>

namespace {
bool Near(double a, double b, double eps = 1e-9) { return std::fabs(a - b) <= eps; }
}

int main() {
  const ScreenPoint center{100, 100};

  {
    PointCloudCamera camera;
    if (!Near(camera.GetPitch(), PointCloudCamera::kInitialPitch) ||
        !Near(camera.GetYaw(), PointCloudCamera::kInitialYaw) ||
        !Near(camera.GetUserZoom(), 1.0) || camera.IsPerspectiveEnabled()) {
      std::cerr << "Unexpected initial camera state\n";
      return 1;
    }
  }

  {
    PointCloudCamera camera;
    camera.SetOrientation(0.0, 0.0);
    camera.SetBaseScale(1.0);
    auto sr = camera.Project(5.0, 3.0, 0.0, center);
    if (!sr || sr->x != 105 || sr->y != 97 || !Near(sr->depth, 0.0) ||
        !Near(sr->perspectiveFactor, 1.0)) {
      std::cerr << "Orthographic projection mismatch\n";
      return 1;
    }

    // Negative results truncate toward zero
    camera.SetBaseScale(0.5);
    sr = camera.Project(-3.0, 0.0, 0.0, ScreenPoint{0, 0});
    if (!sr || sr->x != -1) {
      std::cerr << "Screen coordinates must truncate toward zero\n";
      return 1;
    }
  }

  {
    // Quarter turn of yaw moves +X into -depth
    PointCloudCamera camera;
    camera.SetOrientation(0.0, 3.14159265358979323846 / 2.0);
    auto sr = camera.Project(1.0, 0.0, 0.0, center);
    if (!sr || !Near(sr->depth, -1.0)) {
      std::cerr << "Yaw rotation depth mismatch\n";
      return 1;
    }
  }

  {
    PointCloudCamera camera;
    camera.SetOrientation(0.0, 0.0);
    camera.SetPerspective(true);

    auto sr = camera.Project(2.0, 0.0, 10.0, center);
    if (!sr || !Near(sr->perspectiveFactor, 1.5) || sr->x != 103) {
      std::cerr << "Perspective factor mismatch\n";
      return 1;
    }

    if (camera.Project(0.0, 0.0, 29.95, center)) {
      std::cerr << "Point at the eye plane must not be projected\n";
      return 1;
    }
    if (camera.Project(0.0, 0.0, 45.0, center)) {
      std::cerr << "Point behind the eye must not be projected\n";
      return 1;
    }

    // Same point is fine once perspective is off again
    camera.TogglePerspective();
    if (!camera.Project(0.0, 0.0, 45.0, center)) {
      std::cerr << "Orthographic projection must accept every point\n";
      return 1;
    }
  }

  {
    PointCloudCamera camera;
    camera.Zoom(1.0);
    if (!Near(camera.GetUserZoom(), 0.9)) {
      std::cerr << "Zoom out step mismatch\n";
      return 1;
    }
    camera.Zoom(-1.0);
    if (!Near(camera.GetUserZoom(), 0.99)) {
      std::cerr << "Zoom in step mismatch\n";
      return 1;
    }
    camera.Zoom(20.0);
    if (!Near(camera.GetUserZoom(), PointCloudCamera::kMinUserZoom)) {
      std::cerr << "User zoom must be clamped to the minimum\n";
      return 1;
    }
    camera.SetUserZoom(0.01);
    if (!Near(camera.GetUserZoom(), PointCloudCamera::kMinUserZoom)) {
      std::cerr << "SetUserZoom must clamp as well\n";
      return 1;
    }
  }

  {
    // Coordinates beyond the int range stick to the matching screen edge
    PointCloudCamera camera;
    camera.SetOrientation(0.0, 0.0);
    camera.SetBaseScale(1e12);
    auto right = camera.Project(5.0, -5.0, 0.0, center);
    auto left = camera.Project(-5.0, 5.0, 0.0, center);
    if (!right || !left || right->x != INT_MAX || right->y != INT_MAX ||
        left->x != INT_MIN || left->y != INT_MIN) {
      std::cerr << "Far off-screen points must saturate to their own side\n";
      return 1;
    }
  }

  {
    PointCloudCamera camera;
    camera.Orbit(1.0, -2.0);
    camera.SetUserZoom(3.0);
    camera.SetBaseScale(7.0);
    camera.SetPerspective(true);
    camera.Reset();
    if (!Near(camera.GetPitch(), PointCloudCamera::kInitialPitch) ||
        !Near(camera.GetYaw(), PointCloudCamera::kInitialYaw) ||
        !Near(camera.GetUserZoom(), 1.0) || !Near(camera.GetBaseScale(), 7.0) ||
        !camera.IsPerspectiveEnabled()) {
      std::cerr << "Reset must only restore orientation and user zoom\n";
      return 1;
    }
  }

  return 0;
}
