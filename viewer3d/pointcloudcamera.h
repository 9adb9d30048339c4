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
 * File: pointcloudcamera.h
 * Author: Luisma Peramato
 * License: GNU General Public License v3.0
 * Description: Rotating camera that projects model points onto the screen.
 */

#pragma once

#include "pointcloud_types.h"

#include <optional>

class PointCloudCamera
{
public:
    // Distance from the rotation center to the eye in perspective mode
    static constexpr double kViewerDistance = 30.0;
    // Points closer than this to the eye plane are not projected
    static constexpr double kNearLimit = 0.1;
    static constexpr double kMinUserZoom = 0.1;
    static constexpr double kZoomStepPerNotch = 0.1;
    static constexpr double kInitialPitch = 3.14159265358979323846 / 6.0;
    static constexpr double kInitialYaw = 3.14159265358979323846 / 4.0;

    PointCloudCamera();

    // Rotates (x, y, z) around X then Y and maps it onto the screen around
    // center. Coordinates are expected relative to the dataset midpoint.
    // Returns std::nullopt when perspective is active and the point lies
    // behind or too close to the eye.
    std::optional<ScreenResult> Project(double x, double y, double z,
                                        const ScreenPoint& center) const;
    std::optional<ScreenResult> Project(const Point3D& p,
                                        const ScreenPoint& center) const;

    // Adds to pitch (rotation around X) and yaw (rotation around Y)
    void Orbit(double deltaPitch, double deltaYaw);

    // Applies wheel notches. Positive notches zoom out.
    void Zoom(double notches);

    void SetOrientation(double pitch, double yaw);
    void SetBaseScale(double scale) { state.baseScale = scale; }
    void SetUserZoom(double zoom);

    void SetPerspective(bool enabled) { state.perspective = enabled; }
    void TogglePerspective() { state.perspective = !state.perspective; }
    bool IsPerspectiveEnabled() const { return state.perspective; }

    double GetPitch() const { return state.rotationX; }
    double GetYaw() const { return state.rotationY; }
    double GetUserZoom() const { return state.userZoom; }
    double GetBaseScale() const { return state.baseScale; }
    const CameraState& GetState() const { return state; }

    // Restores the initial orientation and user zoom. Base scale and the
    // projection mode are left untouched.
    void Reset();

private:
    CameraState state;
};
