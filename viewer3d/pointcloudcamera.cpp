/*
 * File: pointcloudcamera.cpp
 * Author: Luisma Peramato
 * License: GNU General Public License v3.0
 * Description: Implementation of the point cloud camera.
 */

#include "pointcloudcamera.h"
#include <algorithm>
#include <climits>
#include <cmath>

namespace
{
// Truncates toward zero and saturates at the int range; NaN maps to 0.
int ToPixel(double v)
{
    if (std::isnan(v))
        return 0;
    if (v >= static_cast<double>(INT_MAX))
        return INT_MAX;
    if (v <= static_cast<double>(INT_MIN))
        return INT_MIN;
    return static_cast<int>(v);
}
} // namespace

PointCloudCamera::PointCloudCamera()
{
    state.rotationX = kInitialPitch;
    state.rotationY = kInitialYaw;
}

std::optional<ScreenResult> PointCloudCamera::Project(double x, double y, double z,
                                                      const ScreenPoint& center) const
{
    double cosX = std::cos(state.rotationX);
    double sinX = std::sin(state.rotationX);
    double cosY = std::cos(state.rotationY);
    double sinY = std::sin(state.rotationY);

    // Rotation around X
    double y1 = y * cosX - z * sinX;
    double z1 = y * sinX + z * cosX;

    // Rotation around Y
    double x2 = x * cosY + z1 * sinY;
    double y2 = y1;
    double z2 = z1 * cosY - x * sinY;

    double factor = 1.0;
    if (state.perspective)
    {
        if (kViewerDistance - z2 > kNearLimit)
            factor = kViewerDistance / (kViewerDistance - z2);
        else
            return std::nullopt;
    }

    // Screen Y grows downward while model Y grows upward
    double scale = state.EffectiveScale() * factor;
    ScreenResult result;
    result.x = ToPixel(center.x + x2 * scale);
    result.y = ToPixel(center.y - y2 * scale);
    result.depth = z2;
    result.perspectiveFactor = factor;
    return result;
}

std::optional<ScreenResult> PointCloudCamera::Project(const Point3D& p,
                                                      const ScreenPoint& center) const
{
    return Project(p.x, p.y, p.z, center);
}

void PointCloudCamera::Orbit(double deltaPitch, double deltaYaw)
{
    // Angles are periodic through the trig functions, no clamping needed
    state.rotationX += deltaPitch;
    state.rotationY += deltaYaw;
}

void PointCloudCamera::Zoom(double notches)
{
    state.userZoom *= 1.0 - notches * kZoomStepPerNotch;
    state.userZoom = std::max(kMinUserZoom, state.userZoom);
}

void PointCloudCamera::SetOrientation(double pitch, double yaw)
{
    state.rotationX = pitch;
    state.rotationY = yaw;
}

void PointCloudCamera::SetUserZoom(double zoom)
{
    state.userZoom = std::max(kMinUserZoom, zoom);
}

void PointCloudCamera::Reset()
{
    state.rotationX = kInitialPitch;
    state.rotationY = kInitialYaw;
    state.userZoom = 1.0;
}
