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
#include "inputcontroller.h"

#include "pointcloudcamera.h"

void InputController::OnPress(int x, int y) {
  m_dragging = true;
  m_lastX = x;
  m_lastY = y;
}

void InputController::OnRelease() { m_dragging = false; }

bool InputController::OnDrag(int x, int y, PointCloudCamera &camera) {
  if (!m_dragging)
    return false;

  double deltaX = x - m_lastX;
  double deltaY = y - m_lastY;
  camera.Orbit(deltaY * kRotationPerPixel, deltaX * kRotationPerPixel);

  m_lastX = x;
  m_lastY = y;
  return true;
}

bool InputController::OnWheel(double notches, PointCloudCamera &camera) {
  camera.Zoom(notches);
  return true;
}

bool InputController::OnTogglePerspective(PointCloudCamera &camera) {
  camera.TogglePerspective();
  return true;
}
