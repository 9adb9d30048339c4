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

class PointCloudCamera;

// Turns raw pointer input into camera changes. Each handler returns true when
// the camera changed and the view needs to be redrawn.
class InputController {
public:
  // Radians of rotation per pixel of drag
  static constexpr double kRotationPerPixel = 0.01;

  void OnPress(int x, int y);
  void OnRelease();
  // Horizontal motion rotates around Y, vertical motion around X. Ignored
  // unless a press is active.
  bool OnDrag(int x, int y, PointCloudCamera &camera);
  // Positive notches zoom out, negative notches zoom in.
  bool OnWheel(double notches, PointCloudCamera &camera);
  bool OnTogglePerspective(PointCloudCamera &camera);

  bool IsDragging() const { return m_dragging; }
  int GetLastX() const { return m_lastX; }
  int GetLastY() const { return m_lastY; }

private:
  bool m_dragging = false;
  int m_lastX = 0;
  int m_lastY = 0;
};
