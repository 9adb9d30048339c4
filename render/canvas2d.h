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
#include <memory>
#include <string>
#include <variant>
#include <vector>

// Simple RGBA color container expressed in floating point values.
struct CanvasColor {
  float r = 0.0f;
  float g = 0.0f;
  float b = 0.0f;
  float a = 1.0f;
};

// Line style shared by commands that involve strokes. A width of zero means
// no outline is drawn.
struct CanvasStroke {
  CanvasColor color{};
  float width = 1.0f; // Width in screen pixels
};

// Fill style used by circles.
struct CanvasFill {
  CanvasColor color{};
};

// Describes text appearance. The coordinate passed to DrawText is the left end
// of the text baseline.
struct CanvasTextStyle {
  std::string fontFamily;
  float fontSize = 12.0f;
  bool bold = false;
  CanvasColor color{};
};

// Abstract interface representing the 2D drawing surface the point cloud
// viewer paints on. Coordinates are screen pixels with Y growing downward.
// Implementations may draw on screen or record commands.
class ICanvas2D {
public:
  virtual ~ICanvas2D() = default;

  virtual void BeginFrame() = 0;
  virtual void EndFrame() = 0;

  virtual void SetAntialias(bool enabled) = 0;

  virtual void DrawLine(float x0, float y0, float x1, float y1,
                        const CanvasStroke &stroke) = 0;
  virtual void DrawCircle(float cx, float cy, float radius,
                          const CanvasStroke &stroke,
                          const CanvasFill *fill) = 0;
  virtual void DrawText(float x, float y, const std::string &text,
                        const CanvasTextStyle &style) = 0;
};

// Command types used by the RecordingCanvas. Each command stores all data
// required to reproduce the drawing.
struct AntialiasCommand {
  bool enabled = true;
};

struct LineCommand {
  float x0 = 0.0f;
  float y0 = 0.0f;
  float x1 = 0.0f;
  float y1 = 0.0f;
  CanvasStroke stroke{};
};

struct CircleCommand {
  float cx = 0.0f;
  float cy = 0.0f;
  float radius = 0.0f;
  CanvasStroke stroke{};
  CanvasFill fill{};
  bool hasFill = false;
};

struct TextCommand {
  float x = 0.0f;
  float y = 0.0f;
  std::string text;
  CanvasTextStyle style{};
};

using CanvasCommand =
    std::variant<AntialiasCommand, LineCommand, CircleCommand, TextCommand>;

// Ordered list of issued drawing commands for one frame.
struct CommandBuffer {
  std::vector<CanvasCommand> commands;
  uint64_t frameCount = 0; // Number of frames recorded into this buffer

  void Clear() { commands.clear(); }

  template <typename T> std::vector<T> CommandsOfType() const {
    std::vector<T> out;
    for (const auto &cmd : commands) {
      if (const T *typed = std::get_if<T>(&cmd))
        out.push_back(*typed);
    }
    return out;
  }
};

// Factory helper implemented in canvas2d.cpp so callers do not need to know
// the concrete canvas class.
std::unique_ptr<ICanvas2D> CreateRecordingCanvas(CommandBuffer &buffer);
