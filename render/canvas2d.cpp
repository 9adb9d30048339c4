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

#include "canvas2d.h"

#include <utility>

// Stores every drawing call in a CommandBuffer. BeginFrame discards the
// previous frame so the buffer always holds the most recent one.
class RecordingCanvas : public ICanvas2D {
public:
  explicit RecordingCanvas(CommandBuffer &buffer) : m_buffer(buffer) {}

  void BeginFrame() override {
    m_buffer.Clear();
    ++m_buffer.frameCount;
  }
  void EndFrame() override {}

  void SetAntialias(bool enabled) override {
    PushCommand(AntialiasCommand{enabled});
  }

  void DrawLine(float x0, float y0, float x1, float y1,
                const CanvasStroke &stroke) override {
    PushCommand(LineCommand{x0, y0, x1, y1, stroke});
  }

  void DrawCircle(float cx, float cy, float radius, const CanvasStroke &stroke,
                  const CanvasFill *fill) override {
    CircleCommand cmd{cx, cy, radius, stroke, {}, false};
    if (fill) {
      cmd.fill = *fill;
      cmd.hasFill = true;
    }
    PushCommand(std::move(cmd));
  }

  void DrawText(float x, float y, const std::string &text,
                const CanvasTextStyle &style) override {
    PushCommand(TextCommand{x, y, text, style});
  }

private:
  void PushCommand(CanvasCommand &&cmd) {
    m_buffer.commands.emplace_back(std::move(cmd));
  }

  CommandBuffer &m_buffer;
};

std::unique_ptr<ICanvas2D> CreateRecordingCanvas(CommandBuffer &buffer) {
  return std::make_unique<RecordingCanvas>(buffer);
}
