#include "axisrenderer.h"
#include "pointcloudcamera.h"

#include <iostream>

namespace {
BoundingExtrema Box(const Point3D &mins, const Point3D &maxs) {
  BoundingExtrema b;
  b.mins = mins;
  b.maxs = maxs;
  b.mids = Point3D((mins.x + maxs.x) / 2, (mins.y + maxs.y) / 2,
                   (mins.z + maxs.z) / 2);
  return b;
}
}

int main() {
  const ScreenPoint center{100, 100};
  AxisRenderer renderer;

  if (renderer.GetTextStyle().fontFamily != "Sans" ||
      renderer.GetTextStyle().fontSize != 12.0f ||
      renderer.GetTextStyle().bold) {
    std::cerr << "Axis labels use the plain Sans 12 font\n";
    return 1;
  }

  {
    auto corners = AxisRenderer::BoxCorners(Box({0, 0, 0}, {1, 2, 3}));
    if (corners[0] != Point3D(0, 0, 0) || corners[1] != Point3D(1, 0, 0) ||
        corners[2] != Point3D(0, 2, 0) || corners[4] != Point3D(0, 0, 3) ||
        corners[7] != Point3D(1, 2, 3)) {
      std::cerr << "Box corner order mismatch\n";
      return 1;
    }
  }

  {
    // Without rotation the four min-z corners tie, the first one wins
    PointCloudCamera camera;
    camera.SetOrientation(0.0, 0.0);
    const BoundingExtrema bounds = Box({0, 0, 0}, {10, 20, 30});
    auto far = AxisRenderer::FindFarCorner(bounds, camera, center);
    if (!far || *far != 0) {
      std::cerr << "Far corner tie must pick the first corner\n";
      return 1;
    }

    AxisOverlay overlay = renderer.Build(bounds, camera, center);
    if (!overlay.visible || overlay.origin.x != 95 || overlay.origin.y != 110 ||
        overlay.originLabel != "(0.0, 0.0, 0.0)") {
      std::cerr << "Axis origin mismatch\n";
      return 1;
    }
    const AxisGuide &x = overlay.axes[0];
    const AxisGuide &y = overlay.axes[1];
    const AxisGuide &z = overlay.axes[2];
    if (x.name != 'X' || x.end != Point3D(10, 0, 0) || x.endLabel != "10.0" ||
        !x.endScreen || x.endScreen->x != 105 || x.endScreen->y != 110) {
      std::cerr << "X axis mismatch\n";
      return 1;
    }
    if (y.end != Point3D(0, 20, 0) || y.endLabel != "20.0" || !y.endScreen ||
        y.endScreen->x != 95 || y.endScreen->y != 90 || !y.midScreen ||
        y.midScreen->y != 100) {
      std::cerr << "Y axis mismatch\n";
      return 1;
    }
    if (z.end != Point3D(0, 0, 30) || z.endLabel != "30.0") {
      std::cerr << "Z axis mismatch\n";
      return 1;
    }

    CommandBuffer buffer;
    auto canvas = CreateRecordingCanvas(buffer);
    canvas->BeginFrame();
    renderer.Draw(overlay, *canvas);
    canvas->EndFrame();

    auto lines = buffer.CommandsOfType<LineCommand>();
    auto texts = buffer.CommandsOfType<TextCommand>();
    if (lines.size() != 3 || texts.size() != 7) {
      std::cerr << "Expected 3 axis lines and 7 labels\n";
      return 1;
    }
    if (texts[0].text != overlay.originLabel || texts[0].x != 75.0f ||
        texts[0].y != 125.0f) {
      std::cerr << "Origin label placement mismatch\n";
      return 1;
    }
    // X end label then X name at mid + (-4, -8)
    if (texts[1].text != "10.0" || texts[1].x != 97.0f || texts[1].y != 125.0f ||
        texts[2].text != "X" || texts[2].x != 96.0f || texts[2].y != 102.0f) {
      std::cerr << "X label placement mismatch\n";
      return 1;
    }
    // Y name sits at mid + (8, 4)
    if (texts[4].text != "Y" || texts[4].x != 103.0f || texts[4].y != 104.0f) {
      std::cerr << "Y name placement mismatch\n";
      return 1;
    }
    if (lines[0].stroke.width != 1.5f) {
      std::cerr << "Axis stroke width mismatch\n";
      return 1;
    }
  }

  {
    PointCloudCamera camera;
    camera.SetOrientation(0.0, 0.0);
    AxisOverlay overlay =
        renderer.Build(Box({-1000, 0, 0}, {1234.5, 1, 1}), camera, center);
    if (overlay.originLabel != "(-1,000.0, 0.0, 0.0)" ||
        overlay.axes[0].endLabel != "1,234.5") {
      std::cerr << "Axis labels must group thousands\n";
      return 1;
    }
  }

  {
    // Every corner beyond the eye plane leaves nothing to draw
    BoundingExtrema bounds;
    bounds.mins = Point3D(0, 0, 40);
    bounds.maxs = Point3D(1, 1, 50);
    PointCloudCamera camera;
    camera.SetOrientation(0.0, 0.0);
    camera.SetPerspective(true);
    if (AxisRenderer::FindFarCorner(bounds, camera, center)) {
      std::cerr << "No far corner expected behind the eye\n";
      return 1;
    }
    AxisOverlay overlay = renderer.Build(bounds, camera, center);
    CommandBuffer buffer;
    auto canvas = CreateRecordingCanvas(buffer);
    renderer.Draw(overlay, *canvas);
    if (overlay.visible || !buffer.commands.empty()) {
      std::cerr << "Invisible overlay must not draw\n";
      return 1;
    }
  }

  return 0;
}
