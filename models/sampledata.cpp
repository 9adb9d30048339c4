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
#include "sampledata.h"

#include <array>
#include <cmath>
#include <random>
#include <string>

namespace {
constexpr double kPi = 3.14159265358979323846;

// Hue in [0, 1) to a saturated color.
RGBColor HueColor(double hue) {
  double h = (hue - std::floor(hue)) * 6.0;
  int sector = static_cast<int>(h);
  double f = h - sector;
  auto c = [](double v) { return static_cast<uint8_t>(std::lround(v * 255)); };
  switch (sector) {
  case 0:
    return {255, c(f), 0};
  case 1:
    return {c(1.0 - f), 255, 0};
  case 2:
    return {0, 255, c(f)};
  case 3:
    return {0, c(1.0 - f), 255};
  case 4:
    return {c(f), 0, 255};
  default:
    return {255, 0, c(1.0 - f)};
  }
}
} // namespace

namespace SampleData {

std::vector<PointItem> MakeHelix(size_t count) {
  std::vector<PointItem> items;
  items.reserve(count);
  const double turns = 3.0;
  const double radius = 10.0;
  const double height = 40.0;
  for (size_t i = 0; i < count; ++i) {
    double t = count > 1 ? static_cast<double>(i) / (count - 1) : 0.0;
    double angle = t * turns * 2.0 * kPi;
    PointItem item;
    item.position = Point3D(radius * std::cos(angle), radius * std::sin(angle),
                            t * height);
    item.color = HueColor(t);
    if (i % 25 == 0)
      item.label = "P" + std::to_string(i);
    items.push_back(item);
  }
  return items;
}

std::vector<PointItem> MakeClusters(size_t count, uint32_t seed) {
  struct Cluster {
    Point3D center;
    double spread;
    RGBColor color;
    const char *name;
  };
  const std::array<Cluster, 4> clusters = {{
      {{-1500.0, 200.0, 800.0}, 180.0, {230, 80, 80}, "North"},
      {{1200.0, -400.0, 300.0}, 250.0, {80, 200, 90}, "East"},
      {{0.0, 900.0, -600.0}, 150.0, {90, 140, 240}, "South"},
      {{300.0, -1100.0, -200.0}, 300.0, {240, 200, 70}, "West"},
  }};

  std::mt19937 rng(seed);
  std::normal_distribution<double> unit(0.0, 1.0);

  std::vector<PointItem> items;
  items.reserve(count + clusters.size());
  for (const auto &cluster : clusters) {
    PointItem centroid;
    centroid.position = cluster.center;
    centroid.color = RGBColor(255, 255, 255);
    centroid.label = cluster.name;
    items.push_back(centroid);
  }
  for (size_t i = 0; i < count; ++i) {
    const Cluster &cluster = clusters[i % clusters.size()];
    PointItem item;
    item.position = Point3D(cluster.center.x + unit(rng) * cluster.spread,
                            cluster.center.y + unit(rng) * cluster.spread,
                            cluster.center.z + unit(rng) * cluster.spread);
    item.color = cluster.color;
    items.push_back(item);
  }
  return items;
}

std::vector<PointItem> MakeSinglePoint() {
  PointItem item;
  item.position = Point3D(12.5, -3.0, 7.25);
  item.color = RGBColor(255, 160, 0);
  item.label = "Only point";
  return {item};
}

} // namespace SampleData
