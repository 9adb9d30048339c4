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

#include "pointitem.h"

#include <cstdint>
#include <vector>

// Demo point clouds shown by the main window.
namespace SampleData {

// Three turn helix around the Z axis, every 25th point labelled.
std::vector<PointItem> MakeHelix(size_t count);

// Four gaussian clusters with one labelled centroid each. The seed makes the
// cloud reproducible.
std::vector<PointItem> MakeClusters(size_t count, uint32_t seed = 42);

// A single labelled point, exercises the degenerate scale path.
std::vector<PointItem> MakeSinglePoint();

} // namespace SampleData
