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
 * File: itemadapter.h
 * Author: Luisma Peramato
 * License: GNU General Public License v3.0
 * Description: Adapter interface that exposes arbitrary item collections to
 * the point cloud viewer.
 */

#pragma once

#include "point3d.h"

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

// Converts items of type T into the coordinates, colors and labels needed for
// rendering. The viewer only ever talks to this interface, so any item type
// can be displayed without the viewer knowing its layout.
//
// Index based accessors are always called with 0 <= index < items.size().
// GetMin/GetMax must return per-axis extrema over the whole collection; the
// viewer uses them as-is.
template <typename T> class ItemAdapter {
public:
  virtual ~ItemAdapter() = default;

  virtual Point3D GetItem(const std::vector<T> &items, size_t index) const = 0;
  virtual RGBColor GetColor(const std::vector<T> &items,
                            size_t index) const = 0;
  // Returns std::nullopt (or an empty string) when no label should be drawn.
  virtual std::optional<std::string> GetLabel(const std::vector<T> &items,
                                              size_t index) const = 0;

  virtual Point3D GetMin(const std::vector<T> &items) const = 0;
  virtual Point3D GetMax(const std::vector<T> &items) const = 0;
};

// Non-template view of a collection bound to its adapter. This is what the
// viewer stores so the rendering code does not need to be a template.
class IDataset {
public:
  virtual ~IDataset() = default;

  virtual size_t Size() const = 0;
  bool Empty() const { return Size() == 0; }

  virtual Point3D GetItem(size_t index) const = 0;
  virtual RGBColor GetColor(size_t index) const = 0;
  virtual std::optional<std::string> GetLabel(size_t index) const = 0;
  virtual Point3D GetMin() const = 0;
  virtual Point3D GetMax() const = 0;
};

// Borrows both the collection and the adapter. Callers keep them alive for as
// long as the dataset is installed in a viewer and may modify the collection
// in place before notifying the viewer.
template <typename T> class AdaptedDataset : public IDataset {
public:
  AdaptedDataset(const std::vector<T> &items, const ItemAdapter<T> &adapter)
      : m_items(items), m_adapter(adapter) {}

  size_t Size() const override { return m_items.size(); }

  Point3D GetItem(size_t index) const override {
    return m_adapter.GetItem(m_items, index);
  }
  RGBColor GetColor(size_t index) const override {
    return m_adapter.GetColor(m_items, index);
  }
  std::optional<std::string> GetLabel(size_t index) const override {
    return m_adapter.GetLabel(m_items, index);
  }
  Point3D GetMin() const override { return m_adapter.GetMin(m_items); }
  Point3D GetMax() const override { return m_adapter.GetMax(m_items); }

private:
  const std::vector<T> &m_items;
  const ItemAdapter<T> &m_adapter;
};

template <typename T>
std::unique_ptr<IDataset> MakeDataset(const std::vector<T> &items,
                                      const ItemAdapter<T> &adapter) {
  return std::make_unique<AdaptedDataset<T>>(items, adapter);
}

// The dataset only borrows its arguments, temporaries would dangle.
template <typename T>
std::unique_ptr<IDataset> MakeDataset(const std::vector<T> &&,
                                      const ItemAdapter<T> &) = delete;
template <typename T>
std::unique_ptr<IDataset> MakeDataset(const std::vector<T> &,
                                      const ItemAdapter<T> &&) = delete;
template <typename T>
std::unique_ptr<IDataset> MakeDataset(const std::vector<T> &&,
                                      const ItemAdapter<T> &&) = delete;
