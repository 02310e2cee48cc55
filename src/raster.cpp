// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#include "floodfusion/raster.hpp"

#include <algorithm>

#include "floodfusion/errors.hpp"

namespace floodfusion {

namespace {

constexpr double kGeometryTolerance = 1e-6;

void copyGeometry(const Raster& reference, Raster& out) {
  out.setGeometry(static_cast<float>(reference.getLength().x()),
                  static_cast<float>(reference.getLength().y()),
                  static_cast<float>(reference.getResolution()),
                  reference.getPosition());
  out.setFrameId(reference.getFrameId());
  out.setTimestamp(reference.getTimestamp());
  out.setStartIndex(reference.getStartIndex());
}

}  // namespace

bool Raster::sameGrid(const Raster& other) const {
  return (getSize() == other.getSize()).all() &&
         std::abs(getResolution() - other.getResolution()) <
             kGeometryTolerance &&
         (getPosition() - other.getPosition()).norm() < kGeometryTolerance &&
         (getStartIndex() == other.getStartIndex()).all() &&
         getFrameId() == other.getFrameId();
}

Raster Raster::select(const std::vector<std::string>& names) const {
  Raster out;
  copyGeometry(*this, out);
  for (const auto& name : names) {
    if (!exists(name)) {
      throw ComputationError("Raster", "Band '" + name + "' does not exist");
    }
    out.add(name, get(name));
  }
  return out;
}

Raster Raster::addBands(const Raster& other) const {
  if (!sameGrid(other)) {
    throw ComputationError("Raster",
                           "Cannot combine bands from different grids");
  }
  Raster out = *this;
  for (const auto& name : other.getLayers()) {
    if (out.exists(name)) {
      throw ComputationError("Raster", "Duplicate band name '" + name + "'");
    }
    out.add(name, other.get(name));
  }
  return out;
}

Raster makeRasterLike(const Raster& reference,
                      const std::vector<std::string>& bands) {
  Raster out;
  copyGeometry(reference, out);
  for (const auto& name : bands) out.addBand(name);
  return out;
}

Raster resampleNearest(const Raster& source, const Raster& target,
                       const std::vector<std::string>& bands) {
  for (const auto& name : bands) {
    if (!source.hasBand(name)) {
      throw ComputationError("Raster", "Band '" + name + "' does not exist");
    }
  }
  Raster out = makeRasterLike(target, bands);
  if (source.sameGrid(target)) {
    for (const auto& name : bands) out.get(name) = source.get(name);
    return out;
  }

  grid_map::Position position;
  grid_map::Index source_index;
  for (grid_map::GridMapIterator it(out); !it.isPastEnd(); ++it) {
    out.getPosition(*it, position);
    if (!source.getIndex(position, source_index)) continue;
    for (const auto& name : bands) {
      out.at(name, *it) = source.at(name, source_index);
    }
  }
  return out;
}

Raster selfMask(const Raster& raster, const std::string& band) {
  if (!raster.hasBand(band)) {
    throw ComputationError("Raster", "Band '" + band + "' does not exist");
  }
  Raster out = raster;
  const auto keep = (raster.get(band).array() == 1.0f).eval();
  for (const auto& name : out.getLayers()) {
    auto& data = out.get(name);
    data = keep.select(data.array(), NAN).matrix();
  }
  return out;
}

grid_map::Position northUpPosition(const Raster& raster, int image_row,
                                   int image_col) {
  grid_map::Position min_corner, max_corner;
  raster.bounds(min_corner, max_corner);
  const double res = raster.getResolution();
  return grid_map::Position(min_corner.x() + (image_col + 0.5) * res,
                            max_corner.y() - (image_row + 0.5) * res);
}

}  // namespace floodfusion
