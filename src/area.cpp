// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * area.cpp
 */

#include "floodfusion/evaluation/area.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <string>

#include "floodfusion/errors.hpp"

namespace floodfusion {

namespace {

// Neumaier compensated sum
class CompensatedSum {
 public:
  void add(double v) {
    const double t = sum_ + v;
    if (std::abs(sum_) >= std::abs(v)) {
      c_ += (sum_ - t) + v;
    } else {
      c_ += (v - t) + sum_;
    }
    sum_ = t;
  }
  double value() const { return sum_ + c_; }

 private:
  double sum_ = 0.0;
  double c_ = 0.0;
};

// Mask on a grid of the requested scale covering the same extent
Raster atScale(const Raster& flood_mask, double scale) {
  const double res = flood_mask.getResolution();
  if (std::abs(res - scale) <= 1e-9 * scale) return flood_mask;

  const grid_map::Length length = flood_mask.getLength();
  const double width = std::max(1.0, std::ceil(length.x() / scale)) * scale;
  const double height = std::max(1.0, std::ceil(length.y() / scale)) * scale;
  grid_map::Position min_corner, max_corner;
  flood_mask.bounds(min_corner, max_corner);
  const grid_map::Position center =
      min_corner + grid_map::Position(width / 2.0, height / 2.0);

  Raster target(static_cast<float>(width), static_cast<float>(height),
                static_cast<float>(scale), flood_mask.getFrameId(), center);
  spdlog::debug("[Area] Resampling mask from {} m to {} m", res, scale);
  return resampleNearest(flood_mask, target, {band::flood});
}

}  // namespace

double floodAreaHectares(const Raster& flood_mask, const AreaOfInterest& aoi,
                         const ReductionParams& params) {
  if (!flood_mask.hasBand(band::flood)) {
    throw ComputationError("Area", "Flood mask has no 'flood' band");
  }
  if (aoi.empty()) {
    throw ComputationError("Area", "Area of interest is empty");
  }
  if (!(params.scale > 0.0)) {
    throw ComputationError("Area", "Reduction scale must be positive");
  }

  const Raster mask = atScale(flood_mask, params.scale);
  const auto& flood = mask.get(band::flood);
  const auto idx = mask.indexer();
  const double pixel_area = mask.getResolution() * mask.getResolution();

  const int tile_scale = std::max(1, params.tile_scale);
  const int tile_rows = (idx.rows + tile_scale - 1) / tile_scale;
  const int tile_cols = (idx.cols + tile_scale - 1) / tile_scale;

  CompensatedSum area;
  double pixels_in_region = 0.0;
  grid_map::Position position;

  for (int tr = 0; tr < idx.rows; tr += tile_rows) {
    for (int tc = 0; tc < idx.cols; tc += tile_cols) {
      int64_t tile_pixels = 0;
      int64_t tile_flooded = 0;
      for (int row = tr; row < std::min(tr + tile_rows, idx.rows); ++row) {
        for (int col = tc; col < std::min(tc + tile_cols, idx.cols); ++col) {
          const auto [r, c] = idx(row, col);
          mask.getPosition(grid_map::Index(r, c), position);
          if (!aoi.contains(position)) continue;
          ++tile_pixels;
          if (flood(r, c) == 1.0f) ++tile_flooded;
        }
      }
      pixels_in_region += static_cast<double>(tile_pixels);
      if (pixels_in_region > params.max_pixels) {
        throw ComputationError(
            "Area", "Too many pixels in the region (limit " +
                        std::to_string(static_cast<long long>(
                            params.max_pixels)) +
                        ")");
      }
      area.add(static_cast<double>(tile_flooded) * pixel_area);
    }
  }

  const double hectares = area.value() / kSquareMetresPerHectare;
  spdlog::debug("[Area] {:.0f} pixels in region, {:.2f} ha flooded",
                pixels_in_region, hectares);
  return hectares;
}

double aoiAreaHectares(const AreaOfInterest& aoi) {
  return aoi.area() / kSquareMetresPerHectare;
}

}  // namespace floodfusion
