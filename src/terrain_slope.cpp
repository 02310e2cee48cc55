// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#include "floodfusion/filters/terrain_slope.hpp"

#include <spdlog/spdlog.h>

#include <cmath>

#include "floodfusion/errors.hpp"

namespace floodfusion {

namespace {

constexpr double kRadToDeg = 180.0 / M_PI;

}  // namespace

Raster computeSlope(const Raster& dem, const std::string& elevation_band) {
  if (!dem.hasBand(elevation_band)) {
    throw ComputationError("TerrainSlope",
                           "DEM has no '" + elevation_band + "' band");
  }

  Raster out = makeRasterLike(dem, {band::slope});
  const auto& elev = dem.get(elevation_band);
  auto& slope = out.get(band::slope);

  const auto idx = dem.indexer();
  const double res = idx.resolution;

  auto valueAt = [&](int row, int col) -> float {
    if (!idx.contains(row, col)) return NAN;
    auto [r, c] = idx(row, col);
    return elev(r, c);
  };

  // Derivative along one axis: central, else one-sided, else NaN.
  auto derivative = [&](float center, float before, float after) -> double {
    const bool has_before = std::isfinite(before);
    const bool has_after = std::isfinite(after);
    if (has_before && has_after) return (after - before) / (2.0 * res);
    if (has_after) return (after - center) / res;
    if (has_before) return (center - before) / res;
    return NAN;
  };

  for (int row = 0; row < idx.rows; ++row) {
    for (int col = 0; col < idx.cols; ++col) {
      auto [r, c] = idx(row, col);
      const float z = elev(r, c);
      if (!std::isfinite(z)) continue;

      // grid_map: row → -x, col → -y (sign is irrelevant for the magnitude)
      const double dz_row =
          derivative(z, valueAt(row - 1, col), valueAt(row + 1, col));
      const double dz_col =
          derivative(z, valueAt(row, col - 1), valueAt(row, col + 1));
      if (!std::isfinite(dz_row) || !std::isfinite(dz_col)) continue;

      const double gradient = std::sqrt(dz_row * dz_row + dz_col * dz_col);
      slope(r, c) = static_cast<float>(std::atan(gradient) * kRadToDeg);
    }
  }

  spdlog::debug("[TerrainSlope] {} slope cells from '{}'",
                out.validPixelCount(band::slope), elevation_band);
  return out;
}

}  // namespace floodfusion
