// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * speckle_filter.cpp
 *
 * Refined Lee filter over a square window.
 */

#include "floodfusion/filters/speckle_filter.hpp"

#include <spdlog/spdlog.h>

#include <cmath>
#include <stdexcept>
#include <vector>

namespace floodfusion {

Composite applySpeckleFilter(const Raster& radar, const std::string& band,
                             const std::string& output_band, int kernel_size) {
  if (kernel_size < 1 || kernel_size % 2 == 0) {
    throw std::invalid_argument("Speckle kernel size must be a positive odd "
                                "number, got " +
                                std::to_string(kernel_size));
  }
  if (!radar.hasBand(band)) {
    spdlog::debug("[SpeckleFilter] Band '{}' absent, nothing to filter", band);
    return Composite{};
  }

  Raster out = makeRasterLike(radar, {output_band});
  const auto& input = radar.get(band);
  auto& output = out.get(output_band);

  const auto idx = radar.indexer();
  const auto neighbors = MapIndexer::squareNeighbors(kernel_size);

  std::vector<double> window;
  window.reserve(neighbors.size());

  for (int row = 0; row < idx.rows; ++row) {
    for (int col = 0; col < idx.cols; ++col) {
      auto [r, c] = idx(row, col);

      const float center = input(r, c);
      if (!std::isfinite(center)) continue;

      window.clear();
      double sum = 0.0;
      for (const auto& [dr, dc] : neighbors) {
        if (!idx.contains(row + dr, col + dc)) continue;
        auto [nr, nc] = idx(row + dr, col + dc);
        const float v = input(nr, nc);
        if (!std::isfinite(v)) continue;
        window.push_back(v);
        sum += v;
      }

      // Two-pass population variance
      const double mean = sum / static_cast<double>(window.size());
      double sq_dev = 0.0;
      for (double v : window) sq_dev += (v - mean) * (v - mean);
      const double variance = sq_dev / static_cast<double>(window.size());

      const double w = speckleWeight(mean, variance);
      output(r, c) = static_cast<float>(center * w + mean * (1.0 - w));
    }
  }

  spdlog::debug("[SpeckleFilter] {} -> {} ({}x{} window, {} pixels)", band,
                output_band, kernel_size, kernel_size,
                out.validPixelCount(output_band));
  return Composite(std::move(out));
}

}  // namespace floodfusion
