// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * speckle_filter.hpp
 *
 * Adaptive (refined Lee) speckle reduction for radar backscatter.
 */

#ifndef FLOODFUSION_FILTERS_SPECKLE_FILTER_HPP
#define FLOODFUSION_FILTERS_SPECKLE_FILTER_HPP

#include <algorithm>
#include <string>

#include "floodfusion/composite.hpp"
#include "floodfusion/raster.hpp"

namespace floodfusion {

/**
 * @brief Blend weight of the center value.
 *
 * b = max(0, 1 - variance / mean²), w = b / (1 + b). A zero local mean gives
 * w = 0 (the output is the local mean).
 */
inline double speckleWeight(double mean, double variance) {
  if (mean == 0.0) return 0.0;
  const double b = std::max(0.0, 1.0 - variance / (mean * mean));
  return b / (1.0 + b);
}

/**
 * @brief Apply the refined Lee filter to one band.
 *
 * For every unmasked pixel, computes the mean and population variance of the
 * finite values in a kernel_size × kernel_size window (clipped at the raster
 * edge) and outputs center·w + mean·(1 − w). Masked pixels stay masked.
 *
 * @param radar Input raster (not modified)
 * @param band Band to filter
 * @param output_band Name of the single output band
 * @param kernel_size Odd window width in cells (default: 7)
 * @return One-band composite on the input grid, or an empty composite if
 *         the input band is absent
 * @throws std::invalid_argument if kernel_size is not a positive odd number
 */
Composite applySpeckleFilter(const Raster& radar, const std::string& band,
                             const std::string& output_band,
                             int kernel_size = 7);

}  // namespace floodfusion

#endif  // FLOODFUSION_FILTERS_SPECKLE_FILTER_HPP
