// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * area.hpp
 *
 * Region reductions for flood and AOI area in hectares.
 */

#ifndef FLOODFUSION_EVALUATION_AREA_HPP
#define FLOODFUSION_EVALUATION_AREA_HPP

#include "floodfusion/geometry.hpp"
#include "floodfusion/raster.hpp"

namespace floodfusion {

constexpr double kSquareMetresPerHectare = 10000.0;

struct ReductionParams {
  double scale = 10.0;      ///< Reduction resolution [m]
  int tile_scale = 4;       ///< Region is reduced in tile_scale² tiles
  double max_pixels = 1e13; ///< Limit on pixels inside the region
};

/**
 * @brief Sum of pixel areas where `flood` == 1 inside the AOI.
 *
 * The mask is resampled (nearest) to params.scale when its resolution
 * differs. A pixel belongs to the AOI when its center does. Masked pixels
 * contribute nothing. Tile sums are combined with compensated summation.
 *
 * @return Area in hectares
 * @throws ComputationError if the band is missing or the AOI covers more
 *         than max_pixels pixels
 */
double floodAreaHectares(const Raster& flood_mask, const AreaOfInterest& aoi,
                         const ReductionParams& params = {});

/// Planar area of the AOI polygon in hectares.
double aoiAreaHectares(const AreaOfInterest& aoi);

}  // namespace floodfusion

#endif  // FLOODFUSION_EVALUATION_AREA_HPP
