// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * terrain_slope.hpp
 *
 * Terrain slope from a digital elevation model.
 */

#ifndef FLOODFUSION_FILTERS_TERRAIN_SLOPE_HPP
#define FLOODFUSION_FILTERS_TERRAIN_SLOPE_HPP

#include <string>

#include "floodfusion/raster.hpp"

namespace floodfusion {

/**
 * @brief Compute slope [deg] from an elevation band.
 *
 * Gradient from central differences of the 4-connected neighbours, one-sided
 * at the raster edge or next to a masked cell. A cell is masked when its
 * elevation is masked or when an axis has no finite neighbour.
 *
 * @return Raster on the DEM grid with the single band "slope"
 * @throws ComputationError if the elevation band is missing
 */
Raster computeSlope(const Raster& dem,
                    const std::string& elevation_band = band::elevation);

}  // namespace floodfusion

#endif  // FLOODFUSION_FILTERS_TERRAIN_SLOPE_HPP
