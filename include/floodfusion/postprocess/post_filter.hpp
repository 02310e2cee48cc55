// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * post_filter.hpp
 *
 * Patch-size and terrain-slope cleanup of the classified flood map.
 */

#ifndef FLOODFUSION_POSTPROCESS_POST_FILTER_HPP
#define FLOODFUSION_POSTPROCESS_POST_FILTER_HPP

#include <string>

#include "floodfusion/config/post_filter.hpp"
#include "floodfusion/raster.hpp"

namespace floodfusion {

using PostFilterParams = config::PostFilter;

/**
 * @brief Check user-facing post-filter bounds.
 *
 * @throws InputError if slope_threshold is outside [0, 30] or
 *         min_patch_size is outside [0, 50]
 */
void validatePostFilterParams(const PostFilterParams& params);

/**
 * @brief Size of the connected patch of equal value containing each pixel.
 *
 * Patches are grown over finite pixels with the same value, 4- or
 * 8-connected. Counts are capped at max_size. Masked pixels stay masked.
 *
 * @return Raster with a single band `patch_size`
 */
Raster connectedPixelCount(const Raster& raster, const std::string& band_name,
                           int max_size = 100, bool eight_connected = true);

/**
 * @brief Final flood mask from the classification and terrain slope.
 *
 * flood = 1 where classified as flood, the patch holds at least
 * min_patch_size pixels (not checked when 0) and slope <= slope_threshold.
 * Patch counting is capped at max(max_patch_size, min_patch_size).
 * Other classified pixels are 0. Pixels with masked classification, masked
 * slope or slope above the threshold are masked.
 *
 * @param classified Raster with band `classification`
 * @param slope Raster with band `slope` [deg] on the same grid
 * @return Raster with a single band `flood`
 *
 * @throws InputError on invalid params
 * @throws ComputationError on missing bands or a grid mismatch
 */
Raster applyPostFilter(const Raster& classified, const Raster& slope,
                       const PostFilterParams& params);

}  // namespace floodfusion

#endif  // FLOODFUSION_POSTPROCESS_POST_FILTER_HPP
