// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * cloud_mask.hpp
 *
 * Per-scene cloud and cirrus masking of optical imagery.
 */

#ifndef FLOODFUSION_FILTERS_CLOUD_MASK_HPP
#define FLOODFUSION_FILTERS_CLOUD_MASK_HPP

#include <cmath>
#include <cstdint>

#include "floodfusion/config/sources.hpp"
#include "floodfusion/raster.hpp"

namespace floodfusion {

/// True if neither the cloud nor the cirrus bit is set in a QA value.
inline bool isClearSky(float qa, int cloud_bit, int cirrus_bit) {
  if (!std::isfinite(qa) || qa < 0.0f) return false;
  const auto bits = static_cast<uint32_t>(qa);
  return (bits & (1u << cloud_bit)) == 0 && (bits & (1u << cirrus_bit)) == 0;
}

/**
 * @brief Mask cloudy pixels of one optical scene and scale to reflectance.
 *
 * Keeps only reflectance bands (names starting with 'B'), divided by
 * cfg.reflectance_scale. Pixels flagged in the QA band, or with a masked QA
 * value, are masked in every output band.
 *
 * @throws ComputationError if the scene has no QA band.
 */
Raster applyCloudMask(const Raster& scene, const config::Sources& cfg);

}  // namespace floodfusion

#endif  // FLOODFUSION_FILTERS_CLOUD_MASK_HPP
