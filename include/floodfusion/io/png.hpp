// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * png.hpp
 *
 * PNG rendering of display layers.
 */

#ifndef FLOODFUSION_IO_PNG_HPP
#define FLOODFUSION_IO_PNG_HPP

#include <string>

#include "floodfusion/raster.hpp"
#include "floodfusion/visualization.hpp"

namespace floodfusion {
namespace io {

/**
 * @brief Render a raster north-up as RGBA PNG.
 *
 * Three bands: each band stretched linearly from min[i] to max[i] into one
 * channel. One band: value stretched from min to max and mapped through the
 * palette (grayscale when empty). Masked pixels are fully transparent.
 */
bool savePng(const std::string& filename, const Raster& raster,
             const VisParams& vis);

/// Render a display layer (its raster with its stretch).
bool savePng(const std::string& filename, const DisplayLayer& layer);

}  // namespace io
}  // namespace floodfusion

#endif  // FLOODFUSION_IO_PNG_HPP
