// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * visualization.hpp
 *
 * Display layers produced by a flood mapping run.
 */

#ifndef FLOODFUSION_VISUALIZATION_HPP
#define FLOODFUSION_VISUALIZATION_HPP

#include <array>
#include <cstdint>
#include <string>
#include <vector>

#include "floodfusion/config/visualization.hpp"
#include "floodfusion/raster.hpp"

namespace floodfusion {

/// A raster with its display stretch.
struct DisplayLayer {
  std::string name;
  Raster raster;
  VisParams vis;
  bool shown = true;
};

namespace layer_name {
constexpr auto optical_rgb = "Sentinel-2 RGB";
constexpr auto radar_false_color = "Sentinel-1 False Color";
constexpr auto flooded_area = "Flooded Area";
}  // namespace layer_name

/// Parse "#RRGGBB" or "RRGGBB". Returns false on malformed input.
bool parseHexColor(const std::string& text, std::array<uint8_t, 3>& rgb);

/**
 * @brief Build the three result layers in draw order.
 *
 * Optical RGB, radar false colour, then the flood mask self-masked so only
 * flooded pixels are drawn. Layers whose bands are missing are skipped.
 */
std::vector<DisplayLayer> makeDisplayLayers(const Raster& optical_composite,
                                            const Raster& radar_composite,
                                            const Raster& flood_mask,
                                            const config::Visualization& cfg);

}  // namespace floodfusion

#endif  // FLOODFUSION_VISUALIZATION_HPP
