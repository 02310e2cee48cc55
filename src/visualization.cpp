// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#include "floodfusion/visualization.hpp"

#include <spdlog/spdlog.h>

namespace floodfusion {

namespace {

bool hasBands(const Raster& raster, const VisParams& vis) {
  if (vis.bands.empty()) return false;
  for (const auto& name : vis.bands) {
    if (!raster.hasBand(name)) return false;
  }
  return true;
}

int hexDigit(char ch) {
  if (ch >= '0' && ch <= '9') return ch - '0';
  if (ch >= 'a' && ch <= 'f') return ch - 'a' + 10;
  if (ch >= 'A' && ch <= 'F') return ch - 'A' + 10;
  return -1;
}

}  // namespace

bool parseHexColor(const std::string& text, std::array<uint8_t, 3>& rgb) {
  const std::string hex = (!text.empty() && text[0] == '#') ? text.substr(1)
                                                            : text;
  if (hex.size() != 6) return false;
  for (int i = 0; i < 3; ++i) {
    const int hi = hexDigit(hex[2 * i]);
    const int lo = hexDigit(hex[2 * i + 1]);
    if (hi < 0 || lo < 0) return false;
    rgb[i] = static_cast<uint8_t>(hi * 16 + lo);
  }
  return true;
}

std::vector<DisplayLayer> makeDisplayLayers(const Raster& optical_composite,
                                            const Raster& radar_composite,
                                            const Raster& flood_mask,
                                            const config::Visualization& cfg) {
  std::vector<DisplayLayer> layers;
  auto addLayer = [&](const std::string& name, const Raster& source,
                      const VisParams& vis) {
    if (!hasBands(source, vis)) {
      spdlog::warn("[Visualization] Skipping '{}': missing display bands",
                   name);
      return;
    }
    layers.push_back({name, source.select(vis.bands), vis, true});
  };

  addLayer(layer_name::optical_rgb, optical_composite, cfg.optical_rgb);
  addLayer(layer_name::radar_false_color, radar_composite,
           cfg.radar_false_color);
  if (flood_mask.hasBand(band::flood)) {
    addLayer(layer_name::flooded_area, selfMask(flood_mask, band::flood),
             cfg.flood);
  }
  return layers;
}

}  // namespace floodfusion
