// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * io_png.cpp
 *
 * Display stretch and palette rendering through stb_image_write.
 */

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wmissing-field-initializers"
#define STB_IMAGE_WRITE_IMPLEMENTATION
#include <stb_image_write.h>
#pragma GCC diagnostic pop

#include "floodfusion/io/png.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <cmath>
#include <vector>

namespace floodfusion {
namespace io {

namespace detail {

using Rgb = std::array<uint8_t, 3>;

/// min/max for band i; a single value applies to every band.
float stretchBound(const std::vector<float>& values, size_t i,
                   float fallback) {
  if (values.empty()) return fallback;
  return i < values.size() ? values[i] : values.back();
}

float normalize(float v, float lo, float hi) {
  float range = hi - lo;
  if (std::abs(range) < 1e-12f) range = 1.0f;
  return std::max(0.0f, std::min(1.0f, (v - lo) / range));
}

/// Piecewise-linear interpolation over the palette colours.
void paletteColor(const std::vector<Rgb>& palette, float t, uint8_t* px) {
  if (palette.empty()) {
    px[0] = px[1] = px[2] = static_cast<uint8_t>(t * 255);
    return;
  }
  if (palette.size() == 1) {
    std::copy(palette[0].begin(), palette[0].end(), px);
    return;
  }
  const float pos = t * static_cast<float>(palette.size() - 1);
  const auto i0 = static_cast<size_t>(pos);
  const size_t i1 = std::min(i0 + 1, palette.size() - 1);
  const float frac = pos - static_cast<float>(i0);
  for (int k = 0; k < 3; ++k) {
    px[k] = static_cast<uint8_t>(palette[i0][k] * (1 - frac) +
                                 palette[i1][k] * frac);
  }
}

}  // namespace detail

bool savePng(const std::string& filename, const Raster& raster,
             const VisParams& vis) {
  if (vis.bands.size() != 1 && vis.bands.size() != 3) {
    spdlog::error("[png_io] Expected 1 or 3 display bands, got {}",
                  vis.bands.size());
    return false;
  }
  for (const auto& name : vis.bands) {
    if (!raster.exists(name)) {
      spdlog::error("[png_io] Band '{}' does not exist", name);
      return false;
    }
  }

  std::vector<detail::Rgb> palette;
  for (const auto& text : vis.palette) {
    detail::Rgb rgb;
    if (!parseHexColor(text, rgb)) {
      spdlog::error("[png_io] Invalid palette colour '{}'", text);
      return false;
    }
    palette.push_back(rgb);
  }

  const int width = imageWidth(raster);
  const int height = imageHeight(raster);
  constexpr int channels = 4;
  std::vector<uint8_t> pixels(static_cast<size_t>(width) * height * channels);

  grid_map::Index index;
  for (int row = 0; row < height; ++row) {
    for (int col = 0; col < width; ++col) {
      uint8_t* px = &pixels[(static_cast<size_t>(row) * width + col) * channels];
      px[0] = px[1] = px[2] = px[3] = 0;
      if (!raster.getIndex(northUpPosition(raster, row, col), index)) continue;

      std::array<float, 3> values{};
      bool masked = false;
      for (size_t b = 0; b < vis.bands.size(); ++b) {
        values[b] = raster.at(vis.bands[b], index);
        masked |= !std::isfinite(values[b]);
      }
      if (masked) continue;

      if (vis.bands.size() == 3) {
        for (size_t b = 0; b < 3; ++b) {
          const float t = detail::normalize(
              values[b], detail::stretchBound(vis.min, b, 0.0f),
              detail::stretchBound(vis.max, b, 1.0f));
          px[b] = static_cast<uint8_t>(t * 255);
        }
      } else {
        const float t = detail::normalize(
            values[0], detail::stretchBound(vis.min, 0, 0.0f),
            detail::stretchBound(vis.max, 0, 1.0f));
        detail::paletteColor(palette, t, px);
      }
      px[3] = 255;
    }
  }

  const int stride = width * channels;
  if (!stbi_write_png(filename.c_str(), width, height, channels,
                      pixels.data(), stride)) {
    spdlog::error("[png_io] Write failed for {}", filename);
    return false;
  }
  return true;
}

bool savePng(const std::string& filename, const DisplayLayer& layer) {
  return savePng(filename, layer.raster, layer.vis);
}

}  // namespace io
}  // namespace floodfusion
