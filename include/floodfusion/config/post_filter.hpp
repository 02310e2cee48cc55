// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#ifndef FLOODFUSION_CONFIG_POST_FILTER_HPP
#define FLOODFUSION_CONFIG_POST_FILTER_HPP

namespace floodfusion::config {

/// Spatial and terrain cleanup of the classified map.
struct PostFilter {
  float slope_threshold = 5.0f;  ///< Max slope kept as flood [deg], 0-30
  int min_patch_size = 8;        ///< Min connected flood pixels, 0-50 (0 = off)
  int max_patch_size = 100;      ///< Patch counting stops at this size
  bool eight_connected = true;
};

}  // namespace floodfusion::config

#endif  // FLOODFUSION_CONFIG_POST_FILTER_HPP
