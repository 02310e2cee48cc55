// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#ifndef FLOODFUSION_CONFIG_FLOODFUSION_HPP
#define FLOODFUSION_CONFIG_FLOODFUSION_HPP

#include <cstdint>
#include <string>

namespace YAML {
class Node;
}

#include "floodfusion/config/classifier.hpp"
#include "floodfusion/config/post_filter.hpp"
#include "floodfusion/config/sources.hpp"
#include "floodfusion/config/visualization.hpp"

namespace floodfusion {

namespace config {

/// Refined Lee speckle filter window.
struct Speckle {
  int kernel_size = 7;  ///< Odd window width [cells]
};

/// Processing grid and training sample extraction.
struct Sampling {
  double scale = 10.0;         ///< Processing resolution [m]
  int tile_scale = 8;          ///< Grid split into tile_scale² tiles
  double split_fraction = 0.7; ///< Share of samples used for training
  uint64_t seed = 0;
};

/// Area reductions.
struct Evaluation {
  double scale = 10.0;  ///< Reduction resolution [m]
  int tile_scale = 4;
  double max_pixels = 1e13;
};

}  // namespace config

/// Pipeline configuration for FloodFusion.
struct Config {
  config::Sources sources;
  config::Speckle speckle;
  config::Sampling sampling;
  config::Classifier classifier;
  config::PostFilter post_filter;
  config::Evaluation evaluation;
  config::Visualization visualization;
  std::string log_level = "info";
};

Config parseConfig(const YAML::Node& root);
Config loadConfig(const std::string& path);

}  // namespace floodfusion

#endif  // FLOODFUSION_CONFIG_FLOODFUSION_HPP
