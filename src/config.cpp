// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * config.cpp
 *
 * YAML configuration loading.
 */

#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>
#include <type_traits>

#include "floodfusion/config/floodfusion.hpp"

namespace floodfusion {
namespace detail {

template <typename T>
void load(const YAML::Node& node, const std::string& key, T& value) {
  if (node[key]) {
    value = node[key].as<T>();
  }
}

ClassifierType parseClassifierType(const std::string& type) {
  if (type == "random_forest" || type == "smile_random_forest") {
    return ClassifierType::RandomForest;
  }
  spdlog::warn("[Config] Unknown classifier type '{}', using random_forest",
               type);
  return ClassifierType::RandomForest;
}

void loadVisParams(const YAML::Node& node, VisParams& vis) {
  if (!node) return;
  load(node, "bands", vis.bands);
  load(node, "palette", vis.palette);
  // Accept both a scalar and a per-band list for min / max.
  for (const auto& key : {"min", "max"}) {
    auto& target = std::string(key) == "min" ? vis.min : vis.max;
    if (!node[key]) continue;
    if (node[key].IsSequence()) {
      target = node[key].as<std::vector<float>>();
    } else {
      target = {node[key].as<float>()};
    }
  }
}

Config parse(const YAML::Node& root) {
  Config cfg;

  if (auto n = root["sources"]) {
    auto& s = cfg.sources;
    load(n, "radar_collection", s.radar_collection);
    load(n, "optical_collection", s.optical_collection);
    load(n, "dem", s.dem);
    load(n, "instrument_mode", s.instrument_mode);
    load(n, "orbit_pass", s.orbit_pass);
    load(n, "polarisations", s.polarisations);
    load(n, "qa_band", s.qa_band);
    load(n, "cloud_bit", s.cloud_bit);
    load(n, "cirrus_bit", s.cirrus_bit);
    load(n, "reflectance_scale", s.reflectance_scale);
    load(n, "optical_bands", s.optical_bands);
  }

  if (auto n = root["speckle"]) {
    load(n, "kernel_size", cfg.speckle.kernel_size);
  }

  if (auto n = root["sampling"]) {
    load(n, "scale", cfg.sampling.scale);
    load(n, "tile_scale", cfg.sampling.tile_scale);
    load(n, "split_fraction", cfg.sampling.split_fraction);
    load(n, "seed", cfg.sampling.seed);
  }

  if (auto n = root["classifier"]) {
    auto& c = cfg.classifier;
    std::string type_str;
    load(n, "type", type_str);
    if (!type_str.empty()) c.type = parseClassifierType(type_str);
    load(n, "trees", c.trees);
    load(n, "variables_per_split", c.variables_per_split);
    load(n, "min_leaf_population", c.min_leaf_population);
    load(n, "bag_fraction", c.bag_fraction);
    load(n, "max_depth", c.max_depth);
    load(n, "seed", c.seed);
  }

  if (auto n = root["post_filter"]) {
    auto& p = cfg.post_filter;
    load(n, "slope_threshold", p.slope_threshold);
    load(n, "min_patch_size", p.min_patch_size);
    load(n, "max_patch_size", p.max_patch_size);
    load(n, "eight_connected", p.eight_connected);
  }

  if (auto n = root["evaluation"]) {
    load(n, "scale", cfg.evaluation.scale);
    load(n, "tile_scale", cfg.evaluation.tile_scale);
    load(n, "max_pixels", cfg.evaluation.max_pixels);
  }

  if (auto n = root["visualization"]) {
    auto& v = cfg.visualization;
    loadVisParams(n["optical_rgb"], v.optical_rgb);
    loadVisParams(n["radar_false_color"], v.radar_false_color);
    loadVisParams(n["flood"], v.flood);
    if (auto legend = n["legend"]) {
      v.legend.clear();
      for (const auto& entry : legend) {
        LegendEntry item;
        load(entry, "label", item.label);
        load(entry, "color", item.color);
        v.legend.push_back(item);
      }
    }
  }

  load(root, "log_level", cfg.log_level);
  return cfg;
}

void validate(Config& cfg) {
  // --- Fatal: inconsistencies that break the pipeline ---
  if (cfg.sources.polarisations.size() != 2) {
    throw std::invalid_argument(
        "sources.polarisations: expected exactly 2 entries, got " +
        std::to_string(cfg.sources.polarisations.size()));
  }
  if (cfg.sources.optical_bands.empty()) {
    throw std::invalid_argument("sources.optical_bands must not be empty");
  }
  if (cfg.sources.cloud_bit < 0 || cfg.sources.cloud_bit > 15 ||
      cfg.sources.cirrus_bit < 0 || cfg.sources.cirrus_bit > 15) {
    throw std::invalid_argument(
        "sources: cloud_bit and cirrus_bit must be in [0, 15]");
  }
  if (cfg.sampling.scale <= 0.0 || !std::isfinite(cfg.sampling.scale)) {
    throw std::invalid_argument("sampling.scale (" +
                                std::to_string(cfg.sampling.scale) +
                                ") must be > 0");
  }

  // --- Non-fatal: warn and clamp ---
  auto warn_clamp = [](const std::string& name, auto& val, auto lo, auto hi) {
    if (val < lo || val > hi) {
      spdlog::warn("[Config] {} ({}) out of range [{}, {}], clamping", name, val,
                   lo, hi);
      val = std::clamp(val, static_cast<std::decay_t<decltype(val)>>(lo),
                       static_cast<std::decay_t<decltype(val)>>(hi));
    }
  };

  if (cfg.sources.reflectance_scale <= 0.0f) {
    spdlog::warn(
        "[Config] sources.reflectance_scale ({}) must be > 0, clamping to "
        "10000",
        cfg.sources.reflectance_scale);
    cfg.sources.reflectance_scale = 10000.0f;
  }

  // Speckle window must be odd
  warn_clamp("speckle.kernel_size", cfg.speckle.kernel_size, 1, 31);
  if (cfg.speckle.kernel_size % 2 == 0) {
    spdlog::warn("[Config] speckle.kernel_size ({}) must be odd, using {}",
                 cfg.speckle.kernel_size, cfg.speckle.kernel_size + 1);
    cfg.speckle.kernel_size += 1;
  }

  warn_clamp("sampling.tile_scale", cfg.sampling.tile_scale, 1, 16);
  warn_clamp("sampling.split_fraction", cfg.sampling.split_fraction, 0.0, 1.0);

  auto& c = cfg.classifier;
  if (c.trees <= 0) {
    spdlog::warn("[Config] classifier.trees ({}) must be > 0, clamping to 500",
                 c.trees);
    c.trees = 500;
  }
  warn_clamp("classifier.variables_per_split", c.variables_per_split, 0,
             1000);
  warn_clamp("classifier.min_leaf_population", c.min_leaf_population, 1,
             1000);
  if (c.bag_fraction <= 0.0f || c.bag_fraction > 1.0f) {
    spdlog::warn(
        "[Config] classifier.bag_fraction ({}) must be in (0, 1], clamping to "
        "1.0",
        c.bag_fraction);
    c.bag_fraction = 1.0f;
  }
  warn_clamp("classifier.max_depth", c.max_depth, 0, 1000);

  auto& p = cfg.post_filter;
  warn_clamp("post_filter.slope_threshold", p.slope_threshold, 0.0f, 30.0f);
  warn_clamp("post_filter.min_patch_size", p.min_patch_size, 0, 50);
  if (p.max_patch_size < p.min_patch_size || p.max_patch_size < 1) {
    spdlog::warn(
        "[Config] post_filter.max_patch_size ({}) must be >= max(1, "
        "min_patch_size), clamping to 100",
        p.max_patch_size);
    p.max_patch_size = 100;
  }

  if (cfg.evaluation.scale <= 0.0) {
    spdlog::warn("[Config] evaluation.scale ({}) must be > 0, using {}",
                 cfg.evaluation.scale, cfg.sampling.scale);
    cfg.evaluation.scale = cfg.sampling.scale;
  }
  warn_clamp("evaluation.tile_scale", cfg.evaluation.tile_scale, 1, 16);
  if (cfg.evaluation.max_pixels < 1.0) {
    spdlog::warn(
        "[Config] evaluation.max_pixels ({}) must be >= 1, clamping to 1e13",
        cfg.evaluation.max_pixels);
    cfg.evaluation.max_pixels = 1e13;
  }
}

}  // namespace detail

Config parseConfig(const YAML::Node& root) {
  auto cfg = detail::parse(root);
  detail::validate(cfg);
  return cfg;
}

Config loadConfig(const std::string& path) {
  try {
    return parseConfig(YAML::LoadFile(path));
  } catch (const YAML::Exception& e) {
    throw std::runtime_error("Failed to load config: " + path + " - " +
                             e.what());
  }
}

}  // namespace floodfusion
