// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * sampled_dataset.cpp
 *
 * Tiled point sampling and the hash-based random split.
 */

#include "floodfusion/sampling/sampled_dataset.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <optional>

#include "floodfusion/errors.hpp"

namespace floodfusion {

namespace {

uint64_t fnv1a(const std::string& text) {
  uint64_t hash = 0xcbf29ce484222325ull;
  for (char ch : text) {
    hash ^= static_cast<uint8_t>(ch);
    hash *= 0x100000001b3ull;
  }
  return hash;
}

uint64_t splitmix64(uint64_t x) {
  x += 0x9e3779b97f4a7c15ull;
  x = (x ^ (x >> 30)) * 0xbf58476d1ce4e5b9ull;
  x = (x ^ (x >> 27)) * 0x94d049bb133111ebull;
  return x ^ (x >> 31);
}

}  // namespace

std::vector<int> SampleSet::labels() const {
  std::vector<int> out;
  out.reserve(samples.size());
  for (const auto& s : samples) out.push_back(s.label);
  return out;
}

SampleSet sampleRegions(const Raster& stack, const PointDataset& points,
                        const std::string& label_property, int tile_scale) {
  if (!points.hasProperty(label_property)) {
    throw InputError("Sampling", "Class column '" + label_property +
                                     "' not found in the training data");
  }
  tile_scale = std::max(1, tile_scale);

  const auto& bands = stack.bandNames();
  const auto idx = stack.indexer();
  const int tile_rows = (idx.rows + tile_scale - 1) / tile_scale;
  const int tile_cols = (idx.cols + tile_scale - 1) / tile_scale;

  // Bucket points by tile
  const auto& features = points.points();
  std::vector<std::vector<size_t>> tiles(
      static_cast<size_t>(tile_scale) * tile_scale);
  size_t outside = 0;
  std::vector<grid_map::Index> cell(features.size());
  for (size_t k = 0; k < features.size(); ++k) {
    if (!stack.getIndex(features[k].position, cell[k])) {
      ++outside;
      continue;
    }
    const auto [row, col] = idx.logical(cell[k]);
    tiles[static_cast<size_t>(row / tile_rows) * tile_scale + col / tile_cols]
        .push_back(k);
  }

  std::vector<const grid_map::Matrix*> layers;
  for (const auto& name : bands) layers.push_back(&stack.get(name));

  std::vector<std::optional<LabeledSample>> results(features.size());
  size_t masked = 0, unlabeled = 0, non_binary = 0;

  for (const auto& tile : tiles) {
    for (size_t k : tile) {
      const auto& point = features[k];
      const auto label_it = point.properties.find(label_property);
      if (label_it == point.properties.end()) {
        ++unlabeled;
        continue;
      }
      const double label = label_it->second;
      if (label != 0.0 && label != 1.0) {
        ++non_binary;
        continue;
      }

      LabeledSample sample;
      sample.id = point.id;
      sample.label = static_cast<int>(label);
      sample.features.resize(static_cast<Eigen::Index>(layers.size()));
      bool valid = true;
      for (size_t b = 0; b < layers.size() && valid; ++b) {
        const float v = (*layers[b])(cell[k](0), cell[k](1));
        valid = std::isfinite(v);
        sample.features(static_cast<Eigen::Index>(b)) = v;
      }
      if (!valid) {
        ++masked;
        continue;
      }
      results[k] = std::move(sample);
    }
  }

  if (non_binary > 0) {
    spdlog::warn("[Sampling] Dropped {} points with labels other than 0/1",
                 non_binary);
  }

  SampleSet set;
  set.feature_names = bands;
  set.label_property = label_property;
  for (auto& r : results) {
    if (r) set.samples.push_back(std::move(*r));
  }

  spdlog::debug("[Sampling] {} samples ({} outside, {} masked, {} unlabeled)",
                set.size(), outside, masked, unlabeled);
  if (set.empty()) {
    throw SamplingError("Sampling",
                        "No training samples overlap valid pixels of the "
                        "image stack");
  }
  return set;
}

double stableUniform(uint64_t seed, const std::string& id) {
  const uint64_t bits = splitmix64(seed ^ splitmix64(fnv1a(id)));
  // Top 53 bits → [0, 1)
  return static_cast<double>(bits >> 11) * (1.0 / 9007199254740992.0);
}

SampleSplit splitSamples(const SampleSet& samples, double fraction,
                         uint64_t seed) {
  SampleSplit split;
  split.training.feature_names = samples.feature_names;
  split.training.label_property = samples.label_property;
  split.validation.feature_names = samples.feature_names;
  split.validation.label_property = samples.label_property;

  for (const auto& sample : samples.samples) {
    if (stableUniform(seed, sample.id) < fraction) {
      split.training.samples.push_back(sample);
    } else {
      split.validation.samples.push_back(sample);
    }
  }

  spdlog::debug("[Sampling] Split {} samples: {} training, {} validation",
                samples.size(), split.training.size(),
                split.validation.size());
  return split;
}

}  // namespace floodfusion
