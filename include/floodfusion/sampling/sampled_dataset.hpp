// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * sampled_dataset.hpp
 *
 * Labelled feature vectors extracted from the stack at training points,
 * and their training / validation split.
 */

#ifndef FLOODFUSION_SAMPLING_SAMPLED_DATASET_HPP
#define FLOODFUSION_SAMPLING_SAMPLED_DATASET_HPP

#include <Eigen/Core>
#include <cstdint>
#include <string>
#include <vector>

#include "floodfusion/imagery/catalog.hpp"
#include "floodfusion/raster.hpp"

namespace floodfusion {

struct LabeledSample {
  std::string id;
  Eigen::VectorXf features;  ///< One value per stack band, in band order
  int label = 0;             ///< 0 = non-flood, 1 = flood
};

struct SampleSet {
  std::vector<std::string> feature_names;
  std::string label_property;
  std::vector<LabeledSample> samples;

  size_t size() const { return samples.size(); }
  bool empty() const { return samples.empty(); }

  /// Labels in sample order.
  std::vector<int> labels() const;
};

struct SampleSplit {
  SampleSet training;
  SampleSet validation;
};

/**
 * @brief Sample every stack band at each labelled point.
 *
 * Points outside the stack, over a masked pixel in any band, or without the
 * label property are dropped. Labels other than 0 or 1 are dropped with a
 * warning. The grid is processed in tile_scale × tile_scale tiles; the output
 * keeps the input point order for every tile scale.
 *
 * @throws InputError if no point carries the label property
 * @throws SamplingError if no valid sample remains
 */
SampleSet sampleRegions(const Raster& stack, const PointDataset& points,
                        const std::string& label_property,
                        int tile_scale = 1);

/// Stable value in [0, 1) from (seed, id), identical across runs.
double stableUniform(uint64_t seed, const std::string& id);

/**
 * @brief Split samples by a per-sample stable random value.
 *
 * value < fraction → training, otherwise validation. Disjoint and complete;
 * reproducible for the same seed and sample ids.
 */
SampleSplit splitSamples(const SampleSet& samples, double fraction = 0.7,
                         uint64_t seed = 0);

}  // namespace floodfusion

#endif  // FLOODFUSION_SAMPLING_SAMPLED_DATASET_HPP
