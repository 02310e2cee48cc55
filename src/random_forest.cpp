// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * random_forest.cpp
 */

#include "floodfusion/classification/random_forest.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <random>

#include "floodfusion/errors.hpp"

namespace floodfusion {

RandomForest::RandomForest(const config::Classifier& cfg) : cfg_(cfg) {
  if (cfg_.trees <= 0) {
    throw InputError("Training", "Number of trees must be positive");
  }
}

void RandomForest::fit(const Eigen::MatrixXf& X, const std::vector<int>& y) {
  const int n = static_cast<int>(X.rows());
  const int d = static_cast<int>(X.cols());

  for (int label : y) {
    if (label < 0) {
      throw ComputationError("Training", "Negative class label " +
                                             std::to_string(label));
    }
  }
  num_classes_ = std::max(2, *std::max_element(y.begin(), y.end()) + 1);

  TreeParams params;
  params.variables_per_split =
      cfg_.variables_per_split > 0
          ? std::min(cfg_.variables_per_split, d)
          : std::max(1, static_cast<int>(std::floor(std::sqrt(double(d)))));
  params.min_leaf_population = std::max(1, cfg_.min_leaf_population);
  params.max_depth = cfg_.max_depth;

  const double bag = std::clamp(static_cast<double>(cfg_.bag_fraction), 0.0, 1.0);
  const int bag_size =
      std::max(1, static_cast<int>(std::lround(bag * n)));

  std::mt19937_64 rng(cfg_.seed);
  std::uniform_int_distribution<int> draw(0, n - 1);

  trees_.assign(cfg_.trees, DecisionTree{});
  std::vector<int> rows(bag_size);
  for (auto& tree : trees_) {
    for (auto& r : rows) r = draw(rng);
    tree.fit(X, y, rows, num_classes_, params, rng);
  }

  spdlog::debug("[RandomForest] {} trees, {} candidate features per split, "
                "{} rows per bag",
                trees_.size(), params.variables_per_split, bag_size);
}

std::vector<int> RandomForest::votes(const Eigen::VectorXf& features) const {
  std::vector<int> counts(num_classes_, 0);
  for (const auto& tree : trees_) {
    const int label = tree.predict(features);
    if (label >= 0 && label < num_classes_) ++counts[label];
  }
  return counts;
}

int RandomForest::predictOne(const Eigen::VectorXf& features) const {
  const auto counts = votes(features);
  // First maximum: ties resolve to the lowest class
  return static_cast<int>(std::max_element(counts.begin(), counts.end()) -
                          counts.begin());
}

}  // namespace floodfusion
