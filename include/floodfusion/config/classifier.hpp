// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#ifndef FLOODFUSION_CONFIG_CLASSIFIER_HPP
#define FLOODFUSION_CONFIG_CLASSIFIER_HPP

#include <cstdint>

namespace floodfusion {

enum class ClassifierType { RandomForest };

namespace config {

/// Random forest hyper-parameters.
struct Classifier {
  ClassifierType type = ClassifierType::RandomForest;
  int trees = 500;
  int variables_per_split = 0;  ///< 0 = floor(sqrt(feature count))
  int min_leaf_population = 1;
  float bag_fraction = 1.0f;    ///< Bootstrap size relative to training set
  int max_depth = 0;            ///< 0 = unlimited
  uint64_t seed = 0;
};

}  // namespace config
}  // namespace floodfusion

#endif  // FLOODFUSION_CONFIG_CLASSIFIER_HPP
