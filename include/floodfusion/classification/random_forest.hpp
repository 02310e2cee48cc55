// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * random_forest.hpp
 *
 * Bagged ensemble of CART trees with per-split feature sampling.
 */

#ifndef FLOODFUSION_CLASSIFICATION_RANDOM_FOREST_HPP
#define FLOODFUSION_CLASSIFICATION_RANDOM_FOREST_HPP

#include <vector>

#include "floodfusion/classification/classifier.hpp"
#include "floodfusion/classification/decision_tree.hpp"

namespace floodfusion {

/**
 * @brief Random forest classifier.
 *
 * Each tree is grown on a bootstrap sample of bag_fraction × n rows and
 * considers variables_per_split random features at every node
 * (floor(sqrt(d)) when 0). Prediction is a majority vote; ties resolve to
 * the lowest class. Training is deterministic for a fixed seed.
 */
class RandomForest : public Classifier {
 public:
  explicit RandomForest(const config::Classifier& cfg = {});

  std::string name() const override { return "RandomForest"; }

  int numTrees() const { return cfg_.trees; }
  const std::vector<DecisionTree>& trees() const { return trees_; }

  /// Votes per class for one feature vector.
  std::vector<int> votes(const Eigen::VectorXf& features) const;

 protected:
  void fit(const Eigen::MatrixXf& X, const std::vector<int>& y) override;
  int predictOne(const Eigen::VectorXf& features) const override;

 private:
  config::Classifier cfg_;
  std::vector<DecisionTree> trees_;
  int num_classes_ = 2;
};

}  // namespace floodfusion

#endif  // FLOODFUSION_CLASSIFICATION_RANDOM_FOREST_HPP
