// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * decision_tree.hpp
 *
 * CART classification tree with Gini impurity, stored as a flat node array.
 */

#ifndef FLOODFUSION_CLASSIFICATION_DECISION_TREE_HPP
#define FLOODFUSION_CLASSIFICATION_DECISION_TREE_HPP

#include <Eigen/Core>
#include <random>
#include <vector>

namespace floodfusion {

struct TreeNode {
  int feature = -1;        ///< Split feature, -1 for a leaf
  float threshold = 0.0f;  ///< x[feature] <= threshold goes left
  int left = -1;
  int right = -1;
  int label = 0;           ///< Majority class of the node's samples
};

struct TreeParams {
  int variables_per_split = 0;  ///< Candidate features per node, 0 = all
  int min_leaf_population = 1;
  int max_depth = 0;            ///< 0 = unlimited
};

class DecisionTree {
 public:
  /**
   * @brief Grow the tree on a subset of rows.
   *
   * @param X Samples as rows, features as columns
   * @param y Labels in [0, num_classes)
   * @param rows Row indices to train on (duplicates allowed)
   * @param rng Random source for the per-node feature subsets
   */
  void fit(const Eigen::MatrixXf& X, const std::vector<int>& y,
           std::vector<int> rows, int num_classes, const TreeParams& params,
           std::mt19937_64& rng);

  int predict(const Eigen::VectorXf& x) const;

  bool empty() const { return nodes_.empty(); }
  size_t nodeCount() const { return nodes_.size(); }
  int depth() const;

  const std::vector<TreeNode>& nodes() const { return nodes_; }

 private:
  int build(const Eigen::MatrixXf& X, const std::vector<int>& y,
            std::vector<int>& rows, int depth, std::mt19937_64& rng);

  std::vector<TreeNode> nodes_;
  TreeParams params_;
  int num_classes_ = 2;
};

}  // namespace floodfusion

#endif  // FLOODFUSION_CLASSIFICATION_DECISION_TREE_HPP
