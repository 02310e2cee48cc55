// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * decision_tree.cpp
 *
 * Recursive CART growth. Split search per candidate feature:
 *   sort node rows by value, sweep every boundary between distinct values,
 *   keep the mid-point threshold with the lowest weighted Gini impurity.
 */

#include "floodfusion/classification/decision_tree.hpp"

#include <algorithm>
#include <numeric>
#include <utility>

namespace floodfusion {

namespace {

double gini(const std::vector<int>& counts, int total) {
  if (total == 0) return 0.0;
  double sum_sq = 0.0;
  for (int c : counts) {
    const double p = static_cast<double>(c) / total;
    sum_sq += p * p;
  }
  return 1.0 - sum_sq;
}

// Majority class; ties go to the lowest class id
int majority(const std::vector<int>& counts) {
  return static_cast<int>(std::max_element(counts.begin(), counts.end()) -
                          counts.begin());
}

struct Split {
  int feature = -1;
  float threshold = 0.0f;
  double impurity = 0.0;
};

}  // namespace

void DecisionTree::fit(const Eigen::MatrixXf& X, const std::vector<int>& y,
                       std::vector<int> rows, int num_classes,
                       const TreeParams& params, std::mt19937_64& rng) {
  nodes_.clear();
  params_ = params;
  params_.min_leaf_population = std::max(1, params_.min_leaf_population);
  num_classes_ = std::max(1, num_classes);
  if (rows.empty()) return;
  build(X, y, rows, 0, rng);
}

int DecisionTree::build(const Eigen::MatrixXf& X, const std::vector<int>& y,
                        std::vector<int>& rows, int depth,
                        std::mt19937_64& rng) {
  const int node_id = static_cast<int>(nodes_.size());
  nodes_.emplace_back();

  const int n = static_cast<int>(rows.size());
  std::vector<int> counts(num_classes_, 0);
  for (int r : rows) ++counts[y[r]];
  nodes_[node_id].label = majority(counts);

  const double parent_impurity = gini(counts, n);
  const int min_leaf = params_.min_leaf_population;
  const bool depth_reached =
      params_.max_depth > 0 && depth >= params_.max_depth;
  if (parent_impurity <= 0.0 || depth_reached || n < 2 * min_leaf) {
    return node_id;
  }

  // Random candidate features (partial Fisher-Yates)
  const int d = static_cast<int>(X.cols());
  int mtry = params_.variables_per_split > 0
                 ? std::min(params_.variables_per_split, d)
                 : d;
  std::vector<int> features(d);
  std::iota(features.begin(), features.end(), 0);
  for (int k = 0; k < mtry; ++k) {
    std::uniform_int_distribution<int> pick(k, d - 1);
    std::swap(features[k], features[pick(rng)]);
  }

  Split best;
  best.impurity = parent_impurity;
  std::vector<std::pair<float, int>> column(n);
  std::vector<int> left_counts(num_classes_);
  std::vector<int> right_counts(num_classes_);

  for (int k = 0; k < mtry; ++k) {
    const int f = features[k];
    for (int i = 0; i < n; ++i) column[i] = {X(rows[i], f), y[rows[i]]};
    std::sort(column.begin(), column.end());

    std::fill(left_counts.begin(), left_counts.end(), 0);
    right_counts = counts;
    for (int i = 0; i < n - 1; ++i) {
      ++left_counts[column[i].second];
      --right_counts[column[i].second];

      const int n_left = i + 1;
      const int n_right = n - n_left;
      if (column[i].first == column[i + 1].first) continue;
      if (n_left < min_leaf || n_right < min_leaf) continue;

      const double impurity =
          (n_left * gini(left_counts, n_left) +
           n_right * gini(right_counts, n_right)) /
          n;
      if (impurity < best.impurity) {
        const float lo = column[i].first;
        const float hi = column[i + 1].first;
        float threshold = lo + (hi - lo) * 0.5f;
        if (!(threshold < hi)) threshold = lo;
        best = {f, threshold, impurity};
      }
    }
  }

  if (best.feature < 0) return node_id;

  std::vector<int> left_rows, right_rows;
  left_rows.reserve(n);
  right_rows.reserve(n);
  for (int r : rows) {
    (X(r, best.feature) <= best.threshold ? left_rows : right_rows)
        .push_back(r);
  }
  rows.clear();
  rows.shrink_to_fit();

  // nodes_ may reallocate during recursion: assign through the index
  const int left = build(X, y, left_rows, depth + 1, rng);
  const int right = build(X, y, right_rows, depth + 1, rng);
  nodes_[node_id].feature = best.feature;
  nodes_[node_id].threshold = best.threshold;
  nodes_[node_id].left = left;
  nodes_[node_id].right = right;
  return node_id;
}

int DecisionTree::predict(const Eigen::VectorXf& x) const {
  if (nodes_.empty()) return 0;
  int id = 0;
  while (nodes_[id].feature >= 0) {
    const auto& node = nodes_[id];
    id = x(node.feature) <= node.threshold ? node.left : node.right;
  }
  return nodes_[id].label;
}

int DecisionTree::depth() const {
  if (nodes_.empty()) return 0;
  int max_depth = 0;
  std::vector<std::pair<int, int>> stack = {{0, 0}};
  while (!stack.empty()) {
    const auto [id, d] = stack.back();
    stack.pop_back();
    max_depth = std::max(max_depth, d);
    if (nodes_[id].feature >= 0) {
      stack.push_back({nodes_[id].left, d + 1});
      stack.push_back({nodes_[id].right, d + 1});
    }
  }
  return max_depth;
}

}  // namespace floodfusion
