// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * accuracy.cpp
 */

#include "floodfusion/evaluation/accuracy.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>

#include "floodfusion/errors.hpp"

namespace floodfusion {

ConfusionMatrix::ConfusionMatrix(int num_classes)
    : counts_(Counts::Zero(std::max(1, num_classes), std::max(1, num_classes))) {}

void ConfusionMatrix::add(int actual, int predicted, int64_t count) {
  const int k = numClasses();
  if (actual < 0 || actual >= k || predicted < 0 || predicted >= k) {
    throw ComputationError("Accuracy", "Class pair (" + std::to_string(actual) +
                                           ", " + std::to_string(predicted) +
                                           ") outside a " + std::to_string(k) +
                                           "-class matrix");
  }
  counts_(actual, predicted) += count;
}

double ConfusionMatrix::accuracy() const {
  const int64_t n = total();
  if (n == 0) return NAN;
  return static_cast<double>(counts_.trace()) / static_cast<double>(n);
}

double ConfusionMatrix::kappa() const {
  const int64_t n = total();
  if (n == 0) return NAN;

  const Eigen::MatrixXd p = counts_.cast<double>() / static_cast<double>(n);
  const double po = p.trace();
  const double pe = p.rowwise().sum().dot(p.colwise().sum().transpose());
  if (pe >= 1.0) return NAN;
  return (po - pe) / (1.0 - pe);
}

Eigen::VectorXd ConfusionMatrix::producersAccuracy() const {
  const int k = numClasses();
  Eigen::VectorXd out(k);
  for (int i = 0; i < k; ++i) {
    const int64_t row = counts_.row(i).sum();
    out(i) = row == 0 ? NAN
                      : static_cast<double>(counts_(i, i)) /
                            static_cast<double>(row);
  }
  return out;
}

Eigen::VectorXd ConfusionMatrix::consumersAccuracy() const {
  const int k = numClasses();
  Eigen::VectorXd out(k);
  for (int j = 0; j < k; ++j) {
    const int64_t col = counts_.col(j).sum();
    out(j) = col == 0 ? NAN
                      : static_cast<double>(counts_(j, j)) /
                            static_cast<double>(col);
  }
  return out;
}

std::string ConfusionMatrix::toString() const {
  std::ostringstream ss;
  ss << "[";
  for (int i = 0; i < numClasses(); ++i) {
    ss << (i ? ", [" : "[");
    for (int j = 0; j < numClasses(); ++j) {
      ss << (j ? ", " : "") << counts_(i, j);
    }
    ss << "]";
  }
  ss << "]";
  return ss.str();
}

ConfusionMatrix errorMatrix(const std::vector<int>& actual,
                            const std::vector<int>& predicted) {
  if (actual.size() != predicted.size()) {
    throw ComputationError("Accuracy", "Label count mismatch: " +
                                           std::to_string(actual.size()) +
                                           " actual, " +
                                           std::to_string(predicted.size()) +
                                           " predicted");
  }
  int max_label = 1;
  for (size_t i = 0; i < actual.size(); ++i) {
    if (actual[i] < 0 || predicted[i] < 0) {
      throw ComputationError("Accuracy", "Negative class label");
    }
    max_label = std::max({max_label, actual[i], predicted[i]});
  }

  ConfusionMatrix matrix(max_label + 1);
  for (size_t i = 0; i < actual.size(); ++i) {
    matrix.add(actual[i], predicted[i]);
  }
  return matrix;
}

}  // namespace floodfusion
