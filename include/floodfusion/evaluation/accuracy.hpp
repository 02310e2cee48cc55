// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * accuracy.hpp
 *
 * Confusion matrix and agreement statistics for validation samples.
 */

#ifndef FLOODFUSION_EVALUATION_ACCURACY_HPP
#define FLOODFUSION_EVALUATION_ACCURACY_HPP

#include <Eigen/Core>
#include <cstdint>
#include <string>
#include <vector>

namespace floodfusion {

/**
 * @brief K×K error matrix, rows = actual class, columns = predicted class.
 */
class ConfusionMatrix {
 public:
  using Counts = Eigen::Matrix<int64_t, Eigen::Dynamic, Eigen::Dynamic>;

  explicit ConfusionMatrix(int num_classes = 2);

  /// Record one (actual, predicted) pair.
  /// @throws ComputationError if a class is outside [0, numClasses())
  void add(int actual, int predicted, int64_t count = 1);

  int64_t at(int actual, int predicted) const {
    return counts_(actual, predicted);
  }
  int64_t total() const { return counts_.sum(); }
  int numClasses() const { return static_cast<int>(counts_.rows()); }
  const Counts& counts() const { return counts_; }

  /// Correct / total. NaN when empty.
  double accuracy() const;

  /// Cohen's kappa (po - pe) / (1 - pe). NaN when empty or pe == 1.
  double kappa() const;

  /// Per actual class: correct / row total (NaN for an empty row).
  Eigen::VectorXd producersAccuracy() const;

  /// Per predicted class: correct / column total (NaN for an empty column).
  Eigen::VectorXd consumersAccuracy() const;

  std::string toString() const;

 private:
  Counts counts_;
};

/**
 * @brief Build the error matrix of paired labels.
 *
 * The matrix holds max(2, largest label + 1) classes.
 *
 * @throws ComputationError on size mismatch or negative labels
 */
ConfusionMatrix errorMatrix(const std::vector<int>& actual,
                            const std::vector<int>& predicted);

}  // namespace floodfusion

#endif  // FLOODFUSION_EVALUATION_ACCURACY_HPP
