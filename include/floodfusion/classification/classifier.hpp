// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * classifier.hpp
 *
 * Supervised pixel classifier interface and image/sample application.
 */

#ifndef FLOODFUSION_CLASSIFICATION_CLASSIFIER_HPP
#define FLOODFUSION_CLASSIFICATION_CLASSIFIER_HPP

#include <Eigen/Core>
#include <memory>
#include <string>
#include <vector>

#include "floodfusion/config/classifier.hpp"
#include "floodfusion/raster.hpp"
#include "floodfusion/sampling/sampled_dataset.hpp"

namespace floodfusion {

/**
 * @brief Abstract base class for supervised classifiers.
 *
 * train() picks the input_properties columns out of the sample set (in the
 * given order) and hands the design matrix to fit(). predict() expects a
 * feature vector in inputProperties() order.
 */
class Classifier {
 public:
  virtual ~Classifier() = default;

  /**
   * @brief Fit the model on labelled samples.
   *
   * @param training Samples with feature values named by feature_names
   * @param class_property Name of the label column (informational)
   * @param input_properties Feature columns used for training and prediction
   *
   * @throws SamplingError if the training set is empty
   * @throws ComputationError if an input property is not a sampled feature
   */
  void train(const SampleSet& training, const std::string& class_property,
             const std::vector<std::string>& input_properties);

  /// Predicted class of one feature vector.
  /// @throws ComputationError if the model is not trained
  int predict(const Eigen::VectorXf& features) const;

  bool isTrained() const { return trained_; }

  const std::vector<std::string>& inputProperties() const {
    return input_properties_;
  }

  const std::string& classProperty() const { return class_property_; }

  virtual std::string name() const = 0;

 protected:
  /// @param X Samples as rows, features as columns
  /// @param y Class label per row
  virtual void fit(const Eigen::MatrixXf& X, const std::vector<int>& y) = 0;

  virtual int predictOne(const Eigen::VectorXf& features) const = 0;

 private:
  bool trained_ = false;
  std::string class_property_;
  std::vector<std::string> input_properties_;
};

/**
 * @brief Classify every pixel of a stack.
 *
 * Reads the classifier's input properties as bands. A pixel where any of them
 * is masked stays masked in the output.
 *
 * @return Raster with a single band `classification`
 * @throws ComputationError if a band is missing or the model is not trained
 */
Raster classify(const Raster& stack, const Classifier& classifier);

/// Per-sample predictions, in sample order.
std::vector<int> classify(const SampleSet& samples,
                          const Classifier& classifier);

/// Factory: create classifier from config
std::unique_ptr<Classifier> createClassifier(const config::Classifier& cfg);

}  // namespace floodfusion

#endif  // FLOODFUSION_CLASSIFICATION_CLASSIFIER_HPP
