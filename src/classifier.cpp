// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * classifier.cpp
 */

#include "floodfusion/classification/classifier.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>

#include "floodfusion/classification/random_forest.hpp"
#include "floodfusion/errors.hpp"

namespace floodfusion {

void Classifier::train(const SampleSet& training,
                       const std::string& class_property,
                       const std::vector<std::string>& input_properties) {
  if (training.empty()) {
    throw SamplingError("Training", "No training samples to fit the " +
                                        name() + " classifier");
  }
  if (input_properties.empty()) {
    throw ComputationError("Training", "No input properties given");
  }

  // Column of each input property in the sampled feature vectors
  std::vector<int> columns;
  columns.reserve(input_properties.size());
  for (const auto& prop : input_properties) {
    const auto it = std::find(training.feature_names.begin(),
                              training.feature_names.end(), prop);
    if (it == training.feature_names.end()) {
      throw ComputationError("Training",
                             "Input property '" + prop + "' was not sampled");
    }
    columns.push_back(static_cast<int>(it - training.feature_names.begin()));
  }

  const int n = static_cast<int>(training.size());
  const int d = static_cast<int>(columns.size());
  Eigen::MatrixXf X(n, d);
  std::vector<int> y(n);
  for (int i = 0; i < n; ++i) {
    const auto& sample = training.samples[i];
    for (int k = 0; k < d; ++k) X(i, k) = sample.features(columns[k]);
    y[i] = sample.label;
  }

  trained_ = false;
  fit(X, y);
  class_property_ = class_property;
  input_properties_ = input_properties;
  trained_ = true;
  spdlog::debug("[Classifier] {} trained on {} samples, {} features", name(),
                n, d);
}

int Classifier::predict(const Eigen::VectorXf& features) const {
  if (!trained_) {
    throw ComputationError("Classify", name() + " classifier is not trained");
  }
  if (features.size() != static_cast<Eigen::Index>(input_properties_.size())) {
    throw ComputationError("Classify", "Expected " +
                                           std::to_string(
                                               input_properties_.size()) +
                                           " features, got " +
                                           std::to_string(features.size()));
  }
  return predictOne(features);
}

Raster classify(const Raster& stack, const Classifier& classifier) {
  if (!classifier.isTrained()) {
    throw ComputationError("Classify",
                           classifier.name() + " classifier is not trained");
  }

  const auto& inputs = classifier.inputProperties();
  std::vector<const grid_map::Matrix*> layers;
  layers.reserve(inputs.size());
  for (const auto& name : inputs) {
    if (!stack.hasBand(name)) {
      throw ComputationError("Classify",
                             "Stack is missing input band '" + name + "'");
    }
    layers.push_back(&stack.get(name));
  }

  Raster out = makeRasterLike(stack, {band::classification});
  auto& labels = out.get(band::classification);
  const auto& size = stack.getSize();
  Eigen::VectorXf x(static_cast<Eigen::Index>(layers.size()));

  // All bands share the buffer layout, so buffer indices are used directly
  for (int i = 0; i < size(0); ++i) {
    for (int j = 0; j < size(1); ++j) {
      bool valid = true;
      for (size_t k = 0; k < layers.size(); ++k) {
        const float v = (*layers[k])(i, j);
        if (!std::isfinite(v)) {
          valid = false;
          break;
        }
        x(static_cast<Eigen::Index>(k)) = v;
      }
      if (valid) labels(i, j) = static_cast<float>(classifier.predict(x));
    }
  }
  return out;
}

std::vector<int> classify(const SampleSet& samples,
                          const Classifier& classifier) {
  const auto& inputs = classifier.inputProperties();
  std::vector<int> columns;
  for (const auto& prop : inputs) {
    const auto it = std::find(samples.feature_names.begin(),
                              samples.feature_names.end(), prop);
    if (it == samples.feature_names.end()) {
      throw ComputationError("Classify",
                             "Samples are missing property '" + prop + "'");
    }
    columns.push_back(static_cast<int>(it - samples.feature_names.begin()));
  }

  std::vector<int> predictions;
  predictions.reserve(samples.size());
  Eigen::VectorXf x(static_cast<Eigen::Index>(columns.size()));
  for (const auto& sample : samples.samples) {
    for (size_t k = 0; k < columns.size(); ++k) {
      x(static_cast<Eigen::Index>(k)) = sample.features(columns[k]);
    }
    predictions.push_back(classifier.predict(x));
  }
  return predictions;
}

std::unique_ptr<Classifier> createClassifier(const config::Classifier& cfg) {
  switch (cfg.type) {
    case ClassifierType::RandomForest:
      return std::make_unique<RandomForest>(cfg);
    default:
      spdlog::warn("[Classifier] Unknown type ({}), falling back to "
                   "RandomForest",
                   static_cast<int>(cfg.type));
      return std::make_unique<RandomForest>(cfg);
  }
}

}  // namespace floodfusion
