// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * test_config.cpp
 *
 * Tests for YAML configuration and run request loading.
 */

#include <gtest/gtest.h>
#include <yaml-cpp/yaml.h>

#include <fstream>

#include "floodfusion/config/floodfusion.hpp"
#include "floodfusion/errors.hpp"
#include "floodfusion/pipeline/run_request.hpp"

using namespace floodfusion;

// ─── Helpers ─────────────────────────────────────────────────────────────────

namespace {

/// Write a temporary YAML file and return its path.
std::string writeTempYaml(const std::string& content,
                          const std::string& name = "test_config.yaml") {
  std::string path = "/tmp/" + name;
  std::ofstream fs(path);
  fs << content;
  return path;
}

}  // namespace

// ─── Loading Tests ───────────────────────────────────────────────────────────

TEST(ConfigLoadTest, LoadDefaultYaml) {
  auto cfg = loadConfig(FLOODFUSION_CONFIG_DIR "/default.yaml");

  EXPECT_EQ(cfg.sources.radar_collection, "COPERNICUS/S1_GRD");
  EXPECT_EQ(cfg.sources.optical_collection, "COPERNICUS/S2_SR");
  EXPECT_EQ(cfg.sources.dem, "USGS/SRTMGL1_003");
  EXPECT_EQ(cfg.sources.optical_bands.size(), 10u);
  EXPECT_EQ(cfg.classifier.type, ClassifierType::RandomForest);
  EXPECT_EQ(cfg.classifier.trees, 500);
  EXPECT_EQ(cfg.speckle.kernel_size, 7);
  EXPECT_DOUBLE_EQ(cfg.sampling.split_fraction, 0.7);
  EXPECT_EQ(cfg.sampling.tile_scale, 8);
  EXPECT_EQ(cfg.evaluation.tile_scale, 4);
  EXPECT_DOUBLE_EQ(cfg.evaluation.max_pixels, 1e13);

  ASSERT_EQ(cfg.visualization.radar_false_color.min.size(), 3u);
  EXPECT_FLOAT_EQ(cfg.visualization.radar_false_color.min[1], -25.0f);
  ASSERT_EQ(cfg.visualization.legend.size(), 1u);
  EXPECT_EQ(cfg.visualization.legend[0].label, "Flood/Water");
  EXPECT_EQ(cfg.visualization.legend[0].color, "#0000FF");
}

TEST(ConfigLoadTest, NonexistentFileThrows) {
  EXPECT_THROW(loadConfig("/nonexistent/path.yaml"), std::runtime_error);
}

TEST(ConfigLoadTest, EmptyYamlUsesDefaults) {
  auto cfg = loadConfig(writeTempYaml("# empty config\n", "ff_empty.yaml"));

  Config defaults;
  EXPECT_EQ(cfg.sources.polarisations, defaults.sources.polarisations);
  EXPECT_EQ(cfg.classifier.trees, defaults.classifier.trees);
  EXPECT_FLOAT_EQ(cfg.post_filter.slope_threshold,
                  defaults.post_filter.slope_threshold);
  EXPECT_EQ(cfg.log_level, "info");
}

TEST(ConfigLoadTest, PartialYamlPreservesDefaults) {
  auto cfg = loadConfig(writeTempYaml(
      "classifier:\n"
      "  trees: 50\n"
      "  seed: 7\n"
      "visualization:\n"
      "  optical_rgb:\n"
      "    max: 0.4\n",
      "ff_partial.yaml"));

  EXPECT_EQ(cfg.classifier.trees, 50);
  EXPECT_EQ(cfg.classifier.seed, 7u);

  Config defaults;
  EXPECT_EQ(cfg.classifier.min_leaf_population,
            defaults.classifier.min_leaf_population);
  EXPECT_EQ(cfg.visualization.optical_rgb.bands,
            defaults.visualization.optical_rgb.bands);
  ASSERT_EQ(cfg.visualization.optical_rgb.max.size(), 1u);
  EXPECT_FLOAT_EQ(cfg.visualization.optical_rgb.max[0], 0.4f);
}

TEST(ConfigLoadTest, UnknownClassifierFallsBack) {
  auto cfg = loadConfig(writeTempYaml("classifier:\n  type: svm\n",
                                      "ff_svm.yaml"));
  EXPECT_EQ(cfg.classifier.type, ClassifierType::RandomForest);
}

TEST(ConfigLoadTest, MalformedYamlThrows) {
  auto path = writeTempYaml("classifier: [trees: 5\n", "ff_malformed.yaml");
  EXPECT_THROW(loadConfig(path), std::runtime_error);
}

// ─── Validation Tests ───────────────────────────────────────────────────────

TEST(ConfigValidationTest, OutOfRangeValuesAreClamped) {
  auto cfg = parseConfig(YAML::Load(
      "speckle: {kernel_size: 4}\n"
      "sampling: {split_fraction: 1.5, tile_scale: 0}\n"
      "classifier: {trees: -3, bag_fraction: 0.0}\n"
      "post_filter: {slope_threshold: 45.0, min_patch_size: 80}\n"
      "evaluation: {scale: -1.0}\n"));

  EXPECT_EQ(cfg.speckle.kernel_size, 5);
  EXPECT_DOUBLE_EQ(cfg.sampling.split_fraction, 1.0);
  EXPECT_EQ(cfg.sampling.tile_scale, 1);
  EXPECT_EQ(cfg.classifier.trees, 500);
  EXPECT_FLOAT_EQ(cfg.classifier.bag_fraction, 1.0f);
  EXPECT_FLOAT_EQ(cfg.post_filter.slope_threshold, 30.0f);
  EXPECT_EQ(cfg.post_filter.min_patch_size, 50);
  EXPECT_DOUBLE_EQ(cfg.evaluation.scale, cfg.sampling.scale);
}

TEST(ConfigValidationTest, FatalInconsistenciesThrow) {
  EXPECT_THROW(parseConfig(YAML::Load("sources: {polarisations: [VV]}\n")),
               std::invalid_argument);
  EXPECT_THROW(parseConfig(YAML::Load("sources: {optical_bands: []}\n")),
               std::invalid_argument);
  EXPECT_THROW(parseConfig(YAML::Load("sources: {cloud_bit: 16}\n")),
               std::invalid_argument);
  EXPECT_THROW(parseConfig(YAML::Load("sampling: {scale: 0}\n")),
               std::invalid_argument);
}

// ─── Run request ────────────────────────────────────────────────────────────

TEST(RunRequestTest, ParsePolygonAoi) {
  const auto request = parseRunRequest(YAML::Load(
      "aoi:\n"
      "  frame_id: EPSG:32645\n"
      "  vertices: [[0, 0], [100, 0], [100, 50], [0, 50]]\n"
      "start_date: 2021-07-01\n"
      "training_asset: flood_points\n"
      "trees: 100\n"
      "slope_threshold: 3\n"));

  ASSERT_TRUE(request.aoi.has_value());
  EXPECT_EQ(request.aoi->frameId(), "EPSG:32645");
  EXPECT_NEAR(request.aoi->area(), 5000.0, 1e-9);
  EXPECT_EQ(request.start_date, "2021-07-01");
  EXPECT_EQ(request.end_date, "2021-07-31");
  EXPECT_EQ(request.training_asset, "flood_points");
  EXPECT_EQ(request.class_property, "Planet_flo");
  EXPECT_EQ(request.trees, 100);
  EXPECT_FLOAT_EQ(request.slope_threshold, 3.0f);
  EXPECT_EQ(request.min_patch_size, 8);
}

TEST(RunRequestTest, ParseRectangleAoi) {
  const auto request = parseRunRequest(YAML::Load(
      "aoi:\n"
      "  rectangle: {min: [10, 20], max: [30, 60]}\n"));
  ASSERT_TRUE(request.aoi.has_value());
  EXPECT_NEAR(request.aoi->area(), 800.0, 1e-9);
}

TEST(RunRequestTest, MissingAoiIsAllowed) {
  const auto request = parseRunRequest(YAML::Load("trees: 10\n"));
  EXPECT_FALSE(request.aoi.has_value());
  EXPECT_EQ(request.trees, 10);
}

TEST(RunRequestTest, InvalidAoiThrows) {
  EXPECT_THROW(parseRunRequest(YAML::Load("aoi: {vertices: [[0, 0], [1, 1]]}\n")),
               InputError);
  EXPECT_THROW(parseRunRequest(YAML::Load("aoi: {frame_id: EPSG:32645}\n")),
               std::runtime_error);
  EXPECT_THROW(loadRunRequest("/nonexistent/run.yaml"), std::runtime_error);
}
