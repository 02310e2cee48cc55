// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * test_accuracy.cpp
 *
 * Tests for the error matrix statistics and area reductions.
 */

#include <gtest/gtest.h>

#include <cmath>

#include "floodfusion/errors.hpp"
#include "floodfusion/evaluation/accuracy.hpp"
#include "floodfusion/evaluation/area.hpp"

using namespace floodfusion;

// ─── ConfusionMatrix ────────────────────────────────────────────────────────

TEST(ConfusionMatrixTest, PerfectAgreement) {
  ConfusionMatrix matrix;
  matrix.add(0, 0, 5);
  matrix.add(1, 1, 5);
  EXPECT_EQ(matrix.total(), 10);
  EXPECT_DOUBLE_EQ(matrix.accuracy(), 1.0);
  EXPECT_DOUBLE_EQ(matrix.kappa(), 1.0);
  EXPECT_EQ(matrix.toString(), "[[5, 0], [0, 5]]");
}

TEST(ConfusionMatrixTest, ChanceAgreement) {
  ConfusionMatrix matrix;
  matrix.add(0, 0, 5);
  matrix.add(0, 1, 5);
  matrix.add(1, 0, 5);
  matrix.add(1, 1, 5);
  EXPECT_DOUBLE_EQ(matrix.accuracy(), 0.5);
  EXPECT_NEAR(matrix.kappa(), 0.0, 1e-12);
}

TEST(ConfusionMatrixTest, KappaFromMarginals) {
  // po = 0.7, pe = 0.5·0.6 + 0.5·0.4 = 0.5 → kappa = 0.4
  ConfusionMatrix matrix;
  matrix.add(0, 0, 4);
  matrix.add(0, 1, 1);
  matrix.add(1, 0, 2);
  matrix.add(1, 1, 3);
  EXPECT_DOUBLE_EQ(matrix.accuracy(), 0.7);
  EXPECT_NEAR(matrix.kappa(), 0.4, 1e-12);

  const Eigen::VectorXd producers = matrix.producersAccuracy();
  EXPECT_DOUBLE_EQ(producers(0), 0.8);
  EXPECT_DOUBLE_EQ(producers(1), 0.6);
  const Eigen::VectorXd consumers = matrix.consumersAccuracy();
  EXPECT_DOUBLE_EQ(consumers(0), 4.0 / 6.0);
  EXPECT_DOUBLE_EQ(consumers(1), 0.75);
}

TEST(ConfusionMatrixTest, EmptyIsUndefined) {
  ConfusionMatrix matrix;
  EXPECT_EQ(matrix.total(), 0);
  EXPECT_TRUE(std::isnan(matrix.accuracy()));
  EXPECT_TRUE(std::isnan(matrix.kappa()));
  EXPECT_TRUE(std::isnan(matrix.producersAccuracy()(0)));
}

TEST(ConfusionMatrixTest, SingleClassKappaIsUndefined) {
  ConfusionMatrix matrix;
  matrix.add(1, 1, 4);
  EXPECT_DOUBLE_EQ(matrix.accuracy(), 1.0);
  EXPECT_TRUE(std::isnan(matrix.kappa()));
}

TEST(ConfusionMatrixTest, OutOfRangeClassThrows) {
  ConfusionMatrix matrix;
  EXPECT_THROW(matrix.add(2, 0), ComputationError);
  EXPECT_THROW(matrix.add(0, -1), ComputationError);
}

TEST(ErrorMatrixTest, FromLabelLists) {
  const auto matrix = errorMatrix({0, 0, 1, 1, 1}, {0, 1, 1, 1, 0});
  EXPECT_EQ(matrix.numClasses(), 2);
  EXPECT_EQ(matrix.at(0, 0), 1);
  EXPECT_EQ(matrix.at(0, 1), 1);
  EXPECT_EQ(matrix.at(1, 0), 1);
  EXPECT_EQ(matrix.at(1, 1), 2);
  EXPECT_DOUBLE_EQ(matrix.accuracy(), 0.6);

  EXPECT_EQ(errorMatrix({0, 2}, {0, 1}).numClasses(), 3);
  EXPECT_EQ(errorMatrix({}, {}).total(), 0);
}

TEST(ErrorMatrixTest, InvalidInputThrows) {
  EXPECT_THROW(errorMatrix({0, 1}, {0}), ComputationError);
  EXPECT_THROW(errorMatrix({0, -1}, {0, 0}), ComputationError);
}

// ─── Area ───────────────────────────────────────────────────────────────────

class AreaTest : public ::testing::Test {
 protected:
  Raster mask;
  AreaOfInterest aoi;

  void SetUp() override {
    // 1 km x 1 km at 10m with the left half (x < 500) flooded
    mask = Raster(1000.0f, 1000.0f, 10.0f, "EPSG:32645",
                  grid_map::Position(500.0, 500.0));
    mask.addBand(band::flood, 0.0f);
    grid_map::Position p;
    for (grid_map::GridMapIterator it(mask); !it.isPastEnd(); ++it) {
      mask.getPosition(*it, p);
      if (p.x() < 500.0) mask.at(band::flood, *it) = 1.0f;
    }
    aoi = AreaOfInterest::rectangle(grid_map::Position(0, 0),
                                    grid_map::Position(1000, 1000),
                                    "EPSG:32645");
  }
};

TEST_F(AreaTest, HalfFloodedAoi) {
  EXPECT_NEAR(aoiAreaHectares(aoi), 100.0, 1e-9);
  EXPECT_NEAR(floodAreaHectares(mask, aoi), 50.0, 1e-6);
}

TEST_F(AreaTest, IndependentOfTileScale) {
  ReductionParams params;
  params.tile_scale = 1;
  const double single = floodAreaHectares(mask, aoi, params);
  params.tile_scale = 7;
  EXPECT_NEAR(floodAreaHectares(mask, aoi, params), single, 1e-9);
}

TEST_F(AreaTest, OnlyPixelsInsideAoiCount) {
  const auto quarter = AreaOfInterest::rectangle(
      grid_map::Position(0, 0), grid_map::Position(500, 500), "EPSG:32645");
  EXPECT_NEAR(floodAreaHectares(mask, quarter), 25.0, 1e-6);
}

TEST_F(AreaTest, MaskedAndZeroPixelsDoNotCount) {
  mask.get(band::flood).setConstant(NAN);
  EXPECT_DOUBLE_EQ(floodAreaHectares(mask, aoi), 0.0);
}

TEST_F(AreaTest, CoarserReductionScale) {
  ReductionParams params;
  params.scale = 20.0;
  EXPECT_NEAR(floodAreaHectares(mask, aoi, params), 50.0, 1e-6);
}

TEST_F(AreaTest, ErrorCases) {
  ReductionParams params;
  params.max_pixels = 100;
  EXPECT_THROW(floodAreaHectares(mask, aoi, params), ComputationError);

  params = ReductionParams{};
  params.scale = 0.0;
  EXPECT_THROW(floodAreaHectares(mask, aoi, params), ComputationError);

  EXPECT_THROW(floodAreaHectares(mask, AreaOfInterest{}), ComputationError);

  Raster no_flood(10.0f, 10.0f, 1.0f, "EPSG:32645");
  no_flood.addBand(band::classification, 1.0f);
  EXPECT_THROW(floodAreaHectares(no_flood, aoi), ComputationError);
}
