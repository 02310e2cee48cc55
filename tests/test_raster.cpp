// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * test_raster.cpp
 *
 * Unit tests for Raster band handling, grid helpers and resampling.
 */

#include <gtest/gtest.h>

#include "floodfusion/errors.hpp"
#include "floodfusion/raster.hpp"

using namespace floodfusion;

// ─── Fixture ────────────────────────────────────────────────────────────────

class RasterTest : public ::testing::Test {
 protected:
  Raster raster;

  void SetUp() override {
    // 10m x 6m, 1m resolution → 10x6 grid
    raster = Raster(10.0f, 6.0f, 1.0f, "EPSG:32645",
                    grid_map::Position(100.0, 200.0));
  }
};

// ─── Construction ───────────────────────────────────────────────────────────

TEST_F(RasterTest, GeometryAndFrame) {
  EXPECT_TRUE(raster.isInitialized());
  EXPECT_EQ(imageWidth(raster), 10);
  EXPECT_EQ(imageHeight(raster), 6);
  EXPECT_EQ(raster.getFrameId(), "EPSG:32645");
  EXPECT_EQ(raster.bandCount(), 0u);

  grid_map::Position min_corner, max_corner;
  raster.bounds(min_corner, max_corner);
  EXPECT_NEAR(min_corner.x(), 95.0, 1e-6);
  EXPECT_NEAR(max_corner.x(), 105.0, 1e-6);
  EXPECT_NEAR(min_corner.y(), 197.0, 1e-6);
  EXPECT_NEAR(max_corner.y(), 203.0, 1e-6);
}

TEST(RasterBasicTest, DefaultIsUninitialized) {
  Raster empty;
  EXPECT_FALSE(empty.isInitialized());
  EXPECT_EQ(empty.bandCount(), 0u);
}

TEST_F(RasterTest, AddBandDefaultsToMasked) {
  raster.addBand(band::VV);
  ASSERT_TRUE(raster.hasBand(band::VV));
  EXPECT_EQ(raster.validPixelCount(band::VV), 0u);

  raster.addBand(band::VH, -15.0f);
  EXPECT_EQ(raster.validPixelCount(band::VH), 60u);
  EXPECT_FLOAT_EQ(raster.valueAt(band::VH, grid_map::Position(100.0, 200.0)),
                  -15.0f);
}

TEST_F(RasterTest, ValueAtOutsideOrMissingIsNan) {
  raster.addBand(band::VV, 1.0f);
  EXPECT_TRUE(std::isnan(raster.valueAt(band::VV, grid_map::Position(0, 0))));
  EXPECT_TRUE(std::isnan(
      raster.valueAt("missing", grid_map::Position(100.0, 200.0))));
  EXPECT_TRUE(std::isnan(raster.valueAt(band::VV, grid_map::Index(50, 0))));
}

// ─── Band selection ─────────────────────────────────────────────────────────

TEST_F(RasterTest, SelectKeepsRequestedOrder) {
  raster.addBand("B2", 2.0f);
  raster.addBand("B3", 3.0f);
  raster.addBand("B4", 4.0f);

  const Raster rgb = raster.select({"B4", "B3", "B2"});
  ASSERT_EQ(rgb.bandCount(), 3u);
  EXPECT_EQ(rgb.bandNames()[0], "B4");
  EXPECT_EQ(rgb.bandNames()[2], "B2");
  EXPECT_TRUE(rgb.sameGrid(raster));
}

TEST_F(RasterTest, SelectMissingBandThrows) {
  raster.addBand("B2", 2.0f);
  EXPECT_THROW(raster.select({"B8"}), ComputationError);
}

TEST_F(RasterTest, AddBandsConcatenates) {
  raster.addBand("B2", 2.0f);
  Raster other = makeRasterLike(raster, {band::VV});
  other.get(band::VV).setConstant(-10.0f);

  const Raster stack = raster.addBands(other);
  ASSERT_EQ(stack.bandCount(), 2u);
  EXPECT_EQ(stack.bandNames()[1], band::VV);
  EXPECT_EQ(stack.validPixelCount(band::VV), 60u);
}

TEST_F(RasterTest, AddBandsRejectsDuplicatesAndOtherGrids) {
  raster.addBand("B2", 2.0f);
  EXPECT_THROW(raster.addBands(raster), ComputationError);

  Raster other(10.0f, 6.0f, 2.0f, "EPSG:32645",
               grid_map::Position(100.0, 200.0));
  other.addBand(band::VV, 1.0f);
  EXPECT_THROW(raster.addBands(other), ComputationError);
}

// ─── Helpers ────────────────────────────────────────────────────────────────

TEST_F(RasterTest, ResampleNearestToCoarserGrid) {
  raster.addBand(band::elevation);
  auto& elev = raster.get(band::elevation);
  for (int i = 0; i < elev.rows(); ++i) {
    for (int j = 0; j < elev.cols(); ++j) elev(i, j) = static_cast<float>(i);
  }

  // Target grid larger than the source: outside cells stay masked
  Raster target(20.0f, 6.0f, 2.0f, "EPSG:32645",
                grid_map::Position(100.5, 200.5));
  const Raster resampled = resampleNearest(raster, target, {band::elevation});
  EXPECT_TRUE(resampled.sameGrid(target));

  // Cell center of both grids
  grid_map::Position inside(100.5, 200.5);
  EXPECT_FLOAT_EQ(resampled.valueAt(band::elevation, inside),
                  raster.valueAt(band::elevation, inside));
  EXPECT_TRUE(std::isnan(
      resampled.valueAt(band::elevation, grid_map::Position(109.0, 200.5))));
}

TEST_F(RasterTest, SelfMaskKeepsOnlyOnes) {
  raster.addBand(band::flood, 0.0f);
  raster.addBand(band::VV, -12.0f);
  grid_map::Index index;
  ASSERT_TRUE(raster.getIndex(grid_map::Position(100.5, 200.5), index));
  raster.at(band::flood, index) = 1.0f;

  const Raster masked = selfMask(raster, band::flood);
  EXPECT_EQ(masked.validPixelCount(band::flood), 1u);
  EXPECT_EQ(masked.validPixelCount(band::VV), 1u);
  EXPECT_FLOAT_EQ(masked.at(band::VV, index), -12.0f);
}

TEST_F(RasterTest, NorthUpPositionCorners) {
  grid_map::Position min_corner, max_corner;
  raster.bounds(min_corner, max_corner);

  const auto north_west = northUpPosition(raster, 0, 0);
  EXPECT_NEAR(north_west.x(), min_corner.x() + 0.5, 1e-6);
  EXPECT_NEAR(north_west.y(), max_corner.y() - 0.5, 1e-6);

  const auto south_east =
      northUpPosition(raster, imageHeight(raster) - 1, imageWidth(raster) - 1);
  EXPECT_NEAR(south_east.x(), max_corner.x() - 0.5, 1e-6);
  EXPECT_NEAR(south_east.y(), min_corner.y() + 0.5, 1e-6);
}

TEST_F(RasterTest, IndexerRoundTripsAfterMove) {
  raster.addBand(band::VV, 0.0f);
  raster.move(grid_map::Position(103.0, 201.0));
  const auto idx = raster.indexer();
  for (int row = 0; row < idx.rows; ++row) {
    for (int col = 0; col < idx.cols; ++col) {
      const auto [r, c] = idx(row, col);
      const auto [lr, lc] = idx.logical(grid_map::Index(r, c));
      EXPECT_EQ(lr, row);
      EXPECT_EQ(lc, col);
    }
  }
}
