// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * test_post_filter.cpp
 */

#include <gtest/gtest.h>

#include <cmath>

#include "floodfusion/errors.hpp"
#include "floodfusion/postprocess/post_filter.hpp"

using namespace floodfusion;

class PostFilterTest : public ::testing::Test {
 protected:
  Raster classified;
  Raster slope;
  PostFilterParams params;

  void SetUp() override {
    // 10m x 10m at 1m, centered at origin
    classified = Raster(10.0f, 10.0f, 1.0f, "EPSG:32645");
    classified.addBand(band::classification, 0.0f);
    slope = makeRasterLike(classified, {band::slope});
    slope.get(band::slope).setZero();

    params.slope_threshold = 5.0f;
    params.min_patch_size = 8;
  }

  void set(Raster& raster, const std::string& name, double x, double y,
           float value) {
    grid_map::Index index;
    ASSERT_TRUE(raster.getIndex(grid_map::Position(x, y), index));
    raster.at(name, index) = value;
  }

  /// 2 x 5 block of flood pixels in the +x/+y quadrant.
  void addBlob() {
    for (int i = 0; i < 2; ++i) {
      for (int j = 0; j < 5; ++j) {
        set(classified, band::classification, 2.5 + i, -0.5 + j, 1.0f);
      }
    }
  }

  float floodAt(const Raster& flood, double x, double y) const {
    return flood.valueAt(band::flood, grid_map::Position(x, y));
  }
};

// ─── connectedPixelCount ────────────────────────────────────────────────────

TEST_F(PostFilterTest, CountsPatchesOfEqualValue) {
  addBlob();
  set(classified, band::classification, -3.5, -3.5, 1.0f);

  const Raster counts = connectedPixelCount(classified, band::classification);
  ASSERT_TRUE(counts.hasBand(band::patch_size));
  EXPECT_FLOAT_EQ(counts.valueAt(band::patch_size,
                                 grid_map::Position(2.5, -0.5)),
                  10.0f);
  EXPECT_FLOAT_EQ(counts.valueAt(band::patch_size,
                                 grid_map::Position(-3.5, -3.5)),
                  1.0f);
  // Background is one patch of 89, capped
  EXPECT_FLOAT_EQ(counts.valueAt(band::patch_size,
                                 grid_map::Position(-0.5, -0.5)),
                  89.0f);
  const Raster capped =
      connectedPixelCount(classified, band::classification, 50);
  EXPECT_FLOAT_EQ(capped.valueAt(band::patch_size,
                                 grid_map::Position(-0.5, -0.5)),
                  50.0f);
}

TEST_F(PostFilterTest, DiagonalNeighboursDependOnConnectivity) {
  set(classified, band::classification, 0.5, 0.5, 1.0f);
  set(classified, band::classification, 1.5, 1.5, 1.0f);

  const Raster eight = connectedPixelCount(classified, band::classification,
                                           100, true);
  const Raster four = connectedPixelCount(classified, band::classification,
                                          100, false);
  EXPECT_FLOAT_EQ(eight.valueAt(band::patch_size, grid_map::Position(0.5, 0.5)),
                  2.0f);
  EXPECT_FLOAT_EQ(four.valueAt(band::patch_size, grid_map::Position(0.5, 0.5)),
                  1.0f);
}

TEST_F(PostFilterTest, MaskedPixelsHaveNoCount) {
  set(classified, band::classification, 0.5, 0.5, NAN);
  const Raster counts = connectedPixelCount(classified, band::classification);
  EXPECT_TRUE(std::isnan(
      counts.valueAt(band::patch_size, grid_map::Position(0.5, 0.5))));
  EXPECT_EQ(counts.validPixelCount(band::patch_size), 99u);
}

// ─── applyPostFilter ────────────────────────────────────────────────────────

TEST_F(PostFilterTest, RemovesSmallPatchesKeepsLargeOnes) {
  addBlob();
  set(classified, band::classification, -3.5, -3.5, 1.0f);

  const Raster flood = applyPostFilter(classified, slope, params);
  ASSERT_TRUE(flood.hasBand(band::flood));
  EXPECT_EQ(flood.bandCount(), 1u);
  EXPECT_FLOAT_EQ(floodAt(flood, 2.5, -0.5), 1.0f);
  EXPECT_FLOAT_EQ(floodAt(flood, 3.5, 3.5), 1.0f);
  EXPECT_FLOAT_EQ(floodAt(flood, -3.5, -3.5), 0.0f);
  EXPECT_FLOAT_EQ(floodAt(flood, -0.5, -0.5), 0.0f);
  EXPECT_EQ((flood.get(band::flood).array() == 1.0f).count(), 10);
}

TEST_F(PostFilterTest, ZeroPatchSizeKeepsSinglePixels) {
  set(classified, band::classification, -3.5, -3.5, 1.0f);
  params.min_patch_size = 0;
  const Raster flood = applyPostFilter(classified, slope, params);
  EXPECT_FLOAT_EQ(floodAt(flood, -3.5, -3.5), 1.0f);
}

TEST_F(PostFilterTest, PatchCapBelowMinimumKeepsLargePatches) {
  // 4 x 10 block: 40 pixels
  for (int i = 0; i < 4; ++i) {
    for (int j = 0; j < 10; ++j) {
      set(classified, band::classification, 0.5 + i, -4.5 + j, 1.0f);
    }
  }
  // 2 x 5 block: 10 pixels, not touching the large one
  for (int i = 0; i < 2; ++i) {
    for (int j = 0; j < 5; ++j) {
      set(classified, band::classification, -3.5 + i, -0.5 + j, 1.0f);
    }
  }
  params.max_patch_size = 20;
  params.min_patch_size = 30;

  const Raster flood = applyPostFilter(classified, slope, params);
  EXPECT_FLOAT_EQ(floodAt(flood, 0.5, -4.5), 1.0f);
  EXPECT_FLOAT_EQ(floodAt(flood, 3.5, 4.5), 1.0f);
  EXPECT_FLOAT_EQ(floodAt(flood, -3.5, -0.5), 0.0f);
  EXPECT_EQ((flood.get(band::flood).array() == 1.0f).count(), 40);
}

TEST_F(PostFilterTest, SteepTerrainIsMasked) {
  addBlob();
  slope.get(band::slope).setConstant(10.0f);
  // One flat pixel inside the blob
  set(slope, band::slope, 2.5, -0.5, 5.0f);

  const Raster flood = applyPostFilter(classified, slope, params);
  EXPECT_FLOAT_EQ(floodAt(flood, 2.5, -0.5), 1.0f);
  EXPECT_TRUE(std::isnan(floodAt(flood, 3.5, 3.5)));
  EXPECT_TRUE(std::isnan(floodAt(flood, -0.5, -0.5)));
  EXPECT_EQ(flood.validPixelCount(band::flood), 1u);
}

TEST_F(PostFilterTest, MaskedInputsStayMasked) {
  set(classified, band::classification, 0.5, 0.5, NAN);
  set(slope, band::slope, -0.5, 0.5, NAN);
  const Raster flood = applyPostFilter(classified, slope, params);
  EXPECT_TRUE(std::isnan(floodAt(flood, 0.5, 0.5)));
  EXPECT_TRUE(std::isnan(floodAt(flood, -0.5, 0.5)));
  EXPECT_EQ(flood.validPixelCount(band::flood), 98u);
}

TEST_F(PostFilterTest, InvalidParamsThrow) {
  params.slope_threshold = 31.0f;
  EXPECT_THROW(applyPostFilter(classified, slope, params), InputError);
  params.slope_threshold = -1.0f;
  EXPECT_THROW(validatePostFilterParams(params), InputError);
  params.slope_threshold = 5.0f;
  params.min_patch_size = 51;
  EXPECT_THROW(validatePostFilterParams(params), InputError);
  params.min_patch_size = -1;
  EXPECT_THROW(validatePostFilterParams(params), InputError);

  params.min_patch_size = 50;
  params.slope_threshold = 30.0f;
  EXPECT_NO_THROW(validatePostFilterParams(params));
}

TEST_F(PostFilterTest, GridMismatchThrows) {
  Raster other(20.0f, 20.0f, 1.0f, "EPSG:32645");
  other.addBand(band::slope, 0.0f);
  EXPECT_THROW(applyPostFilter(classified, other, params), ComputationError);

  Raster no_slope = makeRasterLike(classified, {"elevation"});
  EXPECT_THROW(applyPostFilter(classified, no_slope, params),
               ComputationError);
}
