// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * test_geometry.cpp
 *
 * Tests for dates, time windows and area-of-interest polygons.
 */

#include <gtest/gtest.h>

#include "floodfusion/errors.hpp"
#include "floodfusion/geometry.hpp"

using namespace floodfusion;

// ─── Date ───────────────────────────────────────────────────────────────────

TEST(DateTest, ParseAndFormat) {
  const Date date = parseDate("2021-06-01");
  EXPECT_EQ(date.year(), 2021);
  EXPECT_EQ(date.month(), 6);
  EXPECT_EQ(date.day(), 1);
  EXPECT_EQ(date.toString(), "2021-06-01");
}

TEST(DateTest, EpochAndLeapDay) {
  EXPECT_EQ(Date(1970, 1, 1).daysSinceEpoch(), 0);
  EXPECT_EQ(parseDate("2020-02-29").toString(), "2020-02-29");
  EXPECT_EQ(parseDate("2021-03-01").daysSinceEpoch() -
                parseDate("2021-02-28").daysSinceEpoch(),
            1);
}

TEST(DateTest, MalformedDatesThrow) {
  EXPECT_THROW(parseDate(""), InputError);
  EXPECT_THROW(parseDate("2021/06/01"), InputError);
  EXPECT_THROW(parseDate("2021-6-1"), InputError);
  EXPECT_THROW(parseDate("2021-13-01"), InputError);
  EXPECT_THROW(parseDate("2021-02-29"), InputError);
  EXPECT_THROW(parseDate("abcd-ef-gh"), InputError);
}

TEST(TimeWindowTest, HalfOpenInterval) {
  const auto window =
      makeTimeWindow(parseDate("2021-06-01"), parseDate("2021-07-31"));
  EXPECT_TRUE(window.contains(parseDate("2021-06-01")));
  EXPECT_TRUE(window.contains(parseDate("2021-07-30")));
  EXPECT_FALSE(window.contains(parseDate("2021-07-31")));
  EXPECT_FALSE(window.contains(parseDate("2021-05-31")));
}

TEST(TimeWindowTest, StartMustPrecedeEnd) {
  const Date day = parseDate("2021-06-01");
  EXPECT_THROW(makeTimeWindow(day, day), InputError);
  EXPECT_THROW(makeTimeWindow(parseDate("2021-07-01"), day), InputError);
}

// ─── AreaOfInterest ─────────────────────────────────────────────────────────

TEST(AreaOfInterestTest, RectangleAreaAndBounds) {
  const auto aoi = AreaOfInterest::rectangle(grid_map::Position(0.0, 0.0),
                                             grid_map::Position(200.0, 100.0),
                                             "EPSG:32645");
  EXPECT_FALSE(aoi.empty());
  EXPECT_EQ(aoi.frameId(), "EPSG:32645");
  EXPECT_NEAR(aoi.area(), 20000.0, 1e-9);

  grid_map::Position min_corner, max_corner;
  aoi.bounds(min_corner, max_corner);
  EXPECT_NEAR(min_corner.x(), 0.0, 1e-9);
  EXPECT_NEAR(max_corner.y(), 100.0, 1e-9);

  EXPECT_TRUE(aoi.contains(grid_map::Position(50.0, 50.0)));
  EXPECT_FALSE(aoi.contains(grid_map::Position(250.0, 50.0)));
}

TEST(AreaOfInterestTest, ClosedRingIsAccepted) {
  const auto aoi = AreaOfInterest::polygon(
      {grid_map::Position(0, 0), grid_map::Position(10, 0),
       grid_map::Position(0, 10), grid_map::Position(0, 0)});
  EXPECT_EQ(aoi.vertices().size(), 3u);
  EXPECT_NEAR(aoi.area(), 50.0, 1e-9);
}

TEST(AreaOfInterestTest, DegeneratePolygonsThrow) {
  // Too few vertices
  EXPECT_THROW(AreaOfInterest::polygon(
                   {grid_map::Position(0, 0), grid_map::Position(1, 1)}),
               InputError);
  // Collinear
  EXPECT_THROW(AreaOfInterest::polygon({grid_map::Position(0, 0),
                                        grid_map::Position(1, 1),
                                        grid_map::Position(2, 2)}),
               InputError);
  // Bow tie
  EXPECT_THROW(AreaOfInterest::polygon(
                   {grid_map::Position(0, 0), grid_map::Position(10, 10),
                    grid_map::Position(10, 0), grid_map::Position(0, 10)}),
               InputError);
  // Non-finite vertex
  EXPECT_THROW(AreaOfInterest::polygon({grid_map::Position(0, 0),
                                        grid_map::Position(NAN, 1),
                                        grid_map::Position(2, 0)}),
               InputError);
}

TEST(AreaOfInterestTest, DefaultIsEmpty) {
  AreaOfInterest aoi;
  EXPECT_TRUE(aoi.empty());
  EXPECT_DOUBLE_EQ(aoi.area(), 0.0);
  EXPECT_FALSE(aoi.contains(grid_map::Position(0, 0)));
}

TEST(AreaOfInterestTest, ClipMasksCellsOutside) {
  Raster raster(10.0f, 10.0f, 1.0f, "EPSG:32645",
                grid_map::Position(5.0, 5.0));
  raster.addBand(band::VV, -10.0f);

  // Left half of the raster
  const auto aoi = AreaOfInterest::rectangle(grid_map::Position(0.0, 0.0),
                                             grid_map::Position(5.0, 10.0));
  const Raster clipped = clipToAoi(raster, aoi);
  EXPECT_EQ(clipped.validPixelCount(band::VV), 50u);
  EXPECT_FLOAT_EQ(clipped.valueAt(band::VV, grid_map::Position(2.5, 5.5)),
                  -10.0f);
  EXPECT_TRUE(
      std::isnan(clipped.valueAt(band::VV, grid_map::Position(7.5, 5.5))));
}
