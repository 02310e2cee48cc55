// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * geometry.hpp
 *
 * Dates, time windows and the area of interest.
 */

#ifndef FLOODFUSION_GEOMETRY_HPP
#define FLOODFUSION_GEOMETRY_HPP

#include <string>
#include <vector>

#include <grid_map_core/Polygon.hpp>
#include <grid_map_core/TypeDefs.hpp>

#include "floodfusion/raster.hpp"

namespace floodfusion {

// ─── Date ───────────────────────────────────────────────────────────────────

/// Civil (proleptic Gregorian) date, stored as days since 1970-01-01.
class Date {
 public:
  Date() = default;
  Date(int year, int month, int day);

  int year() const;
  int month() const;
  int day() const;
  long daysSinceEpoch() const { return days_; }

  /// "YYYY-MM-DD"
  std::string toString() const;

  bool operator==(const Date& o) const { return days_ == o.days_; }
  bool operator!=(const Date& o) const { return days_ != o.days_; }
  bool operator<(const Date& o) const { return days_ < o.days_; }
  bool operator<=(const Date& o) const { return days_ <= o.days_; }

 private:
  long days_ = 0;
};

/// Parse "YYYY-MM-DD". @throws InputError if unparseable or not a real date.
Date parseDate(const std::string& text);

/// Half-open interval [start, end).
struct TimeWindow {
  Date start;
  Date end;

  bool contains(const Date& date) const {
    return start <= date && date < end;
  }
};

/// @throws InputError unless start < end.
TimeWindow makeTimeWindow(const Date& start, const Date& end);

// ─── AreaOfInterest ─────────────────────────────────────────────────────────

/**
 * @brief Simple closed polygon in the raster CRS (projected metres).
 *
 * Created through the validating factories only. The ring is stored open
 * (the first vertex is not repeated).
 */
class AreaOfInterest {
 public:
  AreaOfInterest() = default;

  /// Axis-aligned rectangle. @throws InputError if degenerate.
  static AreaOfInterest rectangle(const grid_map::Position& min_corner,
                                  const grid_map::Position& max_corner,
                                  const std::string& frame_id = "");

  /// @throws InputError on fewer than 3 distinct vertices, zero area or
  ///         self-intersection.
  static AreaOfInterest polygon(const std::vector<grid_map::Position>& vertices,
                                const std::string& frame_id = "");

  bool empty() const { return vertices_.empty(); }

  bool contains(const grid_map::Position& position) const;

  void bounds(grid_map::Position& min_corner,
              grid_map::Position& max_corner) const;

  /// Planar area in m² (shoelace).
  double area() const;

  const std::vector<grid_map::Position>& vertices() const { return vertices_; }
  const grid_map::Polygon& polygon() const { return polygon_; }
  const std::string& frameId() const { return frame_id_; }

 private:
  std::vector<grid_map::Position> vertices_;
  grid_map::Polygon polygon_;
  std::string frame_id_;
};

/// Copy of `raster` with every cell whose center lies outside the AOI masked.
Raster clipToAoi(const Raster& raster, const AreaOfInterest& aoi);

}  // namespace floodfusion

#endif  // FLOODFUSION_GEOMETRY_HPP
