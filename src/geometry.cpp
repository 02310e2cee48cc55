// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#include "floodfusion/geometry.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>

#include "floodfusion/errors.hpp"

namespace floodfusion {

namespace {

constexpr double kVertexTolerance = 1e-9;

// Days from civil date (H. Hinnant's algorithm).
long daysFromCivil(int y, int m, int d) {
  y -= m <= 2;
  const long era = (y >= 0 ? y : y - 399) / 400;
  const long yoe = y - era * 400;
  const long doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
  const long doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
  return era * 146097 + doe - 719468;
}

void civilFromDays(long z, int& y, int& m, int& d) {
  z += 719468;
  const long era = (z >= 0 ? z : z - 146096) / 146097;
  const long doe = z - era * 146097;
  const long yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
  const long doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
  const long mp = (5 * doy + 2) / 153;
  d = static_cast<int>(doy - (153 * mp + 2) / 5 + 1);
  m = static_cast<int>(mp < 10 ? mp + 3 : mp - 9);
  y = static_cast<int>(yoe + era * 400 + (m <= 2));
}

bool isLeapYear(int y) { return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0; }

int daysInMonth(int y, int m) {
  static const int kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
  return (m == 2 && isLeapYear(y)) ? 29 : kDays[m - 1];
}

bool parseDigits(const std::string& text, size_t pos, size_t count,
                 int& value) {
  value = 0;
  for (size_t i = pos; i < pos + count; ++i) {
    if (!std::isdigit(static_cast<unsigned char>(text[i]))) return false;
    value = value * 10 + (text[i] - '0');
  }
  return true;
}

double cross(const grid_map::Position& o, const grid_map::Position& a,
             const grid_map::Position& b) {
  return (a.x() - o.x()) * (b.y() - o.y()) - (a.y() - o.y()) * (b.x() - o.x());
}

bool onSegment(const grid_map::Position& p, const grid_map::Position& q,
               const grid_map::Position& r) {
  return std::min(p.x(), r.x()) - kVertexTolerance <= q.x() &&
         q.x() <= std::max(p.x(), r.x()) + kVertexTolerance &&
         std::min(p.y(), r.y()) - kVertexTolerance <= q.y() &&
         q.y() <= std::max(p.y(), r.y()) + kVertexTolerance;
}

bool segmentsIntersect(const grid_map::Position& p1,
                       const grid_map::Position& p2,
                       const grid_map::Position& q1,
                       const grid_map::Position& q2) {
  const double d1 = cross(q1, q2, p1);
  const double d2 = cross(q1, q2, p2);
  const double d3 = cross(p1, p2, q1);
  const double d4 = cross(p1, p2, q2);
  if (((d1 > 0 && d2 < 0) || (d1 < 0 && d2 > 0)) &&
      ((d3 > 0 && d4 < 0) || (d3 < 0 && d4 > 0))) {
    return true;
  }
  if (std::abs(d1) <= kVertexTolerance && onSegment(q1, p1, q2)) return true;
  if (std::abs(d2) <= kVertexTolerance && onSegment(q1, p2, q2)) return true;
  if (std::abs(d3) <= kVertexTolerance && onSegment(p1, q1, p2)) return true;
  if (std::abs(d4) <= kVertexTolerance && onSegment(p1, q2, p2)) return true;
  return false;
}

double shoelace(const std::vector<grid_map::Position>& ring) {
  double twice_area = 0.0;
  const size_t n = ring.size();
  for (size_t i = 0; i < n; ++i) {
    const auto& a = ring[i];
    const auto& b = ring[(i + 1) % n];
    twice_area += a.x() * b.y() - b.x() * a.y();
  }
  return 0.5 * twice_area;
}

}  // namespace

// ─── Date ───────────────────────────────────────────────────────────────────

Date::Date(int year, int month, int day)
    : days_(daysFromCivil(year, month, day)) {}

int Date::year() const {
  int y, m, d;
  civilFromDays(days_, y, m, d);
  return y;
}

int Date::month() const {
  int y, m, d;
  civilFromDays(days_, y, m, d);
  return m;
}

int Date::day() const {
  int y, m, d;
  civilFromDays(days_, y, m, d);
  return d;
}

std::string Date::toString() const {
  int y, m, d;
  civilFromDays(days_, y, m, d);
  char buffer[16];
  std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02d", y, m, d);
  return buffer;
}

Date parseDate(const std::string& text) {
  int y = 0, m = 0, d = 0;
  const bool well_formed = text.size() == 10 && text[4] == '-' &&
                           text[7] == '-' && parseDigits(text, 0, 4, y) &&
                           parseDigits(text, 5, 2, m) &&
                           parseDigits(text, 8, 2, d);
  if (!well_formed) {
    throw InputError("Input", "Invalid date '" + text +
                                  "', expected YYYY-MM-DD");
  }
  if (m < 1 || m > 12 || d < 1 || d > daysInMonth(y, m)) {
    throw InputError("Input", "Invalid date '" + text + "'");
  }
  return Date(y, m, d);
}

TimeWindow makeTimeWindow(const Date& start, const Date& end) {
  if (!(start < end)) {
    throw InputError("Input", "Start date " + start.toString() +
                                  " must be before end date " +
                                  end.toString());
  }
  return TimeWindow{start, end};
}

// ─── AreaOfInterest ─────────────────────────────────────────────────────────

AreaOfInterest AreaOfInterest::rectangle(const grid_map::Position& min_corner,
                                         const grid_map::Position& max_corner,
                                         const std::string& frame_id) {
  return polygon({min_corner,
                  grid_map::Position(max_corner.x(), min_corner.y()),
                  max_corner,
                  grid_map::Position(min_corner.x(), max_corner.y())},
                 frame_id);
}

AreaOfInterest AreaOfInterest::polygon(
    const std::vector<grid_map::Position>& vertices,
    const std::string& frame_id) {
  std::vector<grid_map::Position> ring;
  ring.reserve(vertices.size());
  for (const auto& v : vertices) {
    if (!std::isfinite(v.x()) || !std::isfinite(v.y())) {
      throw InputError("Input", "AOI vertex is not finite");
    }
    if (!ring.empty() && (ring.back() - v).norm() <= kVertexTolerance) continue;
    ring.push_back(v);
  }
  // Drop the closing vertex of a closed ring.
  if (ring.size() > 1 && (ring.front() - ring.back()).norm() <= kVertexTolerance)
    ring.pop_back();

  if (ring.size() < 3) {
    throw InputError("Input", "AOI needs at least 3 distinct vertices");
  }
  if (std::abs(shoelace(ring)) <= kVertexTolerance) {
    throw InputError("Input", "AOI has zero area");
  }

  const size_t n = ring.size();
  for (size_t i = 0; i < n; ++i) {
    for (size_t j = i + 1; j < n; ++j) {
      // Skip edges sharing a vertex
      if (j == i + 1 || (i == 0 && j == n - 1)) continue;
      if (segmentsIntersect(ring[i], ring[(i + 1) % n], ring[j],
                            ring[(j + 1) % n])) {
        throw InputError("Input", "AOI polygon self-intersects");
      }
    }
  }

  AreaOfInterest aoi;
  aoi.vertices_ = ring;
  aoi.polygon_ = grid_map::Polygon(ring);
  aoi.polygon_.setFrameId(frame_id);
  aoi.frame_id_ = frame_id;
  return aoi;
}

bool AreaOfInterest::contains(const grid_map::Position& position) const {
  if (empty()) return false;
  return polygon_.isInside(position);
}

void AreaOfInterest::bounds(grid_map::Position& min_corner,
                            grid_map::Position& max_corner) const {
  min_corner = max_corner = grid_map::Position::Zero();
  if (empty()) return;
  min_corner = max_corner = vertices_.front();
  for (const auto& v : vertices_) {
    min_corner = min_corner.cwiseMin(v);
    max_corner = max_corner.cwiseMax(v);
  }
}

double AreaOfInterest::area() const {
  if (empty()) return 0.0;
  return std::abs(shoelace(vertices_));
}

Raster clipToAoi(const Raster& raster, const AreaOfInterest& aoi) {
  Raster out = raster;
  grid_map::Position position;
  for (grid_map::GridMapIterator it(out); !it.isPastEnd(); ++it) {
    out.getPosition(*it, position);
    if (aoi.contains(position)) continue;
    for (const auto& name : out.getLayers()) out.at(name, *it) = NAN;
  }
  return out;
}

}  // namespace floodfusion
