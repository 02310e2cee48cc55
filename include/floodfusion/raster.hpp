// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * raster.hpp
 *
 * Multi-band georeferenced raster built on grid_map.
 * Includes band name constants.
 */

#ifndef FLOODFUSION_RASTER_HPP
#define FLOODFUSION_RASTER_HPP

#include <cmath>
#include <string>
#include <utility>
#include <vector>

#include <grid_map_core/grid_map_core.hpp>

namespace floodfusion {

// ─── Band name constants ────────────────────────────────────────────────────

namespace band {

// Radar backscatter (dB)
constexpr auto VV = "VV";
constexpr auto VH = "VH";
constexpr auto VV_filtered = "VV_Filtered";
constexpr auto VH_filtered = "VH_Filtered";
constexpr auto ratio_filtered = "Ratio_Filtered";

// Optical quality band (bit 10 = opaque cloud, bit 11 = cirrus)
constexpr auto qa60 = "QA60";

// Terrain
constexpr auto elevation = "elevation";
constexpr auto slope = "slope";

// Products
constexpr auto classification = "classification";
constexpr auto flood = "flood";
constexpr auto patch_size = "patch_size";

}  // namespace band

// ─── MapIndexer ─────────────────────────────────────────────────────────────

class Raster;  // forward declaration

/**
 * @brief Lightweight helper for iterating over Raster grid cells.
 *
 * Handles the circular buffer index mapping internally so callers can iterate
 * with plain (row, col) loops and access Eigen matrices without knowing about
 * the underlying buffer layout. Row grows towards -x, col towards -y.
 *
 * Usage:
 * @code
 *   const auto idx = raster.indexer();
 *   const auto& vv = raster.get(band::VV);
 *
 *   for (int row = 0; row < idx.rows; ++row) {
 *     for (int col = 0; col < idx.cols; ++col) {
 *       auto [r, c] = idx(row, col);
 *       float val = vv(r, c);
 *
 *       for (const auto& [dr, dc] : idx.squareNeighbors(3)) {
 *         if (!idx.contains(row + dr, col + dc)) continue;
 *         auto [nr, nc] = idx(row + dr, col + dc);
 *         // use vv(nr, nc)
 *       }
 *     }
 *   }
 * @endcode
 */
struct MapIndexer {
  const int rows, cols;
  const float resolution;

  explicit MapIndexer(const Raster& raster);

  /// Grid (row, col) → matrix position for Eigen access.
  std::pair<int, int> operator()(int row, int col) const {
    int r = row + sr_;
    if (r >= rows) r -= rows;
    int c = col + sc_;
    if (c >= cols) c -= cols;
    return {r, c};
  }

  /// Matrix position (buffer index) → grid (row, col).
  std::pair<int, int> logical(const grid_map::Index& index) const {
    int row = index(0) - sr_;
    if (row < 0) row += rows;
    int col = index(1) - sc_;
    if (col < 0) col += cols;
    return {row, col};
  }

  /// Check if (row, col) is within [0, rows) × [0, cols).
  bool contains(int row, int col) const {
    return row >= 0 && row < rows && col >= 0 && col < cols;
  }

  struct Offset {
    int dr, dc;
  };

  /// Offsets of a size×size window centered on the cell (size is odd).
  /// @note Includes the center cell (dr=0, dc=0).
  static std::vector<Offset> squareNeighbors(int size) {
    std::vector<Offset> offsets;
    const int half = size / 2;
    offsets.reserve(static_cast<size_t>(size) * size);
    for (int dr = -half; dr <= half; ++dr) {
      for (int dc = -half; dc <= half; ++dc) {
        offsets.push_back({dr, dc});
      }
    }
    return offsets;
  }

 private:
  int sr_, sc_;
};

// ─── Raster ─────────────────────────────────────────────────────────────────

/**
 * @brief Multi-band raster on a single projected grid.
 *
 * Raster extends grid_map::GridMap: every band is a layer and all bands share
 * resolution, extent, center position and frame id. The frame id carries the
 * coordinate reference system (e.g. "EPSG:32645"); positions are metres.
 *
 * @note NaN marks a masked pixel. Band order is layer insertion order.
 */
class Raster : public grid_map::GridMap {
 public:
  Raster();

  explicit Raster(const std::vector<std::string>& bands);

  Raster(float width, float height, float resolution,
         const std::string& frame_id,
         const grid_map::Position& center = grid_map::Position::Zero());

  void setGeometry(float width, float height, float resolution,
                   const grid_map::Position& center =
                       grid_map::Position::Zero());

  bool isInitialized() const;

  const std::vector<std::string>& bandNames() const { return getLayers(); }

  size_t bandCount() const { return getLayers().size(); }

  bool hasBand(const std::string& name) const { return exists(name); }

  /// Add (or overwrite) a band filled with a constant. NaN = fully masked.
  void addBand(const std::string& name, float fill = NAN);

  /// Value at position. Returns NaN if outside, masked or band is missing.
  float valueAt(const std::string& name,
                const grid_map::Position& position) const;

  /// Value at buffer index. Returns NaN if out of range or band is missing.
  float valueAt(const std::string& name, const grid_map::Index& index) const;

  /// Number of finite cells in a band.
  size_t validPixelCount(const std::string& name) const;

  /// True if both rasters share size, resolution, position and buffer layout.
  bool sameGrid(const Raster& other) const;

  /// New raster with only the given bands, in the given order.
  /// @throws ComputationError if a band is missing.
  Raster select(const std::vector<std::string>& names) const;

  /// Concatenate the bands of another raster on the same grid.
  /// @throws ComputationError on grid mismatch or duplicate band name.
  Raster addBands(const Raster& other) const;

  /// Bounding box of the raster extent.
  void bounds(grid_map::Position& min_corner,
              grid_map::Position& max_corner) const;

  /// Create a MapIndexer for efficient grid iteration.
  MapIndexer indexer() const;
};

inline Raster::Raster() : grid_map::GridMap(std::vector<std::string>{}) {}

inline Raster::Raster(const std::vector<std::string>& bands)
    : grid_map::GridMap(bands) {}

inline Raster::Raster(float width, float height, float resolution,
                      const std::string& frame_id,
                      const grid_map::Position& center)
    : Raster() {
  setGeometry(width, height, resolution, center);
  setFrameId(frame_id);
}

inline void Raster::setGeometry(float width, float height, float resolution,
                                const grid_map::Position& center) {
  grid_map::GridMap::setGeometry(grid_map::Length(width, height), resolution,
                                 center);
  clearAll();
}

inline bool Raster::isInitialized() const {
  const auto& size = getSize();
  return size(0) > 0 && size(1) > 0;
}

inline void Raster::addBand(const std::string& name, float fill) {
  add(name, fill);
}

inline float Raster::valueAt(const std::string& name,
                             const grid_map::Position& position) const {
  if (!exists(name)) return NAN;
  grid_map::Index index;
  if (!getIndex(position, index)) return NAN;
  return at(name, index);
}

inline float Raster::valueAt(const std::string& name,
                             const grid_map::Index& index) const {
  if (!exists(name)) return NAN;
  const auto& size = getSize();
  if (index(0) < 0 || index(0) >= size(0) || index(1) < 0 ||
      index(1) >= size(1)) {
    return NAN;
  }
  return at(name, index);
}

inline size_t Raster::validPixelCount(const std::string& name) const {
  if (!exists(name)) return 0;
  return static_cast<size_t>(get(name).array().isFinite().count());
}

inline void Raster::bounds(grid_map::Position& min_corner,
                           grid_map::Position& max_corner) const {
  const grid_map::Position half = getLength().matrix() / 2.0;
  min_corner = getPosition() - half;
  max_corner = getPosition() + half;
}

// ─── MapIndexer inline definitions ──────────────────────────────────────────

inline MapIndexer::MapIndexer(const Raster& raster)
    : rows(raster.getSize()(0)),
      cols(raster.getSize()(1)),
      resolution(static_cast<float>(raster.getResolution())),
      sr_(raster.getStartIndex()(0)),
      sc_(raster.getStartIndex()(1)) {}

inline MapIndexer Raster::indexer() const { return MapIndexer(*this); }

// ─── Raster helpers ─────────────────────────────────────────────────────────

/// All-masked raster on the same grid (geometry, frame, timestamp).
Raster makeRasterLike(const Raster& reference,
                      const std::vector<std::string>& bands);

/// Sample bands of `source` onto the grid of `target` by nearest cell center.
/// Cells of the target outside the source extent are masked.
Raster resampleNearest(const Raster& source, const Raster& target,
                       const std::vector<std::string>& bands);

/// Copy of a raster where every band is masked wherever `band` != 1.
Raster selfMask(const Raster& raster, const std::string& band);

/// Position of an image pixel in north-up order (row 0 = north, col 0 = west).
grid_map::Position northUpPosition(const Raster& raster, int image_row,
                                   int image_col);

/// Image width (west→east cells) and height (north→south cells).
inline int imageWidth(const Raster& raster) { return raster.getSize()(0); }
inline int imageHeight(const Raster& raster) { return raster.getSize()(1); }

}  // namespace floodfusion

#endif  // FLOODFUSION_RASTER_HPP
