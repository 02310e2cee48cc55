// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * catalog.hpp
 *
 * Scene collections, labelled point datasets and the catalog interface
 * that serves them.
 */

#ifndef FLOODFUSION_IMAGERY_CATALOG_HPP
#define FLOODFUSION_IMAGERY_CATALOG_HPP

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "floodfusion/geometry.hpp"
#include "floodfusion/raster.hpp"

namespace YAML {
class Node;
}

namespace floodfusion {

// ─── Scenes ─────────────────────────────────────────────────────────────────

/// One acquisition with its metadata.
struct Scene {
  std::string id;
  Date date;
  std::map<std::string, std::string> properties;
  std::map<std::string, std::vector<std::string>> list_properties;
  Raster raster;
};

/**
 * @brief Ordered set of scenes with metadata filters.
 *
 * Filters return new collections; the source collection is never modified.
 */
class SceneCollection {
 public:
  SceneCollection() = default;
  explicit SceneCollection(std::vector<Scene> scenes)
      : scenes_(std::move(scenes)) {}

  /// Scenes acquired inside the half-open window.
  SceneCollection filterDate(const TimeWindow& window) const;

  /// Scenes whose footprint intersects the AOI bounding box.
  SceneCollection filterBounds(const AreaOfInterest& aoi) const;

  /// Scenes where properties[key] == value.
  SceneCollection filterEquals(const std::string& key,
                               const std::string& value) const;

  /// Scenes where list_properties[key] contains value.
  SceneCollection filterListContains(const std::string& key,
                                     const std::string& value) const;

  /// Replace every scene raster by fn(scene).
  template <typename Fn>
  SceneCollection map(Fn&& fn) const {
    std::vector<Scene> out;
    out.reserve(scenes_.size());
    for (const auto& scene : scenes_) {
      Scene mapped = scene;
      mapped.raster = fn(scene);
      out.push_back(std::move(mapped));
    }
    return SceneCollection(std::move(out));
  }

  void add(Scene scene) { scenes_.push_back(std::move(scene)); }

  size_t size() const { return scenes_.size(); }
  bool empty() const { return scenes_.empty(); }

  std::vector<Scene>::const_iterator begin() const { return scenes_.begin(); }
  std::vector<Scene>::const_iterator end() const { return scenes_.end(); }
  const std::vector<Scene>& scenes() const { return scenes_; }

 private:
  template <typename Pred>
  SceneCollection filter(Pred&& pred) const {
    std::vector<Scene> out;
    for (const auto& scene : scenes_) {
      if (pred(scene)) out.push_back(scene);
    }
    return SceneCollection(std::move(out));
  }

  std::vector<Scene> scenes_;
};

// ─── Point datasets ─────────────────────────────────────────────────────────

/// Property name reserved for the feature index; hidden from listings.
constexpr auto kSystemIndexProperty = "system:index";

struct LabeledPoint {
  std::string id;
  grid_map::Position position;
  std::map<std::string, double> properties;
  std::map<std::string, std::string> text_properties;  ///< Not usable as labels
};

class PointDataset {
 public:
  PointDataset() = default;
  PointDataset(std::vector<LabeledPoint> points, std::string frame_id)
      : points_(std::move(points)), frame_id_(std::move(frame_id)) {}

  /// Property names (numeric and text) of the first feature, sorted, without
  /// the reserved index.
  std::vector<std::string> listProperties() const;

  /// True if at least one feature carries the property (numeric or text).
  bool hasProperty(const std::string& name) const;

  void add(LabeledPoint point) { points_.push_back(std::move(point)); }

  size_t size() const { return points_.size(); }
  bool empty() const { return points_.empty(); }
  const std::vector<LabeledPoint>& points() const { return points_; }
  const std::string& frameId() const { return frame_id_; }

 private:
  std::vector<LabeledPoint> points_;
  std::string frame_id_;
};

/**
 * @brief Parse a point dataset from YAML.
 *
 * @code
 *   frame_id: EPSG:32645
 *   features:
 *     - {id: "0", x: 500100.0, y: 3000100.0, properties: {Planet_flo: 1}}
 * @endcode
 * Features without an id get their list index. Non-numeric property values
 * are kept as text.
 *
 * @throws std::runtime_error on malformed input.
 */
PointDataset parsePointDataset(const YAML::Node& root);
PointDataset loadPointDataset(const std::string& path);

// ─── Catalog ────────────────────────────────────────────────────────────────

/**
 * @brief Read-only source of imagery and training data.
 *
 * Lookups return std::nullopt for unknown ids; the require* helpers turn
 * that into a ComputationError. Implementations must allow concurrent const
 * calls.
 */
class DataCatalog {
 public:
  using Ptr = std::shared_ptr<DataCatalog>;

  virtual ~DataCatalog() = default;

  virtual std::optional<SceneCollection> imageCollection(
      const std::string& id) const = 0;

  virtual std::optional<Raster> image(const std::string& id) const = 0;

  virtual std::optional<PointDataset> featureCollection(
      const std::string& id) const = 0;

  SceneCollection requireImageCollection(const std::string& id) const;
  Raster requireImage(const std::string& id) const;
  PointDataset requireFeatureCollection(const std::string& id) const;
};

/// Catalog held in memory; filled by tests or from a manifest.
class InMemoryCatalog : public DataCatalog {
 public:
  using Ptr = std::shared_ptr<InMemoryCatalog>;

  InMemoryCatalog& addScene(const std::string& collection_id, Scene scene);
  InMemoryCatalog& addImage(const std::string& id, Raster raster);
  InMemoryCatalog& addFeatureCollection(const std::string& id,
                                        PointDataset points);

  std::optional<SceneCollection> imageCollection(
      const std::string& id) const override;
  std::optional<Raster> image(const std::string& id) const override;
  std::optional<PointDataset> featureCollection(
      const std::string& id) const override;

 private:
  std::map<std::string, SceneCollection> collections_;
  std::map<std::string, Raster> images_;
  std::map<std::string, PointDataset> feature_collections_;
};

/**
 * @brief Build an InMemoryCatalog from a YAML manifest.
 *
 * @code
 *   collections:
 *     COPERNICUS/S1_GRD:
 *       - id: S1A_20210615
 *         file: s1/20210615.npz
 *         date: 2021-06-15
 *         properties: {instrumentMode: IW, orbitProperties_pass: DESCENDING}
 *         list_properties: {transmitterReceiverPolarisation: [VV, VH]}
 *   images:
 *     USGS/SRTMGL1_003: dem.npz
 *   feature_collections:
 *     users/me/flood_points: points.yaml
 * @endcode
 * Relative paths are resolved against the manifest directory. Rasters are
 * .npz files (io::loadNpz), point datasets are YAML (loadPointDataset).
 *
 * @throws std::runtime_error if the manifest or a referenced file is
 *         unreadable.
 */
InMemoryCatalog::Ptr loadCatalogManifest(const std::string& path);

}  // namespace floodfusion

#endif  // FLOODFUSION_IMAGERY_CATALOG_HPP
