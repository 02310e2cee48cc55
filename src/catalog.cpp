// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * catalog.cpp
 *
 * Scene filtering, point datasets and the manifest-backed catalog.
 */

#include "floodfusion/imagery/catalog.hpp"

#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <filesystem>

#include "floodfusion/errors.hpp"
#include "floodfusion/io/npz.hpp"

namespace floodfusion {

// ─── SceneCollection ────────────────────────────────────────────────────────

SceneCollection SceneCollection::filterDate(const TimeWindow& window) const {
  return filter([&](const Scene& s) { return window.contains(s.date); });
}

SceneCollection SceneCollection::filterBounds(const AreaOfInterest& aoi) const {
  grid_map::Position aoi_min, aoi_max;
  aoi.bounds(aoi_min, aoi_max);
  return filter([&](const Scene& s) {
    if (!s.raster.isInitialized()) return false;
    grid_map::Position min_corner, max_corner;
    s.raster.bounds(min_corner, max_corner);
    return min_corner.x() < aoi_max.x() && aoi_min.x() < max_corner.x() &&
           min_corner.y() < aoi_max.y() && aoi_min.y() < max_corner.y();
  });
}

SceneCollection SceneCollection::filterEquals(const std::string& key,
                                              const std::string& value) const {
  return filter([&](const Scene& s) {
    const auto it = s.properties.find(key);
    return it != s.properties.end() && it->second == value;
  });
}

SceneCollection SceneCollection::filterListContains(
    const std::string& key, const std::string& value) const {
  return filter([&](const Scene& s) {
    const auto it = s.list_properties.find(key);
    return it != s.list_properties.end() &&
           std::find(it->second.begin(), it->second.end(), value) !=
               it->second.end();
  });
}

// ─── PointDataset ───────────────────────────────────────────────────────────

std::vector<std::string> PointDataset::listProperties() const {
  std::vector<std::string> names;
  if (points_.empty()) return names;
  const auto& first = points_.front();
  for (const auto& [name, value] : first.properties) {
    if (name != kSystemIndexProperty) names.push_back(name);
  }
  for (const auto& [name, value] : first.text_properties) {
    if (name != kSystemIndexProperty) names.push_back(name);
  }
  std::sort(names.begin(), names.end());
  return names;
}

bool PointDataset::hasProperty(const std::string& name) const {
  return std::any_of(points_.begin(), points_.end(),
                     [&](const LabeledPoint& p) {
                       return p.properties.count(name) > 0 ||
                              p.text_properties.count(name) > 0;
                     });
}

PointDataset parsePointDataset(const YAML::Node& root) {
  const auto features = root["features"];
  if (!features || !features.IsSequence()) {
    throw std::runtime_error("Point dataset has no 'features' list");
  }

  std::string frame_id;
  if (root["frame_id"]) frame_id = root["frame_id"].as<std::string>();

  PointDataset dataset({}, frame_id);
  size_t index = 0;
  for (const auto& node : features) {
    LabeledPoint point;
    point.id = node["id"] ? node["id"].as<std::string>()
                          : std::to_string(index);
    if (!node["x"] || !node["y"]) {
      throw std::runtime_error("Feature '" + point.id +
                               "' has no x/y coordinates");
    }
    point.position = grid_map::Position(node["x"].as<double>(),
                                        node["y"].as<double>());
    if (const auto props = node["properties"]) {
      for (const auto& kv : props) {
        const auto key = kv.first.as<std::string>();
        try {
          point.properties[key] = kv.second.as<double>();
        } catch (const YAML::BadConversion&) {
          if (!kv.second.IsScalar()) {
            spdlog::warn("[Catalog] Feature '{}': property '{}' is not a "
                         "scalar, ignored",
                         point.id, key);
            continue;
          }
          point.text_properties[key] = kv.second.as<std::string>();
        }
      }
    }
    dataset.add(std::move(point));
    ++index;
  }
  return dataset;
}

PointDataset loadPointDataset(const std::string& path) {
  try {
    return parsePointDataset(YAML::LoadFile(path));
  } catch (const YAML::Exception& e) {
    throw std::runtime_error("Failed to load point dataset: " + path + " - " +
                             e.what());
  }
}

// ─── DataCatalog ────────────────────────────────────────────────────────────

SceneCollection DataCatalog::requireImageCollection(
    const std::string& id) const {
  auto collection = imageCollection(id);
  if (!collection) {
    throw ComputationError("Catalog", "Unknown image collection '" + id + "'");
  }
  return std::move(*collection);
}

Raster DataCatalog::requireImage(const std::string& id) const {
  auto raster = image(id);
  if (!raster) {
    throw ComputationError("Catalog", "Unknown image '" + id + "'");
  }
  return std::move(*raster);
}

PointDataset DataCatalog::requireFeatureCollection(
    const std::string& id) const {
  auto points = featureCollection(id);
  if (!points) {
    throw ComputationError("Catalog",
                           "Unknown feature collection '" + id + "'");
  }
  return std::move(*points);
}

// ─── InMemoryCatalog ────────────────────────────────────────────────────────

InMemoryCatalog& InMemoryCatalog::addScene(const std::string& collection_id,
                                           Scene scene) {
  collections_[collection_id].add(std::move(scene));
  return *this;
}

InMemoryCatalog& InMemoryCatalog::addImage(const std::string& id,
                                           Raster raster) {
  images_[id] = std::move(raster);
  return *this;
}

InMemoryCatalog& InMemoryCatalog::addFeatureCollection(const std::string& id,
                                                       PointDataset points) {
  feature_collections_[id] = std::move(points);
  return *this;
}

std::optional<SceneCollection> InMemoryCatalog::imageCollection(
    const std::string& id) const {
  const auto it = collections_.find(id);
  if (it == collections_.end()) return std::nullopt;
  return it->second;
}

std::optional<Raster> InMemoryCatalog::image(const std::string& id) const {
  const auto it = images_.find(id);
  if (it == images_.end()) return std::nullopt;
  return it->second;
}

std::optional<PointDataset> InMemoryCatalog::featureCollection(
    const std::string& id) const {
  const auto it = feature_collections_.find(id);
  if (it == feature_collections_.end()) return std::nullopt;
  return it->second;
}

// ─── Manifest ───────────────────────────────────────────────────────────────

namespace {

Raster loadRasterFile(const std::filesystem::path& file) {
  Raster raster;
  if (!io::loadNpz(file.string(), raster)) {
    throw std::runtime_error("Cannot load raster " + file.string());
  }
  return raster;
}

}  // namespace

InMemoryCatalog::Ptr loadCatalogManifest(const std::string& path) {
  YAML::Node root;
  try {
    root = YAML::LoadFile(path);
  } catch (const YAML::Exception& e) {
    throw std::runtime_error("Failed to load manifest: " + path + " - " +
                             e.what());
  }

  const auto base = std::filesystem::path(path).parent_path();
  auto resolve = [&](const std::string& file) {
    const std::filesystem::path p(file);
    return p.is_absolute() ? p : base / p;
  };

  auto catalog = std::make_shared<InMemoryCatalog>();
  size_t scene_count = 0;

  try {
    for (const auto& collection : root["collections"]) {
      const auto collection_id = collection.first.as<std::string>();
      for (const auto& node : collection.second) {
        Scene scene;
        scene.id = node["id"].as<std::string>();
        scene.date = parseDate(node["date"].as<std::string>());
        if (const auto props = node["properties"]) {
          for (const auto& kv : props) {
            scene.properties[kv.first.as<std::string>()] =
                kv.second.as<std::string>();
          }
        }
        if (const auto lists = node["list_properties"]) {
          for (const auto& kv : lists) {
            scene.list_properties[kv.first.as<std::string>()] =
                kv.second.as<std::vector<std::string>>();
          }
        }
        scene.raster = loadRasterFile(resolve(node["file"].as<std::string>()));
        catalog->addScene(collection_id, std::move(scene));
        ++scene_count;
      }
    }

    for (const auto& image : root["images"]) {
      catalog->addImage(image.first.as<std::string>(),
                        loadRasterFile(resolve(image.second.as<std::string>())));
    }

    for (const auto& fc : root["feature_collections"]) {
      catalog->addFeatureCollection(
          fc.first.as<std::string>(),
          loadPointDataset(resolve(fc.second.as<std::string>()).string()));
    }
  } catch (const YAML::Exception& e) {
    throw std::runtime_error("Malformed manifest: " + path + " - " + e.what());
  } catch (const InputError& e) {
    throw std::runtime_error("Malformed manifest: " + path + " - " +
                             e.getMessage());
  }

  spdlog::info("[Catalog] Loaded {} scenes from {}", scene_count, path);
  return catalog;
}

}  // namespace floodfusion
