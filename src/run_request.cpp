// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#include "floodfusion/pipeline/run_request.hpp"

#include <yaml-cpp/yaml.h>

#include <stdexcept>
#include <vector>

namespace floodfusion {

namespace {

grid_map::Position loadPosition(const YAML::Node& node) {
  if (!node.IsSequence() || node.size() != 2) {
    throw std::runtime_error("AOI coordinate must be a [x, y] pair");
  }
  return grid_map::Position(node[0].as<double>(), node[1].as<double>());
}

template <typename T>
void load(const YAML::Node& node, const char* key, T& value) {
  if (node[key]) value = node[key].as<T>();
}

AreaOfInterest loadAoi(const YAML::Node& node) {
  std::string frame_id;
  load(node, "frame_id", frame_id);

  if (const auto rect = node["rectangle"]) {
    return AreaOfInterest::rectangle(loadPosition(rect["min"]),
                                     loadPosition(rect["max"]), frame_id);
  }
  if (const auto vertices = node["vertices"]) {
    std::vector<grid_map::Position> ring;
    for (const auto& v : vertices) ring.push_back(loadPosition(v));
    return AreaOfInterest::polygon(ring, frame_id);
  }
  throw std::runtime_error("AOI needs 'vertices' or 'rectangle'");
}

}  // namespace

RunRequest parseRunRequest(const YAML::Node& root) {
  RunRequest request;
  if (!root || root.IsNull()) return request;

  if (const auto aoi = root["aoi"]) request.aoi = loadAoi(aoi);
  load(root, "start_date", request.start_date);
  load(root, "end_date", request.end_date);
  load(root, "training_asset", request.training_asset);
  load(root, "class_property", request.class_property);
  load(root, "trees", request.trees);
  load(root, "slope_threshold", request.slope_threshold);
  load(root, "min_patch_size", request.min_patch_size);
  return request;
}

RunRequest loadRunRequest(const std::string& path) {
  try {
    return parseRunRequest(YAML::LoadFile(path));
  } catch (const YAML::Exception& e) {
    throw std::runtime_error("Failed to load run request: " + path + " - " +
                             e.what());
  }
}

}  // namespace floodfusion
