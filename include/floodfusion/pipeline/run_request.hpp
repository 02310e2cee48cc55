// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * run_request.hpp
 *
 * User inputs of one analysis run and their YAML form.
 */

#ifndef FLOODFUSION_PIPELINE_RUN_REQUEST_HPP
#define FLOODFUSION_PIPELINE_RUN_REQUEST_HPP

#include <optional>
#include <string>

#include "floodfusion/geometry.hpp"

namespace YAML {
class Node;
}

namespace floodfusion {

/// Inputs of one run, as entered by the user.
struct RunRequest {
  std::optional<AreaOfInterest> aoi;
  std::string start_date = "2021-06-01";  ///< YYYY-MM-DD, inclusive
  std::string end_date = "2021-07-31";    ///< YYYY-MM-DD, exclusive
  std::string training_asset;
  std::string class_property = "Planet_flo";
  int trees = 500;
  float slope_threshold = 5.0f;  ///< [deg], 0-30
  int min_patch_size = 8;        ///< [pixels], 0-50, 0 disables
};

/**
 * @brief Parse a run request.
 *
 * @code
 *   aoi:
 *     frame_id: EPSG:32645
 *     vertices: [[x0, y0], [x1, y1], [x2, y2], ...]
 *     # or  rectangle: {min: [x, y], max: [x, y]}
 *   start_date: 2021-06-01
 *   end_date: 2021-07-31
 *   training_asset: flood_points
 *   class_property: Planet_flo
 *   trees: 500
 *   slope_threshold: 5
 *   min_patch_size: 8
 * @endcode
 *
 * Missing keys keep their defaults. A missing aoi leaves the request without
 * one (rejected by the pipeline).
 *
 * @throws InputError on an invalid AOI polygon
 */
RunRequest parseRunRequest(const YAML::Node& root);

/// @throws std::runtime_error if the file cannot be read or parsed
RunRequest loadRunRequest(const std::string& path);

}  // namespace floodfusion

#endif  // FLOODFUSION_PIPELINE_RUN_REQUEST_HPP
