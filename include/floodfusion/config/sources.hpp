// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#ifndef FLOODFUSION_CONFIG_SOURCES_HPP
#define FLOODFUSION_CONFIG_SOURCES_HPP

#include <string>
#include <vector>

namespace floodfusion::config {

/// Catalog ids and acquisition filters for the input imagery.
struct Sources {
  std::string radar_collection = "COPERNICUS/S1_GRD";
  std::string optical_collection = "COPERNICUS/S2_SR";
  std::string dem = "USGS/SRTMGL1_003";

  // Radar scene filters
  std::string instrument_mode = "IW";
  std::string orbit_pass = "DESCENDING";
  std::vector<std::string> polarisations = {"VV", "VH"};

  // Optical cloud masking
  std::string qa_band = "QA60";
  int cloud_bit = 10;   ///< Opaque clouds
  int cirrus_bit = 11;  ///< Cirrus clouds
  float reflectance_scale = 10000.0f;

  /// Optical bands placed first in the classification stack, in order.
  std::vector<std::string> optical_bands = {"B2", "B3", "B4",  "B5",  "B6",
                                            "B7", "B8", "B8A", "B11", "B12"};
};

}  // namespace floodfusion::config

#endif  // FLOODFUSION_CONFIG_SOURCES_HPP
