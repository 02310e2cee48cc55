// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#ifndef FLOODFUSION_CONFIG_VISUALIZATION_HPP
#define FLOODFUSION_CONFIG_VISUALIZATION_HPP

#include <string>
#include <vector>

namespace floodfusion {

/// Display stretch for one layer. One min/max per band, or one shared value.
struct VisParams {
  std::vector<std::string> bands;
  std::vector<float> min;
  std::vector<float> max;
  std::vector<std::string> palette;  ///< "#RRGGBB" or "RRGGBB"
};

struct LegendEntry {
  std::string label;
  std::string color;
};

namespace config {

struct Visualization {
  VisParams optical_rgb{{"B4", "B3", "B2"}, {0.0f}, {0.3f}, {}};
  VisParams radar_false_color{{"VV_Filtered", "VH_Filtered", "Ratio_Filtered"},
                              {-20.0f, -25.0f, 0.5f},
                              {0.0f, -5.0f, 5.0f},
                              {}};
  VisParams flood{{"flood"}, {0.0f}, {1.0f}, {"#0000FF"}};
  std::vector<LegendEntry> legend{{"Flood/Water", "#0000FF"}};
};

}  // namespace config
}  // namespace floodfusion

#endif  // FLOODFUSION_CONFIG_VISUALIZATION_HPP
