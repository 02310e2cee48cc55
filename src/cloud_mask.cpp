// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#include "floodfusion/filters/cloud_mask.hpp"

#include <spdlog/spdlog.h>

#include <string>
#include <vector>

#include "floodfusion/errors.hpp"

namespace floodfusion {

Raster applyCloudMask(const Raster& scene, const config::Sources& cfg) {
  if (!scene.hasBand(cfg.qa_band)) {
    throw ComputationError("CloudMask",
                           "Scene has no '" + cfg.qa_band + "' band");
  }

  std::vector<std::string> reflectance_bands;
  for (const auto& name : scene.getLayers()) {
    if (!name.empty() && name[0] == 'B') reflectance_bands.push_back(name);
  }

  const auto& qa = scene.get(cfg.qa_band);
  const Eigen::MatrixXf clear = qa.unaryExpr([&](float v) {
    return isClearSky(v, cfg.cloud_bit, cfg.cirrus_bit) ? 1.0f : 0.0f;
  });

  Raster out = scene.select(reflectance_bands);
  const float inv_scale = 1.0f / cfg.reflectance_scale;
  for (const auto& name : reflectance_bands) {
    auto& data = out.get(name);
    data = (clear.array() > 0.5f).select(data.array() * inv_scale, NAN).matrix();
  }

  spdlog::debug("[CloudMask] {} of {} pixels clear",
                (clear.array() > 0.5f).count(), clear.size());
  return out;
}

}  // namespace floodfusion
