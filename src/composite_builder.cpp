// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * composite_builder.cpp
 *
 * Scene filtering, temporal median reduction and stack assembly.
 */

#include "floodfusion/imagery/composite_builder.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>

#include "floodfusion/errors.hpp"
#include "floodfusion/filters/cloud_mask.hpp"
#include "floodfusion/filters/speckle_filter.hpp"

namespace floodfusion {

namespace {

constexpr auto kInstrumentModeProperty = "instrumentMode";
constexpr auto kOrbitPassProperty = "orbitProperties_pass";
constexpr auto kPolarisationProperty = "transmitterReceiverPolarisation";

float median(std::vector<float>& values) {
  std::sort(values.begin(), values.end());
  const size_t n = values.size();
  if (n % 2 == 1) return values[n / 2];
  return 0.5f * (values[n / 2 - 1] + values[n / 2]);
}

}  // namespace

Raster makeAnalysisGrid(const AreaOfInterest& aoi, double scale) {
  if (aoi.empty()) {
    throw InputError("Composite", "Area of interest is empty");
  }
  if (!(scale > 0.0)) {
    throw InputError("Composite", "Processing scale must be positive");
  }
  grid_map::Position min_corner, max_corner;
  aoi.bounds(min_corner, max_corner);

  const grid_map::Position extent = max_corner - min_corner;
  const double width = std::max(1.0, std::ceil(extent.x() / scale)) * scale;
  const double height = std::max(1.0, std::ceil(extent.y() / scale)) * scale;
  const grid_map::Position center =
      min_corner + grid_map::Position(width / 2.0, height / 2.0);

  Raster grid(static_cast<float>(width), static_cast<float>(height),
              static_cast<float>(scale), aoi.frameId(), center);
  spdlog::debug("[Composite] Analysis grid {}x{} cells at {} m",
                grid.getSize()(0), grid.getSize()(1), scale);
  return grid;
}

Raster temporalMedian(const SceneCollection& scenes,
                      const std::vector<std::string>& bands,
                      const Raster& grid) {
  // Resample every scene onto the grid once
  std::vector<Raster> sampled;
  sampled.reserve(scenes.size());
  for (const auto& scene : scenes) {
    std::vector<std::string> carried;
    for (const auto& name : bands) {
      if (scene.raster.hasBand(name)) carried.push_back(name);
    }
    if (carried.empty()) continue;
    sampled.push_back(resampleNearest(scene.raster, grid, carried));
  }

  std::vector<std::string> present;
  for (const auto& name : bands) {
    const bool any = std::any_of(sampled.begin(), sampled.end(),
                                 [&](const Raster& r) { return r.hasBand(name); });
    if (any) present.push_back(name);
  }

  Raster out = makeRasterLike(grid, present);
  const auto& size = grid.getSize();
  std::vector<float> values;
  values.reserve(sampled.size());

  for (const auto& name : present) {
    std::vector<const grid_map::Matrix*> layers;
    for (const auto& r : sampled) {
      if (r.hasBand(name)) layers.push_back(&r.get(name));
    }
    auto& data = out.get(name);
    for (int i = 0; i < size(0); ++i) {
      for (int j = 0; j < size(1); ++j) {
        values.clear();
        for (const auto* layer : layers) {
          const float v = (*layer)(i, j);
          if (std::isfinite(v)) values.push_back(v);
        }
        if (!values.empty()) data(i, j) = median(values);
      }
    }
  }
  return out;
}

Composite buildRadarComposite(const SceneCollection& collection,
                              const TimeWindow& window,
                              const AreaOfInterest& aoi, const Raster& grid,
                              const Config& cfg) {
  const auto& src = cfg.sources;
  const std::string& pol_a = src.polarisations.at(0);
  const std::string& pol_b = src.polarisations.at(1);

  const auto filtered =
      collection.filterDate(window)
          .filterBounds(aoi)
          .filterEquals(kInstrumentModeProperty, src.instrument_mode)
          .filterEquals(kOrbitPassProperty, src.orbit_pass)
          .filterListContains(kPolarisationProperty, pol_a)
          .filterListContains(kPolarisationProperty, pol_b);

  spdlog::info("[Composite] Radar: {} of {} scenes match", filtered.size(),
               collection.size());
  if (filtered.empty()) return Composite{};

  const Raster median =
      clipToAoi(temporalMedian(filtered, {pol_a, pol_b}, grid), aoi);

  const auto filtered_a = applySpeckleFilter(median, pol_a, pol_a + "_Filtered",
                                             cfg.speckle.kernel_size);
  const auto filtered_b = applySpeckleFilter(median, pol_b, pol_b + "_Filtered",
                                             cfg.speckle.kernel_size);

  if (!filtered_a.isPresent() && !filtered_b.isPresent()) return Composite{};
  if (filtered_a.isPresent() != filtered_b.isPresent()) {
    throw DataAvailabilityError(
        "Composite", "Radar composite has only one polarisation (" +
                         (filtered_a.isPresent() ? pol_a : pol_b) + ")");
  }

  Raster out = filtered_a.raster().addBands(filtered_b.raster());
  const auto& a = out.get(pol_a + "_Filtered");
  const auto& b = out.get(pol_b + "_Filtered");
  const Eigen::ArrayXXf ratio = a.array() / b.array();
  out.add(band::ratio_filtered, ratio.isFinite().select(ratio, NAN).matrix());
  return Composite(std::move(out));
}

Composite buildOpticalComposite(const SceneCollection& collection,
                                const TimeWindow& window,
                                const AreaOfInterest& aoi, const Raster& grid,
                                const Config& cfg) {
  const auto filtered = collection.filterDate(window).filterBounds(aoi);
  spdlog::info("[Composite] Optical: {} of {} scenes match", filtered.size(),
               collection.size());
  if (filtered.empty()) return Composite{};

  const auto masked = filtered.map(
      [&](const Scene& scene) { return applyCloudMask(scene.raster, cfg.sources); });

  // Union of reflectance bands in first-seen order
  std::vector<std::string> bands;
  for (const auto& scene : masked) {
    for (const auto& name : scene.raster.bandNames()) {
      if (std::find(bands.begin(), bands.end(), name) == bands.end()) {
        bands.push_back(name);
      }
    }
  }
  if (bands.empty()) return Composite{};

  return Composite(clipToAoi(temporalMedian(masked, bands, grid), aoi));
}

Raster buildStack(const Composite& optical, const Composite& radar,
                  const std::vector<std::string>& optical_bands) {
  if (optical.bandCount() == 0 || radar.bandCount() == 0) {
    throw DataAvailabilityError(
        "Stack", "No Sentinel-1 or Sentinel-2 images found for the criteria.");
  }
  for (const auto& name : optical_bands) {
    if (!optical.raster().hasBand(name)) {
      throw DataAvailabilityError(
          "Stack", "Optical composite is missing band '" + name + "'");
    }
  }
  Raster stack = optical.raster().select(optical_bands).addBands(radar.raster());
  spdlog::debug("[Stack] {} bands", stack.bandCount());
  return stack;
}

}  // namespace floodfusion
