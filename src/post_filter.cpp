// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * post_filter.cpp
 */

#include "floodfusion/postprocess/post_filter.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <vector>

#include "floodfusion/errors.hpp"

namespace floodfusion {

namespace {

constexpr int dr8[] = {-1, -1, -1, 0, 0, 1, 1, 1};
constexpr int dc8[] = {-1, 0, 1, -1, 1, -1, 0, 1};
constexpr int dr4[] = {-1, 0, 0, 1};
constexpr int dc4[] = {0, -1, 1, 0};

}  // namespace

void validatePostFilterParams(const PostFilterParams& params) {
  if (!(params.slope_threshold >= 0.0f && params.slope_threshold <= 30.0f)) {
    throw InputError("Input", "Slope threshold must be between 0 and 30 "
                              "degrees");
  }
  if (params.min_patch_size < 0 || params.min_patch_size > 50) {
    throw InputError("Input", "Minimum patch size must be between 0 and 50 "
                              "pixels");
  }
}

Raster connectedPixelCount(const Raster& raster, const std::string& band_name,
                           int max_size, bool eight_connected) {
  if (!raster.hasBand(band_name)) {
    throw ComputationError("PostFilter",
                           "Band '" + band_name + "' does not exist");
  }
  max_size = std::max(1, max_size);

  Raster out = makeRasterLike(raster, {band::patch_size});
  const auto& values = raster.get(band_name);
  auto& counts = out.get(band::patch_size);

  const auto idx = raster.indexer();
  const int* dr = eight_connected ? dr8 : dr4;
  const int* dc = eight_connected ? dc8 : dc4;
  const int num_neighbors = eight_connected ? 8 : 4;

  // Component labelling in logical (row, col) space
  std::vector<int> component(static_cast<size_t>(idx.rows) * idx.cols, -1);
  std::vector<int> queue;
  std::vector<int> members;

  for (int row = 0; row < idx.rows; ++row) {
    for (int col = 0; col < idx.cols; ++col) {
      const int seed = row * idx.cols + col;
      if (component[seed] >= 0) continue;
      const auto [r, c] = idx(row, col);
      const float value = values(r, c);
      if (!std::isfinite(value)) continue;

      queue.assign(1, seed);
      members.clear();
      component[seed] = seed;
      while (!queue.empty()) {
        const int cell = queue.back();
        queue.pop_back();
        members.push_back(cell);
        const int lr = cell / idx.cols;
        const int lc = cell % idx.cols;
        for (int k = 0; k < num_neighbors; ++k) {
          const int nlr = lr + dr[k];
          const int nlc = lc + dc[k];
          if (!idx.contains(nlr, nlc)) continue;
          const int next = nlr * idx.cols + nlc;
          if (component[next] >= 0) continue;
          const auto [nr, nc] = idx(nlr, nlc);
          if (values(nr, nc) != value) continue;
          component[next] = seed;
          queue.push_back(next);
        }
      }

      const float size = static_cast<float>(
          std::min<size_t>(members.size(), static_cast<size_t>(max_size)));
      for (int cell : members) {
        const auto [mr, mc] = idx(cell / idx.cols, cell % idx.cols);
        counts(mr, mc) = size;
      }
    }
  }
  return out;
}

Raster applyPostFilter(const Raster& classified, const Raster& slope,
                       const PostFilterParams& params) {
  validatePostFilterParams(params);
  if (!classified.hasBand(band::classification)) {
    throw ComputationError("PostFilter", "Missing band 'classification'");
  }
  if (!slope.hasBand(band::slope)) {
    throw ComputationError("PostFilter", "Missing band 'slope'");
  }
  if (!classified.sameGrid(slope)) {
    throw ComputationError("PostFilter",
                           "Slope and classification grids differ");
  }

  const auto& labels = classified.get(band::classification);
  const Eigen::ArrayXXf flood_pixels =
      labels.array().isFinite().select((labels.array() == 1.0f).cast<float>(),
                                       NAN);

  Raster out = makeRasterLike(classified, {band::flood});
  auto& flood = out.get(band::flood);
  flood = flood_pixels.matrix();

  if (params.min_patch_size > 0) {
    Raster patches = makeRasterLike(classified, {band::flood});
    patches.get(band::flood) = flood_pixels.matrix();
    // The cap must not hide patches that reach min_patch_size
    const int cap = std::max(params.max_patch_size, params.min_patch_size);
    const Raster counted =
        connectedPixelCount(patches, band::flood, cap, params.eight_connected);
    const auto& count = counted.get(band::patch_size);
    const Eigen::ArrayXXf kept =
        (count.array() >= static_cast<float>(params.min_patch_size))
            .cast<float>();
    flood = (flood_pixels == 1.0f).select(kept, flood_pixels).matrix();
  }

  // Terrain mask over the whole result
  const auto& degrees = slope.get(band::slope);
  const Eigen::ArrayXXf unfiltered = flood.array();
  flood = (degrees.array() <= params.slope_threshold)
              .select(unfiltered, NAN)
              .matrix();

  spdlog::debug("[PostFilter] {} flood pixels after filtering",
                static_cast<long>((flood.array() == 1.0f).count()));
  return out;
}

}  // namespace floodfusion
