// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * composite_builder.hpp
 *
 * Radar and optical median composites over the AOI, and the combined
 * classification stack.
 */

#ifndef FLOODFUSION_IMAGERY_COMPOSITE_BUILDER_HPP
#define FLOODFUSION_IMAGERY_COMPOSITE_BUILDER_HPP

#include <string>
#include <vector>

#include "floodfusion/composite.hpp"
#include "floodfusion/config/floodfusion.hpp"
#include "floodfusion/geometry.hpp"
#include "floodfusion/imagery/catalog.hpp"
#include "floodfusion/raster.hpp"

namespace floodfusion {

/// Empty grid covering the AOI bounding box at `scale` metres per cell.
Raster makeAnalysisGrid(const AreaOfInterest& aoi, double scale);

/**
 * @brief Per-pixel median of each band over a scene collection.
 *
 * Scenes are sampled onto `grid` by nearest cell center. Only finite values
 * count; an even number of observations gives the mean of the two middle
 * values. Bands carried by no scene are left out of the result.
 */
Raster temporalMedian(const SceneCollection& scenes,
                      const std::vector<std::string>& bands,
                      const Raster& grid);

/**
 * @brief Speckle-filtered radar composite.
 *
 * Keeps scenes inside the window and AOI with the configured instrument mode
 * and orbit pass that carry both polarisations, takes the temporal median,
 * clips to the AOI and filters each polarisation into "<pol>_Filtered".
 * Adds Ratio_Filtered = first / second polarisation.
 *
 * @return Empty composite when no scene matches
 * @throws DataAvailabilityError if only one polarisation could be filtered
 */
Composite buildRadarComposite(const SceneCollection& collection,
                              const TimeWindow& window,
                              const AreaOfInterest& aoi, const Raster& grid,
                              const Config& cfg);

/**
 * @brief Cloud-free optical median composite.
 *
 * Keeps scenes inside the window and AOI, cloud-masks each one, takes the
 * temporal median of the reflectance bands and clips to the AOI.
 *
 * @return Empty composite when no scene matches
 */
Composite buildOpticalComposite(const SceneCollection& collection,
                                const TimeWindow& window,
                                const AreaOfInterest& aoi, const Raster& grid,
                                const Config& cfg);

/**
 * @brief Classification stack: optical bands (in order) then radar bands.
 *
 * @throws DataAvailabilityError if either composite is empty or an optical
 *         band is missing
 */
Raster buildStack(const Composite& optical, const Composite& radar,
                  const std::vector<std::string>& optical_bands);

}  // namespace floodfusion

#endif  // FLOODFUSION_IMAGERY_COMPOSITE_BUILDER_HPP
