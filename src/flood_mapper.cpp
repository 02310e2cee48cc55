// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * flood_mapper.cpp
 */

#include "floodfusion/pipeline/flood_mapper.hpp"

#include <spdlog/spdlog.h>

#include <stdexcept>
#include <utility>

#include "floodfusion/classification/classifier.hpp"
#include "floodfusion/evaluation/area.hpp"
#include "floodfusion/filters/terrain_slope.hpp"
#include "floodfusion/imagery/composite_builder.hpp"
#include "floodfusion/io/geotiff.hpp"
#include "floodfusion/postprocess/post_filter.hpp"
#include "floodfusion/sampling/sampled_dataset.hpp"

namespace floodfusion {

namespace {

// Status messages
constexpr auto kStatusSatellite = "Processing satellite data...";
constexpr auto kStatusLoading = "Loading training data...";
constexpr auto kStatusSampling = "Sampling training data...";
constexpr auto kStatusTraining = "Training classifier...";
constexpr auto kStatusClassifying = "Classifying image...";
constexpr auto kStatusAccuracy = "Assessing accuracy...";
constexpr auto kStatusArea = "Calculating area...";
constexpr auto kStatusComplete = "Complete.";

/// Clears the cancel request and the in-flight flag when the run leaves scope.
class RunGuard {
 public:
  RunGuard(std::atomic<bool>& running, std::atomic<bool>& cancel_requested)
      : running_(running), cancel_requested_(cancel_requested) {}
  ~RunGuard() {
    cancel_requested_.store(false);
    running_.store(false);
  }

  RunGuard(const RunGuard&) = delete;
  RunGuard& operator=(const RunGuard&) = delete;

 private:
  std::atomic<bool>& running_;
  std::atomic<bool>& cancel_requested_;
};

/// Request checked and converted to pipeline types.
struct ValidatedRequest {
  AreaOfInterest aoi;
  TimeWindow window;
  PostFilterParams post_filter;
  config::Classifier classifier;
};

ValidatedRequest validateRequest(const RunRequest& request, const Config& cfg) {
  if (!request.aoi || request.aoi->empty()) {
    throw InputError("Input", "Please draw an Area of Interest (AOI) first.");
  }
  if (request.training_asset.empty() || request.class_property.empty()) {
    throw InputError("Input",
                     "Please provide a Training Asset and select a Class "
                     "Column.");
  }
  if (request.trees <= 0) {
    throw InputError("Input", "Number of trees must be positive");
  }

  ValidatedRequest out;
  out.aoi = *request.aoi;
  out.window = makeTimeWindow(parseDate(request.start_date),
                              parseDate(request.end_date));

  out.post_filter = cfg.post_filter;
  out.post_filter.slope_threshold = request.slope_threshold;
  out.post_filter.min_patch_size = request.min_patch_size;
  validatePostFilterParams(out.post_filter);

  out.classifier = cfg.classifier;
  out.classifier.trees = request.trees;
  return out;
}

}  // namespace

FloodMapper::FloodMapper(DataCatalog::Ptr catalog, const Config& cfg)
    : catalog_(std::move(catalog)), cfg_(cfg) {
  if (!catalog_) {
    throw std::invalid_argument("FloodMapper requires a data catalog");
  }
}

void FloodMapper::setStatusCallback(StatusCallback callback) {
  status_callback_ = std::move(callback);
}

void FloodMapper::cancel() noexcept {
  if (running_.load()) cancel_requested_.store(true);
}

void FloodMapper::emitStatus(const std::string& message) const {
  spdlog::info("[FloodMapper] {}", message);
  if (status_callback_) status_callback_(message);
}

void FloodMapper::checkpoint(const char* stage) const {
  if (cancel_requested_.load()) {
    throw FloodError(ErrorCategory::Cancelled, stage, "Run cancelled");
  }
}

RunOutcome FloodMapper::run(const RunRequest& request) {
  bool expected = false;
  if (!running_.compare_exchange_strong(expected, true)) {
    spdlog::warn("[FloodMapper] A run is already in progress. Skipping...");
    RunOutcome busy;
    busy.category = ErrorCategory::Busy;
    busy.stage = "Run";
    busy.message = "A run is already in progress";
    return busy;
  }
  RunGuard guard(running_, cancel_requested_);

  RunOutcome outcome;
  try {
    outcome.result = runImpl(request);
    return outcome;
  } catch (const FloodError& e) {
    outcome.category = e.category();
    outcome.stage = e.getStage();
    outcome.message = e.getMessage();
  } catch (const std::exception& e) {
    outcome.category = ErrorCategory::Computation;
    outcome.stage = "Run";
    outcome.message = std::string("Computation failed: ") + e.what();
  }

  spdlog::error("[FloodMapper] {} in stage {}: {}", toString(outcome.category),
                outcome.stage, outcome.message);
  outcome.result.reset();
  emitStatus("Error: " + outcome.message);
  return outcome;
}

std::future<RunOutcome> FloodMapper::runAsync(const RunRequest& request) {
  return std::async(std::launch::async,
                    [this, request] { return run(request); });
}

AnalysisResult FloodMapper::runImpl(const RunRequest& request) {
  // ─── Input ──────────────────────────────────────────────────────────────
  const auto input = validateRequest(request, cfg_);

  const auto points = catalog_->featureCollection(request.training_asset);
  if (!points) {
    throw InputError("Input", "Could not load training data. Check Asset ID.");
  }
  if (!points->hasProperty(request.class_property)) {
    throw InputError("Input", "Class column '" + request.class_property +
                                  "' not found in the training data");
  }

  // ─── Composites ─────────────────────────────────────────────────────────
  emitStatus(kStatusSatellite);
  const Raster grid = makeAnalysisGrid(input.aoi, cfg_.sampling.scale);
  const SceneCollection radar_scenes =
      catalog_->requireImageCollection(cfg_.sources.radar_collection);
  const SceneCollection optical_scenes =
      catalog_->requireImageCollection(cfg_.sources.optical_collection);

  auto radar_future = std::async(std::launch::async, [&] {
    return buildRadarComposite(radar_scenes, input.window, input.aoi, grid,
                               cfg_);
  });
  auto optical_future = std::async(std::launch::async, [&] {
    return buildOpticalComposite(optical_scenes, input.window, input.aoi, grid,
                                 cfg_);
  });
  // Wait for both before rethrowing either failure
  radar_future.wait();
  optical_future.wait();
  const Composite radar = radar_future.get();
  const Composite optical = optical_future.get();
  checkpoint("Composite");

  const Raster stack = buildStack(optical, radar, cfg_.sources.optical_bands);
  checkpoint("Stack");

  // ─── Training data ──────────────────────────────────────────────────────
  emitStatus(kStatusLoading);
  spdlog::debug("[FloodMapper] {} labelled points in '{}'", points->size(),
                request.training_asset);
  checkpoint("Loading");

  emitStatus(kStatusSampling);
  const SampleSet samples = sampleRegions(stack, *points,
                                          request.class_property,
                                          cfg_.sampling.tile_scale);
  const SampleSplit split = splitSamples(samples, cfg_.sampling.split_fraction,
                                         cfg_.sampling.seed);
  if (split.training.empty()) {
    throw SamplingError("Sampling",
                        "No valid training data found. Points may be in "
                        "cloudy areas or outside image extent.");
  }
  checkpoint("Sampling");

  // ─── Classification ─────────────────────────────────────────────────────
  emitStatus(kStatusTraining);
  auto classifier = createClassifier(input.classifier);
  classifier->train(split.training, request.class_property,
                    stack.bandNames());
  checkpoint("Training");

  emitStatus(kStatusClassifying);
  const Raster classified = classify(stack, *classifier);

  const Raster dem = catalog_->requireImage(cfg_.sources.dem);
  const Raster slope =
      resampleNearest(computeSlope(dem), classified, {band::slope});
  const Raster flood_mask =
      applyPostFilter(classified, slope, input.post_filter);
  checkpoint("Classification");

  // ─── Accuracy ───────────────────────────────────────────────────────────
  emitStatus(kStatusAccuracy);
  AnalysisResult result;
  if (split.validation.empty()) {
    spdlog::warn("[FloodMapper] Validation set is empty, accuracy undefined");
  } else {
    result.confusion_matrix = errorMatrix(
        split.validation.labels(), classify(split.validation, *classifier));
  }
  result.accuracy = result.confusion_matrix.accuracy();
  result.kappa = result.confusion_matrix.kappa();
  checkpoint("Accuracy");

  // ─── Area ───────────────────────────────────────────────────────────────
  emitStatus(kStatusArea);
  ReductionParams reduction;
  reduction.scale = cfg_.evaluation.scale;
  reduction.tile_scale = cfg_.evaluation.tile_scale;
  reduction.max_pixels = cfg_.evaluation.max_pixels;

  auto flood_area_future = std::async(std::launch::async, [&] {
    return floodAreaHectares(flood_mask, input.aoi, reduction);
  });
  auto aoi_area_future =
      std::async(std::launch::async, [&] { return aoiAreaHectares(input.aoi); });
  flood_area_future.wait();
  aoi_area_future.wait();
  try {
    result.flood_area_ha = flood_area_future.get();
    result.aoi_area_ha = aoi_area_future.get();
  } catch (const ComputationError& e) {
    throw ComputationError("Area",
                           "Could not calculate area. " + e.getMessage());
  }
  checkpoint("Area");

  result.aoi = input.aoi;
  result.optical_composite = optical;
  result.radar_composite = radar;
  result.stack_bands = stack.bandNames();
  result.flood_mask = flood_mask;
  result.training_count = split.training.size();
  result.validation_count = split.validation.size();
  result.display_layers = makeDisplayLayers(optical.raster(), radar.raster(),
                                            flood_mask, cfg_.visualization);
  result.legend = cfg_.visualization.legend;

  spdlog::info("[FloodMapper] AOI {:.2f} ha, flood {:.2f} ha, accuracy "
               "{:.2f}%, kappa {:.3f}",
               result.aoi_area_ha, result.flood_area_ha,
               result.accuracy * 100.0, result.kappa);
  emitStatus(kStatusComplete);
  return result;
}

ExportOutcome FloodMapper::exportFloodMask(const AnalysisResult& result,
                                           const std::string& path) const {
  ExportOutcome outcome;
  outcome.path = path;
  try {
    if (!result.flood_mask.hasBand(band::flood)) {
      throw ExportError("Export", "Result has no flood mask");
    }
    const Raster flooded = clipToAoi(
        selfMask(result.flood_mask.select({band::flood}), band::flood),
        result.aoi);
    if (!io::saveGeoTiff(path, flooded, band::flood)) {
      throw ExportError("Export", "Could not write " + path);
    }
  } catch (const FloodError& e) {
    outcome.category = ErrorCategory::Export;
    outcome.message = e.getMessage();
    spdlog::error("[FloodMapper] Export failed: {}", outcome.message);
    return outcome;
  }
  spdlog::info("[FloodMapper] Flood mask exported to {}", path);
  return outcome;
}

std::vector<std::string> FloodMapper::listProperties(
    const std::string& asset) const {
  if (asset.empty()) {
    throw InputError("Input", "Please enter a training data Asset ID first.");
  }
  const auto points = catalog_->featureCollection(asset);
  if (!points) {
    throw InputError("Input",
                     "Invalid Asset ID. Could not load FeatureCollection.");
  }
  return points->listProperties();
}

}  // namespace floodfusion
