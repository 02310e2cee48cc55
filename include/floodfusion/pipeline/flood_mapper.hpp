// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * flood_mapper.hpp
 *
 * FloodFusion: staged flood mapping from radar and optical composites.
 */

#ifndef FLOODFUSION_PIPELINE_FLOOD_MAPPER_HPP
#define FLOODFUSION_PIPELINE_FLOOD_MAPPER_HPP

#include <atomic>
#include <functional>
#include <future>
#include <optional>
#include <string>
#include <vector>

// Configs
#include "floodfusion/config/floodfusion.hpp"

// Data types
#include "floodfusion/composite.hpp"
#include "floodfusion/errors.hpp"
#include "floodfusion/geometry.hpp"
#include "floodfusion/pipeline/run_request.hpp"
#include "floodfusion/raster.hpp"
#include "floodfusion/visualization.hpp"

// Core objects
#include "floodfusion/evaluation/accuracy.hpp"
#include "floodfusion/imagery/catalog.hpp"

namespace floodfusion {

/// Products of a successful run.
struct AnalysisResult {
  AreaOfInterest aoi;
  Composite optical_composite;
  Composite radar_composite;
  std::vector<std::string> stack_bands;
  Raster flood_mask;  ///< Band `flood`: 1 flood, 0 non-flood, NaN masked
  ConfusionMatrix confusion_matrix;
  double accuracy = NAN;
  double kappa = NAN;
  double aoi_area_ha = 0.0;
  double flood_area_ha = 0.0;
  size_t training_count = 0;
  size_t validation_count = 0;
  std::vector<DisplayLayer> display_layers;
  std::vector<LegendEntry> legend;
};

/// Result of run(): either a result or a categorised error.
struct RunOutcome {
  ErrorCategory category = ErrorCategory::None;
  std::string stage;
  std::string message;
  std::optional<AnalysisResult> result;

  bool ok() const { return category == ErrorCategory::None; }
};

struct ExportOutcome {
  ErrorCategory category = ErrorCategory::None;
  std::string message;
  std::string path;

  bool ok() const { return category == ErrorCategory::None; }
};

/**
 * @brief Flood mapping pipeline over a data catalog.
 *
 * Stages run strictly in order:
 *   composites → stack → sampling → training → classification
 *   → post filter → accuracy → area
 * The radar and optical composites, and the flood and AOI areas, are
 * computed concurrently.
 *
 * ## Thread safety
 *
 * - run() / runAsync(): at most one run in flight; a concurrent call returns
 *   ErrorCategory::Busy without touching any state.
 * - cancel(), isRunning(): safe from any thread, including the status
 *   callback.
 * - setStatusCallback(): call before starting a run.
 */
class FloodMapper {
 public:
  using StatusCallback = std::function<void(const std::string&)>;

  explicit FloodMapper(DataCatalog::Ptr catalog, const Config& cfg = {});

  // Non-copyable
  FloodMapper(const FloodMapper&) = delete;
  FloodMapper& operator=(const FloodMapper&) = delete;

  /// Status messages ("Training classifier...", "Error: ...").
  void setStatusCallback(StatusCallback callback);

  /**
   * @brief Run the whole analysis once.
   *
   * Request validation happens before any imagery is read. On failure
   * exactly one "Error: <message>" status is emitted and the outcome holds
   * the error category; no result is kept.
   */
  RunOutcome run(const RunRequest& request);

  /// run() on a separate thread.
  std::future<RunOutcome> runAsync(const RunRequest& request);

  /// Stop the in-flight run at the next stage boundary (Cancelled).
  void cancel() noexcept;

  bool isRunning() const noexcept { return running_.load(); }

  /**
   * @brief Write the flood mask of a finished run as GeoTIFF.
   *
   * Only flood pixels are kept, clipped to the AOI. A failure is reported
   * as ErrorCategory::Export and leaves the result untouched.
   */
  ExportOutcome exportFloodMask(const AnalysisResult& result,
                                const std::string& path) const;

  /**
   * @brief Property names of a training point asset.
   *
   * @throws InputError if the asset id is empty or unknown
   */
  std::vector<std::string> listProperties(const std::string& asset) const;

  const Config& config() const { return cfg_; }

 private:
  AnalysisResult runImpl(const RunRequest& request);

  void emitStatus(const std::string& message) const;

  /// @throws FloodError(Cancelled) if cancel() was requested.
  void checkpoint(const char* stage) const;

  DataCatalog::Ptr catalog_;
  Config cfg_;
  StatusCallback status_callback_;

  std::atomic<bool> running_{false};
  std::atomic<bool> cancel_requested_{false};
};

}  // namespace floodfusion

#endif  // FLOODFUSION_PIPELINE_FLOOD_MAPPER_HPP
