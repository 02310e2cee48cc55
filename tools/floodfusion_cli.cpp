// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * floodfusion_cli — Map flooded area from radar and optical composites.
 *
 * Pipeline: composites → stack → sampling → random forest → post filter
 *           → accuracy / area → export
 *
 * Usage:
 *   ./floodfusion_cli [--verbose] <config.yaml> <manifest.yaml> <run.yaml>
 *                     [output_dir]
 *   ./floodfusion_cli --list-properties <config.yaml> <manifest.yaml> <asset>
 *
 * Example:
 *   ./floodfusion_cli config/default.yaml data/manifest.yaml run.yaml out
 */

#include <spdlog/spdlog.h>

#include <cctype>
#include <filesystem>
#include <floodfusion/io/npz.hpp>
#include <floodfusion/io/png.hpp>
#include <floodfusion/pipeline/flood_mapper.hpp>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

using namespace floodfusion;

namespace {

void printUsage() {
  std::cerr
      << "Usage: floodfusion_cli [--verbose] <config.yaml> <manifest.yaml> "
         "<run.yaml> [output_dir]\n"
      << "       floodfusion_cli --list-properties <config.yaml> "
         "<manifest.yaml> <asset>\n";
}

std::string layerFileName(const std::string& layer_name) {
  std::string out;
  for (char ch : layer_name) {
    if (std::isalnum(static_cast<unsigned char>(ch))) {
      out.push_back(static_cast<char>(std::tolower(ch)));
    } else if (!out.empty() && out.back() != '_') {
      out.push_back('_');
    }
  }
  return out + ".png";
}

}  // namespace

int main(int argc, char** argv) {
  bool verbose = false;
  bool list_properties = false;
  std::vector<std::string> args;
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--verbose") {
      verbose = true;
    } else if (arg == "--list-properties") {
      list_properties = true;
    } else {
      args.push_back(arg);
    }
  }
  if (args.size() < 3 || (list_properties && args.size() != 3)) {
    printUsage();
    return 1;
  }

  try {
    const Config cfg = loadConfig(args[0]);
    spdlog::set_level(verbose ? spdlog::level::debug
                              : spdlog::level::from_str(cfg.log_level));

    FloodMapper mapper(loadCatalogManifest(args[1]), cfg);

    if (list_properties) {
      for (const auto& name : mapper.listProperties(args[2])) {
        std::cout << name << std::endl;
      }
      return 0;
    }

    const RunRequest request = loadRunRequest(args[2]);
    const std::filesystem::path output_dir = args.size() >= 4 ? args[3] : ".";
    std::filesystem::create_directories(output_dir);

    mapper.setStatusCallback(
        [](const std::string& status) { std::cout << "Status: " << status
                                                  << std::endl; });
    const RunOutcome outcome = mapper.run(request);
    if (!outcome.ok()) {
      std::cerr << toString(outcome.category) << ": " << outcome.message
                << std::endl;
      return 1;
    }
    const AnalysisResult& result = *outcome.result;

    // Report
    std::cout << std::fixed << std::setprecision(2)
              << "AOI Area: " << result.aoi_area_ha << " ha\n"
              << "Mapped Flood Area: " << result.flood_area_ha << " ha\n"
              << "Overall Accuracy: " << result.accuracy * 100.0 << "%\n"
              << std::setprecision(3) << "Kappa Coefficient: " << result.kappa
              << "\n"
              << "Samples: " << result.training_count << " training, "
              << result.validation_count << " validation\n"
              << "Error matrix: " << result.confusion_matrix.toString()
              << std::endl;

    // Export
    const auto export_outcome = mapper.exportFloodMask(
        result, (output_dir / "flood_mask.tif").string());
    if (!export_outcome.ok()) {
      std::cerr << "Export failed: " << export_outcome.message << std::endl;
    } else {
      std::cout << "Saved " << export_outcome.path << std::endl;
    }
    bool saved = export_outcome.ok();
    const auto npz_path = (output_dir / "flood_mask.npz").string();
    if (!io::saveNpz(npz_path, result.flood_mask)) {
      std::cerr << "Could not write " << npz_path << std::endl;
      saved = false;
    }
    for (const auto& layer : result.display_layers) {
      const auto png_path = (output_dir / layerFileName(layer.name)).string();
      if (!io::savePng(png_path, layer)) {
        std::cerr << "Could not write " << png_path << std::endl;
        saved = false;
      }
    }
    if (!saved) spdlog::warn("[floodfusion_cli] Some outputs were not written");
    return 0;
  } catch (const FloodError& e) {
    std::cerr << toString(e.category()) << ": " << e.getMessage() << std::endl;
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << std::endl;
  }
  return 1;
}
