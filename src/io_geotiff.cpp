// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * io_geotiff.cpp
 *
 * GeoTIFF export through the GDAL GTiff driver.
 */

#include "floodfusion/io/geotiff.hpp"

#include <cpl_conv.h>
#include <gdal_priv.h>
#include <ogr_spatialref.h>
#include <spdlog/spdlog.h>

#include <cmath>
#include <memory>
#include <mutex>
#include <vector>

namespace floodfusion {
namespace io {

namespace detail {

void registerDrivers() {
  static std::once_flag flag;
  std::call_once(flag, [] { GDALAllRegister(); });
}

struct DatasetCloser {
  void operator()(GDALDataset* ds) const {
    if (ds) GDALClose(GDALDataset::ToHandle(ds));
  }
};
using DatasetPtr = std::unique_ptr<GDALDataset, DatasetCloser>;

}  // namespace detail

int epsgFromFrameId(const std::string& frame_id) {
  constexpr const char* kPrefix = "EPSG:";
  if (frame_id.compare(0, 5, kPrefix) != 0 || frame_id.size() == 5) return 0;
  int code = 0;
  for (size_t i = 5; i < frame_id.size(); ++i) {
    const char ch = frame_id[i];
    if (ch < '0' || ch > '9') return 0;
    code = code * 10 + (ch - '0');
    if (code > 65535) return 0;
  }
  return code;
}

bool saveGeoTiff(const std::string& filename, const Raster& raster,
                 const std::string& band_name, float nodata) {
  if (!raster.exists(band_name)) {
    spdlog::error("[geotiff_io] Band '{}' does not exist", band_name);
    return false;
  }
  if (!raster.isInitialized()) {
    spdlog::error("[geotiff_io] Raster has no geometry");
    return false;
  }

  detail::registerDrivers();
  GDALDriver* driver = GetGDALDriverManager()->GetDriverByName("GTiff");
  if (!driver) {
    spdlog::error("[geotiff_io] GDAL GTiff driver is not available");
    return false;
  }

  const int width = imageWidth(raster);
  const int height = imageHeight(raster);
  detail::DatasetPtr ds(
      driver->Create(filename.c_str(), width, height, 1, GDT_Float32, nullptr));
  if (!ds) {
    spdlog::error("[geotiff_io] Cannot create {}", filename);
    return false;
  }

  // Upper-left corner, north-up
  const double res = raster.getResolution();
  grid_map::Position min_corner, max_corner;
  raster.bounds(min_corner, max_corner);
  double geo_transform[6] = {min_corner.x(), res, 0.0,
                             max_corner.y(), 0.0, -res};
  if (ds->SetGeoTransform(geo_transform) != CE_None) {
    spdlog::error("[geotiff_io] Cannot set geotransform on {}", filename);
    return false;
  }

  const int epsg = epsgFromFrameId(raster.getFrameId());
  OGRSpatialReference srs;
  if (epsg != 0 && srs.importFromEPSG(epsg) == OGRERR_NONE) {
    char* wkt = nullptr;
    srs.exportToWkt(&wkt);
    const CPLErr err = ds->SetProjection(wkt);
    CPLFree(wkt);
    if (err != CE_None) {
      spdlog::error("[geotiff_io] Cannot set projection on {}", filename);
      return false;
    }
  } else {
    spdlog::warn("[geotiff_io] Frame '{}' is not a known EPSG code, CRS left "
                 "unset",
                 raster.getFrameId());
  }

  // Pixels, north-up row-major
  std::vector<float> pixels(static_cast<size_t>(width) * height);
  for (int row = 0; row < height; ++row) {
    for (int col = 0; col < width; ++col) {
      const float v =
          raster.valueAt(band_name, northUpPosition(raster, row, col));
      pixels[static_cast<size_t>(row) * width + col] =
          std::isfinite(v) ? v : nodata;
    }
  }

  GDALRasterBand* band = ds->GetRasterBand(1);
  band->SetNoDataValue(nodata);
  if (band->RasterIO(GF_Write, 0, 0, width, height, pixels.data(), width,
                     height, GDT_Float32, 0, 0, nullptr) != CE_None) {
    spdlog::error("[geotiff_io] Write failed for {}", filename);
    return false;
  }

  ds.reset();
  spdlog::debug("[geotiff_io] Wrote {} ({}x{}, EPSG:{})", filename, width,
                height, epsg);
  return true;
}

}  // namespace io
}  // namespace floodfusion
