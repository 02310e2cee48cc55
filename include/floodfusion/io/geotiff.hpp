// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * geotiff.hpp
 *
 * Single-band float32 GeoTIFF export (north-up) via GDAL.
 */

#ifndef FLOODFUSION_IO_GEOTIFF_HPP
#define FLOODFUSION_IO_GEOTIFF_HPP

#include <cmath>
#include <string>

#include "floodfusion/raster.hpp"

namespace floodfusion {
namespace io {

/// EPSG code from a frame id of the form "EPSG:<code>", or 0.
int epsgFromFrameId(const std::string& frame_id);

/**
 * @brief Write one band as a GeoTIFF.
 *
 * The geotransform maps pixel (0, 0) to the upper-left corner of the raster.
 * The CRS is set when the frame id is "EPSG:<code>". Masked pixels are
 * written as `nodata`, which is also the band's no-data value.
 */
bool saveGeoTiff(const std::string& filename, const Raster& raster,
                 const std::string& band_name, float nodata = NAN);

}  // namespace io
}  // namespace floodfusion

#endif  // FLOODFUSION_IO_GEOTIFF_HPP
