// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * npz.hpp
 *
 * NumPy .npz format for lossless Raster serialization.
 * Compatible with numpy.load() / numpy.savez() in Python.
 */

#ifndef FLOODFUSION_IO_NPZ_HPP
#define FLOODFUSION_IO_NPZ_HPP

#include <string>
#include <vector>

#include "floodfusion/raster.hpp"

namespace floodfusion {
namespace io {

/// Save all bands + metadata as NumPy .npz archive.
bool saveNpz(const std::string& filename, const Raster& raster);

/// Save specific bands + metadata as NumPy .npz archive.
bool saveNpz(const std::string& filename, const Raster& raster,
             const std::vector<std::string>& band_names);

/// Load a Raster from a .npz archive (saved by saveNpz). Replaces all bands
/// and the geometry of `raster`; band order follows the archive.
bool loadNpz(const std::string& filename, Raster& raster);

}  // namespace io
}  // namespace floodfusion

#endif  // FLOODFUSION_IO_NPZ_HPP
