// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * composite.hpp
 *
 * A sensor composite that may be absent.
 */

#ifndef FLOODFUSION_COMPOSITE_HPP
#define FLOODFUSION_COMPOSITE_HPP

#include <utility>
#include <variant>

#include "floodfusion/errors.hpp"
#include "floodfusion/raster.hpp"

namespace floodfusion {

/// Marker for "no imagery matched".
struct EmptyComposite {};

/**
 * @brief Either a raster or nothing.
 *
 * Stages that find no matching imagery return an empty composite instead of
 * failing; the stack builder decides whether that is fatal.
 */
class Composite {
 public:
  Composite() : value_(EmptyComposite{}) {}
  explicit Composite(Raster raster) : value_(std::move(raster)) {}

  bool isPresent() const { return std::holds_alternative<Raster>(value_); }

  /// @throws DataAvailabilityError if empty.
  const Raster& raster() const {
    if (!isPresent()) {
      throw DataAvailabilityError("Composite", "Composite has no bands");
    }
    return std::get<Raster>(value_);
  }

  size_t bandCount() const {
    return isPresent() ? std::get<Raster>(value_).bandCount() : 0;
  }

 private:
  std::variant<Raster, EmptyComposite> value_;
};

}  // namespace floodfusion

#endif  // FLOODFUSION_COMPOSITE_HPP
