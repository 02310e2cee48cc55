// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * errors.hpp
 *
 * Exception hierarchy for flood mapping runs.
 *
 * Hierarchy:
 *   FloodError (base, carries an ErrorCategory and the failing stage)
 *   ├── InputError            - invalid request, detected before any raster work
 *   ├── DataAvailabilityError - no usable imagery for the AOI / time window
 *   ├── SamplingError         - no valid labelled samples on the stack
 *   ├── ComputationError      - a reduction, classification or catalog call failed
 *   └── ExportError           - writing the flood mask failed
 *
 * Stages throw; FloodMapper catches at the run boundary and turns the
 * exception into a RunOutcome, so nothing escapes to the caller.
 */

#ifndef FLOODFUSION_ERRORS_HPP
#define FLOODFUSION_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace floodfusion {

enum class ErrorCategory {
  None,
  Input,
  DataAvailability,
  Sampling,
  Computation,
  Export,
  Busy,       ///< Run rejected because another run is in flight
  Cancelled,  ///< Run stopped at a stage boundary on request
};

inline const char* toString(ErrorCategory category) {
  switch (category) {
    case ErrorCategory::None:
      return "None";
    case ErrorCategory::Input:
      return "InputError";
    case ErrorCategory::DataAvailability:
      return "DataAvailabilityError";
    case ErrorCategory::Sampling:
      return "SamplingError";
    case ErrorCategory::Computation:
      return "ComputationError";
    case ErrorCategory::Export:
      return "ExportError";
    case ErrorCategory::Busy:
      return "Busy";
    case ErrorCategory::Cancelled:
      return "Cancelled";
  }
  return "Unknown";
}

/**
 * @brief Base exception for flood mapping errors.
 */
class FloodError : public std::runtime_error {
 public:
  FloodError(ErrorCategory category, const std::string& stage_name,
             const std::string& message)
      : std::runtime_error("[" + stage_name + "] " + message),
        category_(category),
        stage_name_(stage_name),
        message_(message) {}

  ErrorCategory category() const { return category_; }
  const std::string& getStage() const { return stage_name_; }
  const std::string& getMessage() const { return message_; }

 private:
  ErrorCategory category_;
  std::string stage_name_;
  std::string message_;
};

class InputError : public FloodError {
 public:
  InputError(const std::string& stage_name, const std::string& message)
      : FloodError(ErrorCategory::Input, stage_name, message) {}
};

class DataAvailabilityError : public FloodError {
 public:
  DataAvailabilityError(const std::string& stage_name,
                        const std::string& message)
      : FloodError(ErrorCategory::DataAvailability, stage_name, message) {}
};

class SamplingError : public FloodError {
 public:
  SamplingError(const std::string& stage_name, const std::string& message)
      : FloodError(ErrorCategory::Sampling, stage_name, message) {}
};

class ComputationError : public FloodError {
 public:
  ComputationError(const std::string& stage_name, const std::string& message)
      : FloodError(ErrorCategory::Computation, stage_name, message) {}
};

class ExportError : public FloodError {
 public:
  ExportError(const std::string& stage_name, const std::string& message)
      : FloodError(ErrorCategory::Export, stage_name, message) {}
};

}  // namespace floodfusion

#endif  // FLOODFUSION_ERRORS_HPP
