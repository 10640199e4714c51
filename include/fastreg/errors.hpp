// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * errors.hpp
 *
 * Exception hierarchy for model fitting and robust estimation.
 *
 * Exception hierarchy:
 *   Error (base)
 *   ├── InsufficientDataError - fewer matches than the model needs
 *   ├── IllConditionedError   - degenerate or singular fit geometry
 *   ├── NonInvertibleError    - inverse requested on a non-bijective map
 *   └── NotEnoughInliersError - consensus search below the inlier minimum
 *
 * None of these are fatal to the process. Callers typically retry with
 * relaxed parameters (larger epsilon, fewer required inliers) or give up on
 * the image pair.
 */

#ifndef FASTREG_ERRORS_HPP
#define FASTREG_ERRORS_HPP

#include <cstddef>
#include <stdexcept>
#include <string>

namespace fastreg {

/**
 * @brief Base exception for all fitting errors
 */
class Error : public std::runtime_error {
 public:
  explicit Error(const std::string& message) : std::runtime_error(message) {}
};

class InsufficientDataError : public Error {
 public:
  InsufficientDataError(size_t required, size_t provided)
      : Error("Insufficient data: " + std::to_string(provided) +
              " correspondences provided, at least " +
              std::to_string(required) + " required"),
        required_(required),
        provided_(provided) {}

  size_t required() const { return required_; }
  size_t provided() const { return provided_; }

 private:
  size_t required_;
  size_t provided_;
};

class IllConditionedError : public Error {
 public:
  explicit IllConditionedError(const std::string& message)
      : Error("Ill-conditioned fit: " + message) {}
};

class NonInvertibleError : public Error {
 public:
  explicit NonInvertibleError(const std::string& message)
      : Error("Non-invertible transform: " + message) {}
};

class NotEnoughInliersError : public Error {
 public:
  NotEnoughInliersError(size_t required, size_t found)
      : Error("Not enough inliers: found " + std::to_string(found) +
              ", required " + std::to_string(required)),
        required_(required),
        found_(found) {}

  size_t required() const { return required_; }
  size_t found() const { return found_; }

 private:
  size_t required_;
  size_t found_;
};

}  // namespace fastreg

#endif  // FASTREG_ERRORS_HPP
