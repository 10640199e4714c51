// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#ifndef FASTREG_CONFIG_MODEL_HPP
#define FASTREG_CONFIG_MODEL_HPP

namespace fastreg {

/// Coordinate transform model variant.
enum class ModelType {
  Translation,        ///< 2 DoF: shift only
  Rigid,              ///< 3 DoF: rotation + shift
  Similarity,         ///< 4 DoF: isotropic scale + rotation + shift
  Affine,             ///< 6 DoF: general linear + shift
  Homography,         ///< 8 DoF: projective
  MovingLeastSquares  ///< Per-query locally weighted fit (not invertible)
};

namespace config {

/// Model selection and moving least squares parameters
struct Model {
  ModelType type = ModelType::Affine;

  struct MovingLeastSquares {
    ModelType local_type = ModelType::Affine;  ///< Model fit at each query
    double alpha = 1.0;  ///< Weight falloff exponent: w = 1 / |p - pᵢ|^(2α)
  } mls;
};

}  // namespace config
}  // namespace fastreg

#endif  // FASTREG_CONFIG_MODEL_HPP
