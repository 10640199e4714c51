// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * least_squares.hpp
 *
 * Weighted least-squares building blocks shared by the model variants:
 * centered moments of a correspondence set and a conditioning-checked
 * solver for symmetric normal equations.
 */

#ifndef FASTREG_ESTIMATION_LEAST_SQUARES_HPP
#define FASTREG_ESTIMATION_LEAST_SQUARES_HPP

#include <Eigen/Core>
#include <memory>
#include <vector>

#include "fastreg/correspondence.hpp"
#include "fastreg/models/model.hpp"

namespace fastreg {
namespace lsq {

/// Systems whose equilibrated reciprocal condition falls below this are
/// rejected as ill-conditioned.
constexpr double kMinReciprocalCondition = 1e-12;

/// Relative spread below which a point set counts as collapsed to a point.
constexpr double kMinRelativeSpread = 1e-12;

/**
 * @brief Weighted first and second moments of a correspondence set.
 *
 * With p̃ = p - p̄ and q̃ = q - q̄ (weighted centroids):
 *   source_cov = Σ wᵢ p̃ᵢ p̃ᵢᵀ
 *   cross_cov  = Σ wᵢ p̃ᵢ q̃ᵢᵀ
 */
struct Moments {
  Point source_centroid = Point::Zero();
  Point target_centroid = Point::Zero();
  double weight_sum = 0.0;
  Eigen::Matrix2d source_cov = Eigen::Matrix2d::Zero();
  Eigen::Matrix2d cross_cov = Eigen::Matrix2d::Zero();
  double source_spread = 0.0;  ///< trace(source_cov)
  double target_spread = 0.0;  ///< Σ wᵢ |q̃ᵢ|²

  /// True if the source points coincide (relative to their magnitude)
  bool sourceCollapsed() const;
  /// True if the target points coincide (relative to their magnitude)
  bool targetCollapsed() const;
};

/// @throws IllConditionedError if the total weight is not positive
Moments computeMoments(const Correspondences& matches);

/// Reciprocal condition number of a Jacobi-equilibrated symmetric matrix
/// (smallest / largest eigenvalue, 0 if singular or indefinite).
double reciprocalCondition(const Eigen::MatrixXd& normal);

/**
 * @brief Solve the symmetric positive (semi)definite system N·X = B.
 *
 * N is equilibrated (unit diagonal) before its conditioning is checked and
 * the system is factorized with LDLT.
 *
 * @throws IllConditionedError if N is singular, near-singular, or the
 *         inputs or solution are not finite
 */
Eigen::MatrixXd solveSymmetric(const Eigen::MatrixXd& normal,
                               const Eigen::MatrixXd& rhs);

/**
 * @brief Fit a fresh model of the given type.
 *
 * Minimizes Σ wᵢ·||apply(srcᵢ) - tgtᵢ||² in closed form.
 *
 * @throws InsufficientDataError, IllConditionedError
 */
std::unique_ptr<Model> fitModel(ModelType type, const Correspondences& matches);

/// Fit a copy of the prototype on matches[indices].
std::unique_ptr<Model> refit(const Model& prototype,
                             const Correspondences& matches,
                             const std::vector<size_t>& indices);

/// Gather matches[indices] in index order
Correspondences select(const Correspondences& matches,
                       const std::vector<size_t>& indices);

}  // namespace lsq
}  // namespace fastreg

#endif  // FASTREG_ESTIMATION_LEAST_SQUARES_HPP
