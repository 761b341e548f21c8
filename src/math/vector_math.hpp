/**
 * @file vector_math.hpp
 * @brief Per-axis vector operations for sensor error models
 *
 * Purpose: Thin wrappers around Eigen for the operations the IMU pipeline
 * applies axis by axis (saturation) and for the sample statistics used to
 * check noise models.
 *
 * References:
 * - Eigen Dense: https://eigen.tuxfamily.org/dox/group__TutorialMatrixArithmetic.html
 *
 * Sample Input:
 *   - v = [30, -5, -40], limit = 19.62
 * Expected Output:
 *   - saturate(v, limit) = [19.62, -5, -19.62]
 */

#ifndef SENSEMU_MATH_VECTOR_MATH_HPP
#define SENSEMU_MATH_VECTOR_MATH_HPP

#include "core/types.hpp"
#include <vector>

namespace sensemu {

/**
 * @brief Clamp each axis independently to [-limit, +limit]
 *
 * A non-positive limit disables saturation.
 */
Vector3d saturate(const Vector3d& v, double limit);

/**
 * @brief Check whether any axis reaches the saturation limit
 */
bool is_saturated(const Vector3d& v, double limit);

/**
 * @brief Compute mean of vector samples
 */
Vector3d compute_mean(const std::vector<Vector3d>& samples);

/**
 * @brief Compute per-axis sample standard deviation (N - 1 denominator)
 */
Vector3d compute_std_dev(const std::vector<Vector3d>& samples);

} // namespace sensemu

#endif // SENSEMU_MATH_VECTOR_MATH_HPP
