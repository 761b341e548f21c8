/**
 * @file quaternion.hpp
 * @brief Orientation helpers for moving vectors between world and body frames
 *
 * Purpose: The IMU synthesizer measures in the body frame while the physical
 * simulation reports velocities and gravity in the world frame. These helpers
 * wrap Eigen quaternions for the two frame changes and for orientation
 * integration in the body-state producer.
 *
 * References:
 * - Joan Solà: "Quaternion kinematics for the error-state Kalman filter"
 *   https://arxiv.org/abs/1711.02508
 * - Eigen Geometry: https://eigen.tuxfamily.org/dox/group__Geometry__Module.html
 *
 * Sample Input:
 *   - q = 90° about +X, v_world = [0, 1, 0]
 *
 * Expected Output:
 *   - world_to_body(q, v_world) = [0, 0, -1]
 *   - body_to_world(q, [0, 0, -1]) = [0, 1, 0]
 */

#ifndef SENSEMU_CORE_QUATERNION_HPP
#define SENSEMU_CORE_QUATERNION_HPP

#include "types.hpp"

namespace sensemu {

/**
 * @brief Exponential map: rotation vector -> unit quaternion
 *
 * @param omega Rotation vector [rad] (axis * angle)
 */
Quaterniond quaternion_exp(const Vector3d& omega);

/**
 * @brief Create quaternion from axis-angle representation
 *
 * @param axis Rotation axis (normalized internally)
 * @param angle Rotation angle [rad]
 */
Quaterniond quaternion_from_axis_angle(const Vector3d& axis, double angle);

/**
 * @brief Express a world-frame vector in the body frame
 *
 * @param orientation body -> world rotation
 */
Vector3d world_to_body(const Quaterniond& orientation, const Vector3d& v_world);

/**
 * @brief Express a body-frame vector in the world frame
 */
Vector3d body_to_world(const Quaterniond& orientation, const Vector3d& v_body);

/**
 * @brief Advance an orientation by a world-frame angular velocity
 *
 * q(t + dt) = Exp(omega_world * dt) * q(t), renormalized.
 */
Quaterniond integrate_orientation(const Quaterniond& orientation,
                                  const Vector3d& omega_world,
                                  double dt);

} // namespace sensemu

#endif // SENSEMU_CORE_QUATERNION_HPP
