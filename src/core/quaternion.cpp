/**
 * @file quaternion.cpp
 * @brief Implementation of orientation helpers
 */

#include "quaternion.hpp"
#include <cmath>

namespace sensemu {

Quaterniond quaternion_exp(const Vector3d& omega) {
    double theta = omega.norm();

    if (theta < 1e-8) {
        // First-order expansion: q ≈ [1, omega/2]
        return Quaterniond(1.0,
                          0.5 * omega.x(),
                          0.5 * omega.y(),
                          0.5 * omega.z()).normalized();
    }

    double half_theta = 0.5 * theta;
    double s = std::sin(half_theta) / theta;

    return Quaterniond(std::cos(half_theta),
                      s * omega.x(),
                      s * omega.y(),
                      s * omega.z());
}

Quaterniond quaternion_from_axis_angle(const Vector3d& axis, double angle) {
    Vector3d axis_norm = axis.normalized();

    double half_angle = 0.5 * angle;
    double s = std::sin(half_angle);

    return Quaterniond(std::cos(half_angle),
                      s * axis_norm.x(),
                      s * axis_norm.y(),
                      s * axis_norm.z());
}

Vector3d world_to_body(const Quaterniond& orientation, const Vector3d& v_world) {
    // Unit quaternion: inverse == conjugate
    return orientation.conjugate()._transformVector(v_world);
}

Vector3d body_to_world(const Quaterniond& orientation, const Vector3d& v_body) {
    return orientation._transformVector(v_body);
}

Quaterniond integrate_orientation(const Quaterniond& orientation,
                                  const Vector3d& omega_world,
                                  double dt) {
    Quaterniond q = quaternion_exp(omega_world * dt) * orientation;
    q.normalize();
    return q;
}

} // namespace sensemu
