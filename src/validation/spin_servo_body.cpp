/**
 * @file spin_servo_body.cpp
 * @brief Implementation of the spin-servo rolling body
 */

#include "spin_servo_body.hpp"
#include "core/quaternion.hpp"

#include <stdexcept>

namespace sensemu {

SpinServoBody::SpinServoBody(const BodyConfig& config)
    : config_(config),
      report_acceleration_(false),
      orientation_(Quaterniond::Identity()),
      angular_velocity_(Vector3d::Zero()),
      linear_velocity_(Vector3d::Zero()),
      linear_acceleration_(Vector3d::Zero()),
      gravity_(0.0, -SIM_GRAVITY, 0.0),
      time_(0.0) {

    if (!config_.validate()) {
        throw std::invalid_argument("Invalid body configuration");
    }
}

double SpinServoBody::spin_rate() const {
    const Vector3d right = body_to_world(orientation_, Vector3d::UnitX());
    return angular_velocity_.dot(right);
}

void SpinServoBody::advance(double dt) {
    if (dt <= 0.0) {
        return;
    }

    const double target = config_.target_spin_deg_s * DEG_TO_RAD;
    const Vector3d right = body_to_world(orientation_, Vector3d::UnitX());

    if (config_.use_torque_servo) {
        // Velocity servo: angular acceleration along the spin axis only
        const double error = target - angular_velocity_.dot(right);
        angular_velocity_ += right * (error * config_.servo_gain * dt);
    } else {
        angular_velocity_ = right * target;
    }

    const double speed = angular_velocity_.norm();
    if (speed > config_.max_angular_velocity) {
        angular_velocity_ *= config_.max_angular_velocity / speed;
    }

    orientation_ = integrate_orientation(orientation_, angular_velocity_, dt);

    const Vector3d up = -gravity_.normalized();
    const Vector3d velocity = config_.shell_radius * angular_velocity_.cross(up);
    linear_acceleration_ = (velocity - linear_velocity_) / dt;
    linear_velocity_ = velocity;

    time_ += dt;
}

bool SpinServoBody::sample(PhysicalBodyState& state) const {
    state.linear_velocity = linear_velocity_;
    state.angular_velocity = angular_velocity_;
    state.orientation = orientation_;
    state.gravity = gravity_;
    state.has_linear_acceleration = report_acceleration_;
    state.linear_acceleration = report_acceleration_ ? linear_acceleration_ : Vector3d::Zero();
    return true;
}

} // namespace sensemu
