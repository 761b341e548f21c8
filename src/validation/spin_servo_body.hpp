/**
 * @file spin_servo_body.hpp
 * @brief Spherical rolling robot driven by a spin servo
 *
 * Purpose: Minimal physical-state producer for the IMU synthesizer. Models the
 * robot shell as a sphere rolling without slip on a horizontal floor, spun
 * about its local +X axis by a velocity servo.
 *
 * Math:
 *   ω_err = ω_target - (ω · x_body)
 *   ω    += x_body * ω_err * servo_gain * dt          (torque servo)
 *   |ω|  <= max_angular_velocity
 *   q     = Exp(ω dt) * q
 *   v     = R (ω × up)                                (rolling, no slip)
 *
 * Sample Input:
 *   - target 90 deg/s, servo_gain 12, dt 0.01 s, 2 s of simulation
 *
 * Expected Output:
 *   - ω · x_body → 1.571 rad/s, v magnitude → 1.571 * R
 */

#ifndef SENSEMU_VALIDATION_SPIN_SERVO_BODY_HPP
#define SENSEMU_VALIDATION_SPIN_SERVO_BODY_HPP

#include "core/emulator_config.hpp"
#include "core/types.hpp"
#include "imu/body_state_provider.hpp"

namespace sensemu {

class SpinServoBody : public BodyStateProvider {
public:
    EIGEN_MAKE_ALIGNED_OPERATOR_NEW

    /**
     * @brief Constructor
     * @throws std::invalid_argument if config fails validation
     */
    explicit SpinServoBody(const BodyConfig& config = BodyConfig());

    // Step the servo, orientation and rolling velocity by dt seconds
    void advance(double dt);

    bool sample(PhysicalBodyState& state) const override;

    // Spin target about local +X [deg/s]
    void set_target_spin(double deg_per_s) { config_.target_spin_deg_s = deg_per_s; }

    // Also report a → the IMU then skips differentiating velocity
    void set_report_acceleration(bool report) { report_acceleration_ = report; }

    // Spin rate about the local +X axis [rad/s]
    double spin_rate() const;

    const Vector3d& angular_velocity() const { return angular_velocity_; }
    const Vector3d& linear_velocity() const { return linear_velocity_; }
    const Quaterniond& orientation() const { return orientation_; }
    double time() const { return time_; }

private:
    BodyConfig config_;
    bool report_acceleration_;

    Quaterniond orientation_;
    Vector3d angular_velocity_;   ///< world frame
    Vector3d linear_velocity_;    ///< world frame
    Vector3d linear_acceleration_;
    Vector3d gravity_;
    double time_;
};

} // namespace sensemu

#endif // SENSEMU_VALIDATION_SPIN_SERVO_BODY_HPP
