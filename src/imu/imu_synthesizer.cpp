/**
 * @file imu_synthesizer.cpp
 * @brief Implementation of the six-axis IMU synthesizer
 */

#include "imu_synthesizer.hpp"
#include "core/quaternion.hpp"
#include "math/coordinate_frames.hpp"
#include "math/vector_math.hpp"
#include "utils/logger.hpp"

#include <cmath>
#include <stdexcept>

namespace sensemu {

ImuSynthesizer::ImuSynthesizer()
    : state_(State::UNINITIALIZED),
      config_(),
      rate_limiter_(config_.update_rate_hz),
      noise_(config_.seed),
      sim_time_(0.0),
      prev_velocity_(Vector3d::Zero()),
      has_prev_velocity_(false),
      warned_uninitialized_(false) {}

ImuSynthesizer::ImuSynthesizer(const ImuConfig& config)
    : ImuSynthesizer() {
    if (!configure(config)) {
        throw std::invalid_argument("Invalid IMU configuration");
    }
}

bool ImuSynthesizer::configure(const ImuConfig& config) {
    if (state_ == State::RUNNING) {
        LOG_WARN("IMU already running, use the calibration setters instead");
        return false;
    }

    if (!config.validate()) {
        return false;
    }

    config_ = config;
    rate_limiter_.set_rate(config_.update_rate_hz);
    rate_limiter_.reset();
    noise_.reseed(config_.seed);

    reading_ = ImuReading();
    reading_.temperature_c = config_.temperature_c;

    state_ = State::RUNNING;
    LOG_INFO("IMU running: %.1f Hz, accel ±%.1f g (%s), gyro ±%.0f deg/s (%s), seed %u",
             config_.update_rate_hz,
             config_.accel.range, convention_name(config_.accel.convention),
             config_.gyro.range, convention_name(config_.gyro.convention),
             noise_.seed());
    return true;
}

double ImuSynthesizer::accel_limit() const {
    return config_.accel.range * G_TO_MS2;
}

double ImuSynthesizer::gyro_limit() const {
    return config_.gyro.range * DEG_TO_RAD;
}

const ImuReading& ImuSynthesizer::tick(const PhysicalBodyState& state, double dt) {
    if (!advance_clock(dt) || !rate_limiter_.poll(sim_time_)) {
        stats_.held_ticks++;
        return reading_;
    }

    compute_reading(state, rate_limiter_.last_interval());
    return reading_;
}

const ImuReading& ImuSynthesizer::hold(double dt) {
    advance_clock(dt);
    stats_.held_ticks++;
    return reading_;
}

bool ImuSynthesizer::advance_clock(double dt) {
    if (state_ != State::RUNNING) {
        if (!warned_uninitialized_) {
            LOG_WARN("IMU ticked before configure(), returning zero reading");
            warned_uninitialized_ = true;
        }
        return false;
    }

    if (!std::isfinite(dt) || dt < 0.0) {
        stats_.invalid_dt++;
        LOG_ERROR("IMU tick with invalid dt %f, treated as 0", dt);
        dt = 0.0;
    }
    sim_time_ += dt;
    return true;
}

void ImuSynthesizer::compute_reading(const PhysicalBodyState& state, double interval) {
    // 1. Specific force in the world frame
    Vector3d accel_world = Vector3d::Zero();
    if (state.has_linear_acceleration) {
        accel_world = state.linear_acceleration;
    } else if (has_prev_velocity_ && interval > 0.0) {
        accel_world = (state.linear_velocity - prev_velocity_) / interval;
    }
    prev_velocity_ = state.linear_velocity;
    has_prev_velocity_ = true;

    const Vector3d specific_force_world = accel_world - state.gravity;

    // 1-2. Body frame
    const Vector3d specific_force_body = world_to_body(state.orientation, specific_force_world);
    const Vector3d omega_body = world_to_body(state.orientation, state.angular_velocity);
    const Vector3d gravity_body = world_to_body(state.orientation, state.gravity);

    // 3. Sensor axis convention
    Vector3d accel = to_convention(specific_force_body, config_.accel.convention);
    Vector3d gyro = to_convention(omega_body, config_.gyro.convention);
    const Vector3d gravity = to_convention(gravity_body, config_.accel.convention);

    // 4. Bias
    accel += config_.accel.bias;
    gyro += config_.gyro.bias;

    // 5. Temperature drift
    const double delta_t = config_.temperature_c - REFERENCE_TEMPERATURE_C;
    accel += Vector3d::Constant(config_.accel_temp_coeff * delta_t);
    gyro += Vector3d::Constant(config_.gyro_temp_coeff * delta_t);

    // 6. White noise, fresh draws every reading
    accel += noise_.sample_vector(config_.accel.noise_std);
    gyro += noise_.sample_vector(config_.gyro.noise_std);

    // 7. Saturation
    const double a_limit = accel_limit();
    const double g_limit = gyro_limit();
    if (is_saturated(accel, a_limit)) {
        stats_.accel_saturations++;
    }
    if (is_saturated(gyro, g_limit)) {
        stats_.gyro_saturations++;
    }

    // 8. Stamp
    const uint32_t sequence = static_cast<uint32_t>(stats_.readings_emitted);

    reading_.accel = saturate(accel, a_limit);
    reading_.gyro = saturate(gyro, g_limit);
    reading_.gravity = gravity;
    reading_.temperature_c = config_.temperature_c;
    reading_.timestamp_s = sim_time_;
    reading_.sequence = sequence;

    stats_.readings_emitted++;
}

// === Calibration setters ===

bool ImuSynthesizer::set_accel_calibration(const SensorCalibration& calibration) {
    if (!is_valid_convention(calibration.convention)) {
        LOG_ERROR("Rejected accel calibration: invalid convention %d",
                  static_cast<int>(calibration.convention));
        return false;
    }
    if (calibration.noise_std < 0.0 || !(calibration.range > 0.0)) {
        LOG_ERROR("Rejected accel calibration: noise %.4f, range %.2f g",
                  calibration.noise_std, calibration.range);
        return false;
    }
    config_.accel = calibration;
    return true;
}

bool ImuSynthesizer::set_gyro_calibration(const SensorCalibration& calibration) {
    if (!is_valid_convention(calibration.convention)) {
        LOG_ERROR("Rejected gyro calibration: invalid convention %d",
                  static_cast<int>(calibration.convention));
        return false;
    }
    if (calibration.noise_std < 0.0 || !(calibration.range > 0.0)) {
        LOG_ERROR("Rejected gyro calibration: noise %.4f, range %.2f deg/s",
                  calibration.noise_std, calibration.range);
        return false;
    }
    config_.gyro = calibration;
    return true;
}

bool ImuSynthesizer::set_update_rate(double rate_hz) {
    if (!rate_limiter_.set_rate(rate_hz)) {
        LOG_ERROR("Rejected IMU update rate %.3f Hz", rate_hz);
        return false;
    }
    config_.update_rate_hz = rate_hz;
    return true;
}

void ImuSynthesizer::set_temperature_coefficients(double accel_coeff, double gyro_coeff) {
    config_.accel_temp_coeff = accel_coeff;
    config_.gyro_temp_coeff = gyro_coeff;
}

void ImuSynthesizer::reseed(uint32_t seed) {
    config_.seed = seed;
    noise_.reseed(seed);
}

} // namespace sensemu
