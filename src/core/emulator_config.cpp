// Emulator Configuration Validation
#include "core/emulator_config.hpp"
#include "math/coordinate_frames.hpp"
#include "utils/logger.hpp"

namespace sensemu {

bool CameraConfig::validate() const {
    bool ok = true;

    if (target_width <= 0 || target_height <= 0) {
        LOG_ERROR("camera: target resolution %dx%d must be positive",
                  target_width, target_height);
        ok = false;
    }
    if (target_fps <= 0) {
        LOG_ERROR("camera: target_fps %d must be positive", target_fps);
        ok = false;
    }
    return ok;
}

bool MicrophoneConfig::validate() const {
    bool ok = true;

    if (sample_rate <= 0) {
        LOG_ERROR("microphone: sample_rate %d must be positive", sample_rate);
        ok = false;
    }
    if (frame_ms <= 0) {
        LOG_ERROR("microphone: frame_ms %d must be positive", frame_ms);
        ok = false;
    }
    if (buffer_seconds <= 0) {
        LOG_ERROR("microphone: buffer_seconds %d must be positive", buffer_seconds);
        ok = false;
    }
    if (ok && frame_ms > buffer_seconds * 1000) {
        LOG_ERROR("microphone: frame_ms %d exceeds ring buffer of %d s",
                  frame_ms, buffer_seconds);
        ok = false;
    }
    if (ok && frame_samples() == 0) {
        LOG_ERROR("microphone: %d ms at %d Hz is less than one sample",
                  frame_ms, sample_rate);
        ok = false;
    }
    return ok;
}

bool ImuConfig::validate() const {
    bool ok = true;

    if (!(update_rate_hz > 0.0)) {
        LOG_ERROR("imu: update_rate_hz %.3f must be positive", update_rate_hz);
        ok = false;
    }
    if (accel.noise_std < 0.0 || gyro.noise_std < 0.0) {
        LOG_ERROR("imu: noise std must be non-negative (accel %.4f, gyro %.4f)",
                  accel.noise_std, gyro.noise_std);
        ok = false;
    }
    if (!(accel.range > 0.0) || !(gyro.range > 0.0)) {
        LOG_ERROR("imu: ranges must be positive (accel %.2f g, gyro %.2f deg/s)",
                  accel.range, gyro.range);
        ok = false;
    }
    if (!is_valid_convention(accel.convention) || !is_valid_convention(gyro.convention)) {
        LOG_ERROR("imu: invalid coordinate convention (accel %d, gyro %d)",
                  static_cast<int>(accel.convention), static_cast<int>(gyro.convention));
        ok = false;
    }
    return ok;
}

bool BodyConfig::validate() const {
    bool ok = true;

    if (servo_gain < 0.0) {
        LOG_ERROR("body: servo_gain %.2f must be non-negative", servo_gain);
        ok = false;
    }
    if (!(max_angular_velocity > 0.0)) {
        LOG_ERROR("body: max_angular_velocity %.2f must be positive", max_angular_velocity);
        ok = false;
    }
    if (!(shell_radius > 0.0)) {
        LOG_ERROR("body: shell_radius %.3f must be positive", shell_radius);
        ok = false;
    }
    return ok;
}

bool BatteryConfig::validate() const {
    bool ok = true;

    if (starting_percent < 0.0 || starting_percent > 100.0) {
        LOG_ERROR("battery: starting_percent %.1f outside [0, 100]", starting_percent);
        ok = false;
    }
    if (drain_rate < 0.0) {
        LOG_ERROR("battery: drain_rate %.3f must be non-negative", drain_rate);
        ok = false;
    }
    return ok;
}

bool EmulatorConfig::validate() const {
    // Evaluate all sections so every problem is logged at once
    bool ok = camera.validate();
    ok = microphone.validate() && ok;
    ok = imu.validate() && ok;
    ok = body.validate() && ok;
    ok = battery.validate() && ok;
    return ok;
}

}  // namespace sensemu
