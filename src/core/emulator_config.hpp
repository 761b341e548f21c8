// Emulator Configuration - Recognized options of every emulated device
//
// Purpose: Plain configuration structs with the defaults of the emulated
// robot (ESP32-class board with OV2640 camera, I2S microphone, 6-axis IMU).
// Each struct validates itself and logs every rejected field.
//
// Sample Usage:
//   EmulatorConfig config;
//   config.camera.target_fps = 15;
//   config.imu.accel.convention = CoordinateConvention::NED;
//   if (!config.validate()) { ...reject... }
//
// Expected Output:
//   - Defaults: 320x240 @ 30 fps, 16 kHz / 20 ms / 2 s ring, IMU at 100 Hz

#pragma once

#include "core/sensor_types.hpp"
#include "core/types.hpp"

#include <cstdint>
#include <string>

namespace sensemu {

/**
 * @brief Camera configuration
 */
struct CameraConfig {
    int target_width;             ///< Wire frame width [px] (default: 320)
    int target_height;            ///< Wire frame height [px] (default: 240)
    int target_fps;               ///< Frame rate [Hz] (default: 30)
    std::string device_name;      ///< Capture device ("" = first available)

    CameraConfig()
        : target_width(320),
          target_height(240),
          target_fps(30),
          device_name() {}

    bool validate() const;
};

/**
 * @brief Microphone configuration
 */
struct MicrophoneConfig {
    int sample_rate;              ///< [Hz] (default: 16000)
    int frame_ms;                 ///< Default frame duration [ms] (default: 20)
    int buffer_seconds;           ///< Ring buffer length [s] (default: 2)
    std::string device_name;      ///< Capture device ("" = first available)
    bool log_volume;              ///< Log RMS / dB on every hub tick

    MicrophoneConfig()
        : sample_rate(16000),
          frame_ms(20),
          buffer_seconds(2),
          device_name(),
          log_volume(false) {}

    // Samples per channel in the default frame
    int frame_samples() const { return sample_rate * frame_ms / 1000; }

    bool validate() const;
};

/**
 * @brief IMU configuration
 *
 * accel.range is in g, gyro.range in deg/s. Temperature drift is
 * coefficient * (temperature_c - 25 °C) added to every axis.
 */
struct ImuConfig {
    EIGEN_MAKE_ALIGNED_OPERATOR_NEW

    SensorCalibration accel;      ///< noise [m/s²], bias [m/s²], range [g]
    SensorCalibration gyro;       ///< noise [rad/s], bias [rad/s], range [deg/s]

    double update_rate_hz;        ///< Reading rate [Hz] (default: 100)
    double accel_temp_coeff;      ///< Accel drift [m/s² per °C]
    double gyro_temp_coeff;       ///< Gyro drift [rad/s per °C] (default: accel / 10)
    double temperature_c;         ///< Initial die temperature [°C]
    uint32_t seed;                ///< Noise seed (0 = from clock)

    ImuConfig()
        : accel(0.1, Vector3d::Zero(), 16.0, CoordinateConvention::NATIVE),
          gyro(0.01, Vector3d::Zero(), 2000.0, CoordinateConvention::NATIVE),
          update_rate_hz(100.0),
          accel_temp_coeff(0.002),
          gyro_temp_coeff(0.0002),
          temperature_c(REFERENCE_TEMPERATURE_C),
          seed(0) {}

    bool validate() const;
};

/**
 * @brief Physical-state producer configuration (spinning sphere robot)
 *
 * Owned by the body model; the IMU synthesizer only consumes its output.
 */
struct BodyConfig {
    bool use_torque_servo;        ///< true = velocity servo, false = hard-set spin
    double servo_gain;            ///< Servo gain [1/s] (default: 12)
    double max_angular_velocity;  ///< Angular speed cap [rad/s] (default: 50)
    double shell_radius;          ///< Rolling radius [m]
    double target_spin_deg_s;     ///< Spin target about local +X [deg/s]

    BodyConfig()
        : use_torque_servo(true),
          servo_gain(12.0),
          max_angular_velocity(50.0),
          shell_radius(0.1),
          target_spin_deg_s(0.0) {}

    bool validate() const;
};

/**
 * @brief Battery gauge configuration
 */
struct BatteryConfig {
    double starting_percent;      ///< [%] (default: 100)
    double drain_rate;            ///< [% per second] (default: 1)
    bool log_battery;             ///< Log the charge on every hub tick

    BatteryConfig()
        : starting_percent(100.0),
          drain_rate(1.0),
          log_battery(false) {}

    bool validate() const;
};

/**
 * @brief Complete emulator configuration
 */
struct EmulatorConfig {
    EIGEN_MAKE_ALIGNED_OPERATOR_NEW

    CameraConfig camera;
    MicrophoneConfig microphone;
    ImuConfig imu;
    BodyConfig body;
    BatteryConfig battery;

    bool validate() const;
};

}  // namespace sensemu
