/**
 * @file sensor_types.hpp
 * @brief Data structures exchanged between the emulator and its collaborators
 *
 * Purpose: Define the ground-truth inputs (camera image, rigid body state) and
 * the emulated device outputs (IMU reading). Wire byte buffers for camera and
 * microphone are plain std::vector<uint8_t> owned by their components.
 *
 * Sample Input:
 *   - RawColorFrame: 640x480 RGB image from the renderer
 *   - PhysicalBodyState: v = [0, 0, 1] m/s, omega = [2, 0, 0] rad/s
 *
 * Expected Output:
 *   - ImuReading with specific force, angular rate, gravity, temperature and
 *     timestamp in SI units
 */

#ifndef SENSEMU_CORE_SENSOR_TYPES_HPP
#define SENSEMU_CORE_SENSOR_TYPES_HPP

#include "types.hpp"
#include <cstddef>
#include <cstdint>

namespace sensemu {

// ========== Camera Input ==========

/**
 * @brief Non-owning view of a caller-owned 8-bit color image
 *
 * Row-major, tightly packed. bytes_per_pixel is 3 (RGB) or 4 (RGBA, alpha
 * ignored). Valid only for the duration of the poll that received it.
 */
struct RawColorFrame {
    const uint8_t* pixels;      ///< width * height * bytes_per_pixel bytes
    int width;                  ///< Source width [px]
    int height;                 ///< Source height [px]
    int bytes_per_pixel;        ///< 3 = RGB, 4 = RGBA

    RawColorFrame()
        : pixels(nullptr), width(0), height(0), bytes_per_pixel(3) {}

    RawColorFrame(const uint8_t* data, int w, int h, int bpp)
        : pixels(data), width(w), height(h), bytes_per_pixel(bpp) {}

    size_t size_bytes() const {
        return static_cast<size_t>(width) * static_cast<size_t>(height) *
               static_cast<size_t>(bytes_per_pixel);
    }
};

// ========== Rigid Body Input ==========

/**
 * @brief Snapshot of the simulated rigid body at the current tick
 *
 * Velocities and gravity are expressed in the world frame of the simulation.
 * orientation rotates body-frame vectors into the world frame.
 */
struct PhysicalBodyState {
    EIGEN_MAKE_ALIGNED_OPERATOR_NEW

    Vector3d linear_velocity;       ///< [m/s], world frame
    Vector3d angular_velocity;      ///< [rad/s], world frame
    Quaterniond orientation;        ///< body -> world
    Vector3d gravity;               ///< [m/s²], world frame

    // Filled only by physical sources that integrate forces themselves
    bool has_linear_acceleration;
    Vector3d linear_acceleration;   ///< [m/s²], world frame (force / mass)

    PhysicalBodyState()
        : linear_velocity(Vector3d::Zero()),
          angular_velocity(Vector3d::Zero()),
          orientation(Quaterniond::Identity()),
          gravity(0.0, -SIM_GRAVITY, 0.0),
          has_linear_acceleration(false),
          linear_acceleration(Vector3d::Zero()) {}
};

// ========== IMU Output ==========

/**
 * @brief One six-axis reading of the emulated IMU
 *
 * Frequency: configured update rate (default 100 Hz)
 */
struct ImuReading {
    EIGEN_MAKE_ALIGNED_OPERATOR_NEW

    Vector3d accel;             ///< Specific force [m/s²], sensor frame
    Vector3d gyro;              ///< Angular velocity [rad/s], sensor frame
    Vector3d gravity;           ///< Gravity [m/s²], sensor frame
    double temperature_c;       ///< Die temperature [°C]
    sim_time_t timestamp_s;     ///< Monotonic simulation time [s]
    uint32_t sequence;          ///< Number of readings emitted before this one

    ImuReading()
        : accel(Vector3d::Zero()), gyro(Vector3d::Zero()),
          gravity(Vector3d::Zero()), temperature_c(REFERENCE_TEMPERATURE_C),
          timestamp_s(0.0), sequence(0) {}
};

// ========== Calibration ==========

/**
 * @brief Axis convention of an emulated sensor's output
 *
 * NATIVE is the simulation frame (x right, y up, z forward).
 */
enum class CoordinateConvention : uint8_t {
    NATIVE = 0,
    NED = 1,    ///< North-East-Down
    ENU = 2     ///< East-North-Up
};

/**
 * @brief Per-sensor error model, fixed while the sensor runs
 *
 * range is in the sensor's datasheet unit: g for accelerometers, deg/s for
 * gyroscopes.
 */
struct SensorCalibration {
    EIGEN_MAKE_ALIGNED_OPERATOR_NEW

    double noise_std;                   ///< White noise 1-sigma [SI unit]
    Vector3d bias;                      ///< Constant bias [SI unit], sensor frame
    double range;                       ///< Full scale [g] or [deg/s]
    CoordinateConvention convention;

    SensorCalibration()
        : noise_std(0.0), bias(Vector3d::Zero()), range(0.0),
          convention(CoordinateConvention::NATIVE) {}

    SensorCalibration(double std_dev, const Vector3d& b, double full_scale,
                      CoordinateConvention conv)
        : noise_std(std_dev), bias(b), range(full_scale), convention(conv) {}
};

// ========== Faults ==========

/**
 * @brief Configuration-time faults that disable a component
 */
enum class SensorFault : uint8_t {
    NONE = 0,
    NO_DEVICE,          ///< No capture device registered
    DEVICE_NOT_FOUND,   ///< Requested device name not registered
    DEVICE_START_FAILED ///< Device found but refused the requested format
};

inline const char* sensor_fault_name(SensorFault fault) {
    switch (fault) {
        case SensorFault::NONE: return "none";
        case SensorFault::NO_DEVICE: return "no device";
        case SensorFault::DEVICE_NOT_FOUND: return "device not found";
        case SensorFault::DEVICE_START_FAILED: return "device start failed";
    }
    return "unknown";
}

} // namespace sensemu

#endif // SENSEMU_CORE_SENSOR_TYPES_HPP
