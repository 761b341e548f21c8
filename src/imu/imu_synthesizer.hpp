/**
 * @file imu_synthesizer.hpp
 * @brief Six-axis IMU synthesizer driven by rigid body state
 *
 * Purpose: Generate the readings a MEMS accelerometer + gyroscope strapped to
 * the simulated body would report, including the device's error model and its
 * fixed output data rate.
 *
 * Pipeline per reading:
 *   1. Specific force f = a - g (world), a from Δv over the reading interval
 *      or directly from the physical source, rotated into the body frame
 *   2. Angular rate from the body's angular velocity, in the body frame
 *   3. Axis convention transform (NATIVE / NED / ENU)
 *   4. + constant bias
 *   5. + temperature drift coeff * (T - 25 °C)
 *   6. + white noise (Box-Muller, redrawn every reading)
 *   7. Saturation to ±range (g -> m/s², deg/s -> rad/s)
 *   8. Timestamp = simulation time
 *
 * References:
 * - "An Introduction to Inertial Navigation" by Oliver Woodman
 * - InvenSense MPU-6050 datasheet (full-scale ranges, temperature drift)
 *
 * Sample Input:
 *   - Body at rest, upright, gravity [0, -9.81, 0], noise and bias zero
 *
 * Expected Output:
 *   - accel = [0, 9.81, 0] m/s² (NATIVE), gyro = 0, at update_rate_hz
 */

#ifndef SENSEMU_IMU_IMU_SYNTHESIZER_HPP
#define SENSEMU_IMU_IMU_SYNTHESIZER_HPP

#include "core/emulator_config.hpp"
#include "core/rate_limiter.hpp"
#include "core/sensor_types.hpp"
#include "math/gaussian_noise.hpp"

#include <cstdint>

namespace sensemu {

/**
 * @brief IMU synthesizer counters
 */
struct ImuStats {
    uint64_t readings_emitted;      ///< Fresh readings computed
    uint64_t held_ticks;            ///< Ticks that returned the previous reading
    uint64_t accel_saturations;     ///< Readings with a clamped accel axis
    uint64_t gyro_saturations;      ///< Readings with a clamped gyro axis
    uint32_t invalid_dt;            ///< Ticks with negative or non-finite dt

    ImuStats()
        : readings_emitted(0), held_ticks(0), accel_saturations(0),
          gyro_saturations(0), invalid_dt(0) {}
};

/**
 * @brief Emulated 6-axis IMU
 *
 * Lifecycle: constructed uninitialized; configure() moves it to running once
 * and for all. Calibration can change between ticks through the setters.
 * Not thread-safe: one caller per instance.
 */
class ImuSynthesizer {
public:
    EIGEN_MAKE_ALIGNED_OPERATOR_NEW

    enum class State : uint8_t {
        UNINITIALIZED = 0,
        RUNNING = 1
    };

    /**
     * @brief Construct an uninitialized synthesizer
     */
    ImuSynthesizer();

    /**
     * @brief Construct and configure
     * @throws std::invalid_argument if config fails validation
     */
    explicit ImuSynthesizer(const ImuConfig& config);

    /**
     * @brief Apply configuration and start running
     *
     * @return false if the config is invalid or the synthesizer already runs
     */
    bool configure(const ImuConfig& config);

    /**
     * @brief Advance simulation time by dt and produce the current reading
     *
     * A fresh reading is computed only when an update interval has elapsed;
     * otherwise the previous reading is returned unchanged. Missed intervals
     * are coalesced into one reading. Before configure() the default (zero)
     * reading is returned.
     *
     * @param state Body state at the current tick
     * @param dt Time since the previous tick [s]
     */
    const ImuReading& tick(const PhysicalBodyState& state, double dt);

    /**
     * @brief Advance simulation time without a body state
     *
     * The previous reading is held. The next tick() with a body state is
     * stamped with the advanced time and coalesces the intervals skipped here.
     */
    const ImuReading& hold(double dt);

    // === Calibration setters (between ticks) ===

    bool set_accel_calibration(const SensorCalibration& calibration);
    bool set_gyro_calibration(const SensorCalibration& calibration);
    bool set_update_rate(double rate_hz);
    void set_temperature(double temperature_c) { config_.temperature_c = temperature_c; }
    void set_temperature_coefficients(double accel_coeff, double gyro_coeff);
    void reseed(uint32_t seed);

    // === Accessors ===

    State state() const { return state_; }
    bool is_running() const { return state_ == State::RUNNING; }
    const ImuReading& last_reading() const { return reading_; }
    const ImuConfig& config() const { return config_; }
    const ImuStats& stats() const { return stats_; }
    sim_time_t sim_time() const { return sim_time_; }
    uint64_t coalesced_intervals() const { return rate_limiter_.coalesced_count(); }

    // Saturation limits in SI units
    double accel_limit() const;
    double gyro_limit() const;

private:
    bool advance_clock(double dt);
    void compute_reading(const PhysicalBodyState& state, double interval);

    State state_;
    ImuConfig config_;
    UpdateRateLimiter rate_limiter_;
    GaussianNoise noise_;

    sim_time_t sim_time_;
    Vector3d prev_velocity_;
    bool has_prev_velocity_;
    bool warned_uninitialized_;

    ImuReading reading_;
    ImuStats stats_;
};

} // namespace sensemu

#endif // SENSEMU_IMU_IMU_SYNTHESIZER_HPP
