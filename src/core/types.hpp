/**
 * @file types.hpp
 * @brief Core type definitions using Eigen library for the sensor emulator
 *
 * Purpose: Strongly-typed aliases for the vector math used by the IMU
 * synthesizer and the body-state producer, plus the physical constants the
 * emulated devices are calibrated against.
 *
 * References:
 * - Eigen: https://eigen.tuxfamily.org/dox/group__QuickRefPage.html
 *
 * Sample Input: N/A (type definitions only)
 * Expected Output: Compile-time type safety for all vector operations
 */

#ifndef SENSEMU_CORE_TYPES_HPP
#define SENSEMU_CORE_TYPES_HPP

#include <Eigen/Dense>
#include <Eigen/Geometry>
#include <cstdint>

namespace sensemu {

// ========== Double Precision (kinematics and IMU pipeline) ==========

using Vector3d = Eigen::Vector3d;
using Quaterniond = Eigen::Quaterniond;

// ========== Constants ==========

// Accelerometer full-scale conversion used by the emulated device [m/s² per g]
constexpr double G_TO_MS2 = 9.81;

// Default world gravity magnitude of the simulation [m/s²]
constexpr double SIM_GRAVITY = 9.81;

// Reference temperature for drift terms [°C]
constexpr double REFERENCE_TEMPERATURE_C = 25.0;

constexpr double DEG_TO_RAD = 3.14159265358979323846 / 180.0;

// Simulation time in seconds (monotonic, starts at 0)
using sim_time_t = double;

} // namespace sensemu

#endif // SENSEMU_CORE_TYPES_HPP
