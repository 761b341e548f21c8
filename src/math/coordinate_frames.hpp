/**
 * @file coordinate_frames.hpp
 * @brief Fixed axis conventions of the emulated sensors
 *
 * Purpose: Map vectors from the simulation frame (x right, y up, z forward)
 * into the axis convention a sensor is configured to report, and back.
 * Each convention is a signed permutation of the axes, so every transform is
 * exact in floating point and has an exact inverse.
 *
 *   NATIVE: (x, y, z)                  identity
 *   ENU:    (east, north, up)   = (x, z, y)
 *   NED:    (north, east, down) = (z, x, -y)
 *
 * Sample Input:
 *   - v_native = [1, 2, 3], convention = NED
 *
 * Expected Output:
 *   - to_convention(v_native, NED) = [3, 1, -2]
 *   - from_convention([3, 1, -2], NED) = [1, 2, 3]
 */

#ifndef SENSEMU_MATH_COORDINATE_FRAMES_HPP
#define SENSEMU_MATH_COORDINATE_FRAMES_HPP

#include "core/sensor_types.hpp"
#include "core/types.hpp"
#include <string>

namespace sensemu {

/**
 * @brief Express a simulation-frame vector in the given convention
 *
 * An out-of-range convention value is logged and treated as NATIVE.
 */
Vector3d to_convention(const Vector3d& v_native, CoordinateConvention convention);

/**
 * @brief Inverse of to_convention()
 */
Vector3d from_convention(const Vector3d& v, CoordinateConvention convention);

/**
 * @brief Check that a convention value is one of the enumerated variants
 */
bool is_valid_convention(CoordinateConvention convention);

/**
 * @brief Parse a convention name ("native", "ned", "enu", case-insensitive)
 *
 * @param name Convention name
 * @param out Parsed convention; NATIVE when the name is unknown
 * @return false if the name is unknown
 */
bool parse_coordinate_convention(const std::string& name, CoordinateConvention& out);

/**
 * @brief Short lowercase name of a convention
 */
const char* convention_name(CoordinateConvention convention);

} // namespace sensemu

#endif // SENSEMU_MATH_COORDINATE_FRAMES_HPP
