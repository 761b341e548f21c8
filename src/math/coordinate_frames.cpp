/**
 * @file coordinate_frames.cpp
 * @brief Implementation of sensor axis conventions
 */

#include "coordinate_frames.hpp"
#include "utils/logger.hpp"

#include <algorithm>
#include <cctype>

namespace sensemu {

bool is_valid_convention(CoordinateConvention convention) {
    switch (convention) {
        case CoordinateConvention::NATIVE:
        case CoordinateConvention::NED:
        case CoordinateConvention::ENU:
            return true;
    }
    return false;
}

Vector3d to_convention(const Vector3d& v_native, CoordinateConvention convention) {
    switch (convention) {
        case CoordinateConvention::NATIVE:
            return v_native;
        case CoordinateConvention::ENU:
            return Vector3d(v_native.x(), v_native.z(), v_native.y());
        case CoordinateConvention::NED:
            return Vector3d(v_native.z(), v_native.x(), -v_native.y());
    }

    LOG_ERROR("Invalid coordinate convention %d, passing vector through",
              static_cast<int>(convention));
    return v_native;
}

Vector3d from_convention(const Vector3d& v, CoordinateConvention convention) {
    switch (convention) {
        case CoordinateConvention::NATIVE:
            return v;
        case CoordinateConvention::ENU:
            // (e, n, u) -> (x = e, y = u, z = n)
            return Vector3d(v.x(), v.z(), v.y());
        case CoordinateConvention::NED:
            // (n, e, d) -> (x = e, y = -d, z = n)
            return Vector3d(v.y(), -v.z(), v.x());
    }

    LOG_ERROR("Invalid coordinate convention %d, passing vector through",
              static_cast<int>(convention));
    return v;
}

bool parse_coordinate_convention(const std::string& name, CoordinateConvention& out) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "native" || lower == "sim") {
        out = CoordinateConvention::NATIVE;
        return true;
    }
    if (lower == "ned") {
        out = CoordinateConvention::NED;
        return true;
    }
    if (lower == "enu") {
        out = CoordinateConvention::ENU;
        return true;
    }

    LOG_ERROR("Unknown coordinate convention '%s', using native", name.c_str());
    out = CoordinateConvention::NATIVE;
    return false;
}

const char* convention_name(CoordinateConvention convention) {
    switch (convention) {
        case CoordinateConvention::NATIVE: return "native";
        case CoordinateConvention::NED: return "ned";
        case CoordinateConvention::ENU: return "enu";
    }
    return "invalid";
}

} // namespace sensemu
