/**
 * @file vector_math.cpp
 * @brief Implementation of vector math utilities
 */

#include "vector_math.hpp"
#include <algorithm>
#include <cmath>

namespace sensemu {

Vector3d saturate(const Vector3d& v, double limit) {
    if (limit <= 0.0) {
        return v;
    }

    Vector3d out;
    for (int i = 0; i < 3; i++) {
        out(i) = std::max(-limit, std::min(limit, v(i)));
    }
    return out;
}

bool is_saturated(const Vector3d& v, double limit) {
    if (limit <= 0.0) {
        return false;
    }
    return v.cwiseAbs().maxCoeff() >= limit;
}

Vector3d compute_mean(const std::vector<Vector3d>& samples) {
    if (samples.empty()) {
        return Vector3d::Zero();
    }

    Vector3d sum = Vector3d::Zero();
    for (const auto& sample : samples) {
        sum += sample;
    }
    return sum / static_cast<double>(samples.size());
}

Vector3d compute_std_dev(const std::vector<Vector3d>& samples) {
    if (samples.size() < 2) {
        return Vector3d::Zero();
    }

    Vector3d mean = compute_mean(samples);
    Vector3d var = Vector3d::Zero();

    for (const auto& sample : samples) {
        Vector3d diff = sample - mean;
        var += diff.cwiseProduct(diff);
    }

    var /= static_cast<double>(samples.size() - 1);
    return var.cwiseSqrt();
}

} // namespace sensemu
