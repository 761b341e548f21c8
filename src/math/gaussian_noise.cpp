/**
 * @file gaussian_noise.cpp
 * @brief Implementation of the Box-Muller noise generator
 */

#include "gaussian_noise.hpp"
#include <chrono>
#include <cmath>

namespace sensemu {

namespace {
constexpr double TWO_PI = 2.0 * 3.14159265358979323846;
}

GaussianNoise::GaussianNoise(uint32_t seed)
    : uniform_(0.0, 1.0),
      seed_(0)
{
    reseed(seed);
}

void GaussianNoise::reseed(uint32_t seed) {
    if (seed == 0) {
        seed = static_cast<uint32_t>(
            std::chrono::steady_clock::now().time_since_epoch().count());
    }
    seed_ = seed;
    rng_.seed(seed_);
    uniform_.reset();
}

double GaussianNoise::sample(double std_dev) {
    if (std_dev <= 0.0) {
        return 0.0;
    }

    // 1 - U[0,1) lies in (0,1], keeps log() finite
    double u1 = 1.0 - uniform_(rng_);
    double u2 = 1.0 - uniform_(rng_);

    double standard_normal = std::sqrt(-2.0 * std::log(u1)) * std::sin(TWO_PI * u2);
    return std_dev * standard_normal;
}

Vector3d GaussianNoise::sample_vector(double std_dev) {
    Vector3d n;
    n.x() = sample(std_dev);
    n.y() = sample(std_dev);
    n.z() = sample(std_dev);
    return n;
}

} // namespace sensemu
