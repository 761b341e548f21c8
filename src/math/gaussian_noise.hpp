/**
 * @file gaussian_noise.hpp
 * @brief Per-sensor Box-Muller white noise generator
 *
 * Purpose: Every emulated sensor owns one generator, seeded at construction,
 * so noise streams are reproducible under test and independent across
 * sensor instances.
 *
 * References:
 * - G. E. P. Box, M. E. Muller: "A Note on the Generation of Random Normal
 *   Deviates", Ann. Math. Statist. 29 (1958)
 *
 * Sample Input:
 *   GaussianNoise noise(42);
 *   noise.sample(0.1);
 *
 * Expected Output:
 *   - Zero-mean normal deviate with σ = 0.1
 *   - Same sequence for every generator seeded with 42
 */

#ifndef SENSEMU_MATH_GAUSSIAN_NOISE_HPP
#define SENSEMU_MATH_GAUSSIAN_NOISE_HPP

#include "core/types.hpp"
#include <cstdint>
#include <random>

namespace sensemu {

class GaussianNoise {
public:
    /**
     * @brief Constructor
     * @param seed Random seed (0 = seed from steady clock)
     */
    explicit GaussianNoise(uint32_t seed = 0);

    /**
     * @brief Draw one zero-mean deviate
     *
     * Box-Muller: sqrt(-2 ln u1) * sin(2π u2), u1 and u2 in (0, 1].
     *
     * @param std_dev Standard deviation (<= 0 returns 0 without drawing)
     */
    double sample(double std_dev);

    /**
     * @brief Draw three independent deviates
     */
    Vector3d sample_vector(double std_dev);

    /**
     * @brief Restart the sequence from a new seed
     */
    void reseed(uint32_t seed);

    uint32_t seed() const { return seed_; }

private:
    std::mt19937 rng_;
    std::uniform_real_distribution<double> uniform_;
    uint32_t seed_;
};

} // namespace sensemu

#endif // SENSEMU_MATH_GAUSSIAN_NOISE_HPP
