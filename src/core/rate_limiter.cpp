// Update Rate Limiter Implementation
#include "core/rate_limiter.hpp"

#include <cmath>
#include <stdexcept>

namespace sensemu {

namespace {
// Tolerance relative to the period for accumulated dt rounding
constexpr double DEADLINE_TOLERANCE = 1e-6;
}

UpdateRateLimiter::UpdateRateLimiter(double rate_hz)
    : period_(0.0),
      next_deadline_(0.0),
      last_update_(0.0),
      last_interval_(0.0),
      has_updated_(false),
      update_count_(0),
      coalesced_count_(0) {

    if (!(rate_hz > 0.0)) {
        throw std::invalid_argument("Update rate must be positive");
    }
    period_ = 1.0 / rate_hz;
}

bool UpdateRateLimiter::poll(sim_time_t now) {
    if (!has_updated_) {
        has_updated_ = true;
        last_update_ = now;
        last_interval_ = 0.0;
        next_deadline_ = now + period_;
        update_count_++;
        return true;
    }

    const double tolerance = period_ * DEADLINE_TOLERANCE;
    if (now + tolerance < next_deadline_) {
        return false;
    }

    // Whole periods that elapsed past the deadline were skipped by the caller
    const double overdue = now + tolerance - next_deadline_;
    const uint64_t missed = static_cast<uint64_t>(std::floor(overdue / period_));

    coalesced_count_ += missed;
    next_deadline_ += static_cast<double>(missed + 1) * period_;

    last_interval_ = now - last_update_;
    last_update_ = now;
    update_count_++;
    return true;
}

bool UpdateRateLimiter::set_rate(double rate_hz) {
    if (!(rate_hz > 0.0)) {
        return false;
    }

    period_ = 1.0 / rate_hz;
    if (has_updated_) {
        next_deadline_ = last_update_ + period_;
    }
    return true;
}

void UpdateRateLimiter::reset() {
    next_deadline_ = 0.0;
    last_update_ = 0.0;
    last_interval_ = 0.0;
    has_updated_ = false;
    update_count_ = 0;
    coalesced_count_ = 0;
}

}  // namespace sensemu
