// Update Rate Limiter - Fixed-rate sensor scheduling on a polled clock
//
// Purpose: Decouple a sensor's configured update rate from the caller's poll
// frequency. The caller polls with the current simulation time; the limiter
// answers whether a fresh sample is due.
//
// Key Features:
// - At most one update per poll: missed intervals are coalesced, never backfilled
// - Phase preserved: the next deadline advances by whole periods
// - Coalesced interval counter for diagnostics
// - Small tolerance so accumulated dt rounding (100 x 0.01 s) still lands on time
//
// Sample Usage:
//   UpdateRateLimiter limiter(100.0);   // 100 Hz
//   if (limiter.poll(now)) {
//       double span = limiter.last_interval();
//       ...compute reading over span...
//   }
//
// Expected Output:
//   - Polled at 1 kHz: true every 10th poll
//   - Polled at 20 Hz: true every poll, 4 intervals coalesced per poll

#pragma once

#include "core/types.hpp"

#include <cstdint>

namespace sensemu {

class UpdateRateLimiter {
public:
    /**
     * @brief Constructor
     * @param rate_hz Update rate [Hz], must be > 0
     * @throws std::invalid_argument on non-positive rate
     */
    explicit UpdateRateLimiter(double rate_hz);

    /**
     * @brief Check whether an update is due at time now
     *
     * The first poll is always due. Returns false (and changes nothing) when
     * time has not reached the next deadline.
     */
    bool poll(sim_time_t now);

    /**
     * @brief Change the rate; the next deadline is rescheduled from the last update
     * @return false if rate_hz is not positive (rate unchanged)
     */
    bool set_rate(double rate_hz);

    /**
     * @brief Forget all history; the next poll is due
     */
    void reset();

    double rate_hz() const { return 1.0 / period_; }
    double period() const { return period_; }

    // Time between the two most recent updates [s] (0 after the first update)
    double last_interval() const { return last_interval_; }

    sim_time_t last_update_time() const { return last_update_; }
    uint64_t update_count() const { return update_count_; }
    uint64_t coalesced_count() const { return coalesced_count_; }

private:
    double period_;
    sim_time_t next_deadline_;
    sim_time_t last_update_;
    double last_interval_;
    bool has_updated_;
    uint64_t update_count_;
    uint64_t coalesced_count_;
};

}  // namespace sensemu
