// Battery Emulator - Linear-drain fuel gauge
//
// Purpose: Report the robot's battery percentage the way its fuel gauge does:
// an integer percent, draining at a constant rate while the robot is active,
// latching off once empty.
//
// Sample Usage:
//   BatteryEmulator battery(config.battery);
//   battery.update(dt);
//   int percent = battery.percentage();
//
// Expected Output:
//   - 100 % start, 1 %/s drain: 50 after 50 s, 0 and depleted after 100 s

#pragma once

#include "core/emulator_config.hpp"

namespace sensemu {

class BatteryEmulator {
public:
    /**
     * @brief Constructor
     * @throws std::invalid_argument if config fails validation
     */
    explicit BatteryEmulator(const BatteryConfig& config = BatteryConfig());

    /**
     * @brief Drain for dt seconds (no-op once depleted)
     */
    void update(double dt);

    /**
     * @brief Charge rounded to the nearest whole percent
     */
    int percentage() const;

    /**
     * @brief Log the current charge
     */
    void log_status() const;

    double charge() const { return charge_; }
    bool is_depleted() const { return depleted_; }

    /**
     * @brief Refill to the configured starting charge
     */
    void reset();

private:
    BatteryConfig config_;
    double charge_;
    bool depleted_;
};

}  // namespace sensemu
