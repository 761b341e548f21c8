// Battery Emulator Implementation
#include "power/battery_emulator.hpp"
#include "utils/logger.hpp"

#include <cmath>
#include <stdexcept>

namespace sensemu {

BatteryEmulator::BatteryEmulator(const BatteryConfig& config)
    : config_(config),
      charge_(config.starting_percent),
      depleted_(false) {

    if (!config_.validate()) {
        throw std::invalid_argument("Invalid battery configuration");
    }
    depleted_ = charge_ <= 0.0;
}

void BatteryEmulator::update(double dt) {
    if (depleted_ || dt <= 0.0) {
        return;
    }

    charge_ -= config_.drain_rate * dt;
    if (charge_ <= 0.0) {
        charge_ = 0.0;
        depleted_ = true;
        LOG_WARN("Battery depleted - system stopped");
    }
}

void BatteryEmulator::log_status() const {
    LOG_INFO("Current Battery: %.2f%%%s", charge_, depleted_ ? " (depleted)" : "");
}

int BatteryEmulator::percentage() const {
    return static_cast<int>(std::lround(charge_));
}

void BatteryEmulator::reset() {
    charge_ = config_.starting_percent;
    depleted_ = charge_ <= 0.0;
}

}  // namespace sensemu
