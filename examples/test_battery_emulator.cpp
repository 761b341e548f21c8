// Battery Emulator Unit Tests
//
// Purpose: Validate linear drain, rounding and depletion latch
// Tests:
//   1. Linear drain and rounded percentage
//   2. Depletion latches at zero
//   3. Config validation and reset
//   4. Status logging leaves the charge untouched

#include "power/battery_emulator.hpp"

#include <cmath>
#include <iostream>
#include <stdexcept>

using namespace sensemu;

namespace {

bool report(int n, bool passed) {
    if (passed) {
        std::cout << "✓ Test " << n << ": PASSED" << std::endl;
    } else {
        std::cerr << "✗ Test " << n << ": FAILED" << std::endl;
    }
    return passed;
}

}  // namespace

// Test 1: 1 %/s for 10.6 s
bool test_linear_drain() {
    std::cout << "\n=== Test 1: Linear Drain ===" << std::endl;

    BatteryEmulator battery;
    bool full = battery.percentage() == 100;

    for (int i = 0; i < 106; i++) {
        battery.update(0.1);
    }

    std::cout << "Charge: " << battery.charge() << " %, reported: "
              << battery.percentage() << " %" << std::endl;

    bool passed = full && std::fabs(battery.charge() - 89.4) < 1e-9 &&
                  battery.percentage() == 89 && !battery.is_depleted();

    battery.update(-5.0);
    passed = passed && std::fabs(battery.charge() - 89.4) < 1e-9;

    return report(1, passed);
}

// Test 2: Fast drain runs the battery flat once
bool test_depletion() {
    std::cout << "\n=== Test 2: Depletion ===" << std::endl;

    BatteryConfig config;
    config.starting_percent = 5.0;
    config.drain_rate = 2.0;
    BatteryEmulator battery(config);

    battery.update(2.0);
    bool draining = battery.percentage() == 1 && !battery.is_depleted();

    battery.update(1.0);
    bool depleted = battery.is_depleted() && battery.charge() == 0.0 &&
                    battery.percentage() == 0;

    battery.update(10.0);
    bool latched = battery.charge() == 0.0 && battery.is_depleted();

    return report(2, draining && depleted && latched);
}

// Test 3: Validation and reset
bool test_config() {
    std::cout << "\n=== Test 3: Config and Reset ===" << std::endl;

    BatteryConfig bad;
    bad.starting_percent = 120.0;
    bool threw = false;
    try {
        BatteryEmulator battery(bad);
    } catch (const std::invalid_argument&) {
        threw = true;
    }

    BatteryConfig config;
    config.drain_rate = 50.0;
    BatteryEmulator battery(config);
    battery.update(3.0);
    bool empty = battery.is_depleted();
    battery.reset();
    bool restored = !battery.is_depleted() && battery.percentage() == 100;

    return report(3, threw && empty && restored);
}

// Test 4: Logging while draining to depletion
bool test_log_status() {
    std::cout << "\n=== Test 4: Status Logging ===" << std::endl;

    BatteryConfig config;
    config.starting_percent = 0.25;
    config.drain_rate = 0.1;
    config.log_battery = true;
    BatteryEmulator battery(config);

    battery.log_status();
    bool unchanged = battery.charge() == 0.25 && battery.percentage() == 0;

    battery.update(1.0);
    battery.log_status();
    bool draining = std::fabs(battery.charge() - 0.15) < 1e-9 && !battery.is_depleted();

    battery.update(2.0);
    battery.log_status();
    bool depleted = battery.is_depleted() && battery.charge() == 0.0;

    return report(4, config.validate() && unchanged && draining && depleted);
}

int main() {
    std::cout << "========================================" << std::endl;
    std::cout << "Battery Emulator Unit Tests" << std::endl;
    std::cout << "========================================" << std::endl;

    bool all_passed = true;

    all_passed &= test_linear_drain();
    all_passed &= test_depletion();
    all_passed &= test_config();
    all_passed &= test_log_status();

    std::cout << "\n========================================" << std::endl;
    if (all_passed) {
        std::cout << "✅ ALL BATTERY TESTS PASSED" << std::endl;
    } else {
        std::cout << "❌ SOME TESTS FAILED" << std::endl;
        return 1;
    }
    std::cout << "========================================" << std::endl;

    return 0;
}
