// Capture Device Selection
//
// Purpose: Pick a capture device by name from the devices registered with a
// component at start-up. A blank name selects the first device.
//
// Sample Usage:
//   SensorFault fault;
//   auto cam = select_device(cameras, config.device_name, fault);
//   if (!cam) { LOG_ERROR("Camera disabled: %s", sensor_fault_name(fault)); }

#pragma once

#include "core/sensor_types.hpp"

#include <memory>
#include <string>
#include <vector>

namespace sensemu {

/**
 * @brief Select a device by name
 *
 * Device type must provide `const std::string& name() const`.
 *
 * @param devices Registered devices (null entries are skipped)
 * @param requested Device name, "" for the first device
 * @param fault Set to NO_DEVICE / DEVICE_NOT_FOUND on failure, NONE on success
 * @return Selected device or nullptr
 */
template <typename Device>
std::shared_ptr<Device> select_device(const std::vector<std::shared_ptr<Device>>& devices,
                                      const std::string& requested,
                                      SensorFault& fault) {
    fault = SensorFault::NONE;

    bool any = false;
    for (const auto& device : devices) {
        if (!device) {
            continue;
        }
        any = true;
        if (requested.empty() || device->name() == requested) {
            return device;
        }
    }

    fault = any ? SensorFault::DEVICE_NOT_FOUND : SensorFault::NO_DEVICE;
    return nullptr;
}

}  // namespace sensemu
