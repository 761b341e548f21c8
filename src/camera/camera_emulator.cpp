// Camera Emulator Implementation
#include "camera/camera_emulator.hpp"
#include "core/device_select.hpp"
#include "utils/logger.hpp"

#include <stdexcept>

namespace sensemu {

namespace {
const CameraConfig& checked(const CameraConfig& config) {
    if (!config.validate()) {
        throw std::invalid_argument("Invalid camera configuration");
    }
    return config;
}
}  // namespace

CameraEmulator::CameraEmulator(const CameraConfig& config)
    : config_(checked(config)),
      codec_(config.target_width, config.target_height),
      frame_clock_(static_cast<double>(config.target_fps)),
      device_(nullptr),
      enabled_(false),
      last_grab_live_(false),
      fault_(SensorFault::NONE) {}

CameraEmulator::~CameraEmulator() {
    stop();
}

bool CameraEmulator::start(const std::vector<std::shared_ptr<FrameSource>>& devices) {
    if (enabled_) {
        LOG_WARN("Camera already started on '%s'", device_->name().c_str());
        return false;
    }

    device_ = select_device(devices, config_.device_name, fault_);
    if (!device_) {
        if (fault_ == SensorFault::NO_DEVICE) {
            LOG_ERROR("No camera devices found, camera disabled");
        } else {
            LOG_ERROR("Camera device '%s' not found, camera disabled",
                      config_.device_name.c_str());
        }
        return false;
    }

    if (!device_->start(config_.target_width, config_.target_height, config_.target_fps)) {
        LOG_ERROR("Camera device '%s' failed to start, camera disabled",
                  device_->name().c_str());
        fault_ = SensorFault::DEVICE_START_FAILED;
        device_.reset();
        return false;
    }

    enabled_ = true;
    frame_clock_.reset();
    LOG_INFO("Camera '%s' started: %dx%d @ %d fps (RGB565 big-endian)",
             device_->name().c_str(), config_.target_width,
             config_.target_height, config_.target_fps);
    return true;
}

void CameraEmulator::stop() {
    if (!enabled_) {
        return;
    }

    device_->stop();
    LOG_INFO("Camera '%s' stopped (%llu frames encoded)", device_->name().c_str(),
             static_cast<unsigned long long>(stats_.frames_encoded));
    device_.reset();
    enabled_ = false;
    last_grab_live_ = false;
}

bool CameraEmulator::is_ready() const {
    return enabled_ && device_->is_playing() && last_grab_live_;
}

const std::vector<uint8_t>* CameraEmulator::poll_wire_frame(sim_time_t now) {
    if (!enabled_ || !device_->is_playing()) {
        stats_.not_ready_polls++;
        return nullptr;
    }

    if (!frame_clock_.poll(now)) {
        // Between capture instants: serve the previous frame
        const std::vector<uint8_t>* cached = last_grab_live_ ? codec_.wire_frame() : nullptr;
        if (cached != nullptr) {
            stats_.cached_polls++;
        } else {
            stats_.not_ready_polls++;
        }
        return cached;
    }

    RawColorFrame frame;
    const std::vector<uint8_t>* wire = nullptr;
    if (device_->grab(frame)) {
        wire = codec_.produce_wire_frame(frame);
    }

    if (wire == nullptr) {
        if (last_grab_live_) {
            LOG_DEBUG("Camera '%s' not ready", device_->name().c_str());
        }
        last_grab_live_ = false;
        stats_.not_ready_polls++;
        return nullptr;
    }

    last_grab_live_ = true;
    stats_.frames_encoded++;
    return wire;
}

const std::vector<uint8_t>* CameraEmulator::poll_display_frame(sim_time_t now) {
    if (poll_wire_frame(now) == nullptr) {
        return nullptr;
    }
    return codec_.display_frame();
}

}  // namespace sensemu
