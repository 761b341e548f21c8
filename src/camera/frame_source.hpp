// Frame Source - Interface to the renderer's capture device
//
// Purpose: The camera emulator reads ground-truth imagery through this
// interface. Implementations wrap whatever produces the rendered image (a
// simulator render target, a webcam, a synthetic pattern).
//
// Contract:
//   - start() may fail; the emulator then reports the device as unusable
//   - grab() never blocks: false means no frame is available right now
//   - A grabbed frame stays valid until the next grab() or stop()
//   - While warming up, a device may report a degenerate size (<= 16 px)

#pragma once

#include "core/sensor_types.hpp"

#include <string>

namespace sensemu {

class FrameSource {
public:
    virtual ~FrameSource() = default;

    virtual const std::string& name() const = 0;

    // Request capture at a resolution and rate (the device may deliver another size)
    virtual bool start(int requested_width, int requested_height, int requested_fps) = 0;

    virtual void stop() = 0;

    virtual bool is_playing() const = 0;

    // Latest frame, non-blocking
    virtual bool grab(RawColorFrame& frame) = 0;
};

}  // namespace sensemu
