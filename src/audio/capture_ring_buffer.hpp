// Capture Ring Buffer - Interface to a continuously recording audio device
//
// Purpose: The microphone digitizer reads ground-truth audio through this
// interface. The device owns a looping buffer of `capacity()` frames per
// channel that it overwrites continuously; `write_position()` is the index of
// the next frame it will write.
//
// Contract:
//   - Samples are normalized floats, interleaved by channel
//   - write_position() advances modulo capacity(); a negative value or a value
//     above capacity() reports a device error
//   - read() copies one contiguous region [start, start + frames) and never
//     wraps: start + frames must not exceed capacity()
//   - Nothing blocks

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace sensemu {

class CaptureRingBuffer {
public:
    virtual ~CaptureRingBuffer() = default;

    virtual const std::string& name() const = 0;

    // Begin looping capture into a buffer of buffer_seconds at sample_rate
    virtual bool start(int sample_rate, int buffer_seconds) = 0;

    virtual void stop() = 0;

    virtual bool is_recording() const = 0;

    virtual int channels() const = 0;

    virtual int sample_rate() const = 0;

    // Frames per channel
    virtual size_t capacity() const = 0;

    virtual int64_t write_position() const = 0;

    // Copy frames * channels() interleaved samples starting at frame index start
    virtual bool read(size_t start, size_t frames, float* interleaved) const = 0;
};

}  // namespace sensemu
