/**
 * @file synthetic_microphone.cpp
 * @brief Implementation of the synthetic capture device
 */

#include "synthetic_microphone.hpp"
#include "utils/logger.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace sensemu {

namespace {
constexpr double TWO_PI = 2.0 * 3.14159265358979323846;
}

SyntheticMicrophone::SyntheticMicrophone(const std::string& name, int channels,
                                         double tone_hz, double amplitude)
    : name_(name),
      channels_(channels),
      tone_hz_(tone_hz),
      amplitude_(amplitude),
      sample_rate_(0),
      capacity_(0),
      recording_(false),
      write_pos_(0),
      frames_written_(0),
      pending_frames_(0.0) {

    if (channels < 1) {
        throw std::invalid_argument("Synthetic microphone needs at least one channel");
    }
}

bool SyntheticMicrophone::start(int sample_rate, int buffer_seconds) {
    if (sample_rate <= 0 || buffer_seconds <= 0) {
        LOG_ERROR("SyntheticMicrophone '%s': invalid format %d Hz, %d s",
                  name_.c_str(), sample_rate, buffer_seconds);
        return false;
    }

    sample_rate_ = sample_rate;
    capacity_ = static_cast<size_t>(sample_rate) * static_cast<size_t>(buffer_seconds);
    ring_.assign(capacity_ * static_cast<size_t>(channels_), 0.0f);
    write_pos_ = 0;
    frames_written_ = 0;
    pending_frames_ = 0.0;
    recording_ = true;
    return true;
}

void SyntheticMicrophone::stop() {
    recording_ = false;
}

void SyntheticMicrophone::set_tone(double tone_hz, double amplitude) {
    tone_hz_ = tone_hz;
    amplitude_ = amplitude;
}

bool SyntheticMicrophone::read(size_t start, size_t frames, float* interleaved) const {
    if (!recording_ || start + frames > capacity_) {
        return false;
    }

    const size_t ch = static_cast<size_t>(channels_);
    std::copy(ring_.begin() + static_cast<std::ptrdiff_t>(start * ch),
              ring_.begin() + static_cast<std::ptrdiff_t>((start + frames) * ch),
              interleaved);
    return true;
}

void SyntheticMicrophone::write(const float* interleaved, size_t frames) {
    if (!recording_) {
        return;
    }

    const size_t ch = static_cast<size_t>(channels_);
    size_t pos = static_cast<size_t>(write_pos_);
    for (size_t i = 0; i < frames; i++) {
        std::copy(interleaved + i * ch, interleaved + (i + 1) * ch,
                  ring_.begin() + static_cast<std::ptrdiff_t>(pos * ch));
        pos = (pos + 1) % capacity_;
    }

    write_pos_ = static_cast<int64_t>(pos);
    frames_written_ += frames;
}

void SyntheticMicrophone::advance(double seconds) {
    if (!recording_ || seconds <= 0.0) {
        return;
    }

    pending_frames_ += seconds * sample_rate_;
    const size_t frames = static_cast<size_t>(pending_frames_);
    pending_frames_ -= static_cast<double>(frames);
    if (frames == 0) {
        return;
    }

    const size_t ch = static_cast<size_t>(channels_);
    if (scratch_.size() < frames * ch) {
        scratch_.resize(frames * ch);
    }

    for (size_t i = 0; i < frames; i++) {
        const double t = static_cast<double>(frames_written_ + i) / sample_rate_;
        const float s = static_cast<float>(amplitude_ * std::sin(TWO_PI * tone_hz_ * t));
        for (size_t c = 0; c < ch; c++) {
            scratch_[i * ch + c] = s;
        }
    }

    write(scratch_.data(), frames);
}

} // namespace sensemu
