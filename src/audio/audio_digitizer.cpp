/**
 * @file audio_digitizer.cpp
 * @brief Implementation of the ring-buffer microphone digitizer
 */

#include "audio_digitizer.hpp"
#include "core/device_select.hpp"
#include "utils/logger.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace sensemu {

namespace {
constexpr float SILENCE_DB = -80.0f;

const MicrophoneConfig& checked(const MicrophoneConfig& config) {
    if (!config.validate()) {
        throw std::invalid_argument("Invalid microphone configuration");
    }
    return config;
}
}  // namespace

int16_t quantize_pcm16(float sample) {
    float f = std::max(-1.0f, std::min(1.0f, sample));
    return static_cast<int16_t>(std::lround(f * 32767.0f));
}

void pack_pcm16_le(const int16_t* samples, size_t count, uint8_t* out) {
    for (size_t i = 0, j = 0; i < count; i++, j += 2) {
        const uint16_t s = static_cast<uint16_t>(samples[i]);
        out[j] = static_cast<uint8_t>(s & 0xFF);            // low
        out[j + 1] = static_cast<uint8_t>((s >> 8) & 0xFF); // high
    }
}

float pcm16_rms(const std::vector<uint8_t>& frame) {
    const size_t samples = frame.size() / 2;
    if (samples == 0) {
        return 0.0f;
    }

    double acc = 0.0;
    for (size_t i = 0; i < samples; i++) {
        const double f = decode_pcm16_le(frame.data() + 2 * i) / 32768.0;
        acc += f * f;
    }
    return static_cast<float>(std::sqrt(acc / static_cast<double>(samples)));
}

float rms_to_db(float rms) {
    return rms > 0.0f ? 20.0f * std::log10(rms) : SILENCE_DB;
}

AudioDigitizer::AudioDigitizer(const MicrophoneConfig& config)
    : config_(checked(config)),
      device_(nullptr),
      enabled_(false),
      cursor_advanced_(false),
      initial_position_(0),
      fault_(SensorFault::NONE) {}

AudioDigitizer::~AudioDigitizer() {
    stop();
}

bool AudioDigitizer::start(const std::vector<std::shared_ptr<CaptureRingBuffer>>& devices) {
    if (enabled_) {
        LOG_WARN("Microphone already started on '%s'", device_->name().c_str());
        return false;
    }

    device_ = select_device(devices, config_.device_name, fault_);
    if (!device_) {
        if (fault_ == SensorFault::NO_DEVICE) {
            LOG_ERROR("No microphone devices found, microphone disabled");
        } else {
            LOG_ERROR("Microphone device '%s' not found, microphone disabled",
                      config_.device_name.c_str());
        }
        return false;
    }

    if (!device_->start(config_.sample_rate, config_.buffer_seconds)) {
        LOG_ERROR("Microphone '%s' failed to start, microphone disabled",
                  device_->name().c_str());
        fault_ = SensorFault::DEVICE_START_FAILED;
        device_.reset();
        return false;
    }

    enabled_ = true;
    cursor_advanced_ = false;
    initial_position_ = device_->write_position();

    ensure_buffers(static_cast<size_t>(config_.frame_samples()), device_->channels());

    LOG_INFO("Mic '%s' started: %d Hz, %d ch, buffer %d s, frame %d ms",
             device_->name().c_str(), device_->sample_rate(), device_->channels(),
             config_.buffer_seconds, config_.frame_ms);
    return true;
}

void AudioDigitizer::stop() {
    if (!enabled_) {
        return;
    }

    device_->stop();
    LOG_INFO("Mic '%s' stopped (%llu frames extracted)", device_->name().c_str(),
             static_cast<unsigned long long>(stats_.frames_extracted));
    device_.reset();
    enabled_ = false;
}

void AudioDigitizer::ensure_buffers(size_t samples, int channels) {
    const size_t interleaved = samples * static_cast<size_t>(channels);
    if (interleaved_.size() != interleaved) {
        interleaved_.assign(interleaved, 0.0f);
    }
    if (mono_.size() != samples) {
        mono_.assign(samples, 0);
    }
    if (pcm_le_.size() != samples * 2) {
        pcm_le_.assign(samples * 2, 0);
    }
}

const std::vector<uint8_t>* AudioDigitizer::extract_frame(int duration_ms) {
    if (!enabled_ || !device_->is_recording()) {
        stats_.not_ready_polls++;
        return nullptr;
    }

    if (duration_ms <= 0) {
        duration_ms = config_.frame_ms;
    }

    const int channels = device_->channels();
    const size_t capacity = device_->capacity();
    if (channels <= 0 || capacity == 0) {
        LOG_ERROR("Microphone '%s' reports %d channels, capacity %zu",
                  device_->name().c_str(), channels, capacity);
        stats_.not_ready_polls++;
        return nullptr;
    }

    const int64_t position = device_->write_position();
    if (position < 0 || position > static_cast<int64_t>(capacity)) {
        LOG_DEBUG("Microphone cursor %lld out of range [0, %zu]",
                  static_cast<long long>(position), capacity);
        stats_.not_ready_polls++;
        return nullptr;
    }

    if (!cursor_advanced_) {
        if (position == initial_position_) {
            // Capture not started yet
            stats_.not_ready_polls++;
            return nullptr;
        }
        cursor_advanced_ = true;
    }

    size_t samples = static_cast<size_t>(
        static_cast<int64_t>(device_->sample_rate()) * duration_ms / 1000);
    if (samples == 0) {
        stats_.not_ready_polls++;
        return nullptr;
    }
    if (samples > capacity) {
        stats_.clamp_events++;
        LOG_ERROR("Requested %zu samples exceed ring capacity %zu, clamping",
                  samples, capacity);
        samples = capacity;
    }

    ensure_buffers(samples, channels);

    if (!copy_window(position, samples)) {
        stats_.not_ready_polls++;
        return nullptr;
    }

    downmix_and_pack(samples, channels);

    stats_.frames_extracted++;
    return &pcm_le_;
}

bool AudioDigitizer::copy_window(int64_t position, size_t samples) {
    const size_t capacity = device_->capacity();
    const size_t channels = static_cast<size_t>(device_->channels());
    const size_t pos = static_cast<size_t>(position) % capacity;

    // (pos - samples) mod capacity, samples <= capacity
    const size_t start = (pos >= samples) ? pos - samples : pos + capacity - samples;

    if (start + samples <= capacity) {
        return device_->read(start, samples, interleaved_.data());
    }

    // Seam: tail [start, capacity) then head [0, samples - tail)
    const size_t tail = capacity - start;
    const size_t head = samples - tail;
    if (head > pos) {
        LOG_ERROR("Ring window head %zu passes write cursor %zu", head, pos);
        stats_.clamp_events++;
        return false;
    }

    if (!device_->read(start, tail, interleaved_.data())) {
        return false;
    }
    if (!device_->read(0, head, interleaved_.data() + tail * channels)) {
        return false;
    }

    stats_.wrapped_frames++;
    return true;
}

void AudioDigitizer::downmix_and_pack(size_t samples, int channels) {
    if (channels == 1) {
        for (size_t i = 0; i < samples; i++) {
            mono_[i] = quantize_pcm16(interleaved_[i]);
        }
    } else {
        const float inv_channels = 1.0f / static_cast<float>(channels);
        for (size_t i = 0, k = 0; i < samples; i++) {
            float sum = 0.0f;
            for (int c = 0; c < channels; c++, k++) {
                sum += interleaved_[k];
            }
            mono_[i] = quantize_pcm16(sum * inv_channels);
        }
    }

    pack_pcm16_le(mono_.data(), samples, pcm_le_.data());
}

float AudioDigitizer::rms(int duration_ms) {
    const std::vector<uint8_t>* bytes = extract_frame(duration_ms);
    return bytes != nullptr ? pcm16_rms(*bytes) : 0.0f;
}

float AudioDigitizer::level_db(int duration_ms) {
    return rms_to_db(rms(duration_ms));
}

void AudioDigitizer::log_volume(int duration_ms) {
    const std::vector<uint8_t>* bytes = extract_frame(duration_ms);
    if (bytes == nullptr) {
        LOG_INFO("Volume - RMS: 0.0000, dB: %.1f, Device: %s", SILENCE_DB,
                 enabled_ ? device_->name().c_str() : "(none)");
        return;
    }
    log_frame_volume(*bytes);
}

void AudioDigitizer::log_frame_volume(const std::vector<uint8_t>& frame) const {
    const float level = pcm16_rms(frame);
    LOG_INFO("Volume - RMS: %.4f, dB: %.1f, Device: %s", level, rms_to_db(level),
             enabled_ ? device_->name().c_str() : "(none)");
}

} // namespace sensemu
