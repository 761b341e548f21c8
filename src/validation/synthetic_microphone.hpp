/**
 * @file synthetic_microphone.hpp
 * @brief Synthetic looping capture device for microphone validation
 *
 * Purpose: Stand-in for the host's audio capture. Keeps a looping float
 * buffer of sample_rate * buffer_seconds frames per channel, written by a tone
 * generator (or by explicit writes) as simulated time advances.
 *
 * Sample Input:
 *   - 2 channels, 440 Hz, amplitude 0.5, start(16000, 2), advance(0.1)
 *
 * Expected Output:
 *   - capacity() = 32000, write_position() = 1600
 *   - every frame holds the same sample on both channels
 */

#ifndef SENSEMU_VALIDATION_SYNTHETIC_MICROPHONE_HPP
#define SENSEMU_VALIDATION_SYNTHETIC_MICROPHONE_HPP

#include "audio/capture_ring_buffer.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace sensemu {

class SyntheticMicrophone : public CaptureRingBuffer {
public:
    /**
     * @brief Constructor
     *
     * @param name Device name
     * @param channels Channel count (>= 1)
     * @param tone_hz Tone frequency [Hz] (0 = silence)
     * @param amplitude Tone peak amplitude (normalized)
     * @throws std::invalid_argument if channels < 1
     */
    SyntheticMicrophone(const std::string& name, int channels = 1,
                        double tone_hz = 440.0, double amplitude = 0.5);

    const std::string& name() const override { return name_; }
    bool start(int sample_rate, int buffer_seconds) override;
    void stop() override;
    bool is_recording() const override { return recording_; }
    int channels() const override { return channels_; }
    int sample_rate() const override { return sample_rate_; }
    size_t capacity() const override { return capacity_; }
    int64_t write_position() const override { return write_pos_; }
    bool read(size_t start, size_t frames, float* interleaved) const override;

    /**
     * @brief Generate tone samples for the given time span
     *
     * Fractional samples carry over to the next call.
     */
    void advance(double seconds);

    /**
     * @brief Append interleaved frames at the write cursor, wrapping at capacity
     */
    void write(const float* interleaved, size_t frames);

    void set_tone(double tone_hz, double amplitude);

    uint64_t frames_written() const { return frames_written_; }

private:
    std::string name_;
    int channels_;
    double tone_hz_;
    double amplitude_;

    int sample_rate_;
    size_t capacity_;
    bool recording_;

    std::vector<float> ring_;     ///< capacity_ * channels_
    int64_t write_pos_;
    uint64_t frames_written_;
    double pending_frames_;
    std::vector<float> scratch_;
};

} // namespace sensemu

#endif // SENSEMU_VALIDATION_SYNTHETIC_MICROPHONE_HPP
