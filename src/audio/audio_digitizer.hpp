/**
 * @file audio_digitizer.hpp
 * @brief Ring-buffer microphone digitizer producing 16-bit PCM frames
 *
 * Purpose: Turn the continuously overwritten float capture buffer of an audio
 * device into the robot microphone's frame format: the most recent N ms,
 * downmixed to mono, 16-bit signed, little-endian.
 *
 * Note the byte order differs from the camera wire format (big-endian RGB565);
 * the PCM layout matches the target MCU's native int16_t memory layout.
 *
 * References:
 * - ESP-IDF I2S driver, 16-bit mono PCM frames
 *
 * Sample Input:
 *   - Device at 16 kHz, 2 s ring (32000 frames/channel), write cursor 100
 *   - extract_frame() with the default 20 ms
 *
 * Expected Output:
 *   - 640 bytes = 320 samples covering frames [31780, 32000) then [0, 100)
 *   - RMS of a full-scale sine ≈ 0.707
 */

#ifndef SENSEMU_AUDIO_AUDIO_DIGITIZER_HPP
#define SENSEMU_AUDIO_AUDIO_DIGITIZER_HPP

#include "audio/capture_ring_buffer.hpp"
#include "core/emulator_config.hpp"
#include "core/sensor_types.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

namespace sensemu {

/**
 * @brief Quantize a normalized sample: clamp to [-1, 1], round(x * 32767)
 */
int16_t quantize_pcm16(float sample);

/**
 * @brief Pack int16 samples little-endian (low byte first)
 *
 * @param out Must hold 2 * count bytes
 */
void pack_pcm16_le(const int16_t* samples, size_t count, uint8_t* out);

/**
 * @brief Read one little-endian int16 sample
 */
inline int16_t decode_pcm16_le(const uint8_t* p) {
    return static_cast<int16_t>(static_cast<uint16_t>(p[0] | (p[1] << 8)));
}

/**
 * @brief RMS of a packed PCM16 little-endian frame, normalized by 32768
 *
 * @return 0 for an empty frame
 */
float pcm16_rms(const std::vector<uint8_t>& frame);

/**
 * @brief dBFS of an RMS level: 20 log10(rms), -80 dB for silence
 */
float rms_to_db(float rms);

/**
 * @brief Digitizer poll counters
 */
struct AudioStats {
    uint64_t frames_extracted;    ///< Frames returned to callers
    uint64_t wrapped_frames;      ///< Frames that spanned the ring seam
    uint64_t not_ready_polls;     ///< Polls that returned nullptr
    uint32_t clamp_events;        ///< Requests clamped to the ring capacity

    AudioStats()
        : frames_extracted(0), wrapped_frames(0),
          not_ready_polls(0), clamp_events(0) {}
};

/**
 * @brief Microphone emulator reading a capture ring buffer
 *
 * All working buffers are owned by the instance and reused; they are
 * reallocated only when the requested frame length changes.
 * Not thread-safe: one caller per instance.
 */
class AudioDigitizer {
public:
    /**
     * @brief Constructor
     * @throws std::invalid_argument if config fails validation
     */
    explicit AudioDigitizer(const MicrophoneConfig& config = MicrophoneConfig());

    ~AudioDigitizer();

    AudioDigitizer(const AudioDigitizer&) = delete;
    AudioDigitizer& operator=(const AudioDigitizer&) = delete;

    /**
     * @brief Select and start the capture device
     *
     * @return false on a configuration fault (microphone stays disabled)
     */
    bool start(const std::vector<std::shared_ptr<CaptureRingBuffer>>& devices);

    /**
     * @brief Stop recording; the microphone becomes disabled
     */
    void stop();

    /**
     * @brief Most recent duration_ms of audio as mono PCM16 little-endian
     *
     * Frame start is (write_position - N) mod capacity with
     * N = sample_rate * duration_ms / 1000. A frame crossing the end of the
     * ring is assembled from the tail region followed by the head region.
     *
     * @param duration_ms Frame length, <= 0 selects the configured frame_ms
     * @return 2 * N bytes (reused between calls), or nullptr when not ready
     */
    const std::vector<uint8_t>* extract_frame(int duration_ms = -1);

    /**
     * @brief RMS level of the most recent frame, 0..1 (0 when not ready)
     *
     * Decodes the packed PCM frame, so the level reflects exactly the bytes
     * a consumer would receive.
     */
    float rms(int duration_ms = -1);

    /**
     * @brief Level in dBFS: 20 log10(rms), -80 dB for silence / not ready
     */
    float level_db(int duration_ms = -1);

    /**
     * @brief Extract a frame and log its RMS and dB
     */
    void log_volume(int duration_ms = -1);

    /**
     * @brief Log RMS and dB of a frame that was already extracted
     */
    void log_frame_volume(const std::vector<uint8_t>& frame) const;

    /**
     * @brief Interleaved float samples of the last extracted frame, in source order
     */
    const std::vector<float>& working_samples() const { return interleaved_; }

    bool is_enabled() const { return enabled_; }
    SensorFault last_fault() const { return fault_; }
    const AudioStats& stats() const { return stats_; }
    const MicrophoneConfig& config() const { return config_; }

private:
    void ensure_buffers(size_t samples, int channels);
    bool copy_window(int64_t position, size_t samples);
    void downmix_and_pack(size_t samples, int channels);

    MicrophoneConfig config_;
    std::shared_ptr<CaptureRingBuffer> device_;
    bool enabled_;
    bool cursor_advanced_;
    int64_t initial_position_;
    SensorFault fault_;
    AudioStats stats_;

    // Working buffers
    std::vector<float> interleaved_;    ///< frames * channels
    std::vector<int16_t> mono_;         ///< frames
    std::vector<uint8_t> pcm_le_;       ///< 2 * frames
};

} // namespace sensemu

#endif // SENSEMU_AUDIO_AUDIO_DIGITIZER_HPP
