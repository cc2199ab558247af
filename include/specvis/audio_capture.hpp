#pragma once

#include "specvis/ring_buffer.hpp"

#include <portaudio.h>

#include <atomic>
#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace specvis {

struct AudioConfig {
    std::uint32_t sample_rate = 48000;
    std::uint32_t buffer_frames = 256;  // frames per callback
    std::uint32_t channels = 1;
    float ring_buffer_seconds = 0.5f;
    int device_index = -1;  // -1 selects the host default input
};

struct AudioStats {
    std::uint64_t frames_captured = 0;
    std::uint64_t overruns = 0;
    std::uint64_t callback_count = 0;
    float peak_amplitude = 0.0f;
};

struct AudioDevice {
    int index = -1;
    std::string name;
    int max_input_channels = 0;
    double default_sample_rate = 0.0;
    bool is_default = false;
};

/// Keeps PortAudio initialized while at least one guard is alive.
class PortAudioGuard {
public:
    /// @throws std::runtime_error if Pa_Initialize fails.
    PortAudioGuard();
    ~PortAudioGuard();

    PortAudioGuard(const PortAudioGuard&) = delete;
    PortAudioGuard& operator=(const PortAudioGuard&) = delete;

private:
    static std::atomic<int> users_;
};

/// PortAudio input stream feeding a lock-free sample ring.
///
/// The callback runs on PortAudio's real-time thread: it only copies samples
/// and bumps counters. Interleaved channels are pushed as-is; the analyzer
/// expects mono, so multi-channel capture is mixed down in the callback.
class AudioCapture {
public:
    /// Opens the configured (or default) input device.
    /// @throws std::runtime_error if no usable device exists or the stream
    ///         cannot be opened.
    explicit AudioCapture(const AudioConfig& config = {});
    ~AudioCapture();

    AudioCapture(const AudioCapture&) = delete;
    AudioCapture& operator=(const AudioCapture&) = delete;

    /// Idempotent.
    /// @throws std::runtime_error if the stream fails to start.
    void start();

    /// Idempotent.
    void stop() noexcept;

    [[nodiscard]] bool is_running() const noexcept { return running_.load(std::memory_order_acquire); }
    [[nodiscard]] std::uint32_t sample_rate() const noexcept { return config_.sample_rate; }
    [[nodiscard]] const std::string& device_name() const noexcept { return device_name_; }
    [[nodiscard]] AudioStats stats() const noexcept;

    /// Mono samples, consumed by the analysis thread.
    [[nodiscard]] RingBuffer<float>& buffer() noexcept { return ring_; }

    /// @throws std::runtime_error if PortAudio cannot enumerate devices.
    [[nodiscard]] static std::vector<AudioDevice> list_input_devices();

private:
    static int audio_callback(const void* input, void* output, unsigned long frame_count,
                              const PaStreamCallbackTimeInfo* time_info,
                              PaStreamCallbackFlags status_flags, void* user_data);

    void process_audio(const float* interleaved, unsigned long frames,
                       PaStreamCallbackFlags status_flags) noexcept;

    PortAudioGuard guard_;
    AudioConfig config_;
    std::string device_name_;
    RingBuffer<float> ring_;
    std::vector<float> mixdown_;

    PaStream* stream_ = nullptr;
    std::atomic<bool> running_{false};

    std::atomic<std::uint64_t> frames_captured_{0};
    std::atomic<std::uint64_t> overruns_{0};
    std::atomic<std::uint64_t> callback_count_{0};
    std::atomic<float> peak_amplitude_{0.0f};
};

}  // namespace specvis
