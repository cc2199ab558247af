#include "specvis/audio_capture.hpp"

#include "specvis/logging.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

namespace specvis {

namespace {

constexpr const char* kLogSource = "AudioCapture";

std::runtime_error pa_error(const char* what, PaError err) {
    return std::runtime_error(std::string(what) + ": " + Pa_GetErrorText(err));
}

std::size_t ring_capacity(const AudioConfig& config) {
    const auto samples = static_cast<std::size_t>(config.ring_buffer_seconds *
                                                  static_cast<float>(config.sample_rate));
    return std::max<std::size_t>(samples, config.buffer_frames);
}

}  // namespace

std::atomic<int> PortAudioGuard::users_{0};

PortAudioGuard::PortAudioGuard() {
    if (users_.fetch_add(1, std::memory_order_acq_rel) == 0) {
        const PaError err = Pa_Initialize();
        if (err != paNoError) {
            users_.fetch_sub(1, std::memory_order_acq_rel);
            throw pa_error("Failed to initialize PortAudio", err);
        }
    }
}

PortAudioGuard::~PortAudioGuard() {
    if (users_.fetch_sub(1, std::memory_order_acq_rel) == 1) {
        Pa_Terminate();
    }
}

AudioCapture::AudioCapture(const AudioConfig& config)
    : config_{config}, ring_{ring_capacity(config)} {
    if (config_.channels == 0) {
        throw std::runtime_error("Audio capture needs at least one channel");
    }

    PaDeviceIndex device = config_.device_index;
    if (device < 0) {
        device = Pa_GetDefaultInputDevice();
        if (device == paNoDevice) {
            throw std::runtime_error("No default audio input device available");
        }
    } else if (device >= Pa_GetDeviceCount()) {
        throw std::runtime_error("Audio device index out of range: " +
                                 std::to_string(config_.device_index));
    }

    const PaDeviceInfo* info = Pa_GetDeviceInfo(device);
    if (info == nullptr || info->maxInputChannels <= 0) {
        throw std::runtime_error("Device " + std::to_string(device) + " has no input channels");
    }
    device_name_ = info->name;

    if (config_.channels > 1) {
        mixdown_.resize(static_cast<std::size_t>(config_.buffer_frames) * 4);
    }

    PaStreamParameters input{};
    input.device = device;
    input.channelCount = static_cast<int>(config_.channels);
    input.sampleFormat = paFloat32;
    input.suggestedLatency = info->defaultLowInputLatency;
    input.hostApiSpecificStreamInfo = nullptr;

    const PaError err = Pa_OpenStream(&stream_, &input, nullptr,
                                      static_cast<double>(config_.sample_rate),
                                      config_.buffer_frames, paClipOff,
                                      &AudioCapture::audio_callback, this);
    if (err != paNoError) {
        throw pa_error("Failed to open audio stream", err);
    }

    SPECVIS_LOG_INFO(kLogSource, "Opened '%s' at %u Hz, %u channel(s), %u frames/buffer",
                     device_name_.c_str(), config_.sample_rate, config_.channels,
                     config_.buffer_frames);
}

AudioCapture::~AudioCapture() {
    stop();
    if (stream_ != nullptr) {
        Pa_CloseStream(stream_);
    }
}

void AudioCapture::start() {
    if (running_.load(std::memory_order_acquire)) {
        return;
    }
    const PaError err = Pa_StartStream(stream_);
    if (err != paNoError) {
        throw pa_error("Failed to start audio stream", err);
    }
    running_.store(true, std::memory_order_release);
    SPECVIS_LOG_INFO(kLogSource, "Capture started");
}

void AudioCapture::stop() noexcept {
    if (!running_.exchange(false, std::memory_order_acq_rel)) {
        return;
    }
    const PaError err = Pa_StopStream(stream_);
    if (err != paNoError) {
        SPECVIS_LOG_WARNING(kLogSource, "Pa_StopStream: %s", Pa_GetErrorText(err));
    }
    const auto s = stats();
    SPECVIS_LOG_INFO(kLogSource, "Capture stopped after %llu frames, %llu overrun(s)",
                     static_cast<unsigned long long>(s.frames_captured),
                     static_cast<unsigned long long>(s.overruns));
}

AudioStats AudioCapture::stats() const noexcept {
    return AudioStats{.frames_captured = frames_captured_.load(std::memory_order_relaxed),
                      .overruns = overruns_.load(std::memory_order_relaxed),
                      .callback_count = callback_count_.load(std::memory_order_relaxed),
                      .peak_amplitude = peak_amplitude_.load(std::memory_order_relaxed)};
}

int AudioCapture::audio_callback(const void* input, void* /*output*/, unsigned long frame_count,
                                 const PaStreamCallbackTimeInfo* /*time_info*/,
                                 PaStreamCallbackFlags status_flags, void* user_data) {
    auto* self = static_cast<AudioCapture*>(user_data);
    if (input != nullptr) {
        self->process_audio(static_cast<const float*>(input), frame_count, status_flags);
    }
    return paContinue;
}

void AudioCapture::process_audio(const float* interleaved, unsigned long frames,
                                 PaStreamCallbackFlags status_flags) noexcept {
    if ((status_flags & paInputOverflow) != 0) {
        overruns_.fetch_add(1, std::memory_order_relaxed);
    }

    std::span<const float> mono{interleaved, frames};
    if (config_.channels > 1) {
        // Mixdown buffer was sized up front; never allocate here.
        const auto n = std::min<std::size_t>(frames, mixdown_.size());
        const float inv = 1.0f / static_cast<float>(config_.channels);
        for (std::size_t f = 0; f < n; ++f) {
            float sum = 0.0f;
            for (std::uint32_t c = 0; c < config_.channels; ++c) {
                sum += interleaved[f * config_.channels + c];
            }
            mixdown_[f] = sum * inv;
        }
        mono = {mixdown_.data(), n};
    }

    float peak = 0.0f;
    for (const float s : mono) {
        peak = std::max(peak, std::abs(s));
    }
    float current = peak_amplitude_.load(std::memory_order_relaxed);
    while (peak > current &&
           !peak_amplitude_.compare_exchange_weak(current, peak, std::memory_order_relaxed)) {
    }

    if (ring_.try_push(mono) < mono.size()) {
        overruns_.fetch_add(1, std::memory_order_relaxed);
    }

    frames_captured_.fetch_add(frames, std::memory_order_relaxed);
    callback_count_.fetch_add(1, std::memory_order_relaxed);
}

std::vector<AudioDevice> AudioCapture::list_input_devices() {
    PortAudioGuard guard;

    const int count = Pa_GetDeviceCount();
    if (count < 0) {
        throw pa_error("Failed to enumerate audio devices", count);
    }
    const PaDeviceIndex default_input = Pa_GetDefaultInputDevice();

    std::vector<AudioDevice> devices;
    for (int i = 0; i < count; ++i) {
        const PaDeviceInfo* info = Pa_GetDeviceInfo(i);
        if (info == nullptr || info->maxInputChannels <= 0) {
            continue;
        }
        devices.push_back(AudioDevice{.index = i,
                                      .name = info->name,
                                      .max_input_channels = info->maxInputChannels,
                                      .default_sample_rate = info->defaultSampleRate,
                                      .is_default = i == default_input});
    }
    return devices;
}

}  // namespace specvis
