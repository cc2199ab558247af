#pragma once

#include "specvis/audio_capture.hpp"
#include "specvis/fft_processor.hpp"
#include "specvis/logging.hpp"
#include "specvis/render_quality.hpp"
#include "specvis/render_style.hpp"
#include "specvis/spectrum_converter.hpp"

#include <cstddef>
#include <string>

namespace specvis {

struct DisplayConfig {
    RenderStyle style = RenderStyle::Bars;
    RenderQuality quality = RenderQuality::Medium;
    bool overlay = false;
    std::size_t bar_count = 64;
    int bar_spacing = 1;
    int fps = 60;
    /// When false frames are drawn back to back; fps is then only a label.
    bool limit_fps = true;
};

/// Everything the specvis program is configured with.
struct AppConfig {
    AudioConfig audio{};
    FFTConfig fft{};
    ConverterConfig converter{};
    DisplayConfig display{};

    std::string log_file = "specvis.log";
    LogLevel log_level = LogLevel::Info;

    bool list_devices = false;
    bool show_help = false;
};

/// Limits accepted on the command line.
inline constexpr std::size_t kMinBars = 1;
inline constexpr std::size_t kMaxBars = 512;
inline constexpr int kMaxSpacing = 8;
inline constexpr int kMinFps = 1;
inline constexpr int kMaxFps = 240;

/// Parses command-line options into a config, starting from defaults.
/// @throws std::invalid_argument naming the option for unknown options,
///         missing values and values that fail to parse or are out of range.
[[nodiscard]] AppConfig parse_args(int argc, const char* const* argv);

/// Help text for --help.
[[nodiscard]] std::string usage(const char* program);

}  // namespace specvis
