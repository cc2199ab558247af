#include "specvis/app_config.hpp"

#include <charconv>
#include <cstring>
#include <stdexcept>
#include <string_view>
#include <system_error>

namespace specvis {

namespace {

[[noreturn]] void bad_value(std::string_view option, std::string_view value,
                            std::string_view expected) {
    throw std::invalid_argument("Invalid value '" + std::string(value) + "' for " +
                                std::string(option) + " (expected " + std::string(expected) +
                                ")");
}

template <typename T>
T parse_number(std::string_view option, std::string_view value, T lo, T hi) {
    T out{};
    const auto* end = value.data() + value.size();
    const auto [ptr, ec] = std::from_chars(value.data(), end, out);
    if (ec != std::errc{} || ptr != end || out < lo || out > hi) {
        bad_value(option, value,
                  "an integer in " + std::to_string(lo) + ".." + std::to_string(hi));
    }
    return out;
}

// Rethrows a parser's invalid_argument with the option name attached.
template <typename Fn>
auto parse_named(std::string_view option, std::string_view value, Fn&& fn) {
    try {
        return fn(value);
    } catch (const std::invalid_argument& e) {
        throw std::invalid_argument(std::string(option) + ": " + e.what());
    }
}

}  // namespace

AppConfig parse_args(int argc, const char* const* argv) {
    AppConfig config;

    for (int i = 1; i < argc; ++i) {
        const std::string_view arg = argv[i];

        auto value = [&]() -> std::string_view {
            if (i + 1 >= argc) {
                throw std::invalid_argument("Missing value for " + std::string(arg));
            }
            return argv[++i];
        };

        if (arg == "--help" || arg == "-h") {
            config.show_help = true;
        } else if (arg == "--style") {
            config.display.style = parse_named(arg, value(), parse_style);
        } else if (arg == "--quality") {
            config.display.quality = parse_named(arg, value(), parse_quality);
        } else if (arg == "--overlay") {
            config.display.overlay = true;
        } else if (arg == "--bars") {
            config.display.bar_count = parse_number<std::size_t>(arg, value(), kMinBars, kMaxBars);
        } else if (arg == "--spacing") {
            config.display.bar_spacing = parse_number<int>(arg, value(), 0, kMaxSpacing);
        } else if (arg == "--fps") {
            config.display.fps = parse_number<int>(arg, value(), kMinFps, kMaxFps);
        } else if (arg == "--unlimited-fps") {
            config.display.limit_fps = false;
        } else if (arg == "--fft-size") {
            const auto v = value();
            const auto n = parse_number<std::size_t>(arg, v, 64, 32768);
            if ((n & (n - 1)) != 0) {
                bad_value(arg, v, "a power of two");
            }
            config.fft.fft_size = n;
        } else if (arg == "--scale") {
            config.converter.scale = parse_named(arg, value(), parse_scale);
        } else if (arg == "--device") {
            config.audio.device_index = parse_number<int>(arg, value(), -1, 1024);
        } else if (arg == "--list-devices") {
            config.list_devices = true;
        } else if (arg == "--log-file") {
            const auto v = value();
            if (v.empty()) {
                bad_value(arg, v, "a file path");
            }
            config.log_file = std::string(v);
        } else if (arg == "--log-level") {
            config.log_level = parse_named(arg, value(), parse_log_level);
        } else {
            throw std::invalid_argument("Unknown option: " + std::string(arg));
        }
    }

    return config;
}

std::string usage(const char* program) {
    std::string text = "Usage: ";
    text += program != nullptr && std::strlen(program) > 0 ? program : "specvis";
    text +=
        " [options]\n"
        "\n"
        "Display:\n"
        "  --style NAME       bars|dots|waveform|ledmeter|particles|waterfall|gauge (default bars)\n"
        "  --quality LEVEL    low|medium|high (default medium)\n"
        "  --overlay          Start in overlay mode (no chrome, heavier smoothing)\n"
        "  --bars N           Bar count, 1..512 (default 64)\n"
        "  --spacing N        Cells between bars, 0..8 (default 1)\n"
        "  --fps N            Frame rate, 1..240 (default 60)\n"
        "  --unlimited-fps    Start with the frame limiter off\n"
        "\n"
        "Analysis:\n"
        "  --fft-size N       FFT window, power of two 64..32768 (default 2048)\n"
        "  --scale NAME       linear|log|mel|bark|erb (default log)\n"
        "  --device N         PortAudio input device index, -1 for default\n"
        "  --list-devices     Print input devices and exit\n"
        "\n"
        "Logging:\n"
        "  --log-file PATH    Log destination while the display runs (default specvis.log)\n"
        "  --log-level LEVEL  debug|info|warning|error (default info)\n"
        "\n"
        "Keys: q/Esc quit, Left/Right/Tab style, 1/2/3 quality, o overlay,\n"
        "      f frame limiter, r reset renderers, +/- bar count\n";
    return text;
}

}  // namespace specvis
