#include "specvis/app_config.hpp"
#include "specvis/audio_capture.hpp"
#include "specvis/frame_rate.hpp"
#include "specvis/logging.hpp"
#include "specvis/renderer_registry.hpp"
#include "specvis/spectrum_analyzer.hpp"
#include "specvis/spectrum_feed.hpp"
#include "specvis/terminal_surface.hpp"

#include <ncurses.h>

#include <algorithm>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <cstdio>
#include <memory>
#include <stdexcept>
#include <stop_token>
#include <thread>

namespace {

volatile std::sig_atomic_t g_stop_requested = 0;

void signal_handler(int /*signum*/) {
    g_stop_requested = 1;
}

constexpr const char* kLogSource = "specvis";

}  // namespace

namespace specvis {

/// Terminal front end: owns the ncurses session, the renderer registry and the
/// analysis thread, and runs the frame loop.
class TerminalApp {
public:
    TerminalApp(const AppConfig& config, AudioCapture& capture)
        : config_{config},
          capture_{capture},
          registry_{default_renderer_table(), config.display.quality},
          style_{config.display.style},
          overlay_{config.display.overlay},
          bar_count_{config.display.bar_count},
          limiter_{config.display.fps, config.display.limit_fps},
          surface_{0, 0, 0, 0} {
        initscr();
        cbreak();
        noecho();
        curs_set(0);
        nodelay(stdscr, TRUE);
        keypad(stdscr, TRUE);
        TerminalSurface::init_colors();
        layout();
    }

    ~TerminalApp() {
        registry_.reset();
        endwin();
    }

    TerminalApp(const TerminalApp&) = delete;
    TerminalApp& operator=(const TerminalApp&) = delete;

    /// Blocks until the user quits or a signal arrives.
    void run() {
        // Built here so bad FFT or gain settings fail before the thread starts.
        SpectrumAnalyzer analyzer{capture_.buffer(), capture_.sample_rate(), config_.fft,
                                  config_.converter};

        capture_.start();
        std::jthread analysis{[this, &analyzer](std::stop_token stop) {
            analysis_loop(stop, analyzer);
        }};

        acquire_renderer();

        while (running_ && g_stop_requested == 0) {
            const auto frame_start = FrameRateMeter::Clock::now();
            meter_.tick(frame_start);

            handle_input();
            if (!running_) {
                break;
            }

            feed_.copy_if_new(last_seen_, frame_);
            render_frame();

            const auto wait = limiter_.remaining(FrameRateMeter::Clock::now() - frame_start);
            if (wait > FrameLimiter::Clock::duration::zero()) {
                std::this_thread::sleep_for(wait);
            }
        }

        analysis.request_stop();
        analysis.join();
        capture_.stop();
    }

private:
    static constexpr int kHeaderLines = 2;
    static constexpr int kFooterLines = 2;

    void analysis_loop(std::stop_token stop, SpectrumAnalyzer& analyzer) {
        try {
            while (!stop.stop_requested()) {
                if (auto frame = analyzer.update()) {
                    feed_.publish(std::move(*frame));
                } else {
                    std::this_thread::sleep_for(std::chrono::milliseconds(2));
                }
            }
        } catch (const std::exception& e) {
            SPECVIS_LOG_ERROR(kLogSource, "Analysis stopped: %s", e.what());
            feed_.clear();
        }
    }

    void handle_input() {
        for (int ch = getch(); ch != ERR; ch = getch()) {
            switch (ch) {
                case 'q':
                case 'Q':
                case 27:  // Esc
                    running_ = false;
                    return;
                case KEY_RESIZE:
                    layout();
                    break;
                case KEY_RIGHT:
                case '\t':
                    style_ = next_style(style_);
                    acquire_renderer();
                    break;
                case KEY_LEFT:
                case KEY_BTAB:
                    style_ = previous_style(style_);
                    acquire_renderer();
                    break;
                case '1':
                    registry_.set_global_quality(RenderQuality::Low);
                    break;
                case '2':
                    registry_.set_global_quality(RenderQuality::Medium);
                    break;
                case '3':
                    registry_.set_global_quality(RenderQuality::High);
                    break;
                case 'o':
                case 'O':
                    overlay_ = !overlay_;
                    layout();
                    acquire_renderer();
                    break;
                case 'f':
                case 'F':
                    limiter_.toggle();
                    meter_.reset();
                    SPECVIS_LOG_INFO(kLogSource, "Frame limiter %s",
                                     limiter_.is_enabled() ? "enabled" : "disabled");
                    break;
                case 'r':
                case 'R':
                    registry_.reset();
                    acquire_renderer();
                    break;
                case '+':
                case '=':
                    bar_count_ = std::min(kMaxBars, bar_count_ * 2);
                    break;
                case '-':
                case '_':
                    bar_count_ = std::max(kMinBars, bar_count_ / 2);
                    break;
                default:
                    break;
            }
        }
    }

    void acquire_renderer() {
        renderer_ = registry_.create_renderer(style_, overlay_);
        if (renderer_->is_fallback()) {
            SPECVIS_LOG_WARNING(kLogSource, "Style %s unavailable, showing fallback",
                                to_string(style_));
            return;
        }
        SPECVIS_LOG_INFO(kLogSource, "Style %s -> renderer '%.*s'", to_string(style_),
                         static_cast<int>(renderer_->name().size()), renderer_->name().data());
    }

    void layout() {
        surface_.invalidate();
        getmaxyx(stdscr, term_height_, term_width_);

        const int top = overlay_ ? 0 : kHeaderLines;
        const int bottom = overlay_ ? 0 : kFooterLines;
        const int margin = overlay_ ? 0 : 1;
        surface_.set_viewport(margin, top, term_width_ - 2 * margin,
                              term_height_ - top - bottom);
        erase();
    }

    [[nodiscard]] RenderRequest request() const noexcept {
        RenderRequest req;
        req.bar_count = std::min(bar_count_, frame_.values.size());
        req.bar_spacing = config_.display.bar_spacing;
        if (req.bar_count > 0) {
            const auto n = static_cast<int>(req.bar_count);
            req.bar_width = std::max(1, (surface_.width() - req.bar_spacing * (n - 1)) / n);
        }
        return req;
    }

    void render_frame() {
        erase();

        if (surface_.width() < 10 || surface_.height() < 3) {
            mvprintw(0, 0, "Terminal too small");
            refresh();
            return;
        }

        if (!overlay_) {
            draw_chrome();
        }

        if (frame_.values.empty()) {
            surface_.text(surface_.width() / 2 - 10, surface_.height() / 2, "Waiting for audio...",
                          Shade::Text);
        } else {
            renderer_->render(&surface_, frame_.values, request());
        }

        refresh();
    }

    void draw_chrome() {
        attron(A_BOLD);
        mvprintw(0, 1, "SPECVIS");
        attroff(A_BOLD);
        mvprintw(0, 10, "%s  quality:%s  bars:%zu  scale:%s", to_string(style_),
                 to_string(registry_.global_quality()), bar_count_,
                 to_string(config_.converter.scale));
        mvhline(1, 0, ACS_HLINE, term_width_);

        const auto stats = capture_.stats();
        mvhline(term_height_ - kFooterLines, 0, ACS_HLINE, term_width_);
        mvprintw(term_height_ - 1, 1,
                 "FPS %5.1f%s  RMS %.2f  Peak %.2f  %lluk frames  %llu overruns  [%s]",
                 meter_.fps(), limiter_.is_enabled() ? "" : " (unlimited)",
                 static_cast<double>(frame_.rms_level), static_cast<double>(frame_.peak_level),
                 static_cast<unsigned long long>(stats.frames_captured / 1000),
                 static_cast<unsigned long long>(stats.overruns), capture_.device_name().c_str());
        mvprintw(term_height_ - 1, std::max(0, term_width_ - 34),
                 "[q]uit [<>]style [o]verlay [f]ps");
    }

    const AppConfig& config_;
    AudioCapture& capture_;
    RendererRegistry registry_;
    SpectrumFeed feed_;

    RenderStyle style_;
    bool overlay_;
    std::size_t bar_count_;
    std::shared_ptr<Renderer> renderer_;

    FrameLimiter limiter_;
    FrameRateMeter meter_;

    TerminalSurface surface_;
    SpectrumFrame frame_;
    std::uint64_t last_seen_ = 0;

    bool running_ = true;
    int term_width_ = 0;
    int term_height_ = 0;
};

}  // namespace specvis

int main(int argc, char** argv) {
    specvis::AppConfig config;
    try {
        config = specvis::parse_args(argc, argv);
    } catch (const std::invalid_argument& e) {
        std::fprintf(stderr, "Error: %s\n\n%s", e.what(), specvis::usage(argv[0]).c_str());
        return 2;
    }

    if (config.show_help) {
        std::fputs(specvis::usage(argv[0]).c_str(), stdout);
        return 0;
    }

    specvis::set_log_level(config.log_level);

    try {
        if (config.list_devices) {
            for (const auto& device : specvis::AudioCapture::list_input_devices()) {
                std::printf("%3d  %s%s  (%d ch, %.0f Hz)\n", device.index, device.name.c_str(),
                            device.is_default ? " [default]" : "", device.max_input_channels,
                            device.default_sample_rate);
            }
            return 0;
        }

        specvis::AudioCapture capture{config.audio};

        // ncurses owns the terminal from here on.
        specvis::set_log_sink(std::make_shared<specvis::StreamSink>(config.log_file));
        SPECVIS_LOG_INFO(kLogSource, "Starting: style %s, quality %s, %zu bars, fft %zu",
                         specvis::to_string(config.display.style),
                         specvis::to_string(config.display.quality), config.display.bar_count,
                         config.fft.fft_size);

        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);

        {
            specvis::TerminalApp app{config, capture};
            app.run();
        }

        SPECVIS_LOG_INFO(kLogSource, "Exiting");
        specvis::set_log_sink(nullptr);
        return 0;

    } catch (const std::exception& e) {
        // TerminalApp's destructor has already restored the terminal.
        specvis::set_log_sink(nullptr);
        std::fprintf(stderr, "Error: %s\n", e.what());
        return 1;
    }
}
