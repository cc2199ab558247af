#include "specvis/logging.hpp"

#include "string_utils.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdarg>
#include <ctime>
#include <stdexcept>
#include <utility>

namespace specvis {

namespace {

std::mutex g_sink_mutex;
std::shared_ptr<LogSink> g_sink;
std::atomic<LogLevel> g_level{LogLevel::Info};

std::shared_ptr<LogSink> current_sink() {
    std::lock_guard<std::mutex> lock(g_sink_mutex);
    if (!g_sink) {
        g_sink = std::make_shared<StreamSink>(stderr);
    }
    return g_sink;
}

}  // namespace

const char* to_string(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Debug:
            return "DEBUG";
        case LogLevel::Info:
            return "INFO";
        case LogLevel::Warning:
            return "WARN";
        case LogLevel::Error:
            return "ERROR";
    }
    return "?";
}

LogLevel parse_log_level(std::string_view text) {
    const auto token = detail::normalize_token(text);
    if (token == "debug") return LogLevel::Debug;
    if (token == "info") return LogLevel::Info;
    if (token == "warning" || token == "warn") return LogLevel::Warning;
    if (token == "error") return LogLevel::Error;
    throw std::invalid_argument("Unknown log level: " + std::string(text));
}

StreamSink::StreamSink(std::FILE* stream) noexcept : stream_{stream} {}

StreamSink::StreamSink(const std::string& path)
    : stream_{std::fopen(path.c_str(), "a")}, owns_stream_{true} {
    if (stream_ == nullptr) {
        throw std::runtime_error("Failed to open log file: " + path);
    }
}

StreamSink::~StreamSink() {
    if (owns_stream_ && stream_ != nullptr) {
        std::fclose(stream_);
    }
}

void StreamSink::write(LogLevel level, std::string_view source, std::string_view message) {
    const auto now = std::chrono::system_clock::now();
    const auto t = std::chrono::system_clock::to_time_t(now);
    const auto ms =
        std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

    std::tm tm{};
    localtime_r(&t, &tm);

    char ts[16];
    std::strftime(ts, sizeof(ts), "%H:%M:%S", &tm);

    std::lock_guard<std::mutex> lock(mutex_);
    std::fprintf(stream_, "[%s.%03lld][%s][%.*s] %.*s\n", ts, static_cast<long long>(ms.count()),
                 to_string(level), static_cast<int>(source.size()), source.data(),
                 static_cast<int>(message.size()), message.data());
    std::fflush(stream_);
}

void set_log_sink(std::shared_ptr<LogSink> sink) {
    std::lock_guard<std::mutex> lock(g_sink_mutex);
    g_sink = std::move(sink);
}

void set_log_level(LogLevel level) noexcept {
    g_level.store(level, std::memory_order_relaxed);
}

LogLevel log_level() noexcept {
    return g_level.load(std::memory_order_relaxed);
}

void log_message(LogLevel level, std::string_view source, const char* fmt, ...) {
    if (level < log_level()) {
        return;
    }

    char buf[1024];
    va_list args;
    va_start(args, fmt);
    int n = std::vsnprintf(buf, sizeof(buf), fmt, args);
    va_end(args);
    if (n < 0) {
        return;
    }
    const auto len = std::min(static_cast<std::size_t>(n), sizeof(buf) - 1);

    current_sink()->write(level, source, std::string_view{buf, len});
}

}  // namespace specvis
