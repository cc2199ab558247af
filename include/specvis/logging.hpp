#pragma once

#include <cstdio>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>

namespace specvis {

/// Severity of a diagnostic message.
enum class LogLevel {
    Debug,
    Info,
    Warning,
    Error
};

[[nodiscard]] const char* to_string(LogLevel level) noexcept;

/// Parses "debug", "info", "warning"/"warn" or "error".
/// @throws std::invalid_argument for anything else.
[[nodiscard]] LogLevel parse_log_level(std::string_view text);

/// Destination for diagnostic messages.
///
/// Implementations must tolerate concurrent calls; the process-wide logger
/// serializes writes, but a sink may also be used directly.
class LogSink {
public:
    virtual ~LogSink() = default;

    virtual void write(LogLevel level, std::string_view source, std::string_view message) = 0;
};

/// Writes "[HH:MM:SS.mmm][LEVEL][source] message" lines to a C stream.
class StreamSink final : public LogSink {
public:
    /// Wraps an existing stream (e.g. stderr). The stream is not closed.
    explicit StreamSink(std::FILE* stream) noexcept;

    /// Opens (appends to) a log file.
    /// @throws std::runtime_error if the file cannot be opened.
    explicit StreamSink(const std::string& path);

    ~StreamSink() override;

    StreamSink(const StreamSink&) = delete;
    StreamSink& operator=(const StreamSink&) = delete;

    void write(LogLevel level, std::string_view source, std::string_view message) override;

private:
    std::FILE* stream_ = nullptr;
    bool owns_stream_ = false;
    std::mutex mutex_;
};

/// Replaces the process-wide sink. Passing nullptr restores the stderr sink.
void set_log_sink(std::shared_ptr<LogSink> sink);

/// Messages below this level are dropped. Default: Info.
void set_log_level(LogLevel level) noexcept;
[[nodiscard]] LogLevel log_level() noexcept;

/// Formats a printf-style message and forwards it to the current sink.
void log_message(LogLevel level, std::string_view source, const char* fmt, ...)
#if defined(__GNUC__)
    __attribute__((format(printf, 3, 4)))
#endif
    ;

}  // namespace specvis

#define SPECVIS_LOG_DEBUG(source, ...) \
    ::specvis::log_message(::specvis::LogLevel::Debug, source, __VA_ARGS__)
#define SPECVIS_LOG_INFO(source, ...) \
    ::specvis::log_message(::specvis::LogLevel::Info, source, __VA_ARGS__)
#define SPECVIS_LOG_WARNING(source, ...) \
    ::specvis::log_message(::specvis::LogLevel::Warning, source, __VA_ARGS__)
#define SPECVIS_LOG_ERROR(source, ...) \
    ::specvis::log_message(::specvis::LogLevel::Error, source, __VA_ARGS__)
