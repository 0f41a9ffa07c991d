#ifndef DRAPE_LOG_H
#define DRAPE_LOG_H

#include <functional>
#include <string_view>

namespace Drape {

    enum class LogLevel { Debug, Info, Warn, Error, Off };

    using LogSink = std::function<void(LogLevel, std::string_view)>;

    // Passing an empty sink restores the default stderr sink.
    void set_log_sink(LogSink sink);
    void set_log_level(LogLevel level) noexcept;
    [[nodiscard]] LogLevel log_level() noexcept;
    [[nodiscard]] const char* to_string(LogLevel level) noexcept;

#if defined(__GNUC__) || defined(__clang__)
    void log_message(LogLevel level, const char* fmt, ...) __attribute__((format(printf, 2, 3)));
#else
    void log_message(LogLevel level, const char* fmt, ...);
#endif

}

#define DRAPE_LOG_DEBUG(...) ::Drape::log_message(::Drape::LogLevel::Debug, __VA_ARGS__)
#define DRAPE_LOG_INFO(...) ::Drape::log_message(::Drape::LogLevel::Info, __VA_ARGS__)
#define DRAPE_LOG_WARN(...) ::Drape::log_message(::Drape::LogLevel::Warn, __VA_ARGS__)
#define DRAPE_LOG_ERROR(...) ::Drape::log_message(::Drape::LogLevel::Error, __VA_ARGS__)

#endif
