#include "log.h"

#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <mutex>
#include <utility>

namespace Drape {

    namespace {
        std::mutex g_sink_mutex;
        LogSink g_sink;
        std::atomic<LogLevel> g_level{LogLevel::Info};

        void default_sink(LogLevel level, std::string_view msg) {
            std::fprintf(stderr, "[drape][%s] %.*s\n", to_string(level), static_cast<int>(msg.size()), msg.data());
        }
    }

    void set_log_sink(LogSink sink) {
        std::lock_guard<std::mutex> lock(g_sink_mutex);
        g_sink = std::move(sink);
    }

    void set_log_level(LogLevel level) noexcept {
        g_level.store(level, std::memory_order_relaxed);
    }

    LogLevel log_level() noexcept {
        return g_level.load(std::memory_order_relaxed);
    }

    const char* to_string(LogLevel level) noexcept {
        switch (level) {
        case LogLevel::Debug: return "debug";
        case LogLevel::Info: return "info";
        case LogLevel::Warn: return "warn";
        case LogLevel::Error: return "error";
        case LogLevel::Off: return "off";
        }
        return "unknown";
    }

    void log_message(LogLevel level, const char* fmt, ...) {
        if (level == LogLevel::Off || level < log_level()) return;
        char buf[512];
        va_list args;
        va_start(args, fmt);
        const int len = std::vsnprintf(buf, sizeof(buf), fmt, args);
        va_end(args);
        if (len < 0) return;
        const std::string_view msg(buf, static_cast<std::size_t>(len) < sizeof(buf) ? static_cast<std::size_t>(len) : sizeof(buf) - 1);

        std::lock_guard<std::mutex> lock(g_sink_mutex);
        if (g_sink) {
            g_sink(level, msg);
        } else {
            default_sink(level, msg);
        }
    }

}
