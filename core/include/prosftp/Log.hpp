// Minimal logging utility (header-only) for the ProSFTP core.
// Enabled by PRO_SFTP_LOG (any value but "0"); PRO_SFTP_LOG=debug also
// enables debug lines. Front ends may install a sink to take over output.
#pragma once
#include "RuntimeLogging.hpp"

#include <cstdarg>
#include <cstdio>
#include <functional>
#include <mutex>
#include <string>

namespace prosftp {

enum class LogLevel { Debug, Info, Warning, Error };

using LogSink = std::function<void(LogLevel, const std::string&)>;

namespace detail {
inline std::mutex& logMutex() {
    static std::mutex m;
    return m;
}
inline LogSink& logSink() {
    static LogSink sink;
    return sink;
}
inline bool& logForced() {
    static bool forced = false;
    return forced;
}
} // namespace detail

inline const char* logLevelName(LogLevel level) {
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

// Route log lines to the given sink. Passing an empty sink restores stderr.
// With a sink installed every level above Debug is delivered regardless of
// PRO_SFTP_LOG; the sink applies its own filtering.
inline void setLogSink(LogSink sink) {
    std::lock_guard<std::mutex> lk(detail::logMutex());
    detail::logForced() = static_cast<bool>(sink);
    detail::logSink() = std::move(sink);
}

inline bool logEnabled(LogLevel level = LogLevel::Info) {
    const std::string v = normalizedEnv("PRO_SFTP_LOG");
    if (level == LogLevel::Debug)
        return v == "debug";
    {
        std::lock_guard<std::mutex> lk(detail::logMutex());
        if (detail::logForced())
            return true;
    }
    return !v.empty() && v != "0";
}

inline void logf(LogLevel level, const char* fmt, ...) {
    if (!logEnabled(level)) return;
    char buf[2048];
    va_list ap;
    va_start(ap, fmt);
    std::vsnprintf(buf, sizeof(buf), fmt, ap);
    va_end(ap);

    std::lock_guard<std::mutex> lk(detail::logMutex());
    if (detail::logSink()) {
        detail::logSink()(level, std::string(buf));
        return;
    }
    std::fprintf(stderr, "[ProSFTP][%s] %s\n", logLevelName(level), buf);
}

} // namespace prosftp

#define PROSFTP_LOGD(fmt, ...) \
    do { \
        if (prosftp::logEnabled(prosftp::LogLevel::Debug)) \
            prosftp::logf(prosftp::LogLevel::Debug, fmt, ##__VA_ARGS__); \
    } while (0)

#define PROSFTP_LOGI(fmt, ...) \
    do { \
        if (prosftp::logEnabled(prosftp::LogLevel::Info)) \
            prosftp::logf(prosftp::LogLevel::Info, fmt, ##__VA_ARGS__); \
    } while (0)

#define PROSFTP_LOGW(fmt, ...) \
    do { \
        if (prosftp::logEnabled(prosftp::LogLevel::Warning)) \
            prosftp::logf(prosftp::LogLevel::Warning, fmt, ##__VA_ARGS__); \
    } while (0)

#define PROSFTP_LOGE(fmt, ...) \
    do { \
        if (prosftp::logEnabled(prosftp::LogLevel::Error)) \
            prosftp::logf(prosftp::LogLevel::Error, fmt, ##__VA_ARGS__); \
    } while (0)
