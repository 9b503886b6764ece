// Runtime policy helpers for diagnostics/sensitive logging and
// environment-driven configuration.
#pragma once

#include <cctype>
#include <cstdlib>
#include <string>

namespace prosftp {

inline std::string rawEnv(const char *name) {
    if (!name)
        return {};
    const char *raw = std::getenv(name);
    if (!raw || !*raw)
        return {};
    return std::string(raw);
}

inline std::string normalizedEnv(const char *name) {
    std::string out = rawEnv(name);
    std::size_t start = 0;
    while (start < out.size() &&
           std::isspace(static_cast<unsigned char>(out[start]))) {
        ++start;
    }
    std::size_t end = out.size();
    while (end > start &&
           std::isspace(static_cast<unsigned char>(out[end - 1]))) {
        --end;
    }
    out = out.substr(start, end - start);
    for (char &c : out)
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return out;
}

inline bool envFlagEnabled(const char *name) {
    const std::string v = normalizedEnv(name);
    return v == "1" || v == "true" || v == "yes" || v == "on";
}

// Positive integer from the environment, or fallback when unset/invalid.
inline long envPositiveLong(const char *name, long fallback) {
    const std::string v = normalizedEnv(name);
    if (v.empty())
        return fallback;
    char *end = nullptr;
    const long n = std::strtol(v.c_str(), &end, 10);
    if (!end || *end != '\0' || n <= 0)
        return fallback;
    return n;
}

inline bool isDevEnvironment() {
    const std::string env = normalizedEnv("PRO_SFTP_ENV");
    return env == "dev" || env == "development" || env == "local" ||
           env == "debug";
}

inline bool sensitiveLoggingEnabled() {
    return isDevEnvironment() && envFlagEnabled("PRO_SFTP_LOG_SENSITIVE");
}

// Value to print in logs for user names and host names.
inline std::string redacted(const std::string &value) {
    if (sensitiveLoggingEnabled())
        return value;
    return value.empty() ? std::string() : std::string("<redacted>");
}

} // namespace prosftp
