#pragma once

#include <atomic>
#include <cstdlib>
#include <iostream>
#include <mutex>
#include <string>

#include <nlohmann/json.hpp>

#include "utils.hpp"

enum class LogLevel
{
    Debug,
    Info,
    Warn,
    Error,
    Off
};

inline const char *to_string(LogLevel level)
{
    switch (level)
    {
    case LogLevel::Debug:
        return "debug";
    case LogLevel::Info:
        return "info";
    case LogLevel::Warn:
        return "warn";
    case LogLevel::Error:
        return "error";
    case LogLevel::Off:
        return "off";
    }
    return "unknown";
}

// Maps "debug", "info", "warn", "error" or "off"; anything else yields fallback.
inline LogLevel parse_log_level(const std::string &name, LogLevel fallback = LogLevel::Info)
{
    for (LogLevel level : {LogLevel::Debug, LogLevel::Info, LogLevel::Warn, LogLevel::Error, LogLevel::Off})
    {
        if (name == to_string(level))
            return level;
    }
    return fallback;
}

// Thread-safe structured logger that prints one JSON object per line to stderr,
// keeping stdout free for datagram and message output.
class Logger
{
public:
    static constexpr const char *ENV_LOG_LEVEL = "DATAGRAM_CHUNKER_LOG_LEVEL";

    // Events below this level are dropped.
    static void set_threshold(LogLevel level) { threshold().store(level, std::memory_order_relaxed); }
    static LogLevel get_threshold() { return threshold().load(std::memory_order_relaxed); }

    // Reads DATAGRAM_CHUNKER_LOG_LEVEL when present.
    static void init_from_env()
    {
        if (const char *raw = std::getenv(ENV_LOG_LEVEL))
            set_threshold(parse_log_level(raw, get_threshold()));
    }

    // Emits a structured log event as a single JSON line.
    static void log_event(LogLevel level, const std::string &action, const std::string &message, const nlohmann::json &extra = nlohmann::json::object())
    {
        if (level == LogLevel::Off || level < get_threshold())
            return;

        nlohmann::json j = extra.is_object() ? extra : nlohmann::json::object();
        j["ts"] = current_timestamp();
        j["level"] = to_string(level);
        j["action"] = action;
        j["message"] = message;

        // Serialize output to avoid interleaved JSON lines.
        std::lock_guard<std::mutex> lock(mutex());
        std::cerr << j.dump() << std::endl;
    }

private:
    static std::atomic<LogLevel> &threshold()
    {
        static std::atomic<LogLevel> level{LogLevel::Info};
        return level;
    }

    static std::mutex &mutex()
    {
        static std::mutex m;
        return m;
    }
};
