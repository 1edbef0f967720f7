// Utility helpers for timestamps and input validation.
#pragma once
#include <string>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <optional>
#include <sstream>
#include <cctype>
#include <cstddef>

// Returns local time in "YYYY-MM-DD HH:MM:SS" format.
inline std::string current_timestamp() {
    auto now = std::chrono::system_clock::now();
    std::time_t t_c = std::chrono::system_clock::to_time_t(now);

    std::stringstream ss;
    ss << std::put_time(std::localtime(&t_c), "%Y-%m-%d %H:%M:%S");
    return ss.str();
}

// Parses a non-empty decimal byte count; rejects signs, spaces and overflow.
inline std::optional<std::size_t> parseSize(const std::string &text)
{
    if (text.empty() || text.size() > 19)
        return std::nullopt;
    std::size_t value = 0;
    for (unsigned char ch : text)
    {
        if (!std::isdigit(ch))
            return std::nullopt;
        value = value * 10 + static_cast<std::size_t>(ch - '0');
    }
    return value;
}

// Strips a trailing '\r' left by CRLF line endings.
inline void trimCarriageReturn(std::string &line)
{
    if (!line.empty() && line.back() == '\r')
        line.pop_back();
}
