#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

#include "Logging.hpp"

enum class ChunkErrorKind
{
    InvalidConfiguration,
    MessageTooLarge,
    OversizedDatagram,
    MalformedFrame,
    CodecFailure
};

// Stable error codes, reported in log events and by the command-line tool.
inline const char *to_string(ChunkErrorKind kind)
{
    switch (kind)
    {
    case ChunkErrorKind::InvalidConfiguration:
        return "ERR_INVALID_CONFIGURATION";
    case ChunkErrorKind::MessageTooLarge:
        return "ERR_MESSAGE_TOO_LARGE";
    case ChunkErrorKind::OversizedDatagram:
        return "ERR_OVERSIZED_DATAGRAM";
    case ChunkErrorKind::MalformedFrame:
        return "ERR_MALFORMED_FRAME";
    case ChunkErrorKind::CodecFailure:
        return "ERR_CODEC_FAILURE";
    }
    return "ERR_UNKNOWN";
}

// Severity used when an error of this kind is logged.
inline LogLevel log_level(ChunkErrorKind kind)
{
    switch (kind)
    {
    case ChunkErrorKind::InvalidConfiguration:
    case ChunkErrorKind::MessageTooLarge:
        return LogLevel::Error;
    case ChunkErrorKind::OversizedDatagram:
    case ChunkErrorKind::MalformedFrame:
    case ChunkErrorKind::CodecFailure:
        return LogLevel::Warn;
    }
    return LogLevel::Error;
}

class ChunkerError : public std::runtime_error
{
public:
    static constexpr std::size_t npos = static_cast<std::size_t>(-1);

    ChunkerError(ChunkErrorKind kind, const std::string &message,
                 std::size_t index = npos, std::size_t size = npos, std::size_t offset = npos)
        : std::runtime_error(message), kind_(kind), index_(index), size_(size), offset_(offset)
    {
    }

    ChunkErrorKind kind() const { return kind_; }
    // Index of the offending message (encoder) or datagram (decoder), npos if not applicable.
    std::size_t index() const { return index_; }
    // Observed size of the offending message, datagram or configuration value.
    std::size_t size() const { return size_; }
    // Byte offset of a malformed frame inside its datagram.
    std::size_t offset() const { return offset_; }
    LogLevel log_level() const { return ::log_level(kind_); }

    // Fields suitable for Logger::log_event extras.
    nlohmann::json to_json() const
    {
        nlohmann::json j = {{"error", to_string(kind_)}, {"detail", what()}};
        if (index_ != npos)
            j["index"] = index_;
        if (size_ != npos)
            j["size"] = size_;
        if (offset_ != npos)
            j["offset"] = offset_;
        return j;
    }

private:
    ChunkErrorKind kind_;
    std::size_t index_;
    std::size_t size_;
    std::size_t offset_;
};
