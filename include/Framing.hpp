#pragma once

#include <arpa/inet.h>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <optional>
#include <stdexcept>
#include <string>

// Wire format of one frame: [u16 big-endian length][payload].
constexpr std::size_t FRAME_PREFIX_SIZE = sizeof(uint16_t);
constexpr std::size_t MAX_FRAME_PAYLOAD = UINT16_MAX;
// Largest datagram size whose payload limit still fits in the prefix.
constexpr std::size_t MAX_DATAGRAM_LIMIT = FRAME_PREFIX_SIZE + MAX_FRAME_PAYLOAD;

// Record header used to store a sequence of datagrams in a byte stream.
constexpr std::size_t RECORD_PREFIX_SIZE = sizeof(uint32_t);

inline std::size_t frame_size(std::size_t payload_len)
{
    return FRAME_PREFIX_SIZE + payload_len;
}

// Appends a frame for the payload; the caller has checked payload size.
inline void append_frame(std::string &datagram, const std::string &payload)
{
    uint16_t net_len = htons(static_cast<uint16_t>(payload.size()));
    char prefix[FRAME_PREFIX_SIZE];
    std::memcpy(prefix, &net_len, FRAME_PREFIX_SIZE);
    datagram.append(prefix, FRAME_PREFIX_SIZE);
    datagram.append(payload);
}

// Frames a payload with a 2-byte big-endian length prefix.
inline std::string frame_message(const std::string &payload)
{
    std::string framed;
    framed.reserve(frame_size(payload.size()));
    append_frame(framed, payload);
    return framed;
}

// Reads a length prefix; data must hold at least FRAME_PREFIX_SIZE bytes.
inline std::size_t read_frame_prefix(const char *data)
{
    uint16_t net_len = 0;
    std::memcpy(&net_len, data, FRAME_PREFIX_SIZE);
    return ntohs(net_len);
}

// Frames a datagram with a 4-byte big-endian length record header.
inline std::string frame_record(const std::string &datagram)
{
    uint32_t net_len = htonl(static_cast<uint32_t>(datagram.size()));
    std::string framed;
    framed.resize(RECORD_PREFIX_SIZE);
    std::memcpy(framed.data(), &net_len, RECORD_PREFIX_SIZE);
    framed.append(datagram);
    return framed;
}

// Reassembles length records from an arbitrarily split byte stream.
class RecordReader
{
public:
    explicit RecordReader(std::size_t maxRecord) : max_record_(maxRecord) {}

    void append(const char *data, std::size_t len) { buffer_.append(data, len); }

    // Returns the next complete record, or nullopt when more bytes are needed.
    // Throws std::length_error when a header announces more than maxRecord bytes.
    std::optional<std::string> pop()
    {
        if (buffer_.size() < RECORD_PREFIX_SIZE)
            return std::nullopt;

        uint32_t net_len = 0;
        std::memcpy(&net_len, buffer_.data(), RECORD_PREFIX_SIZE);
        uint32_t len = ntohl(net_len);
        if (len > max_record_)
            throw std::length_error("record length " + std::to_string(len) + " exceeds limit " + std::to_string(max_record_));
        if (buffer_.size() < RECORD_PREFIX_SIZE + len)
            return std::nullopt;

        std::string record = buffer_.substr(RECORD_PREFIX_SIZE, len);
        buffer_.erase(0, RECORD_PREFIX_SIZE + len);
        return record;
    }

    // Bytes received that do not yet form a complete record.
    std::size_t pending() const { return buffer_.size(); }

private:
    std::size_t max_record_;
    std::string buffer_;
};
