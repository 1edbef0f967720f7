#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "ChunkerConfig.hpp"

class ChunkMetrics;

// Pulls the next received datagram; nullopt ends the sequence.
using DatagramSource = std::function<std::optional<std::string>()>;
// Receives each reconstructed message in order.
using MessageSink = std::function<void(std::string)>;

enum class FrameState
{
    ReadingPrefix,
    ReadingPayload,
    DatagramExhausted
};

// Cursor over the frames of a single datagram. The viewed bytes must outlive the reader.
class FrameReader
{
public:
    FrameReader(std::string_view datagram, std::size_t datagramIndex);

    // Returns the next message, or nullopt once the cursor sits exactly on the
    // datagram end. Throws ChunkerError(MalformedFrame) naming the frame's offset
    // when a prefix or payload runs past the end.
    std::optional<std::string> next();

    FrameState state() const { return state_; }
    std::size_t offset() const { return offset_; }

private:
    [[noreturn]] void fail(const std::string &what) const;

    std::string_view datagram_;
    std::size_t datagram_index_;
    std::size_t offset_ = 0;
    std::size_t frame_start_ = 0;
    std::size_t payload_len_ = 0;
    FrameState state_ = FrameState::ReadingPrefix;
};

// Splits received datagrams back into messages. Each datagram is parsed on its
// own; only the datagram index carries over between calls to feed().
class DatagramDechunker
{
public:
    // Throws ChunkerError(InvalidConfiguration) for an unusable size.
    explicit DatagramDechunker(const ChunkerConfig &config);

    // Delivers every message in the datagram to sink and returns their count.
    // Throws ChunkerError(OversizedDatagram) before parsing a datagram larger
    // than max_datagram_size, or MalformedFrame after delivering the messages
    // that preceded the bad frame.
    std::size_t feed(const std::string &datagram, const MessageSink &sink);

    std::size_t datagrams_seen() const { return next_index_; }
    const ChunkerConfig &config() const { return config_; }

private:
    ChunkerConfig config_;
    std::size_t next_index_ = 0;
};

// Streams datagrams from source into messages delivered to sink, returning the
// number of messages produced. Errors are logged and rethrown after all
// earlier messages have reached the sink.
std::size_t dechunk_datagrams(const ChunkerConfig &config, const DatagramSource &source,
                              const MessageSink &sink, ChunkMetrics *metrics = nullptr);

// Materializes the message sequence for an in-memory datagram list.
std::vector<std::string> dechunk_all(const std::vector<std::string> &datagrams, const ChunkerConfig &config);
