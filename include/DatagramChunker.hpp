#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "ChunkerConfig.hpp"

class ChunkMetrics;

// Pulls the next serialized message; nullopt ends the sequence.
using MessageSource = std::function<std::optional<std::string>()>;
// Receives each completed datagram in order.
using DatagramSink = std::function<void(std::string)>;

// Greedy first-fit packer: appends each frame to the current datagram if it
// fits, otherwise completes that datagram and starts a new one.
// Frames are never split across datagrams.
class DatagramChunker
{
public:
    // Throws ChunkerError(InvalidConfiguration) for an unusable size.
    explicit DatagramChunker(const ChunkerConfig &config);

    // Adds one message. Returns the previous datagram when this frame did not
    // fit beside it. Throws ChunkerError(MessageTooLarge) when the frame cannot
    // fit in any datagram; the datagram under construction is left untouched.
    std::optional<std::string> push(const std::string &message);

    // Completes the trailing datagram, if any frames are pending.
    std::optional<std::string> finish();

    // Messages offered to push(), rejected ones included.
    std::size_t messages_seen() const { return next_index_; }
    std::size_t pending_bytes() const { return current_.size(); }
    const ChunkerConfig &config() const { return config_; }

private:
    ChunkerConfig config_;
    std::string current_;
    std::size_t next_index_ = 0;
};

// Streams messages from source into datagrams delivered to sink, returning the
// number of datagrams emitted. On MessageTooLarge the datagram already holding
// earlier messages is delivered first, then the error is rethrown.
std::size_t chunk_messages(const ChunkerConfig &config, const MessageSource &source,
                           const DatagramSink &sink, ChunkMetrics *metrics = nullptr);

// Materializes the full chunk sequence for an in-memory message list.
std::vector<std::string> chunk_all(const std::vector<std::string> &messages, const ChunkerConfig &config);
