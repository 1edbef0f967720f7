#include "DatagramDechunker.hpp"

#include "ChunkerError.hpp"
#include "Framing.hpp"
#include "Logging.hpp"
#include "Metrics.hpp"

FrameReader::FrameReader(std::string_view datagram, std::size_t datagramIndex)
    : datagram_(datagram), datagram_index_(datagramIndex)
{
}

void FrameReader::fail(const std::string &what) const
{
    throw ChunkerError(ChunkErrorKind::MalformedFrame,
                       "datagram " + std::to_string(datagram_index_) + ": " + what +
                           " at offset " + std::to_string(frame_start_),
                       datagram_index_, datagram_.size(), frame_start_);
}

std::optional<std::string> FrameReader::next()
{
    while (true)
    {
        std::size_t remaining = datagram_.size() - offset_;
        switch (state_)
        {
        case FrameState::ReadingPrefix:
            if (remaining == 0)
            {
                state_ = FrameState::DatagramExhausted;
                return std::nullopt;
            }
            frame_start_ = offset_;
            if (remaining < FRAME_PREFIX_SIZE)
                fail("truncated length prefix (" + std::to_string(remaining) + " trailing bytes)");
            payload_len_ = read_frame_prefix(datagram_.data() + offset_);
            offset_ += FRAME_PREFIX_SIZE;
            state_ = FrameState::ReadingPayload;
            break;

        case FrameState::ReadingPayload:
        {
            if (payload_len_ > remaining)
            {
                fail("frame claims " + std::to_string(payload_len_) + " payload bytes but only " +
                     std::to_string(remaining) + " remain");
            }
            std::string message(datagram_.substr(offset_, payload_len_));
            offset_ += payload_len_;
            state_ = FrameState::ReadingPrefix;
            return message;
        }

        case FrameState::DatagramExhausted:
            return std::nullopt;
        }
    }
}

DatagramDechunker::DatagramDechunker(const ChunkerConfig &config)
    : config_(config)
{
    config_.validate();
}

std::size_t DatagramDechunker::feed(const std::string &datagram, const MessageSink &sink)
{
    std::size_t index = next_index_++;
    if (datagram.size() > config_.max_datagram_size)
    {
        throw ChunkerError(ChunkErrorKind::OversizedDatagram,
                           "datagram " + std::to_string(index) + " of " + std::to_string(datagram.size()) +
                               " bytes exceeds max_datagram_size " + std::to_string(config_.max_datagram_size),
                           index, datagram.size());
    }

    FrameReader reader(datagram, index);
    std::size_t count = 0;
    while (auto message = reader.next())
    {
        ++count;
        sink(std::move(*message));
    }
    return count;
}

std::size_t dechunk_datagrams(const ChunkerConfig &config, const DatagramSource &source,
                              const MessageSink &sink, ChunkMetrics *metrics)
{
    DatagramDechunker dechunker(config);
    std::size_t produced = 0;
    // Set while the caller's sink runs, so its errors are not blamed on the datagram.
    bool in_sink = false;
    auto deliver = [&](std::string message)
    {
        if (metrics)
            metrics->on_message(message.size());
        ++produced;
        in_sink = true;
        sink(std::move(message));
        in_sink = false;
    };

    while (auto datagram = source())
    {
        try
        {
            dechunker.feed(*datagram, deliver);
        }
        catch (const ChunkerError &e)
        {
            if (metrics)
                metrics->on_error();
            nlohmann::json extra = e.to_json();
            extra["max_datagram_size"] = config.max_datagram_size;
            if (in_sink)
            {
                extra["datagram_index"] = dechunker.datagrams_seen() - 1;
                Logger::log_event(e.log_level(), "sink_error", "Message rejected by sink", extra);
            }
            else
            {
                Logger::log_event(e.log_level(), "dechunk_error", "Datagram rejected by dechunker", extra);
            }
            throw;
        }
        if (metrics)
            metrics->on_datagram(datagram->size());
    }
    return produced;
}

std::vector<std::string> dechunk_all(const std::vector<std::string> &datagrams, const ChunkerConfig &config)
{
    std::vector<std::string> messages;
    std::size_t next = 0;
    dechunk_datagrams(
        config,
        [&]() -> std::optional<std::string>
        {
            if (next == datagrams.size())
                return std::nullopt;
            return datagrams[next++];
        },
        [&](std::string message)
        { messages.push_back(std::move(message)); });
    return messages;
}
