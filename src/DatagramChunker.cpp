#include "DatagramChunker.hpp"

#include "ChunkerError.hpp"
#include "Framing.hpp"
#include "Logging.hpp"
#include "Metrics.hpp"

DatagramChunker::DatagramChunker(const ChunkerConfig &config)
    : config_(config)
{
    config_.validate();
    current_.reserve(config_.max_datagram_size);
}

std::optional<std::string> DatagramChunker::push(const std::string &message)
{
    std::size_t index = next_index_++;
    std::size_t needed = frame_size(message.size());
    if (needed > config_.max_datagram_size)
    {
        throw ChunkerError(ChunkErrorKind::MessageTooLarge,
                           "message " + std::to_string(index) + " of " + std::to_string(message.size()) +
                               " bytes exceeds the " + std::to_string(config_.max_message_size()) + "-byte message limit",
                           index, message.size());
    }

    std::optional<std::string> completed;
    if (!current_.empty() && current_.size() + needed > config_.max_datagram_size)
    {
        completed = std::move(current_);
        current_.clear();
        current_.reserve(config_.max_datagram_size);
    }
    append_frame(current_, message);
    return completed;
}

std::optional<std::string> DatagramChunker::finish()
{
    if (current_.empty())
        return std::nullopt;
    std::string last = std::move(current_);
    current_.clear();
    return last;
}

std::size_t chunk_messages(const ChunkerConfig &config, const MessageSource &source,
                           const DatagramSink &sink, ChunkMetrics *metrics)
{
    DatagramChunker chunker(config);
    std::size_t emitted = 0;
    auto emit = [&](std::string datagram)
    {
        if (metrics)
            metrics->on_datagram(datagram.size());
        ++emitted;
        sink(std::move(datagram));
    };

    while (auto message = source())
    {
        std::optional<std::string> completed;
        try
        {
            completed = chunker.push(*message);
        }
        catch (const ChunkerError &e)
        {
            if (metrics)
                metrics->on_error();
            nlohmann::json extra = e.to_json();
            extra["max_datagram_size"] = config.max_datagram_size;
            Logger::log_event(e.log_level(), "chunk_error", "Message rejected by chunker", extra);

            // Earlier messages stay deliverable.
            if (auto tail = chunker.finish())
                emit(std::move(*tail));
            throw;
        }

        if (metrics)
            metrics->on_message(message->size());
        if (completed)
            emit(std::move(*completed));
    }

    if (auto tail = chunker.finish())
        emit(std::move(*tail));
    return emitted;
}

std::vector<std::string> chunk_all(const std::vector<std::string> &messages, const ChunkerConfig &config)
{
    std::vector<std::string> datagrams;
    std::size_t next = 0;
    chunk_messages(
        config,
        [&]() -> std::optional<std::string>
        {
            if (next == messages.size())
                return std::nullopt;
            return messages[next++];
        },
        [&](std::string datagram)
        { datagrams.push_back(std::move(datagram)); });
    return datagrams;
}
