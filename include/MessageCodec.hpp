#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "ChunkerConfig.hpp"
#include "ChunkerError.hpp"
#include "DatagramChunker.hpp"
#include "DatagramDechunker.hpp"

// Typed messages travel as MessagePack payloads. A message type T provides
//   nlohmann::json to_json() const;
//   static T from_json(const nlohmann::json &j);   // throws on missing fields

template <typename T>
std::string encode_message(const T &message)
{
    std::vector<std::uint8_t> packed = nlohmann::json::to_msgpack(message.to_json());
    return std::string(packed.begin(), packed.end());
}

// Throws ChunkerError(CodecFailure) when the payload is not a valid T.
template <typename T>
T decode_message(const std::string &payload)
{
    try
    {
        return T::from_json(nlohmann::json::from_msgpack(payload));
    }
    catch (const nlohmann::json::exception &e)
    {
        throw ChunkerError(ChunkErrorKind::CodecFailure,
                           std::string("cannot decode message payload: ") + e.what(),
                           ChunkerError::npos, payload.size());
    }
}

// Encodes and packs typed messages into datagrams.
template <typename T>
std::vector<std::string> serialize_to_datagrams(const std::vector<T> &messages, const ChunkerConfig &config)
{
    std::vector<std::string> datagrams;
    std::size_t next = 0;
    chunk_messages(
        config,
        [&]() -> std::optional<std::string>
        {
            if (next == messages.size())
                return std::nullopt;
            return encode_message(messages[next++]);
        },
        [&](std::string datagram)
        { datagrams.push_back(std::move(datagram)); });
    return datagrams;
}

// Decodes every message in one datagram.
template <typename T>
std::vector<T> deserialize_datagram(const std::string &datagram, const ChunkerConfig &config)
{
    std::vector<T> messages;
    DatagramDechunker dechunker(config);
    dechunker.feed(datagram, [&](std::string payload)
                   { messages.push_back(decode_message<T>(payload)); });
    return messages;
}

// Decodes a datagram sequence into one ordered message list.
template <typename T>
std::vector<T> deserialize_datagrams(const std::vector<std::string> &datagrams, const ChunkerConfig &config)
{
    std::vector<T> messages;
    std::size_t next = 0;
    dechunk_datagrams(
        config,
        [&]() -> std::optional<std::string>
        {
            if (next == datagrams.size())
                return std::nullopt;
            return datagrams[next++];
        },
        [&](std::string payload)
        { messages.push_back(decode_message<T>(payload)); });
    return messages;
}
