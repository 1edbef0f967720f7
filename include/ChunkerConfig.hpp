#pragma once

#include <cstddef>
#include <string>

#include <nlohmann/json.hpp>

// Session-wide datagram limit shared by the encoder and decoder.
struct ChunkerConfig
{
    static constexpr std::size_t DEFAULT_MAX_DATAGRAM_SIZE = 1200;
    static constexpr const char *ENV_MAX_SIZE = "DATAGRAM_CHUNKER_MAX_SIZE";

    std::size_t max_datagram_size = DEFAULT_MAX_DATAGRAM_SIZE;

    // Builds a validated configuration; throws ChunkerError on a bad size.
    static ChunkerConfig with_max_size(std::size_t max_datagram_size);

    // Throws ChunkerError(InvalidConfiguration) unless the size lies in
    // (FRAME_PREFIX_SIZE, MAX_DATAGRAM_LIMIT].
    void validate() const;

    // Largest message payload that fits alone in one datagram.
    std::size_t max_message_size() const;

    nlohmann::json to_json() const;
    // Reads "max_datagram_size"; a missing key keeps the current value.
    void merge_json(const nlohmann::json &j);
    static ChunkerConfig from_json(const nlohmann::json &j);

    // Merges a JSON config file; returns false if the file cannot be opened.
    // Throws ChunkerError when the file does not hold a valid configuration.
    bool loadFromFile(const std::string &filename);

    // Applies DATAGRAM_CHUNKER_MAX_SIZE when set; returns true if it was applied.
    bool apply_env();
};
