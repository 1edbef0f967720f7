#include "ChunkerConfig.hpp"

#include <cstdlib>
#include <fstream>

#include "ChunkerError.hpp"
#include "Framing.hpp"
#include "utils.hpp"

using json = nlohmann::json;

ChunkerConfig ChunkerConfig::with_max_size(std::size_t max_datagram_size)
{
    ChunkerConfig config;
    config.max_datagram_size = max_datagram_size;
    config.validate();
    return config;
}

void ChunkerConfig::validate() const
{
    if (max_datagram_size <= FRAME_PREFIX_SIZE)
    {
        throw ChunkerError(ChunkErrorKind::InvalidConfiguration,
                           "max_datagram_size " + std::to_string(max_datagram_size) +
                               " cannot hold a " + std::to_string(FRAME_PREFIX_SIZE) + "-byte frame prefix",
                           ChunkerError::npos, max_datagram_size);
    }
    if (max_datagram_size > MAX_DATAGRAM_LIMIT)
    {
        throw ChunkerError(ChunkErrorKind::InvalidConfiguration,
                           "max_datagram_size " + std::to_string(max_datagram_size) +
                               " exceeds the frame length limit of " + std::to_string(MAX_DATAGRAM_LIMIT),
                           ChunkerError::npos, max_datagram_size);
    }
}

std::size_t ChunkerConfig::max_message_size() const
{
    return max_datagram_size - FRAME_PREFIX_SIZE;
}

json ChunkerConfig::to_json() const
{
    return {{"max_datagram_size", max_datagram_size}};
}

void ChunkerConfig::merge_json(const json &j)
{
    if (!j.is_object())
        throw ChunkerError(ChunkErrorKind::InvalidConfiguration, "configuration must be a JSON object");
    if (!j.contains("max_datagram_size"))
        return;

    const auto &value = j["max_datagram_size"];
    if (!value.is_number_unsigned())
        throw ChunkerError(ChunkErrorKind::InvalidConfiguration, "max_datagram_size must be a positive integer");

    ChunkerConfig candidate;
    candidate.max_datagram_size = value.get<std::size_t>();
    candidate.validate();
    max_datagram_size = candidate.max_datagram_size;
}

ChunkerConfig ChunkerConfig::from_json(const json &j)
{
    ChunkerConfig config;
    config.merge_json(j);
    return config;
}

bool ChunkerConfig::loadFromFile(const std::string &filename)
{
    std::ifstream in(filename);
    if (!in.is_open())
        return false;

    json j = json::object();
    if (in.peek() != std::ifstream::traits_type::eof())
    {
        try
        {
            in >> j;
        }
        catch (const json::parse_error &e)
        {
            throw ChunkerError(ChunkErrorKind::InvalidConfiguration,
                               "cannot parse " + filename + ": " + e.what());
        }
    }
    merge_json(j);
    return true;
}

bool ChunkerConfig::apply_env()
{
    const char *raw = std::getenv(ENV_MAX_SIZE);
    if (!raw)
        return false;

    auto size = parseSize(raw);
    if (!size)
    {
        throw ChunkerError(ChunkErrorKind::InvalidConfiguration,
                           std::string(ENV_MAX_SIZE) + " is not a byte count: " + raw);
    }

    ChunkerConfig candidate;
    candidate.max_datagram_size = *size;
    candidate.validate();
    max_datagram_size = *size;
    return true;
}
