#include <gtest/gtest.h>
#include <optional>
#include <random>
#include <string>
#include <vector>

#include "ChunkerConfig.hpp"
#include "ChunkerError.hpp"
#include "DatagramChunker.hpp"
#include "Framing.hpp"
#include "Metrics.hpp"

namespace
{
    // Walks a datagram frame by frame; fails the test if a frame runs past the end.
    std::vector<std::string> split_frames(const std::string &datagram)
    {
        std::vector<std::string> out;
        std::size_t offset = 0;
        while (offset < datagram.size())
        {
            EXPECT_LE(offset + FRAME_PREFIX_SIZE, datagram.size());
            std::size_t len = read_frame_prefix(datagram.data() + offset);
            offset += FRAME_PREFIX_SIZE;
            EXPECT_LE(offset + len, datagram.size());
            out.push_back(datagram.substr(offset, len));
            offset += len;
        }
        return out;
    }

    MessageSource vector_source(const std::vector<std::string> &messages, std::size_t &pulled)
    {
        return [&messages, &pulled]() -> std::optional<std::string>
        {
            if (pulled == messages.size())
                return std::nullopt;
            return messages[pulled++];
        };
    }
}

TEST(DatagramChunkerTest, PacksScenarioIntoTwoDatagrams)
{
    // Frames of 4 and 5 bytes share a 10-byte datagram; the 3-byte frame needs a new one.
    auto datagrams = chunk_all({"AB", "CDE", "F"}, ChunkerConfig::with_max_size(10));
    ASSERT_EQ(datagrams.size(), 2u);
    EXPECT_EQ(datagrams[0], std::string("\x00\x02" "AB" "\x00\x03" "CDE", 9));
    EXPECT_EQ(datagrams[1], std::string("\x00\x01" "F", 3));
}

TEST(DatagramChunkerTest, EmptyInputYieldsNoDatagrams)
{
    EXPECT_TRUE(chunk_all({}, ChunkerConfig::with_max_size(10)).empty());

    DatagramChunker chunker(ChunkerConfig::with_max_size(10));
    EXPECT_FALSE(chunker.finish().has_value());
}

TEST(DatagramChunkerTest, MessageAtLimitFillsWholeDatagram)
{
    // A payload of max_datagram_size - prefix bytes fits exactly.
    auto datagrams = chunk_all({std::string(8, 'x'), std::string(8, 'y')}, ChunkerConfig::with_max_size(10));
    ASSERT_EQ(datagrams.size(), 2u);
    EXPECT_EQ(datagrams[0].size(), 10u);
    EXPECT_EQ(datagrams[1].size(), 10u);
}

TEST(DatagramChunkerTest, RejectsMessageOneByteOverLimit)
{
    // Verifies MessageTooLarge carries the offending message index and size.
    DatagramChunker chunker(ChunkerConfig::with_max_size(10));
    ASSERT_FALSE(chunker.push("AB").has_value());
    try
    {
        chunker.push(std::string(9, 'x'));
        FAIL() << "expected MessageTooLarge";
    }
    catch (const ChunkerError &e)
    {
        EXPECT_EQ(e.kind(), ChunkErrorKind::MessageTooLarge);
        EXPECT_EQ(e.index(), 1u);
        EXPECT_EQ(e.size(), 9u);
    }
}

TEST(DatagramChunkerTest, RejectedPushLeavesPendingDatagramIntact)
{
    // After a rejected message the chunker keeps packing as if it was never offered.
    DatagramChunker chunker(ChunkerConfig::with_max_size(10));
    ASSERT_FALSE(chunker.push("AB").has_value());
    EXPECT_THROW(chunker.push(std::string(20, 'x')), ChunkerError);
    EXPECT_EQ(chunker.pending_bytes(), 4u);
    ASSERT_FALSE(chunker.push("C").has_value());
    EXPECT_EQ(chunker.messages_seen(), 3u);

    auto last = chunker.finish();
    ASSERT_TRUE(last.has_value());
    EXPECT_EQ(*last, std::string("\x00\x02" "AB" "\x00\x01" "C", 7));
    EXPECT_EQ(chunker.pending_bytes(), 0u);
}

TEST(DatagramChunkerTest, InvalidConfigurationFailsConstruction)
{
    ChunkerConfig tiny;
    tiny.max_datagram_size = FRAME_PREFIX_SIZE;
    try
    {
        DatagramChunker chunker(tiny);
        FAIL() << "expected InvalidConfiguration";
    }
    catch (const ChunkerError &e)
    {
        EXPECT_EQ(e.kind(), ChunkErrorKind::InvalidConfiguration);
        EXPECT_EQ(e.size(), FRAME_PREFIX_SIZE);
    }

    ChunkerConfig huge;
    huge.max_datagram_size = MAX_DATAGRAM_LIMIT + 1;
    EXPECT_THROW(DatagramChunker{huge}, ChunkerError);
}

TEST(DatagramChunkerTest, SmallestConfigurationCarriesOneBytePayloads)
{
    auto datagrams = chunk_all({"a", "b"}, ChunkerConfig::with_max_size(FRAME_PREFIX_SIZE + 1));
    ASSERT_EQ(datagrams.size(), 2u);
    EXPECT_EQ(datagrams[0], std::string("\x00\x01" "a", 3));
}

TEST(DatagramChunkerTest, EmptyMessagesAreFramed)
{
    // Zero-length messages still occupy a prefix and are packed like any other frame.
    auto datagrams = chunk_all({"", "", ""}, ChunkerConfig::with_max_size(4));
    ASSERT_EQ(datagrams.size(), 2u);
    EXPECT_EQ(datagrams[0], std::string("\x00\x00\x00\x00", 4));
    EXPECT_EQ(datagrams[1], std::string("\x00\x00", 2));
}

TEST(DatagramChunkerTest, RandomStreamsRespectBoundAndNeverSplitFrames)
{
    // Packs pseudo-random message lengths and checks every frame sits inside one datagram.
    std::mt19937 rng(1234);
    for (std::size_t max_size : {3u, 7u, 64u, 1200u})
    {
        auto config = ChunkerConfig::with_max_size(max_size);
        std::uniform_int_distribution<std::size_t> len_dist(0, config.max_message_size());
        std::vector<std::string> messages;
        for (int i = 0; i < 200; ++i)
        {
            std::string m(len_dist(rng), '\0');
            for (auto &ch : m)
                ch = static_cast<char>(rng() & 0xff);
            messages.push_back(std::move(m));
        }

        auto datagrams = chunk_all(messages, config);
        std::vector<std::string> recovered;
        for (const auto &d : datagrams)
        {
            EXPECT_LE(d.size(), max_size);
            EXPECT_FALSE(d.empty());
            for (auto &m : split_frames(d))
                recovered.push_back(std::move(m));
        }
        EXPECT_EQ(recovered, messages) << "max_size=" << max_size;
    }
}

TEST(ChunkMessagesTest, EmitsDatagramsBeforeInputIsExhausted)
{
    // Each 6-byte message fills its own 10-byte datagram, so the first datagram
    // must be delivered when the second message is pulled.
    std::vector<std::string> messages(4, "123456");
    std::size_t pulled = 0;
    std::vector<std::size_t> pulled_at_emit;
    auto count = chunk_messages(ChunkerConfig::with_max_size(10), vector_source(messages, pulled),
                                [&](std::string)
                                { pulled_at_emit.push_back(pulled); });
    EXPECT_EQ(count, 4u);
    ASSERT_EQ(pulled_at_emit.size(), 4u);
    EXPECT_EQ(pulled_at_emit[0], 2u);
    EXPECT_EQ(pulled_at_emit[3], 4u);
}

TEST(ChunkMessagesTest, FlushesPriorProgressThenFails)
{
    // Earlier messages are delivered, including the partially filled datagram,
    // before MessageTooLarge surfaces; nothing of the oversized message is emitted.
    std::vector<std::string> messages = {"AB", "CDE", "F", std::string(9, '!'), "G"};
    std::size_t pulled = 0;
    std::vector<std::string> datagrams;
    ChunkMetrics metrics;
    try
    {
        chunk_messages(ChunkerConfig::with_max_size(10), vector_source(messages, pulled),
                       [&](std::string d)
                       { datagrams.push_back(std::move(d)); },
                       &metrics);
        FAIL() << "expected MessageTooLarge";
    }
    catch (const ChunkerError &e)
    {
        EXPECT_EQ(e.kind(), ChunkErrorKind::MessageTooLarge);
        EXPECT_EQ(e.index(), 3u);
        EXPECT_EQ(e.size(), 9u);
    }
    EXPECT_EQ(pulled, 4u);
    ASSERT_EQ(datagrams.size(), 2u);
    EXPECT_EQ(split_frames(datagrams[0]), (std::vector<std::string>{"AB", "CDE"}));
    EXPECT_EQ(split_frames(datagrams[1]), (std::vector<std::string>{"F"}));
    EXPECT_EQ(metrics.messages(), 3u);
    EXPECT_EQ(metrics.datagrams(), 2u);
    EXPECT_EQ(metrics.errors(), 1u);
}

TEST(ChunkMessagesTest, RecordsMetrics)
{
    std::vector<std::string> messages = {"AB", "CDE", "F"};
    std::size_t pulled = 0;
    ChunkMetrics metrics;
    chunk_messages(ChunkerConfig::with_max_size(10), vector_source(messages, pulled),
                   [](std::string) {}, &metrics);
    EXPECT_EQ(metrics.messages(), 3u);
    EXPECT_EQ(metrics.datagrams(), 2u);
    EXPECT_EQ(metrics.payload_bytes(), 6u);
    EXPECT_EQ(metrics.wire_bytes(), 12u);
    EXPECT_EQ(metrics.errors(), 0u);
}
