#include <gtest/gtest.h>
#include "protocol/frame_codec.hpp"
#include "protocol/message_types.hpp"
#include "system/logger.hpp"

#include <zlib.h>

#include <vector>
#include <string>
#include <random>

using namespace nocturne;
using namespace nocturne::protocol;

class FrameCodecTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::initialize("test_frame_codec.log", Logger::Level::Debug, false);
    }

    void TearDown() override {
        Logger::shutdown();
    }

    std::vector<uint8_t> generatePayload(size_t size, uint32_t seed = 42) {
        std::vector<uint8_t> payload(size);
        std::mt19937 gen(seed);
        std::uniform_int_distribution<int> dist(0, 255);
        for (auto& byte : payload) {
            byte = static_cast<uint8_t>(dist(gen));
        }
        return payload;
    }
};

TEST_F(FrameCodecTest, EncodeDecodeRoundTrip) {
    auto payload = generatePayload(200);
    auto bytes = FrameCodec::encode(message_type::STATE_FULL, payload, 0x1234);

    ASSERT_EQ(bytes.size(), HEADER_SIZE + payload.size());

    FrameError error = FrameError::CrcMismatch;
    auto frame = FrameCodec::decode(bytes, &error);
    ASSERT_TRUE(frame.has_value());
    EXPECT_EQ(error, FrameError::None);
    EXPECT_TRUE(frame->isComplete);
    EXPECT_EQ(frame->header.version, PROTOCOL_VERSION);
    EXPECT_EQ(frame->header.type, message_type::STATE_FULL);
    EXPECT_EQ(frame->header.messageId, 0x1234);
    EXPECT_EQ(frame->header.payloadSize, payload.size());
    EXPECT_EQ(frame->payload, payload);
    EXPECT_EQ(frame->frameSize(), bytes.size());
}

TEST_F(FrameCodecTest, HeaderLayoutIsBigEndian) {
    std::vector<uint8_t> payload = {0x01, 0x02, 0x03};
    auto bytes = FrameCodec::encode(message_type::ALBUM_ART_CHUNK, payload, 0x0102);

    // version in the high nibble, 12-bit type below it
    EXPECT_EQ(bytes[0], 0x23);
    EXPECT_EQ(bytes[1], 0x02);
    EXPECT_EQ(bytes[2], 0x01);
    EXPECT_EQ(bytes[3], 0x02);
    EXPECT_EQ(bytes[4], 0x00);
    EXPECT_EQ(bytes[5], 0x00);
    EXPECT_EQ(bytes[6], 0x00);
    EXPECT_EQ(bytes[7], 0x03);

    uint32_t crc = static_cast<uint32_t>(crc32(crc32(0L, Z_NULL, 0), payload.data(), 3));
    uint32_t carried = (static_cast<uint32_t>(bytes[8]) << 24) | (static_cast<uint32_t>(bytes[9]) << 16) |
                       (static_cast<uint32_t>(bytes[10]) << 8) | bytes[11];
    EXPECT_EQ(carried, crc);

    for (size_t i = 12; i < HEADER_SIZE; ++i) {
        EXPECT_EQ(bytes[i], 0) << "flags/reserved byte " << i;
    }
}

TEST_F(FrameCodecTest, EmptyPayload) {
    auto bytes = FrameCodec::encode(message_type::GET_CAPABILITIES, {});
    ASSERT_EQ(bytes.size(), HEADER_SIZE);

    auto frame = FrameCodec::decode(bytes);
    ASSERT_TRUE(frame.has_value());
    EXPECT_TRUE(frame->isComplete);
    EXPECT_TRUE(frame->payload.empty());
}

TEST_F(FrameCodecTest, AnySinglePayloadByteMutationFailsCrc) {
    auto payload = generatePayload(64, 7);
    auto bytes = FrameCodec::encode(message_type::ALBUM_ART_CHUNK, payload, 3);

    for (size_t i = HEADER_SIZE; i < bytes.size(); ++i) {
        auto corrupted = bytes;
        corrupted[i] ^= 0x5A;

        FrameError error = FrameError::None;
        auto frame = FrameCodec::decode(corrupted, &error);
        EXPECT_FALSE(frame.has_value()) << "mutation at byte " << i;
        EXPECT_EQ(error, FrameError::CrcMismatch);
    }
}

TEST_F(FrameCodecTest, ShortHeaderIsRejected) {
    auto bytes = FrameCodec::encode(message_type::TIME_SYNC, {1, 2, 3});
    bytes.resize(HEADER_SIZE - 1);

    FrameError error = FrameError::None;
    EXPECT_FALSE(FrameCodec::decode(bytes, &error).has_value());
    EXPECT_EQ(error, FrameError::TruncatedHeader);
}

TEST_F(FrameCodecTest, PartialPayloadIsIncomplete) {
    auto payload = generatePayload(100);
    auto bytes = FrameCodec::encode(message_type::ALBUM_ART_CHUNK, payload);
    bytes.resize(HEADER_SIZE + 40);

    auto frame = FrameCodec::decode(bytes);
    ASSERT_TRUE(frame.has_value());
    EXPECT_FALSE(frame->isComplete);
    EXPECT_TRUE(frame->payload.empty());
    EXPECT_EQ(frame->header.payloadSize, 100u);
}

TEST_F(FrameCodecTest, UnsupportedVersionIsRejected) {
    auto bytes = FrameCodec::encode(message_type::STATE_FULL, {9, 9});
    bytes[0] = static_cast<uint8_t>((1 << 4) | (bytes[0] & 0x0F));

    FrameError error = FrameError::None;
    EXPECT_FALSE(FrameCodec::decode(bytes, &error).has_value());
    EXPECT_EQ(error, FrameError::UnsupportedVersion);
}

TEST_F(FrameCodecTest, TypeWiderThanTwelveBitsThrows) {
    EXPECT_THROW(FrameCodec::encode(0x1000, {}), std::invalid_argument);
    EXPECT_NO_THROW(FrameCodec::encode(MAX_MESSAGE_TYPE, {}));
}

TEST_F(FrameCodecTest, MessageTypeNames) {
    EXPECT_STREQ(messageTypeName(message_type::STATE_FULL), "STATE_FULL");
    EXPECT_TRUE(isKnownMessageType(message_type::WEATHER_END));
    EXPECT_FALSE(isKnownMessageType(0x7FF));
    EXPECT_EQ(messageCategory(message_type::CMD_PLAY), MessageCategory::Command);
    EXPECT_EQ(messageCategory(message_type::GRADIENT_COLORS), MessageCategory::Gradient);
    EXPECT_TRUE(isCommandType(message_type::CMD_SEEK_TO));
    EXPECT_FALSE(isCommandType(message_type::STATE_TRACK));
}

// FrameReader

TEST_F(FrameCodecTest, ReaderReassemblesByteAtATime) {
    auto payload = generatePayload(57);
    auto bytes = FrameCodec::encode(message_type::STATE_TRACK, payload, 9);

    FrameReader reader;
    for (size_t i = 0; i + 1 < bytes.size(); ++i) {
        reader.append(&bytes[i], 1);
        EXPECT_FALSE(reader.next().has_value());
    }
    reader.append(&bytes.back(), 1);

    auto frame = reader.next();
    ASSERT_TRUE(frame.has_value());
    EXPECT_EQ(frame->header.type, message_type::STATE_TRACK);
    EXPECT_EQ(frame->payload, payload);
    EXPECT_EQ(reader.buffered(), 0u);
}

TEST_F(FrameCodecTest, ReaderYieldsBackToBackFrames) {
    auto first = FrameCodec::encode(message_type::STATE_ARTIST, {'a', 'b'});
    auto second = FrameCodec::encode(message_type::STATE_ALBUM, {'c'});

    std::vector<uint8_t> stream = first;
    stream.insert(stream.end(), second.begin(), second.end());

    FrameReader reader;
    reader.append(stream);

    auto a = reader.next();
    auto b = reader.next();
    ASSERT_TRUE(a.has_value());
    ASSERT_TRUE(b.has_value());
    EXPECT_EQ(a->header.type, message_type::STATE_ARTIST);
    EXPECT_EQ(b->header.type, message_type::STATE_ALBUM);
    EXPECT_FALSE(reader.next().has_value());
}

TEST_F(FrameCodecTest, ReaderSkipsCorruptFrame) {
    auto corrupt = FrameCodec::encode(message_type::STATE_TRACK, {1, 2, 3, 4});
    corrupt.back() ^= 0xFF;
    auto good = FrameCodec::encode(message_type::STATE_VOLUME, {50});

    FrameReader reader;
    reader.append(corrupt);
    reader.append(good);

    auto frame = reader.next();
    ASSERT_TRUE(frame.has_value());
    EXPECT_EQ(frame->header.type, message_type::STATE_VOLUME);
    EXPECT_EQ(reader.errorCount(), 1u);
    EXPECT_EQ(reader.lastError(), FrameError::CrcMismatch);
}

TEST_F(FrameCodecTest, ReaderResyncsAfterGarbage) {
    auto good = FrameCodec::encode(message_type::STATE_VOLUME, {75});

    std::vector<uint8_t> stream = {0xFF, 0xFF, 0xFF};
    stream.insert(stream.end(), good.begin(), good.end());

    FrameReader reader;
    reader.append(stream);

    auto frame = reader.next();
    ASSERT_TRUE(frame.has_value());
    EXPECT_EQ(frame->payload, std::vector<uint8_t>{75});
    EXPECT_EQ(reader.errorCount(), 3u);
}

TEST_F(FrameCodecTest, ReaderDropsOversizedDeclaration) {
    FrameReader reader(128);
    auto big = FrameCodec::encode(message_type::ALBUM_ART_CHUNK, generatePayload(512));
    reader.append(big);

    EXPECT_FALSE(reader.next().has_value());
    EXPECT_EQ(reader.lastError(), FrameError::Oversized);
    EXPECT_EQ(reader.buffered(), 0u);
}
