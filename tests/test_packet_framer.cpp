#include <gtest/gtest.h>
#include "packet_framer.h"
#include <string>
#include <vector>

using namespace xtrans;

TEST(PacketFramerTest, HeaderLayout) {
    std::vector<uint8_t> payload = {0xDE, 0xAD, 0xBE, 0xEF};
    std::vector<uint8_t> frame = PacketFramer::encode("abc", 0x01020304, payload);

    ASSERT_EQ(frame.size(), PACKET_HEADER_SIZE + payload.size());
    EXPECT_EQ(PACKET_HEADER_SIZE, 44u);

    // Magic "BDTL"
    EXPECT_EQ(frame[0], 0x42);
    EXPECT_EQ(frame[1], 0x44);
    EXPECT_EQ(frame[2], 0x54);
    EXPECT_EQ(frame[3], 0x4C);

    // File id, null padded
    EXPECT_EQ(frame[4], 'a');
    EXPECT_EQ(frame[5], 'b');
    EXPECT_EQ(frame[6], 'c');
    for (size_t i = 7; i < 40; ++i) {
        EXPECT_EQ(frame[i], 0) << "padding byte " << i;
    }

    // Chunk index, big-endian
    EXPECT_EQ(frame[40], 0x01);
    EXPECT_EQ(frame[41], 0x02);
    EXPECT_EQ(frame[42], 0x03);
    EXPECT_EQ(frame[43], 0x04);

    EXPECT_EQ(frame[44], 0xDE);
    EXPECT_EQ(frame[47], 0xEF);
}

TEST(PacketFramerTest, DecodeRecoversFields) {
    std::string file_id = "123e4567-e89b-12d3-a456-426614174000";
    ASSERT_EQ(file_id.size(), 36u);

    std::vector<uint8_t> payload(1000);
    for (size_t i = 0; i < payload.size(); ++i) {
        payload[i] = static_cast<uint8_t>(i);
    }

    auto frame = PacketFramer::decode(PacketFramer::encode(file_id, 7, payload));

    ASSERT_TRUE(frame.has_value());
    EXPECT_EQ(frame->file_id, file_id);
    EXPECT_EQ(frame->chunk_index, 7u);
    EXPECT_EQ(frame->payload, payload);
}

TEST(PacketFramerTest, EmptyPayload) {
    std::vector<uint8_t> encoded = PacketFramer::encode("f1", 0, std::vector<uint8_t>());
    EXPECT_EQ(encoded.size(), PACKET_HEADER_SIZE);

    auto frame = PacketFramer::decode(encoded);
    ASSERT_TRUE(frame.has_value());
    EXPECT_EQ(frame->file_id, "f1");
    EXPECT_TRUE(frame->payload.empty());
}

TEST(PacketFramerTest, RejectsOversizedFileId) {
    XtransError error;
    std::vector<uint8_t> frame = PacketFramer::encode(std::string(37, 'x'), 0, std::vector<uint8_t>{1}, &error);

    EXPECT_TRUE(frame.empty());
    EXPECT_EQ(error.code, XtransErrorCode::INVALID_FILE_ID);
}

TEST(PacketFramerTest, DecodeRejectsShortBuffer) {
    std::vector<uint8_t> frame = PacketFramer::encode("f1", 1, std::vector<uint8_t>{1, 2, 3});
    frame.resize(PACKET_HEADER_SIZE - 1);

    EXPECT_FALSE(PacketFramer::decode(frame).has_value());
    EXPECT_FALSE(PacketFramer::decode(nullptr, 0).has_value());
}

TEST(PacketFramerTest, DecodeRejectsWrongMagic) {
    std::vector<uint8_t> frame = PacketFramer::encode("f1", 1, std::vector<uint8_t>{1, 2, 3});
    frame[0] = 0x00;

    EXPECT_FALSE(PacketFramer::is_chunk_frame(frame.data(), frame.size()));
    EXPECT_FALSE(PacketFramer::decode(frame).has_value());
}

TEST(PacketFramerTest, IsChunkFrame) {
    std::vector<uint8_t> frame = PacketFramer::encode("f1", 1, std::vector<uint8_t>{9});
    EXPECT_TRUE(PacketFramer::is_chunk_frame(frame.data(), frame.size()));

    std::vector<uint8_t> text = {'{', '"', 't', '"', '}'};
    EXPECT_FALSE(PacketFramer::is_chunk_frame(text.data(), text.size()));
}
