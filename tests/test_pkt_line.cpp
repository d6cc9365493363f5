#include <gtest/gtest.h>

#include <string>

#include "test_helpers.h"
#include "pkt_line_utils.h"
#include "errors.h"

TEST(PktLineTest, CreatePktLineCountsThePrefix) {
    EXPECT_EQ(createPktLine(""), "0000");
    EXPECT_EQ(createPktLine("done\n"), "0009done\n");
    EXPECT_EQ(createPktLine("want 4b825dc642cb6eb9a060e54bf8d69288fbee4904\n"),
              "0032want 4b825dc642cb6eb9a060e54bf8d69288fbee4904\n");
}

TEST(PktLineTest, ReadsDataFlushAndEnd) {
    const auto data = toBytes("000ahello\n00000004" "0006ab");
    PktLineReader reader(data);

    auto first = reader.readNextPacket();
    ASSERT_TRUE(first.has_value());
    EXPECT_FALSE(first->is_flush);
    EXPECT_EQ(first->payload, "hello\n");

    auto flush = reader.readNextPacket();
    ASSERT_TRUE(flush.has_value());
    EXPECT_TRUE(flush->is_flush);

    auto empty = reader.readNextPacket();
    ASSERT_TRUE(empty.has_value());
    EXPECT_FALSE(empty->is_flush);
    EXPECT_TRUE(empty->payload.empty());

    auto last = reader.readNextPacket();
    ASSERT_TRUE(last.has_value());
    EXPECT_EQ(last->payload, "ab");

    EXPECT_FALSE(reader.readNextPacket().has_value());
    EXPECT_EQ(reader.position(), data.size());
}

TEST(PktLineTest, RemainingExposesBytesAfterLastPacket) {
    const auto data = toBytes("0008NAK\nPACKrest");
    PktLineReader reader(data);
    ASSERT_TRUE(reader.readNextPacket().has_value());
    EXPECT_EQ(toString(reader.remaining()), "PACKrest");
}

TEST(PktLineTest, AcceptsUppercaseHexLength) {
    const std::string payload(0x1A - 4, 'x');
    const auto data = toBytes("001A" + payload);
    PktLineReader reader(data);
    auto packet = reader.readNextPacket();
    ASSERT_TRUE(packet.has_value());
    EXPECT_EQ(packet->payload, payload);
}

TEST(PktLineTest, MalformedLengthsAreProtocolErrors) {
    for (std::string bad : {"zzzzhello", "0002", "0003x", "00", "fff0"}) {
        const auto data = toBytes(bad);
        PktLineReader reader(data);
        EXPECT_THROW(reader.readNextPacket(), ProtocolError) << bad;
    }
}

TEST(PktLineTest, PacketRunningPastTheEndIsAProtocolError) {
    const auto data = toBytes("0010short");
    PktLineReader reader(data);
    EXPECT_THROW(reader.readNextPacket(), ProtocolError);
}

TEST(PktLineTest, ChompLineDropsOneNewline) {
    EXPECT_EQ(chompLine("NAK\n"), "NAK");
    EXPECT_EQ(chompLine("NAK"), "NAK");
    EXPECT_EQ(chompLine("a\n\n"), "a\n");
}
