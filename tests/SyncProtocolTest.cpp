#include <gtest/gtest.h>

#include "rooms/SyncProtocol.h"

using namespace collabgate;
using namespace collabgate::rooms;

TEST(SyncProtocolTest, FramesStartWithTypeAndSubType) {
    const auto step1 = create_sync_step1("sv");
    ASSERT_EQ(step1.size(), 5u);
    EXPECT_EQ(step1[0], 0);
    EXPECT_EQ(step1[1], 0);
    EXPECT_EQ(step1[2], 2);
    EXPECT_EQ(step1.substr(3), "sv");

    EXPECT_EQ(create_sync_step2("u")[1], 1);
    EXPECT_EQ(create_update_message("u")[1], 2);

    const auto awareness = create_awareness_message("abc");
    EXPECT_EQ(awareness[0], 1);
    EXPECT_EQ(awareness[1], 3);
}

TEST(SyncProtocolTest, ParseRecoversTypeAndPayload) {
    const auto msg = parse_sync_message(create_update_message("payload"));
    EXPECT_EQ(msg.type, SyncMessageType::Update);
    EXPECT_EQ(msg.payload, "payload");

    EXPECT_EQ(parse_awareness_message(create_awareness_message("states")), "states");
}

TEST(SyncProtocolTest, MessageTypeOfUnknownOrEmptyFrame) {
    EXPECT_EQ(message_type(""), std::nullopt);
    EXPECT_EQ(message_type(std::string("\x07", 1)), std::nullopt);
    EXPECT_EQ(message_type(create_sync_step1("")), MessageType::Sync);
    EXPECT_EQ(message_type(create_awareness_message("")), MessageType::Awareness);
}

TEST(SyncProtocolTest, MalformedFramesThrow) {
    EXPECT_THROW(parse_sync_message(std::string("\x00", 1)), crdt::DecodeError);
    EXPECT_THROW(parse_sync_message(std::string("\x00\x09\x00", 3)), crdt::DecodeError);
    EXPECT_THROW(parse_sync_message(std::string("\x00\x02\x05" "ab", 5)), crdt::DecodeError);
    EXPECT_THROW(parse_awareness_message(create_sync_step1("x")), crdt::DecodeError);
}
