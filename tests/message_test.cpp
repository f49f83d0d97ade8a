#include <gtest/gtest.h>

#include <string>

#include "onionchat/crypto.hpp"
#include "onionchat/errors.hpp"
#include "onionchat/message.hpp"

using namespace OnionChat;

namespace {

WireMessage sample_message() {
    WireMessage msg;
    msg.id = WireMessage::new_id();
    msg.type = MessageType::TEXT;
    msg.sender = "duckduckgogg42xjoc72x3sjasowoarfbgcmvfimaftt6twagswzczad.onion";
    msg.content = {0x10, 0x20, 0x30};
    msg.timestamp = 1700000000;
    msg.sequence = 42;
    return msg;
}

} // namespace

TEST(MessageTest, SerializeDeserialize) {
    ASSERT_EQ(Crypto::init(), 0);

    WireMessage original = sample_message();
    WireMessage parsed = WireMessage::deserialize(original.serialize());

    ASSERT_EQ(parsed.id, original.id);
    ASSERT_EQ(parsed.type, original.type);
    ASSERT_EQ(parsed.sender, original.sender);
    ASSERT_EQ(parsed.content, original.content);
    ASSERT_EQ(parsed.timestamp, original.timestamp);
    ASSERT_EQ(parsed.sequence, original.sequence);
}

TEST(MessageTest, IdsAreRandomHex) {
    ASSERT_EQ(Crypto::init(), 0);

    std::string a = WireMessage::new_id();
    std::string b = WireMessage::new_id();
    ASSERT_EQ(a.size(), 32u);
    ASSERT_NE(a, b);
    ASSERT_EQ(a.find_first_not_of("0123456789abcdef"), std::string::npos);
}

TEST(MessageTest, HeaderExcludesContent) {
    ASSERT_EQ(Crypto::init(), 0);

    WireMessage msg = sample_message();
    byte_vector header = msg.header_bytes();
    msg.content = {0x99};
    ASSERT_EQ(header, msg.header_bytes());

    msg.sequence += 1;
    ASSERT_NE(header, msg.header_bytes());
}

TEST(MessageTest, RejectsUnknownTypeAndMissingFields) {
    ASSERT_EQ(Crypto::init(), 0);

    byte_vector bytes = sample_message().serialize();
    bytes[0] = 0x7f;  // op code high byte
    ASSERT_THROW(WireMessage::deserialize(bytes), MalformedMessage);

    byte_vector truncated = sample_message().serialize();
    truncated.resize(truncated.size() - 5);
    ASSERT_THROW(WireMessage::deserialize(truncated), MalformedMessage);

    WireMessage no_sender = sample_message();
    no_sender.sender.clear();
    ASSERT_THROW(WireMessage::deserialize(no_sender.serialize()), MalformedMessage);

    WireMessage long_id = sample_message();
    long_id.id = std::string(MAX_MESSAGE_ID_CHARS + 1, 'a');
    ASSERT_THROW(WireMessage::deserialize(long_id.serialize()), MalformedMessage);
}

TEST(MessageTest, FileMetadata) {
    FileMetadata meta;
    meta.name = "report.pdf";
    meta.size = 123456;
    meta.mime_type = "application/pdf";

    FileMetadata parsed = FileMetadata::deserialize(meta.serialize());
    ASSERT_EQ(parsed.name, meta.name);
    ASSERT_EQ(parsed.size, meta.size);
    ASSERT_EQ(parsed.mime_type, meta.mime_type);

    FileMetadata unnamed = meta;
    unnamed.name.clear();
    ASSERT_THROW(FileMetadata::deserialize(unnamed.serialize()), MalformedMessage);
    ASSERT_THROW(FileMetadata::deserialize(sample_message().serialize()), MalformedMessage);
}

TEST(MessageTest, TypeNames) {
    ASSERT_STREQ(to_string(MessageType::TEXT), "text");
    ASSERT_STREQ(to_string(MessageType::FILE_METADATA), "file");
    ASSERT_STREQ(to_string(MessageType::HANDSHAKE), "handshake");
    ASSERT_STREQ(to_string(MessageType::KEEPALIVE), "keepalive");
    ASSERT_STREQ(to_string(MessageType::DISCONNECT), "disconnect");
}
