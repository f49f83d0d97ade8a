#include "onionchat/handshake_messages.hpp"

#include <arpa/inet.h>

#include "onionchat/crypto.hpp"
#include "onionchat/errors.hpp"

namespace OnionChat {

namespace {

constexpr Payload::OpCode HELLO_CODE = 0x4801;
constexpr Payload::OpCode SIGNED_HELLO_CODE = 0x4802;
constexpr size_t MAX_OFFERED_VERSIONS = 16;

byte_vector encode_versions(const std::vector<Version>& versions) {
    byte_vector buffer;
    for (const auto& version : versions) {
        uint16_t be_version = htons(version);
        buffer.insert(buffer.end(), reinterpret_cast<uint8_t*>(&be_version), reinterpret_cast<uint8_t*>(&be_version) + sizeof(be_version));
    }
    return buffer;
}

std::vector<Version> decode_versions(const byte_vector& data) {
    if (data.empty() || data.size() % sizeof(Version) != 0 || data.size() / sizeof(Version) > MAX_OFFERED_VERSIONS) {
        throw HandshakeError("Invalid hello: bad version list.");
    }
    std::vector<Version> versions;
    for (size_t offset = 0; offset < data.size(); offset += sizeof(Version)) {
        versions.push_back(static_cast<Version>((data[offset] << 8) | data[offset + 1]));
    }
    return versions;
}

} // namespace

byte_vector HandshakeHello::serialize() const {
    return PayloadBuilder(HELLO_CODE)
        .add_param(encode_versions(supported_versions))
        .add_param(ephemeral_pk.data)
        .add_param(identity_pk.data)
        .add_param(recipient)
        .add_param(timestamp)
        .add_param(answered_pk.data)
        .add_param(signature.data)
        .build()
        .serialize();
}

HandshakeHello HandshakeHello::deserialize(const byte_vector& data) {
    HandshakeHello hello;
    try {
        Payload payload = Payload::deserialize(data);
        if (payload.op_code != HELLO_CODE) {
            throw HandshakeError("Invalid hello: unexpected record type.");
        }
        PayloadReader reader(payload);
        hello.supported_versions = decode_versions(reader.read_param<byte_vector>());
        hello.ephemeral_pk.data = reader.read_param<byte_vector>();
        hello.identity_pk.data = reader.read_param<byte_vector>();
        hello.recipient = reader.read_param<std::string>();
        hello.timestamp = reader.read_param<int64_t>();
        hello.answered_pk.data = reader.read_param<byte_vector>();
        hello.signature.data = reader.read_param<byte_vector>();
    } catch (const MalformedMessage& e) {
        throw HandshakeError(std::string("Invalid hello: ") + e.what());
    }

    if (hello.ephemeral_pk.data.size() != KX_KEY_BYTES) {
        throw HandshakeError("Invalid hello: ephemeral key has the wrong size.");
    }
    if (hello.identity_pk.data.size() != SIGN_PUBLIC_KEY_BYTES) {
        throw HandshakeError("Invalid hello: identity key has the wrong size.");
    }
    if (!hello.answered_pk.data.empty() && hello.answered_pk.data.size() != KX_KEY_BYTES) {
        throw HandshakeError("Invalid hello: answered key has the wrong size.");
    }
    if (hello.signature.data.size() != SIGNATURE_BYTES) {
        throw HandshakeError("Invalid hello: signature has the wrong size.");
    }
    if (hello.recipient.empty()) {
        throw HandshakeError("Invalid hello: missing recipient.");
    }
    return hello;
}

byte_vector HandshakeHello::signed_bytes(const std::string& sender) const {
    return PayloadBuilder(SIGNED_HELLO_CODE)
        .add_param(HANDSHAKE_SIGN_CONTEXT)
        .add_param(encode_versions(supported_versions))
        .add_param(ephemeral_pk.data)
        .add_param(identity_pk.data)
        .add_param(sender)
        .add_param(recipient)
        .add_param(timestamp)
        .add_param(answered_pk.data)
        .build()
        .serialize();
}

} // namespace OnionChat
