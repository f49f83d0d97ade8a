#include "onionchat/message.hpp"

#include <chrono>

#include "onionchat/crypto.hpp"
#include "onionchat/errors.hpp"

namespace OnionChat {

    namespace {
        constexpr Payload::OpCode FILE_METADATA_CODE = 0x4601;
        constexpr size_t MESSAGE_ID_BYTES = 16;

        bool is_known_type(Payload::OpCode code) {
            switch (static_cast<MessageType>(code)) {
                case MessageType::TEXT:
                case MessageType::FILE_METADATA:
                case MessageType::HANDSHAKE:
                case MessageType::KEEPALIVE:
                case MessageType::DISCONNECT:
                    return true;
            }
            return false;
        }

        PayloadBuilder header_builder(const WireMessage& msg) {
            PayloadBuilder builder(static_cast<Payload::OpCode>(msg.type));
            builder.add_param(msg.id)
                .add_param(msg.sender)
                .add_param(msg.timestamp)
                .add_param(msg.sequence);
            return builder;
        }
    }

    const char* to_string(MessageType type) {
        switch (type) {
            case MessageType::TEXT: return "text";
            case MessageType::FILE_METADATA: return "file";
            case MessageType::HANDSHAKE: return "handshake";
            case MessageType::KEEPALIVE: return "keepalive";
            case MessageType::DISCONNECT: return "disconnect";
        }
        return "unknown";
    }

    int64_t unix_time_now() {
        return std::chrono::duration_cast<std::chrono::seconds>(
                   std::chrono::system_clock::now().time_since_epoch())
            .count();
    }

    // --- WireMessage ---

    byte_vector WireMessage::serialize() const {
        return header_builder(*this).add_param(content).build().serialize();
    }

    WireMessage WireMessage::deserialize(const byte_vector& data) {
        Payload payload = Payload::deserialize(data);
        if (!is_known_type(payload.op_code)) {
            throw MalformedMessage("Unknown message type: " + std::to_string(payload.op_code));
        }

        WireMessage msg;
        msg.type = static_cast<MessageType>(payload.op_code);

        PayloadReader reader(payload);
        msg.id = reader.read_param<std::string>();
        msg.sender = reader.read_param<std::string>();
        msg.timestamp = reader.read_param<int64_t>();
        msg.sequence = reader.read_param<uint64_t>();
        msg.content = reader.read_param<byte_vector>();

        if (msg.id.empty() || msg.id.size() > MAX_MESSAGE_ID_CHARS) {
            throw MalformedMessage("Message id is empty or too long.");
        }
        if (msg.sender.empty() || msg.sender.size() > MAX_SENDER_CHARS) {
            throw MalformedMessage("Message sender is empty or too long.");
        }
        return msg;
    }

    byte_vector WireMessage::header_bytes() const {
        return header_builder(*this).build().serialize();
    }

    std::string WireMessage::new_id() {
        return Crypto::to_hex(Crypto::random_bytes(MESSAGE_ID_BYTES));
    }

    // --- FileMetadata ---

    byte_vector FileMetadata::serialize() const {
        return PayloadBuilder(FILE_METADATA_CODE)
            .add_param(name)
            .add_param(size)
            .add_param(mime_type)
            .build()
            .serialize();
    }

    FileMetadata FileMetadata::deserialize(const byte_vector& data) {
        Payload payload = Payload::deserialize(data);
        if (payload.op_code != FILE_METADATA_CODE) {
            throw MalformedMessage("Not a file metadata record.");
        }
        PayloadReader reader(payload);
        FileMetadata meta;
        meta.name = reader.read_param<std::string>();
        meta.size = reader.read_param<uint64_t>();
        meta.mime_type = reader.read_param<std::string>();
        if (meta.name.empty()) {
            throw MalformedMessage("File metadata without a name.");
        }
        return meta;
    }

} // namespace OnionChat
