#ifndef ONIONCHAT_MESSAGE_HPP
#define ONIONCHAT_MESSAGE_HPP

#include <cstdint>
#include <string>

#include "keys.hpp"
#include "packet.hpp"

namespace OnionChat {

    /**
     * @brief Wire message types. The value doubles as the payload op code.
     */
    enum class MessageType : Payload::OpCode {
        TEXT = 0x0001,
        FILE_METADATA = 0x0002,
        HANDSHAKE = 0x0003,
        KEEPALIVE = 0x0004,
        DISCONNECT = 0x0005
    };

    // "text", "file", "handshake", "keepalive", "disconnect"
    const char* to_string(MessageType type);

    // Maximum length of a message id on the wire (hex of 16 random bytes is 32).
    constexpr size_t MAX_MESSAGE_ID_CHARS = 64;
    // Longest sender accepted; a v3 address with its suffix is 62 characters.
    constexpr size_t MAX_SENDER_CHARS = 62;

    /**
     * @brief The unit exchanged between two peers.
     *
     * Encoded as a Payload: op code = type, then the parameters
     * [id] [sender] [timestamp] [sequence] [content]. Parameters after the
     * content are ignored so later versions can append fields.
     */
    struct WireMessage {
        std::string id;
        MessageType type = MessageType::TEXT;
        std::string sender;
        byte_vector content;     // ciphertext, or the clear hello for HANDSHAKE
        int64_t timestamp = 0;   // unix seconds
        uint64_t sequence = 0;

        byte_vector serialize() const;

        /**
         * @throws MalformedMessage on an unknown type or a missing or mistyped field.
         */
        static WireMessage deserialize(const byte_vector& data);

        /**
         * @brief Every field except the content, in wire order.
         *
         * Sealed messages authenticate these bytes as AAD, so a relay cannot
         * move a ciphertext under another id, type, sender or sequence.
         */
        byte_vector header_bytes() const;

        // 16 random bytes, hex encoded.
        static std::string new_id();
    };

    /**
     * @brief Description of a file offered to the peer; the body of FILE_METADATA messages.
     */
    struct FileMetadata {
        std::string name;
        uint64_t size = 0;
        std::string mime_type;

        byte_vector serialize() const;

        /**
         * @throws MalformedMessage
         */
        static FileMetadata deserialize(const byte_vector& data);
    };

    int64_t unix_time_now();

} // namespace OnionChat

#endif // ONIONCHAT_MESSAGE_HPP
