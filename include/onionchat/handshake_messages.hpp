#ifndef ONIONCHAT_HANDSHAKE_MESSAGES_HPP
#define ONIONCHAT_HANDSHAKE_MESSAGES_HPP

#include <cstdint>
#include <string>
#include <vector>

#include "keys.hpp"
#include "packet.hpp"
#include "version.hpp"

namespace OnionChat {

    /**
     * @brief Content of a HANDSHAKE wire message, sent in the clear.
     *
     * The initiator lists every version it supports; the responder answers
     * with exactly the version it selected and echoes the initiator's
     * ephemeral key in answered_pk, so a reply only fits the attempt it was
     * made for. The signature is made with the long-term identity key over
     * signed_bytes().
     */
    struct HandshakeHello {
        std::vector<Version> supported_versions;
        PublicKey ephemeral_pk;   // X25519, fresh for this attempt
        PublicKey identity_pk;    // Ed25519, must derive the sender's address
        std::string recipient;    // address the hello is meant for
        int64_t timestamp = 0;    // Unix seconds at signing
        PublicKey answered_pk;    // empty in the first hello
        Signature signature;

        byte_vector serialize() const;

        /**
         * @throws HandshakeError (HANDSHAKE_MALFORMED) on missing fields or bad sizes.
         */
        static HandshakeHello deserialize(const byte_vector& data);

        /**
         * @brief Bytes covered by the signature.
         * @param sender The address the hello claims to come from.
         */
        byte_vector signed_bytes(const std::string& sender) const;
    };

} // namespace OnionChat

#endif // ONIONCHAT_HANDSHAKE_MESSAGES_HPP
