#ifndef ONIONCHAT_SESSION_HPP
#define ONIONCHAT_SESSION_HPP

#include <chrono>
#include <cstdint>
#include <string>

#include "crypto.hpp"
#include "message.hpp"
#include "replay_window.hpp"
#include "version.hpp"

namespace OnionChat {

    /**
     * @brief Crypto context of one established peer session.
     *
     * Holds the direction-separated keys derived by the handshake, the
     * outbound sequence counter and the inbound replay window. A Session is
     * not synchronized; its owner serializes access.
     */
    class Session {
    public:
        /**
         * @param keys Keys from Crypto::derive_keys for this side's role.
         * @param padding_block Plaintexts are padded to a multiple of this size.
         * @throws KeyExchangeError if the send and receive keys are equal.
         */
        Session(std::string local_address,
                std::string peer_address,
                Role role,
                Version version,
                Crypto::SessionKeys keys,
                size_t padding_block);
        ~Session();

        Session(const Session&) = delete;
        Session& operator=(const Session&) = delete;

        /**
         * @brief Seals a plaintext into the next wire message.
         *
         * The message takes the current outbound sequence (the first is 0) and
         * the counter advances; the nonce is derived from the direction, the
         * session id and that sequence.
         *
         * @throws SessionUnknown after wipe(), SessionExhausted when no sequence is left.
         */
        WireMessage seal_outbound(const byte_vector& plaintext, MessageType type);

        /**
         * @brief Validates and opens an inbound wire message.
         *
         * The replay window is consulted before decryption and only advanced
         * after the frame authenticates, so forged frames cannot move it.
         *
         * @throws SessionUnknown, ReplayRejected, AuthFailure, MalformedMessage
         */
        byte_vector open_inbound(const WireMessage& message);

        /**
         * @brief Destroys the keys. Any later seal or open throws SessionUnknown.
         */
        void wipe();

        bool is_active() const { return active_; }

        const std::string& local_address() const { return local_address_; }
        const std::string& peer_address() const { return peer_address_; }
        Role role() const { return role_; }
        Version version() const { return version_; }
        const byte_vector& session_id() const { return session_id_; }
        std::chrono::system_clock::time_point established_at() const { return established_at_; }

        uint64_t next_sequence() const { return send_sequence_; }
        const ReplayWindow& replay_window() const { return replay_window_; }

        // Inbound frames that failed authentication since the last good one.
        uint32_t consecutive_auth_failures() const { return auth_failures_; }

    private:
        byte_vector make_nonce(Role sender_role, uint64_t sequence) const;

        std::string local_address_;
        std::string peer_address_;
        Role role_;
        Version version_;
        SecretBytes tx_key_;
        SecretBytes rx_key_;
        byte_vector session_id_;
        size_t padding_block_;
        std::chrono::system_clock::time_point established_at_;

        bool active_ = true;
        uint64_t send_sequence_ = 0;
        bool send_exhausted_ = false;
        ReplayWindow replay_window_;
        uint32_t auth_failures_ = 0;
    };

} // namespace OnionChat

#endif // ONIONCHAT_SESSION_HPP
