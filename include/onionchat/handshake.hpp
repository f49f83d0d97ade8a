#ifndef ONIONCHAT_HANDSHAKE_HPP
#define ONIONCHAT_HANDSHAKE_HPP

#include <chrono>
#include <memory>
#include <optional>
#include <string>

#include "crypto.hpp"
#include "handshake_messages.hpp"
#include "identity.hpp"
#include "message.hpp"
#include "session.hpp"

namespace OnionChat {

    /**
     * @brief Why a connection attempt did not produce a session.
     */
    enum class HandshakeFailure {
        TIMEOUT,
        MALFORMED,
        AUTHENTICATION,
        VERSION_MISMATCH,
        KEY_EXCHANGE,
        TRANSPORT,
        RETRIES_EXHAUSTED,
        CANCELLED
    };

    const char* to_string(HandshakeFailure failure);

    /**
     * @brief One key exchange attempt with one peer.
     *
     * Both sides run the same machine; the initiator calls start(), the
     * responder feeds the first hello to on_message(). Once both ephemeral
     * keys are known the session keys are derived and the ephemeral private
     * key is wiped immediately. FAILED is terminal: retrying means creating
     * a new Handshake.
     *
     *   IDLE --start()--> KEY_EXCHANGE_SENT --reply--> ESTABLISHED
     *   IDLE --hello----> KEY_EXCHANGE_RECEIVED -----> ESTABLISHED
     *   any --error/timeout--> FAILED
     */
    class Handshake {
    public:
        enum class State {
            IDLE,
            KEY_EXCHANGE_SENT,
            KEY_EXCHANGE_RECEIVED,
            ESTABLISHED,
            FAILED
        };

        /**
         * @param identity Signs our hello; must outlive the handshake.
         * @param peer_address The dialed address for an initiator, empty for a
         *                     responder that learns it from the first hello.
         * @param max_clock_skew Hellos stamped further than this from the local
         *                       clock fail authentication.
         */
        Handshake(const IdentityStore& identity,
                  std::string peer_address,
                  size_t padding_block,
                  std::chrono::seconds max_clock_skew = std::chrono::seconds(300));
        ~Handshake();

        Handshake(const Handshake&) = delete;
        Handshake& operator=(const Handshake&) = delete;

        /**
         * @brief [INITIATOR] Generates the ephemeral key and returns the first hello.
         * @throws LogicError unless IDLE.
         */
        WireMessage start();

        /**
         * @brief Feeds a HANDSHAKE message from the peer.
         * @return The reply to send (responder side), or nothing (initiator side).
         * @throws HandshakeError or KeyExchangeError; the state is FAILED afterwards.
         * @throws LogicError if the handshake is already established.
         */
        std::optional<WireMessage> on_message(const WireMessage& message);

        /**
         * @brief The handshake window elapsed. Fails the attempt unless established.
         */
        void on_timeout();

        /**
         * @brief Abandons the attempt with the given reason and wipes key material.
         */
        void fail(HandshakeFailure reason);

        /**
         * @brief Moves the established session out.
         * @throws LogicError unless ESTABLISHED and not yet taken.
         */
        std::unique_ptr<Session> take_session();

        State state() const { return state_; }
        bool is_initiator() const { return role_ == Role::INITIATOR; }
        const std::string& peer_address() const { return peer_address_; }
        std::optional<HandshakeFailure> failure() const { return failure_; }
        // The peer's ephemeral key once its hello has authenticated.
        const PublicKey& peer_ephemeral() const { return peer_ephemeral_; }

    private:
        WireMessage make_hello(const std::vector<Version>& versions);
        HandshakeHello authenticate(const WireMessage& message);
        void establish(const PublicKey& peer_ephemeral, Version version);
        [[noreturn]] void reject(HandshakeFailure reason, const std::string& what);

        const IdentityStore& identity_;
        std::string local_address_;
        std::string peer_address_;
        size_t padding_block_;
        std::chrono::seconds max_clock_skew_;
        Role role_ = Role::INITIATOR;
        State state_ = State::IDLE;
        std::optional<HandshakeFailure> failure_;
        std::unique_ptr<KeyPair> ephemeral_kx_kp_;
        PublicKey peer_ephemeral_;
        std::unique_ptr<Session> session_;
    };

    const char* to_string(Handshake::State state);

} // namespace OnionChat

#endif // ONIONCHAT_HANDSHAKE_HPP
