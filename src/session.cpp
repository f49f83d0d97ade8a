#include "onionchat/session.hpp"

#include <limits>
#include <utility>

#include "onionchat/errors.hpp"
#include "onionchat/log.hpp"

namespace OnionChat {

namespace {
// First nonce byte: which side sealed the frame.
constexpr uint8_t DIRECTION_FROM_INITIATOR = 0x01;
constexpr uint8_t DIRECTION_FROM_RESPONDER = 0x02;
// Nonce layout: direction (1) | session id prefix (15) | sequence, big endian (8).
constexpr size_t NONCE_ID_BYTES = AEAD_NONCE_BYTES - 1 - sizeof(uint64_t);
}

Session::Session(std::string local_address,
                 std::string peer_address,
                 Role role,
                 Version version,
                 Crypto::SessionKeys keys,
                 size_t padding_block)
    : local_address_(std::move(local_address)),
      peer_address_(std::move(peer_address)),
      role_(role),
      version_(version),
      tx_key_(std::move(keys.tx)),
      rx_key_(std::move(keys.rx)),
      session_id_(std::move(keys.session_id)),
      padding_block_(padding_block),
      established_at_(std::chrono::system_clock::now()) {
    if (padding_block_ == 0) {
        throw InvalidArgument("Padding block size must be positive.");
    }
    if (session_id_.size() < NONCE_ID_BYTES) {
        throw KeyExchangeError("Session id too short.");
    }
    if (tx_key_.size() != SESSION_KEY_BYTES || rx_key_.size() != SESSION_KEY_BYTES) {
        throw KeyExchangeError("Session keys have the wrong size.");
    }
    if (tx_key_ == rx_key_) {
        throw KeyExchangeError("Send and receive keys must differ.");
    }
}

Session::~Session() {
    wipe();
}

byte_vector Session::make_nonce(Role sender_role, uint64_t sequence) const {
    byte_vector nonce;
    nonce.reserve(AEAD_NONCE_BYTES);
    nonce.push_back(sender_role == Role::INITIATOR ? DIRECTION_FROM_INITIATOR : DIRECTION_FROM_RESPONDER);
    nonce.insert(nonce.end(), session_id_.begin(), session_id_.begin() + NONCE_ID_BYTES);
    detail::append_be64(nonce, sequence);
    return nonce;
}

WireMessage Session::seal_outbound(const byte_vector& plaintext, MessageType type) {
    if (!active_) {
        throw SessionUnknown("Session with " + peer_address_ + " has been closed.");
    }
    if (send_exhausted_) {
        throw SessionExhausted("Outbound sequence space exhausted; a new handshake is required.");
    }

    WireMessage msg;
    msg.id = WireMessage::new_id();
    msg.type = type;
    msg.sender = local_address_;
    msg.timestamp = unix_time_now();
    msg.sequence = send_sequence_;

    byte_vector padded = Crypto::pad(plaintext, padding_block_);
    msg.content = Crypto::seal(tx_key_, make_nonce(role_, msg.sequence), msg.header_bytes(), padded);
    Crypto::secure_wipe(padded);

    if (send_sequence_ == std::numeric_limits<uint64_t>::max()) {
        send_exhausted_ = true;
    } else {
        ++send_sequence_;
    }
    return msg;
}

byte_vector Session::open_inbound(const WireMessage& message) {
    if (!active_) {
        throw SessionUnknown("Session with " + peer_address_ + " has been closed.");
    }
    if (!replay_window_.check(message.sequence)) {
        Log::debug("Rejected replayed or stale frame " + std::to_string(message.sequence) + " from " + peer_address_);
        throw ReplayRejected("Sequence " + std::to_string(message.sequence) + " is stale or already seen.");
    }

    const Role peer_role = role_ == Role::INITIATOR ? Role::RESPONDER : Role::INITIATOR;
    byte_vector padded;
    try {
        padded = Crypto::open(rx_key_, make_nonce(peer_role, message.sequence), message.header_bytes(), message.content);
    } catch (const AuthFailure&) {
        ++auth_failures_;
        throw;
    }

    auth_failures_ = 0;
    replay_window_.mark(message.sequence);

    byte_vector plaintext = Crypto::unpad(padded, padding_block_);
    Crypto::secure_wipe(padded);
    return plaintext;
}

void Session::wipe() {
    tx_key_.wipe();
    rx_key_.wipe();
    active_ = false;
}

} // namespace OnionChat
