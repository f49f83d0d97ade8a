#include "onionchat/handshake.hpp"

#include "onionchat/errors.hpp"
#include "onionchat/log.hpp"
#include "onionchat/onion_address.hpp"

namespace OnionChat {

const char* to_string(HandshakeFailure failure) {
    switch (failure) {
        case HandshakeFailure::TIMEOUT: return "timeout";
        case HandshakeFailure::MALFORMED: return "malformed";
        case HandshakeFailure::AUTHENTICATION: return "authentication";
        case HandshakeFailure::VERSION_MISMATCH: return "version mismatch";
        case HandshakeFailure::KEY_EXCHANGE: return "key exchange";
        case HandshakeFailure::TRANSPORT: return "transport";
        case HandshakeFailure::RETRIES_EXHAUSTED: return "retries exhausted";
        case HandshakeFailure::CANCELLED: return "cancelled";
    }
    return "unknown";
}

const char* to_string(Handshake::State state) {
    switch (state) {
        case Handshake::State::IDLE: return "idle";
        case Handshake::State::KEY_EXCHANGE_SENT: return "key exchange sent";
        case Handshake::State::KEY_EXCHANGE_RECEIVED: return "key exchange received";
        case Handshake::State::ESTABLISHED: return "established";
        case Handshake::State::FAILED: return "failed";
    }
    return "unknown";
}

Handshake::Handshake(const IdentityStore& identity,
                     std::string peer_address,
                     size_t padding_block,
                     std::chrono::seconds max_clock_skew)
    : identity_(identity),
      local_address_(identity.address()),
      padding_block_(padding_block),
      max_clock_skew_(max_clock_skew) {
    if (!peer_address.empty()) {
        peer_address_ = OnionAddress::normalize(peer_address);
    }
}

Handshake::~Handshake() = default;

// --- Transitions ---

WireMessage Handshake::start() {
    if (state_ != State::IDLE) {
        throw LogicError("A handshake can only be started from the idle state.");
    }
    if (peer_address_.empty()) {
        throw LogicError("The initiator must know the address it dials.");
    }

    role_ = Role::INITIATOR;
    ephemeral_kx_kp_ = std::make_unique<KeyPair>(Crypto::generate_kx_keypair());
    WireMessage hello = make_hello(SUPPORTED_VERSIONS);
    state_ = State::KEY_EXCHANGE_SENT;
    return hello;
}

std::optional<WireMessage> Handshake::on_message(const WireMessage& message) {
    switch (state_) {
        case State::ESTABLISHED:
            throw LogicError("Handshake already established.");
        case State::FAILED:
            throw HandshakeError("Handshake attempt already failed.");
        case State::KEY_EXCHANGE_RECEIVED:
            throw LogicError("Responder is still completing the key exchange.");
        default:
            break;
    }
    if (message.type != MessageType::HANDSHAKE) {
        reject(HandshakeFailure::MALFORMED, std::string("Expected a handshake message, got ") + to_string(message.type) + ".");
    }

    if (state_ == State::IDLE) {
        role_ = Role::RESPONDER;
        if (peer_address_.empty()) {
            if (!OnionAddress::is_valid(message.sender)) {
                reject(HandshakeFailure::MALFORMED, "Hello sender is not a valid onion address.");
            }
            peer_address_ = OnionAddress::normalize(message.sender);
        }

        HandshakeHello hello = authenticate(message);
        std::optional<Version> version = VersionNegotiator::negotiate(hello.supported_versions, SUPPORTED_VERSIONS);
        if (!version) {
            reject(HandshakeFailure::VERSION_MISMATCH, "No common protocol version with " + peer_address_ + ".");
        }

        try {
            ephemeral_kx_kp_ = std::make_unique<KeyPair>(Crypto::generate_kx_keypair());
        } catch (const EntropyFailure& e) {
            reject(HandshakeFailure::KEY_EXCHANGE, e.what());
        }
        state_ = State::KEY_EXCHANGE_RECEIVED;
        WireMessage reply = make_hello({*version});
        establish(hello.ephemeral_pk, *version);
        return reply;
    }

    // KEY_EXCHANGE_SENT: this is the responder's answer.
    HandshakeHello hello = authenticate(message);
    if (hello.supported_versions.size() != 1 || !VersionNegotiator::is_supported(hello.supported_versions.front())) {
        reject(HandshakeFailure::VERSION_MISMATCH, "Responder selected an unsupported version.");
    }
    establish(hello.ephemeral_pk, hello.supported_versions.front());
    return std::nullopt;
}

void Handshake::on_timeout() {
    if (state_ == State::ESTABLISHED || state_ == State::FAILED) {
        return;
    }
    Log::info("Handshake with " + (peer_address_.empty() ? std::string("unknown peer") : peer_address_) +
              " timed out in state " + to_string(state_));
    fail(HandshakeFailure::TIMEOUT);
}

void Handshake::fail(HandshakeFailure reason) {
    state_ = State::FAILED;
    failure_ = reason;
    ephemeral_kx_kp_.reset();
    session_.reset();
}

std::unique_ptr<Session> Handshake::take_session() {
    if (state_ != State::ESTABLISHED || !session_) {
        throw LogicError("No established session to take.");
    }
    return std::move(session_);
}

// --- Helpers ---

WireMessage Handshake::make_hello(const std::vector<Version>& versions) {
    HandshakeHello hello;
    hello.supported_versions = versions;
    hello.ephemeral_pk = ephemeral_kx_kp_->publicKey;
    hello.identity_pk = identity_.public_key();
    hello.recipient = peer_address_;
    hello.timestamp = unix_time_now();
    if (role_ == Role::RESPONDER) {
        hello.answered_pk = peer_ephemeral_;
    }
    hello.signature = identity_.sign(hello.signed_bytes(local_address_));

    WireMessage msg;
    msg.id = WireMessage::new_id();
    msg.type = MessageType::HANDSHAKE;
    msg.sender = local_address_;
    msg.content = hello.serialize();
    msg.timestamp = hello.timestamp;
    msg.sequence = 0;
    return msg;
}

HandshakeHello Handshake::authenticate(const WireMessage& message) {
    if (!OnionAddress::is_valid(message.sender) || OnionAddress::normalize(message.sender) != peer_address_) {
        reject(HandshakeFailure::AUTHENTICATION, "Hello did not come from " + peer_address_ + ".");
    }

    HandshakeHello hello;
    try {
        hello = HandshakeHello::deserialize(message.content);
    } catch (const HandshakeError& e) {
        reject(HandshakeFailure::MALFORMED, e.what());
    }

    if (OnionAddress::from_public_key(hello.identity_pk) != peer_address_) {
        reject(HandshakeFailure::AUTHENTICATION, "Identity key does not match the address " + peer_address_ + ".");
    }
    if (hello.recipient != local_address_) {
        reject(HandshakeFailure::AUTHENTICATION, "Hello was addressed to another node.");
    }
    if (!Crypto::verify(hello.signature, hello.signed_bytes(message.sender), hello.identity_pk)) {
        reject(HandshakeFailure::AUTHENTICATION, "Hello signature is invalid.");
    }
    const int64_t skew = unix_time_now() - hello.timestamp;
    if (skew > max_clock_skew_.count() || -skew > max_clock_skew_.count()) {
        reject(HandshakeFailure::AUTHENTICATION, "Hello timestamp is outside the accepted clock skew.");
    }
    if (role_ == Role::RESPONDER) {
        if (!hello.answered_pk.data.empty()) {
            reject(HandshakeFailure::MALFORMED, "First hello must not answer another key.");
        }
    } else if (hello.answered_pk.data != ephemeral_kx_kp_->publicKey.data) {
        reject(HandshakeFailure::AUTHENTICATION, "Reply does not answer this attempt.");
    }
    if (ephemeral_kx_kp_ && hello.ephemeral_pk.data == ephemeral_kx_kp_->publicKey.data) {
        reject(HandshakeFailure::AUTHENTICATION, "Peer echoed our ephemeral key.");
    }
    peer_ephemeral_ = hello.ephemeral_pk;
    return hello;
}

void Handshake::establish(const PublicKey& peer_ephemeral, Version version) {
    try {
        SharedSecret shared = Crypto::diffie_hellman(ephemeral_kx_kp_->privateKey, peer_ephemeral);
        const PublicKey& own_ephemeral = ephemeral_kx_kp_->publicKey;
        Crypto::SessionKeys keys = role_ == Role::INITIATOR
                                       ? Crypto::derive_keys(shared, own_ephemeral, peer_ephemeral, role_)
                                       : Crypto::derive_keys(shared, peer_ephemeral, own_ephemeral, role_);
        shared.data.wipe();

        // Forward secrecy: the ephemeral private key must not outlive the derivation.
        ephemeral_kx_kp_->privateKey.data.wipe();
        ephemeral_kx_kp_.reset();

        session_ = std::make_unique<Session>(local_address_, peer_address_, role_, version, std::move(keys), padding_block_);
    } catch (const KeyExchangeError& e) {
        reject(HandshakeFailure::KEY_EXCHANGE, e.what());
    }
    state_ = State::ESTABLISHED;
    Log::debug("Session established with " + peer_address_ + (role_ == Role::INITIATOR ? " (initiator)" : " (responder)"));
}

void Handshake::reject(HandshakeFailure reason, const std::string& what) {
    Log::warn("Handshake with " + (peer_address_.empty() ? std::string("unknown peer") : peer_address_) +
              " failed: " + what);
    fail(reason);
    if (reason == HandshakeFailure::KEY_EXCHANGE) {
        throw KeyExchangeError(what);
    }
    throw HandshakeError(what, reason == HandshakeFailure::TIMEOUT ? ErrorCode::HANDSHAKE_TIMEOUT
                                                                   : ErrorCode::HANDSHAKE_MALFORMED);
}

} // namespace OnionChat
