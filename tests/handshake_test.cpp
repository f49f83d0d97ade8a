#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <string>

#include "onionchat/crypto.hpp"
#include "onionchat/errors.hpp"
#include "onionchat/handshake.hpp"

using namespace OnionChat;

class HandshakeTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_EQ(Crypto::init(), 0);
        alice.create_identity();
        bob.create_identity();
        carol.create_identity();
    }

    IdentityStore alice{PasswordCost::minimum()};
    IdentityStore bob{PasswordCost::minimum()};
    IdentityStore carol{PasswordCost::minimum()};
};

TEST_F(HandshakeTest, EstablishesAndCarriesFirstMessage) {
    Handshake initiator(alice, bob.address(), 64);
    Handshake responder(bob, "", 64);
    ASSERT_EQ(initiator.state(), Handshake::State::IDLE);

    WireMessage hello = initiator.start();
    ASSERT_EQ(hello.type, MessageType::HANDSHAKE);
    ASSERT_EQ(initiator.state(), Handshake::State::KEY_EXCHANGE_SENT);
    ASSERT_TRUE(initiator.is_initiator());

    std::optional<WireMessage> reply = responder.on_message(hello);
    ASSERT_TRUE(reply.has_value());
    ASSERT_EQ(responder.state(), Handshake::State::ESTABLISHED);
    ASSERT_FALSE(responder.is_initiator());
    ASSERT_EQ(responder.peer_address(), alice.address());

    ASSERT_FALSE(initiator.on_message(*reply).has_value());
    ASSERT_EQ(initiator.state(), Handshake::State::ESTABLISHED);

    std::unique_ptr<Session> a = initiator.take_session();
    std::unique_ptr<Session> b = responder.take_session();
    ASSERT_EQ(a->peer_address(), bob.address());
    ASSERT_EQ(b->peer_address(), alice.address());
    ASSERT_EQ(a->session_id(), b->session_id());
    ASSERT_EQ(a->version(), Versions::V1_0);

    std::string text = "hello";
    WireMessage first = a->seal_outbound(byte_vector(text.begin(), text.end()), MessageType::TEXT);
    ASSERT_EQ(first.sequence, 0u);
    byte_vector opened = b->open_inbound(first);
    ASSERT_EQ(std::string(opened.begin(), opened.end()), "hello");

    ASSERT_THROW(initiator.take_session(), LogicError);
}

TEST_F(HandshakeTest, TimeoutFailsAttempt) {
    Handshake initiator(alice, bob.address(), 64);
    initiator.start();
    initiator.on_timeout();

    ASSERT_EQ(initiator.state(), Handshake::State::FAILED);
    ASSERT_EQ(initiator.failure(), HandshakeFailure::TIMEOUT);
    ASSERT_THROW(initiator.take_session(), LogicError);
}

TEST_F(HandshakeTest, TimeoutAfterEstablishIsIgnored) {
    Handshake initiator(alice, bob.address(), 64);
    Handshake responder(bob, "", 64);
    initiator.on_message(*responder.on_message(initiator.start()));

    initiator.on_timeout();
    ASSERT_EQ(initiator.state(), Handshake::State::ESTABLISHED);
}

TEST_F(HandshakeTest, HelloForAnotherNodeIsRejected) {
    // Alice believes she is talking to Carol, but Bob answers.
    Handshake initiator(alice, carol.address(), 64);
    Handshake responder(bob, "", 64);

    ASSERT_THROW(responder.on_message(initiator.start()), HandshakeError);
    ASSERT_EQ(responder.state(), Handshake::State::FAILED);
    ASSERT_EQ(responder.failure(), HandshakeFailure::AUTHENTICATION);
}

TEST_F(HandshakeTest, ReplyFromWrongPeerIsRejected) {
    Handshake initiator(alice, bob.address(), 64);
    Handshake carol_side(carol, "", 64);
    Handshake bob_side(bob, "", 64);

    WireMessage hello = initiator.start();
    std::optional<WireMessage> bob_reply = bob_side.on_message(hello);
    ASSERT_TRUE(bob_reply.has_value());

    // Carol replays Bob's reply under her own name.
    WireMessage forged = *bob_reply;
    forged.sender = carol.address();
    ASSERT_THROW(initiator.on_message(forged), HandshakeError);
    ASSERT_EQ(initiator.failure(), HandshakeFailure::AUTHENTICATION);
}

TEST_F(HandshakeTest, ForgedSignatureIsRejected) {
    Handshake initiator(alice, bob.address(), 64);
    Handshake responder(bob, "", 64);

    WireMessage hello = initiator.start();
    HandshakeHello body = HandshakeHello::deserialize(hello.content);
    body.signature.data[0] ^= 0x01;
    hello.content = body.serialize();

    ASSERT_THROW(responder.on_message(hello), HandshakeError);
    ASSERT_EQ(responder.failure(), HandshakeFailure::AUTHENTICATION);
}

TEST_F(HandshakeTest, MalformedHelloIsRejected) {
    Handshake responder(bob, "", 64);
    WireMessage hello;
    hello.id = WireMessage::new_id();
    hello.type = MessageType::HANDSHAKE;
    hello.sender = alice.address();
    hello.content = {0x01, 0x02, 0x03};

    ASSERT_THROW(responder.on_message(hello), HandshakeError);
    ASSERT_EQ(responder.failure(), HandshakeFailure::MALFORMED);
}

TEST_F(HandshakeTest, NonHandshakeMessageIsRejected) {
    Handshake initiator(alice, bob.address(), 64);
    Handshake responder(bob, "", 64);
    WireMessage hello = initiator.start();
    hello.type = MessageType::TEXT;

    ASSERT_THROW(responder.on_message(hello), HandshakeError);
    ASSERT_EQ(responder.failure(), HandshakeFailure::MALFORMED);
}

TEST_F(HandshakeTest, NoCommonVersion) {
    Handshake initiator(alice, bob.address(), 64);
    Handshake responder(bob, "", 64);

    // Re-sign a hello that only offers a future version.
    WireMessage hello = initiator.start();
    HandshakeHello body = HandshakeHello::deserialize(hello.content);
    body.supported_versions = {0x0900};
    body.signature = alice.sign(body.signed_bytes(hello.sender));
    hello.content = body.serialize();

    ASSERT_THROW(responder.on_message(hello), HandshakeError);
    ASSERT_EQ(responder.failure(), HandshakeFailure::VERSION_MISMATCH);
}

TEST_F(HandshakeTest, FailedIsTerminal) {
    Handshake initiator(alice, bob.address(), 64);
    initiator.start();
    ASSERT_THROW(initiator.start(), LogicError);

    initiator.fail(HandshakeFailure::CANCELLED);
    ASSERT_EQ(initiator.state(), Handshake::State::FAILED);

    Handshake responder(bob, "", 64);
    Handshake other(alice, bob.address(), 64);
    WireMessage reply = *responder.on_message(other.start());
    ASSERT_THROW(initiator.on_message(reply), HandshakeError);
    ASSERT_EQ(initiator.failure(), HandshakeFailure::CANCELLED);
}

TEST_F(HandshakeTest, ResponderCannotStart) {
    Handshake responder(bob, "", 64);
    ASSERT_THROW(responder.start(), LogicError);
}

TEST_F(HandshakeTest, EachAttemptUsesFreshKeys) {
    Handshake first(alice, bob.address(), 64);
    Handshake second(alice, bob.address(), 64);

    HandshakeHello a = HandshakeHello::deserialize(first.start().content);
    HandshakeHello b = HandshakeHello::deserialize(second.start().content);
    ASSERT_NE(a.ephemeral_pk.data, b.ephemeral_pk.data);
    ASSERT_EQ(a.identity_pk.data, b.identity_pk.data);
}

TEST_F(HandshakeTest, ReplyFromEarlierAttemptIsRejected) {
    Handshake first(alice, bob.address(), 64);
    Handshake bob_side(bob, "", 64);
    WireMessage old_reply = *bob_side.on_message(first.start());

    // The reply names the ephemeral key of the attempt it answered.
    Handshake second(alice, bob.address(), 64);
    second.start();
    ASSERT_THROW(second.on_message(old_reply), HandshakeError);
    ASSERT_EQ(second.failure(), HandshakeFailure::AUTHENTICATION);
}

TEST_F(HandshakeTest, StaleHelloIsRejected) {
    Handshake initiator(alice, bob.address(), 64);
    Handshake responder(bob, "", 64, std::chrono::seconds(60));

    WireMessage hello = initiator.start();
    HandshakeHello body = HandshakeHello::deserialize(hello.content);
    body.timestamp -= 3600;
    body.signature = alice.sign(body.signed_bytes(hello.sender));
    hello.content = body.serialize();

    ASSERT_THROW(responder.on_message(hello), HandshakeError);
    ASSERT_EQ(responder.failure(), HandshakeFailure::AUTHENTICATION);
}

TEST_F(HandshakeTest, HelloFromTheFutureIsRejected) {
    Handshake initiator(alice, bob.address(), 64);
    Handshake responder(bob, "", 64, std::chrono::seconds(60));

    WireMessage hello = initiator.start();
    HandshakeHello body = HandshakeHello::deserialize(hello.content);
    body.timestamp += 3600;
    body.signature = alice.sign(body.signed_bytes(hello.sender));
    hello.content = body.serialize();

    ASSERT_THROW(responder.on_message(hello), HandshakeError);
    ASSERT_EQ(responder.failure(), HandshakeFailure::AUTHENTICATION);
}

TEST_F(HandshakeTest, FirstHelloMustNotAnswerAKey) {
    Handshake initiator(alice, bob.address(), 64);
    Handshake responder(bob, "", 64);

    WireMessage hello = initiator.start();
    HandshakeHello body = HandshakeHello::deserialize(hello.content);
    body.answered_pk = Crypto::generate_kx_keypair().publicKey;
    body.signature = alice.sign(body.signed_bytes(hello.sender));
    hello.content = body.serialize();

    ASSERT_THROW(responder.on_message(hello), HandshakeError);
    ASSERT_EQ(responder.failure(), HandshakeFailure::MALFORMED);
}
