#include <gtest/gtest.h>

#include <cctype>
#include <string>

#include "onionchat/contacts.hpp"
#include "onionchat/crypto.hpp"
#include "onionchat/errors.hpp"
#include "onionchat/onion_address.hpp"

using namespace OnionChat;

class ContactBookTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_EQ(Crypto::init(), 0);
        alice = OnionAddress::from_public_key(Crypto::generate_sign_keypair().publicKey);
        bob = OnionAddress::from_public_key(Crypto::generate_sign_keypair().publicKey);
    }

    ContactBook book{PasswordCost::minimum()};
    std::string alice;
    std::string bob;
};

TEST_F(ContactBookTest, AddFindRemove) {
    ASSERT_TRUE(book.add(alice, "Alice", "abcd-efgh-ijk="));
    ASSERT_TRUE(book.add(bob, "Bob"));
    ASSERT_EQ(book.size(), 2u);

    auto found = book.find(alice);
    ASSERT_TRUE(found.has_value());
    ASSERT_EQ(found->nickname, "Alice");
    ASSERT_EQ(found->fingerprint, "abcd-efgh-ijk=");
    ASSERT_FALSE(found->online);
    ASSERT_GT(found->added_at, 0);

    ASSERT_TRUE(book.remove(alice));
    ASSERT_FALSE(book.find(alice).has_value());
    ASSERT_FALSE(book.remove(alice));
    ASSERT_EQ(book.size(), 1u);
}

TEST_F(ContactBookTest, DuplicatesAreIgnored) {
    ASSERT_TRUE(book.add(alice, "Alice"));
    ASSERT_FALSE(book.add(alice, "Someone else"));

    // The stored address is normalized, so case and suffix variants are the same contact.
    std::string upper = alice;
    for (auto& c : upper) {
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    ASSERT_FALSE(book.add(upper, "Shouting Alice"));
    ASSERT_EQ(book.find(alice)->nickname, "Alice");
    ASSERT_EQ(book.size(), 1u);
}

TEST_F(ContactBookTest, RejectsInvalidAddress) {
    ASSERT_THROW(book.add("not-an-address.onion", "Nobody"), InvalidArgument);
    ASSERT_FALSE(book.find("not-an-address.onion").has_value());
    ASSERT_EQ(book.size(), 0u);
}

TEST_F(ContactBookTest, PresenceFromEvents) {
    book.add(alice, "Alice");

    book.apply(HandshakeCompleted{alice});
    ASSERT_TRUE(book.find(alice)->online);
    ASSERT_GT(book.find(alice)->last_seen, 0);

    book.apply(ConnectionLost{alice});
    ASSERT_FALSE(book.find(alice)->online);

    // Failed handshakes do not change presence; unknown peers are ignored.
    book.apply(HandshakeFailed{alice, HandshakeFailure::TIMEOUT});
    ASSERT_FALSE(book.find(alice)->online);
    book.apply(HandshakeCompleted{bob});
    ASSERT_FALSE(book.find(bob).has_value());

    ASSERT_FALSE(book.set_online(bob, true, 100));
    ASSERT_TRUE(book.set_online(alice, true, 100));
}

TEST_F(ContactBookTest, ListIsSortedByAddress) {
    book.add(alice, "Alice");
    book.add(bob, "Bob");
    auto contacts = book.list();
    ASSERT_EQ(contacts.size(), 2u);
    ASSERT_LT(contacts[0].address, contacts[1].address);
}

TEST_F(ContactBookTest, SaveAndLoad) {
    book.add(alice, "Alice", "abcd-efgh-ijk=");
    book.add(bob, "Bob");
    book.set_online(bob, true, 1700000000);

    byte_vector blob = book.save("hunter2");

    ContactBook restored(PasswordCost::minimum());
    restored.load(blob, "hunter2");
    ASSERT_EQ(restored.size(), 2u);

    auto restored_alice = restored.find(alice);
    ASSERT_TRUE(restored_alice.has_value());
    ASSERT_EQ(restored_alice->nickname, "Alice");
    ASSERT_EQ(restored_alice->fingerprint, "abcd-efgh-ijk=");

    auto restored_bob = restored.find(bob);
    ASSERT_TRUE(restored_bob.has_value());
    ASSERT_EQ(restored_bob->last_seen, 1700000000);
    // Presence is not persisted.
    ASSERT_FALSE(restored_bob->online);
}

TEST_F(ContactBookTest, LoadFailures) {
    book.add(alice, "Alice");
    byte_vector blob = book.save("hunter2");

    ContactBook restored(PasswordCost::minimum());
    restored.add(bob, "Bob");

    ASSERT_THROW(restored.load(blob, "wrong"), WrongPassword);
    ASSERT_THROW(restored.load(byte_vector(blob.begin(), blob.begin() + 12), "hunter2"), CorruptStorage);
    ASSERT_THROW(restored.load(byte_vector{}, "hunter2"), CorruptStorage);

    // A failed load leaves the book untouched.
    ASSERT_EQ(restored.size(), 1u);
    ASSERT_TRUE(restored.find(bob).has_value());
}
