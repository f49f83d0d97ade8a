#include <gtest/gtest.h>

#include <string>

#include "onionchat/crypto.hpp"
#include "onionchat/errors.hpp"
#include "onionchat/identity.hpp"
#include "onionchat/onion_address.hpp"
#include "onionchat/packet.hpp"

using namespace OnionChat;

class IdentityTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_EQ(Crypto::init(), 0);
    }

    IdentityStore store{PasswordCost::minimum()};
};

TEST_F(IdentityTest, CreateDerivesAddress) {
    ASSERT_FALSE(store.has_identity());
    Identity id = store.create_identity();

    ASSERT_TRUE(store.has_identity());
    ASSERT_TRUE(OnionAddress::is_valid(id.address));
    ASSERT_EQ(id.address, OnionAddress::from_public_key(id.public_key));
    ASSERT_EQ(store.address(), id.address);
    ASSERT_GT(id.created_at, 0);
    ASSERT_EQ(store.fingerprint(), Crypto::fingerprint(id.public_key));
}

TEST_F(IdentityTest, SignaturesVerifyAgainstPublicKey) {
    Identity id = store.create_identity();
    byte_vector message = {1, 2, 3, 4};

    Signature sig = store.sign(message);
    ASSERT_TRUE(Crypto::verify(sig, message, id.public_key));
}

TEST_F(IdentityTest, ExportImportRecoversIdentity) {
    Identity original = store.create_identity();
    byte_vector blob = store.export_identity("abc");

    IdentityStore restored(PasswordCost::minimum());
    Identity imported = restored.import_identity(blob, "abc");

    ASSERT_EQ(imported.address, original.address);
    ASSERT_EQ(imported.public_key.data, original.public_key.data);
    ASSERT_EQ(imported.created_at, original.created_at);

    // Same private key: signatures from the restored store verify under the old key.
    byte_vector message = {9, 9, 9};
    ASSERT_TRUE(Crypto::verify(restored.sign(message), message, original.public_key));
}

TEST_F(IdentityTest, WrongPasswordIsRejected) {
    store.create_identity();
    byte_vector blob = store.export_identity("abc");

    IdentityStore restored(PasswordCost::minimum());
    ASSERT_THROW(restored.import_identity(blob, "xyz"), WrongPassword);
    ASSERT_FALSE(restored.has_identity());
}

TEST_F(IdentityTest, DamagedBackupReadsAsWrongPassword) {
    store.create_identity();
    byte_vector blob = store.export_identity("abc");
    blob.back() ^= 0x01;

    IdentityStore restored(PasswordCost::minimum());
    ASSERT_THROW(restored.import_identity(blob, "abc"), WrongPassword);
    ASSERT_FALSE(restored.has_identity());
}

TEST_F(IdentityTest, SaveAndLoad) {
    Identity original = store.create_identity();

    IdentityStore plain_copy(PasswordCost::minimum());
    ASSERT_EQ(plain_copy.load(store.save(std::nullopt), std::nullopt).address, original.address);

    byte_vector sealed = store.save(std::string("secret"));
    IdentityStore sealed_copy(PasswordCost::minimum());
    ASSERT_THROW(sealed_copy.load(sealed, std::nullopt), WrongPassword);
    ASSERT_EQ(sealed_copy.load(sealed, std::string("secret")).address, original.address);
}

TEST_F(IdentityTest, PlainBlobLayout) {
    Identity original = store.create_identity();
    byte_vector blob = store.save(std::nullopt);

    Payload payload = Payload::deserialize(blob);
    PayloadReader reader(payload);
    ASSERT_EQ(reader.read_param<std::string>(), "onionchat-identity-v1");
    ASSERT_EQ(reader.read_param<int64_t>(), original.created_at);
    ASSERT_EQ(reader.read_param<byte_vector>(), original.public_key.data);
    ASSERT_EQ(reader.read_param<uint64_t>(), 0u);
    ASSERT_EQ(reader.read_param<uint64_t>(), 0u);
    byte_vector secret = reader.read_param<byte_vector>();
    ASSERT_EQ(secret.size(), SIGN_SECRET_KEY_BYTES);
    ASSERT_FALSE(reader.has_more());

    // Ed25519 signatures are deterministic, so the same key signs identically.
    IdentityStore copy(PasswordCost::minimum());
    copy.load(blob, std::nullopt);
    byte_vector message = {4, 5, 6};
    ASSERT_EQ(copy.sign(message).data, store.sign(message).data);
}

TEST_F(IdentityTest, PlainBlobWithShortKeyIsRejected) {
    store.create_identity();
    Payload payload = Payload::deserialize(store.save(std::nullopt));
    PayloadReader reader(payload);
    const std::string magic = reader.read_param<std::string>();
    const int64_t created_at = reader.read_param<int64_t>();
    const byte_vector public_key = reader.read_param<byte_vector>();
    const uint64_t opslimit = reader.read_param<uint64_t>();
    const uint64_t memlimit = reader.read_param<uint64_t>();
    byte_vector secret = reader.read_param<byte_vector>();
    secret.resize(16);

    byte_vector damaged = PayloadBuilder(payload.op_code)
                              .add_param(magic)
                              .add_param(created_at)
                              .add_param(public_key)
                              .add_param(opslimit)
                              .add_param(memlimit)
                              .add_param(secret)
                              .build()
                              .serialize();

    IdentityStore other(PasswordCost::minimum());
    ASSERT_THROW(other.load(damaged, std::nullopt), CorruptStorage);
    ASSERT_FALSE(other.has_identity());
}

TEST_F(IdentityTest, CorruptBlobs) {
    store.create_identity();
    byte_vector blob = store.export_identity("abc");

    IdentityStore other(PasswordCost::minimum());

    byte_vector truncated(blob.begin(), blob.begin() + 10);
    ASSERT_THROW(other.import_identity(truncated, "abc"), CorruptStorage);

    ASSERT_THROW(other.load(byte_vector{}, std::nullopt), CorruptStorage);

    // A plain blob is not a backup.
    ASSERT_THROW(other.import_identity(store.save(std::nullopt), "abc"), CorruptStorage);

    // Flipping a header byte breaks the authenticated header.
    byte_vector tampered = blob;
    tampered[20] ^= 0x01;
    ASSERT_ANY_THROW(other.import_identity(tampered, "abc"));
    ASSERT_FALSE(other.has_identity());
}

TEST_F(IdentityTest, WipeForgetsIdentity) {
    store.create_identity();
    store.wipe();
    ASSERT_FALSE(store.has_identity());
    ASSERT_THROW(store.sign({1}), LogicError);
    ASSERT_THROW(store.export_identity("abc"), LogicError);
}
