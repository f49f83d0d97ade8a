#include "onionchat/identity.hpp"

#include <arpa/inet.h>

#include <chrono>
#include <mutex>

#include "onionchat/errors.hpp"
#include "onionchat/log.hpp"
#include "onionchat/onion_address.hpp"
#include "onionchat/packet.hpp"

namespace OnionChat {

namespace {

// Blob layout: a Payload whose op code tells the kind, then
// [magic] [created_at] [public key] [opslimit] [memlimit] [body].
// For sealed blobs the body is salt | nonce | ciphertext and everything
// before it is authenticated as AAD.
constexpr Payload::OpCode BLOB_PLAIN = 0x4901;
constexpr Payload::OpCode BLOB_SEALED = 0x4902;
constexpr char BLOB_MAGIC[] = "onionchat-identity-v1";

int64_t unix_now() {
    return std::chrono::duration_cast<std::chrono::seconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

PayloadBuilder blob_header(Payload::OpCode kind, const Identity& identity, const PasswordCost& cost) {
    PayloadBuilder builder(kind);
    builder.add_param(BLOB_MAGIC)
        .add_param(identity.created_at)
        .add_param(identity.public_key.data)
        .add_param(static_cast<uint64_t>(cost.opslimit))
        .add_param(static_cast<uint64_t>(cost.memlimit));
    return builder;
}

// Appends a length-prefixed parameter without leaving a stray copy of it on
// the heap: the buffer is grown once, before the bytes go in.
void append_secret_param(byte_vector& out, const uint8_t* data, size_t size) {
    out.reserve(out.size() + sizeof(uint32_t) + size);
    const uint32_t be_len = htonl(static_cast<uint32_t>(size));
    out.insert(out.end(), reinterpret_cast<const uint8_t*>(&be_len), reinterpret_cast<const uint8_t*>(&be_len) + sizeof(be_len));
    out.insert(out.end(), data, data + size);
}

struct ParsedBlob {
    ParsedBlob() = default;
    ParsedBlob(const ParsedBlob&) = delete;
    ParsedBlob& operator=(const ParsedBlob&) = delete;
    // The body of a plain blob is the private key.
    ~ParsedBlob() { Crypto::secure_wipe(body); }

    Payload::OpCode kind = 0;
    int64_t created_at = 0;
    PublicKey public_key;
    PasswordCost cost{};
    byte_vector aad;
    byte_vector body;
};

void parse_blob(const byte_vector& blob, ParsedBlob& parsed) {
    Payload payload;
    try {
        payload = Payload::deserialize(blob);
        if (payload.op_code != BLOB_PLAIN && payload.op_code != BLOB_SEALED) {
            throw CorruptStorage("Unknown identity blob kind.");
        }
        PayloadReader reader(payload);
        if (reader.read_param<std::string>() != BLOB_MAGIC) {
            throw CorruptStorage("Identity blob has a bad magic value.");
        }
        parsed.kind = payload.op_code;
        parsed.created_at = reader.read_param<int64_t>();
        parsed.public_key.data = reader.read_param<byte_vector>();
        parsed.cost.opslimit = reader.read_param<uint64_t>();
        parsed.cost.memlimit = static_cast<size_t>(reader.read_param<uint64_t>());
        parsed.body = reader.read_param<byte_vector>();
    } catch (const MalformedMessage& e) {
        Crypto::secure_wipe(payload.parameters);
        throw CorruptStorage(std::string("Truncated identity blob: ") + e.what());
    } catch (const CorruptStorage&) {
        Crypto::secure_wipe(payload.parameters);
        throw;
    }
    Crypto::secure_wipe(payload.parameters);

    if (parsed.public_key.data.size() != SIGN_PUBLIC_KEY_BYTES) {
        throw CorruptStorage("Identity blob holds a public key of the wrong size.");
    }
    const PasswordCost ceiling = PasswordCost::sensitive();
    if (parsed.kind == BLOB_SEALED &&
        (parsed.cost.opslimit > ceiling.opslimit || parsed.cost.memlimit > ceiling.memlimit)) {
        throw CorruptStorage("Identity blob requests an out-of-range password cost.");
    }

    Identity header_identity;
    header_identity.created_at = parsed.created_at;
    header_identity.public_key = parsed.public_key;
    parsed.aad = blob_header(parsed.kind, header_identity, parsed.cost).build().serialize();
}

} // namespace

IdentityStore::IdentityStore(PasswordCost cost) : cost_(cost) {}

Identity IdentityStore::create_identity() {
    KeyPair kp = Crypto::generate_sign_keypair();

    std::unique_lock<std::shared_mutex> lock(mutex_);
    Identity identity = install(std::move(kp.publicKey), std::move(kp.privateKey), unix_now());
    Log::info("Created identity " + identity.address);
    return identity;
}

Identity IdentityStore::load(const byte_vector& storage_blob, const std::optional<std::string>& password) {
    ParsedBlob parsed;
    parse_blob(storage_blob, parsed);

    PrivateKey private_key;
    if (parsed.kind == BLOB_SEALED) {
        if (!password) {
            throw WrongPassword("This identity is password protected.");
        }
        byte_vector secret = Crypto::open_with_password(parsed.body, *password, parsed.cost, parsed.aad);
        private_key.data = SecretBytes(secret.data(), secret.size());
        Crypto::secure_wipe(secret);
    } else {
        private_key.data = SecretBytes(parsed.body.data(), parsed.body.size());
    }

    if (private_key.data.size() != SIGN_SECRET_KEY_BYTES) {
        throw CorruptStorage("Identity blob holds a private key of the wrong size.");
    }
    if (Crypto::sign_public_key(private_key).data != parsed.public_key.data) {
        throw CorruptStorage("Private key does not match the stored public key.");
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);
    return install(std::move(parsed.public_key), std::move(private_key), parsed.created_at);
}

byte_vector IdentityStore::save(const std::optional<std::string>& password) const {
    if (password) {
        return export_identity(*password);
    }

    std::shared_lock<std::shared_mutex> lock(mutex_);
    if (!identity_) {
        throw LogicError("No identity to save.");
    }
    byte_vector blob = blob_header(BLOB_PLAIN, *identity_, PasswordCost{0, 0}).build().serialize();
    append_secret_param(blob, private_key_.data.data(), private_key_.data.size());
    return blob;
}

byte_vector IdentityStore::export_identity(const std::string& password) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    if (!identity_) {
        throw LogicError("No identity to export.");
    }

    byte_vector aad = blob_header(BLOB_SEALED, *identity_, cost_).build().serialize();
    byte_vector secret(private_key_.data.data(), private_key_.data.data() + private_key_.data.size());
    byte_vector sealed = Crypto::seal_with_password(secret, password, cost_, aad);
    Crypto::secure_wipe(secret);

    return blob_header(BLOB_SEALED, *identity_, cost_).add_param(sealed).build().serialize();
}

Identity IdentityStore::import_identity(const byte_vector& blob, const std::string& password) {
    ParsedBlob parsed;
    parse_blob(blob, parsed);
    if (parsed.kind != BLOB_SEALED) {
        throw CorruptStorage("Backup blobs must be password sealed.");
    }
    return load(blob, password);
}

bool IdentityStore::has_identity() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return identity_.has_value();
}

Identity IdentityStore::identity() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    if (!identity_) {
        throw LogicError("No identity loaded.");
    }
    return *identity_;
}

std::string IdentityStore::address() const {
    return identity().address;
}

PublicKey IdentityStore::public_key() const {
    return identity().public_key;
}

std::string IdentityStore::fingerprint() const {
    return Crypto::fingerprint(identity().public_key);
}

Signature IdentityStore::sign(const byte_vector& message) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    if (!identity_) {
        throw LogicError("No identity loaded.");
    }
    return Crypto::sign(message, private_key_);
}

void IdentityStore::wipe() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    private_key_.data.wipe();
    identity_.reset();
}

Identity IdentityStore::install(PublicKey public_key, PrivateKey private_key, int64_t created_at) {
    Identity identity;
    identity.address = OnionAddress::from_public_key(public_key);
    identity.public_key = std::move(public_key);
    identity.created_at = created_at;

    private_key_ = std::move(private_key);
    identity_ = identity;
    return identity;
}

} // namespace OnionChat
