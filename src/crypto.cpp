#include "onionchat/crypto.hpp"

#include <sodium.h>

#include <algorithm>
#include <atomic>

#include "onionchat/errors.hpp"

namespace OnionChat {

    static std::atomic<bool> g_sodium_initialized{false};

    // Subkey ids for crypto_kdf_derive_from_key.
    constexpr uint64_t SUBKEY_INITIATOR_TO_RESPONDER = 1;
    constexpr uint64_t SUBKEY_RESPONDER_TO_INITIATOR = 2;
    constexpr uint64_t SUBKEY_SESSION_ID = 3;

    static void ensure_initialized() {
        if (Crypto::init() != 0) {
            throw EntropyFailure("libsodium could not be initialized; no entropy source available.");
        }
    }

    // --- PasswordCost ---

    PasswordCost PasswordCost::minimum() {
        return {crypto_pwhash_OPSLIMIT_MIN, crypto_pwhash_MEMLIMIT_MIN};
    }

    PasswordCost PasswordCost::interactive() {
        return {crypto_pwhash_OPSLIMIT_INTERACTIVE, crypto_pwhash_MEMLIMIT_INTERACTIVE};
    }

    PasswordCost PasswordCost::moderate() {
        return {crypto_pwhash_OPSLIMIT_MODERATE, crypto_pwhash_MEMLIMIT_MODERATE};
    }

    PasswordCost PasswordCost::sensitive() {
        return {crypto_pwhash_OPSLIMIT_SENSITIVE, crypto_pwhash_MEMLIMIT_SENSITIVE};
    }

    PasswordCost PasswordCost::from_name(const std::string& name) {
        if (name == "min" || name == "minimum") {
            return minimum();
        }
        if (name == "interactive") {
            return interactive();
        }
        if (name == "moderate") {
            return moderate();
        }
        if (name == "sensitive") {
            return sensitive();
        }
        throw InvalidArgument("Unknown password cost preset: " + name);
    }

    // --- Crypto ---

    int Crypto::init() {
        if (g_sodium_initialized) {
            return 0;  // Already successfully initialized
        }

        if (sodium_init() < 0) {
            return -1;  // Initialization failed
        }

        g_sodium_initialized = true;
        return 0;
    }

    KeyPair Crypto::generate_kx_keypair() {
        ensure_initialized();
        KeyPair kp;
        kp.publicKey.data.resize(crypto_kx_PUBLICKEYBYTES);
        kp.privateKey.data = SecretBytes(crypto_kx_SECRETKEYBYTES);
        if (crypto_kx_keypair(kp.publicKey.data.data(), kp.privateKey.data.data()) != 0) {
            throw EntropyFailure("Failed to generate key exchange key pair.");
        }
        return kp;
    }

    KeyPair Crypto::generate_sign_keypair() {
        ensure_initialized();
        KeyPair kp;
        kp.publicKey.data.resize(crypto_sign_PUBLICKEYBYTES);
        kp.privateKey.data = SecretBytes(crypto_sign_SECRETKEYBYTES);
        if (crypto_sign_keypair(kp.publicKey.data.data(), kp.privateKey.data.data()) != 0) {
            throw EntropyFailure("Failed to generate signing key pair.");
        }
        return kp;
    }

    PublicKey Crypto::sign_public_key(const PrivateKey& private_key) {
        if (private_key.data.size() != crypto_sign_SECRETKEYBYTES) {
            throw InvalidArgument("Invalid private key size for signing.");
        }
        PublicKey pk;
        pk.data.resize(crypto_sign_PUBLICKEYBYTES);
        crypto_sign_ed25519_sk_to_pk(pk.data.data(), private_key.data.data());
        return pk;
    }

    Signature Crypto::sign(const byte_vector& message, const PrivateKey& private_key) {
        if (private_key.data.size() != crypto_sign_SECRETKEYBYTES) {
            throw InvalidArgument("Invalid private key size for signing.");
        }
        Signature sig;
        sig.data.resize(crypto_sign_BYTES);
        crypto_sign_detached(sig.data.data(), nullptr, message.data(), message.size(), private_key.data.data());
        return sig;
    }

    bool Crypto::verify(const Signature& signature, const byte_vector& message, const PublicKey& public_key) {
        if (signature.data.size() != crypto_sign_BYTES || public_key.data.size() != crypto_sign_PUBLICKEYBYTES) {
            return false;  // Invalid sizes
        }
        return crypto_sign_verify_detached(
                   signature.data.data(), message.data(), message.size(), public_key.data.data()) == 0;
    }

    SharedSecret Crypto::diffie_hellman(const PrivateKey& own_private, const PublicKey& peer_public) {
        if (own_private.data.size() != crypto_scalarmult_SCALARBYTES ||
            peer_public.data.size() != crypto_scalarmult_BYTES) {
            throw KeyExchangeError("Invalid key sizes for Diffie-Hellman.");
        }

        SharedSecret shared;
        shared.data = SecretBytes(crypto_scalarmult_BYTES);
        // Fails when the peer key is a low-order point and the result is all zero.
        if (crypto_scalarmult(shared.data.data(), own_private.data.data(), peer_public.data.data()) != 0) {
            throw KeyExchangeError("Diffie-Hellman produced a degenerate shared secret.");
        }
        return shared;
    }

    Crypto::SessionKeys Crypto::derive_keys(const SharedSecret& shared,
                                            const PublicKey& initiator_pk,
                                            const PublicKey& responder_pk,
                                            Role role) {
        if (shared.data.size() != crypto_scalarmult_BYTES ||
            initiator_pk.data.size() != crypto_kx_PUBLICKEYBYTES ||
            responder_pk.data.size() != crypto_kx_PUBLICKEYBYTES) {
            throw KeyExchangeError("Invalid key sizes for session key derivation.");
        }

        // master = BLAKE2b(shared || initiator_pk || responder_pk)
        SecretBytes master(crypto_kdf_KEYBYTES);
        crypto_generichash_state state;
        crypto_generichash_init(&state, nullptr, 0, master.size());
        crypto_generichash_update(&state, shared.data.data(), shared.data.size());
        crypto_generichash_update(&state, initiator_pk.data.data(), initiator_pk.data.size());
        crypto_generichash_update(&state, responder_pk.data.data(), responder_pk.data.size());
        crypto_generichash_final(&state, master.data(), master.size());
        sodium_memzero(&state, sizeof(state));

        SecretBytes i2r(SESSION_KEY_BYTES);
        SecretBytes r2i(SESSION_KEY_BYTES);
        byte_vector session_id(SESSION_ID_BYTES);
        crypto_kdf_derive_from_key(i2r.data(), i2r.size(), SUBKEY_INITIATOR_TO_RESPONDER, KDF_CONTEXT, master.data());
        crypto_kdf_derive_from_key(r2i.data(), r2i.size(), SUBKEY_RESPONDER_TO_INITIATOR, KDF_CONTEXT, master.data());
        crypto_kdf_derive_from_key(session_id.data(), session_id.size(), SUBKEY_SESSION_ID, KDF_CONTEXT, master.data());

        if (i2r == r2i) {
            throw KeyExchangeError("Derived send and receive keys are identical.");
        }

        SessionKeys keys;
        keys.session_id = std::move(session_id);
        if (role == Role::INITIATOR) {
            keys.tx = std::move(i2r);
            keys.rx = std::move(r2i);
        } else {
            keys.tx = std::move(r2i);
            keys.rx = std::move(i2r);
        }
        return keys;
    }

    byte_vector Crypto::seal(const SecretBytes& key,
                             const byte_vector& nonce,
                             const byte_vector& aad,
                             const byte_vector& plaintext) {
        if (key.size() != crypto_aead_xchacha20poly1305_ietf_KEYBYTES) {
            throw InvalidArgument("Invalid key size for encryption.");
        }
        if (nonce.size() != crypto_aead_xchacha20poly1305_ietf_NPUBBYTES) {
            throw InvalidArgument("Invalid nonce size for encryption.");
        }

        byte_vector ciphertext(plaintext.size() + crypto_aead_xchacha20poly1305_ietf_ABYTES);
        unsigned long long ciphertext_len = 0;
        crypto_aead_xchacha20poly1305_ietf_encrypt(ciphertext.data(),
                                                   &ciphertext_len,
                                                   plaintext.data(),
                                                   plaintext.size(),
                                                   aad.data(),
                                                   aad.size(),
                                                   nullptr,  // nsec is not used
                                                   nonce.data(),
                                                   key.data());
        ciphertext.resize(static_cast<size_t>(ciphertext_len));
        return ciphertext;
    }

    byte_vector Crypto::open(const SecretBytes& key,
                             const byte_vector& nonce,
                             const byte_vector& aad,
                             const byte_vector& ciphertext) {
        if (key.size() != crypto_aead_xchacha20poly1305_ietf_KEYBYTES) {
            throw InvalidArgument("Invalid key size for decryption.");
        }
        if (nonce.size() != crypto_aead_xchacha20poly1305_ietf_NPUBBYTES) {
            throw InvalidArgument("Invalid nonce size for decryption.");
        }
        if (ciphertext.size() < crypto_aead_xchacha20poly1305_ietf_ABYTES) {
            throw AuthFailure("Ciphertext too small to carry an authentication tag.");
        }

        byte_vector plaintext(ciphertext.size() - crypto_aead_xchacha20poly1305_ietf_ABYTES);
        unsigned long long plaintext_len = 0;
        if (crypto_aead_xchacha20poly1305_ietf_decrypt(plaintext.data(),
                                                       &plaintext_len,
                                                       nullptr,  // nsec is not used
                                                       ciphertext.data(),
                                                       ciphertext.size(),
                                                       aad.data(),
                                                       aad.size(),
                                                       nonce.data(),
                                                       key.data()) != 0) {
            throw AuthFailure("Failed to decrypt message. Authentication tag is invalid.");
        }
        plaintext.resize(static_cast<size_t>(plaintext_len));
        return plaintext;
    }

    SymmetricKey Crypto::stretch_password(const std::string& password,
                                          const byte_vector& salt,
                                          const PasswordCost& cost) {
        if (salt.size() != crypto_pwhash_SALTBYTES) {
            throw InvalidArgument("Invalid salt size for password stretching.");
        }
        ensure_initialized();

        SymmetricKey key;
        key.data = SecretBytes(crypto_aead_xchacha20poly1305_ietf_KEYBYTES);
        if (crypto_pwhash(key.data.data(),
                          key.data.size(),
                          password.data(),
                          password.size(),
                          salt.data(),
                          cost.opslimit,
                          cost.memlimit,
                          crypto_pwhash_ALG_ARGON2ID13) != 0) {
            throw RuntimeError("Password stretching failed (out of memory?).");
        }
        return key;
    }

    byte_vector Crypto::seal_with_password(const byte_vector& plaintext,
                                           const std::string& password,
                                           const PasswordCost& cost,
                                           const byte_vector& aad) {
        byte_vector salt = random_bytes(crypto_pwhash_SALTBYTES);
        byte_vector nonce = random_bytes(crypto_aead_xchacha20poly1305_ietf_NPUBBYTES);
        SymmetricKey key = stretch_password(password, salt, cost);

        byte_vector ciphertext = seal(key.data, nonce, aad, plaintext);

        byte_vector out;
        out.reserve(salt.size() + nonce.size() + ciphertext.size());
        out.insert(out.end(), salt.begin(), salt.end());
        out.insert(out.end(), nonce.begin(), nonce.end());
        out.insert(out.end(), ciphertext.begin(), ciphertext.end());
        return out;
    }

    byte_vector Crypto::open_with_password(const byte_vector& sealed,
                                           const std::string& password,
                                           const PasswordCost& cost,
                                           const byte_vector& aad) {
        constexpr size_t SALT_SIZE = crypto_pwhash_SALTBYTES;
        constexpr size_t NONCE_SIZE = crypto_aead_xchacha20poly1305_ietf_NPUBBYTES;
        if (sealed.size() < SALT_SIZE + NONCE_SIZE + crypto_aead_xchacha20poly1305_ietf_ABYTES) {
            throw CorruptStorage("Sealed blob too small to be valid.");
        }

        byte_vector salt(sealed.begin(), sealed.begin() + SALT_SIZE);
        byte_vector nonce(sealed.begin() + SALT_SIZE, sealed.begin() + SALT_SIZE + NONCE_SIZE);
        byte_vector ciphertext(sealed.begin() + SALT_SIZE + NONCE_SIZE, sealed.end());

        SymmetricKey key = stretch_password(password, salt, cost);
        try {
            return open(key.data, nonce, aad, ciphertext);
        } catch (const AuthFailure&) {
            throw WrongPassword("Password does not open this blob.");
        }
    }

    byte_vector Crypto::random_bytes(size_t len) {
        ensure_initialized();
        byte_vector out(len);
        randombytes_buf(out.data(), out.size());
        return out;
    }

    uint32_t Crypto::random_uniform(uint32_t upper_bound) {
        ensure_initialized();
        return randombytes_uniform(upper_bound);
    }

    void Crypto::secure_wipe(void* data, size_t len) {
        if (data != nullptr && len > 0) {
            sodium_memzero(data, len);
        }
    }

    void Crypto::secure_wipe(byte_vector& data) {
        secure_wipe(data.data(), data.size());
        data.clear();
    }

    byte_vector Crypto::pad(const byte_vector& data, size_t block_size) {
        if (block_size == 0) {
            throw InvalidArgument("Padding block size must be positive.");
        }
        byte_vector out(data.size() + block_size);
        std::copy(data.begin(), data.end(), out.begin());
        size_t padded_len = 0;
        if (sodium_pad(&padded_len, out.data(), data.size(), block_size, out.size()) != 0) {
            throw InvalidArgument("Failed to pad data.");
        }
        out.resize(padded_len);
        return out;
    }

    byte_vector Crypto::unpad(const byte_vector& data, size_t block_size) {
        if (block_size == 0) {
            throw InvalidArgument("Padding block size must be positive.");
        }
        size_t unpadded_len = 0;
        if (data.empty() || sodium_unpad(&unpadded_len, data.data(), data.size(), block_size) != 0) {
            throw MalformedMessage("Invalid message padding.");
        }
        return byte_vector(data.begin(), data.begin() + unpadded_len);
    }

    byte_vector Crypto::sha256(const byte_vector& data) {
        byte_vector digest(crypto_hash_sha256_BYTES);
        crypto_hash_sha256(digest.data(), data.data(), data.size());
        return digest;
    }

    std::string Crypto::to_hex(const byte_vector& data) {
        std::string hex(data.size() * 2 + 1, '\0');
        sodium_bin2hex(&hex[0], hex.size(), data.data(), data.size());
        hex.resize(data.size() * 2);
        return hex;
    }

    std::string Crypto::to_base64(const byte_vector& data) {
        const size_t encoded_len = sodium_base64_ENCODED_LEN(data.size(), sodium_base64_VARIANT_ORIGINAL);
        std::string b64(encoded_len, '\0');
        sodium_bin2base64(&b64[0], b64.size(), data.data(), data.size(), sodium_base64_VARIANT_ORIGINAL);
        b64.resize(encoded_len - 1);  // drop the terminating NUL
        return b64;
    }

    std::string Crypto::fingerprint(const PublicKey& public_key) {
        byte_vector digest = sha256(public_key.data);
        std::string raw = to_base64(byte_vector(digest.begin(), digest.begin() + 8));

        std::string formatted;
        for (size_t i = 0; i < raw.size(); ++i) {
            if (i > 0 && i % 4 == 0) {
                formatted.push_back('-');
            }
            formatted.push_back(raw[i]);
        }
        return formatted;
    }

}  // namespace OnionChat
