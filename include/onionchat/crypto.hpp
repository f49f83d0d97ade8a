#ifndef ONIONCHAT_CRYPTO_HPP
#define ONIONCHAT_CRYPTO_HPP

#include "keys.hpp"

#include <cstddef>
#include <string>

namespace OnionChat {

    // Context for the session key derivation (crypto_kdf requires exactly 8 bytes).
    constexpr char KDF_CONTEXT[] = "OnionChS";

    // Domain separation prefix for handshake signatures.
    constexpr char HANDSHAKE_SIGN_CONTEXT[] = "OnionChat handshake v1";

    constexpr size_t KX_KEY_BYTES = 32;
    constexpr size_t SIGN_PUBLIC_KEY_BYTES = 32;
    constexpr size_t SIGN_SECRET_KEY_BYTES = 64;
    constexpr size_t SIGNATURE_BYTES = 64;
    constexpr size_t SESSION_KEY_BYTES = 32;
    constexpr size_t SESSION_ID_BYTES = 16;
    constexpr size_t AEAD_NONCE_BYTES = 24;
    constexpr size_t AEAD_TAG_BYTES = 16;
    constexpr size_t PWHASH_SALT_BYTES = 16;

    /**
     * @brief Which side of the key exchange a party played.
     *
     * The initiator is the party whose hello was sent first on the connection.
     */
    enum class Role {
        INITIATOR,
        RESPONDER
    };

    /**
     * @brief Argon2id cost parameters for password stretching.
     */
    struct PasswordCost {
        unsigned long long opslimit;
        size_t memlimit;

        static PasswordCost minimum();
        static PasswordCost interactive();
        static PasswordCost moderate();
        static PasswordCost sensitive();

        /**
         * @brief Resolves a preset by name ("min", "interactive", "moderate", "sensitive").
         * @throws InvalidArgument for an unknown name.
         */
        static PasswordCost from_name(const std::string& name);
    };

    class Crypto {
    public:
        /**
         * @brief Initializes the cryptographic library. Must be called once.
         * @return 0 on success, -1 on error.
         */
        static int init();

        /**
         * @brief Generates an X25519 key pair for the key exchange.
         * @throws EntropyFailure if the library is not initialized.
         */
        static KeyPair generate_kx_keypair();

        /**
         * @brief Generates an Ed25519 key pair for long-term identities.
         * @throws EntropyFailure if the library is not initialized.
         */
        static KeyPair generate_sign_keypair();

        /**
         * @brief Recomputes the Ed25519 public key embedded in a secret key.
         */
        static PublicKey sign_public_key(const PrivateKey& private_key);

        /**
         * @brief Creates a detached digital signature for a given message.
         */
        static Signature sign(const byte_vector& message, const PrivateKey& private_key);

        /**
         * @brief Verifies a digital signature.
         * @return True if the signature is valid, false otherwise.
         */
        static bool verify(const Signature& signature, const byte_vector& message, const PublicKey& public_key);

        /**
         * @brief X25519 scalar multiplication.
         * @throws KeyExchangeError for malformed keys or a low-order peer point.
         */
        static SharedSecret diffie_hellman(const PrivateKey& own_private, const PublicKey& peer_public);

        /**
         * @brief The directional keys of a session plus its identifier.
         */
        struct SessionKeys {
            SecretBytes rx; // Key for receiving data
            SecretBytes tx; // Key for sending data
            byte_vector session_id;
        };

        /**
         * @brief Derives direction-separated session keys from a DH result.
         *
         * Both parties pass the same initiator/responder public keys; the role
         * decides which subkey becomes tx. The initiator's tx equals the
         * responder's rx and vice versa.
         *
         * @throws KeyExchangeError on bad key sizes or if tx == rx.
         */
        static SessionKeys derive_keys(const SharedSecret& shared,
                                       const PublicKey& initiator_pk,
                                       const PublicKey& responder_pk,
                                       Role role);

        /**
         * @brief XChaCha20-Poly1305 (IETF) encryption.
         * @return Ciphertext with the 16-byte tag appended.
         */
        static byte_vector seal(const SecretBytes& key,
                                const byte_vector& nonce,
                                const byte_vector& aad,
                                const byte_vector& plaintext);

        /**
         * @brief XChaCha20-Poly1305 (IETF) decryption.
         * @throws AuthFailure if the tag does not verify.
         */
        static byte_vector open(const SecretBytes& key,
                                const byte_vector& nonce,
                                const byte_vector& aad,
                                const byte_vector& ciphertext);

        /**
         * @brief Argon2id key stretching.
         * @throws RuntimeError if the cost cannot be satisfied (out of memory).
         */
        static SymmetricKey stretch_password(const std::string& password,
                                             const byte_vector& salt,
                                             const PasswordCost& cost);

        /**
         * @brief Seals data under a password: [salt (16) | nonce (24) | ciphertext].
         *
         * aad is authenticated but not stored.
         */
        static byte_vector seal_with_password(const byte_vector& plaintext,
                                              const std::string& password,
                                              const PasswordCost& cost,
                                              const byte_vector& aad = {});

        /**
         * @brief Reverses seal_with_password.
         * @throws WrongPassword if authentication fails, CorruptStorage if the blob is truncated.
         */
        static byte_vector open_with_password(const byte_vector& sealed,
                                              const std::string& password,
                                              const PasswordCost& cost,
                                              const byte_vector& aad = {});

        static byte_vector random_bytes(size_t len);

        // Uniform value in [0, upper_bound).
        static uint32_t random_uniform(uint32_t upper_bound);

        static void secure_wipe(void* data, size_t len);
        static void secure_wipe(byte_vector& data);

        /**
         * @brief ISO/IEC 7816-4 padding to a multiple of block_size.
         */
        static byte_vector pad(const byte_vector& data, size_t block_size);

        /**
         * @brief Removes ISO/IEC 7816-4 padding.
         * @throws MalformedMessage if the padding is invalid.
         */
        static byte_vector unpad(const byte_vector& data, size_t block_size);

        static byte_vector sha256(const byte_vector& data);

        static std::string to_hex(const byte_vector& data);

        static std::string to_base64(const byte_vector& data);

        /**
         * @brief Short human-comparable key fingerprint, e.g. "q2Xy-Lm9A-bC0=".
         *
         * Base64 of the first 8 bytes of SHA-256(public key), grouped by 4.
         */
        static std::string fingerprint(const PublicKey& public_key);
    };

} // namespace OnionChat

#endif // ONIONCHAT_CRYPTO_HPP
