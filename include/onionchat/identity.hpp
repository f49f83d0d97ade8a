#ifndef ONIONCHAT_IDENTITY_HPP
#define ONIONCHAT_IDENTITY_HPP

#include <cstdint>
#include <optional>
#include <shared_mutex>
#include <string>

#include "crypto.hpp"
#include "keys.hpp"

namespace OnionChat {

    /**
     * @brief The public half of the local long-term identity.
     */
    struct Identity {
        PublicKey public_key;      // Ed25519
        std::string address;       // Tor v3 address derived from public_key
        int64_t created_at = 0;    // unix seconds
    };

    /**
     * @brief Owns the local long-term key pair.
     *
     * The private key lives in guarded memory inside the store and is only
     * used through sign(). It leaves the store solely in sealed form
     * (export_identity / save with a password) or in the plain storage form
     * meant for an already encrypted blob store.
     *
     * sign() may run concurrently from several handshakes; create, load,
     * import and wipe take the store exclusively.
     */
    class IdentityStore {
    public:
        explicit IdentityStore(PasswordCost cost = PasswordCost::interactive());

        /**
         * @brief Generates a fresh identity, replacing any loaded one.
         * @throws EntropyFailure if no key material can be produced.
         */
        Identity create_identity();

        /**
         * @brief Loads a blob produced by save().
         * @param password Required when the blob was saved with a password.
         * @throws CorruptStorage, WrongPassword
         */
        Identity load(const byte_vector& storage_blob, const std::optional<std::string>& password);

        /**
         * @brief Serializes the identity for the local blob store.
         * @param password When present the private key is sealed with it;
         *                 otherwise the blob relies on the store's own encryption.
         */
        byte_vector save(const std::optional<std::string>& password) const;

        /**
         * @brief Password-protected backup: Argon2id + XChaCha20-Poly1305.
         */
        byte_vector export_identity(const std::string& password) const;

        /**
         * @brief Restores a backup produced by export_identity().
         *
         * A damaged ciphertext fails authentication exactly like a wrong
         * password does, so both surface as WrongPassword. Only damage to the
         * header or the framing is reported as CorruptStorage.
         * @throws WrongPassword, CorruptStorage
         */
        Identity import_identity(const byte_vector& blob, const std::string& password);

        bool has_identity() const;

        /**
         * @throws LogicError if no identity is loaded.
         */
        Identity identity() const;
        std::string address() const;
        PublicKey public_key() const;
        std::string fingerprint() const;

        /**
         * @brief Signs with the long-term key.
         * @throws LogicError if no identity is loaded.
         */
        Signature sign(const byte_vector& message) const;

        /**
         * @brief Zeroes the private key and forgets the identity.
         */
        void wipe();

    private:
        Identity install(PublicKey public_key, PrivateKey private_key, int64_t created_at);

        PasswordCost cost_;
        mutable std::shared_mutex mutex_;
        std::optional<Identity> identity_;
        PrivateKey private_key_;
    };

} // namespace OnionChat

#endif // ONIONCHAT_IDENTITY_HPP
