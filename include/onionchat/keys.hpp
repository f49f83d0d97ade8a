#ifndef ONIONCHAT_KEYS_HPP
#define ONIONCHAT_KEYS_HPP

#include <cstddef>
#include <cstdint>
#include <vector>

namespace OnionChat {

    // Using a simple vector of bytes for public data representation.
    using byte_vector = std::vector<uint8_t>;

    /**
     * @brief A fixed-size buffer for secret material.
     *
     * The storage comes from sodium_malloc: it is locked in RAM, surrounded by
     * guard pages and zeroed when released. Copies allocate a new guarded region.
     */
    class SecretBytes {
    public:
        SecretBytes() = default;
        explicit SecretBytes(size_t size);
        SecretBytes(const uint8_t* data, size_t size);
        ~SecretBytes();

        SecretBytes(const SecretBytes& other);
        SecretBytes& operator=(const SecretBytes& other);
        SecretBytes(SecretBytes&& other) noexcept;
        SecretBytes& operator=(SecretBytes&& other) noexcept;

        uint8_t* data() { return data_; }
        const uint8_t* data() const { return data_; }
        size_t size() const { return size_; }
        bool empty() const { return size_ == 0; }

        /**
         * @brief Zeroes and releases the buffer. The object becomes empty.
         */
        void wipe() noexcept;

        // Constant-time comparison.
        bool operator==(const SecretBytes& other) const;
        bool operator!=(const SecretBytes& other) const { return !(*this == other); }

    private:
        uint8_t* data_ = nullptr;
        size_t size_ = 0;
    };

    // A generic structure for a public key.
    struct PublicKey {
        byte_vector data;
    };

    // A generic structure for a private key.
    struct PrivateKey {
        SecretBytes data;
    };

    // A key pair consisting of a public and a private key.
    struct KeyPair {
        PublicKey publicKey;
        PrivateKey privateKey;
    };

    // A digital signature.
    struct Signature {
        byte_vector data;
    };

    // Output of an X25519 scalar multiplication.
    struct SharedSecret {
        SecretBytes data;
    };

    // A 256-bit key for the AEAD or for password-based sealing.
    struct SymmetricKey {
        SecretBytes data;
    };

} // namespace OnionChat

#endif // ONIONCHAT_KEYS_HPP
