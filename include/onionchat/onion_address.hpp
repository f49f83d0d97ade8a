#ifndef ONIONCHAT_ONION_ADDRESS_HPP
#define ONIONCHAT_ONION_ADDRESS_HPP

#include <string>

#include "keys.hpp"

namespace OnionChat {

    constexpr char ONION_SUFFIX[] = ".onion";
    constexpr size_t ONION_ADDRESS_CHARS = 56;  // without the suffix
    constexpr uint8_t ONION_VERSION = 0x03;

    /**
     * @brief Tor v3 hidden-service addresses.
     *
     * address = base32(pubkey || checksum || version) + ".onion"
     * checksum = SHA3-256(".onion checksum" || pubkey || version)[:2]
     *
     * The address commits to the Ed25519 identity key, so reaching an address
     * through Tor and verifying a signature by the committed key authenticates
     * the peer.
     */
    class OnionAddress {
    public:
        /**
         * @brief Derives the address for an Ed25519 public key.
         * @throws InvalidArgument if the key is not 32 bytes.
         */
        static std::string from_public_key(const PublicKey& public_key);

        /**
         * @brief Checks length, alphabet, version byte and checksum.
         * Accepts the address with or without the ".onion" suffix, in any case.
         */
        static bool is_valid(const std::string& address);

        /**
         * @brief Lowercases and appends ".onion" when missing.
         * @throws InvalidArgument if the result is not a valid address.
         */
        static std::string normalize(const std::string& address);

        /**
         * @brief Recovers the public key an address commits to.
         * @throws InvalidArgument if the address is not valid.
         */
        static PublicKey public_key(const std::string& address);

        static std::string base32_encode(const byte_vector& data);

        /**
         * @brief Decodes lowercase RFC 4648 base32 without padding.
         * @return false on characters outside the alphabet.
         */
        static bool base32_decode(const std::string& text, byte_vector& out);
    };

} // namespace OnionChat

#endif // ONIONCHAT_ONION_ADDRESS_HPP
