#include "onionchat/onion_address.hpp"

#include <openssl/evp.h>

#include <algorithm>
#include <cctype>
#include <memory>

#include "onionchat/errors.hpp"

namespace OnionChat {

namespace {

constexpr char BASE32_ALPHABET[] = "abcdefghijklmnopqrstuvwxyz234567";
constexpr char CHECKSUM_PREFIX[] = ".onion checksum";
constexpr size_t PUBKEY_BYTES = 32;
constexpr size_t CHECKSUM_BYTES = 2;

byte_vector sha3_256(const byte_vector& data) {
    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    if (!ctx) {
        throw RuntimeError("Failed to allocate digest context.");
    }

    byte_vector digest(EVP_MAX_MD_SIZE);
    unsigned int digest_len = 0;
    if (EVP_DigestInit_ex(ctx.get(), EVP_sha3_256(), nullptr) != 1 ||
        EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1 ||
        EVP_DigestFinal_ex(ctx.get(), digest.data(), &digest_len) != 1) {
        throw RuntimeError("SHA3-256 computation failed.");
    }
    digest.resize(digest_len);
    return digest;
}

byte_vector checksum(const byte_vector& pubkey) {
    byte_vector input(CHECKSUM_PREFIX, CHECKSUM_PREFIX + sizeof(CHECKSUM_PREFIX) - 1);
    input.insert(input.end(), pubkey.begin(), pubkey.end());
    input.push_back(ONION_VERSION);
    byte_vector digest = sha3_256(input);
    return byte_vector(digest.begin(), digest.begin() + CHECKSUM_BYTES);
}

std::string strip_suffix(const std::string& address) {
    std::string lowered(address);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    const std::string suffix(ONION_SUFFIX);
    if (lowered.size() >= suffix.size() &&
        lowered.compare(lowered.size() - suffix.size(), suffix.size(), suffix) == 0) {
        lowered.resize(lowered.size() - suffix.size());
    }
    return lowered;
}

// Returns pubkey || checksum || version, or an empty vector when malformed.
byte_vector decode_body(const std::string& address) {
    const std::string body = strip_suffix(address);
    if (body.size() != ONION_ADDRESS_CHARS) {
        return {};
    }
    byte_vector raw;
    if (!OnionAddress::base32_decode(body, raw) || raw.size() != PUBKEY_BYTES + CHECKSUM_BYTES + 1) {
        return {};
    }
    return raw;
}

} // namespace

std::string OnionAddress::from_public_key(const PublicKey& public_key) {
    if (public_key.data.size() != PUBKEY_BYTES) {
        throw InvalidArgument("Onion addresses are derived from 32-byte Ed25519 keys.");
    }

    byte_vector raw(public_key.data);
    byte_vector sum = checksum(public_key.data);
    raw.insert(raw.end(), sum.begin(), sum.end());
    raw.push_back(ONION_VERSION);

    return base32_encode(raw) + ONION_SUFFIX;
}

bool OnionAddress::is_valid(const std::string& address) {
    byte_vector raw = decode_body(address);
    if (raw.empty() || raw.back() != ONION_VERSION) {
        return false;
    }
    byte_vector pubkey(raw.begin(), raw.begin() + PUBKEY_BYTES);
    byte_vector stored(raw.begin() + PUBKEY_BYTES, raw.begin() + PUBKEY_BYTES + CHECKSUM_BYTES);
    return checksum(pubkey) == stored;
}

std::string OnionAddress::normalize(const std::string& address) {
    if (!is_valid(address)) {
        throw InvalidArgument("Invalid onion address: " + address);
    }
    return strip_suffix(address) + ONION_SUFFIX;
}

PublicKey OnionAddress::public_key(const std::string& address) {
    if (!is_valid(address)) {
        throw InvalidArgument("Invalid onion address: " + address);
    }
    byte_vector raw = decode_body(address);
    PublicKey pk;
    pk.data.assign(raw.begin(), raw.begin() + PUBKEY_BYTES);
    return pk;
}

std::string OnionAddress::base32_encode(const byte_vector& data) {
    std::string out;
    out.reserve((data.size() * 8 + 4) / 5);

    uint32_t buffer = 0;
    int bits = 0;
    for (uint8_t byte : data) {
        buffer = (buffer << 8) | byte;
        bits += 8;
        while (bits >= 5) {
            out.push_back(BASE32_ALPHABET[(buffer >> (bits - 5)) & 0x1F]);
            bits -= 5;
        }
    }
    if (bits > 0) {
        out.push_back(BASE32_ALPHABET[(buffer << (5 - bits)) & 0x1F]);
    }
    return out;
}

bool OnionAddress::base32_decode(const std::string& text, byte_vector& out) {
    out.clear();
    out.reserve(text.size() * 5 / 8);

    uint32_t buffer = 0;
    int bits = 0;
    for (char c : text) {
        uint32_t value;
        if (c >= 'a' && c <= 'z') {
            value = static_cast<uint32_t>(c - 'a');
        } else if (c >= '2' && c <= '7') {
            value = static_cast<uint32_t>(c - '2' + 26);
        } else {
            return false;
        }
        buffer = (buffer << 5) | value;
        bits += 5;
        if (bits >= 8) {
            out.push_back(static_cast<uint8_t>(buffer >> (bits - 8)));
            bits -= 8;
        }
    }
    return true;
}

} // namespace OnionChat
