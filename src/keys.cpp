#include "onionchat/keys.hpp"

#include <sodium.h>

#include <cstring>
#include <utility>

#include "onionchat/errors.hpp"

namespace OnionChat {

SecretBytes::SecretBytes(size_t size) {
    if (size == 0) {
        return;
    }
    data_ = static_cast<uint8_t*>(sodium_malloc(size));
    if (data_ == nullptr) {
        throw RuntimeError("Secure allocation failed.");
    }
    sodium_memzero(data_, size);
    size_ = size;
}

SecretBytes::SecretBytes(const uint8_t* data, size_t size) : SecretBytes(size) {
    if (size_ > 0) {
        std::memcpy(data_, data, size_);
    }
}

SecretBytes::~SecretBytes() {
    wipe();
}

SecretBytes::SecretBytes(const SecretBytes& other) : SecretBytes(other.data_, other.size_) {}

SecretBytes& SecretBytes::operator=(const SecretBytes& other) {
    if (this != &other) {
        SecretBytes copy(other);
        *this = std::move(copy);
    }
    return *this;
}

SecretBytes::SecretBytes(SecretBytes&& other) noexcept : data_(other.data_), size_(other.size_) {
    other.data_ = nullptr;
    other.size_ = 0;
}

SecretBytes& SecretBytes::operator=(SecretBytes&& other) noexcept {
    if (this != &other) {
        wipe();
        data_ = other.data_;
        size_ = other.size_;
        other.data_ = nullptr;
        other.size_ = 0;
    }
    return *this;
}

void SecretBytes::wipe() noexcept {
    if (data_ != nullptr) {
        // sodium_free zeroes the region before unmapping it.
        sodium_free(data_);
        data_ = nullptr;
    }
    size_ = 0;
}

bool SecretBytes::operator==(const SecretBytes& other) const {
    if (size_ != other.size_) {
        return false;
    }
    if (size_ == 0) {
        return true;
    }
    return sodium_memcmp(data_, other.data_, size_) == 0;
}

} // namespace OnionChat
