#ifndef ONIONCHAT_CONTACTS_HPP
#define ONIONCHAT_CONTACTS_HPP

#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "crypto.hpp"
#include "events.hpp"
#include "keys.hpp"

namespace OnionChat {

    struct Contact {
        std::string address;
        std::string nickname;
        bool online = false;       // not persisted
        int64_t last_seen = 0;     // unix seconds, 0 if never seen
        std::string fingerprint;   // empty if not verified
        int64_t added_at = 0;
    };

    /**
     * @brief Application-side address book.
     *
     * Keyed by normalized address. The whole book is sealed with a password
     * for storage, in the same salt | nonce | ciphertext form as identity
     * backups.
     */
    class ContactBook {
    public:
        explicit ContactBook(PasswordCost cost = PasswordCost::interactive());

        /**
         * @brief Adds a contact. Adding an address that is already present does nothing.
         * @return false if the address was already present.
         * @throws InvalidArgument if the address is not a valid onion address.
         */
        bool add(const std::string& address, const std::string& nickname, const std::string& fingerprint = "");

        bool remove(const std::string& address);
        std::optional<Contact> find(const std::string& address) const;

        // Sorted by address.
        std::vector<Contact> list() const;
        size_t size() const;

        /**
         * @brief Updates presence for a known contact.
         * @return false if the address is not in the book.
         */
        bool set_online(const std::string& address, bool online, int64_t when);

        /**
         * @brief Tracks presence from connection events: online on
         * HandshakeCompleted and MessageReceived, offline on ConnectionLost.
         */
        void apply(const Event& event);

        /**
         * @brief Seals every contact under the password.
         */
        byte_vector save(const std::string& password) const;

        /**
         * @brief Replaces the book with the contents of a blob from save().
         * @throws WrongPassword, CorruptStorage
         */
        void load(const byte_vector& blob, const std::string& password);

    private:
        PasswordCost cost_;
        mutable std::mutex mutex_;
        std::map<std::string, Contact> contacts_;
    };

} // namespace OnionChat

#endif // ONIONCHAT_CONTACTS_HPP
