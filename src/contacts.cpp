#include "onionchat/contacts.hpp"

#include "onionchat/errors.hpp"
#include "onionchat/log.hpp"
#include "onionchat/message.hpp"
#include "onionchat/onion_address.hpp"
#include "onionchat/packet.hpp"

namespace OnionChat {

namespace {

// Blob: [magic] [opslimit] [memlimit] [salt | nonce | ciphertext].
// The header is the AAD; the plaintext is a CONTACT_LIST payload.
constexpr Payload::OpCode CONTACTS_SEALED = 0x4301;
constexpr Payload::OpCode CONTACT_LIST = 0x4302;
constexpr char CONTACTS_MAGIC[] = "onionchat-contacts-v1";

PayloadBuilder contacts_header(const PasswordCost& cost) {
    PayloadBuilder builder(CONTACTS_SEALED);
    builder.add_param(CONTACTS_MAGIC)
        .add_param(static_cast<uint64_t>(cost.opslimit))
        .add_param(static_cast<uint64_t>(cost.memlimit));
    return builder;
}

} // namespace

ContactBook::ContactBook(PasswordCost cost) : cost_(cost) {}

bool ContactBook::add(const std::string& address, const std::string& nickname, const std::string& fingerprint) {
    Contact contact;
    contact.address = OnionAddress::normalize(address);
    contact.nickname = nickname;
    contact.fingerprint = fingerprint;
    contact.added_at = unix_time_now();

    std::lock_guard<std::mutex> lock(mutex_);
    return contacts_.emplace(contact.address, contact).second;
}

bool ContactBook::remove(const std::string& address) {
    if (!OnionAddress::is_valid(address)) {
        return false;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    return contacts_.erase(OnionAddress::normalize(address)) > 0;
}

std::optional<Contact> ContactBook::find(const std::string& address) const {
    if (!OnionAddress::is_valid(address)) {
        return std::nullopt;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = contacts_.find(OnionAddress::normalize(address));
    if (it == contacts_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<Contact> ContactBook::list() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Contact> out;
    out.reserve(contacts_.size());
    for (const auto& item : contacts_) {
        out.push_back(item.second);
    }
    return out;
}

size_t ContactBook::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return contacts_.size();
}

bool ContactBook::set_online(const std::string& address, bool online, int64_t when) {
    if (!OnionAddress::is_valid(address)) {
        return false;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = contacts_.find(OnionAddress::normalize(address));
    if (it == contacts_.end()) {
        return false;
    }
    it->second.online = online;
    if (when > it->second.last_seen) {
        it->second.last_seen = when;
    }
    return true;
}

void ContactBook::apply(const Event& event) {
    const int64_t now = unix_time_now();
    if (std::holds_alternative<HandshakeCompleted>(event) || std::holds_alternative<MessageReceived>(event)) {
        set_online(event_address(event), true, now);
    } else if (std::holds_alternative<ConnectionLost>(event)) {
        set_online(event_address(event), false, now);
    }
}

byte_vector ContactBook::save(const std::string& password) const {
    PayloadBuilder list(CONTACT_LIST);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        list.add_param(static_cast<uint32_t>(contacts_.size()));
        for (const auto& item : contacts_) {
            const Contact& c = item.second;
            list.add_param(c.address)
                .add_param(c.nickname)
                .add_param(c.last_seen)
                .add_param(c.fingerprint)
                .add_param(c.added_at);
        }
    }

    byte_vector plaintext = list.build().serialize();
    byte_vector aad = contacts_header(cost_).build().serialize();
    byte_vector sealed = Crypto::seal_with_password(plaintext, password, cost_, aad);
    Crypto::secure_wipe(plaintext);

    return contacts_header(cost_).add_param(sealed).build().serialize();
}

void ContactBook::load(const byte_vector& blob, const std::string& password) {
    PasswordCost cost{};
    byte_vector sealed;
    try {
        Payload payload = Payload::deserialize(blob);
        if (payload.op_code != CONTACTS_SEALED) {
            throw CorruptStorage("Not a contact book blob.");
        }
        PayloadReader reader(payload);
        if (reader.read_param<std::string>() != CONTACTS_MAGIC) {
            throw CorruptStorage("Contact book blob has a bad magic value.");
        }
        cost.opslimit = reader.read_param<uint64_t>();
        cost.memlimit = static_cast<size_t>(reader.read_param<uint64_t>());
        sealed = reader.read_param<byte_vector>();
    } catch (const MalformedMessage& e) {
        throw CorruptStorage(std::string("Truncated contact book: ") + e.what());
    }

    const PasswordCost ceiling = PasswordCost::sensitive();
    if (cost.opslimit > ceiling.opslimit || cost.memlimit > ceiling.memlimit) {
        throw CorruptStorage("Contact book requests an out-of-range password cost.");
    }

    byte_vector plaintext =
        Crypto::open_with_password(sealed, password, cost, contacts_header(cost).build().serialize());

    std::map<std::string, Contact> loaded;
    try {
        Payload payload = Payload::deserialize(plaintext);
        if (payload.op_code != CONTACT_LIST) {
            throw CorruptStorage("Contact book holds an unknown record type.");
        }
        PayloadReader reader(payload);
        const uint32_t count = reader.read_param<uint32_t>();
        for (uint32_t i = 0; i < count; ++i) {
            Contact c;
            c.address = reader.read_param<std::string>();
            c.nickname = reader.read_param<std::string>();
            c.last_seen = reader.read_param<int64_t>();
            c.fingerprint = reader.read_param<std::string>();
            c.added_at = reader.read_param<int64_t>();
            if (!OnionAddress::is_valid(c.address)) {
                throw CorruptStorage("Contact book holds an invalid address.");
            }
            c.address = OnionAddress::normalize(c.address);
            loaded[c.address] = c;
        }
    } catch (const MalformedMessage& e) {
        Crypto::secure_wipe(plaintext);
        throw CorruptStorage(std::string("Truncated contact list: ") + e.what());
    }
    Crypto::secure_wipe(plaintext);

    std::lock_guard<std::mutex> lock(mutex_);
    contacts_.swap(loaded);
    Log::debug("Loaded " + std::to_string(contacts_.size()) + " contacts");
}

} // namespace OnionChat
