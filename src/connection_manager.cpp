#include "onionchat/connection_manager.hpp"

#include <utility>

#include "onionchat/errors.hpp"
#include "onionchat/log.hpp"
#include "onionchat/onion_address.hpp"

namespace OnionChat {

namespace {

// Upper bound for everything a sealed frame adds to the padded plaintext.
constexpr size_t FRAME_OVERHEAD = 256;

} // namespace

struct ConnectionManager::PeerEntry {
    PeerEntry(boost::asio::io_context& io, std::string peer, const ProtocolConfig& config)
        : address(std::move(peer)),
          reconnect(config.backoff_base, config.backoff_max, config.backoff_jitter_percent, config.max_retries),
          handshake_timer(io),
          retry_timer(io),
          keepalive_timer(io) {}

    std::mutex mutex;
    const std::string address;
    bool removed = false;
    bool dialer = false;         // the consumer asked for this connection
    bool link_outbound = false;  // the current link was dialed by us
    uint64_t generation = 0;     // identifies the current link and its timers

    std::shared_ptr<net::Link> link;
    std::unique_ptr<Handshake> handshake;
    std::unique_ptr<Session> session;

    ReconnectPolicy reconnect;
    bool retry_pending = false;
    boost::asio::steady_timer handshake_timer;
    boost::asio::steady_timer retry_timer;
    boost::asio::steady_timer keepalive_timer;
    std::chrono::steady_clock::time_point last_inbound;
};

// Where the callbacks of an accepted link go: to the pending handshake
// first, then to the peer entry that adopted the link.
struct ConnectionManager::InboundRoute {
    std::mutex mutex;
    std::weak_ptr<PendingInbound> pending;
    std::weak_ptr<PeerEntry> entry;
    uint64_t generation = 0;
};

struct ConnectionManager::PendingInbound {
    explicit PendingInbound(boost::asio::io_context& io) : timer(io) {}

    std::mutex mutex;
    uint64_t id = 0;
    bool done = false;
    std::shared_ptr<net::Link> link;
    std::unique_ptr<Handshake> handshake;
    std::shared_ptr<InboundRoute> route;
    boost::asio::steady_timer timer;
};

const char* to_string(ConnectionManager::PeerState state) {
    switch (state) {
        case ConnectionManager::PeerState::CONNECTING: return "connecting";
        case ConnectionManager::PeerState::HANDSHAKING: return "handshaking";
        case ConnectionManager::PeerState::ESTABLISHED: return "established";
        case ConnectionManager::PeerState::BACKOFF: return "backoff";
    }
    return "unknown";
}

ConnectionManager::ConnectionManager(boost::asio::io_context& io,
                                     const IdentityStore& identity,
                                     net::Transport& transport,
                                     ProtocolConfig config)
    : io_(io),
      identity_(identity),
      transport_(transport),
      config_(std::move(config)),
      local_address_(identity.address()) {}

ConnectionManager::~ConnectionManager() {
    shutdown();
}

void ConnectionManager::start() {
    transport_.set_accept_handler([this](std::shared_ptr<net::Link> link) { return accept(std::move(link)); });
    Log::info("Accepting connections for " + local_address_);
}

void ConnectionManager::shutdown() {
    transport_.set_accept_handler(nullptr);

    for (const auto& address : peers()) {
        disconnect(address);
    }

    std::map<uint64_t, std::shared_ptr<PendingInbound>> pending;
    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        pending.swap(pending_);
    }
    for (auto& item : pending) {
        std::lock_guard<std::mutex> lock(item.second->mutex);
        item.second->done = true;
        item.second->timer.cancel();
        item.second->handshake.reset();
        item.second->link->close();
    }
}

// --- Registry ---

std::shared_ptr<ConnectionManager::PeerEntry> ConnectionManager::find_entry(const std::string& address) const {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    auto it = peers_.find(address);
    return it == peers_.end() ? nullptr : it->second;
}

std::shared_ptr<ConnectionManager::PeerEntry> ConnectionManager::get_or_create_entry(const std::string& address) {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    auto it = peers_.find(address);
    if (it != peers_.end()) {
        return it->second;
    }
    auto entry = std::make_shared<PeerEntry>(io_, address, config_);
    peers_.emplace(address, entry);
    return entry;
}

void ConnectionManager::erase_entry(const std::shared_ptr<PeerEntry>& entry) {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    auto it = peers_.find(entry->address);
    if (it != peers_.end() && it->second == entry) {
        peers_.erase(it);
    }
}

std::string ConnectionManager::resolve_address(const std::string& address) const {
    std::string normalized = OnionAddress::normalize(address);
    if (normalized == local_address_) {
        throw InvalidArgument("Refusing to connect to our own address.");
    }
    return normalized;
}

// --- Commands ---

void ConnectionManager::connect(const std::string& address) {
    const std::string peer = resolve_address(address);

    EventList events;
    bool erase = false;
    std::shared_ptr<PeerEntry> entry;
    for (;;) {
        entry = get_or_create_entry(peer);
        std::lock_guard<std::mutex> lock(entry->mutex);
        if (entry->removed) {
            // Lost a race with a teardown; drop the stale entry and retry.
            erase_entry(entry);
            continue;
        }
        entry->dialer = true;
        if (entry->link || entry->retry_pending) {
            return;
        }
        entry->reconnect.reset();
        try {
            start_attempt(entry, events);
        } catch (const Exception& e) {
            Log::warn("Cannot dial " + peer + ": " + e.what());
            erase = handle_failure(entry, HandshakeFailure::TRANSPORT, true, events);
        }
        break;
    }
    if (erase) {
        erase_entry(entry);
    }
    events_.push_all(std::move(events));
}

void ConnectionManager::disconnect(const std::string& address) {
    const std::string peer = OnionAddress::normalize(address);
    auto entry = find_entry(peer);
    if (!entry) {
        return;
    }

    EventList events;
    {
        std::lock_guard<std::mutex> lock(entry->mutex);
        if (entry->removed) {
            return;
        }
        const bool had_session = entry->session != nullptr;
        const bool had_attempt = entry->handshake != nullptr || entry->retry_pending;
        if (entry->session && entry->link) {
            try {
                WireMessage bye = entry->session->seal_outbound({}, MessageType::DISCONNECT);
                entry->link->send(bye.serialize());
            } catch (const Exception& e) {
                Log::debug("Could not send disconnect to " + peer + ": " + e.what());
            }
        }
        if (entry->handshake) {
            entry->handshake->fail(HandshakeFailure::CANCELLED);
        }
        teardown(*entry);
        entry->removed = true;

        if (had_session) {
            events.push_back(ConnectionLost{peer});
        } else if (had_attempt) {
            events.push_back(HandshakeFailed{peer, HandshakeFailure::CANCELLED});
        }
    }
    erase_entry(entry);
    Log::info("Disconnected from " + peer);
    events_.push_all(std::move(events));
}

std::string ConnectionManager::send(const std::string& address, const byte_vector& plaintext) {
    return send_sealed(address, plaintext, MessageType::TEXT);
}

std::string ConnectionManager::send_text(const std::string& address, const std::string& text) {
    return send_sealed(address, byte_vector(text.begin(), text.end()), MessageType::TEXT);
}

std::string ConnectionManager::send_file_metadata(const std::string& address, const FileMetadata& metadata) {
    return send_sealed(address, metadata.serialize(), MessageType::FILE_METADATA);
}

std::string ConnectionManager::send_sealed(const std::string& address, const byte_vector& plaintext, MessageType type) {
    if (plaintext.size() + config_.padding_block + FRAME_OVERHEAD > config_.max_message_size) {
        throw InvalidArgument("Message of " + std::to_string(plaintext.size()) + " bytes exceeds the frame limit.");
    }
    const std::string peer = OnionAddress::normalize(address);
    auto entry = find_entry(peer);
    if (!entry) {
        throw NotConnected("Not connected to " + peer + ".");
    }

    std::lock_guard<std::mutex> lock(entry->mutex);
    if (entry->removed || !entry->session || !entry->link) {
        throw NotConnected("No established session with " + peer + ".");
    }
    // Sealing and queueing under the entry lock keeps wire order equal to call order.
    WireMessage msg = entry->session->seal_outbound(plaintext, type);
    entry->link->send(msg.serialize());
    return msg.id;
}

namespace {

struct CommandRunner {
    ConnectionManager& manager;

    std::optional<std::string> operator()(const Connect& cmd) const {
        manager.connect(cmd.address);
        return std::nullopt;
    }
    std::optional<std::string> operator()(const Disconnect& cmd) const {
        manager.disconnect(cmd.address);
        return std::nullopt;
    }
    std::optional<std::string> operator()(const SendText& cmd) const {
        return manager.send_text(cmd.address, cmd.text);
    }
    std::optional<std::string> operator()(const SendFileMetadata& cmd) const {
        FileMetadata meta;
        meta.name = cmd.name;
        meta.size = cmd.size;
        meta.mime_type = cmd.mime_type;
        return manager.send_file_metadata(cmd.address, meta);
    }
};

} // namespace

std::optional<std::string> ConnectionManager::execute(const Command& command) {
    return std::visit(CommandRunner{*this}, command);
}

bool ConnectionManager::is_connected(const std::string& address) const {
    std::optional<PeerState> state = peer_state(address);
    return state && *state == PeerState::ESTABLISHED;
}

std::optional<ConnectionManager::PeerState> ConnectionManager::peer_state(const std::string& address) const {
    if (!OnionAddress::is_valid(address)) {
        return std::nullopt;
    }
    auto entry = find_entry(OnionAddress::normalize(address));
    if (!entry) {
        return std::nullopt;
    }
    std::lock_guard<std::mutex> lock(entry->mutex);
    if (entry->removed) {
        return std::nullopt;
    }
    if (entry->session) {
        return PeerState::ESTABLISHED;
    }
    if (entry->handshake && entry->handshake->state() != Handshake::State::IDLE) {
        return PeerState::HANDSHAKING;
    }
    if (entry->link) {
        return PeerState::CONNECTING;
    }
    if (entry->retry_pending) {
        return PeerState::BACKOFF;
    }
    return std::nullopt;
}

std::vector<std::string> ConnectionManager::peers() const {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    std::vector<std::string> out;
    out.reserve(peers_.size());
    for (const auto& item : peers_) {
        out.push_back(item.first);
    }
    return out;
}

// --- Per-peer lifecycle (entry locked) ---

void ConnectionManager::start_attempt(const std::shared_ptr<PeerEntry>& entry, EventList& /*events*/) {
    entry->generation = ++next_generation_;
    const uint64_t generation = entry->generation;
    const std::weak_ptr<PeerEntry> weak = entry;

    entry->handshake =
        std::make_unique<Handshake>(identity_, entry->address, config_.padding_block, config_.max_clock_skew);
    entry->link_outbound = true;

    net::LinkEvents link_events;
    link_events.on_open = [this, weak, generation]() { on_link_open(weak, generation); };
    link_events.on_frame = [this, weak, generation](byte_vector frame) {
        on_link_frame(weak, generation, std::move(frame));
    };
    link_events.on_close = [this, weak, generation](const std::string& reason) {
        on_link_close(weak, generation, reason);
    };

    entry->handshake_timer.expires_after(config_.handshake_timeout);
    entry->handshake_timer.async_wait([this, weak, generation](const boost::system::error_code& ec) {
        if (ec != boost::asio::error::operation_aborted) {
            on_handshake_timeout(weak, generation);
        }
    });

    Log::debug("Dialing " + entry->address + " (attempt " + std::to_string(entry->reconnect.attempts() + 1) + ")");
    entry->link = transport_.open(entry->address, std::move(link_events));
}

void ConnectionManager::teardown(PeerEntry& entry) {
    ++entry.generation;
    entry.handshake_timer.cancel();
    entry.retry_timer.cancel();
    entry.keepalive_timer.cancel();
    entry.retry_pending = false;
    entry.handshake.reset();
    if (entry.session) {
        entry.session->wipe();
        entry.session.reset();
    }
    if (entry.link) {
        entry.link->close();
        entry.link.reset();
    }
}

bool ConnectionManager::handle_failure(const std::shared_ptr<PeerEntry>& entry,
                                       std::optional<HandshakeFailure> reason,
                                       bool allow_reconnect,
                                       EventList& events) {
    const bool had_session = entry->session != nullptr;
    teardown(*entry);

    if (had_session) {
        events.push_back(ConnectionLost{entry->address});
    } else if (reason) {
        events.push_back(HandshakeFailed{entry->address, *reason});
    }

    if (entry->dialer && allow_reconnect) {
        if (auto delay = entry->reconnect.next_delay()) {
            Log::info("Reconnecting to " + entry->address + " in " + std::to_string(delay->count()) + " ms");
            const std::weak_ptr<PeerEntry> weak = entry;
            const uint64_t generation = entry->generation;
            entry->retry_pending = true;
            entry->retry_timer.expires_after(*delay);
            entry->retry_timer.async_wait([this, weak, generation](const boost::system::error_code& ec) {
                if (ec != boost::asio::error::operation_aborted) {
                    on_retry(weak, generation);
                }
            });
            return false;
        }
        Log::warn("Giving up on " + entry->address + " after " + std::to_string(entry->reconnect.max_retries()) +
                  " retries");
        events.push_back(HandshakeFailed{entry->address, HandshakeFailure::RETRIES_EXHAUSTED});
    }

    entry->removed = true;
    return true;
}

void ConnectionManager::arm_keepalive(const std::shared_ptr<PeerEntry>& entry) {
    const std::weak_ptr<PeerEntry> weak = entry;
    const uint64_t generation = entry->generation;
    entry->keepalive_timer.expires_after(config_.keepalive_interval);
    entry->keepalive_timer.async_wait([this, weak, generation](const boost::system::error_code& ec) {
        if (ec != boost::asio::error::operation_aborted) {
            on_keepalive(weak, generation);
        }
    });
}

ConnectionManager::FrameOutcome ConnectionManager::deliver(PeerEntry& entry, const WireMessage& message, EventList& events) {
    if (message.type == MessageType::HANDSHAKE) {
        Log::warn("Ignoring handshake from " + entry.address + " on an established session");
        return FrameOutcome::OK;
    }

    byte_vector plaintext;
    try {
        plaintext = entry.session->open_inbound(message);
    } catch (const ReplayRejected&) {
        return FrameOutcome::OK;
    } catch (const AuthFailure&) {
        const uint32_t failures = entry.session->consecutive_auth_failures();
        Log::warn("Dropped unauthenticated frame from " + entry.address + " (" + std::to_string(failures) +
                  " in a row)");
        return failures >= config_.max_auth_failures ? FrameOutcome::FAIL : FrameOutcome::OK;
    } catch (const MalformedMessage& e) {
        Log::warn("Dropped malformed frame from " + entry.address + ": " + e.what());
        return FrameOutcome::OK;
    }

    MessageMetadata metadata;
    metadata.id = message.id;
    metadata.type = message.type;
    metadata.timestamp = message.timestamp;
    metadata.sequence = message.sequence;

    switch (message.type) {
        case MessageType::TEXT:
            events.push_back(MessageReceived{entry.address, std::move(plaintext), std::move(metadata)});
            return FrameOutcome::OK;
        case MessageType::FILE_METADATA:
            try {
                metadata.file = FileMetadata::deserialize(plaintext);
            } catch (const MalformedMessage& e) {
                Log::warn("Dropped bad file metadata from " + entry.address + ": " + e.what());
                return FrameOutcome::OK;
            }
            events.push_back(MessageReceived{entry.address, std::move(plaintext), std::move(metadata)});
            return FrameOutcome::OK;
        case MessageType::KEEPALIVE:
            return FrameOutcome::OK;
        case MessageType::DISCONNECT:
            return FrameOutcome::PEER_CLOSED;
        case MessageType::HANDSHAKE:
            break;
    }
    return FrameOutcome::OK;
}

// --- Link and timer callbacks ---

void ConnectionManager::on_link_open(const std::weak_ptr<PeerEntry>& weak, uint64_t generation) {
    auto entry = weak.lock();
    if (!entry) {
        return;
    }
    EventList events;
    bool erase = false;
    {
        std::lock_guard<std::mutex> lock(entry->mutex);
        if (entry->removed || entry->generation != generation || !entry->handshake ||
            entry->handshake->state() != Handshake::State::IDLE) {
            return;
        }
        try {
            WireMessage hello = entry->handshake->start();
            entry->link->send(hello.serialize());
        } catch (const Exception& e) {
            Log::warn("Cannot start handshake with " + entry->address + ": " + e.what());
            erase = handle_failure(entry, HandshakeFailure::KEY_EXCHANGE, true, events);
        }
    }
    if (erase) {
        erase_entry(entry);
    }
    events_.push_all(std::move(events));
}

void ConnectionManager::on_link_frame(const std::weak_ptr<PeerEntry>& weak, uint64_t generation, byte_vector frame) {
    auto entry = weak.lock();
    if (!entry) {
        return;
    }
    EventList events;
    bool erase = false;
    {
        std::lock_guard<std::mutex> lock(entry->mutex);
        if (entry->removed || entry->generation != generation) {
            return;
        }
        entry->last_inbound = std::chrono::steady_clock::now();

        WireMessage message;
        bool parsed = true;
        try {
            message = WireMessage::deserialize(frame);
        } catch (const MalformedMessage& e) {
            parsed = false;
            if (entry->handshake) {
                Log::warn("Malformed handshake frame from " + entry->address + ": " + e.what());
                entry->handshake->fail(HandshakeFailure::MALFORMED);
                erase = handle_failure(entry, HandshakeFailure::MALFORMED, true, events);
            } else {
                Log::warn("Dropped malformed frame from " + entry->address + ": " + e.what());
            }
        }

        if (parsed && entry->handshake) {
            try {
                entry->handshake->on_message(message);
                if (entry->handshake->state() == Handshake::State::ESTABLISHED) {
                    entry->session = entry->handshake->take_session();
                    entry->handshake.reset();
                    entry->handshake_timer.cancel();
                    entry->reconnect.reset();
                    arm_keepalive(entry);
                    Log::info("Handshake with " + entry->address + " completed");
                    events.push_back(HandshakeCompleted{entry->address});
                }
            } catch (const Exception& e) {
                const HandshakeFailure reason = entry->handshake->failure().value_or(HandshakeFailure::MALFORMED);
                erase = handle_failure(entry, reason, true, events);
            }
        } else if (parsed && entry->session) {
            switch (deliver(*entry, message, events)) {
                case FrameOutcome::OK:
                    break;
                case FrameOutcome::FAIL:
                    Log::warn("Too many authentication failures from " + entry->address + "; reconnecting");
                    erase = handle_failure(entry, std::nullopt, true, events);
                    break;
                case FrameOutcome::PEER_CLOSED:
                    Log::info(entry->address + " closed the session");
                    erase = handle_failure(entry, std::nullopt, false, events);
                    break;
            }
        }
    }
    if (erase) {
        erase_entry(entry);
    }
    events_.push_all(std::move(events));
}

void ConnectionManager::on_link_close(const std::weak_ptr<PeerEntry>& weak, uint64_t generation, const std::string& reason) {
    auto entry = weak.lock();
    if (!entry) {
        return;
    }
    EventList events;
    bool erase = false;
    {
        std::lock_guard<std::mutex> lock(entry->mutex);
        if (entry->removed || entry->generation != generation) {
            return;
        }
        Log::info("Link to " + entry->address + " lost: " + reason);
        std::optional<HandshakeFailure> failure;
        if (entry->handshake) {
            entry->handshake->fail(HandshakeFailure::TRANSPORT);
            failure = HandshakeFailure::TRANSPORT;
        }
        erase = handle_failure(entry, failure, true, events);
    }
    if (erase) {
        erase_entry(entry);
    }
    events_.push_all(std::move(events));
}

void ConnectionManager::on_handshake_timeout(const std::weak_ptr<PeerEntry>& weak, uint64_t generation) {
    auto entry = weak.lock();
    if (!entry) {
        return;
    }
    EventList events;
    bool erase = false;
    {
        std::lock_guard<std::mutex> lock(entry->mutex);
        if (entry->removed || entry->generation != generation || !entry->handshake) {
            return;
        }
        entry->handshake->on_timeout();
        if (entry->handshake->state() != Handshake::State::FAILED) {
            return;
        }
        erase = handle_failure(entry, HandshakeFailure::TIMEOUT, true, events);
    }
    if (erase) {
        erase_entry(entry);
    }
    events_.push_all(std::move(events));
}

void ConnectionManager::on_retry(const std::weak_ptr<PeerEntry>& weak, uint64_t generation) {
    auto entry = weak.lock();
    if (!entry) {
        return;
    }
    EventList events;
    bool erase = false;
    {
        std::lock_guard<std::mutex> lock(entry->mutex);
        if (entry->removed || entry->generation != generation || !entry->retry_pending) {
            return;
        }
        entry->retry_pending = false;
        try {
            start_attempt(entry, events);
        } catch (const Exception& e) {
            Log::warn("Cannot dial " + entry->address + ": " + e.what());
            erase = handle_failure(entry, HandshakeFailure::TRANSPORT, true, events);
        }
    }
    if (erase) {
        erase_entry(entry);
    }
    events_.push_all(std::move(events));
}

void ConnectionManager::on_keepalive(const std::weak_ptr<PeerEntry>& weak, uint64_t generation) {
    auto entry = weak.lock();
    if (!entry) {
        return;
    }
    EventList events;
    bool erase = false;
    {
        std::lock_guard<std::mutex> lock(entry->mutex);
        if (entry->removed || entry->generation != generation || !entry->session || !entry->link) {
            return;
        }
        const auto idle = std::chrono::steady_clock::now() - entry->last_inbound;
        if (idle > config_.idle_timeout) {
            Log::info("No traffic from " + entry->address + " within the idle timeout");
            erase = handle_failure(entry, std::nullopt, true, events);
        } else {
            try {
                WireMessage keepalive = entry->session->seal_outbound({}, MessageType::KEEPALIVE);
                entry->link->send(keepalive.serialize());
                arm_keepalive(entry);
            } catch (const Exception& e) {
                Log::warn("Keep-alive to " + entry->address + " failed: " + e.what());
                erase = handle_failure(entry, std::nullopt, true, events);
            }
        }
    }
    if (erase) {
        erase_entry(entry);
    }
    events_.push_all(std::move(events));
}

// --- Inbound connections ---

net::LinkEvents ConnectionManager::accept(std::shared_ptr<net::Link> link) {
    auto pending = std::make_shared<PendingInbound>(io_);
    pending->id = ++next_generation_;
    pending->link = std::move(link);
    pending->handshake =
        std::make_unique<Handshake>(identity_, std::string(), config_.padding_block, config_.max_clock_skew);
    pending->route = std::make_shared<InboundRoute>();
    pending->route->pending = pending;

    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        pending_.emplace(pending->id, pending);
    }
    {
        std::lock_guard<std::mutex> lock(pending->mutex);
        const std::weak_ptr<PendingInbound> weak = pending;
        pending->timer.expires_after(config_.handshake_timeout);
        pending->timer.async_wait([this, weak](const boost::system::error_code& ec) {
            if (ec != boost::asio::error::operation_aborted) {
                on_pending_timeout(weak);
            }
        });
    }

    const std::shared_ptr<InboundRoute> route = pending->route;
    net::LinkEvents link_events;
    link_events.on_frame = [this, route](byte_vector frame) {
        std::weak_ptr<PeerEntry> entry;
        std::shared_ptr<PendingInbound> waiting;
        uint64_t generation = 0;
        {
            std::lock_guard<std::mutex> lock(route->mutex);
            entry = route->entry;
            generation = route->generation;
            waiting = route->pending.lock();
        }
        if (!entry.expired()) {
            on_link_frame(entry, generation, std::move(frame));
        } else if (waiting) {
            on_pending_frame(waiting, std::move(frame));
        }
    };
    link_events.on_close = [this, route](const std::string& reason) {
        std::weak_ptr<PeerEntry> entry;
        std::shared_ptr<PendingInbound> waiting;
        uint64_t generation = 0;
        {
            std::lock_guard<std::mutex> lock(route->mutex);
            entry = route->entry;
            generation = route->generation;
            waiting = route->pending.lock();
        }
        if (!entry.expired()) {
            on_link_close(entry, generation, reason);
        } else if (waiting) {
            on_pending_close(waiting);
        }
    };
    return link_events;
}

void ConnectionManager::on_pending_frame(const std::shared_ptr<PendingInbound>& pending, byte_vector frame) {
    std::unique_ptr<Session> session;
    std::optional<WireMessage> reply;
    {
        std::lock_guard<std::mutex> lock(pending->mutex);
        if (pending->done) {
            return;
        }
        pending->done = true;
        pending->timer.cancel();
        try {
            WireMessage message = WireMessage::deserialize(frame);
            reply = pending->handshake->on_message(message);
            if (!remember_hello(pending->handshake->peer_ephemeral())) {
                throw HandshakeError("Replayed hello from " + pending->handshake->peer_address() + ".");
            }
            session = pending->handshake->take_session();
        } catch (const Exception& e) {
            Log::info(std::string("Rejected inbound handshake: ") + e.what());
            pending->handshake.reset();
            pending->link->close();
        }
    }
    remove_pending(pending->id);
    if (session && reply) {
        adopt_inbound(pending, std::move(session), *reply);
    }
}

void ConnectionManager::adopt_inbound(const std::shared_ptr<PendingInbound>& pending,
                                      std::unique_ptr<Session> session,
                                      const WireMessage& reply) {
    const std::string peer = session->peer_address();
    if (peer == local_address_) {
        Log::warn("Rejected inbound connection claiming our own address");
        session->wipe();
        pending->link->close();
        return;
    }

    EventList events;
    std::shared_ptr<PeerEntry> entry;
    for (;;) {
        entry = get_or_create_entry(peer);
        std::lock_guard<std::mutex> lock(entry->mutex);
        if (entry->removed) {
            erase_entry(entry);
            continue;
        }

        if (entry->link && entry->link_outbound && !(peer < local_address_)) {
            // Simultaneous open: our own dial wins.
            Log::debug("Keeping our connection to " + peer + "; closing theirs");
            session->wipe();
            pending->link->close();
            return;
        }

        const bool replaced_session = entry->session != nullptr;
        teardown(*entry);
        if (replaced_session) {
            events.push_back(ConnectionLost{peer});
        }

        entry->generation = ++next_generation_;
        entry->link = pending->link;
        entry->link_outbound = false;
        entry->session = std::move(session);
        entry->last_inbound = std::chrono::steady_clock::now();
        entry->reconnect.reset();
        {
            std::lock_guard<std::mutex> route_lock(pending->route->mutex);
            pending->route->entry = entry;
            pending->route->generation = entry->generation;
        }
        try {
            entry->link->send(reply.serialize());
            arm_keepalive(entry);
            Log::info("Accepted session from " + peer);
            events.push_back(HandshakeCompleted{peer});
        } catch (const Exception& e) {
            Log::warn("Cannot answer " + peer + ": " + e.what());
            if (handle_failure(entry, std::nullopt, true, events)) {
                events_.push_all(std::move(events));
                erase_entry(entry);
                return;
            }
        }
        break;
    }
    events_.push_all(std::move(events));
}

void ConnectionManager::on_pending_close(const std::shared_ptr<PendingInbound>& pending) {
    {
        std::lock_guard<std::mutex> lock(pending->mutex);
        if (pending->done) {
            return;
        }
        pending->done = true;
        pending->timer.cancel();
        pending->handshake.reset();
    }
    remove_pending(pending->id);
}

void ConnectionManager::on_pending_timeout(const std::weak_ptr<PendingInbound>& weak) {
    auto pending = weak.lock();
    if (!pending) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(pending->mutex);
        if (pending->done) {
            return;
        }
        pending->done = true;
        pending->handshake->on_timeout();
        pending->handshake.reset();
        pending->link->close();
    }
    remove_pending(pending->id);
}

void ConnectionManager::remove_pending(uint64_t id) {
    std::lock_guard<std::mutex> lock(pending_mutex_);
    pending_.erase(id);
}

bool ConnectionManager::remember_hello(const PublicKey& ephemeral) {
    const auto now = std::chrono::steady_clock::now();
    std::lock_guard<std::mutex> lock(hello_mutex_);
    for (auto it = seen_hellos_.begin(); it != seen_hellos_.end();) {
        if (it->second <= now) {
            it = seen_hellos_.erase(it);
        } else {
            ++it;
        }
    }
    return seen_hellos_.emplace(ephemeral.data, now + 2 * config_.max_clock_skew).second;
}

} // namespace OnionChat
