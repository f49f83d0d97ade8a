#ifndef ONIONCHAT_CONNECTION_MANAGER_HPP
#define ONIONCHAT_CONNECTION_MANAGER_HPP

#include <boost/asio.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "config.hpp"
#include "events.hpp"
#include "handshake.hpp"
#include "identity.hpp"
#include "reconnect_policy.hpp"
#include "session.hpp"
#include "transport.hpp"

namespace OnionChat {

    /**
     * @brief One logical connection per peer address.
     *
     * The registry maps a peer address to its entry (handshake or session,
     * link, reconnect state, timers). The registry mutex only guards lookup,
     * insertion and removal; everything about a peer happens under that
     * peer's own mutex, so a slow or failing peer never blocks another.
     * Events are collected while an entry is locked and published to the
     * EventQueue after it is released.
     *
     * An inbound hello is accepted once: its ephemeral key is remembered for
     * twice the allowed clock skew, which covers every timestamp a replay of
     * it could still pass with.
     *
     * Only the side that dialed a connection reconnects it. When both sides
     * dial at once, the connection dialed by the lexicographically smaller
     * address is kept.
     *
     * Handlers run on the io_context; stop it before destroying the manager.
     */
    class ConnectionManager {
    public:
        enum class PeerState {
            CONNECTING,
            HANDSHAKING,
            ESTABLISHED,
            BACKOFF
        };

        /**
         * @param identity Must hold an identity and outlive the manager.
         * @param transport Must outlive the manager.
         */
        ConnectionManager(boost::asio::io_context& io,
                          const IdentityStore& identity,
                          net::Transport& transport,
                          ProtocolConfig config);
        ~ConnectionManager();

        ConnectionManager(const ConnectionManager&) = delete;
        ConnectionManager& operator=(const ConnectionManager&) = delete;

        /**
         * @brief Starts accepting inbound connections from the transport.
         */
        void start();

        /**
         * @brief Stops accepting and disconnects every peer.
         */
        void shutdown();

        /**
         * @brief Dials a peer unless a connection or attempt already exists.
         * @throws InvalidArgument for an invalid or our own address.
         */
        void connect(const std::string& address);

        /**
         * @brief Sends a sealed DISCONNECT if a session exists, then cancels any
         * in-flight handshake, timers and sends and wipes the session keys
         * before returning.
         */
        void disconnect(const std::string& address);

        /**
         * @brief Seals and queues a text message.
         * @return The message id.
         * @throws NotConnected if there is no established session with the peer.
         * @throws InvalidArgument if the message would exceed the frame limit.
         */
        std::string send(const std::string& address, const byte_vector& plaintext);
        std::string send_text(const std::string& address, const std::string& text);
        std::string send_file_metadata(const std::string& address, const FileMetadata& metadata);

        /**
         * @brief Runs a consumer command.
         * @return The message id for send commands.
         */
        std::optional<std::string> execute(const Command& command);

        bool is_connected(const std::string& address) const;
        std::optional<PeerState> peer_state(const std::string& address) const;
        std::vector<std::string> peers() const;

        EventQueue& events() { return events_; }
        const std::string& local_address() const { return local_address_; }

    private:
        struct PeerEntry;
        struct InboundRoute;
        struct PendingInbound;
        using EventList = std::vector<Event>;

        enum class FrameOutcome {
            OK,
            FAIL,
            PEER_CLOSED
        };

        std::shared_ptr<PeerEntry> find_entry(const std::string& address) const;
        std::shared_ptr<PeerEntry> get_or_create_entry(const std::string& address);
        void erase_entry(const std::shared_ptr<PeerEntry>& entry);

        // The helpers below expect the entry's mutex to be held.
        void start_attempt(const std::shared_ptr<PeerEntry>& entry, EventList& events);
        void teardown(PeerEntry& entry);
        bool handle_failure(const std::shared_ptr<PeerEntry>& entry,
                            std::optional<HandshakeFailure> reason,
                            bool allow_reconnect,
                            EventList& events);
        void arm_keepalive(const std::shared_ptr<PeerEntry>& entry);
        FrameOutcome deliver(PeerEntry& entry, const WireMessage& message, EventList& events);

        void on_link_open(const std::weak_ptr<PeerEntry>& weak, uint64_t generation);
        void on_link_frame(const std::weak_ptr<PeerEntry>& weak, uint64_t generation, byte_vector frame);
        void on_link_close(const std::weak_ptr<PeerEntry>& weak, uint64_t generation, const std::string& reason);
        void on_handshake_timeout(const std::weak_ptr<PeerEntry>& weak, uint64_t generation);
        void on_retry(const std::weak_ptr<PeerEntry>& weak, uint64_t generation);
        void on_keepalive(const std::weak_ptr<PeerEntry>& weak, uint64_t generation);

        net::LinkEvents accept(std::shared_ptr<net::Link> link);
        void on_pending_frame(const std::shared_ptr<PendingInbound>& pending, byte_vector frame);
        void on_pending_close(const std::shared_ptr<PendingInbound>& pending);
        void on_pending_timeout(const std::weak_ptr<PendingInbound>& weak);
        void adopt_inbound(const std::shared_ptr<PendingInbound>& pending,
                           std::unique_ptr<Session> session,
                           const WireMessage& reply);
        void remove_pending(uint64_t id);
        bool remember_hello(const PublicKey& ephemeral);

        std::string send_sealed(const std::string& address, const byte_vector& plaintext, MessageType type);
        std::string resolve_address(const std::string& address) const;

        boost::asio::io_context& io_;
        const IdentityStore& identity_;
        net::Transport& transport_;
        ProtocolConfig config_;
        std::string local_address_;
        EventQueue events_;

        std::atomic<uint64_t> next_generation_{0};

        mutable std::mutex registry_mutex_;
        std::map<std::string, std::shared_ptr<PeerEntry>> peers_;

        std::mutex pending_mutex_;
        std::map<uint64_t, std::shared_ptr<PendingInbound>> pending_;

        std::mutex hello_mutex_;
        std::map<byte_vector, std::chrono::steady_clock::time_point> seen_hellos_;
    };

    const char* to_string(ConnectionManager::PeerState state);

} // namespace OnionChat

#endif // ONIONCHAT_CONNECTION_MANAGER_HPP
