#ifndef ONIONCHAT_EVENTS_HPP
#define ONIONCHAT_EVENTS_HPP

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "handshake.hpp"
#include "message.hpp"

namespace OnionChat {

    // --- Events emitted by the core ---

    struct HandshakeCompleted {
        std::string address;
    };

    struct HandshakeFailed {
        std::string address;
        HandshakeFailure reason;
    };

    struct MessageMetadata {
        std::string id;
        MessageType type = MessageType::TEXT;
        int64_t timestamp = 0;
        uint64_t sequence = 0;
        std::optional<FileMetadata> file;  // set for FILE_METADATA messages
    };

    struct MessageReceived {
        std::string address;
        byte_vector plaintext;
        MessageMetadata metadata;
    };

    struct ConnectionLost {
        std::string address;
    };

    using Event = std::variant<HandshakeCompleted, HandshakeFailed, MessageReceived, ConnectionLost>;

    const std::string& event_address(const Event& event);

    // --- Commands accepted from the consumer ---

    struct Connect {
        std::string address;
    };

    struct Disconnect {
        std::string address;
    };

    struct SendText {
        std::string address;
        std::string text;
    };

    struct SendFileMetadata {
        std::string address;
        std::string name;
        uint64_t size = 0;
        std::string mime_type;
    };

    using Command = std::variant<Connect, Disconnect, SendText, SendFileMetadata>;

    /**
     * @brief Outbound channel from the core to its consumer.
     *
     * The core pushes from its I/O threads; the consumer polls or blocks in
     * wait_for() on its own thread.
     */
    class EventQueue {
    public:
        void push(Event event);
        void push_all(std::vector<Event> events);

        // Returns the oldest pending event without blocking.
        std::optional<Event> poll();

        // Blocks up to timeout for an event.
        std::optional<Event> wait_for(std::chrono::milliseconds timeout);

        std::vector<Event> drain();
        size_t size() const;

    private:
        mutable std::mutex mutex_;
        std::condition_variable cv_;
        std::deque<Event> events_;
    };

} // namespace OnionChat

#endif // ONIONCHAT_EVENTS_HPP
