#ifndef ONIONCHAT_TRANSPORT_HPP
#define ONIONCHAT_TRANSPORT_HPP

#include <functional>
#include <memory>
#include <string>

#include "keys.hpp"

namespace OnionChat {
namespace net {

    /**
     * @brief Callbacks of one stream.
     *
     * on_open fires once an outbound stream is usable (never for accepted
     * streams, which are usable immediately). on_frame delivers whole frames
     * in stream order. on_close fires at most once, when the stream fails or
     * the remote end closes it; a local close() does not report it.
     */
    struct LinkEvents {
        std::function<void()> on_open;
        std::function<void(byte_vector)> on_frame;
        std::function<void(const std::string& reason)> on_close;
    };

    /**
     * @brief An ordered, framed byte stream to one peer.
     *
     * Implementations never invoke LinkEvents callbacks from inside send()
     * or close(), so callers may hold their own locks while calling them.
     */
    class Link {
    public:
        virtual ~Link() = default;

        /**
         * @brief Queues a frame. Frames are written in the order send() is called.
         * Frames sent after close() are dropped.
         * @throws InvalidArgument if the frame exceeds the transport's size limit.
         */
        virtual void send(byte_vector frame) = 0;

        /**
         * @brief Closes the stream after already queued frames are written.
         */
        virtual void close() = 0;
    };

    /**
     * @brief Provider of streams to peers, addressed by onion address.
     *
     * Like Link, open() returns before any callback of the new link runs.
     */
    class Transport {
    public:
        // Called for each accepted stream; returns the callbacks to bind to it.
        using AcceptHandler = std::function<LinkEvents(std::shared_ptr<Link>)>;

        virtual ~Transport() = default;

        virtual std::shared_ptr<Link> open(const std::string& address, LinkEvents events) = 0;
        virtual void set_accept_handler(AcceptHandler handler) = 0;
    };

} // namespace net
} // namespace OnionChat

#endif // ONIONCHAT_TRANSPORT_HPP
