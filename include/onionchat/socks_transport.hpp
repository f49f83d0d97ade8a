#ifndef ONIONCHAT_SOCKS_TRANSPORT_HPP
#define ONIONCHAT_SOCKS_TRANSPORT_HPP

#include <boost/asio.hpp>

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

#include "config.hpp"
#include "transport.hpp"

namespace OnionChat {
namespace net {

    /**
     * @brief Streams to peers through the Tor SOCKS5 proxy, plus the local
     * listener the hidden service forwards to.
     *
     * Frames are a 4-byte big-endian length followed by the frame bytes.
     * Each link runs on its own strand of the io_context, so links never
     * block one another; writes of one link are queued and issued one at a
     * time in send() order.
     */
    class SocksTransport : public Transport {
    public:
        SocksTransport(boost::asio::io_context& io, TorConfig config, size_t max_frame_size);
        ~SocksTransport() override;

        /**
         * @brief Starts a SOCKS5 CONNECT to address:virtual_port.
         * Failures are reported through events.on_close.
         */
        std::shared_ptr<Link> open(const std::string& address, LinkEvents events) override;

        void set_accept_handler(AcceptHandler handler) override;

        /**
         * @brief Binds listen_host:listen_port and starts accepting.
         * @return The bound port (useful when listen_port is 0).
         * @throws TransportError if the socket cannot be bound.
         */
        uint16_t listen();

        /**
         * @brief Stops accepting. Call from the io_context thread or after it stopped.
         */
        void stop();

    private:
        void do_accept();

        boost::asio::io_context& io_;
        TorConfig config_;
        size_t max_frame_size_;
        boost::asio::ip::tcp::acceptor acceptor_;

        std::mutex handler_mutex_;
        AcceptHandler accept_handler_;
    };

} // namespace net
} // namespace OnionChat

#endif // ONIONCHAT_SOCKS_TRANSPORT_HPP
