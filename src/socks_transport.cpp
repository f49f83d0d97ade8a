#include "onionchat/socks_transport.hpp"

#include <array>
#include <deque>
#include <functional>
#include <utility>

#include "onionchat/errors.hpp"
#include "onionchat/log.hpp"
#include "onionchat/socks5.hpp"

namespace OnionChat {
namespace net {

namespace {

constexpr size_t FRAME_HEADER_BYTES = 4;

using tcp = boost::asio::ip::tcp;

class SocksLink : public Link, public std::enable_shared_from_this<SocksLink> {
public:
    SocksLink(boost::asio::io_context& io, size_t max_frame_size)
        : strand_(boost::asio::make_strand(io)),
          socket_(strand_),
          resolver_(strand_),
          max_frame_size_(max_frame_size) {}

    tcp::socket& socket() { return socket_; }

    void send(byte_vector frame) override {
        if (frame.empty() || frame.size() > max_frame_size_) {
            throw InvalidArgument("Frame size " + std::to_string(frame.size()) + " is outside the allowed range.");
        }
        byte_vector buffer;
        buffer.reserve(FRAME_HEADER_BYTES + frame.size());
        const uint32_t len = static_cast<uint32_t>(frame.size());
        buffer.push_back(static_cast<uint8_t>(len >> 24));
        buffer.push_back(static_cast<uint8_t>(len >> 16));
        buffer.push_back(static_cast<uint8_t>(len >> 8));
        buffer.push_back(static_cast<uint8_t>(len));
        buffer.insert(buffer.end(), frame.begin(), frame.end());

        boost::asio::post(strand_, [self = shared_from_this(), buffer = std::move(buffer)]() mutable {
            if (self->closed_ || self->closing_) {
                return;
            }
            self->write_queue_.push_back(std::move(buffer));
            if (self->ready_ && self->write_queue_.size() == 1) {
                self->do_write();
            }
        });
    }

    void close() override {
        boost::asio::post(strand_, [self = shared_from_this()]() {
            self->closing_ = true;
            if (self->write_queue_.empty() || !self->ready_) {
                self->shutdown();
            }
        });
    }

    void start_outbound(const TorConfig& config, const std::string& host, uint16_t port, LinkEvents events) {
        events_ = std::move(events);
        credentials_.username = config.socks_username;
        credentials_.password = config.socks_password;
        target_host_ = host;
        target_port_ = port;

        boost::asio::post(strand_, [self = shared_from_this(), proxy_host = config.socks_host,
                                    proxy_port = std::to_string(config.socks_port)]() {
            if (self->closed_) {
                return;
            }
            self->resolver_.async_resolve(
                proxy_host, proxy_port,
                [self](const boost::system::error_code& ec, tcp::resolver::results_type results) {
                    if (self->closed_) {
                        return;
                    }
                    if (ec) {
                        return self->fail("Cannot resolve the SOCKS proxy: " + ec.message());
                    }
                    boost::asio::async_connect(
                        self->socket_, results,
                        [self](const boost::system::error_code& ec, const tcp::endpoint&) {
                            if (self->closed_) {
                                return;
                            }
                            if (ec) {
                                return self->fail("Cannot reach the SOCKS proxy: " + ec.message());
                            }
                            self->socks_greeting();
                        });
                });
        });
    }

    void start_inbound(LinkEvents events) {
        boost::asio::post(strand_, [self = shared_from_this(), events = std::move(events)]() mutable {
            self->events_ = std::move(events);
            if (self->closed_) {
                return;
            }
            self->ready_ = true;
            self->read_frame_header();
            if (!self->write_queue_.empty()) {
                self->do_write();
            }
        });
    }

private:
    using Continuation = std::function<void(byte_vector)>;

    // --- SOCKS5 negotiation ---

    void socks_greeting() {
        write_then_read(socks5::greeting(credentials_), socks5::METHOD_REPLY_BYTES, [this](byte_vector reply) {
            if (socks5::parse_method_reply(reply, credentials_) == socks5::METHOD_USER_PASS) {
                write_then_read(socks5::auth_request(credentials_), socks5::AUTH_REPLY_BYTES, [this](byte_vector auth_reply) {
                    socks5::parse_auth_reply(auth_reply);
                    socks_connect();
                });
            } else {
                socks_connect();
            }
        });
    }

    void socks_connect() {
        write_then_read(socks5::connect_request(target_host_, target_port_), socks5::CONNECT_REPLY_HEAD_BYTES,
                        [this](byte_vector head) {
                            const size_t rest = socks5::parse_connect_reply_head(head);
                            read_exact(rest, [this](byte_vector) { on_ready(); });
                        });
    }

    void on_ready() {
        ready_ = true;
        Log::debug("SOCKS5 stream to " + target_host_ + " is open");
        if (events_.on_open) {
            events_.on_open();
        }
        if (closed_) {
            return;
        }
        read_frame_header();
        if (!write_queue_.empty()) {
            do_write();
        }
    }

    // The continuations capture `this`; the completion handlers keep the link alive.
    void write_then_read(byte_vector request, size_t reply_len, Continuation next) {
        auto out = std::make_shared<byte_vector>(std::move(request));
        boost::asio::async_write(
            socket_, boost::asio::buffer(*out),
            [self = shared_from_this(), out, reply_len, next = std::move(next)](const boost::system::error_code& ec,
                                                                                 size_t) mutable {
                if (self->closed_) {
                    return;
                }
                if (ec) {
                    return self->fail("SOCKS5 write failed: " + ec.message());
                }
                self->read_exact(reply_len, std::move(next));
            });
    }

    void read_exact(size_t len, Continuation next) {
        auto in = std::make_shared<byte_vector>(len);
        boost::asio::async_read(
            socket_, boost::asio::buffer(*in),
            [self = shared_from_this(), in, next = std::move(next)](const boost::system::error_code& ec, size_t) {
                if (self->closed_) {
                    return;
                }
                if (ec) {
                    return self->fail("SOCKS5 read failed: " + ec.message());
                }
                try {
                    next(std::move(*in));
                } catch (const Exception& e) {
                    self->fail(e.what());
                }
            });
    }

    // --- Framing ---

    void read_frame_header() {
        boost::asio::async_read(
            socket_, boost::asio::buffer(read_header_),
            [self = shared_from_this()](const boost::system::error_code& ec, size_t) {
                if (self->closed_ || self->closing_) {
                    return;
                }
                if (ec) {
                    return self->fail(ec == boost::asio::error::eof ? std::string("Connection closed by peer.")
                                                                    : "Read failed: " + ec.message());
                }
                const uint32_t len = (static_cast<uint32_t>(self->read_header_[0]) << 24) |
                                     (static_cast<uint32_t>(self->read_header_[1]) << 16) |
                                     (static_cast<uint32_t>(self->read_header_[2]) << 8) |
                                     static_cast<uint32_t>(self->read_header_[3]);
                if (len == 0 || len > self->max_frame_size_) {
                    return self->fail("Inbound frame of " + std::to_string(len) + " bytes rejected.");
                }
                self->read_frame_body(len);
            });
    }

    void read_frame_body(uint32_t len) {
        auto body = std::make_shared<byte_vector>(len);
        boost::asio::async_read(
            socket_, boost::asio::buffer(*body),
            [self = shared_from_this(), body](const boost::system::error_code& ec, size_t) {
                if (self->closed_ || self->closing_) {
                    return;
                }
                if (ec) {
                    return self->fail("Read failed: " + ec.message());
                }
                if (self->events_.on_frame) {
                    self->events_.on_frame(std::move(*body));
                }
                if (!self->closed_ && !self->closing_) {
                    self->read_frame_header();
                }
            });
    }

    void do_write() {
        boost::asio::async_write(
            socket_, boost::asio::buffer(write_queue_.front()),
            [self = shared_from_this()](const boost::system::error_code& ec, size_t) {
                if (self->closed_) {
                    return;
                }
                if (ec) {
                    return self->fail("Write failed: " + ec.message());
                }
                self->write_queue_.pop_front();
                if (!self->write_queue_.empty()) {
                    self->do_write();
                } else if (self->closing_) {
                    self->shutdown();
                }
            });
    }

    // --- Teardown ---

    void shutdown() {
        if (closed_) {
            return;
        }
        closed_ = true;
        boost::system::error_code ignored;
        resolver_.cancel();
        socket_.shutdown(tcp::socket::shutdown_both, ignored);
        socket_.close(ignored);
        write_queue_.clear();
        events_ = LinkEvents{};
    }

    void fail(const std::string& reason) {
        if (closed_) {
            return;
        }
        auto on_close = std::move(events_.on_close);
        shutdown();
        Log::debug("Link closed: " + reason);
        if (on_close && !closing_) {
            on_close(reason);
        }
    }

    boost::asio::strand<boost::asio::io_context::executor_type> strand_;
    tcp::socket socket_;
    tcp::resolver resolver_;
    size_t max_frame_size_;

    LinkEvents events_;
    socks5::Credentials credentials_;
    std::string target_host_;
    uint16_t target_port_ = 0;

    bool ready_ = false;
    bool closing_ = false;
    bool closed_ = false;
    std::array<uint8_t, FRAME_HEADER_BYTES> read_header_{};
    std::deque<byte_vector> write_queue_;
};

} // namespace

SocksTransport::SocksTransport(boost::asio::io_context& io, TorConfig config, size_t max_frame_size)
    : io_(io), config_(std::move(config)), max_frame_size_(max_frame_size), acceptor_(io) {}

SocksTransport::~SocksTransport() {
    stop();
}

std::shared_ptr<Link> SocksTransport::open(const std::string& address, LinkEvents events) {
    auto link = std::make_shared<SocksLink>(io_, max_frame_size_);
    link->start_outbound(config_, address, config_.virtual_port, std::move(events));
    return link;
}

void SocksTransport::set_accept_handler(AcceptHandler handler) {
    std::lock_guard<std::mutex> lock(handler_mutex_);
    accept_handler_ = std::move(handler);
}

uint16_t SocksTransport::listen() {
    boost::system::error_code ec;
    const auto address = boost::asio::ip::make_address(config_.listen_host, ec);
    if (ec) {
        throw TransportError("Invalid listen address " + config_.listen_host + ": " + ec.message());
    }
    const tcp::endpoint endpoint(address, config_.listen_port);

    acceptor_.open(endpoint.protocol(), ec);
    if (!ec) {
        acceptor_.set_option(tcp::acceptor::reuse_address(true), ec);
    }
    if (!ec) {
        acceptor_.bind(endpoint, ec);
    }
    if (!ec) {
        acceptor_.listen(boost::asio::socket_base::max_listen_connections, ec);
    }
    if (ec) {
        boost::system::error_code ignored;
        acceptor_.close(ignored);
        throw TransportError("Cannot listen on " + config_.listen_host + ":" + std::to_string(config_.listen_port) +
                             ": " + ec.message());
    }

    const uint16_t port = acceptor_.local_endpoint(ec).port();
    Log::info("Listening for hidden service connections on " + config_.listen_host + ":" + std::to_string(port));
    do_accept();
    return port;
}

void SocksTransport::stop() {
    boost::system::error_code ignored;
    acceptor_.close(ignored);
}

void SocksTransport::do_accept() {
    auto link = std::make_shared<SocksLink>(io_, max_frame_size_);
    acceptor_.async_accept(link->socket(), [this, link](const boost::system::error_code& ec) {
        if (ec == boost::asio::error::operation_aborted) {
            return;
        }
        if (ec) {
            Log::warn("Accept failed: " + ec.message());
        } else {
            AcceptHandler handler;
            {
                std::lock_guard<std::mutex> lock(handler_mutex_);
                handler = accept_handler_;
            }
            if (!handler) {
                link->close();
            } else {
                try {
                    link->start_inbound(handler(link));
                } catch (const Exception& e) {
                    Log::warn(std::string("Rejected inbound connection: ") + e.what());
                    link->close();
                }
            }
        }
        if (acceptor_.is_open()) {
            do_accept();
        }
    });
}

} // namespace net
} // namespace OnionChat
