#ifndef ONIONCHAT_TESTS_LOOPBACK_TRANSPORT_HPP
#define ONIONCHAT_TESTS_LOOPBACK_TRANSPORT_HPP

#include <boost/asio.hpp>

#include <algorithm>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "onionchat/transport.hpp"

namespace OnionChat {
namespace test_support {

    class LoopbackNetwork;

    // One end of an in-memory stream. Every callback is posted to the
    // io_context, so none fires from inside send(), close() or open().
    class LoopbackLink : public net::Link, public std::enable_shared_from_this<LoopbackLink> {
    public:
        LoopbackLink(boost::asio::io_context& io, LoopbackNetwork& network) : io_(io), network_(network) {}

        void send(byte_vector frame) override;

        void close() override {
            std::shared_ptr<LoopbackLink> peer;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                if (closed_) {
                    return;
                }
                closed_ = true;
                events_ = net::LinkEvents{};
                peer = peer_.lock();
            }
            if (peer) {
                boost::asio::post(io_, [peer]() { peer->drop("Connection closed by peer."); });
            }
        }

        void connect_to(const std::shared_ptr<LoopbackLink>& peer) {
            std::lock_guard<std::mutex> lock(mutex_);
            peer_ = peer;
        }

        void set_events(net::LinkEvents events) {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!closed_) {
                events_ = std::move(events);
            }
        }

        void fire_open() {
            std::function<void()> cb;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                if (closed_) {
                    return;
                }
                cb = events_.on_open;
            }
            if (cb) {
                cb();
            }
        }

        // Ends the stream from the network side; on_close fires.
        void drop(const std::string& reason) {
            std::function<void(const std::string&)> cb;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                if (closed_) {
                    return;
                }
                closed_ = true;
                cb = std::move(events_.on_close);
                events_ = net::LinkEvents{};
            }
            if (cb) {
                cb(reason);
            }
        }

        bool closed() const {
            std::lock_guard<std::mutex> lock(mutex_);
            return closed_;
        }

    private:
        void deliver(byte_vector frame) {
            std::function<void(byte_vector)> cb;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                if (closed_) {
                    return;
                }
                cb = events_.on_frame;
            }
            if (cb) {
                cb(std::move(frame));
            }
        }

        boost::asio::io_context& io_;
        LoopbackNetwork& network_;
        mutable std::mutex mutex_;
        std::weak_ptr<LoopbackLink> peer_;
        net::LinkEvents events_;
        bool closed_ = false;
    };

    class LoopbackTransport : public net::Transport {
    public:
        LoopbackTransport(boost::asio::io_context& io, LoopbackNetwork& network) : io_(io), network_(network) {}

        std::shared_ptr<net::Link> open(const std::string& address, net::LinkEvents events) override;

        void set_accept_handler(AcceptHandler handler) override {
            std::lock_guard<std::mutex> lock(mutex_);
            handler_ = std::move(handler);
        }

        AcceptHandler handler() {
            std::lock_guard<std::mutex> lock(mutex_);
            return handler_;
        }

        size_t opened() const {
            std::lock_guard<std::mutex> lock(mutex_);
            return opened_;
        }

    private:
        boost::asio::io_context& io_;
        LoopbackNetwork& network_;
        mutable std::mutex mutex_;
        AcceptHandler handler_;
        size_t opened_ = 0;
    };

    // Routes addresses to transports. Addresses without a transport are unreachable.
    class LoopbackNetwork {
    public:
        void attach(const std::string& address, LoopbackTransport* transport) {
            std::lock_guard<std::mutex> lock(mutex_);
            hosts_[address] = transport;
        }

        // The host accepts streams but never answers.
        void attach_silent(const std::string& address) {
            std::lock_guard<std::mutex> lock(mutex_);
            silent_.push_back(address);
        }

        LoopbackTransport* find(const std::string& address, bool& silent) {
            std::lock_guard<std::mutex> lock(mutex_);
            silent = std::find(silent_.begin(), silent_.end(), address) != silent_.end();
            auto it = hosts_.find(address);
            return it == hosts_.end() ? nullptr : it->second;
        }

        // Sees every frame sent on any link before it is delivered and may
        // rewrite it, like an attacker on the path.
        void set_tap(std::function<void(byte_vector&)> tap) {
            std::lock_guard<std::mutex> lock(mutex_);
            tap_ = std::move(tap);
        }

        void observe(byte_vector& frame) {
            std::function<void(byte_vector&)> tap;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                tap = tap_;
            }
            if (tap) {
                tap(frame);
            }
        }

        void track(const std::shared_ptr<LoopbackLink>& link) {
            std::lock_guard<std::mutex> lock(mutex_);
            links_.push_back(link);
        }

        // Severs every open stream as if the network went away.
        void drop_all(boost::asio::io_context& io) {
            std::vector<std::weak_ptr<LoopbackLink>> links;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                links.swap(links_);
            }
            for (auto& weak : links) {
                if (auto link = weak.lock()) {
                    boost::asio::post(io, [link]() { link->drop("Network unreachable."); });
                }
            }
        }

    private:
        std::mutex mutex_;
        std::map<std::string, LoopbackTransport*> hosts_;
        std::vector<std::string> silent_;
        std::vector<std::weak_ptr<LoopbackLink>> links_;
        std::function<void(byte_vector&)> tap_;
    };

    inline void LoopbackLink::send(byte_vector frame) {
        std::shared_ptr<LoopbackLink> peer;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) {
                return;
            }
            peer = peer_.lock();
        }
        network_.observe(frame);
        if (peer) {
            boost::asio::post(io_, [peer, frame = std::move(frame)]() mutable { peer->deliver(std::move(frame)); });
        }
    }

    inline std::shared_ptr<net::Link> LoopbackTransport::open(const std::string& address, net::LinkEvents events) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            ++opened_;
        }
        auto local = std::make_shared<LoopbackLink>(io_, network_);
        auto remote = std::make_shared<LoopbackLink>(io_, network_);
        local->connect_to(remote);
        remote->connect_to(local);
        local->set_events(std::move(events));
        network_.track(local);
        network_.track(remote);

        LoopbackNetwork& network = network_;
        boost::asio::post(io_, [&network, address, local, remote]() {
            bool silent = false;
            LoopbackTransport* target = network.find(address, silent);
            if (silent) {
                local->fire_open();
                return;
            }
            AcceptHandler handler = target ? target->handler() : AcceptHandler();
            if (!handler) {
                local->drop("Host unreachable.");
                return;
            }
            remote->set_events(handler(remote));
            local->fire_open();
        });
        return local;
    }

} // namespace test_support
} // namespace OnionChat

#endif // ONIONCHAT_TESTS_LOOPBACK_TRANSPORT_HPP
