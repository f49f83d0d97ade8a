#include <gtest/gtest.h>

#include <chrono>
#include <thread>

#include "onionchat/events.hpp"

using namespace OnionChat;
using namespace std::chrono_literals;

TEST(EventQueueTest, PollIsFifo) {
    EventQueue queue;
    ASSERT_FALSE(queue.poll().has_value());

    queue.push(HandshakeCompleted{"a.onion"});
    queue.push_all({ConnectionLost{"b.onion"}, HandshakeFailed{"c.onion", HandshakeFailure::TIMEOUT}});
    ASSERT_EQ(queue.size(), 3u);

    auto first = queue.poll();
    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(std::holds_alternative<HandshakeCompleted>(*first));
    ASSERT_EQ(event_address(*first), "a.onion");

    auto second = queue.poll();
    ASSERT_TRUE(std::holds_alternative<ConnectionLost>(*second));

    auto third = queue.poll();
    ASSERT_EQ(std::get<HandshakeFailed>(*third).reason, HandshakeFailure::TIMEOUT);
    ASSERT_EQ(queue.size(), 0u);
}

TEST(EventQueueTest, WaitForTimesOut) {
    EventQueue queue;
    auto start = std::chrono::steady_clock::now();
    ASSERT_FALSE(queue.wait_for(50ms).has_value());
    ASSERT_GE(std::chrono::steady_clock::now() - start, 50ms);
}

TEST(EventQueueTest, WaitForWakesOnPush) {
    EventQueue queue;
    std::thread producer([&queue]() {
        std::this_thread::sleep_for(20ms);
        MessageReceived msg;
        msg.address = "peer.onion";
        msg.plaintext = {'h', 'i'};
        queue.push(std::move(msg));
    });

    auto event = queue.wait_for(5000ms);
    producer.join();
    ASSERT_TRUE(event.has_value());
    ASSERT_EQ(event_address(*event), "peer.onion");
    ASSERT_EQ(std::get<MessageReceived>(*event).plaintext, (byte_vector{'h', 'i'}));
}

TEST(EventQueueTest, DrainEmptiesQueue) {
    EventQueue queue;
    queue.push(ConnectionLost{"x.onion"});
    queue.push(ConnectionLost{"y.onion"});

    auto events = queue.drain();
    ASSERT_EQ(events.size(), 2u);
    ASSERT_EQ(event_address(events[1]), "y.onion");
    ASSERT_EQ(queue.size(), 0u);
    ASSERT_TRUE(queue.drain().empty());
}
