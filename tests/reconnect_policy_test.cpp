#include <gtest/gtest.h>

#include "onionchat/crypto.hpp"
#include "onionchat/errors.hpp"
#include "onionchat/reconnect_policy.hpp"

using namespace OnionChat;
using std::chrono::milliseconds;

TEST(ReconnectPolicyTest, ExponentialWithoutJitter) {
    ReconnectPolicy policy(milliseconds(100), milliseconds(1000), 0, 6);

    ASSERT_EQ(policy.next_delay(), milliseconds(100));
    ASSERT_EQ(policy.next_delay(), milliseconds(200));
    ASSERT_EQ(policy.next_delay(), milliseconds(400));
    ASSERT_EQ(policy.next_delay(), milliseconds(800));
    ASSERT_EQ(policy.next_delay(), milliseconds(1000));
    ASSERT_EQ(policy.next_delay(), milliseconds(1000));
    ASSERT_TRUE(policy.exhausted());
    ASSERT_FALSE(policy.next_delay().has_value());
    ASSERT_EQ(policy.attempts(), 6u);
}

TEST(ReconnectPolicyTest, ResetStartsOver) {
    ReconnectPolicy policy(milliseconds(50), milliseconds(500), 0, 2);
    policy.next_delay();
    policy.next_delay();
    ASSERT_FALSE(policy.next_delay().has_value());

    policy.reset();
    ASSERT_EQ(policy.attempts(), 0u);
    ASSERT_EQ(policy.next_delay(), milliseconds(50));
}

TEST(ReconnectPolicyTest, JitterStaysInBounds) {
    ASSERT_EQ(Crypto::init(), 0);

    for (int round = 0; round < 50; ++round) {
        ReconnectPolicy policy(milliseconds(1000), milliseconds(60000), 20, 3);
        auto first = policy.next_delay();
        ASSERT_TRUE(first.has_value());
        ASSERT_GE(first->count(), 800);
        ASSERT_LE(first->count(), 1200);

        auto second = policy.next_delay();
        ASSERT_GE(second->count(), 1600);
        ASSERT_LE(second->count(), 2400);
    }
}

TEST(ReconnectPolicyTest, NominalDelayCaps) {
    ReconnectPolicy policy(milliseconds(1000), milliseconds(60000), 20, 3);
    ASSERT_EQ(policy.nominal_delay(0), milliseconds(1000));
    ASSERT_EQ(policy.nominal_delay(3), milliseconds(8000));
    ASSERT_EQ(policy.nominal_delay(100), milliseconds(60000));
}

TEST(ReconnectPolicyTest, ZeroRetriesNeverReconnects) {
    ReconnectPolicy policy(milliseconds(10), milliseconds(10), 0, 0);
    ASSERT_TRUE(policy.exhausted());
    ASSERT_FALSE(policy.next_delay().has_value());
}

TEST(ReconnectPolicyTest, RejectsBadParameters) {
    ASSERT_THROW(ReconnectPolicy(milliseconds(0), milliseconds(10), 0, 1), InvalidArgument);
    ASSERT_THROW(ReconnectPolicy(milliseconds(100), milliseconds(10), 0, 1), InvalidArgument);
    ASSERT_THROW(ReconnectPolicy(milliseconds(10), milliseconds(100), 101, 1), InvalidArgument);
}
