#include <gtest/gtest.h>

#include "onionchat/version.hpp"

using namespace OnionChat;

// Test case where both sides share their preferred version.
TEST(VersionNegotiationTest, SameVersion) {
    std::vector<Version> initiator = {Versions::V1_0};
    std::vector<Version> responder = {Versions::V1_0};
    auto result = VersionNegotiator::negotiate(initiator, responder);
    ASSERT_TRUE(result.has_value());
    ASSERT_EQ(result.value(), Versions::V1_0);
}

// The initiator's order of preference decides among common versions.
TEST(VersionNegotiationTest, InitiatorPreferenceWins) {
    const Version v1_1 = 0x0101;
    const Version v2_0 = 0x0200;
    std::vector<Version> initiator = {v2_0, v1_1, Versions::V1_0};
    std::vector<Version> responder = {Versions::V1_0, v1_1};
    auto result = VersionNegotiator::negotiate(initiator, responder);
    ASSERT_TRUE(result.has_value());
    ASSERT_EQ(result.value(), v1_1);
}

// Test case with no common versions.
TEST(VersionNegotiationTest, NoCommonVersion) {
    std::vector<Version> initiator = {0x0200};
    std::vector<Version> responder = {Versions::V1_0};
    auto result = VersionNegotiator::negotiate(initiator, responder);
    ASSERT_FALSE(result.has_value());
}

TEST(VersionNegotiationTest, EmptyOffer) {
    std::vector<Version> initiator;
    auto result = VersionNegotiator::negotiate(initiator, SUPPORTED_VERSIONS);
    ASSERT_FALSE(result.has_value());
}

TEST(VersionNegotiationTest, LocalSupport) {
    ASSERT_TRUE(VersionNegotiator::is_supported(Versions::V1_0));
    ASSERT_FALSE(VersionNegotiator::is_supported(0x0200));
}
