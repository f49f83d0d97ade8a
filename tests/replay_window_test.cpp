#include <gtest/gtest.h>

#include "onionchat/replay_window.hpp"

using OnionChat::ReplayWindow;

TEST(ReplayWindowTest, AcceptsFreshAndRejectsDuplicates) {
    ReplayWindow window;
    ASSERT_TRUE(window.empty());
    ASSERT_TRUE(window.check(0));
    window.mark(0);
    ASSERT_FALSE(window.empty());
    ASSERT_FALSE(window.check(0));

    ASSERT_TRUE(window.check(1));
    window.mark(1);
    ASSERT_FALSE(window.check(1));
    ASSERT_EQ(window.highest(), 1u);
}

TEST(ReplayWindowTest, AcceptsGapsOnceWithinWindow) {
    ReplayWindow window;
    window.mark(10);

    // 5 was skipped and is still inside the window.
    ASSERT_TRUE(window.check(5));
    window.mark(5);
    ASSERT_FALSE(window.check(5));
    ASSERT_EQ(window.highest(), 10u);
}

TEST(ReplayWindowTest, RejectsBelowFloor) {
    ReplayWindow window;
    window.mark(100);
    ASSERT_EQ(window.floor(), 100u - (ReplayWindow::SIZE - 1));

    ASSERT_TRUE(window.check(window.floor()));
    ASSERT_FALSE(window.check(window.floor() - 1));
    ASSERT_FALSE(window.check(0));
}

TEST(ReplayWindowTest, LargeJumpClearsHistory) {
    ReplayWindow window;
    for (uint64_t seq = 0; seq < 10; ++seq) {
        window.mark(seq);
    }
    window.mark(1000);
    ASSERT_FALSE(window.check(1000));
    ASSERT_FALSE(window.check(9));
    ASSERT_TRUE(window.check(999));
}

TEST(ReplayWindowTest, CheckDoesNotMark) {
    ReplayWindow window;
    ASSERT_TRUE(window.check(3));
    ASSERT_TRUE(window.check(3));
    ASSERT_TRUE(window.empty());
}
