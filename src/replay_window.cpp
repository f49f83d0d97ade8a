#include "onionchat/replay_window.hpp"

namespace OnionChat {

bool ReplayWindow::check(uint64_t sequence) const {
    if (!initialized_ || sequence > highest_) {
        return true;
    }
    const uint64_t offset = highest_ - sequence;
    if (offset >= SIZE) {
        return false;  // too old
    }
    return (bitmap_ & (1ULL << offset)) == 0;
}

void ReplayWindow::mark(uint64_t sequence) {
    if (!initialized_) {
        initialized_ = true;
        highest_ = sequence;
        bitmap_ = 1;
        return;
    }
    if (sequence > highest_) {
        const uint64_t shift = sequence - highest_;
        bitmap_ = shift >= SIZE ? 1 : (bitmap_ << shift) | 1;
        highest_ = sequence;
        return;
    }
    const uint64_t offset = highest_ - sequence;
    if (offset < SIZE) {
        bitmap_ |= 1ULL << offset;
    }
}

uint64_t ReplayWindow::floor() const {
    if (!initialized_ || highest_ < SIZE - 1) {
        return 0;
    }
    return highest_ - (SIZE - 1);
}

} // namespace OnionChat
