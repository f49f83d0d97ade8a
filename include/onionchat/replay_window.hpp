#ifndef ONIONCHAT_REPLAY_WINDOW_HPP
#define ONIONCHAT_REPLAY_WINDOW_HPP

#include <cstdint>

namespace OnionChat {

    /**
     * @brief Sliding window over inbound sequence numbers.
     *
     * Tracks the highest accepted sequence and a bitmap of the SIZE sequences
     * at or below it. A sequence is acceptable when it is above the window
     * floor and has not been accepted before. check() and mark() are split so
     * the caller can authenticate a frame between them.
     */
    class ReplayWindow {
    public:
        static constexpr uint64_t SIZE = 64;

        bool check(uint64_t sequence) const;
        void mark(uint64_t sequence);

        bool empty() const { return !initialized_; }
        uint64_t highest() const { return highest_; }

        // Lowest sequence that can still be accepted.
        uint64_t floor() const;

    private:
        bool initialized_ = false;
        uint64_t highest_ = 0;
        uint64_t bitmap_ = 0;  // bit i set: highest_ - i was accepted
    };

} // namespace OnionChat

#endif // ONIONCHAT_REPLAY_WINDOW_HPP
