#ifndef ONIONCHAT_RECONNECT_POLICY_HPP
#define ONIONCHAT_RECONNECT_POLICY_HPP

#include <chrono>
#include <cstdint>
#include <optional>

namespace OnionChat {

    /**
     * @brief Exponential backoff with jitter and a retry limit.
     *
     * Attempt n (starting at 0) waits base * 2^n, capped at max_delay, then
     * scaled by a random factor in [1 - jitter, 1 + jitter].
     */
    class ReconnectPolicy {
    public:
        ReconnectPolicy(std::chrono::milliseconds base,
                        std::chrono::milliseconds max_delay,
                        uint32_t jitter_percent,
                        uint32_t max_retries);

        /**
         * @brief Consumes one retry.
         * @return The delay before the retry, or std::nullopt once the retries are used up.
         */
        std::optional<std::chrono::milliseconds> next_delay();

        // Backoff for an attempt before jitter is applied.
        std::chrono::milliseconds nominal_delay(uint32_t attempt) const;

        void reset() { attempts_ = 0; }
        uint32_t attempts() const { return attempts_; }
        uint32_t max_retries() const { return max_retries_; }
        bool exhausted() const { return attempts_ >= max_retries_; }

    private:
        std::chrono::milliseconds base_;
        std::chrono::milliseconds max_delay_;
        uint32_t jitter_percent_;
        uint32_t max_retries_;
        uint32_t attempts_ = 0;
    };

} // namespace OnionChat

#endif // ONIONCHAT_RECONNECT_POLICY_HPP
