#include "onionchat/reconnect_policy.hpp"

#include <algorithm>

#include "onionchat/crypto.hpp"
#include "onionchat/errors.hpp"

namespace OnionChat {

ReconnectPolicy::ReconnectPolicy(std::chrono::milliseconds base,
                                 std::chrono::milliseconds max_delay,
                                 uint32_t jitter_percent,
                                 uint32_t max_retries)
    : base_(base), max_delay_(max_delay), jitter_percent_(jitter_percent), max_retries_(max_retries) {
    if (base_.count() <= 0 || max_delay_ < base_) {
        throw InvalidArgument("Backoff base must be positive and not above the maximum delay.");
    }
    if (jitter_percent_ > 100) {
        throw InvalidArgument("Backoff jitter is a percentage between 0 and 100.");
    }
}

std::chrono::milliseconds ReconnectPolicy::nominal_delay(uint32_t attempt) const {
    std::chrono::milliseconds delay = base_;
    for (uint32_t i = 0; i < attempt && delay < max_delay_; ++i) {
        delay *= 2;
    }
    return std::min(delay, max_delay_);
}

std::optional<std::chrono::milliseconds> ReconnectPolicy::next_delay() {
    if (exhausted()) {
        return std::nullopt;
    }
    const int64_t nominal = nominal_delay(attempts_).count();
    ++attempts_;
    if (jitter_percent_ == 0) {
        return std::chrono::milliseconds(nominal);
    }

    // Uniform offset in [-spread, +spread].
    const int64_t spread = std::min<int64_t>(nominal * jitter_percent_ / 100, 0x3FFFFFFF);
    const int64_t offset = static_cast<int64_t>(Crypto::random_uniform(static_cast<uint32_t>(2 * spread + 1))) - spread;
    return std::chrono::milliseconds(std::max<int64_t>(1, nominal + offset));
}

} // namespace OnionChat
