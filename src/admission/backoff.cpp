#include "admission/backoff.hpp"
#include <algorithm>

namespace warden::admission {

Backoff::Backoff(BackoffConfig config)
    : config_(config), rng_(std::random_device{}()) {
}

uint32_t Backoff::base_delay_ms(const BackoffConfig& config, uint32_t attempt) {
    double delay = config.initial_ms;
    for (uint32_t i = 0; i < attempt; ++i) {
        delay *= config.multiplier;
        if (delay >= config.max_ms) {
            return config.max_ms;
        }
    }
    return static_cast<uint32_t>(std::min<double>(delay, config.max_ms));
}

std::chrono::milliseconds Backoff::next_delay() {
    double delay = base_delay_ms(config_, attempt_);
    attempt_++;

    if (config_.jitter) {
        std::uniform_real_distribution<double> dist(0.5, 1.5);
        delay *= dist(rng_);
    }
    return std::chrono::milliseconds(static_cast<int64_t>(delay));
}

} // namespace warden::admission
