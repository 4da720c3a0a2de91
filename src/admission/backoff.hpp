#pragma once
#include <chrono>
#include <cstdint>
#include <random>

namespace warden::admission {

struct BackoffConfig {
    uint32_t initial_ms = 1000;         // First delay
    uint32_t max_ms = 60000;            // Cap
    double multiplier = 2.0;            // Exponential base
    bool jitter = true;                 // Scale each delay by [0.5, 1.5)
};

// Exponential backoff: initial * multiplier^attempt, capped, optionally jittered.
class Backoff {
public:
    explicit Backoff(BackoffConfig config = {});

    // Delay before the next retry; advances the attempt counter.
    std::chrono::milliseconds next_delay();

    void reset() { attempt_ = 0; }
    uint32_t attempts() const { return attempt_; }

    // Un-jittered delay for a given attempt (0-based)
    static uint32_t base_delay_ms(const BackoffConfig& config, uint32_t attempt);

private:
    BackoffConfig config_;
    uint32_t attempt_ = 0;
    std::mt19937 rng_;
};

} // namespace warden::admission
