#pragma once

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <random>

namespace kvault {

/**
 * @brief Exponential backoff with bounded jitter
 *
 * delay(n) = min(initial * multiplier^(n-1), max_backoff) * (1 +/- jitter)
 * where n is the 1-based number of the attempt that just failed.
 */
struct RetryPolicy {
    uint32_t max_attempts = 4;                          // total, including the first
    std::chrono::milliseconds initial_backoff{1000};
    std::chrono::milliseconds max_backoff{30000};
    double multiplier = 2.0;
    double jitter = 0.2;                                // fraction, 0.0 - 1.0
    std::chrono::milliseconds max_elapsed{120000};

    [[nodiscard]] std::chrono::milliseconds compute_backoff(uint32_t failed_attempt,
                                                            std::mt19937_64& rng) const {
        const double exponent = failed_attempt > 0 ? static_cast<double>(failed_attempt - 1) : 0.0;
        double base = static_cast<double>(initial_backoff.count()) * std::pow(multiplier, exponent);
        base = std::min(base, static_cast<double>(max_backoff.count()));

        if (jitter > 0.0) {
            std::uniform_real_distribution<double> dist(-jitter, jitter);
            base *= 1.0 + dist(rng);
        }
        base = std::clamp(base, 0.0, static_cast<double>(max_backoff.count()));
        return std::chrono::milliseconds(static_cast<int64_t>(base));
    }

    /// No retries, no sleeping. Used by tests and one-shot calls.
    static RetryPolicy none() {
        RetryPolicy p;
        p.max_attempts = 1;
        p.initial_backoff = std::chrono::milliseconds(0);
        p.max_backoff = std::chrono::milliseconds(0);
        p.jitter = 0.0;
        return p;
    }
};

} // namespace kvault
