#pragma once

#include <chrono>

namespace Parfetch {

/**
 * @brief Exponential-ish backoff schedule for chunk retries
 *
 * delay(n) = min(base + n^2 + jitter, max) milliseconds, where n is the
 * 0-based retry index and jitter is uniform in [0, maxJitter].
 */
struct BackoffPolicy {
    std::chrono::milliseconds base{300};
    std::chrono::milliseconds max{10000};
    std::chrono::milliseconds maxJitter{500};

    // Draws the jitter from QRandomGenerator::global().
    std::chrono::milliseconds delayFor(int retryIndex) const;

    // Deterministic variant; jitter is clamped to [0, maxJitter].
    std::chrono::milliseconds delayFor(int retryIndex, std::chrono::milliseconds jitter) const;

    static BackoffPolicy standard();

    // No waiting at all; used to keep retry-heavy scenarios fast.
    static BackoffPolicy immediate();
};

} // namespace Parfetch
