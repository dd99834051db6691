#include "BackoffPolicy.hpp"

#include <QtCore/QRandomGenerator>
#include <algorithm>

namespace Parfetch {

namespace {
// Keeps n^2 far from overflow; the cap is reached long before this anyway.
constexpr long long kMaxRetryIndex = 1000000;
}

std::chrono::milliseconds BackoffPolicy::delayFor(int retryIndex) const {
    std::chrono::milliseconds jitter{0};
    if (maxJitter.count() > 0) {
        jitter = std::chrono::milliseconds(
            QRandomGenerator::global()->bounded(static_cast<qint64>(maxJitter.count()) + 1));
    }
    return delayFor(retryIndex, jitter);
}

std::chrono::milliseconds BackoffPolicy::delayFor(int retryIndex, std::chrono::milliseconds jitter) const {
    const long long n = std::clamp<long long>(retryIndex, 0, kMaxRetryIndex);
    const long long j = std::clamp<long long>(jitter.count(), 0, std::max<long long>(maxJitter.count(), 0));

    const long long raw = base.count() + n * n + j;
    return std::chrono::milliseconds(std::max<long long>(std::min<long long>(raw, max.count()), 0));
}

BackoffPolicy BackoffPolicy::standard() {
    return BackoffPolicy{};
}

BackoffPolicy BackoffPolicy::immediate() {
    BackoffPolicy policy;
    policy.base = std::chrono::milliseconds(0);
    policy.max = std::chrono::milliseconds(0);
    policy.maxJitter = std::chrono::milliseconds(0);
    return policy;
}

} // namespace Parfetch
