#pragma once

#include <vector>

#include "DownloadTypes.hpp"

namespace Parfetch {

/**
 * @brief Checks a request before any network activity
 *
 * Rejects a non-positive chunk size or max files, parallel failures above
 * max files, retry settings where only one of parallel failures / max retries
 * is zero, a non-http(s) URL, an empty destination and duplicate header keys.
 */
Expected<void, DownloadError> validateDownloadRequest(const DownloadRequest& request);

/**
 * @brief Collects terminal chunk outcomes and reduces them to one result
 *
 * The overall failure is the one of the lowest chunk index, i.e. the first
 * in submission order, regardless of completion order.
 */
class ResultAggregator {
public:
    void reset(qint64 totalBytes, int expectedChunks);

    // Later reports for an already recorded chunk are ignored.
    void record(const ChunkOutcome& outcome);

    bool isComplete() const { return reported_ == expected_; }
    int reported() const { return reported_; }
    int expected() const { return expected_; }
    int failedCount() const;

    DownloadOutcome result() const;

    const std::vector<ChunkOutcome>& outcomes() const { return outcomes_; }

private:
    qint64 totalBytes_ = 0;
    int expected_ = 0;
    int reported_ = 0;
    std::vector<ChunkOutcome> outcomes_;
};

} // namespace Parfetch
