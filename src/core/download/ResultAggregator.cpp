#include "ResultAggregator.hpp"
#include "../common/Logger.hpp"

#include <set>

namespace Parfetch {

Expected<void, DownloadError> validateDownloadRequest(const DownloadRequest& request) {
    if (request.chunkSize <= 0) {
        return makeUnexpected(DownloadError::validation(
            QString("Chunk size must be positive, got %1").arg(request.chunkSize)));
    }

    if (request.maxFiles <= 0) {
        return makeUnexpected(DownloadError::validation(
            QString("Max files must be positive, got %1").arg(request.maxFiles)));
    }

    if (request.parallelFailures < 0 || request.maxRetries < 0) {
        return makeUnexpected(DownloadError::validation("Parallel failures and max retries must not be negative"));
    }

    if (request.parallelFailures > request.maxFiles) {
        return makeUnexpected(DownloadError::validation(
            QString("Parallel failures (%1) cannot exceed max files (%2)")
                .arg(request.parallelFailures).arg(request.maxFiles)));
    }

    if ((request.parallelFailures == 0) != (request.maxRetries == 0)) {
        return makeUnexpected(DownloadError::validation(
            "Retry needs both max retries and parallel failures set, or neither"));
    }

    const QString scheme = request.url.scheme().toLower();
    if (!request.url.isValid() || request.url.host().isEmpty() || (scheme != "http" && scheme != "https")) {
        return makeUnexpected(DownloadError::validation(
            QString("Invalid download URL: '%1'").arg(request.url.toString())));
    }

    if (request.destination.trimmed().isEmpty()) {
        return makeUnexpected(DownloadError::validation("Destination path is empty"));
    }

    std::set<QByteArray> keys;
    for (const auto& [key, value] : request.headers) {
        Q_UNUSED(value);
        if (key.trimmed().isEmpty()) {
            return makeUnexpected(DownloadError::validation("Header name is empty"));
        }
        if (!keys.insert(key.trimmed().toLower()).second) {
            return makeUnexpected(DownloadError::validation(
                QString("Duplicate header: %1").arg(QString::fromLatin1(key))));
        }
    }

    return {};
}

void ResultAggregator::reset(qint64 totalBytes, int expectedChunks) {
    if (expectedChunks < 0) {
        PARFETCH_WARN("ResultAggregator: negative chunk count {}", expectedChunks);
        expectedChunks = 0;
    }
    totalBytes_ = totalBytes;
    expected_ = expectedChunks;
    reported_ = 0;
    outcomes_.assign(static_cast<std::size_t>(expectedChunks), ChunkOutcome{});
    for (int i = 0; i < expectedChunks; ++i) {
        outcomes_[static_cast<std::size_t>(i)].index = i;
    }
}

void ResultAggregator::record(const ChunkOutcome& outcome) {
    if (outcome.index < 0 || outcome.index >= expected_) {
        PARFETCH_WARN("ResultAggregator: outcome for unknown chunk {}", outcome.index);
        return;
    }

    auto& slot = outcomes_[static_cast<std::size_t>(outcome.index)];
    if (slot.state == ChunkState::Succeeded || slot.state == ChunkState::Aborted) {
        return;
    }
    slot = outcome;
    ++reported_;
}

int ResultAggregator::failedCount() const {
    int failed = 0;
    for (const auto& outcome : outcomes_) {
        if (outcome.state == ChunkState::Aborted) {
            ++failed;
        }
    }
    return failed;
}

DownloadOutcome ResultAggregator::result() const {
    for (const auto& outcome : outcomes_) {
        if (outcome.succeeded()) {
            continue;
        }
        if (outcome.error) {
            return makeUnexpected(*outcome.error);
        }

        DownloadError error = DownloadError::join("Chunk never reached a terminal state");
        error.chunkIndex = outcome.index;
        return makeUnexpected(error);
    }

    DownloadSummary summary;
    summary.totalBytes = totalBytes_;
    summary.chunkCount = expected_;
    summary.chunks = outcomes_;
    return summary;
}

} // namespace Parfetch
