#pragma once

#include <QtCore/QObject>
#include <optional>

#include "BackoffPolicy.hpp"
#include "PermitPools.hpp"
#include "RangeTransport.hpp"
#include "RangeWriter.hpp"

namespace Parfetch {

/**
 * @brief Drives one byte range from its first attempt to a terminal state
 *
 * Pending -> Attempting -> Succeeded | Failed
 * Failed -> Backoff -> Attempting   (retry enabled, budget left, failure permit granted)
 * Failed -> Aborted
 *
 * The worker reports exactly once through finished(). A worker destroyed
 * before reporting reports a JoinError from its destructor.
 */
class ChunkWorker : public QObject {
    Q_OBJECT

public:
    ChunkWorker(int index,
                const ByteRange& range,
                const DownloadRequest& request,
                RangeTransport& transport,
                FailureGate& failureGate,
                const RangeWriter& writer,
                const BackoffPolicy& backoff,
                QObject* parent = nullptr);
    ~ChunkWorker() override;

    void start();

    int index() const { return index_; }
    const ByteRange& range() const { return range_; }
    int attempts() const { return attempts_; }
    ChunkState state() const { return state_; }

signals:
    void chunkWritten(int index, qint64 bytes);
    void retryScheduled(int index, int retry, qint64 delayMs);
    void finished(const Parfetch::ChunkOutcome& outcome);

private:
    void attempt();
    void onResponse(TransportResult result);
    Expected<void, DownloadError> accept(const TransportResponse& response);
    void handleFailure(DownloadError error);
    void succeed();
    void abort(DownloadError error);
    void report(ChunkState state, std::optional<DownloadError> error);
    DownloadError withChunkContext(DownloadError error) const;

    const int index_;
    const ByteRange range_;
    const DownloadRequest& request_;
    RangeTransport& transport_;
    FailureGate& failureGate_;
    const RangeWriter& writer_;
    const BackoffPolicy backoff_;

    ChunkState state_ = ChunkState::Pending;
    int attempts_ = 0;
    bool reported_ = false;

    // Held from the moment a retry is granted until that retry concludes.
    std::optional<FailureGate::Permit> failurePermit_;
};

} // namespace Parfetch
