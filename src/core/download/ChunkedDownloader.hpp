#pragma once

#include <QtCore/QObject>
#include <memory>
#include <vector>

#include "BackoffPolicy.hpp"
#include "DownloadTypes.hpp"
#include "LengthProbe.hpp"

namespace Parfetch {

/**
 * @brief Parallel ranged download of one remote object into one local file
 *
 * Probes the length, truncates the destination, then runs one ChunkWorker per
 * planned range with at most maxFiles in flight and at most parallelFailures
 * retrying at once. A failing chunk does not cancel its siblings; the overall
 * result is decided once every chunk has reported.
 *
 * All work runs on the thread that owns the downloader and needs a running
 * event loop, except download() which spins its own.
 */
class ChunkedDownloader : public QObject {
    Q_OBJECT

public:
    explicit ChunkedDownloader(RangeTransport& transport, QObject* parent = nullptr);
    ~ChunkedDownloader() override;

    /**
     * @brief Blocking download. Runs a local event loop until the outcome is known.
     * @return The summary on success, or the first failure in submission order.
     */
    DownloadOutcome download(const DownloadRequest& request);

    /**
     * @brief Starts a download and returns at once; the outcome arrives through finished().
     * @return A ValidationError when the request is rejected. Nothing is sent in that case.
     */
    Expected<void, DownloadError> start(const DownloadRequest& request);

    bool isRunning() const { return run_ != nullptr; }

    // Chunk workers alive in the current download; a worker goes once its chunk reports.
    int liveWorkerCount() const;

    void setBackoffPolicy(const BackoffPolicy& policy) { backoff_ = policy; }
    const BackoffPolicy& backoffPolicy() const { return backoff_; }

    // Per-chunk outcomes and gate statistics of the most recent finished download.
    const std::vector<ChunkOutcome>& lastChunkOutcomes() const { return lastOutcomes_; }
    int lastPeakConcurrency() const { return lastPeakConcurrency_; }
    int lastPeakParallelFailures() const { return lastPeakParallelFailures_; }

signals:
    void started(qint64 totalBytes);
    void progress(qint64 deltaBytes);
    void chunkRetrying(int index, int retry, qint64 delayMs);
    void finished(const Parfetch::DownloadOutcome& outcome);

private:
    struct Run;

    void onLengthKnown(const std::shared_ptr<Run>& run, LengthResult length);
    void submitNext(const std::shared_ptr<Run>& run);
    void launch(const std::shared_ptr<Run>& run, int index, const ByteRange& range);
    void onChunkFinished(const std::shared_ptr<Run>& run, const ChunkOutcome& outcome);
    void finish(DownloadOutcome outcome);

    RangeTransport& transport_;
    BackoffPolicy backoff_;
    std::shared_ptr<Run> run_;

    std::vector<ChunkOutcome> lastOutcomes_;
    int lastPeakConcurrency_ = 0;
    int lastPeakParallelFailures_ = 0;
};

} // namespace Parfetch
