#include "ChunkedDownloader.hpp"
#include "ChunkPlanner.hpp"
#include "ChunkWorker.hpp"
#include "PermitPools.hpp"
#include "RangeWriter.hpp"
#include "ResultAggregator.hpp"
#include "../common/Logger.hpp"

#include <QtCore/QEventLoop>
#include <QtCore/QPointer>
#include <map>
#include <optional>

namespace Parfetch {

struct ChunkedDownloader::Run {
    Run(const DownloadRequest& downloadRequest, RangeTransport& transport)
        : request(downloadRequest)
        , writer(downloadRequest.destination)
        , probe(transport)
        , concurrencyGate(downloadRequest.maxFiles)
        , failureGate(downloadRequest.parallelFailures)
        , planner(0, downloadRequest.chunkSize) {
    }

    const DownloadRequest request;
    RangeWriter writer;
    LengthProbe probe;
    ConcurrencyGate concurrencyGate;
    FailureGate failureGate;
    ChunkPlanner planner;
    ResultAggregator aggregator;

    // Workers still in flight, by chunk index. Declared last: they reference the
    // members above and must go first.
    std::map<int, std::unique_ptr<ChunkWorker>> workers;
};

ChunkedDownloader::ChunkedDownloader(RangeTransport& transport, QObject* parent)
    : QObject(parent)
    , transport_(transport) {
}

ChunkedDownloader::~ChunkedDownloader() {
    if (run_) {
        PARFETCH_WARN("ChunkedDownloader destroyed while downloading {}",
                      run_->request.url.toString().toStdString());
        run_.reset();
    }
}

DownloadOutcome ChunkedDownloader::download(const DownloadRequest& request) {
    std::optional<DownloadOutcome> outcome;
    QEventLoop loop;

    auto connection = connect(this, &ChunkedDownloader::finished, &loop,
                              [&outcome, &loop](const DownloadOutcome& result) {
                                  outcome = result;
                                  loop.quit();
                              });

    auto startResult = start(request);
    if (startResult.hasError()) {
        disconnect(connection);
        return makeUnexpected(startResult.error());
    }

    if (!outcome) {
        loop.exec();
    }
    disconnect(connection);

    if (!outcome) {
        return makeUnexpected(DownloadError::join("Event loop exited before the download finished"));
    }
    return std::move(*outcome);
}

int ChunkedDownloader::liveWorkerCount() const {
    return run_ ? static_cast<int>(run_->workers.size()) : 0;
}

Expected<void, DownloadError> ChunkedDownloader::start(const DownloadRequest& request) {
    if (run_) {
        return makeUnexpected(DownloadError::validation("A download is already in progress"));
    }

    auto validation = validateDownloadRequest(request);
    if (validation.hasError()) {
        PARFETCH_ERROR("Rejected download request: {}", validation.error().message.toStdString());
        return validation;
    }

    PARFETCH_INFO("Downloading {} -> {} (chunk {} bytes, max files {}, parallel failures {}, max retries {})",
                  request.url.toString().toStdString(), request.destination.toStdString(),
                  request.chunkSize, request.maxFiles, request.parallelFailures, request.maxRetries);

    lastOutcomes_.clear();
    lastPeakConcurrency_ = 0;
    lastPeakParallelFailures_ = 0;

    auto run = std::make_shared<Run>(request, transport_);
    run_ = run;

    QPointer<ChunkedDownloader> self(this);
    std::weak_ptr<Run> weakRun = run;
    run->probe.run(request.url, request.headers, [self, weakRun](LengthResult length) {
        auto run = weakRun.lock();
        if (!self || !run) {
            return;
        }
        self->onLengthKnown(run, std::move(length));
    });

    return {};
}

void ChunkedDownloader::onLengthKnown(const std::shared_ptr<Run>& run, LengthResult length) {
    if (run != run_) {
        return;
    }

    if (length.hasError()) {
        PARFETCH_ERROR("Length probe failed: {}", length.error().describe().toStdString());
        finish(makeUnexpected(length.error()));
        return;
    }

    const qint64 total = length.value();

    const qint64 chunkCount = ChunkPlanner::chunkCount(total, run->request.chunkSize);
    if (chunkCount > ChunkPlanner::kMaxChunkCount) {
        finish(makeUnexpected(DownloadError::validation(
            QString("Chunk size %1 splits %2 bytes into %3 chunks, more than the limit of %4")
                .arg(run->request.chunkSize).arg(total).arg(chunkCount).arg(ChunkPlanner::kMaxChunkCount))));
        return;
    }

    // Bytes of an older, longer file must not survive past the new length.
    auto truncated = run->writer.truncate();
    if (truncated.hasError()) {
        finish(makeUnexpected(truncated.error()));
        return;
    }

    run->planner = ChunkPlanner(total, run->request.chunkSize);
    run->aggregator.reset(total, static_cast<int>(chunkCount));

    PARFETCH_INFO("{} is {} bytes, {} chunk(s)", run->request.url.toString().toStdString(),
                  total, chunkCount);
    emit started(total);

    if (run->aggregator.isComplete()) {
        finish(run->aggregator.result());
        return;
    }

    submitNext(run);
}

void ChunkedDownloader::submitNext(const std::shared_ptr<Run>& run) {
    // Free permits are granted synchronously, so fill them here in a loop. Once the
    // gate is full, one waiter is parked and its grant resumes submission.
    while (run == run_ && run->planner.hasNext()) {
        const int index = run->planner.nextIndex();
        const ByteRange range = *run->planner.next();

        if (run->concurrencyGate.available() > 0 && run->concurrencyGate.waiting() == 0) {
            run->concurrencyGate.acquire([this, run, index, range]() {
                launch(run, index, range);
            });
            continue;
        }

        std::weak_ptr<Run> weakRun = run;
        run->concurrencyGate.acquire([this, weakRun, index, range]() {
            auto current = weakRun.lock();
            if (!current || current != run_) {
                return;
            }
            launch(current, index, range);
            submitNext(current);
        });
        return;
    }
}

void ChunkedDownloader::launch(const std::shared_ptr<Run>& run, int index, const ByteRange& range) {
    auto worker = std::make_unique<ChunkWorker>(index, range, run->request, transport_,
                                                run->failureGate, run->writer, backoff_);

    connect(worker.get(), &ChunkWorker::chunkWritten, this, [this](int, qint64 bytes) {
        emit progress(bytes);
    });
    connect(worker.get(), &ChunkWorker::retryScheduled, this, &ChunkedDownloader::chunkRetrying);

    std::weak_ptr<Run> weakRun = run;
    connect(worker.get(), &ChunkWorker::finished, this, [this, weakRun](const ChunkOutcome& outcome) {
        if (auto current = weakRun.lock()) {
            onChunkFinished(current, outcome);
        }
    });

    ChunkWorker* launched = worker.get();
    run->workers[index] = std::move(worker);
    launched->start();
}

void ChunkedDownloader::onChunkFinished(const std::shared_ptr<Run>& run, const ChunkOutcome& outcome) {
    if (run != run_) {
        return;
    }

    // The worker is still emitting finished(); delete it from the event loop.
    auto worker = run->workers.find(outcome.index);
    if (worker != run->workers.end()) {
        worker->second.release()->deleteLater();
        run->workers.erase(worker);
    }

    run->concurrencyGate.release();
    run->aggregator.record(outcome);

    if (run->aggregator.isComplete()) {
        finish(run->aggregator.result());
    }
}

void ChunkedDownloader::finish(DownloadOutcome outcome) {
    auto retired = std::move(run_);
    run_.reset();

    if (retired) {
        lastOutcomes_ = retired->aggregator.outcomes();
        lastPeakConcurrency_ = retired->concurrencyGate.peakInUse();
        lastPeakParallelFailures_ = retired->failureGate.peakInUse();
    }

    if (outcome.hasValue()) {
        PARFETCH_INFO("Download complete: {} bytes in {} chunk(s)",
                      outcome.value().totalBytes, outcome.value().chunkCount);
    } else {
        PARFETCH_ERROR("Download failed: {}", outcome.error().describe().toStdString());
    }

    // The reporting worker is still on the call stack; release the run from the event loop.
    QMetaObject::invokeMethod(this, [retired]() { Q_UNUSED(retired); }, Qt::QueuedConnection);

    emit finished(outcome);
}

} // namespace Parfetch
