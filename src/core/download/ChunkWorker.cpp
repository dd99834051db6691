#include "ChunkWorker.hpp"
#include "../common/Logger.hpp"

#include <QtCore/QPointer>
#include <QtCore/QTimer>
#include <exception>

namespace Parfetch {

ChunkWorker::ChunkWorker(int index,
                         const ByteRange& range,
                         const DownloadRequest& request,
                         RangeTransport& transport,
                         FailureGate& failureGate,
                         const RangeWriter& writer,
                         const BackoffPolicy& backoff,
                         QObject* parent)
    : QObject(parent)
    , index_(index)
    , range_(range)
    , request_(request)
    , transport_(transport)
    , failureGate_(failureGate)
    , writer_(writer)
    , backoff_(backoff) {
}

ChunkWorker::~ChunkWorker() {
    failurePermit_.reset();
    if (!reported_) {
        report(ChunkState::Aborted,
               withChunkContext(DownloadError::join("Chunk worker terminated before reaching a terminal state")));
    }
}

void ChunkWorker::start() {
    if (state_ != ChunkState::Pending) {
        PARFETCH_WARN("Chunk {} started twice, ignoring", index_);
        return;
    }
    attempt();
}

void ChunkWorker::attempt() {
    state_ = ChunkState::Attempting;
    ++attempts_;

    PARFETCH_TRACE("Chunk {} attempt {}: bytes {}-{}", index_, attempts_, range_.start, range_.stop);

    TransportRequest request;
    request.url = request_.url;
    request.headers = withRangeHeader(request_.headers, range_);

    QPointer<ChunkWorker> self(this);
    transport_.get(request, [self](TransportResult result) {
        if (!self) {
            return;
        }
        try {
            self->onResponse(std::move(result));
        } catch (const std::exception& e) {
            self->failurePermit_.reset();
            self->abort(DownloadError::join(QString("Chunk worker failed: %1").arg(e.what())));
        }
    });
}

void ChunkWorker::onResponse(TransportResult result) {
    // The retry this permit covered has concluded, whatever its result.
    failurePermit_.reset();

    if (result.hasError()) {
        handleFailure(result.error());
        return;
    }

    auto accepted = accept(result.value());
    if (accepted.hasError()) {
        handleFailure(accepted.error());
        return;
    }

    emit chunkWritten(index_, range_.length());
    succeed();
}

Expected<void, DownloadError> ChunkWorker::accept(const TransportResponse& response) {
    if (!response.isSuccess()) {
        return makeUnexpected(DownloadError::status(
            response.statusCode, QString("Chunk request rejected with HTTP %1").arg(response.statusCode)));
    }

    if (response.body.size() != range_.length()) {
        return makeUnexpected(DownloadError::status(
            response.statusCode,
            QString("Expected %1 bytes, received %2").arg(range_.length()).arg(response.body.size())));
    }

    return writer_.write(range_.start, response.body);
}

void ChunkWorker::handleFailure(DownloadError error) {
    state_ = ChunkState::Failed;
    error = withChunkContext(std::move(error));

    if (!request_.retryEnabled()) {
        abort(std::move(error));
        return;
    }

    const int retriesUsed = attempts_ - 1;
    if (retriesUsed >= request_.maxRetries) {
        abort(DownloadError::retryExhausted(error, request_.maxRetries));
        return;
    }

    auto permit = failureGate_.tryAcquire();
    if (!permit) {
        abort(DownloadError::concurrencyLimitExceeded(error, request_.parallelFailures));
        return;
    }
    failurePermit_ = std::move(permit);

    const auto delay = backoff_.delayFor(retriesUsed);
    state_ = ChunkState::Backoff;

    PARFETCH_WARN("Chunk {} failed ({}), retry {}/{} in {}ms",
                  index_, error.message.toStdString(), retriesUsed + 1, request_.maxRetries,
                  static_cast<long long>(delay.count()));
    emit retryScheduled(index_, retriesUsed + 1, delay.count());

    QTimer::singleShot(delay, this, [this]() {
        try {
            attempt();
        } catch (const std::exception& e) {
            failurePermit_.reset();
            abort(DownloadError::join(QString("Chunk worker failed: %1").arg(e.what())));
        }
    });
}

void ChunkWorker::succeed() {
    PARFETCH_TRACE("Chunk {} done after {} attempt(s)", index_, attempts_);
    report(ChunkState::Succeeded, std::nullopt);
}

void ChunkWorker::abort(DownloadError error) {
    error = withChunkContext(std::move(error));
    PARFETCH_ERROR("Chunk {} aborted: {}", index_, error.describe().toStdString());
    report(ChunkState::Aborted, std::move(error));
}

void ChunkWorker::report(ChunkState state, std::optional<DownloadError> error) {
    if (reported_) {
        return;
    }
    reported_ = true;
    state_ = state;

    ChunkOutcome outcome;
    outcome.index = index_;
    outcome.range = range_;
    outcome.attempts = attempts_;
    outcome.state = state;
    outcome.error = std::move(error);
    emit finished(outcome);
}

DownloadError ChunkWorker::withChunkContext(DownloadError error) const {
    error.chunkIndex = index_;
    error.range = range_;
    error.attempts = attempts_;
    return error;
}

} // namespace Parfetch
