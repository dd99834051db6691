#include "DownloadTypes.hpp"

namespace Parfetch {

DownloadError DownloadError::validation(const QString& message) {
    DownloadError error;
    error.kind = DownloadErrorKind::ValidationError;
    error.message = message;
    return error;
}

DownloadError DownloadError::probe(const QString& message, int httpStatus) {
    DownloadError error;
    error.kind = DownloadErrorKind::ProbeError;
    error.message = message;
    error.httpStatus = httpStatus;
    return error;
}

DownloadError DownloadError::transport(const QString& message) {
    DownloadError error;
    error.kind = DownloadErrorKind::TransportError;
    error.message = message;
    return error;
}

DownloadError DownloadError::status(int httpStatus, const QString& message) {
    DownloadError error;
    error.kind = DownloadErrorKind::StatusError;
    error.message = message;
    error.httpStatus = httpStatus;
    return error;
}

DownloadError DownloadError::fileIO(const QString& message) {
    DownloadError error;
    error.kind = DownloadErrorKind::FileIOError;
    error.message = message;
    return error;
}

DownloadError DownloadError::join(const QString& message) {
    DownloadError error;
    error.kind = DownloadErrorKind::JoinError;
    error.message = message;
    return error;
}

DownloadError DownloadError::retryExhausted(const DownloadError& last, int maxRetries) {
    DownloadError error = last;
    error.kind = DownloadErrorKind::RetryExhausted;
    error.message = QString("Failed after too many retries (%1)").arg(maxRetries);
    error.limit = maxRetries;
    error.causeKind = last.kind;
    error.causeMessage = last.message;
    return error;
}

DownloadError DownloadError::concurrencyLimitExceeded(const DownloadError& last, int parallelFailures) {
    DownloadError error = last;
    error.kind = DownloadErrorKind::ConcurrencyLimitExceeded;
    error.message = QString("Too many failures in parallel (%1)").arg(parallelFailures);
    error.limit = parallelFailures;
    error.causeKind = last.kind;
    error.causeMessage = last.message;
    return error;
}

bool DownloadError::isRetryable() const {
    switch (kind) {
        case DownloadErrorKind::TransportError:
        case DownloadErrorKind::StatusError:
        case DownloadErrorKind::FileIOError:
            return true;
        default:
            return false;
    }
}

QString DownloadError::describe() const {
    QString text = QString("%1: %2").arg(toString(kind), message);

    if (range) {
        text += QString(" [chunk %1, bytes %2-%3")
                    .arg(chunkIndex.value_or(-1))
                    .arg(range->start)
                    .arg(range->stop);
        if (attempts > 0) {
            text += QString(", %1 attempt(s)").arg(attempts);
        }
        text += "]";
    }

    if (httpStatus > 0) {
        text += QString(" (HTTP %1)").arg(httpStatus);
    }

    if (causeKind) {
        text += QString(": %1: %2").arg(toString(*causeKind), causeMessage);
    }

    return text;
}

QString toString(DownloadErrorKind kind) {
    switch (kind) {
        case DownloadErrorKind::ValidationError: return "ValidationError";
        case DownloadErrorKind::ProbeError: return "ProbeError";
        case DownloadErrorKind::TransportError: return "TransportError";
        case DownloadErrorKind::StatusError: return "StatusError";
        case DownloadErrorKind::FileIOError: return "FileIOError";
        case DownloadErrorKind::RetryExhausted: return "RetryExhausted";
        case DownloadErrorKind::ConcurrencyLimitExceeded: return "ConcurrencyLimitExceeded";
        case DownloadErrorKind::JoinError: return "JoinError";
    }
    return "UnknownError";
}

QString toString(ChunkState state) {
    switch (state) {
        case ChunkState::Pending: return "pending";
        case ChunkState::Attempting: return "attempting";
        case ChunkState::Backoff: return "backoff";
        case ChunkState::Succeeded: return "succeeded";
        case ChunkState::Failed: return "failed";
        case ChunkState::Aborted: return "aborted";
    }
    return "unknown";
}

} // namespace Parfetch
