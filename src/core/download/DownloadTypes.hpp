#pragma once

#include <QtCore/QByteArray>
#include <QtCore/QMetaType>
#include <QtCore/QString>
#include <QtCore/QUrl>
#include <optional>
#include <utility>
#include <vector>

#include "../common/Expected.hpp"

namespace Parfetch {

/**
 * @brief Inclusive byte interval [start, stop] of the remote object
 */
struct ByteRange {
    qint64 start = 0;
    qint64 stop = 0;

    qint64 length() const { return stop - start + 1; }

    bool operator==(const ByteRange& other) const {
        return start == other.start && stop == other.stop;
    }
    bool operator!=(const ByteRange& other) const { return !(*this == other); }
};

// Extra request headers; keys are unique, order is irrelevant.
using HeaderList = std::vector<std::pair<QByteArray, QByteArray>>;

/**
 * @brief Immutable configuration of one chunked download
 *
 * parallelFailures == 0 iff maxRetries == 0 (retry is all-or-nothing),
 * and parallelFailures <= maxFiles.
 */
struct DownloadRequest {
    QUrl url;
    QString destination;
    qint64 chunkSize = 10 * 1024 * 1024;
    int maxFiles = 16;
    int parallelFailures = 0;
    int maxRetries = 0;
    HeaderList headers;

    bool retryEnabled() const { return parallelFailures > 0 && maxRetries > 0; }
};

enum class DownloadErrorKind {
    ValidationError,
    ProbeError,
    TransportError,
    StatusError,
    FileIOError,
    RetryExhausted,
    ConcurrencyLimitExceeded,
    JoinError
};

struct DownloadError {
    DownloadErrorKind kind = DownloadErrorKind::TransportError;
    QString message;

    // Chunk context, set for every error raised by a chunk worker.
    std::optional<int> chunkIndex;
    std::optional<ByteRange> range;
    int attempts = 0;

    // Status of the offending response, 0 when there was none.
    int httpStatus = 0;

    // max_retries for RetryExhausted, parallel_failures for ConcurrencyLimitExceeded.
    int limit = 0;

    // The per-attempt failure that led to RetryExhausted / ConcurrencyLimitExceeded.
    std::optional<DownloadErrorKind> causeKind;
    QString causeMessage;

    static DownloadError validation(const QString& message);
    static DownloadError probe(const QString& message, int httpStatus = 0);
    static DownloadError transport(const QString& message);
    static DownloadError status(int httpStatus, const QString& message);
    static DownloadError fileIO(const QString& message);
    static DownloadError join(const QString& message);
    static DownloadError retryExhausted(const DownloadError& last, int maxRetries);
    static DownloadError concurrencyLimitExceeded(const DownloadError& last, int parallelFailures);

    // Transport, status and file errors may be retried; everything else is terminal.
    bool isRetryable() const;

    QString describe() const;
};

QString toString(DownloadErrorKind kind);

enum class ChunkState {
    Pending,
    Attempting,
    Backoff,
    Succeeded,
    Failed,
    Aborted
};

QString toString(ChunkState state);

struct ChunkOutcome {
    int index = -1;
    ByteRange range;
    int attempts = 0;
    ChunkState state = ChunkState::Pending;
    std::optional<DownloadError> error;

    bool succeeded() const { return state == ChunkState::Succeeded; }
};

struct DownloadSummary {
    qint64 totalBytes = 0;
    int chunkCount = 0;
    std::vector<ChunkOutcome> chunks;
};

using DownloadOutcome = Expected<DownloadSummary, DownloadError>;

} // namespace Parfetch

Q_DECLARE_METATYPE(Parfetch::DownloadError)
Q_DECLARE_METATYPE(Parfetch::DownloadOutcome)
