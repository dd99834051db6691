#pragma once

#include <QtCore/QtGlobal>
#include <optional>

#include "DownloadTypes.hpp"

namespace Parfetch {

/**
 * @brief Lazy, single-pass partition of [0, totalLength) into chunk ranges
 *
 * Ranges are produced in ascending order, are disjoint and cover the object
 * exactly once. The last range is clipped to totalLength - 1.
 */
class ChunkPlanner {
public:
    // Upper bound on ranges per download; each one keeps an outcome slot until the end.
    static constexpr qint64 kMaxChunkCount = qint64(1) << 22;

    ChunkPlanner(qint64 totalLength, qint64 chunkSize);

    bool hasNext() const;

    // Returns the next range, or nothing once the object is covered.
    std::optional<ByteRange> next();

    // Index the next call to next() will assign.
    int nextIndex() const { return nextIndex_; }

    qint64 chunkCount() const;
    qint64 totalLength() const { return totalLength_; }
    qint64 chunkSize() const { return chunkSize_; }

    static qint64 chunkCount(qint64 totalLength, qint64 chunkSize);

private:
    qint64 totalLength_;
    qint64 chunkSize_;
    qint64 cursor_ = 0;
    int nextIndex_ = 0;
};

} // namespace Parfetch
