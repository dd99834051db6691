#include "ChunkPlanner.hpp"

#include <algorithm>

namespace Parfetch {

ChunkPlanner::ChunkPlanner(qint64 totalLength, qint64 chunkSize)
    : totalLength_(std::max<qint64>(totalLength, 0))
    , chunkSize_(chunkSize) {
}

bool ChunkPlanner::hasNext() const {
    return chunkSize_ > 0 && cursor_ < totalLength_;
}

std::optional<ByteRange> ChunkPlanner::next() {
    if (!hasNext()) {
        return std::nullopt;
    }

    ByteRange range;
    range.start = cursor_;
    range.stop = cursor_ + std::min(chunkSize_ - 1, totalLength_ - 1 - cursor_);

    cursor_ = range.stop + 1;
    ++nextIndex_;
    return range;
}

qint64 ChunkPlanner::chunkCount() const {
    return chunkCount(totalLength_, chunkSize_);
}

qint64 ChunkPlanner::chunkCount(qint64 totalLength, qint64 chunkSize) {
    if (totalLength <= 0 || chunkSize <= 0) {
        return 0;
    }
    return totalLength / chunkSize + (totalLength % chunkSize != 0 ? 1 : 0);
}

} // namespace Parfetch
