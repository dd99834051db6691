#pragma once

#include <QtCore/QByteArray>
#include <QtCore/QUrl>
#include <functional>

#include "DownloadTypes.hpp"

namespace Parfetch {

struct TransportRequest {
    QUrl url;
    HeaderList headers;
};

struct TransportResponse {
    int statusCode = 0;
    HeaderList headers;
    QByteArray body;

    bool isSuccess() const { return statusCode >= 200 && statusCode < 300; }

    // Case-insensitive lookup; empty when absent.
    QByteArray header(const QByteArray& name) const {
        for (const auto& [key, value] : headers) {
            if (key.compare(name, Qt::CaseInsensitive) == 0) {
                return value;
            }
        }
        return QByteArray();
    }

    bool hasHeader(const QByteArray& name) const {
        for (const auto& entry : headers) {
            if (entry.first.compare(name, Qt::CaseInsensitive) == 0) {
                return true;
            }
        }
        return false;
    }
};

// An HTTP error status is still a response; only send/receive failures are errors.
using TransportResult = Expected<TransportResponse, DownloadError>;

/**
 * @brief Single-exchange HTTP GET seam used by the probe and the chunk workers
 *
 * Implementations must invoke the callback exactly once, from the event loop
 * and never from inside get().
 */
class RangeTransport {
public:
    using Callback = std::function<void(TransportResult)>;

    virtual ~RangeTransport() = default;

    virtual void get(const TransportRequest& request, Callback callback) = 0;
};

// Caller headers plus "Range: bytes=start-stop". A caller supplied Range is replaced.
inline HeaderList withRangeHeader(const HeaderList& headers, const ByteRange& range) {
    HeaderList merged;
    merged.reserve(headers.size() + 1);
    for (const auto& entry : headers) {
        if (entry.first.compare("Range", Qt::CaseInsensitive) != 0) {
            merged.push_back(entry);
        }
    }
    merged.emplace_back(QByteArray("Range"),
                        QByteArray("bytes=") + QByteArray::number(range.start) + '-' +
                            QByteArray::number(range.stop));
    return merged;
}

} // namespace Parfetch
