#pragma once

#include <QtCore/QByteArray>
#include <functional>

#include "RangeTransport.hpp"

namespace Parfetch {

using LengthResult = Expected<qint64, DownloadError>;

/**
 * @brief Extracts the complete length from a Content-Range value
 *
 * The total is the token after the final '/', e.g. "bytes 0-0/702517648".
 * An unknown total ("*"), a negative or non-numeric token, or a missing '/'
 * is a ProbeError.
 */
LengthResult parseContentRangeTotal(const QByteArray& contentRange);

/**
 * @brief Learns the total length of the remote object with a one-byte range request
 */
class LengthProbe {
public:
    using Callback = std::function<void(LengthResult)>;

    explicit LengthProbe(RangeTransport& transport);

    void run(const QUrl& url, const HeaderList& headers, Callback callback);

    static LengthResult interpret(const TransportResponse& response);

private:
    RangeTransport& transport_;
};

} // namespace Parfetch
