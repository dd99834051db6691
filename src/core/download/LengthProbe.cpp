#include "LengthProbe.hpp"
#include "../common/Logger.hpp"

namespace Parfetch {

LengthResult parseContentRangeTotal(const QByteArray& contentRange) {
    const int slash = contentRange.lastIndexOf('/');
    if (slash < 0) {
        return makeUnexpected(DownloadError::probe(
            QString("Malformed Content-Range header: '%1'").arg(QString::fromLatin1(contentRange))));
    }

    const QByteArray token = contentRange.mid(slash + 1).trimmed();
    if (token.isEmpty() || token == "*") {
        return makeUnexpected(DownloadError::probe(
            QString("Content-Range does not state a complete length: '%1'").arg(QString::fromLatin1(contentRange))));
    }

    for (char c : token) {
        if (c < '0' || c > '9') {
            return makeUnexpected(DownloadError::probe(
                QString("Content-Range length is not a non-negative integer: '%1'").arg(QString::fromLatin1(token))));
        }
    }

    bool ok = false;
    const qint64 total = token.toLongLong(&ok);
    if (!ok) {
        return makeUnexpected(DownloadError::probe(
            QString("Content-Range length out of range: '%1'").arg(QString::fromLatin1(token))));
    }
    return total;
}

LengthProbe::LengthProbe(RangeTransport& transport)
    : transport_(transport) {
}

void LengthProbe::run(const QUrl& url, const HeaderList& headers, Callback callback) {
    TransportRequest request;
    request.url = url;
    request.headers = withRangeHeader(headers, ByteRange{0, 0});

    PARFETCH_DEBUG("Probing length of {}", url.toString().toStdString());

    transport_.get(request, [callback = std::move(callback)](TransportResult result) {
        if (result.hasError()) {
            callback(makeUnexpected(result.error()));
            return;
        }
        callback(interpret(result.value()));
    });
}

LengthResult LengthProbe::interpret(const TransportResponse& response) {
    if (!response.isSuccess()) {
        return makeUnexpected(DownloadError::probe(
            QString("Length probe rejected with HTTP %1").arg(response.statusCode), response.statusCode));
    }

    if (!response.hasHeader("Content-Range")) {
        return makeUnexpected(DownloadError::probe(
            "Response carries no Content-Range header; the origin does not serve byte ranges",
            response.statusCode));
    }

    return parseContentRangeTotal(response.header("Content-Range"));
}

} // namespace Parfetch
