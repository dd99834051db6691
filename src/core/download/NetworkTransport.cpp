#include "NetworkTransport.hpp"
#include "../common/Logger.hpp"

#include <QtNetwork/QNetworkReply>
#include <QtNetwork/QNetworkRequest>

namespace Parfetch {

NetworkTransport::NetworkTransport(QObject* parent)
    : QObject(parent)
    , networkManager_(new QNetworkAccessManager(this)) {
    networkManager_->setRedirectPolicy(QNetworkRequest::NoLessSafeRedirectPolicy);
}

NetworkTransport::~NetworkTransport() {
    if (activeRequests_ > 0) {
        PARFETCH_WARN("NetworkTransport destroyed with {} request(s) in flight", activeRequests_);
    }
}

void NetworkTransport::setUserAgent(const QString& userAgent) {
    userAgent_ = userAgent;
}

QNetworkRequest NetworkTransport::buildRequest(const TransportRequest& request) const {
    QNetworkRequest networkRequest(request.url);
    networkRequest.setAttribute(QNetworkRequest::RedirectPolicyAttribute,
                                QNetworkRequest::NoLessSafeRedirectPolicy);
    networkRequest.setRawHeader("User-Agent", userAgent_.toUtf8());
    networkRequest.setRawHeader("Accept-Encoding", "identity");

    for (const auto& [key, value] : request.headers) {
        networkRequest.setRawHeader(key, value);
    }
    return networkRequest;
}

void NetworkTransport::get(const TransportRequest& request, Callback callback) {
    QNetworkReply* reply = networkManager_->get(buildRequest(request));
    ++activeRequests_;

    PARFETCH_TRACE("GET {} ({} header(s))", request.url.toString().toStdString(), request.headers.size());

    connect(reply, &QNetworkReply::finished, this, [this, reply, callback = std::move(callback)]() {
        reply->deleteLater();
        --activeRequests_;

        const QVariant statusAttribute = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute);

        // QNetworkReply flags 4xx/5xx as errors too; those still carry a status.
        if (!statusAttribute.isValid()) {
            const QString message = reply->error() != QNetworkReply::NoError
                ? reply->errorString()
                : QString("No HTTP response received");
            PARFETCH_DEBUG("Transport failure for {}: {}",
                           reply->url().toString().toStdString(), message.toStdString());
            callback(makeUnexpected(DownloadError::transport(message)));
            return;
        }

        if (reply->error() != QNetworkReply::NoError && reply->error() < QNetworkReply::ContentAccessDenied) {
            // Connection-level failure after headers arrived (e.g. remote closed mid-body).
            callback(makeUnexpected(DownloadError::transport(reply->errorString())));
            return;
        }

        TransportResponse response;
        response.statusCode = statusAttribute.toInt();
        response.body = reply->readAll();
        const auto pairs = reply->rawHeaderPairs();
        response.headers.reserve(pairs.size());
        for (const auto& pair : pairs) {
            response.headers.emplace_back(pair.first, pair.second);
        }
        callback(std::move(response));
    });
}

} // namespace Parfetch
