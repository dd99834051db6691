#pragma once

#include <QtCore/QObject>
#include <QtCore/QString>
#include <QtNetwork/QNetworkAccessManager>

#include "RangeTransport.hpp"

namespace Parfetch {

/**
 * @brief RangeTransport backed by QNetworkAccessManager
 *
 * Sends "Accept-Encoding: identity" so byte offsets are never shifted by
 * transparent decompression, and follows redirects that keep or raise the
 * security level.
 */
class NetworkTransport : public QObject, public RangeTransport {
    Q_OBJECT

public:
    explicit NetworkTransport(QObject* parent = nullptr);
    ~NetworkTransport() override;

    void get(const TransportRequest& request, Callback callback) override;

    void setUserAgent(const QString& userAgent);
    QString userAgent() const { return userAgent_; }

    int activeRequests() const { return activeRequests_; }

private:
    QNetworkRequest buildRequest(const TransportRequest& request) const;

    QNetworkAccessManager* networkManager_ = nullptr;
    QString userAgent_ = "parfetch/1.0";
    int activeRequests_ = 0;
};

} // namespace Parfetch
