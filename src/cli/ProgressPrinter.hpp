#pragma once

#include <QtCore/QElapsedTimer>
#include <QtCore/QHash>
#include <QtCore/QObject>
#include <QtCore/QString>
#include <cstdio>

namespace Parfetch {

class ChunkedDownloader;
class ModelCache;

/**
 * @brief Renders download progress events as plain text lines
 *
 * Lines are throttled per label: one every 5 percentage points or every
 * second, whichever comes first, plus the final line.
 */
class ProgressPrinter : public QObject {
    Q_OBJECT

public:
    explicit ProgressPrinter(std::FILE* stream = stderr, QObject* parent = nullptr);

    void attach(ChunkedDownloader* downloader, const QString& label);
    void attach(ModelCache* cache);

    static QString formatBytes(qint64 bytes);
    static QString renderLine(const QString& label, qint64 done, qint64 total);

public slots:
    void begin(const QString& label, qint64 totalBytes);
    void advance(const QString& label, qint64 deltaBytes);
    void end(const QString& label, bool success);

private:
    struct Track {
        QString display;
        qint64 total = 0;
        qint64 done = 0;
        int lastPercent = -1;
        QElapsedTimer sinceLastLine;
    };

    void beginTrack(const QString& key, const QString& display, qint64 totalBytes);
    void print(const QString& line);

    std::FILE* stream_;
    QHash<QString, Track> tracks_;
};

} // namespace Parfetch
