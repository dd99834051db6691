#include "ProgressPrinter.hpp"
#include "../core/download/ChunkedDownloader.hpp"
#include "../core/models/ModelCache.hpp"

#include <fmt/core.h>

namespace Parfetch {

namespace {
constexpr int kPercentStep = 5;
constexpr qint64 kMinIntervalMs = 1000;
}

ProgressPrinter::ProgressPrinter(std::FILE* stream, QObject* parent)
    : QObject(parent)
    , stream_(stream) {
}

void ProgressPrinter::attach(ChunkedDownloader* downloader, const QString& label) {
    connect(downloader, &ChunkedDownloader::started, this, [this, label](qint64 total) {
        begin(label, total);
    });
    connect(downloader, &ChunkedDownloader::progress, this, [this, label](qint64 delta) {
        advance(label, delta);
    });
    connect(downloader, &ChunkedDownloader::chunkRetrying, this, [this, label](int index, int retry, qint64 delayMs) {
        print(QString("%1: chunk %2 retry %3 in %4 ms").arg(label).arg(index).arg(retry).arg(delayMs));
    });
    connect(downloader, &ChunkedDownloader::finished, this, [this, label](const DownloadOutcome& outcome) {
        end(label, outcome.hasValue());
    });
}

void ProgressPrinter::attach(ModelCache* cache) {
    connect(cache, &ModelCache::fileStarted, this, [this](const QString& name, const QString& file, qint64 total) {
        beginTrack(name, name + '/' + file, total);
    });
    connect(cache, &ModelCache::progress, this, &ProgressPrinter::advance);
    connect(cache, &ModelCache::modelFinished, this, &ProgressPrinter::end);
}

void ProgressPrinter::begin(const QString& label, qint64 totalBytes) {
    beginTrack(label, label, totalBytes);
}

void ProgressPrinter::beginTrack(const QString& key, const QString& display, qint64 totalBytes) {
    Track track;
    track.display = display;
    track.total = totalBytes;
    track.sinceLastLine.start();
    tracks_.insert(key, track);
    print(QString("%1: %2 to fetch").arg(display, formatBytes(totalBytes)));
}

void ProgressPrinter::advance(const QString& label, qint64 deltaBytes) {
    auto it = tracks_.find(label);
    if (it == tracks_.end()) {
        return;
    }

    Track& track = it.value();
    track.done += deltaBytes;

    const int percent = track.total > 0 ? static_cast<int>(track.done * 100 / track.total) : 100;
    const bool stepReached = percent >= track.lastPercent + kPercentStep;
    const bool intervalElapsed = track.sinceLastLine.elapsed() >= kMinIntervalMs;
    if (!stepReached && !intervalElapsed && track.done < track.total) {
        return;
    }

    track.lastPercent = percent;
    track.sinceLastLine.restart();
    print(renderLine(track.display, track.done, track.total));
}

void ProgressPrinter::end(const QString& label, bool success) {
    print(QString("%1: %2").arg(label, success ? "done" : "failed"));
    tracks_.remove(label);
}

QString ProgressPrinter::formatBytes(qint64 bytes) {
    const char* units[] = {"B", "KiB", "MiB", "GiB", "TiB"};
    double value = static_cast<double>(bytes);
    int unit = 0;
    while (value >= 1024.0 && unit < 4) {
        value /= 1024.0;
        ++unit;
    }
    if (unit == 0) {
        return QString("%1 B").arg(bytes);
    }
    return QString("%1 %2").arg(value, 0, 'f', 1).arg(units[unit]);
}

QString ProgressPrinter::renderLine(const QString& label, qint64 done, qint64 total) {
    const int percent = total > 0 ? static_cast<int>(done * 100 / total) : 100;
    return QString("%1: %2% (%3 / %4)").arg(label).arg(percent).arg(formatBytes(done), formatBytes(total));
}

void ProgressPrinter::print(const QString& line) {
    fmt::print(stream_, "{}\n", line.toStdString());
    std::fflush(stream_);
}

} // namespace Parfetch
