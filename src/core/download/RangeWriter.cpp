#include "RangeWriter.hpp"

#include <QtCore/QFile>

namespace Parfetch {

RangeWriter::RangeWriter(const QString& destination)
    : destination_(destination) {
}

Expected<void, DownloadError> RangeWriter::write(qint64 offset, const QByteArray& data) const {
    QFile file(destination_);
    if (!file.open(QIODevice::ReadWrite)) {
        return makeUnexpected(DownloadError::fileIO(
            QString("Cannot open %1: %2").arg(destination_, file.errorString())));
    }

    if (!file.seek(offset)) {
        return makeUnexpected(DownloadError::fileIO(
            QString("Cannot seek %1 to %2: %3").arg(destination_).arg(offset).arg(file.errorString())));
    }

    const qint64 written = file.write(data);
    if (written != data.size()) {
        return makeUnexpected(DownloadError::fileIO(
            QString("Short write to %1 at offset %2: %3 of %4 bytes (%5)")
                .arg(destination_).arg(offset).arg(written).arg(data.size()).arg(file.errorString())));
    }

    if (!file.flush()) {
        return makeUnexpected(DownloadError::fileIO(
            QString("Cannot flush %1: %2").arg(destination_, file.errorString())));
    }

    return {};
}

Expected<void, DownloadError> RangeWriter::truncate() const {
    QFile file(destination_);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        return makeUnexpected(DownloadError::fileIO(
            QString("Cannot create %1: %2").arg(destination_, file.errorString())));
    }
    return {};
}

} // namespace Parfetch
