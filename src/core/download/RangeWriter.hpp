#pragma once

#include <QtCore/QByteArray>
#include <QtCore/QString>

#include "DownloadTypes.hpp"

namespace Parfetch {

/**
 * @brief Positional writer for one destination file
 *
 * Every write opens its own handle, seeks to the offset and writes the whole
 * buffer. The file is created when absent and never truncated, so writers of
 * disjoint ranges need no coordination.
 */
class RangeWriter {
public:
    explicit RangeWriter(const QString& destination);

    Expected<void, DownloadError> write(qint64 offset, const QByteArray& data) const;

    // Creates the file if needed and cuts it to zero length.
    Expected<void, DownloadError> truncate() const;

    const QString& destination() const { return destination_; }

private:
    QString destination_;
};

} // namespace Parfetch
