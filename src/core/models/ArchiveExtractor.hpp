#pragma once

#include <QtCore/QString>
#include <QtCore/QStringList>

#include "ModelSource.hpp"
#include "../common/Expected.hpp"

namespace Parfetch {

/**
 * @brief Unpacks zip archives with the system unzip tool
 *
 * The archive is unpacked into a staging directory first. A single top-level
 * directory is stripped, so its contents land directly in the target.
 */
class ArchiveExtractor {
public:
    explicit ArchiveExtractor(const QString& program = "unzip", int timeoutMs = 10 * 60 * 1000);

    Expected<void, ModelError> extract(const QString& archivePath, const QString& targetDir) const;

    bool isAvailable() const;

    QStringList argumentsFor(const QString& archivePath, const QString& targetDir) const;

    const QString& program() const { return program_; }
    int timeoutMs() const { return timeoutMs_; }

private:
    static Expected<void, ModelError> promote(const QString& stagingDir, const QString& targetDir);

    QString program_;
    int timeoutMs_;
};

} // namespace Parfetch
