#include "ArchiveExtractor.hpp"
#include "../common/Logger.hpp"

#include <QtCore/QDir>
#include <QtCore/QFile>
#include <QtCore/QFileInfo>
#include <QtCore/QProcess>
#include <QtCore/QStandardPaths>
#include <QtCore/QTemporaryDir>

namespace Parfetch {

ArchiveExtractor::ArchiveExtractor(const QString& program, int timeoutMs)
    : program_(program)
    , timeoutMs_(timeoutMs) {
}

bool ArchiveExtractor::isAvailable() const {
    return !QStandardPaths::findExecutable(program_).isEmpty();
}

QStringList ArchiveExtractor::argumentsFor(const QString& archivePath, const QString& targetDir) const {
    return {"-o", "-q", archivePath, "-d", targetDir};
}

Expected<void, ModelError> ArchiveExtractor::extract(const QString& archivePath, const QString& targetDir) const {
    if (!QFileInfo::exists(archivePath)) {
        PARFETCH_ERROR("Archive not found: {}", archivePath.toStdString());
        return makeUnexpected(ModelError::ExtractionFailed);
    }

    QTemporaryDir staging(QDir(targetDir).filePath(".extract-XXXXXX"));
    if (!staging.isValid()) {
        PARFETCH_ERROR("Cannot create a staging directory in {}: {}", targetDir.toStdString(),
                       staging.errorString().toStdString());
        return makeUnexpected(ModelError::ExtractionFailed);
    }

    QProcess process;
    process.setProcessChannelMode(QProcess::MergedChannels);
    process.start(program_, argumentsFor(archivePath, staging.path()));

    if (!process.waitForStarted(5000)) {
        PARFETCH_ERROR("Failed to start {}: {}", program_.toStdString(), process.errorString().toStdString());
        return makeUnexpected(ModelError::ExtractionFailed);
    }

    if (!process.waitForFinished(timeoutMs_)) {
        process.kill();
        process.waitForFinished(1000);
        PARFETCH_ERROR("Extraction of {} timed out after {}ms", archivePath.toStdString(), timeoutMs_);
        return makeUnexpected(ModelError::ExtractionFailed);
    }

    if (process.exitStatus() != QProcess::NormalExit || process.exitCode() != 0) {
        PARFETCH_ERROR("{} exited with code {}: {}", program_.toStdString(), process.exitCode(),
                       QString::fromLocal8Bit(process.readAll()).trimmed().toStdString());
        return makeUnexpected(ModelError::ExtractionFailed);
    }

    auto promoted = promote(staging.path(), targetDir);
    if (promoted.hasError()) {
        return promoted;
    }

    PARFETCH_DEBUG("Extracted {} into {}", archivePath.toStdString(), targetDir.toStdString());
    return {};
}

Expected<void, ModelError> ArchiveExtractor::promote(const QString& stagingDir, const QString& targetDir) {
    const auto filters = QDir::AllEntries | QDir::NoDotAndDotDot | QDir::Hidden | QDir::System;

    QDir source(stagingDir);
    QFileInfoList entries = source.entryInfoList(filters, QDir::Name);
    if (entries.size() == 1 && entries.first().isDir() && !entries.first().isSymLink()) {
        PARFETCH_DEBUG("Stripping top-level directory {}", entries.first().fileName().toStdString());
        source.setPath(entries.first().absoluteFilePath());
        entries = source.entryInfoList(filters, QDir::Name);
    }

    const QDir target(targetDir);
    for (const QFileInfo& entry : entries) {
        const QString destination = target.filePath(entry.fileName());
        const QFileInfo existing(destination);
        if (existing.isDir() && !existing.isSymLink()) {
            QDir(destination).removeRecursively();
        } else if (existing.exists() || existing.isSymLink()) {
            QFile::remove(destination);
        }

        if (!QDir().rename(entry.absoluteFilePath(), destination)) {
            PARFETCH_ERROR("Cannot move {} to {}", entry.absoluteFilePath().toStdString(), destination.toStdString());
            return makeUnexpected(ModelError::ExtractionFailed);
        }
    }
    return {};
}

} // namespace Parfetch
