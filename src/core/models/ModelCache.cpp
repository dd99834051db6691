#include "ModelCache.hpp"
#include "../common/Logger.hpp"
#include "../download/ChunkedDownloader.hpp"
#include "../download/PermitPools.hpp"

#include <QtCore/QDir>
#include <QtCore/QEventLoop>
#include <QtCore/QFile>
#include <QtCore/QFileInfo>
#include <algorithm>
#include <functional>

namespace Parfetch {

namespace {
const char* const kVersionFile = "version";
const char* const kArchiveFile = "archive";
}

/**
 * Downloads the files of one model in sequence, then extracts the archive
 * (archive sources only) and writes the version marker.
 */
class ModelCache::ModelJob : public QObject {
public:
    using Callback = std::function<void(Expected<QString, ModelError>)>;

    ModelJob(ModelCache& cache, const ModelEntry& entry, Callback done)
        : cache_(cache)
        , entry_(entry)
        , directory_(cache.modelPath(entry))
        , downloader_(cache.transport_)
        , done_(std::move(done)) {
        downloader_.setBackoffPolicy(cache.backoff_);

        connect(&downloader_, &ChunkedDownloader::started, this, [this](qint64 totalBytes) {
            emit cache_.fileStarted(entry_.name, tasks_[current_].file, totalBytes);
        });
        connect(&downloader_, &ChunkedDownloader::progress, this, [this](qint64 delta) {
            emit cache_.progress(entry_.name, delta);
        });
        connect(&downloader_, &ChunkedDownloader::finished, this, [this](const DownloadOutcome& outcome) {
            onFileFinished(outcome);
        });
    }

    void start() {
        emit cache_.modelStarted(entry_.name);
        PARFETCH_INFO("Fetching model '{}' version {} into {}", entry_.name.toStdString(),
                      entry_.version.toStdString(), directory_.toStdString());

        QDir dir(directory_);
        if (dir.exists() && !dir.removeRecursively()) {
            PARFETCH_ERROR("Cannot clear {}", directory_.toStdString());
            complete(makeUnexpected(ModelError::DiskError));
            return;
        }
        if (!QDir().mkpath(directory_)) {
            PARFETCH_ERROR("Cannot create {}", directory_.toStdString());
            complete(makeUnexpected(ModelError::DiskError));
            return;
        }

        std::visit(TaskBuilder{*this}, entry_.source);
        nextFile();
    }

private:
    struct FileTask {
        QString file;
        QUrl url;
        QString destination;
    };

    struct TaskBuilder {
        ModelJob& job;

        void operator()(const HuggingfaceSource& source) const {
            for (const auto& [file, url] : source.fileUrls()) {
                job.tasks_.push_back({file, url, QDir(job.directory_).filePath(file)});
            }
        }

        void operator()(const ArchiveSource& source) const {
            job.archivePath_ = QDir(job.directory_).filePath(kArchiveFile);
            job.tasks_.push_back({kArchiveFile, source.url, job.archivePath_});
        }
    };

    void nextFile() {
        if (current_ >= tasks_.size()) {
            finalize();
            return;
        }

        const FileTask& task = tasks_[current_];
        const QString parent = QFileInfo(task.destination).absolutePath();
        if (!QDir().mkpath(parent)) {
            PARFETCH_ERROR("Cannot create {}", parent.toStdString());
            complete(makeUnexpected(ModelError::DiskError));
            return;
        }

        DownloadRequest request = cache_.defaults_;
        request.url = task.url;
        request.destination = task.destination;

        auto started = downloader_.start(request);
        if (started.hasError()) {
            cache_.lastDownloadError_ = started.error();
            complete(makeUnexpected(ModelError::DownloadFailed));
        }
    }

    void onFileFinished(const DownloadOutcome& outcome) {
        const FileTask& task = tasks_[current_];

        if (outcome.hasError()) {
            cache_.lastDownloadError_ = outcome.error();
            PARFETCH_ERROR("Model '{}': {} failed: {}", entry_.name.toStdString(), task.file.toStdString(),
                           outcome.error().describe().toStdString());
            removePartial(task.destination);
            complete(makeUnexpected(ModelError::DownloadFailed));
            return;
        }

        ++current_;
        // Leave the downloader's finished() emission before starting the next file.
        QMetaObject::invokeMethod(this, [this]() { nextFile(); }, Qt::QueuedConnection);
    }

    void finalize() {
        if (!archivePath_.isEmpty()) {
            auto extracted = cache_.extractor_.extract(archivePath_, directory_);
            if (extracted.hasError()) {
                removePartial(archivePath_);
                complete(makeUnexpected(extracted.error()));
                return;
            }
            if (!QFile::remove(archivePath_)) {
                PARFETCH_WARN("Could not remove {}", archivePath_.toStdString());
            }
        }

        QFile versionFile(QDir(directory_).filePath(kVersionFile));
        if (!versionFile.open(QIODevice::WriteOnly | QIODevice::Truncate) ||
            versionFile.write(entry_.version.toUtf8()) != entry_.version.toUtf8().size()) {
            PARFETCH_ERROR("Cannot write version marker for '{}': {}", entry_.name.toStdString(),
                           versionFile.errorString().toStdString());
            complete(makeUnexpected(ModelError::DiskError));
            return;
        }
        versionFile.close();

        PARFETCH_INFO("Model '{}' ready", entry_.name.toStdString());
        complete(directory_);
    }

    void removePartial(const QString& path) {
        if (!cache_.removePartialOnFailure_ || !QFile::exists(path)) {
            return;
        }
        if (!QFile::remove(path)) {
            PARFETCH_WARN("Could not remove partial file {}", path.toStdString());
        }
    }

    void complete(Expected<QString, ModelError> result) {
        if (finished_) {
            return;
        }
        finished_ = true;
        emit cache_.modelFinished(entry_.name, result.hasValue());
        done_(std::move(result));
    }

    ModelCache& cache_;
    ModelEntry entry_;
    QString directory_;
    ChunkedDownloader downloader_;
    Callback done_;
    std::vector<FileTask> tasks_;
    std::size_t current_ = 0;
    QString archivePath_;
    bool finished_ = false;
};

ModelCache::ModelCache(const QString& rootPath,
                       const ModelRegistry& registry,
                       RangeTransport& transport,
                       QObject* parent)
    : QObject(parent)
    , rootPath_(QDir(rootPath).absolutePath())
    , registry_(registry)
    , transport_(transport) {
}

ModelCache::~ModelCache() = default;

QString ModelCache::modelPath(const ModelEntry& entry) const {
    return QDir::cleanPath(QDir(rootPath_).filePath(entry.directory));
}

bool ModelCache::isDownloadNeeded(const ModelEntry& entry) const {
    QFile versionFile(QDir(modelPath(entry)).filePath(kVersionFile));
    if (!versionFile.open(QIODevice::ReadOnly)) {
        return true;
    }
    return QString::fromUtf8(versionFile.readAll()) != entry.version;
}

Expected<QString, ModelError> ModelCache::ensureModel(const QString& name) {
    auto entry = registry_.find(name);
    if (entry.hasError()) {
        PARFETCH_ERROR("Unknown model '{}'", name.toStdString());
        return makeUnexpected(entry.error());
    }

    if (!isDownloadNeeded(entry.value())) {
        PARFETCH_DEBUG("Model '{}' is up to date", name.toStdString());
        return modelPath(entry.value());
    }

    auto result = runJobs({entry.value()}, 1);
    if (result.hasError()) {
        return makeUnexpected(result.error());
    }
    return modelPath(entry.value());
}

Expected<void, ModelError> ModelCache::ensureAll(int parallelModels) {
    std::vector<ModelEntry> needed;
    for (const auto& entry : registry_.entries()) {
        if (isDownloadNeeded(entry)) {
            needed.push_back(entry);
        }
    }

    PARFETCH_INFO("{} of {} model(s) need downloading", needed.size(), registry_.size());
    if (needed.empty()) {
        return {};
    }
    return runJobs(needed, std::max(parallelModels, 1));
}

Expected<void, ModelError> ModelCache::runJobs(const std::vector<ModelEntry>& entries, int parallelModels) {
    std::vector<std::optional<Expected<QString, ModelError>>> results(entries.size());
    std::vector<std::unique_ptr<ModelJob>> jobs(entries.size());
    std::size_t remaining = entries.size();

    QEventLoop loop;
    ConcurrencyGate gate(parallelModels);

    for (std::size_t i = 0; i < entries.size(); ++i) {
        gate.acquire([&, i]() {
            jobs[i] = std::make_unique<ModelJob>(*this, entries[i], [&, i](Expected<QString, ModelError> result) {
                results[i] = std::move(result);
                gate.release();
                if (--remaining == 0) {
                    loop.quit();
                }
            });
            jobs[i]->start();
        });
    }

    if (remaining > 0) {
        loop.exec();
    }

    for (const auto& result : results) {
        if (!result) {
            return makeUnexpected(ModelError::DownloadFailed);
        }
        if (result->hasError()) {
            return makeUnexpected(result->error());
        }
    }
    return {};
}

Expected<void, ModelError> ModelCache::cleanDirectory() {
    if (!QDir(rootPath_).exists()) {
        return {};
    }

    QStringList keep;
    for (const auto& entry : registry_.entries()) {
        keep.append(QDir::cleanPath(entry.directory));
    }

    PARFETCH_INFO("Cleaning {} ({} registered model(s))", rootPath_.toStdString(), keep.size());
    return cleanUnder(rootPath_, QString(), keep);
}

Expected<void, ModelError> ModelCache::cleanUnder(const QString& absolutePath,
                                                  const QString& relativePath,
                                                  const QStringList& keep) {
    const QFileInfoList children = QDir(absolutePath).entryInfoList(
        QDir::AllEntries | QDir::NoDotAndDotDot | QDir::Hidden | QDir::System);

    for (const QFileInfo& child : children) {
        const QString relative = relativePath.isEmpty() ? child.fileName()
                                                        : relativePath + '/' + child.fileName();
        if (keep.contains(relative)) {
            continue;
        }

        bool isAncestor = false;
        for (const QString& kept : keep) {
            if (kept.startsWith(relative + '/')) {
                isAncestor = true;
                break;
            }
        }

        if (isAncestor && child.isDir() && !child.isSymLink()) {
            auto cleaned = cleanUnder(child.absoluteFilePath(), relative, keep);
            if (cleaned.hasError()) {
                return cleaned;
            }
            continue;
        }

        const bool removed = (child.isDir() && !child.isSymLink())
            ? QDir(child.absoluteFilePath()).removeRecursively()
            : QFile::remove(child.absoluteFilePath());
        if (!removed) {
            PARFETCH_ERROR("Cannot remove {}", child.absoluteFilePath().toStdString());
            return makeUnexpected(ModelError::DiskError);
        }
        PARFETCH_DEBUG("Removed {}", relative.toStdString());
    }
    return {};
}

} // namespace Parfetch
