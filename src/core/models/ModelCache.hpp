#pragma once

#include <QtCore/QObject>
#include <QtCore/QString>
#include <memory>
#include <optional>
#include <vector>

#include "ArchiveExtractor.hpp"
#include "ModelRegistry.hpp"
#include "../download/BackoffPolicy.hpp"
#include "../download/DownloadTypes.hpp"
#include "../download/RangeTransport.hpp"

namespace Parfetch {

/**
 * @brief Version-stamped local store of registered models
 *
 * Each model lives in <root>/<directory>. A plain-text "version" file, written
 * only after every file of the model is in place, marks the directory as
 * complete. A model is downloaded again whenever that marker is missing or
 * differs from the registered version.
 */
class ModelCache : public QObject {
    Q_OBJECT

public:
    ModelCache(const QString& rootPath,
               const ModelRegistry& registry,
               RangeTransport& transport,
               QObject* parent = nullptr);
    ~ModelCache() override;

    // Chunk size, gate sizes, retries and headers used for every file; url and destination are ignored.
    void setDownloadDefaults(const DownloadRequest& defaults) { defaults_ = defaults; }

    void setRemovePartialOnFailure(bool remove) { removePartialOnFailure_ = remove; }

    void setBackoffPolicy(const BackoffPolicy& policy) { backoff_ = policy; }
    void setExtractor(const ArchiveExtractor& extractor) { extractor_ = extractor; }

    const QString& rootPath() const { return rootPath_; }
    QString modelPath(const ModelEntry& entry) const;

    bool isDownloadNeeded(const ModelEntry& entry) const;

    /**
     * @brief Makes sure the named model is present and current, downloading it if needed
     * @return Absolute path of the model directory
     */
    Expected<QString, ModelError> ensureModel(const QString& name);

    /**
     * @brief Brings every registered model up to date, at most parallelModels at a time
     * @return The failure of the first failing model in registry order
     */
    Expected<void, ModelError> ensureAll(int parallelModels = 1);

    // Deletes everything under the root that is not a registered model directory.
    Expected<void, ModelError> cleanDirectory();

    // DownloadError behind the most recent DownloadFailed.
    const std::optional<DownloadError>& lastDownloadError() const { return lastDownloadError_; }

signals:
    void modelStarted(const QString& name);
    void fileStarted(const QString& name, const QString& file, qint64 totalBytes);
    void progress(const QString& name, qint64 deltaBytes);
    void modelFinished(const QString& name, bool success);

private:
    class ModelJob;

    Expected<void, ModelError> runJobs(const std::vector<ModelEntry>& entries, int parallelModels);
    Expected<void, ModelError> cleanUnder(const QString& absolutePath, const QString& relativePath,
                                          const QStringList& keep);

    QString rootPath_;
    const ModelRegistry& registry_;
    RangeTransport& transport_;
    DownloadRequest defaults_;
    BackoffPolicy backoff_;
    ArchiveExtractor extractor_;
    bool removePartialOnFailure_ = true;
    std::optional<DownloadError> lastDownloadError_;
};

} // namespace Parfetch
