#pragma once

#include <QtCore/QString>
#include <QtCore/QStringList>
#include <QtCore/QUrl>
#include <optional>
#include <utility>
#include <variant>
#include <vector>

namespace Parfetch {

enum class ModelError {
    ModelNotFound,
    InvalidManifest,
    DownloadFailed,
    ExtractionFailed,
    DiskError
};

QString toString(ModelError error);

/**
 * @brief A set of files published in a Hugging Face repository
 *
 * Files resolve to https://huggingface.co/<repo>/resolve/<commit or main>/<file>.
 */
struct HuggingfaceSource {
    QString repo;
    QStringList files;
    std::optional<QString> commit;

    QString revision() const;
    QUrl urlFor(const QString& file) const;

    // (file name, URL) pairs in declaration order.
    std::vector<std::pair<QString, QUrl>> fileUrls() const;
};

// A single zip archive that is unpacked into the model directory.
struct ArchiveSource {
    QUrl url;
};

using ModelSource = std::variant<HuggingfaceSource, ArchiveSource>;

struct ModelEntry {
    QString name;
    QString directory;  // relative to the cache root
    QString version;
    ModelSource source;
};

} // namespace Parfetch
