#include "ModelSource.hpp"

namespace Parfetch {

namespace {
const char* const kHuggingfaceHost = "https://huggingface.co";
const char* const kDefaultRevision = "main";
}

QString toString(ModelError error) {
    switch (error) {
        case ModelError::ModelNotFound: return "ModelNotFound";
        case ModelError::InvalidManifest: return "InvalidManifest";
        case ModelError::DownloadFailed: return "DownloadFailed";
        case ModelError::ExtractionFailed: return "ExtractionFailed";
        case ModelError::DiskError: return "DiskError";
    }
    return "UnknownError";
}

QString HuggingfaceSource::revision() const {
    if (commit && !commit->isEmpty()) {
        return *commit;
    }
    return kDefaultRevision;
}

QUrl HuggingfaceSource::urlFor(const QString& file) const {
    return QUrl(QString("%1/%2/resolve/%3/%4").arg(kHuggingfaceHost, repo, revision(), file));
}

std::vector<std::pair<QString, QUrl>> HuggingfaceSource::fileUrls() const {
    std::vector<std::pair<QString, QUrl>> urls;
    urls.reserve(static_cast<std::size_t>(files.size()));
    for (const QString& file : files) {
        urls.emplace_back(file, urlFor(file));
    }
    return urls;
}

} // namespace Parfetch
