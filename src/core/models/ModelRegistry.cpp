#include "ModelRegistry.hpp"
#include "../common/Logger.hpp"

#include <QtCore/QDir>
#include <QtCore/QFile>
#include <QtCore/QJsonArray>
#include <QtCore/QJsonDocument>
#include <QtCore/QJsonObject>

namespace Parfetch {

namespace {

Expected<ModelEntry, ModelError> invalid(const QString& message) {
    PARFETCH_ERROR("Invalid model manifest: {}", message.toStdString());
    return makeUnexpected(ModelError::InvalidManifest);
}

Expected<ModelEntry, ModelError> parseEntry(const QJsonObject& object) {
    ModelEntry entry;
    entry.name = object.value("name").toString();
    entry.directory = object.value("directory").toString();
    entry.version = object.value("version").toString();

    if (entry.name.isEmpty()) {
        return invalid("model without a name");
    }
    if (entry.directory.isEmpty()) {
        entry.directory = entry.name;
    }
    if (!ModelRegistry::isSafeDirectory(entry.directory)) {
        return invalid(QString("model '%1' has an unsafe directory '%2'").arg(entry.name, entry.directory));
    }
    if (entry.version.isEmpty()) {
        return invalid(QString("model '%1' has no version").arg(entry.name));
    }

    const bool hasHuggingface = object.contains("huggingface");
    const bool hasArchive = object.contains("archive");
    if (hasHuggingface == hasArchive) {
        return invalid(QString("model '%1' needs exactly one of 'huggingface' or 'archive'").arg(entry.name));
    }

    if (hasArchive) {
        ArchiveSource archive;
        archive.url = QUrl(object.value("archive").toString());
        const QString scheme = archive.url.scheme();
        if (!archive.url.isValid() || (scheme != "http" && scheme != "https")) {
            return invalid(QString("model '%1' has an invalid archive URL").arg(entry.name));
        }
        entry.source = archive;
        return entry;
    }

    const QJsonObject hf = object.value("huggingface").toObject();
    HuggingfaceSource source;
    source.repo = hf.value("repo").toString();
    if (source.repo.isEmpty()) {
        return invalid(QString("model '%1' has no Hugging Face repo").arg(entry.name));
    }

    const QJsonArray files = hf.value("files").toArray();
    for (const QJsonValue& file : files) {
        const QString name = file.toString();
        if (name.isEmpty() || !ModelRegistry::isSafeDirectory(name)) {
            return invalid(QString("model '%1' lists an invalid file").arg(entry.name));
        }
        source.files.append(name);
    }
    if (source.files.isEmpty()) {
        return invalid(QString("model '%1' lists no files").arg(entry.name));
    }

    if (hf.contains("commit")) {
        source.commit = hf.value("commit").toString();
    }

    entry.source = source;
    return entry;
}

} // namespace

void ModelRegistry::registerModel(const ModelEntry& entry) {
    for (auto& existing : entries_) {
        if (existing.name == entry.name) {
            existing = entry;
            return;
        }
    }
    entries_.push_back(entry);
}

void ModelRegistry::registerModels(const std::vector<ModelEntry>& entries) {
    for (const auto& entry : entries) {
        registerModel(entry);
    }
}

Expected<ModelEntry, ModelError> ModelRegistry::find(const QString& name) const {
    for (const auto& entry : entries_) {
        if (entry.name == name) {
            return entry;
        }
    }
    return makeUnexpected(ModelError::ModelNotFound);
}

bool ModelRegistry::contains(const QString& name) const {
    return find(name).hasValue();
}

QStringList ModelRegistry::names() const {
    QStringList result;
    for (const auto& entry : entries_) {
        result.append(entry.name);
    }
    return result;
}

Expected<ModelRegistry, ModelError> ModelRegistry::fromManifest(const QByteArray& json) {
    QJsonParseError parseError;
    const QJsonDocument document = QJsonDocument::fromJson(json, &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        PARFETCH_ERROR("Model manifest is not valid JSON: {}", parseError.errorString().toStdString());
        return makeUnexpected(ModelError::InvalidManifest);
    }

    if (!document.isObject() || !document.object().value("models").isArray()) {
        PARFETCH_ERROR("Model manifest must be an object with a 'models' array");
        return makeUnexpected(ModelError::InvalidManifest);
    }

    ModelRegistry registry;
    const QJsonArray models = document.object().value("models").toArray();
    for (const QJsonValue& value : models) {
        if (!value.isObject()) {
            PARFETCH_ERROR("Model manifest entry is not an object");
            return makeUnexpected(ModelError::InvalidManifest);
        }

        auto entry = parseEntry(value.toObject());
        if (entry.hasError()) {
            return makeUnexpected(entry.error());
        }
        if (registry.contains(entry.value().name)) {
            PARFETCH_ERROR("Model manifest declares '{}' twice", entry.value().name.toStdString());
            return makeUnexpected(ModelError::InvalidManifest);
        }
        registry.registerModel(entry.value());
    }

    PARFETCH_DEBUG("Loaded {} model(s) from manifest", registry.size());
    return registry;
}

Expected<ModelRegistry, ModelError> ModelRegistry::loadManifest(const QString& path) {
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        PARFETCH_ERROR("Cannot open model manifest {}: {}", path.toStdString(), file.errorString().toStdString());
        return makeUnexpected(ModelError::InvalidManifest);
    }
    return fromManifest(file.readAll());
}

bool ModelRegistry::isSafeDirectory(const QString& directory) {
    if (directory.isEmpty() || QDir::isAbsolutePath(directory) || directory.startsWith('/') ||
        directory.startsWith('\\')) {
        return false;
    }
    const QString cleaned = QDir::cleanPath(directory);
    return cleaned != "." && cleaned != ".." && !cleaned.startsWith("../");
}

} // namespace Parfetch
