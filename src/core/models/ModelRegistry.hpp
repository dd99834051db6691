#pragma once

#include <QtCore/QByteArray>
#include <QtCore/QString>
#include <QtCore/QStringList>
#include <vector>

#include "ModelSource.hpp"
#include "../common/Expected.hpp"

namespace Parfetch {

/**
 * @brief Maps logical model names to their directory, version and source
 *
 * Entries keep their registration order. Registering an existing name
 * replaces the entry in place.
 *
 * Manifest format:
 * @code
 * { "models": [
 *     { "name": "tiny", "directory": "whisper/tiny", "version": "1",
 *       "huggingface": { "repo": "org/model", "files": ["a.bin"], "commit": "abc" } },
 *     { "name": "vad", "directory": "vad", "version": "2",
 *       "archive": "https://example.com/vad.zip" } ] }
 * @endcode
 */
class ModelRegistry {
public:
    void registerModel(const ModelEntry& entry);
    void registerModels(const std::vector<ModelEntry>& entries);

    Expected<ModelEntry, ModelError> find(const QString& name) const;
    bool contains(const QString& name) const;

    QStringList names() const;
    const std::vector<ModelEntry>& entries() const { return entries_; }
    int size() const { return static_cast<int>(entries_.size()); }
    bool isEmpty() const { return entries_.empty(); }

    static Expected<ModelRegistry, ModelError> fromManifest(const QByteArray& json);
    static Expected<ModelRegistry, ModelError> loadManifest(const QString& path);

    // Directory must be relative and stay below the cache root.
    static bool isSafeDirectory(const QString& directory);

private:
    std::vector<ModelEntry> entries_;
};

} // namespace Parfetch
