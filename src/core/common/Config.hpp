#pragma once

#include <QtCore/QSettings>
#include <QtCore/QStandardPaths>
#include <QtCore/QString>
#include <QtCore/QVariant>
#include <memory>

namespace Parfetch {

class Config {
public:
    static Config& instance();

    void initialize(const QString& organizationName = "Parfetch",
                    const QString& applicationName = "parfetch");

    // Backs the settings with an explicit INI file instead of the platform store.
    void initializeFromFile(const QString& iniPath);

    bool isInitialized() const { return settings_ != nullptr; }

    // General settings
    QVariant getValue(const QString& key, const QVariant& defaultValue = QVariant()) const;
    void setValue(const QString& key, const QVariant& value);

    // Typed convenience methods
    QString getString(const QString& key, const QString& defaultValue = QString()) const;
    int getInt(const QString& key, int defaultValue = 0) const;
    qint64 getInt64(const QString& key, qint64 defaultValue = 0) const;
    bool getBool(const QString& key, bool defaultValue = false) const;

    struct DownloadSettings {
        qint64 chunkSize = 10 * 1024 * 1024;
        int maxFiles = 16;
        int parallelFailures = 4;
        int maxRetries = 5;
        QString userAgent = "parfetch/1.0";
    };

    struct CacheSettings {
        QString modelsPath;
        bool removePartialOnFailure = true;
        int parallelModels = 1;
    };

    struct LoggingSettings {
        QString filePath;
        QString level = "info";
    };

    DownloadSettings getDownloadSettings() const;
    CacheSettings getCacheSettings() const;
    LoggingSettings getLoggingSettings() const;

    void setDownloadSettings(const DownloadSettings& settings);
    void setCacheSettings(const CacheSettings& settings);
    void setLoggingSettings(const LoggingSettings& settings);

    // Paths
    QString getDataPath() const;
    QString getCachePath() const;

    void sync();

private:
    Config() = default;
    std::unique_ptr<QSettings> settings_;
};

} // namespace Parfetch
