#include "Config.hpp"
#include "Logger.hpp"

namespace Parfetch {

Config& Config::instance() {
    static Config instance;
    return instance;
}

void Config::initialize(const QString& organizationName, const QString& applicationName) {
    settings_ = std::make_unique<QSettings>(organizationName, applicationName);
    PARFETCH_DEBUG("Config initialized for {}/{} ({})",
                   organizationName.toStdString(), applicationName.toStdString(),
                   settings_->fileName().toStdString());
}

void Config::initializeFromFile(const QString& iniPath) {
    settings_ = std::make_unique<QSettings>(iniPath, QSettings::IniFormat);
    if (settings_->status() != QSettings::NoError) {
        PARFETCH_WARN("Config file {} could not be read, using defaults", iniPath.toStdString());
    }
    PARFETCH_DEBUG("Config initialized from {}", iniPath.toStdString());
}

QVariant Config::getValue(const QString& key, const QVariant& defaultValue) const {
    if (!settings_) return defaultValue;
    return settings_->value(key, defaultValue);
}

void Config::setValue(const QString& key, const QVariant& value) {
    if (settings_) {
        settings_->setValue(key, value);
    }
}

QString Config::getString(const QString& key, const QString& defaultValue) const {
    return getValue(key, defaultValue).toString();
}

int Config::getInt(const QString& key, int defaultValue) const {
    bool ok = false;
    int value = getValue(key, defaultValue).toInt(&ok);
    return ok ? value : defaultValue;
}

qint64 Config::getInt64(const QString& key, qint64 defaultValue) const {
    bool ok = false;
    qint64 value = getValue(key, defaultValue).toLongLong(&ok);
    return ok ? value : defaultValue;
}

bool Config::getBool(const QString& key, bool defaultValue) const {
    return getValue(key, defaultValue).toBool();
}

Config::DownloadSettings Config::getDownloadSettings() const {
    DownloadSettings defaults;
    DownloadSettings settings;
    settings.chunkSize = getInt64("download/chunkSize", defaults.chunkSize);
    settings.maxFiles = getInt("download/maxFiles", defaults.maxFiles);
    settings.parallelFailures = getInt("download/parallelFailures", defaults.parallelFailures);
    settings.maxRetries = getInt("download/maxRetries", defaults.maxRetries);
    settings.userAgent = getString("download/userAgent", defaults.userAgent);
    return settings;
}

Config::CacheSettings Config::getCacheSettings() const {
    CacheSettings settings;
    settings.modelsPath = getString("cache/modelsPath", getDataPath() + "/models");
    settings.removePartialOnFailure = getBool("cache/removePartialOnFailure", true);
    settings.parallelModels = getInt("cache/parallelModels", 1);
    return settings;
}

Config::LoggingSettings Config::getLoggingSettings() const {
    LoggingSettings settings;
    settings.filePath = getString("logging/filePath");
    settings.level = getString("logging/level", "info");
    return settings;
}

void Config::setDownloadSettings(const DownloadSettings& settings) {
    setValue("download/chunkSize", settings.chunkSize);
    setValue("download/maxFiles", settings.maxFiles);
    setValue("download/parallelFailures", settings.parallelFailures);
    setValue("download/maxRetries", settings.maxRetries);
    setValue("download/userAgent", settings.userAgent);
}

void Config::setCacheSettings(const CacheSettings& settings) {
    setValue("cache/modelsPath", settings.modelsPath);
    setValue("cache/removePartialOnFailure", settings.removePartialOnFailure);
    setValue("cache/parallelModels", settings.parallelModels);
}

void Config::setLoggingSettings(const LoggingSettings& settings) {
    setValue("logging/filePath", settings.filePath);
    setValue("logging/level", settings.level);
}

QString Config::getDataPath() const {
    return QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
}

QString Config::getCachePath() const {
    return QStandardPaths::writableLocation(QStandardPaths::CacheLocation);
}

void Config::sync() {
    if (settings_) {
        settings_->sync();
    }
}

} // namespace Parfetch
