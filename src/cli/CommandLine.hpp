#pragma once

#include <QtCore/QString>
#include <QtCore/QStringList>
#include <optional>

#include "../core/common/Config.hpp"
#include "../core/common/Expected.hpp"
#include "../core/download/DownloadTypes.hpp"

namespace Parfetch {

enum class ExitCode {
    Success = 0,
    Failure = 1,
    UsageError = 2
};

struct CliOptions {
    enum class Mode {
        Download,
        Models
    };

    Mode mode = Mode::Download;
    bool showHelp = false;
    bool showVersion = false;
    QString helpText;

    // Download mode
    DownloadRequest request;

    // Models mode
    QString manifestPath;
    QString modelsDir;
    QString modelName;
    bool clean = false;
    int parallelModels = 1;

    QString logLevel;
    QString logFile;
    QString configFile;
};

/**
 * @brief Parses parfetch's arguments on top of the configured defaults
 *
 * arguments includes the program name, as QCoreApplication::arguments() does.
 * Errors are usage messages suitable for printing as-is.
 */
Expected<CliOptions, QString> parseCommandLine(const QStringList& arguments,
                                               const Config::DownloadSettings& downloadDefaults,
                                               const Config::CacheSettings& cacheDefaults);

// "Key: Value" -> (Key, Value); nothing when there is no ':' or the key is empty.
std::optional<std::pair<QByteArray, QByteArray>> parseHeader(const QString& header);

// Plain bytes or a K/M/G suffix (powers of 1024); nothing for garbage or non-positive values.
std::optional<qint64> parseByteSize(const QString& text);

} // namespace Parfetch
