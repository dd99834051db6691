#include "CommandLine.hpp"

#include <QtCore/QCommandLineParser>
#include <algorithm>
#include <limits>

namespace Parfetch {

std::optional<std::pair<QByteArray, QByteArray>> parseHeader(const QString& header) {
    const int colon = header.indexOf(':');
    if (colon <= 0) {
        return std::nullopt;
    }
    const QByteArray key = header.left(colon).trimmed().toLatin1();
    const QByteArray value = header.mid(colon + 1).trimmed().toLatin1();
    if (key.isEmpty()) {
        return std::nullopt;
    }
    return std::make_pair(key, value);
}

std::optional<qint64> parseByteSize(const QString& text) {
    QString number = text.trimmed().toUpper();
    if (number.endsWith("IB")) {
        number.chop(2);
    } else if (number.endsWith('B')) {
        number.chop(1);
    }

    qint64 multiplier = 1;
    if (number.endsWith('K')) {
        multiplier = 1024;
    } else if (number.endsWith('M')) {
        multiplier = 1024 * 1024;
    } else if (number.endsWith('G')) {
        multiplier = 1024LL * 1024 * 1024;
    }
    if (multiplier != 1) {
        number.chop(1);
    }

    bool ok = false;
    const qint64 value = number.toLongLong(&ok);
    if (!ok || value <= 0 || value > std::numeric_limits<qint64>::max() / multiplier) {
        return std::nullopt;
    }
    return value * multiplier;
}

namespace {

Expected<int, QString> parseCount(const QCommandLineParser& parser, const QString& option, int fallback) {
    if (!parser.isSet(option)) {
        return fallback;
    }
    bool ok = false;
    const int value = parser.value(option).toInt(&ok);
    if (!ok || value < 0) {
        return makeUnexpected(QString("--%1 expects a non-negative integer, got '%2'")
                                  .arg(option, parser.value(option)));
    }
    return value;
}

} // namespace

Expected<CliOptions, QString> parseCommandLine(const QStringList& arguments,
                                               const Config::DownloadSettings& downloadDefaults,
                                               const Config::CacheSettings& cacheDefaults) {
    QCommandLineParser parser;
    parser.setApplicationDescription("Parallel ranged HTTP downloader");
    const QCommandLineOption helpOption = parser.addHelpOption();
    const QCommandLineOption versionOption = parser.addVersionOption();

    parser.addPositionalArgument("url", "Remote object to fetch (http or https).", "[url]");
    parser.addPositionalArgument("destination", "Local file to write.", "[destination]");

    parser.addOptions({
        {"chunk-size", "Bytes per ranged request (suffixes K, M, G).", "bytes"},
        {"max-files", "Maximum chunks in flight.", "count"},
        {"parallel-failures", "Maximum chunks retrying at once (0 disables retries).", "count"},
        {"max-retries", "Retries per chunk (0 disables retries).", "count"},
        {{"H", "header"}, "Extra request header, repeatable.", "Key: Value"},
        {"log-level", "trace, debug, info, warn, error, critical or off.", "level"},
        {"log-file", "Also log to this file.", "path"},
        {"config", "Read settings from this INI file.", "path"},
        {"manifest", "Model manifest (JSON) to bring up to date.", "path"},
        {"models-dir", "Root directory of the model cache.", "path"},
        {"model", "Only fetch this model from the manifest.", "name"},
        {"parallel-models", "Models fetched at once.", "count"},
        {"clean", "Remove unregistered entries from the models directory."},
    });

    if (!parser.parse(arguments)) {
        return makeUnexpected(parser.errorText());
    }

    CliOptions options;
    options.helpText = parser.helpText();
    options.showHelp = parser.isSet(helpOption);
    options.showVersion = parser.isSet(versionOption);
    if (options.showHelp || options.showVersion) {
        return options;
    }

    options.logLevel = parser.value("log-level");
    options.logFile = parser.value("log-file");
    options.configFile = parser.value("config");

    DownloadRequest& request = options.request;
    request.chunkSize = downloadDefaults.chunkSize;
    request.maxFiles = downloadDefaults.maxFiles;
    request.parallelFailures = downloadDefaults.parallelFailures;
    request.maxRetries = downloadDefaults.maxRetries;

    if (parser.isSet("chunk-size")) {
        auto size = parseByteSize(parser.value("chunk-size"));
        if (!size) {
            return makeUnexpected(QString("--chunk-size expects a positive size, got '%1'")
                                      .arg(parser.value("chunk-size")));
        }
        request.chunkSize = *size;
    }

    auto maxFiles = parseCount(parser, "max-files", request.maxFiles);
    if (maxFiles.hasError()) return makeUnexpected(maxFiles.error());
    request.maxFiles = maxFiles.value();

    auto parallelFailures = parseCount(parser, "parallel-failures", request.parallelFailures);
    if (parallelFailures.hasError()) return makeUnexpected(parallelFailures.error());
    request.parallelFailures = parallelFailures.value();

    auto maxRetries = parseCount(parser, "max-retries", request.maxRetries);
    if (maxRetries.hasError()) return makeUnexpected(maxRetries.error());
    request.maxRetries = maxRetries.value();

    for (const QString& header : parser.values("H")) {
        auto parsed = parseHeader(header);
        if (!parsed) {
            return makeUnexpected(QString("Malformed header '%1', expected 'Key: Value'").arg(header));
        }
        request.headers.push_back(*parsed);
    }

    const QStringList positional = parser.positionalArguments();

    if (parser.isSet("manifest")) {
        if (!positional.isEmpty()) {
            return makeUnexpected(QString("--manifest does not take a URL or destination"));
        }
        options.mode = CliOptions::Mode::Models;
        options.manifestPath = parser.value("manifest");
        options.modelsDir = parser.isSet("models-dir") ? parser.value("models-dir") : cacheDefaults.modelsPath;
        options.modelName = parser.value("model");
        options.clean = parser.isSet("clean");

        auto parallelModels = parseCount(parser, "parallel-models", cacheDefaults.parallelModels);
        if (parallelModels.hasError()) return makeUnexpected(parallelModels.error());
        options.parallelModels = std::max(parallelModels.value(), 1);
        return options;
    }

    if (parser.isSet("models-dir") || parser.isSet("model") || parser.isSet("clean")) {
        return makeUnexpected(QString("--models-dir, --model and --clean need --manifest"));
    }

    if (positional.size() != 2) {
        return makeUnexpected(QString("Expected <url> <destination>"));
    }

    options.mode = CliOptions::Mode::Download;
    request.url = QUrl(positional.at(0));
    request.destination = positional.at(1);
    return options;
}

} // namespace Parfetch
