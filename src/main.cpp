#include <QtCore/QCoreApplication>
#include <QtCore/QFileInfo>
#include <fmt/core.h>

#include "cli/CommandLine.hpp"
#include "cli/ProgressPrinter.hpp"
#include "core/common/Config.hpp"
#include "core/common/Logger.hpp"
#include "core/download/ChunkedDownloader.hpp"
#include "core/download/NetworkTransport.hpp"
#include "core/download/ResultAggregator.hpp"
#include "core/models/ModelCache.hpp"
#include "core/models/ModelRegistry.hpp"

using namespace Parfetch;

namespace {

int exitCode(ExitCode code) {
    return static_cast<int>(code);
}

int usageError(const QString& message) {
    fmt::print(stderr, "parfetch: {}\nTry 'parfetch --help' for more information.\n", message.toStdString());
    return exitCode(ExitCode::UsageError);
}

bool setupLogging(const CliOptions& options, const Config::LoggingSettings& settings) {
    const QString levelName = options.logLevel.isEmpty() ? settings.level : options.logLevel;
    auto level = Logger::parseLevel(levelName.toStdString());
    if (!level) {
        return false;
    }

    const QString logFile = options.logFile.isEmpty() ? settings.filePath : options.logFile;
    if (logFile.isEmpty()) {
        Logger::instance().initializeConsole(*level);
    } else {
        Logger::instance().initialize(logFile.toStdString(), *level);
    }
    return true;
}

int runDownload(const CliOptions& options, const Config::DownloadSettings& settings) {
    NetworkTransport transport;
    transport.setUserAgent(settings.userAgent);

    ChunkedDownloader downloader(transport);
    ProgressPrinter printer;
    printer.attach(&downloader, QFileInfo(options.request.destination).fileName());

    auto outcome = downloader.download(options.request);
    if (outcome.hasError()) {
        const DownloadError& error = outcome.error();
        if (error.kind == DownloadErrorKind::ValidationError) {
            return usageError(error.message);
        }
        fmt::print(stderr, "parfetch: {}\n", error.describe().toStdString());
        return exitCode(ExitCode::Failure);
    }

    PARFETCH_INFO("Wrote {} bytes to {}", outcome.value().totalBytes,
                  options.request.destination.toStdString());
    return exitCode(ExitCode::Success);
}

int runModels(const CliOptions& options, const Config& config) {
    auto registry = ModelRegistry::loadManifest(options.manifestPath);
    if (registry.hasError()) {
        return usageError(QString("cannot load manifest %1 (%2)")
                              .arg(options.manifestPath, toString(registry.error())));
    }

    if (!options.modelName.isEmpty() && !registry.value().contains(options.modelName)) {
        return usageError(QString("model '%1' is not in the manifest").arg(options.modelName));
    }

    // Per-file requests inherit these settings; reject them before any network activity.
    DownloadRequest probe = options.request;
    probe.url = QUrl("https://huggingface.co");
    probe.destination = options.modelsDir;
    auto valid = validateDownloadRequest(probe);
    if (valid.hasError()) {
        return usageError(valid.error().message);
    }

    const auto downloadSettings = config.getDownloadSettings();
    const auto cacheSettings = config.getCacheSettings();

    NetworkTransport transport;
    transport.setUserAgent(downloadSettings.userAgent);

    ModelCache cache(options.modelsDir, registry.value(), transport);
    cache.setDownloadDefaults(options.request);
    cache.setRemovePartialOnFailure(cacheSettings.removePartialOnFailure);

    ProgressPrinter printer;
    printer.attach(&cache);

    if (options.clean) {
        auto cleaned = cache.cleanDirectory();
        if (cleaned.hasError()) {
            fmt::print(stderr, "parfetch: cleaning {} failed ({})\n", options.modelsDir.toStdString(),
                       toString(cleaned.error()).toStdString());
            return exitCode(ExitCode::Failure);
        }
    }

    Expected<void, ModelError> result;
    if (!options.modelName.isEmpty()) {
        auto path = cache.ensureModel(options.modelName);
        if (path.hasError()) {
            result = makeUnexpected(path.error());
        } else {
            fmt::print("{}\n", path.value().toStdString());
        }
    } else {
        result = cache.ensureAll(options.parallelModels);
    }

    if (result.hasError()) {
        QString detail = toString(result.error());
        if (result.error() == ModelError::DownloadFailed && cache.lastDownloadError()) {
            detail += ": " + cache.lastDownloadError()->describe();
        }
        fmt::print(stderr, "parfetch: {}\n", detail.toStdString());
        return exitCode(ExitCode::Failure);
    }
    return exitCode(ExitCode::Success);
}

} // namespace

int main(int argc, char* argv[]) {
    QCoreApplication app(argc, argv);
    app.setApplicationName("parfetch");
    app.setApplicationVersion(PARFETCH_VERSION);
    app.setOrganizationName("Parfetch");

    try {
        Config& config = Config::instance();
        config.initialize();

        auto options = parseCommandLine(app.arguments(), config.getDownloadSettings(), config.getCacheSettings());
        if (options.hasValue() && !options.value().configFile.isEmpty()) {
            config.initializeFromFile(options.value().configFile);
            options = parseCommandLine(app.arguments(), config.getDownloadSettings(), config.getCacheSettings());
        }
        if (options.hasError()) {
            return usageError(options.error());
        }

        const CliOptions& cli = options.value();
        if (cli.showHelp) {
            fmt::print("{}", cli.helpText.toStdString());
            return exitCode(ExitCode::Success);
        }
        if (cli.showVersion) {
            fmt::print("parfetch {}\n", app.applicationVersion().toStdString());
            return exitCode(ExitCode::Success);
        }

        if (!setupLogging(cli, config.getLoggingSettings())) {
            return usageError(QString("unknown log level '%1'").arg(cli.logLevel));
        }

        PARFETCH_DEBUG("Starting parfetch v{}", app.applicationVersion().toStdString());

        const int code = cli.mode == CliOptions::Mode::Models
            ? runModels(cli, config)
            : runDownload(cli, config.getDownloadSettings());

        Logger::instance().shutdown();
        return code;

    } catch (const std::exception& e) {
        PARFETCH_CRITICAL("Fatal error: {}", e.what());
        fmt::print(stderr, "parfetch: fatal error: {}\n", e.what());
        return exitCode(ExitCode::Failure);
    }
}
