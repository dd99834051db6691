#include "Logger.hpp"

#include <algorithm>
#include <cctype>

namespace Parfetch {

namespace {
constexpr const char* kLoggerName = "parfetch";
constexpr std::size_t kMaxLogFileBytes = 1024 * 1024 * 5;
constexpr std::size_t kMaxLogFiles = 3;
}

Logger& Logger::instance() {
    static Logger instance;
    return instance;
}

void Logger::initialize(const std::string& logFilePath, Level level) {
    try {
        auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            logFilePath, kMaxLogFileBytes, kMaxLogFiles);

        console_sink->set_pattern("[%H:%M:%S] [%^%l%$] [%t] %v");
        file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%f] [%l] [%t] %v");

        install(std::make_shared<spdlog::logger>(
                    kLoggerName, spdlog::sinks_init_list{console_sink, file_sink}),
                level);

        PARFETCH_DEBUG("Logger initialized with file: {}", logFilePath);

    } catch (const spdlog::spdlog_ex& ex) {
        initializeConsole(level);
        logger_->error("Logger file sink unavailable ({}), logging to console only", ex.what());
    }
}

void Logger::initializeConsole(Level level) {
    auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console_sink->set_pattern("[%H:%M:%S] [%^%l%$] %v");
    install(std::make_shared<spdlog::logger>(kLoggerName, console_sink), level);
}

void Logger::install(std::shared_ptr<spdlog::logger> logger, Level level) {
    spdlog::drop(kLoggerName);
    logger_ = std::move(logger);
    setLevel(level);
    spdlog::register_logger(logger_);
}

void Logger::setLevel(Level level) {
    if (logger_) {
        logger_->set_level(static_cast<spdlog::level::level_enum>(level));
    }
}

Logger::Level Logger::level() const {
    if (!logger_) {
        return Level::Info;
    }
    return static_cast<Level>(logger_->level());
}

void Logger::flush() {
    if (logger_) {
        logger_->flush();
    }
}

void Logger::shutdown() {
    flush();
    spdlog::drop(kLoggerName);
    logger_.reset();
}

std::optional<Logger::Level> Logger::parseLevel(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "trace") return Level::Trace;
    if (lower == "debug") return Level::Debug;
    if (lower == "info") return Level::Info;
    if (lower == "warn" || lower == "warning") return Level::Warn;
    if (lower == "error") return Level::Error;
    if (lower == "critical") return Level::Critical;
    if (lower == "off") return Level::Off;
    return std::nullopt;
}

const std::shared_ptr<spdlog::logger>& Logger::ensureLogger() {
    if (!logger_) {
        initializeConsole(Level::Info);
    }
    return logger_;
}

} // namespace Parfetch
