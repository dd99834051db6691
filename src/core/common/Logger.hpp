#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <fmt/core.h>
#include <memory>
#include <optional>
#include <string>

namespace Parfetch {

class Logger {
public:
    enum class Level {
        Trace = 0,
        Debug = 1,
        Info = 2,
        Warn = 3,
        Error = 4,
        Critical = 5,
        Off = 6
    };

    static Logger& instance();

    // Console plus rotating file sink. Falls back to console only if the file cannot be opened.
    void initialize(const std::string& logFilePath = "parfetch.log",
                    Level level = Level::Info);

    // Console sink on stderr only; used by tests and when no log file is configured.
    void initializeConsole(Level level = Level::Info);

    void setLevel(Level level);
    Level level() const;

    void flush();
    void shutdown();

    static std::optional<Level> parseLevel(const std::string& name);

    template<typename... Args>
    void trace(fmt::format_string<Args...> format, Args&&... args) {
        ensureLogger()->trace(format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void debug(fmt::format_string<Args...> format, Args&&... args) {
        ensureLogger()->debug(format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void info(fmt::format_string<Args...> format, Args&&... args) {
        ensureLogger()->info(format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void warn(fmt::format_string<Args...> format, Args&&... args) {
        ensureLogger()->warn(format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void error(fmt::format_string<Args...> format, Args&&... args) {
        ensureLogger()->error(format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void critical(fmt::format_string<Args...> format, Args&&... args) {
        ensureLogger()->critical(format, std::forward<Args>(args)...);
    }

private:
    Logger() = default;

    // Library code may log before the host application calls initialize().
    const std::shared_ptr<spdlog::logger>& ensureLogger();
    void install(std::shared_ptr<spdlog::logger> logger, Level level);

    std::shared_ptr<spdlog::logger> logger_;
};

// Convenience macros
#define PARFETCH_TRACE(...) Parfetch::Logger::instance().trace(__VA_ARGS__)
#define PARFETCH_DEBUG(...) Parfetch::Logger::instance().debug(__VA_ARGS__)
#define PARFETCH_INFO(...) Parfetch::Logger::instance().info(__VA_ARGS__)
#define PARFETCH_WARN(...) Parfetch::Logger::instance().warn(__VA_ARGS__)
#define PARFETCH_ERROR(...) Parfetch::Logger::instance().error(__VA_ARGS__)
#define PARFETCH_CRITICAL(...) Parfetch::Logger::instance().critical(__VA_ARGS__)

} // namespace Parfetch
