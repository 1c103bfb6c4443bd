#pragma once

#include "charta/common/ILoggerBackend.h"
#include <fmt/format.h>
#include <memory>
#include <source_location>
#include <string>
#include <vector>

namespace charta {

/**
 * @brief Process-wide logging facade
 *
 * Layout phases report progress at debug level and excluded cycle edges at
 * warn level. Output goes to the injected backend (SpdlogBackend unless a
 * host installs its own) and, when capture is enabled, to an in-memory
 * buffer that tests and embedding hosts can inspect.
 *
 * Thread-safe: backend swaps and the capture buffer are mutex-guarded.
 *
 * Example:
 * @code
 * charta::Logger::enableCapture(true);
 * auto result = charta::SugiyamaLayout().layout(graph);
 * auto warnings = charta::Logger::getCapturedLogs("[warn]");
 * @endcode
 */
class Logger {
public:
    /**
     * @brief Inject custom logger backend
     * @param backend Host backend (ownership transferred)
     */
    static void setBackend(std::unique_ptr<ILoggerBackend> backend);

    /**
     * @brief Initialize default logger (stderr only)
     */
    static void initialize();

    /**
     * @brief Initialize default logger with an additional file sink
     * @param logDir Directory receiving charta.log
     * @param logToFile Enable file logging
     */
    static void initialize(const std::string& logDir, bool logToFile = true);

    /**
     * @brief Set minimum log level
     */
    static void setLevel(LogLevel level);

    // Logging methods
    static void trace(const std::string& message,
                      const std::source_location& loc = std::source_location::current());
    static void debug(const std::string& message,
                      const std::source_location& loc = std::source_location::current());
    static void info(const std::string& message,
                     const std::source_location& loc = std::source_location::current());
    static void warn(const std::string& message,
                     const std::source_location& loc = std::source_location::current());
    static void error(const std::string& message,
                      const std::source_location& loc = std::source_location::current());

    /**
     * @brief Flush log buffers
     */
    static void flush();

    // ===== Log Capture API =====

    /**
     * @brief Enable or disable log capture
     *
     * Captured lines look like "[warn] SugiyamaLayout::layout() - ...".
     * Capture is independent of the backend level.
     */
    static void enableCapture(bool enable);

    static bool isCaptureEnabled();

    /**
     * @brief Get captured logs with optional filtering
     * @param pattern Substring filter (empty = all logs)
     * @param maxLines Return only the last N matches (0 = unlimited)
     */
    static std::vector<std::string> getCapturedLogs(
        const std::string& pattern = "",
        size_t maxLines = 0);

    static void clearCapturedLogs();

private:
    static std::unique_ptr<ILoggerBackend> backend_;
    static void write(LogLevel level, const std::string& message, const std::source_location& loc);
    static void captureLog(const std::string& message);
    static std::string extractFunctionName(const std::source_location& loc);
};

}  // namespace charta

// Logging macros with fmt-style formatting
#define LOG_TRACE(...) charta::Logger::trace(fmt::format(__VA_ARGS__), std::source_location::current())
#define LOG_DEBUG(...) charta::Logger::debug(fmt::format(__VA_ARGS__), std::source_location::current())
#define LOG_INFO(...)  charta::Logger::info(fmt::format(__VA_ARGS__), std::source_location::current())
#define LOG_WARN(...)  charta::Logger::warn(fmt::format(__VA_ARGS__), std::source_location::current())
#define LOG_ERROR(...) charta::Logger::error(fmt::format(__VA_ARGS__), std::source_location::current())
