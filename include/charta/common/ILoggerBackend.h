#pragma once

#include <optional>
#include <source_location>
#include <string>
#include <string_view>

namespace charta {

/**
 * @brief Log level enumeration
 */
enum class LogLevel {
    Trace = 0,
    Debug = 1,
    Info = 2,
    Warn = 3,
    Error = 4,
    Critical = 5,
    Off = 6
};

/**
 * @brief Parse a level name such as "debug" or "warning" (case-insensitive)
 * @return std::nullopt for unknown names
 */
std::optional<LogLevel> parseLogLevel(std::string_view name);

/**
 * @brief Lowercase level name ("trace" ... "off")
 */
const char* logLevelName(LogLevel level);

/**
 * @brief Logger backend interface for dependency injection
 *
 * Lets a host application route charta's layout diagnostics into its own
 * logging system.
 *
 * Example:
 * @code
 * class HostLogger : public charta::ILoggerBackend {
 * public:
 *     void log(LogLevel level, const std::string& message,
 *              const std::source_location& loc) override {
 *         host->write(level, message, loc.file_name(), loc.line());
 *     }
 *     void setLevel(LogLevel level) override { host->setMinLevel(level); }
 *     void flush() override { host->flush(); }
 * };
 *
 * charta::Logger::setBackend(std::make_unique<HostLogger>());
 * @endcode
 */
class ILoggerBackend {
public:
    virtual ~ILoggerBackend() = default;

    /**
     * @brief Log a message with source location
     * @param level Log level
     * @param message Pre-formatted message
     * @param loc Source location (file, line, function)
     */
    virtual void log(LogLevel level, const std::string& message,
                     const std::source_location& loc) = 0;

    /**
     * @brief Set minimum log level
     */
    virtual void setLevel(LogLevel level) = 0;

    /**
     * @brief Flush log buffers
     */
    virtual void flush() = 0;
};

}  // namespace charta
