#pragma once

#include "charta/common/ILoggerBackend.h"
#include <memory>
#include <spdlog/spdlog.h>

namespace charta {

/**
 * @brief spdlog-based logger backend
 *
 * Writes to a colored stderr sink so rendered diagrams on stdout stay
 * clean, with an optional file sink. Default level is warn; the
 * CHARTA_LOG_LEVEL, LOG_LEVEL or SPDLOG_LEVEL environment variable
 * (first one set wins) overrides it.
 */
class SpdlogBackend : public ILoggerBackend {
public:
    static constexpr const char* LOGGER_NAME = "charta";

    SpdlogBackend(const std::string& logDir = "", bool logToFile = false);

    void log(LogLevel level, const std::string& message,
             const std::source_location& loc) override;
    void setLevel(LogLevel level) override;
    void flush() override;

    /// Level after environment overrides were applied
    LogLevel level() const;

private:
    std::shared_ptr<spdlog::logger> logger_;
    static spdlog::level::level_enum convertLevel(LogLevel level);
};

}  // namespace charta
