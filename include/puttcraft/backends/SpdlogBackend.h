#pragma once

#include "puttcraft/common/ILoggerBackend.h"
#include <memory>
#include <spdlog/spdlog.h>

namespace puttcraft {

/**
 * @brief spdlog-based logger backend
 *
 * Colored console sink; the level can be overridden through the
 * LOG_LEVEL or SPDLOG_LEVEL environment variable.
 *
 * Default backend when PUTTCRAFT_USE_SPDLOG=ON.
 */
class SpdlogBackend : public ILoggerBackend {
public:
    SpdlogBackend();

    void log(LogLevel level, const std::string& message,
             const std::source_location& loc) override;
    void setLevel(LogLevel level) override;
    void flush() override;

private:
    std::shared_ptr<spdlog::logger> logger_;
    spdlog::level::level_enum convertLevel(LogLevel level);
};

}  // namespace puttcraft
