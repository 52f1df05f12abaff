#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/logger.h>
#include <memory>
#include <string>

namespace core {
namespace logging {

    // Builds a console + rotating file logger. The caller owns it and hands it to
    // the components that need it; nothing is registered process-wide.
    std::shared_ptr<spdlog::logger> createLogger(const std::string& name = "StockAnalysis",
                                                 const std::string& base_log_filename = "stock_analysis",
                                                 spdlog::level::level_enum console_level = spdlog::level::info,
                                                 spdlog::level::level_enum file_level = spdlog::level::debug);

    // Logger without sinks, used when a component is constructed without one
    std::shared_ptr<spdlog::logger> nullLogger();

    // Returns `logger` if set, otherwise a null logger
    std::shared_ptr<spdlog::logger> orNull(std::shared_ptr<spdlog::logger> logger);

    // Helper function to set log level from string (useful for env vars/args)
    spdlog::level::level_enum level_from_string(const std::string& level_str);

} // namespace logging
} // namespace core
