/**
 * @file logger.h
 * @brief Structured Logging Wrapper
 *
 * Wraps spdlog with the standard sink and pattern configuration.
 * Library code logs through the default spdlog logger; applications call
 * Logger::initialize (or initializeFromConfig) once at startup.
 */

#pragma once

#include "bras/config/config_manager.h"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace bras::common {

/**
 * @brief Logger initialization and configuration
 */
class Logger {
public:
    /**
     * @brief Map a level name to an spdlog level
     * @param level trace, debug, info, warn, error, critical or off
     * @return Matching level, spdlog::level::info for unknown names
     */
    static spdlog::level::level_enum parseLevel(const std::string& level) {
        if (level == "trace") {
            return spdlog::level::trace;
        } else if (level == "debug") {
            return spdlog::level::debug;
        } else if (level == "info") {
            return spdlog::level::info;
        } else if (level == "warn") {
            return spdlog::level::warn;
        } else if (level == "error") {
            return spdlog::level::err;
        } else if (level == "critical") {
            return spdlog::level::critical;
        } else if (level == "off") {
            return spdlog::level::off;
        }
        return spdlog::level::info;
    }

    /**
     * @brief Initialize the default logger
     * @param name Logger name shown in every line
     * @param logLevel Log level (trace, debug, info, warn, error, critical)
     * @param logToFile Enable file logging
     * @param logFile Log file path
     */
    static void initialize(
        const std::string& name,
        const std::string& logLevel = "info",
        bool logToFile = false,
        const std::string& logFile = ""
    ) {
        try {
            std::vector<spdlog::sink_ptr> sinks;

            auto consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
            consoleSink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
            sinks.push_back(consoleSink);

            if (logToFile && !logFile.empty()) {
                auto fileSink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                    logFile, 1024 * 1024 * 10, 3  // 10MB, 3 files
                );
                fileSink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] %v");
                sinks.push_back(fileSink);
            }

            auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
            logger->set_level(parseLevel(logLevel));

            spdlog::set_default_logger(logger);
            spdlog::flush_on(spdlog::level::warn);

            spdlog::debug("Logger initialized: name={}, level={}, file={}",
                          name, logLevel, logToFile ? logFile : "none");

        } catch (const spdlog::spdlog_ex& ex) {
            std::cerr << "Logger initialization failed: " << ex.what() << std::endl;
        }
    }

    /**
     * @brief Initialize from BRAS_LOG_LEVEL, BRAS_LOG_TO_FILE and BRAS_LOG_FILE
     */
    static void initializeFromConfig(const std::string& name) {
        const auto& config = ConfigManager::getInstance();
        initialize(
            name,
            config.getString(ConfigManager::LOG_LEVEL, "info"),
            config.getBool(ConfigManager::LOG_TO_FILE, false),
            config.getString(ConfigManager::LOG_FILE, "")
        );
    }

    /**
     * @brief Set log level at runtime
     */
    static void setLevel(const std::string& level) {
        spdlog::set_level(parseLevel(level));
        spdlog::debug("Log level changed to: {}", level);
    }

    static void flush() {
        spdlog::default_logger()->flush();
    }
};

} // namespace bras::common
