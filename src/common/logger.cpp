// src/common/logger.cpp
#include "logger.hpp"
#include "utils.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <algorithm>
#include <chrono>
#include <iostream>
#include <memory>
#include <vector>

namespace WolRelay
{
    namespace Common
    {
        bool parseLogLevel(const std::string &name, LogLevel &level)
        {
            std::string lower = Utils::toLowerCase(Utils::trim(name));

            if (lower == "trace") level = LogLevel::TRACE;
            else if (lower == "debug") level = LogLevel::DEBUG;
            else if (lower == "info") level = LogLevel::INFO;
            else if (lower == "warn" || lower == "warning") level = LogLevel::WARN;
            else if (lower == "error") level = LogLevel::ERROR;
            else if (lower == "fatal" || lower == "critical") level = LogLevel::FATAL;
            else if (lower == "off") level = LogLevel::OFF;
            else return false;

            return true;
        }

        spdlog::level::level_enum toSpdlogLevel(LogLevel level)
        {
            switch (level)
            {
                case LogLevel::TRACE: return spdlog::level::trace;
                case LogLevel::DEBUG: return spdlog::level::debug;
                case LogLevel::INFO: return spdlog::level::info;
                case LogLevel::WARN: return spdlog::level::warn;
                case LogLevel::ERROR: return spdlog::level::err;
                case LogLevel::FATAL: return spdlog::level::critical;
                case LogLevel::OFF: return spdlog::level::off;
            }
            return spdlog::level::info;
        }

        std::string logLevelToString(LogLevel level)
        {
            switch (level)
            {
                case LogLevel::TRACE: return "TRACE";
                case LogLevel::DEBUG: return "DEBUG";
                case LogLevel::INFO: return "INFO";
                case LogLevel::WARN: return "WARN";
                case LogLevel::ERROR: return "ERROR";
                case LogLevel::FATAL: return "FATAL";
                case LogLevel::OFF: return "OFF";
            }
            return "UNKNOWN";
        }

        bool setupLogger(const LoggerConfig &config)
        {
            try
            {
                auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
                console_sink->set_level(toSpdlogLevel(config.level));
                console_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");

                std::vector<spdlog::sink_ptr> sinks{console_sink};

                // File log ghi ở mức debug, hoặc trace nếu console đang ở trace.
                // Mức off tắt cả file log.
                spdlog::level::level_enum level = toSpdlogLevel(config.level);
                spdlog::level::level_enum file_level = level == spdlog::level::off
                                                           ? spdlog::level::off
                                                           : std::min(spdlog::level::debug, level);
                if (!config.log_file.empty())
                {
                    auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                        config.log_file, config.max_file_size, config.max_files);
                    file_sink->set_level(file_level);
                    file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v");
                    sinks.push_back(file_sink);
                }

                auto logger = std::make_shared<spdlog::logger>("wol_relay", sinks.begin(), sinks.end());
                logger->set_level(config.log_file.empty() ? level : std::min(file_level, level));

                spdlog::set_default_logger(logger);
                spdlog::flush_every(std::chrono::seconds(config.flush_interval_sec));

                spdlog::debug("Logger initialized (level {}, file '{}')",
                              logLevelToString(config.level), config.log_file);
                return true;
            }
            catch (const spdlog::spdlog_ex &ex)
            {
                std::cerr << "Log initialization failed: " << ex.what() << std::endl;
                return false;
            }
        }

    } // namespace Common
} // namespace WolRelay
