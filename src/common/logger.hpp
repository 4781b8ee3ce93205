// src/common/logger.hpp
#ifndef LOGGER_HPP
#define LOGGER_HPP

#include <string>
#include <spdlog/spdlog.h>

namespace WolRelay
{
    namespace Common
    {
        /**
         * @brief Enum cho các mức độ log
         */
        enum class LogLevel : int
        {
            TRACE = 0,
            DEBUG = 1,
            INFO = 2,
            WARN = 3,
            ERROR = 4,
            FATAL = 5,
            OFF = 6
        };

        /**
         * @brief Cấu hình logger
         */
        struct LoggerConfig
        {
            LogLevel level;             // Mức log của console sink
            std::string log_file;       // Rỗng = chỉ log ra console
            size_t max_file_size;       // Kích thước tối đa mỗi file (bytes)
            size_t max_files;           // Số file rotate giữ lại
            int flush_interval_sec;     // Chu kỳ flush định kỳ

            LoggerConfig()
                : level(LogLevel::INFO),
                  log_file(""),
                  max_file_size(1024 * 1024 * 10),
                  max_files(5),
                  flush_interval_sec(5) {}
        };

        /**
         * @brief Parse tên log level (không phân biệt hoa thường)
         * @param name "trace", "debug", "info", "warn"/"warning", "error", "fatal"/"critical", "off"
         * @param level Kết quả
         * @return false nếu tên không hợp lệ
         */
        bool parseLogLevel(const std::string &name, LogLevel &level);

        /**
         * @brief Chuyển LogLevel sang spdlog level
         */
        spdlog::level::level_enum toSpdlogLevel(LogLevel level);

        std::string logLevelToString(LogLevel level);

        /**
         * @brief Khởi tạo default logger của spdlog (console + file xoay vòng)
         * @return true nếu thành công; nếu thất bại logger mặc định được giữ nguyên
         */
        bool setupLogger(const LoggerConfig &config);

    } // namespace Common
} // namespace WolRelay

#endif // LOGGER_HPP
