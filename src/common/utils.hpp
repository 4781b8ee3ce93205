// src/common/utils.hpp
#ifndef UTILS_HPP
#define UTILS_HPP

#include <string>
#include <vector>
#include <chrono>
#include <cstdint>
#include <atomic>
#include <functional>

namespace WolRelay
{
    namespace Common
    {
        /**
         * @brief Lớp tiện ích chung cho hệ thống
         */
        class Utils
        {
        public:
            // ==================== Time utilities ====================
            /**
             * @brief Lấy thời gian hiện tại tính bằng milliseconds
             * @return Timestamp tính bằng milliseconds từ epoch
             */
            static uint64_t getCurrentTimestampMs();

            /**
             * @brief Chuyển đổi timestamp thành string
             * @param timestamp Timestamp tính bằng milliseconds
             * @return Chuỗi thời gian định dạng "YYYY-MM-DD HH:MM:SS.mmm"
             */
            static std::string formatTimestamp(uint64_t timestamp);

            /**
             * @brief Định dạng một khoảng thời gian
             * @param duration_ms Khoảng thời gian (milliseconds)
             * @return Chuỗi dạng "1h 02m 03s" hoặc "850 ms"
             */
            static std::string formatDuration(uint64_t duration_ms);

            // ==================== String utilities ====================
            /**
             * @brief Tách chuỗi thành vector bằng delimiter
             * @param str Chuỗi cần tách
             * @param delimiter Ký tự phân cách
             * @return Vector chứa các phần đã tách
             */
            static std::vector<std::string> split(const std::string &str, char delimiter);

            /**
             * @brief Cắt bỏ khoảng trắng ở đầu/cuối chuỗi
             */
            static std::string trim(const std::string &str);

            /**
             * @brief Cắt bỏ ký tự chỉ định ở đầu/cuối chuỗi
             * @param str Chuỗi cần xử lý
             * @param chars Các ký tự cần loại bỏ
             */
            static std::string trim(const std::string &str, const std::string &chars);

            static std::string toLowerCase(const std::string &str);
            static std::string toUpperCase(const std::string &str);

            static bool startsWith(const std::string &str, const std::string &prefix);

            /**
             * @brief Xóa tất cả ký tự thuộc tập chars khỏi chuỗi
             */
            static std::string removeChars(const std::string &str, const std::string &chars);

            /**
             * @brief Ghép vector string thành chuỗi với delimiter
             * @param strings Vector các chuỗi
             * @param delimiter Chuỗi phân cách
             * @return Chuỗi đã ghép
             */
            static std::string join(const std::vector<std::string> &strings, const std::string &delimiter);

            // ==================== Hex utilities ====================
            /**
             * @brief Chuyển đổi bytes thành hex string (chữ thường, không phân cách)
             * @param data Con trỏ tới dữ liệu
             * @param length Độ dài dữ liệu
             * @return Chuỗi hex
             */
            static std::string bytesToHex(const void *data, size_t length);

            /**
             * @brief Chuyển đổi hex string thành bytes
             * @param hex_str Chuỗi hex (độ dài chẵn, chỉ gồm ký tự hex)
             * @param out Vector bytes kết quả
             * @return false nếu chuỗi không hợp lệ
             */
            static bool hexToBytes(const std::string &hex_str, std::vector<uint8_t> &out);

            /**
             * @brief Kiểm tra chuỗi chỉ gồm ký tự hex
             */
            static bool isHexString(const std::string &str);
        };

        /**
         * @brief Thread-safe Singleton template
         */
        template <typename T>
        class Singleton
        {
        public:
            /**
             * @brief Lấy instance duy nhất
             * @return Reference tới instance
             */
            static T &getInstance()
            {
                static T instance;
                return instance;
            }

        protected:
            Singleton() = default;
            virtual ~Singleton() = default;

        public:
            Singleton(const Singleton &) = delete;
            Singleton &operator=(const Singleton &) = delete;
            Singleton(Singleton &&) = delete;
            Singleton &operator=(Singleton &&) = delete;
        };

        /**
         * @brief Scope guard để thực hiện cleanup tự động
         */
        class ScopeGuard
        {
        public:
            explicit ScopeGuard(std::function<void()> cleanup_func);
            ~ScopeGuard();

            /**
             * @brief Hủy bỏ cleanup (sẽ không thực hiện khi destructor được gọi)
             */
            void dismiss();

        private:
            std::function<void()> cleanup_func_;
            bool dismissed_;
        };

    } // namespace Common
} // namespace WolRelay

#endif // UTILS_HPP
