// src/common/network_utils.hpp
#ifndef NETWORK_UTILS_HPP
#define NETWORK_UTILS_HPP

#include <string>
#include <vector>
#include <cstdint>
#include <netinet/in.h>

namespace WolRelay
{
    namespace Common
    {
        /**
         * @brief Một địa chỉ gắn trên network interface (kết quả thô từ getifaddrs)
         */
        struct InterfaceAddress
        {
            std::string name;               // Tên interface (eth0, enp3s0, ...)
            int family;                     // AF_INET / AF_INET6
            std::vector<uint8_t> address;   // 4 bytes (IPv4) hoặc 16 bytes (IPv6)
            std::vector<uint8_t> netmask;   // Rỗng nếu kernel không cung cấp
            bool is_up;
            bool is_running;
            bool is_loopback;

            InterfaceAddress()
                : family(AF_UNSPEC), is_up(false), is_running(false), is_loopback(false) {}
        };

        /**
         * @brief Tiện ích mạng
         */
        class NetworkUtils
        {
        public:
            /**
             * @brief IP address utilities
             */
            static bool isValidIPv4(const std::string &ip);

            /**
             * @brief Chuyển địa chỉ dạng bytes thành chuỗi (IPv4 hoặc IPv6)
             * @return Chuỗi rỗng nếu độ dài không phải 4 hoặc 16
             */
            static std::string bytesToIPString(const std::vector<uint8_t> &bytes);

            /**
             * @brief Chuyển chuỗi IPv4 thành 4 bytes (network order)
             */
            static bool ipStringToBytes(const std::string &ip, std::vector<uint8_t> &out);

            /**
             * @brief Port utilities
             */
            static bool isValidPort(int port);

            /**
             * @brief Liệt kê tất cả địa chỉ trên các network interface của máy
             * @param out Danh sách địa chỉ theo thứ tự kernel trả về
             * @return false nếu getifaddrs thất bại
             */
            static bool getInterfaceAddresses(std::vector<InterfaceAddress> &out);

            /**
             * @brief Network calculation utilities
             */
            static bool isZeroMask(const std::vector<uint8_t> &mask);

            /**
             * @brief Tính broadcast address: address | ~mask (theo từng byte)
             * @param address Bytes của địa chỉ
             * @param mask Bytes của subnet mask
             * @param broadcast Kết quả
             * @return false nếu độ dài address và mask khác nhau
             */
            static bool calculateBroadcastAddress(const std::vector<uint8_t> &address,
                                                  const std::vector<uint8_t> &mask,
                                                  std::vector<uint8_t> &broadcast);

            /**
             * @brief Chuỗi mô tả lỗi errno (thread-safe)
             */
            static std::string errnoToString(int err);

        private:
            NetworkUtils() = default;
        };

    } // namespace Common
} // namespace WolRelay

#endif // NETWORK_UTILS_HPP
