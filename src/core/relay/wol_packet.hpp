// src/core/relay/wol_packet.hpp
#ifndef WOL_PACKET_HPP
#define WOL_PACKET_HPP

#include <string>
#include <vector>
#include <optional>
#include <regex>
#include <stdexcept>
#include <cstdint>

namespace WolRelay
{
    namespace Relay
    {
        using Packet = std::vector<uint8_t>;

        // ==================== Magic packet layout ====================
        constexpr size_t WOL_SYNC_LENGTH = 6;        // 6 x 0xFF
        constexpr size_t WOL_HW_ADDRESS_LENGTH = 6;  // 48-bit MAC
        constexpr size_t WOL_HW_REPEAT = 16;
        constexpr size_t WOL_PACKET_SIZE = WOL_SYNC_LENGTH + WOL_HW_ADDRESS_LENGTH * WOL_HW_REPEAT; // 102

        /**
         * @brief Pattern mặc định: đúng 102 bytes, 6 x FF rồi 16 nhóm 6 bytes
         */
        constexpr const char *DEFAULT_WOL_PATTERN = "^(FF){6}([0-9A-F]{12}){16}$";

        /**
         * @brief Pattern mặc định để lấy MAC: 6 nhóm capture ngay sau phần sync
         */
        constexpr const char *DEFAULT_MAC_PATTERN =
            "^(?:FF){6}([0-9A-F]{2})([0-9A-F]{2})([0-9A-F]{2})([0-9A-F]{2})([0-9A-F]{2})([0-9A-F]{2})";

        /**
         * @brief Lỗi khi chuỗi MAC address không hợp lệ
         */
        class PacketFormatError : public std::runtime_error
        {
        public:
            explicit PacketFormatError(const std::string &message)
                : std::runtime_error(message) {}
        };

        /**
         * @class WolPacketCodec
         * @brief Tạo magic packet và nhận dạng/trích MAC từ buffer nhận được
         *
         * Hai pattern được áp dụng lên chuỗi hex của buffer. Tách riêng
         * "có phải gói WOL" và "lấy MAC" cho phép chấp nhận các biến thể
         * (VD: có SecureOn password ở cuối) chỉ bằng cấu hình.
         * Sau khi tạo, object chỉ đọc nên dùng chung được giữa các thread.
         */
        class WolPacketCodec
        {
        public:
            WolPacketCodec();

            /**
             * @brief Constructor với pattern tùy chỉnh
             * @throws std::regex_error nếu pattern không hợp lệ
             */
            WolPacketCodec(const std::string &wol_pattern, const std::string &mac_pattern);

            /**
             * @brief Tạo magic packet 102 bytes
             * @param hw_address MAC address, phân cách bằng ':' / '-' hoặc không
             * @throws PacketFormatError nếu không phải đúng 12 chữ số hex
             */
            static Packet buildPacket(const std::string &hw_address);

            /**
             * @brief Dạng chuẩn "AA:BB:CC:DD:EE:FF" của một MAC address
             * @return std::nullopt nếu không hợp lệ
             */
            static std::optional<std::string> normalizeHwAddress(const std::string &hw_address);

            /**
             * @brief Kiểm tra buffer có khớp wol pattern không
             */
            bool isWolShaped(const uint8_t *data, size_t length) const;
            bool isWolShaped(const Packet &packet) const { return isWolShaped(packet.data(), packet.size()); }

            /**
             * @brief Trích MAC address từ buffer theo mac pattern
             * @return MAC dạng chuẩn, hoặc std::nullopt nếu không khớp
             */
            std::optional<std::string> extractHwAddress(const uint8_t *data, size_t length) const;
            std::optional<std::string> extractHwAddress(const Packet &packet) const
            {
                return extractHwAddress(packet.data(), packet.size());
            }

            const std::string &getWolPattern() const { return wol_pattern_; }
            const std::string &getMacPattern() const { return mac_pattern_; }

        private:
            std::string wol_pattern_;
            std::string mac_pattern_;
            std::regex wol_regex_;
            std::regex mac_regex_;
        };

    } // namespace Relay
} // namespace WolRelay

#endif // WOL_PACKET_HPP
