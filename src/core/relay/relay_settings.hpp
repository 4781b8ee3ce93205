// src/core/relay/relay_settings.hpp
#ifndef RELAY_SETTINGS_HPP
#define RELAY_SETTINGS_HPP

#include <string>
#include <vector>
#include <chrono>
#include <cstdint>
#include "config_manager.hpp"
#include "adapter_discovery.hpp"

namespace WolRelay
{
    namespace Relay
    {
        /**
         * @brief Snapshot cấu hình của relay, tạo một lần lúc khởi động
         *
         * Các allow-list được chuyển thành set và không đổi sau đó.
         */
        struct RelaySettings
        {
            // Relay
            int outgoing_port;
            int repeat_send;
            bool send_back_to_adapter;

            // Listener
            bool udp_enabled;
            int udp_port;
            bool tcp_enabled;
            int tcp_port;

            // Packet
            std::string wol_pattern;
            std::string mac_pattern;

            // Debounce
            bool debounce_enabled;
            std::chrono::milliseconds debounce_window;
            std::chrono::milliseconds debounce_expiration;
            std::chrono::milliseconds cleanup_interval;

            // Adapters
            std::string primary_adapter;
            bool primary_only;
            AddressSet incoming_adapters;
            AddressSet outgoing_adapters;

            // Security
            AddressSet trusted_sources;

            RelaySettings();

            /**
             * @brief Đọc các giá trị từ ConfigManager
             */
            static RelaySettings fromConfig(const Common::ConfigManager &config);

            /**
             * @brief Kiểm tra tính hợp lệ
             * @param errors Danh sách lỗi (được thêm vào)
             * @return true nếu không có lỗi
             */
            bool validate(std::vector<std::string> &errors) const;

            /**
             * @brief Cảnh báo không gây lỗi (VD: expiration < window)
             */
            std::vector<std::string> warnings() const;

            DiscoveryOptions toDiscoveryOptions() const;

            /**
             * @brief Ghi cấu hình hiện tại ra log
             */
            void log() const;
        };

    } // namespace Relay
} // namespace WolRelay

#endif // RELAY_SETTINGS_HPP
