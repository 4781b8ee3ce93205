// src/core/relay/relay_service.hpp
#ifndef RELAY_SERVICE_HPP
#define RELAY_SERVICE_HPP

#include <string>
#include <vector>
#include <memory>
#include <atomic>
#include <ostream>
#include "relay_settings.hpp"
#include "adapter_discovery.hpp"
#include "wol_packet.hpp"
#include "packet_sender.hpp"
#include "request_processor.hpp"
#include "relay_listener.hpp"

namespace WolRelay
{
    namespace Relay
    {
        /**
         * @brief Tổng hợp statistics của service
         */
        struct RelayStats
        {
            ListenerStats listeners;
            SenderStats sender;
            size_t active_listeners;
            uint64_t uptime_ms;

            RelayStats() : active_listeners(0), uptime_ms(0) {}
        };

        /**
         * @class RelayService
         * @brief Ghép các thành phần: discovery -> codec -> sender -> processor -> listeners
         */
        class RelayService
        {
        public:
            explicit RelayService(const RelaySettings &settings);
            ~RelayService();

            RelayService(const RelayService &) = delete;
            RelayService &operator=(const RelayService &) = delete;

            /**
             * @brief Tạo codec, tìm adapter của hệ điều hành và dựng sender
             * @return false nếu pattern sai hoặc không có adapter nào
             */
            bool initialize();

            /**
             * @brief Như initialize() nhưng dùng danh sách interface cho trước
             */
            bool initialize(const std::vector<Common::InterfaceAddress> &records);

            /**
             * @brief Chỉ chạy adapter discovery (dùng cho --list-interfaces và --send)
             */
            bool discoverAdapters();

            /**
             * @brief Chạy sender rồi các listener
             * @return false nếu không listener nào bind được
             */
            bool start();

            /**
             * @brief Dừng listener rồi sender. Gọi nhiều lần không sao
             */
            void stop();

            bool isRunning() const { return running_.load(); }

            RelayStats getStats() const;
            void logStats() const;

            /**
             * @brief In bảng adapter (dùng cho --list-interfaces)
             */
            void printAdapters(std::ostream &out) const;

            /**
             * @brief Gửi một magic packet ngay tới tất cả adapter outgoing (--send)
             * @return true nếu mọi adapter đều gửi thành công
             */
            bool sendOnce(const std::string &hw_address);

            const AdapterDiscovery &getDiscovery() const { return discovery_; }
            const RelaySettings &getSettings() const { return settings_; }
            const ListenerManager *getListenerManager() const { return listeners_.get(); }

        private:
            bool buildPipeline();
            void logAdapters() const;

            RelaySettings settings_;
            AdapterDiscovery discovery_;
            std::shared_ptr<const WolPacketCodec> codec_;
            std::shared_ptr<PacketSender> sender_;
            std::shared_ptr<RequestProcessor> processor_;
            std::unique_ptr<ListenerManager> listeners_;

            std::atomic<bool> initialized_;
            std::atomic<bool> running_;
            uint64_t start_time_ms_;
        };

    } // namespace Relay
} // namespace WolRelay

#endif // RELAY_SERVICE_HPP
