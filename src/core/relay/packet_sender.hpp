// src/core/relay/packet_sender.hpp
#ifndef PACKET_SENDER_HPP
#define PACKET_SENDER_HPP

#include <string>
#include <memory>
#include <atomic>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <queue>
#include <chrono>
#include "wol_packet.hpp"
#include "adapter_discovery.hpp"
#include "debounce_gate.hpp"

namespace WolRelay
{
    namespace Relay
    {
        /**
         * @brief Một yêu cầu relay đã được kiểm tra, chờ drain thread gửi đi
         */
        struct RelayRequest
        {
            Packet packet;            // Magic packet sẽ gửi
            std::string hw_address;   // "AA:BB:CC:DD:EE:FF"
            AdapterList adapters;     // Các adapter outgoing đã chọn
        };

        /**
         * @brief Thống kê của sender
         */
        struct SenderStats
        {
            uint64_t requests_accepted;    // Yêu cầu được chấp nhận
            uint64_t requests_debounced;   // Bị chặn bởi debounce gate
            uint64_t requests_dropped;     // Bị bỏ khi shutdown
            uint64_t datagrams_sent;       // Số datagram gửi thành công
            uint64_t send_errors;          // Số lần gửi lỗi

            SenderStats()
                : requests_accepted(0), requests_debounced(0), requests_dropped(0),
                  datagrams_sent(0), send_errors(0) {}
        };

        /**
         * @class PacketSender
         * @brief Interface chung cho việc phát magic packet ra các adapter
         */
        class PacketSender
        {
        public:
            virtual ~PacketSender() = default;

            /**
             * @brief Phát packet ra các adapter
             * @param packet Packet cần gửi
             * @param hw_address MAC đích (dạng chuẩn)
             * @param adapters Adapter outgoing
             * @return true nếu yêu cầu được gửi/đưa vào hàng đợi,
             *         false nếu bị từ chối hoặc có adapter gửi lỗi
             */
            virtual bool forward(const Packet &packet, const std::string &hw_address,
                                 const AdapterList &adapters) = 0;

            /**
             * @brief Tạo magic packet từ MAC rồi gọi forward(packet, ...)
             * @throws PacketFormatError nếu MAC không hợp lệ
             */
            bool forward(const std::string &hw_address, const AdapterList &adapters);

            /**
             * @brief Khởi động các thread nền (nếu có)
             */
            virtual bool start() { return true; }

            /**
             * @brief Dừng các thread nền. Gọi nhiều lần không sao
             */
            virtual void stop() {}

            virtual SenderStats getStats() const = 0;
        };

        /**
         * @class DirectPacketSender
         * @brief Gửi ngay (inline) tới broadcast address của từng adapter
         */
        class DirectPacketSender : public PacketSender
        {
        public:
            DirectPacketSender(uint16_t outgoing_port, int repeat_send);

            using PacketSender::forward;

            bool forward(const Packet &packet, const std::string &hw_address,
                         const AdapterList &adapters) override;

            /**
             * @brief Gửi packet tới tất cả adapter, lỗi ở một adapter không
             *        ảnh hưởng các adapter còn lại
             * @return Số adapter nhận đủ repeat_send lần gửi
             */
            size_t broadcast(const Packet &packet, const AdapterList &adapters);

            SenderStats getStats() const override;

            uint16_t getOutgoingPort() const { return outgoing_port_; }
            int getRepeatSend() const { return repeat_send_; }

        protected:
            /**
             * @brief Gửi một datagram UDP broadcast
             * @return true nếu gửi thành công
             */
            virtual bool sendDatagram(const Packet &packet, const std::string &broadcast_address,
                                      uint16_t port);

        private:
            bool sendToAdapter(const Packet &packet, const NetworkAdapter &adapter);

            uint16_t outgoing_port_;
            int repeat_send_;

            std::atomic<uint64_t> datagrams_sent_;
            std::atomic<uint64_t> send_errors_;
        };

        /**
         * @class DebouncedPacketSender
         * @brief Decorator: lọc qua DebounceGate rồi đưa vào hàng đợi,
         *        một drain thread gửi lần lượt qua sender bên trong
         *
         * Một sweep thread gọi gate.sweep() theo chu kỳ cleanup_interval.
         * Các yêu cầu còn trong hàng đợi khi stop() bị bỏ.
         */
        class DebouncedPacketSender : public PacketSender
        {
        public:
            DebouncedPacketSender(std::shared_ptr<PacketSender> inner,
                                  std::chrono::milliseconds window,
                                  std::chrono::milliseconds expiration,
                                  std::chrono::milliseconds cleanup_interval,
                                  ClockFunction clock = nullptr);

            ~DebouncedPacketSender() override;

            DebouncedPacketSender(const DebouncedPacketSender &) = delete;
            DebouncedPacketSender &operator=(const DebouncedPacketSender &) = delete;

            using PacketSender::forward;

            bool forward(const Packet &packet, const std::string &hw_address,
                         const AdapterList &adapters) override;

            bool start() override;
            void stop() override;

            bool isRunning() const { return running_.load(); }

            SenderStats getStats() const override;

            size_t getPendingCount() const;

            DebounceGate &getGate() { return gate_; }

        private:
            void drainLoop();
            void sweepLoop();

            std::shared_ptr<PacketSender> inner_;
            DebounceGate gate_;
            std::chrono::milliseconds cleanup_interval_;

            mutable std::mutex queue_mutex_;
            std::condition_variable queue_cv_;
            std::queue<RelayRequest> queue_;

            std::mutex sweep_mutex_;
            std::condition_variable sweep_cv_;

            std::atomic<bool> running_;
            std::unique_ptr<std::thread> drain_thread_;
            std::unique_ptr<std::thread> sweep_thread_;

            std::atomic<uint64_t> requests_accepted_;
            std::atomic<uint64_t> requests_debounced_;
            std::atomic<uint64_t> requests_dropped_;
        };

    } // namespace Relay
} // namespace WolRelay

#endif // PACKET_SENDER_HPP
