// src/core/relay/relay_listener.hpp
#ifndef RELAY_LISTENER_HPP
#define RELAY_LISTENER_HPP

#include <string>
#include <vector>
#include <list>
#include <memory>
#include <atomic>
#include <mutex>
#include <thread>
#include <cstdint>
#include <netinet/in.h>
#include "adapter_discovery.hpp"
#include "request_processor.hpp"

namespace WolRelay
{
    namespace Relay
    {
        enum class Transport
        {
            UDP,
            TCP
        };

        std::string transportToString(Transport transport);

        /**
         * @brief Cấu hình cho một listener
         */
        struct ListenerConfig
        {
            NetworkAdapter adapter;     // Adapter để bind
            uint16_t port;              // 0 = port ngẫu nhiên (dùng trong test)
            int poll_timeout_ms;        // Chu kỳ kiểm tra cờ running
            int read_timeout_ms;        // TCP: thời gian chờ dữ liệu tối đa mỗi kết nối
            size_t buffer_size;         // Kích thước buffer nhận

            ListenerConfig()
                : port(9),
                  poll_timeout_ms(500),
                  read_timeout_ms(5000),
                  buffer_size(65535) {}
        };

        /**
         * @brief Statistics của một listener
         */
        struct ListenerStats
        {
            uint64_t packets_received;    // Buffer nhận được
            uint64_t packets_forwarded;   // Được chuyển cho sender
            uint64_t packets_rejected;    // Bị loại (nguồn lạ, sai định dạng, debounce)
            uint64_t connections;         // TCP: số kết nối đã accept
            uint64_t errors;              // Lỗi socket

            ListenerStats()
                : packets_received(0), packets_forwarded(0), packets_rejected(0),
                  connections(0), errors(0) {}
        };

        /**
         * @class RelayListener
         * @brief Lớp cơ sở cho listener UDP/TCP trên một adapter
         *
         * Mỗi listener chạy trên thread riêng. Mọi thao tác chờ dùng poll()
         * với timeout ngắn để cờ running_ được kiểm tra thường xuyên.
         */
        class RelayListener
        {
        public:
            RelayListener(const ListenerConfig &config, std::shared_ptr<const RequestProcessor> processor);
            virtual ~RelayListener();

            RelayListener(const RelayListener &) = delete;
            RelayListener &operator=(const RelayListener &) = delete;

            /**
             * @brief Tạo socket và bind vào adapter:port
             * @return true nếu thành công
             */
            bool initialize();

            /**
             * @brief Bắt đầu thread lắng nghe
             * @return true nếu thành công
             */
            bool start();

            /**
             * @brief Dừng thread, đóng socket. Gọi nhiều lần không sao
             */
            virtual void stop();

            bool isRunning() const { return running_.load(); }

            ListenerStats getStats() const;

            /**
             * @brief Port thực sự được bind (khác config khi port = 0)
             */
            uint16_t getBoundPort() const { return bound_port_; }

            const NetworkAdapter &getAdapter() const { return config_.adapter; }

            virtual Transport getTransport() const = 0;

            /**
             * @brief Chuỗi mô tả, VD: "UDP 192.168.1.10:9"
             */
            std::string describe() const;

        protected:
            /**
             * @brief Tạo socket đã bind, trả về file descriptor hoặc -1
             */
            virtual int openSocket() = 0;

            /**
             * @brief Vòng lặp chính, chạy đến khi running_ = false
             */
            virtual void listenLoop() = 0;

            /**
             * @brief Chờ fd có dữ liệu
             * @return 1 nếu đọc được, 0 nếu hết timeout hoặc bị EINTR, -1 nếu lỗi
             */
            int waitReadable(int fd, int timeout_ms);

            /**
             * @brief Đưa buffer qua RequestProcessor và cập nhật statistics
             */
            void handleBuffer(const uint8_t *data, size_t length, const std::string &source_address);

            /**
             * @brief Bind socket vào adapter:port và lưu port thực tế
             */
            bool bindSocket(int fd);

            ListenerConfig config_;
            std::shared_ptr<const RequestProcessor> processor_;
            int socket_fd_;
            uint16_t bound_port_;
            std::atomic<bool> running_;

            std::atomic<uint64_t> packets_received_;
            std::atomic<uint64_t> packets_forwarded_;
            std::atomic<uint64_t> packets_rejected_;
            std::atomic<uint64_t> connections_;
            std::atomic<uint64_t> errors_;

        private:
            void closeSocket();

            std::unique_ptr<std::thread> listen_thread_;
        };

        /**
         * @class UdpRelayListener
         * @brief Nhận datagram lần lượt theo thứ tự đến
         */
        class UdpRelayListener : public RelayListener
        {
        public:
            using RelayListener::RelayListener;
            ~UdpRelayListener() override;

            Transport getTransport() const override { return Transport::UDP; }

        protected:
            int openSocket() override;
            void listenLoop() override;
        };

        /**
         * @class TcpRelayListener
         * @brief Accept kết nối; mỗi kết nối được xử lý trên thread riêng
         *        với một lần đọc tối đa 1024 bytes
         */
        class TcpRelayListener : public RelayListener
        {
        public:
            static constexpr size_t TCP_READ_SIZE = 1024;

            using RelayListener::RelayListener;
            ~TcpRelayListener() override;

            Transport getTransport() const override { return Transport::TCP; }

            void stop() override;

            size_t getOpenConnectionCount() const;

        protected:
            int openSocket() override;
            void listenLoop() override;

            /**
             * @brief accept() trên socket lắng nghe
             * @return fd của kết nối hoặc -1 (errno được giữ nguyên)
             */
            virtual int acceptConnection(struct sockaddr_in &source);

            /**
             * @brief Tạo thread xử lý một kết nối, có thể ném std::system_error
             */
            virtual std::thread spawnConnection(int client_fd, const std::string &source_address,
                                                std::shared_ptr<std::atomic<bool>> finished);

        private:
            struct Connection
            {
                std::thread thread;
                std::shared_ptr<std::atomic<bool>> finished;
            };

            void handleConnection(int client_fd, std::string source_address,
                                  std::shared_ptr<std::atomic<bool>> finished);

            /**
             * @brief Join các thread kết nối đã kết thúc
             */
            void reapConnections(bool wait_all);

            mutable std::mutex connections_mutex_;
            std::list<Connection> connection_threads_;
        };

        /**
         * @brief Các transport được bật và port tương ứng
         */
        struct ListenerOptions
        {
            bool udp_enabled;
            uint16_t udp_port;
            bool tcp_enabled;
            uint16_t tcp_port;

            ListenerOptions() : udp_enabled(true), udp_port(9), tcp_enabled(false), tcp_port(9) {}
        };

        /**
         * @class ListenerManager
         * @brief Quản lý tất cả listener: một listener cho mỗi adapter incoming
         *        và mỗi transport được bật
         */
        class ListenerManager
        {
        public:
            explicit ListenerManager(std::shared_ptr<const RequestProcessor> processor);
            ~ListenerManager();

            ListenerManager(const ListenerManager &) = delete;
            ListenerManager &operator=(const ListenerManager &) = delete;

            /**
             * @brief Tạo listener cho adapter theo các transport được bật
             * @return Số listener được thêm
             */
            size_t addAdapter(const NetworkAdapter &adapter, const ListenerOptions &options);

            void addListener(std::unique_ptr<RelayListener> listener);

            /**
             * @brief Khởi tạo và chạy tất cả listener. Listener bind lỗi được
             *        ghi log, các listener khác vẫn chạy
             * @return Số listener đang chạy
             */
            size_t startAll();

            void stopAll();

            size_t getListenerCount() const { return listeners_.size(); }
            size_t getActiveCount() const;

            ListenerStats getTotalStats() const;

            const std::vector<std::unique_ptr<RelayListener>> &getListeners() const { return listeners_; }

        private:
            std::shared_ptr<const RequestProcessor> processor_;
            std::vector<std::unique_ptr<RelayListener>> listeners_;
        };

    } // namespace Relay
} // namespace WolRelay

#endif // RELAY_LISTENER_HPP
