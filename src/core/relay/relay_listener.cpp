// src/core/relay/relay_listener.cpp

#include "relay_listener.hpp"
#include "network_utils.hpp"
#include "utils.hpp"
#include <spdlog/spdlog.h>
#include <sys/socket.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <poll.h>
#include <fcntl.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <chrono>
#include <iterator>
#include <system_error>

namespace WolRelay
{
    namespace Relay
    {
        namespace
        {
            std::string sockaddrToString(const struct sockaddr_in &addr)
            {
                char buf[INET_ADDRSTRLEN];
                if (inet_ntop(AF_INET, &addr.sin_addr, buf, sizeof(buf)) == nullptr)
                {
                    return "";
                }
                return std::string(buf);
            }
        }

        std::string transportToString(Transport transport)
        {
            return transport == Transport::UDP ? "UDP" : "TCP";
        }

        // ==================== RelayListener ====================

        RelayListener::RelayListener(const ListenerConfig &config, std::shared_ptr<const RequestProcessor> processor)
            : config_(config),
              processor_(std::move(processor)),
              socket_fd_(-1),
              bound_port_(0),
              running_(false),
              packets_received_(0),
              packets_forwarded_(0),
              packets_rejected_(0),
              connections_(0),
              errors_(0)
        {
        }

        RelayListener::~RelayListener()
        {
            RelayListener::stop();
        }

        std::string RelayListener::describe() const
        {
            uint16_t port = bound_port_ != 0 ? bound_port_ : config_.port;
            return transportToString(getTransport()) + " " + config_.adapter.address + ":" + std::to_string(port);
        }

        bool RelayListener::initialize()
        {
            if (socket_fd_ >= 0)
            {
                spdlog::warn("Listener {} already initialized", describe());
                return true;
            }

            if (!processor_)
            {
                spdlog::error("Listener {} has no request processor", describe());
                return false;
            }

            socket_fd_ = openSocket();
            if (socket_fd_ < 0)
            {
                spdlog::error("Failed to open {} listener on {}:{}",
                              transportToString(getTransport()), config_.adapter.address, config_.port);
                return false;
            }

            spdlog::info("Listening for WOL packets on {} ({})", describe(), config_.adapter.name);
            return true;
        }

        bool RelayListener::start()
        {
            if (socket_fd_ < 0)
            {
                spdlog::error("Listener not initialized. Call initialize() first");
                return false;
            }

            if (running_.load())
            {
                spdlog::warn("Listener {} already running", describe());
                return false;
            }

            running_.store(true);

            listen_thread_ = std::make_unique<std::thread>([this]() {
                spdlog::debug("Listen loop started for {}", describe());
                try
                {
                    listenLoop();
                }
                catch (const std::exception &e)
                {
                    errors_.fetch_add(1);
                    spdlog::error("Listener {} terminated by exception: {}", describe(), e.what());
                }
                spdlog::debug("Listen loop ended for {}", describe());
            });

            return true;
        }

        void RelayListener::stop()
        {
            bool was_running = running_.exchange(false);

            if (listen_thread_ && listen_thread_->joinable())
            {
                listen_thread_->join();
            }
            listen_thread_.reset();

            closeSocket();

            if (was_running)
            {
                ListenerStats stats = getStats();
                spdlog::info("Listener {} stopped (received {}, forwarded {}, rejected {})",
                             describe(), stats.packets_received, stats.packets_forwarded, stats.packets_rejected);
            }
        }

        void RelayListener::closeSocket()
        {
            if (socket_fd_ >= 0)
            {
                close(socket_fd_);
                socket_fd_ = -1;
            }
        }

        ListenerStats RelayListener::getStats() const
        {
            ListenerStats stats;
            stats.packets_received = packets_received_.load();
            stats.packets_forwarded = packets_forwarded_.load();
            stats.packets_rejected = packets_rejected_.load();
            stats.connections = connections_.load();
            stats.errors = errors_.load();
            return stats;
        }

        bool RelayListener::bindSocket(int fd)
        {
            int reuse = 1;
            if (setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse)) < 0)
            {
                spdlog::warn("Failed to set SO_REUSEADDR: {}", Common::NetworkUtils::errnoToString(errno));
            }

            struct sockaddr_in addr;
            std::memset(&addr, 0, sizeof(addr));
            addr.sin_family = AF_INET;
            addr.sin_port = htons(config_.port);

            if (inet_pton(AF_INET, config_.adapter.address.c_str(), &addr.sin_addr) != 1)
            {
                spdlog::error("Invalid adapter address: {}", config_.adapter.address);
                return false;
            }

            if (bind(fd, reinterpret_cast<struct sockaddr *>(&addr), sizeof(addr)) < 0)
            {
                spdlog::error("Failed to bind {}:{}: {}", config_.adapter.address, config_.port,
                              Common::NetworkUtils::errnoToString(errno));
                return false;
            }

            // Lấy port thực tế (port 0 = kernel chọn)
            struct sockaddr_in bound;
            socklen_t len = sizeof(bound);
            if (getsockname(fd, reinterpret_cast<struct sockaddr *>(&bound), &len) == 0)
            {
                bound_port_ = ntohs(bound.sin_port);
            }
            else
            {
                bound_port_ = config_.port;
            }

            return true;
        }

        int RelayListener::waitReadable(int fd, int timeout_ms)
        {
            struct pollfd pfd;
            pfd.fd = fd;
            pfd.events = POLLIN;
            pfd.revents = 0;

            int result = poll(&pfd, 1, timeout_ms);
            if (result < 0)
            {
                if (errno == EINTR)
                {
                    return 0;
                }
                return -1;
            }

            if (result == 0)
            {
                return 0;
            }

            if (pfd.revents & (POLLERR | POLLNVAL))
            {
                return -1;
            }

            return 1;
        }

        void RelayListener::handleBuffer(const uint8_t *data, size_t length, const std::string &source_address)
        {
            packets_received_.fetch_add(1);

            ProcessOutcome outcome = ProcessOutcome::SEND_ERROR;
            try
            {
                outcome = processor_->process(data, length, source_address, config_.adapter);
            }
            catch (const std::exception &e)
            {
                errors_.fetch_add(1);
                spdlog::error("Exception while processing packet from {} on {}: {}",
                              source_address, describe(), e.what());
            }

            if (outcome == ProcessOutcome::FORWARDED)
            {
                packets_forwarded_.fetch_add(1);
            }
            else
            {
                packets_rejected_.fetch_add(1);
                spdlog::debug("Packet from {} on {}: {}", source_address, describe(), outcomeToString(outcome));
            }
        }

        // ==================== UdpRelayListener ====================

        UdpRelayListener::~UdpRelayListener()
        {
            stop();
        }

        int UdpRelayListener::openSocket()
        {
            int fd = socket(AF_INET, SOCK_DGRAM, 0);
            if (fd < 0)
            {
                spdlog::error("Failed to create UDP socket: {}", Common::NetworkUtils::errnoToString(errno));
                return -1;
            }

            if (!bindSocket(fd))
            {
                close(fd);
                return -1;
            }

            return fd;
        }

        void UdpRelayListener::listenLoop()
        {
            std::vector<uint8_t> buffer(config_.buffer_size);

            while (running_.load())
            {
                int ready = waitReadable(socket_fd_, config_.poll_timeout_ms);
                if (ready == 0)
                {
                    continue;
                }
                if (ready < 0)
                {
                    errors_.fetch_add(1);
                    spdlog::error("poll failed on {}: {}", describe(), Common::NetworkUtils::errnoToString(errno));
                    std::this_thread::sleep_for(std::chrono::milliseconds(config_.poll_timeout_ms));
                    continue;
                }

                struct sockaddr_in source;
                socklen_t source_len = sizeof(source);
                ssize_t received = recvfrom(socket_fd_, buffer.data(), buffer.size(), 0,
                                            reinterpret_cast<struct sockaddr *>(&source), &source_len);
                if (received < 0)
                {
                    if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK)
                    {
                        continue;
                    }
                    errors_.fetch_add(1);
                    spdlog::error("recvfrom failed on {}: {}", describe(), Common::NetworkUtils::errnoToString(errno));
                    continue;
                }

                handleBuffer(buffer.data(), static_cast<size_t>(received), sockaddrToString(source));
            }
        }

        // ==================== TcpRelayListener ====================

        TcpRelayListener::~TcpRelayListener()
        {
            stop();
        }

        void TcpRelayListener::stop()
        {
            RelayListener::stop();
            reapConnections(true);
        }

        size_t TcpRelayListener::getOpenConnectionCount() const
        {
            std::lock_guard<std::mutex> lock(connections_mutex_);
            size_t open = 0;
            for (const auto &connection : connection_threads_)
            {
                if (!connection.finished->load())
                {
                    open++;
                }
            }
            return open;
        }

        int TcpRelayListener::openSocket()
        {
            int fd = socket(AF_INET, SOCK_STREAM, 0);
            if (fd < 0)
            {
                spdlog::error("Failed to create TCP socket: {}", Common::NetworkUtils::errnoToString(errno));
                return -1;
            }

            if (!bindSocket(fd))
            {
                close(fd);
                return -1;
            }

            if (listen(fd, SOMAXCONN) < 0)
            {
                spdlog::error("listen failed on {}:{}: {}", config_.adapter.address, config_.port,
                              Common::NetworkUtils::errnoToString(errno));
                close(fd);
                return -1;
            }

            // accept() không được block sau khi poll() báo sẵn sàng
            int flags = fcntl(fd, F_GETFL, 0);
            if (flags < 0 || fcntl(fd, F_SETFL, flags | O_NONBLOCK) < 0)
            {
                spdlog::warn("Failed to set O_NONBLOCK on TCP listener: {}",
                             Common::NetworkUtils::errnoToString(errno));
            }

            return fd;
        }

        void TcpRelayListener::listenLoop()
        {
            while (running_.load())
            {
                reapConnections(false);

                int ready = waitReadable(socket_fd_, config_.poll_timeout_ms);
                if (ready == 0)
                {
                    continue;
                }
                if (ready < 0)
                {
                    errors_.fetch_add(1);
                    spdlog::error("poll failed on {}: {}", describe(), Common::NetworkUtils::errnoToString(errno));
                    std::this_thread::sleep_for(std::chrono::milliseconds(config_.poll_timeout_ms));
                    continue;
                }

                struct sockaddr_in source;
                int client_fd = acceptConnection(source);
                if (client_fd < 0)
                {
                    int err = errno;
                    if (!running_.load())
                    {
                        break;
                    }
                    if (err == EINTR || err == EAGAIN || err == EWOULDBLOCK)
                    {
                        continue;
                    }
                    if (err == ECONNABORTED)
                    {
                        spdlog::debug("Connection aborted before accept on {}", describe());
                        continue;
                    }
                    // EMFILE/ENFILE/ENOBUFS: socket vẫn readable, chờ trước khi thử lại
                    errors_.fetch_add(1);
                    spdlog::error("accept failed on {}: {}", describe(), Common::NetworkUtils::errnoToString(err));
                    std::this_thread::sleep_for(std::chrono::milliseconds(config_.poll_timeout_ms));
                    continue;
                }

                connections_.fetch_add(1);

                auto finished = std::make_shared<std::atomic<bool>>(false);
                std::string source_address = sockaddrToString(source);

                // client_fd thuộc về listener cho đến khi thread nhận nó
                Common::ScopeGuard fd_guard([client_fd]() { close(client_fd); });

                try
                {
                    std::thread worker = spawnConnection(client_fd, source_address, finished);
                    fd_guard.dismiss();

                    std::lock_guard<std::mutex> lock(connections_mutex_);
                    connection_threads_.push_back(Connection{std::move(worker), finished});
                }
                catch (const std::system_error &e)
                {
                    errors_.fetch_add(1);
                    spdlog::error("Cannot start thread for TCP connection from {} on {}: {}",
                                  source_address, describe(), e.what());
                }
            }
        }

        int TcpRelayListener::acceptConnection(struct sockaddr_in &source)
        {
            socklen_t source_len = sizeof(source);
            return accept(socket_fd_, reinterpret_cast<struct sockaddr *>(&source), &source_len);
        }

        std::thread TcpRelayListener::spawnConnection(int client_fd, const std::string &source_address,
                                                      std::shared_ptr<std::atomic<bool>> finished)
        {
            return std::thread(&TcpRelayListener::handleConnection, this, client_fd, source_address, std::move(finished));
        }

        void TcpRelayListener::handleConnection(int client_fd, std::string source_address,
                                                std::shared_ptr<std::atomic<bool>> finished)
        {
            Common::ScopeGuard guard([client_fd, finished]() {
                close(client_fd);
                finished->store(true);
            });

            spdlog::debug("Accepted TCP connection from {} on {}", source_address, describe());

            auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(config_.read_timeout_ms);

            // Chờ dữ liệu cho đến khi có, hết hạn hoặc listener dừng
            while (true)
            {
                if (!running_.load())
                {
                    return;
                }

                if (std::chrono::steady_clock::now() >= deadline)
                {
                    spdlog::debug("TCP connection from {} timed out without data", source_address);
                    return;
                }

                int ready = waitReadable(client_fd, config_.poll_timeout_ms);
                if (ready > 0)
                {
                    break;
                }
                if (ready < 0)
                {
                    errors_.fetch_add(1);
                    spdlog::error("poll failed on TCP connection from {}: {}", source_address,
                                  Common::NetworkUtils::errnoToString(errno));
                    return;
                }
            }

            uint8_t buffer[TCP_READ_SIZE];
            ssize_t received = recv(client_fd, buffer, sizeof(buffer), 0);
            if (received < 0)
            {
                errors_.fetch_add(1);
                spdlog::error("recv failed on TCP connection from {}: {}", source_address,
                              Common::NetworkUtils::errnoToString(errno));
                return;
            }

            if (received == 0)
            {
                spdlog::debug("TCP connection from {} closed without data", source_address);
                return;
            }

            handleBuffer(buffer, static_cast<size_t>(received), source_address);
        }

        void TcpRelayListener::reapConnections(bool wait_all)
        {
            std::list<Connection> to_join;
            {
                std::lock_guard<std::mutex> lock(connections_mutex_);
                for (auto it = connection_threads_.begin(); it != connection_threads_.end();)
                {
                    if (wait_all || it->finished->load())
                    {
                        auto next = std::next(it);
                        to_join.splice(to_join.end(), connection_threads_, it);
                        it = next;
                    }
                    else
                    {
                        ++it;
                    }
                }
            }

            for (auto &connection : to_join)
            {
                if (connection.thread.joinable())
                {
                    connection.thread.join();
                }
            }
        }

        // ==================== ListenerManager ====================

        ListenerManager::ListenerManager(std::shared_ptr<const RequestProcessor> processor)
            : processor_(std::move(processor))
        {
        }

        ListenerManager::~ListenerManager()
        {
            stopAll();
        }

        size_t ListenerManager::addAdapter(const NetworkAdapter &adapter, const ListenerOptions &options)
        {
            size_t added = 0;

            if (options.udp_enabled)
            {
                ListenerConfig config;
                config.adapter = adapter;
                config.port = options.udp_port;
                addListener(std::make_unique<UdpRelayListener>(config, processor_));
                added++;
            }

            if (options.tcp_enabled)
            {
                ListenerConfig config;
                config.adapter = adapter;
                config.port = options.tcp_port;
                addListener(std::make_unique<TcpRelayListener>(config, processor_));
                added++;
            }

            return added;
        }

        void ListenerManager::addListener(std::unique_ptr<RelayListener> listener)
        {
            if (listener)
            {
                listeners_.push_back(std::move(listener));
            }
        }

        size_t ListenerManager::startAll()
        {
            size_t started = 0;

            for (auto &listener : listeners_)
            {
                if (!listener->initialize())
                {
                    spdlog::error("Listener {} failed to bind, skipping", listener->describe());
                    continue;
                }

                if (listener->start())
                {
                    started++;
                }
            }

            spdlog::info("Started {} of {} listeners", started, listeners_.size());
            return started;
        }

        void ListenerManager::stopAll()
        {
            for (auto &listener : listeners_)
            {
                listener->stop();
            }
        }

        size_t ListenerManager::getActiveCount() const
        {
            size_t count = 0;
            for (const auto &listener : listeners_)
            {
                if (listener->isRunning())
                {
                    count++;
                }
            }
            return count;
        }

        ListenerStats ListenerManager::getTotalStats() const
        {
            ListenerStats total;

            for (const auto &listener : listeners_)
            {
                ListenerStats stats = listener->getStats();
                total.packets_received += stats.packets_received;
                total.packets_forwarded += stats.packets_forwarded;
                total.packets_rejected += stats.packets_rejected;
                total.connections += stats.connections;
                total.errors += stats.errors;
            }

            return total;
        }

    } // namespace Relay
} // namespace WolRelay
