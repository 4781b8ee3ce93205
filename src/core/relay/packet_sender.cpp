// src/core/relay/packet_sender.cpp

#include "packet_sender.hpp"
#include "network_utils.hpp"
#include "utils.hpp"
#include <spdlog/spdlog.h>
#include <sys/socket.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>

namespace WolRelay
{
    namespace Relay
    {
        namespace
        {
            constexpr auto DRAIN_WAIT_TIMEOUT = std::chrono::milliseconds(100);
        }

        // ==================== PacketSender ====================

        bool PacketSender::forward(const std::string &hw_address, const AdapterList &adapters)
        {
            Packet packet = WolPacketCodec::buildPacket(hw_address);
            auto canonical = WolPacketCodec::normalizeHwAddress(hw_address);
            return forward(packet, canonical.value_or(hw_address), adapters);
        }

        // ==================== DirectPacketSender ====================

        DirectPacketSender::DirectPacketSender(uint16_t outgoing_port, int repeat_send)
            : outgoing_port_(outgoing_port),
              repeat_send_(repeat_send),
              datagrams_sent_(0),
              send_errors_(0)
        {
            if (repeat_send_ < 1)
            {
                spdlog::warn("Invalid repeat count {}, using 1", repeat_send_);
                repeat_send_ = 1;
            }
        }

        bool DirectPacketSender::forward(const Packet &packet, const std::string &hw_address,
                                         const AdapterList &adapters)
        {
            if (adapters.empty())
            {
                spdlog::warn("No outgoing adapters for {}, packet not sent", hw_address);
                return true;
            }

            spdlog::info("Forwarding WOL packet for {} to {} adapter(s)", hw_address, adapters.size());

            return broadcast(packet, adapters) == adapters.size();
        }

        size_t DirectPacketSender::broadcast(const Packet &packet, const AdapterList &adapters)
        {
            size_t success_count = 0;

            for (const auto &adapter : adapters)
            {
                if (sendToAdapter(packet, adapter))
                {
                    success_count++;
                }
            }

            return success_count;
        }

        bool DirectPacketSender::sendToAdapter(const Packet &packet, const NetworkAdapter &adapter)
        {
            spdlog::debug("Sending WOL packet to broadcast address {}:{} ({})",
                          adapter.broadcast, outgoing_port_, adapter.name);

            bool all_sent = true;
            for (int i = 0; i < repeat_send_; ++i)
            {
                if (sendDatagram(packet, adapter.broadcast, outgoing_port_))
                {
                    datagrams_sent_.fetch_add(1);
                }
                else
                {
                    send_errors_.fetch_add(1);
                    all_sent = false;
                }
            }

            if (!all_sent)
            {
                spdlog::error("Failed to send WOL packet to {} on adapter {}",
                              adapter.broadcast, adapter.address);
            }

            return all_sent;
        }

        bool DirectPacketSender::sendDatagram(const Packet &packet, const std::string &broadcast_address,
                                              uint16_t port)
        {
            struct sockaddr_in dest;
            std::memset(&dest, 0, sizeof(dest));
            dest.sin_family = AF_INET;
            dest.sin_port = htons(port);

            if (inet_pton(AF_INET, broadcast_address.c_str(), &dest.sin_addr) != 1)
            {
                spdlog::error("Invalid broadcast address: {}", broadcast_address);
                return false;
            }

            int sock = socket(AF_INET, SOCK_DGRAM, 0);
            if (sock < 0)
            {
                spdlog::error("Failed to create UDP socket: {}", Common::NetworkUtils::errnoToString(errno));
                return false;
            }
            Common::ScopeGuard close_guard([sock]() { close(sock); });

            int enable = 1;
            if (setsockopt(sock, SOL_SOCKET, SO_BROADCAST, &enable, sizeof(enable)) < 0)
            {
                spdlog::error("Failed to set SO_BROADCAST: {}", Common::NetworkUtils::errnoToString(errno));
                return false;
            }

            ssize_t sent = sendto(sock, packet.data(), packet.size(), 0,
                                  reinterpret_cast<struct sockaddr *>(&dest), sizeof(dest));
            if (sent < 0)
            {
                spdlog::error("sendto {}:{} failed: {}", broadcast_address, port,
                              Common::NetworkUtils::errnoToString(errno));
                return false;
            }

            if (static_cast<size_t>(sent) != packet.size())
            {
                spdlog::error("Partial send to {}:{} ({} of {} bytes)",
                              broadcast_address, port, sent, packet.size());
                return false;
            }

            return true;
        }

        SenderStats DirectPacketSender::getStats() const
        {
            SenderStats stats;
            stats.datagrams_sent = datagrams_sent_.load();
            stats.send_errors = send_errors_.load();
            return stats;
        }

        // ==================== DebouncedPacketSender ====================

        DebouncedPacketSender::DebouncedPacketSender(std::shared_ptr<PacketSender> inner,
                                                     std::chrono::milliseconds window,
                                                     std::chrono::milliseconds expiration,
                                                     std::chrono::milliseconds cleanup_interval,
                                                     ClockFunction clock)
            : inner_(std::move(inner)),
              gate_(window, expiration, std::move(clock)),
              cleanup_interval_(cleanup_interval),
              running_(false),
              requests_accepted_(0),
              requests_debounced_(0),
              requests_dropped_(0)
        {
        }

        DebouncedPacketSender::~DebouncedPacketSender()
        {
            stop();
        }

        bool DebouncedPacketSender::forward(const Packet &packet, const std::string &hw_address,
                                            const AdapterList &adapters)
        {
            if (!gate_.tryAccept(hw_address))
            {
                requests_debounced_.fetch_add(1);
                spdlog::info("Debounced WOL packet for {}", hw_address);
                return false;
            }

            {
                std::lock_guard<std::mutex> lock(queue_mutex_);
                queue_.push(RelayRequest{packet, hw_address, adapters});
            }
            queue_cv_.notify_one();

            requests_accepted_.fetch_add(1);
            spdlog::debug("Queued WOL packet for {}", hw_address);
            return true;
        }

        bool DebouncedPacketSender::start()
        {
            if (running_.load())
            {
                spdlog::warn("DebouncedPacketSender already running");
                return false;
            }

            if (!inner_)
            {
                spdlog::error("DebouncedPacketSender has no inner sender");
                return false;
            }

            if (!inner_->start())
            {
                return false;
            }

            running_.store(true);

            drain_thread_ = std::make_unique<std::thread>(&DebouncedPacketSender::drainLoop, this);
            sweep_thread_ = std::make_unique<std::thread>(&DebouncedPacketSender::sweepLoop, this);

            spdlog::info("Debounced sender started (window {} ms, expiration {} ms, cleanup every {} ms)",
                         gate_.getWindow().count(), gate_.getExpiration().count(),
                         cleanup_interval_.count());
            return true;
        }

        void DebouncedPacketSender::stop()
        {
            if (!running_.exchange(false))
            {
                return;
            }

            spdlog::info("Stopping debounced sender...");

            // Đánh thức cả hai thread
            {
                std::lock_guard<std::mutex> lock(queue_mutex_);
            }
            queue_cv_.notify_all();
            {
                std::lock_guard<std::mutex> lock(sweep_mutex_);
            }
            sweep_cv_.notify_all();

            if (drain_thread_ && drain_thread_->joinable())
            {
                drain_thread_->join();
            }
            if (sweep_thread_ && sweep_thread_->joinable())
            {
                sweep_thread_->join();
            }
            drain_thread_.reset();
            sweep_thread_.reset();

            size_t dropped = 0;
            {
                std::lock_guard<std::mutex> lock(queue_mutex_);
                dropped = queue_.size();
                std::queue<RelayRequest>().swap(queue_);
            }
            requests_dropped_.fetch_add(dropped);

            if (dropped > 0)
            {
                spdlog::warn("Dropped {} pending WOL request(s) on shutdown", dropped);
            }

            inner_->stop();
            spdlog::info("Debounced sender stopped");
        }

        void DebouncedPacketSender::drainLoop()
        {
            spdlog::debug("Drain loop started");

            while (running_.load())
            {
                RelayRequest request;
                {
                    std::unique_lock<std::mutex> lock(queue_mutex_);
                    if (!queue_cv_.wait_for(lock, DRAIN_WAIT_TIMEOUT,
                                            [this]() { return !queue_.empty() || !running_.load(); }))
                    {
                        continue;
                    }

                    if (!running_.load())
                    {
                        break;
                    }

                    request = std::move(queue_.front());
                    queue_.pop();
                }

                try
                {
                    if (!inner_->forward(request.packet, request.hw_address, request.adapters))
                    {
                        spdlog::warn("WOL packet for {} was not sent on every adapter", request.hw_address);
                    }
                }
                catch (const std::exception &e)
                {
                    spdlog::error("Exception while sending WOL packet for {}: {}", request.hw_address, e.what());
                }
            }

            spdlog::debug("Drain loop ended");
        }

        void DebouncedPacketSender::sweepLoop()
        {
            spdlog::debug("Sweep loop started");

            std::unique_lock<std::mutex> lock(sweep_mutex_);
            while (running_.load())
            {
                if (sweep_cv_.wait_for(lock, cleanup_interval_, [this]() { return !running_.load(); }))
                {
                    break;
                }

                size_t removed = gate_.sweep();
                if (removed > 0)
                {
                    spdlog::debug("Debounce sweep removed {} entries", removed);
                }
            }

            spdlog::debug("Sweep loop ended");
        }

        SenderStats DebouncedPacketSender::getStats() const
        {
            SenderStats stats = inner_ ? inner_->getStats() : SenderStats();
            stats.requests_accepted = requests_accepted_.load();
            stats.requests_debounced = requests_debounced_.load();
            stats.requests_dropped = requests_dropped_.load();
            return stats;
        }

        size_t DebouncedPacketSender::getPendingCount() const
        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            return queue_.size();
        }

    } // namespace Relay
} // namespace WolRelay
