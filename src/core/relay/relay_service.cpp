// src/core/relay/relay_service.cpp

#include "relay_service.hpp"
#include "utils.hpp"
#include <spdlog/spdlog.h>
#include <iomanip>
#include <regex>

namespace WolRelay
{
    namespace Relay
    {
        RelayService::RelayService(const RelaySettings &settings)
            : settings_(settings),
              discovery_(settings.toDiscoveryOptions()),
              initialized_(false),
              running_(false),
              start_time_ms_(0)
        {
        }

        RelayService::~RelayService()
        {
            stop();
        }

        bool RelayService::initialize()
        {
            if (initialized_.load())
            {
                spdlog::warn("RelayService already initialized");
                return true;
            }

            if (!discoverAdapters())
            {
                return false;
            }

            return buildPipeline();
        }

        bool RelayService::discoverAdapters()
        {
            return discovery_.discover();
        }

        bool RelayService::initialize(const std::vector<Common::InterfaceAddress> &records)
        {
            if (initialized_.load())
            {
                spdlog::warn("RelayService already initialized");
                return true;
            }

            discovery_.discover(records);
            return buildPipeline();
        }

        bool RelayService::buildPipeline()
        {
            // 1. Codec (pattern sai = lỗi khởi động)
            try
            {
                codec_ = std::make_shared<WolPacketCodec>(settings_.wol_pattern, settings_.mac_pattern);
            }
            catch (const std::regex_error &e)
            {
                spdlog::error("Invalid packet pattern: {}", e.what());
                return false;
            }

            // 2. Adapter
            if (discovery_.getAdapters().empty())
            {
                spdlog::error("No usable network adapters found");
                return false;
            }
            logAdapters();

            if (discovery_.getIncomingAdapters().empty())
            {
                spdlog::error("No incoming adapters match the configuration");
                return false;
            }
            if (discovery_.getOutgoingAdapters().empty())
            {
                spdlog::warn("No outgoing adapters match the configuration, packets will not be forwarded");
            }

            // 3. Sender: direct, bọc trong debounced nếu bật
            auto direct = std::make_shared<DirectPacketSender>(
                static_cast<uint16_t>(settings_.outgoing_port), settings_.repeat_send);

            if (settings_.debounce_enabled)
            {
                sender_ = std::make_shared<DebouncedPacketSender>(
                    direct, settings_.debounce_window, settings_.debounce_expiration, settings_.cleanup_interval);
            }
            else
            {
                sender_ = direct;
            }

            // 4. Processor và listeners
            processor_ = std::make_shared<RequestProcessor>(
                codec_, sender_, discovery_.getOutgoingAdapters(),
                settings_.trusted_sources, settings_.send_back_to_adapter);

            listeners_ = std::make_unique<ListenerManager>(processor_);

            ListenerOptions options;
            options.udp_enabled = settings_.udp_enabled;
            options.udp_port = static_cast<uint16_t>(settings_.udp_port);
            options.tcp_enabled = settings_.tcp_enabled;
            options.tcp_port = static_cast<uint16_t>(settings_.tcp_port);

            for (const auto &adapter : discovery_.getIncomingAdapters())
            {
                listeners_->addAdapter(adapter, options);
            }

            initialized_.store(true);
            spdlog::info("RelayService initialized with {} listener(s)", listeners_->getListenerCount());
            return true;
        }

        bool RelayService::start()
        {
            if (!initialized_.load())
            {
                spdlog::error("RelayService not initialized. Call initialize() first");
                return false;
            }

            if (running_.load())
            {
                spdlog::warn("RelayService already running");
                return false;
            }

            if (!sender_->start())
            {
                spdlog::error("Failed to start packet sender");
                return false;
            }

            size_t started = listeners_->startAll();
            if (started == 0)
            {
                spdlog::error("No listener could be started");
                listeners_->stopAll();
                sender_->stop();
                return false;
            }

            start_time_ms_ = Common::Utils::getCurrentTimestampMs();
            running_.store(true);

            spdlog::info("========================================");
            spdlog::info("WOL relay STARTED");
            spdlog::info("Listeners: {}", started);
            spdlog::info("Start time: {}", Common::Utils::formatTimestamp(start_time_ms_));
            spdlog::info("========================================");

            return true;
        }

        void RelayService::stop()
        {
            if (!running_.exchange(false))
            {
                return;
            }

            spdlog::info("Stopping WOL relay...");

            if (listeners_)
            {
                listeners_->stopAll();
            }
            if (sender_)
            {
                sender_->stop();
            }

            spdlog::info("WOL relay stopped after {}",
                         Common::Utils::formatDuration(Common::Utils::getCurrentTimestampMs() - start_time_ms_));
        }

        RelayStats RelayService::getStats() const
        {
            RelayStats stats;

            if (listeners_)
            {
                stats.listeners = listeners_->getTotalStats();
                stats.active_listeners = listeners_->getActiveCount();
            }
            if (sender_)
            {
                stats.sender = sender_->getStats();
            }
            if (start_time_ms_ > 0)
            {
                stats.uptime_ms = Common::Utils::getCurrentTimestampMs() - start_time_ms_;
            }

            return stats;
        }

        void RelayService::logStats() const
        {
            RelayStats stats = getStats();

            spdlog::info("========================================");
            spdlog::info("Statistics:");
            spdlog::info("  - Uptime: {}", Common::Utils::formatDuration(stats.uptime_ms));
            spdlog::info("  - Active listeners: {}", stats.active_listeners);
            spdlog::info("  - Packets received: {}", stats.listeners.packets_received);
            spdlog::info("  - Packets forwarded: {}", stats.listeners.packets_forwarded);
            spdlog::info("  - Packets rejected: {}", stats.listeners.packets_rejected);
            spdlog::info("  - TCP connections: {}", stats.listeners.connections);
            spdlog::info("  - Debounced: {}", stats.sender.requests_debounced);
            spdlog::info("  - Dropped on shutdown: {}", stats.sender.requests_dropped);
            spdlog::info("  - Datagrams sent: {}", stats.sender.datagrams_sent);
            spdlog::info("  - Send errors: {}", stats.sender.send_errors);
            spdlog::info("========================================");
        }

        void RelayService::logAdapters() const
        {
            for (const auto &adapter : discovery_.getAdapters())
            {
                spdlog::info("Adapter {} {}/{} broadcast {}{}", adapter.name, adapter.address,
                             adapter.netmask, adapter.broadcast, adapter.is_primary ? " [primary]" : "");
            }
        }

        void RelayService::printAdapters(std::ostream &out) const
        {
            auto contains = [](const AdapterList &list, const NetworkAdapter &adapter) {
                for (const auto &item : list)
                {
                    if (item.address == adapter.address)
                    {
                        return true;
                    }
                }
                return false;
            };

            out << std::left
                << std::setw(12) << "INTERFACE"
                << std::setw(18) << "ADDRESS"
                << std::setw(18) << "NETMASK"
                << std::setw(18) << "BROADCAST"
                << std::setw(9) << "PRIMARY"
                << std::setw(10) << "INCOMING"
                << "OUTGOING" << "\n";

            for (const auto &adapter : discovery_.getAdapters())
            {
                out << std::left
                    << std::setw(12) << adapter.name
                    << std::setw(18) << adapter.address
                    << std::setw(18) << adapter.netmask
                    << std::setw(18) << adapter.broadcast
                    << std::setw(9) << (adapter.is_primary ? "yes" : "")
                    << std::setw(10) << (contains(discovery_.getIncomingAdapters(), adapter) ? "yes" : "")
                    << (contains(discovery_.getOutgoingAdapters(), adapter) ? "yes" : "") << "\n";
            }
        }

        bool RelayService::sendOnce(const std::string &hw_address)
        {
            auto canonical = WolPacketCodec::normalizeHwAddress(hw_address);
            if (!canonical)
            {
                spdlog::error("Invalid hardware address: '{}'", hw_address);
                return false;
            }

            const AdapterList &outgoing = discovery_.getOutgoingAdapters();
            if (outgoing.empty())
            {
                spdlog::error("No outgoing adapters to send on");
                return false;
            }

            DirectPacketSender sender(static_cast<uint16_t>(settings_.outgoing_port), settings_.repeat_send);
            return sender.forward(*canonical, outgoing);
        }

    } // namespace Relay
} // namespace WolRelay
