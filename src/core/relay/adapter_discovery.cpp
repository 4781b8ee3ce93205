// src/core/relay/adapter_discovery.cpp

#include "adapter_discovery.hpp"
#include <spdlog/spdlog.h>
#include <sys/socket.h>
#include <cerrno>

namespace WolRelay
{
    namespace Relay
    {
        AdapterDiscovery::AdapterDiscovery(const DiscoveryOptions &options)
            : options_(options)
        {
        }

        bool AdapterDiscovery::discover()
        {
            spdlog::info("Finding network adapters...");

            std::vector<Common::InterfaceAddress> records;
            if (!Common::NetworkUtils::getInterfaceAddresses(records))
            {
                spdlog::error("Failed to enumerate network interfaces: {}",
                              Common::NetworkUtils::errnoToString(errno));
                return false;
            }

            discover(records);
            return true;
        }

        void AdapterDiscovery::discover(const std::vector<Common::InterfaceAddress> &records)
        {
            adapters_.clear();

            for (const auto &record : records)
            {
                if (!record.is_up || !record.is_running || record.is_loopback)
                {
                    continue;
                }

                // IPv6 không được relay
                if (record.family != AF_INET)
                {
                    continue;
                }

                if (record.netmask.empty() || Common::NetworkUtils::isZeroMask(record.netmask))
                {
                    continue;
                }

                std::vector<uint8_t> broadcast;
                if (!Common::NetworkUtils::calculateBroadcastAddress(record.address, record.netmask, broadcast))
                {
                    spdlog::warn("Skipping {} : address and mask lengths differ ({} vs {})",
                                 record.name, record.address.size(), record.netmask.size());
                    continue;
                }

                NetworkAdapter adapter(record.name,
                                       Common::NetworkUtils::bytesToIPString(record.address),
                                       Common::NetworkUtils::bytesToIPString(record.netmask),
                                       Common::NetworkUtils::bytesToIPString(broadcast));

                if (!options_.primary_address.empty() &&
                    adapter.address == options_.primary_address &&
                    getPrimaryAdapter() == nullptr)
                {
                    adapter.is_primary = true;
                }

                spdlog::info("Found network adapter: {} ({}/{} broadcast {})",
                             adapter.name, adapter.address, adapter.netmask, adapter.broadcast);
                adapters_.push_back(adapter);
            }

            // Adapter đầu tiên là primary nếu cấu hình không khớp adapter nào
            if (getPrimaryAdapter() == nullptr && !adapters_.empty())
            {
                if (!options_.primary_address.empty())
                {
                    spdlog::warn("Configured primary adapter {} not found, using {}",
                                 options_.primary_address, adapters_.front().address);
                }
                adapters_.front().is_primary = true;
            }

            incoming_ = filterAdapters(options_.incoming_allow);
            outgoing_ = filterAdapters(options_.outgoing_allow);

            spdlog::info("Found {} network adapters ({} incoming, {} outgoing)",
                         adapters_.size(), incoming_.size(), outgoing_.size());
        }

        const NetworkAdapter *AdapterDiscovery::getPrimaryAdapter() const
        {
            for (const auto &adapter : adapters_)
            {
                if (adapter.is_primary)
                {
                    return &adapter;
                }
            }
            return nullptr;
        }

        AdapterList AdapterDiscovery::filterAdapters(const AddressSet &allow_list) const
        {
            AdapterList result;

            for (const auto &adapter : adapters_)
            {
                if (options_.primary_only)
                {
                    if (adapter.is_primary)
                    {
                        result.push_back(adapter);
                    }
                    continue;
                }

                if (!allow_list.empty() && allow_list.count(adapter.address) == 0)
                {
                    continue;
                }

                result.push_back(adapter);
            }

            return result;
        }

        AdapterList AdapterDiscovery::selectOutgoingAdapters(const NetworkAdapter &incoming, bool send_back) const
        {
            return selectOutgoingAdapters(outgoing_, incoming, send_back);
        }

        AdapterList AdapterDiscovery::selectOutgoingAdapters(const AdapterList &outgoing,
                                                             const NetworkAdapter &incoming, bool send_back)
        {
            AdapterList result;
            result.reserve(outgoing.size());

            for (const auto &adapter : outgoing)
            {
                if (!send_back && adapter.address == incoming.address)
                {
                    continue;
                }
                result.push_back(adapter);
            }

            return result;
        }

        std::string AdapterDiscovery::calculateBroadcastAddress(const std::string &address, const std::string &netmask)
        {
            std::vector<uint8_t> addr_bytes;
            std::vector<uint8_t> mask_bytes;
            std::vector<uint8_t> broadcast;

            if (!Common::NetworkUtils::ipStringToBytes(address, addr_bytes) ||
                !Common::NetworkUtils::ipStringToBytes(netmask, mask_bytes) ||
                !Common::NetworkUtils::calculateBroadcastAddress(addr_bytes, mask_bytes, broadcast))
            {
                return "";
            }

            return Common::NetworkUtils::bytesToIPString(broadcast);
        }

    } // namespace Relay
} // namespace WolRelay
