// src/core/relay/adapter_discovery.hpp
#ifndef ADAPTER_DISCOVERY_HPP
#define ADAPTER_DISCOVERY_HPP

#include <string>
#include <vector>
#include <unordered_set>
#include "network_utils.hpp"

namespace WolRelay
{
    namespace Relay
    {
        /**
         * @brief Một địa chỉ IPv4 cục bộ dùng để nhận hoặc phát lại gói WOL
         */
        struct NetworkAdapter
        {
            std::string name;        // Tên interface
            std::string address;     // Địa chỉ unicast
            std::string netmask;     // Subnet mask
            std::string broadcast;   // address | ~netmask
            bool is_primary;

            NetworkAdapter() : is_primary(false) {}

            NetworkAdapter(const std::string &n, const std::string &addr, const std::string &mask,
                           const std::string &bcast, bool primary = false)
                : name(n), address(addr), netmask(mask), broadcast(bcast), is_primary(primary) {}
        };

        using AdapterList = std::vector<NetworkAdapter>;
        using AddressSet = std::unordered_set<std::string>;

        /**
         * @brief Các tham số lọc adapter
         */
        struct DiscoveryOptions
        {
            std::string primary_address;  // Rỗng = adapter đầu tiên là primary
            bool primary_only;            // Chỉ dùng adapter primary
            AddressSet incoming_allow;    // Rỗng = tất cả
            AddressSet outgoing_allow;    // Rỗng = tất cả

            DiscoveryOptions() : primary_only(false) {}
        };

        /**
         * @class AdapterDiscovery
         * @brief Tìm các adapter IPv4 đang hoạt động và tính các view incoming/outgoing
         *
         * Chạy một lần lúc khởi động; sau đó mọi view đều read-only nên các
         * listener có thể đọc đồng thời mà không cần khóa.
         */
        class AdapterDiscovery
        {
        public:
            explicit AdapterDiscovery(const DiscoveryOptions &options);

            /**
             * @brief Liệt kê interface của hệ điều hành rồi gọi discover(records)
             * @return false nếu không liệt kê được interface
             */
            bool discover();

            /**
             * @brief Xây dựng danh sách adapter từ các bản ghi interface thô
             *
             * Bỏ qua interface down, loopback, địa chỉ không phải IPv4 và mask 0.0.0.0.
             */
            void discover(const std::vector<Common::InterfaceAddress> &records);

            const AdapterList &getAdapters() const { return adapters_; }
            const AdapterList &getIncomingAdapters() const { return incoming_; }
            const AdapterList &getOutgoingAdapters() const { return outgoing_; }

            /**
             * @brief Adapter primary, nullptr nếu không có adapter nào
             */
            const NetworkAdapter *getPrimaryAdapter() const;

            /**
             * @brief Chọn các adapter để phát lại gói nhận được trên incoming
             * @param incoming Adapter đã nhận gói
             * @param send_back false = loại bỏ chính adapter nhận gói
             */
            AdapterList selectOutgoingAdapters(const NetworkAdapter &incoming, bool send_back) const;

            static AdapterList selectOutgoingAdapters(const AdapterList &outgoing,
                                                      const NetworkAdapter &incoming, bool send_back);

            /**
             * @brief Tính broadcast address từ chuỗi địa chỉ và mask IPv4
             * @return Chuỗi rỗng nếu đầu vào không hợp lệ
             */
            static std::string calculateBroadcastAddress(const std::string &address, const std::string &netmask);

        private:
            AdapterList filterAdapters(const AddressSet &allow_list) const;

            DiscoveryOptions options_;
            AdapterList adapters_;
            AdapterList incoming_;
            AdapterList outgoing_;
        };

    } // namespace Relay
} // namespace WolRelay

#endif // ADAPTER_DISCOVERY_HPP
