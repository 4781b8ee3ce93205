// src/common/network_utils.cpp
#include "network_utils.hpp"
#include "utils.hpp"
#include <arpa/inet.h>
#include <ifaddrs.h>
#include <net/if.h>
#include <sys/socket.h>
#include <algorithm>
#include <cstring>

namespace WolRelay
{
    namespace Common
    {
        // ==================== IP address utilities ====================

        bool NetworkUtils::isValidIPv4(const std::string &ip)
        {
            struct sockaddr_in sa;
            return inet_pton(AF_INET, ip.c_str(), &(sa.sin_addr)) == 1;
        }

        std::string NetworkUtils::bytesToIPString(const std::vector<uint8_t> &bytes)
        {
            char str[INET6_ADDRSTRLEN];

            if (bytes.size() == 4) {
                if (inet_ntop(AF_INET, bytes.data(), str, sizeof(str))) {
                    return std::string(str);
                }
            } else if (bytes.size() == 16) {
                if (inet_ntop(AF_INET6, bytes.data(), str, sizeof(str))) {
                    return std::string(str);
                }
            }
            return "";
        }

        bool NetworkUtils::ipStringToBytes(const std::string &ip, std::vector<uint8_t> &out)
        {
            struct in_addr addr;
            if (inet_pton(AF_INET, ip.c_str(), &addr) != 1) {
                return false;
            }

            const uint8_t *p = reinterpret_cast<const uint8_t *>(&addr.s_addr);
            out.assign(p, p + 4);
            return true;
        }

        // ==================== Port utilities ====================

        bool NetworkUtils::isValidPort(int port)
        {
            return port > 0 && port <= 65535;
        }

        // ==================== Network interface utilities ====================

        bool NetworkUtils::getInterfaceAddresses(std::vector<InterfaceAddress> &out)
        {
            struct ifaddrs *ifaddr = nullptr;

            if (getifaddrs(&ifaddr) == -1) {
                return false;
            }
            ScopeGuard guard([ifaddr]() { freeifaddrs(ifaddr); });

            out.clear();
            for (struct ifaddrs *ifa = ifaddr; ifa != nullptr; ifa = ifa->ifa_next) {
                if (ifa->ifa_addr == nullptr) continue;

                int family = ifa->ifa_addr->sa_family;
                if (family != AF_INET && family != AF_INET6) continue;

                InterfaceAddress entry;
                entry.name = ifa->ifa_name ? ifa->ifa_name : "";
                entry.family = family;
                entry.is_up = (ifa->ifa_flags & IFF_UP) != 0;
                entry.is_running = (ifa->ifa_flags & IFF_RUNNING) != 0;
                entry.is_loopback = (ifa->ifa_flags & IFF_LOOPBACK) != 0;

                if (family == AF_INET) {
                    const auto *sin = reinterpret_cast<const struct sockaddr_in *>(ifa->ifa_addr);
                    const uint8_t *p = reinterpret_cast<const uint8_t *>(&sin->sin_addr);
                    entry.address.assign(p, p + 4);

                    if (ifa->ifa_netmask != nullptr) {
                        const auto *mask = reinterpret_cast<const struct sockaddr_in *>(ifa->ifa_netmask);
                        const uint8_t *m = reinterpret_cast<const uint8_t *>(&mask->sin_addr);
                        entry.netmask.assign(m, m + 4);
                    }
                } else {
                    const auto *sin6 = reinterpret_cast<const struct sockaddr_in6 *>(ifa->ifa_addr);
                    const uint8_t *p = reinterpret_cast<const uint8_t *>(&sin6->sin6_addr);
                    entry.address.assign(p, p + 16);

                    if (ifa->ifa_netmask != nullptr) {
                        const auto *mask = reinterpret_cast<const struct sockaddr_in6 *>(ifa->ifa_netmask);
                        const uint8_t *m = reinterpret_cast<const uint8_t *>(&mask->sin6_addr);
                        entry.netmask.assign(m, m + 16);
                    }
                }

                out.push_back(std::move(entry));
            }

            return true;
        }

        // ==================== Network calculation utilities ====================

        bool NetworkUtils::isZeroMask(const std::vector<uint8_t> &mask)
        {
            return std::all_of(mask.begin(), mask.end(), [](uint8_t b) { return b == 0; });
        }

        bool NetworkUtils::calculateBroadcastAddress(const std::vector<uint8_t> &address,
                                                     const std::vector<uint8_t> &mask,
                                                     std::vector<uint8_t> &broadcast)
        {
            if (address.size() != mask.size()) {
                return false;
            }

            broadcast.resize(address.size());
            for (size_t i = 0; i < address.size(); ++i) {
                broadcast[i] = static_cast<uint8_t>(address[i] | (mask[i] ^ 0xFF));
            }
            return true;
        }

        std::string NetworkUtils::errnoToString(int err)
        {
            char buf[256];
            // GNU strerror_r có thể trả về con trỏ khác buf
            const char *msg = strerror_r(err, buf, sizeof(buf));
            return std::string(msg ? msg : "unknown error");
        }

    } // namespace Common
} // namespace WolRelay
