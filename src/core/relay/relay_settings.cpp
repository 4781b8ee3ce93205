// src/core/relay/relay_settings.cpp

#include "relay_settings.hpp"
#include "wol_packet.hpp"
#include "network_utils.hpp"
#include "utils.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>

namespace WolRelay
{
    namespace Relay
    {
        namespace
        {
            AddressSet toAddressSet(const std::vector<std::string> &values)
            {
                AddressSet result;
                for (const auto &value : values)
                {
                    std::string trimmed = Common::Utils::trim(value);
                    if (!trimmed.empty())
                    {
                        result.insert(trimmed);
                    }
                }
                return result;
            }

            void validateAddressSet(const AddressSet &addresses, const std::string &key,
                                    std::vector<std::string> &errors)
            {
                for (const auto &address : addresses)
                {
                    if (!Common::NetworkUtils::isValidIPv4(address))
                    {
                        errors.push_back(key + ": invalid IPv4 address '" + address + "'");
                    }
                }
            }

            std::string describeSet(const AddressSet &addresses)
            {
                if (addresses.empty())
                {
                    return "(all)";
                }
                std::vector<std::string> sorted(addresses.begin(), addresses.end());
                std::sort(sorted.begin(), sorted.end());
                return Common::Utils::join(sorted, ", ");
            }
        }

        RelaySettings::RelaySettings()
            : outgoing_port(9),
              repeat_send(1),
              send_back_to_adapter(true),
              udp_enabled(true),
              udp_port(9),
              tcp_enabled(false),
              tcp_port(9),
              wol_pattern(DEFAULT_WOL_PATTERN),
              mac_pattern(DEFAULT_MAC_PATTERN),
              debounce_enabled(true),
              debounce_window(1000),
              debounce_expiration(60000),
              cleanup_interval(60000),
              primary_only(false)
        {
        }

        RelaySettings RelaySettings::fromConfig(const Common::ConfigManager &config)
        {
            namespace Keys = Common::ConfigKeys;

            RelaySettings settings;

            settings.outgoing_port = config.getInt(Keys::RELAY_OUTGOING_PORT, settings.outgoing_port);
            settings.repeat_send = config.getInt(Keys::RELAY_REPEAT_SEND, settings.repeat_send);
            settings.send_back_to_adapter = config.getBool(Keys::RELAY_SEND_BACK_TO_ADAPTER, settings.send_back_to_adapter);

            settings.udp_enabled = config.getBool(Keys::LISTENER_UDP_ENABLED, settings.udp_enabled);
            settings.udp_port = config.getInt(Keys::LISTENER_UDP_PORT, settings.udp_port);
            settings.tcp_enabled = config.getBool(Keys::LISTENER_TCP_ENABLED, settings.tcp_enabled);
            settings.tcp_port = config.getInt(Keys::LISTENER_TCP_PORT, settings.tcp_port);

            settings.wol_pattern = config.getString(Keys::PACKET_WOL_PATTERN, settings.wol_pattern);
            settings.mac_pattern = config.getString(Keys::PACKET_MAC_PATTERN, settings.mac_pattern);

            settings.debounce_enabled = config.getBool(Keys::DEBOUNCE_ENABLED, settings.debounce_enabled);
            settings.debounce_window = std::chrono::milliseconds(
                config.getInt(Keys::DEBOUNCE_WINDOW_MS, static_cast<int>(settings.debounce_window.count())));
            settings.debounce_expiration = std::chrono::milliseconds(
                config.getInt(Keys::DEBOUNCE_EXPIRATION_MS, static_cast<int>(settings.debounce_expiration.count())));
            settings.cleanup_interval = std::chrono::milliseconds(
                config.getInt(Keys::DEBOUNCE_CLEANUP_INTERVAL_MS, static_cast<int>(settings.cleanup_interval.count())));

            settings.primary_adapter = Common::Utils::trim(config.getString(Keys::ADAPTERS_PRIMARY, ""));
            settings.primary_only = config.getBool(Keys::ADAPTERS_PRIMARY_ONLY, settings.primary_only);
            settings.incoming_adapters = toAddressSet(config.getStringArray(Keys::ADAPTERS_INCOMING));
            settings.outgoing_adapters = toAddressSet(config.getStringArray(Keys::ADAPTERS_OUTGOING));

            settings.trusted_sources = toAddressSet(config.getStringArray(Keys::SECURITY_TRUSTED_SOURCES));

            return settings;
        }

        bool RelaySettings::validate(std::vector<std::string> &errors) const
        {
            size_t error_count = errors.size();

            if (!Common::NetworkUtils::isValidPort(outgoing_port))
            {
                errors.push_back("relay.outgoing_port: must be in 1..65535, got " + std::to_string(outgoing_port));
            }
            if (repeat_send < 1)
            {
                errors.push_back("relay.repeat_send: must be at least 1, got " + std::to_string(repeat_send));
            }

            if (!udp_enabled && !tcp_enabled)
            {
                errors.push_back("listener: at least one of UDP or TCP must be enabled");
            }
            if (udp_enabled && !Common::NetworkUtils::isValidPort(udp_port))
            {
                errors.push_back("listener.udp_port: must be in 1..65535, got " + std::to_string(udp_port));
            }
            if (tcp_enabled && !Common::NetworkUtils::isValidPort(tcp_port))
            {
                errors.push_back("listener.tcp_port: must be in 1..65535, got " + std::to_string(tcp_port));
            }

            if (wol_pattern.empty())
            {
                errors.push_back("packet.wol_pattern: must not be empty");
            }
            if (mac_pattern.empty())
            {
                errors.push_back("packet.mac_pattern: must not be empty");
            }

            if (debounce_window.count() <= 0)
            {
                errors.push_back("debounce.window_ms: must be positive");
            }
            if (debounce_expiration.count() <= 0)
            {
                errors.push_back("debounce.expiration_ms: must be positive");
            }
            if (cleanup_interval.count() <= 0)
            {
                errors.push_back("debounce.cleanup_interval_ms: must be positive");
            }

            if (!primary_adapter.empty() && !Common::NetworkUtils::isValidIPv4(primary_adapter))
            {
                errors.push_back("adapters.primary: invalid IPv4 address '" + primary_adapter + "'");
            }
            validateAddressSet(incoming_adapters, "adapters.incoming", errors);
            validateAddressSet(outgoing_adapters, "adapters.outgoing", errors);
            validateAddressSet(trusted_sources, "security.trusted_sources", errors);

            return errors.size() == error_count;
        }

        std::vector<std::string> RelaySettings::warnings() const
        {
            std::vector<std::string> result;

            if (debounce_enabled && debounce_expiration < debounce_window)
            {
                result.push_back("debounce.expiration_ms (" + std::to_string(debounce_expiration.count()) +
                                 ") is shorter than debounce.window_ms (" +
                                 std::to_string(debounce_window.count()) + ")");
            }

            return result;
        }

        DiscoveryOptions RelaySettings::toDiscoveryOptions() const
        {
            DiscoveryOptions options;
            options.primary_address = primary_adapter;
            options.primary_only = primary_only;
            options.incoming_allow = incoming_adapters;
            options.outgoing_allow = outgoing_adapters;
            return options;
        }

        void RelaySettings::log() const
        {
            spdlog::info("Relay configuration:");
            spdlog::info("  - Outgoing port: {} (repeat {}x)", outgoing_port, repeat_send);
            spdlog::info("  - Send back to adapter: {}", send_back_to_adapter ? "yes" : "no");
            spdlog::info("  - UDP listener: {}", udp_enabled ? std::to_string(udp_port) : "disabled");
            spdlog::info("  - TCP listener: {}", tcp_enabled ? std::to_string(tcp_port) : "disabled");
            spdlog::info("  - WOL pattern: {}", wol_pattern);
            spdlog::info("  - MAC pattern: {}", mac_pattern);
            if (debounce_enabled)
            {
                spdlog::info("  - Debounce: {} ms (expiration {} ms, cleanup every {} ms)",
                             debounce_window.count(), debounce_expiration.count(), cleanup_interval.count());
            }
            else
            {
                spdlog::info("  - Debounce: disabled");
            }
            spdlog::info("  - Primary adapter: {}{}", primary_adapter.empty() ? "(first found)" : primary_adapter,
                         primary_only ? " (primary only)" : "");
            spdlog::info("  - Incoming adapters: {}", describeSet(incoming_adapters));
            spdlog::info("  - Outgoing adapters: {}", describeSet(outgoing_adapters));
            spdlog::info("  - Trusted sources: {}", trusted_sources.empty() ? "(any)" : describeSet(trusted_sources));
        }

    } // namespace Relay
} // namespace WolRelay
