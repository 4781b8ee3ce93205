// src/core/relay/wol_packet.cpp

#include "wol_packet.hpp"
#include "utils.hpp"

namespace WolRelay
{
    namespace Relay
    {
        namespace
        {
            constexpr auto REGEX_FLAGS = std::regex::ECMAScript | std::regex::icase | std::regex::optimize;
        }

        WolPacketCodec::WolPacketCodec()
            : WolPacketCodec(DEFAULT_WOL_PATTERN, DEFAULT_MAC_PATTERN)
        {
        }

        WolPacketCodec::WolPacketCodec(const std::string &wol_pattern, const std::string &mac_pattern)
            : wol_pattern_(wol_pattern),
              mac_pattern_(mac_pattern),
              wol_regex_(wol_pattern, REGEX_FLAGS),
              mac_regex_(mac_pattern, REGEX_FLAGS)
        {
        }

        Packet WolPacketCodec::buildPacket(const std::string &hw_address)
        {
            std::string cleaned = Common::Utils::removeChars(Common::Utils::trim(hw_address), ":-");

            std::vector<uint8_t> hw_bytes;
            if (cleaned.length() != WOL_HW_ADDRESS_LENGTH * 2 ||
                !Common::Utils::hexToBytes(cleaned, hw_bytes))
            {
                throw PacketFormatError("Invalid hardware address: '" + hw_address + "'");
            }

            Packet packet;
            packet.reserve(WOL_PACKET_SIZE);

            // 6 bytes 0xFF
            packet.insert(packet.end(), WOL_SYNC_LENGTH, 0xFF);

            // MAC lặp lại 16 lần
            for (size_t i = 0; i < WOL_HW_REPEAT; ++i)
            {
                packet.insert(packet.end(), hw_bytes.begin(), hw_bytes.end());
            }

            return packet;
        }

        std::optional<std::string> WolPacketCodec::normalizeHwAddress(const std::string &hw_address)
        {
            std::string cleaned = Common::Utils::removeChars(Common::Utils::trim(hw_address), ":-");
            if (cleaned.length() != WOL_HW_ADDRESS_LENGTH * 2 || !Common::Utils::isHexString(cleaned))
            {
                return std::nullopt;
            }

            std::vector<std::string> octets;
            for (size_t i = 0; i < cleaned.length(); i += 2)
            {
                octets.push_back(Common::Utils::toUpperCase(cleaned.substr(i, 2)));
            }
            return Common::Utils::join(octets, ":");
        }

        bool WolPacketCodec::isWolShaped(const uint8_t *data, size_t length) const
        {
            if (data == nullptr || length == 0)
            {
                return false;
            }

            std::string hex = Common::Utils::toUpperCase(Common::Utils::bytesToHex(data, length));
            return std::regex_search(hex, wol_regex_);
        }

        std::optional<std::string> WolPacketCodec::extractHwAddress(const uint8_t *data, size_t length) const
        {
            if (data == nullptr || length == 0)
            {
                return std::nullopt;
            }

            std::string hex = Common::Utils::toUpperCase(Common::Utils::bytesToHex(data, length));
            std::smatch match;
            if (!std::regex_search(hex, match, mac_regex_) || match.size() < WOL_HW_ADDRESS_LENGTH + 1)
            {
                return std::nullopt;
            }

            std::vector<std::string> octets;
            for (size_t i = 1; i <= WOL_HW_ADDRESS_LENGTH; ++i)
            {
                std::string group = match[i].str();
                if (group.length() != 2 || !Common::Utils::isHexString(group))
                {
                    return std::nullopt;
                }
                octets.push_back(Common::Utils::toUpperCase(group));
            }

            return Common::Utils::join(octets, ":");
        }

    } // namespace Relay
} // namespace WolRelay
