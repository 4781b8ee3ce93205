// src/core/relay/request_processor.cpp

#include "request_processor.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <utility>

namespace WolRelay
{
    namespace Relay
    {
        std::string outcomeToString(ProcessOutcome outcome)
        {
            switch (outcome)
            {
            case ProcessOutcome::FORWARDED:
                return "FORWARDED";
            case ProcessOutcome::UNTRUSTED_SOURCE:
                return "UNTRUSTED_SOURCE";
            case ProcessOutcome::NOT_WOL_PACKET:
                return "NOT_WOL_PACKET";
            case ProcessOutcome::EXTRACTION_FAILED:
                return "EXTRACTION_FAILED";
            case ProcessOutcome::NOT_FORWARDED:
                return "NOT_FORWARDED";
            case ProcessOutcome::SEND_ERROR:
                return "SEND_ERROR";
            default:
                return "UNKNOWN";
            }
        }

        RequestProcessor::RequestProcessor(std::shared_ptr<const WolPacketCodec> codec,
                                           std::shared_ptr<PacketSender> sender,
                                           const AdapterList &outgoing_adapters,
                                           const AddressSet &trusted_sources,
                                           bool send_back_to_adapter)
            : codec_(std::move(codec)),
              sender_(std::move(sender)),
              outgoing_adapters_(outgoing_adapters),
              trusted_sources_(trusted_sources),
              send_back_to_adapter_(send_back_to_adapter)
        {
            if (!codec_ || !sender_)
            {
                throw std::invalid_argument("RequestProcessor requires a codec and a sender");
            }
        }

        bool RequestProcessor::isTrustedSource(const std::string &source_address) const
        {
            return trusted_sources_.empty() || trusted_sources_.count(source_address) > 0;
        }

        ProcessOutcome RequestProcessor::process(const uint8_t *data, size_t length,
                                                 const std::string &source_address,
                                                 const NetworkAdapter &incoming) const
        {
            // 1. Trusted source
            if (!isTrustedSource(source_address))
            {
                spdlog::warn("Rejected packet from untrusted source {} on {}", source_address, incoming.address);
                return ProcessOutcome::UNTRUSTED_SOURCE;
            }

            // 2. Hình dạng gói WOL
            if (!codec_->isWolShaped(data, length))
            {
                spdlog::warn("Received invalid WOL packet ({} bytes) from {} on {}",
                             length, source_address, incoming.address);
                return ProcessOutcome::NOT_WOL_PACKET;
            }

            // 3. MAC address
            auto hw_address = codec_->extractHwAddress(data, length);
            if (!hw_address)
            {
                spdlog::debug("Could not extract hardware address from packet sent by {}", source_address);
                return ProcessOutcome::EXTRACTION_FAILED;
            }

            spdlog::info("Received WOL packet for {} from {} on {}", *hw_address, source_address, incoming.address);

            // 4. Chọn adapter và gửi
            AdapterList adapters = AdapterDiscovery::selectOutgoingAdapters(
                outgoing_adapters_, incoming, send_back_to_adapter_);

            try
            {
                Packet packet = WolPacketCodec::buildPacket(*hw_address);
                if (!sender_->forward(packet, *hw_address, adapters))
                {
                    return ProcessOutcome::NOT_FORWARDED;
                }
            }
            catch (const std::exception &e)
            {
                spdlog::error("Failed to forward WOL packet for {}: {}", *hw_address, e.what());
                return ProcessOutcome::SEND_ERROR;
            }

            return ProcessOutcome::FORWARDED;
        }

    } // namespace Relay
} // namespace WolRelay
