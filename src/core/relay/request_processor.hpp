// src/core/relay/request_processor.hpp
#ifndef REQUEST_PROCESSOR_HPP
#define REQUEST_PROCESSOR_HPP

#include <string>
#include <memory>
#include <cstdint>
#include "wol_packet.hpp"
#include "adapter_discovery.hpp"
#include "packet_sender.hpp"

namespace WolRelay
{
    namespace Relay
    {
        /**
         * @brief Kết quả xử lý một buffer nhận được
         */
        enum class ProcessOutcome
        {
            FORWARDED,          // Đã gửi hoặc đưa vào hàng đợi
            UNTRUSTED_SOURCE,   // Nguồn không nằm trong trusted sources
            NOT_WOL_PACKET,     // Không khớp wol pattern
            EXTRACTION_FAILED,  // Khớp wol pattern nhưng không lấy được MAC
            NOT_FORWARDED,      // Sender từ chối (debounce) hoặc gửi lỗi
            SEND_ERROR          // Sender ném exception
        };

        std::string outcomeToString(ProcessOutcome outcome);

        /**
         * @class RequestProcessor
         * @brief Pipeline dùng chung cho mọi listener:
         *        trusted source -> wol pattern -> lấy MAC -> chọn adapter -> sender
         *
         * Mọi thành phần đều read-only sau khi tạo, trừ sender (thread-safe),
         * nên một instance được dùng chung giữa các listener thread.
         */
        class RequestProcessor
        {
        public:
            RequestProcessor(std::shared_ptr<const WolPacketCodec> codec,
                             std::shared_ptr<PacketSender> sender,
                             const AdapterList &outgoing_adapters,
                             const AddressSet &trusted_sources,
                             bool send_back_to_adapter);

            /**
             * @brief Xử lý một buffer nhận được trên adapter incoming
             * @param data Dữ liệu nhận được
             * @param length Số bytes
             * @param source_address Địa chỉ IPv4 của bên gửi
             * @param incoming Adapter đã nhận buffer
             */
            ProcessOutcome process(const uint8_t *data, size_t length,
                                   const std::string &source_address,
                                   const NetworkAdapter &incoming) const;

            /**
             * @brief Kiểm tra địa chỉ nguồn. Allow-list rỗng = tin tưởng tất cả
             */
            bool isTrustedSource(const std::string &source_address) const;

            const AdapterList &getOutgoingAdapters() const { return outgoing_adapters_; }

        private:
            std::shared_ptr<const WolPacketCodec> codec_;
            std::shared_ptr<PacketSender> sender_;
            const AdapterList outgoing_adapters_;
            const AddressSet trusted_sources_;
            const bool send_back_to_adapter_;
        };

    } // namespace Relay
} // namespace WolRelay

#endif // REQUEST_PROCESSOR_HPP
