// src/core/relay/debounce_gate.hpp
#ifndef DEBOUNCE_GATE_HPP
#define DEBOUNCE_GATE_HPP

#include <string>
#include <array>
#include <mutex>
#include <chrono>
#include <functional>
#include <unordered_map>

namespace WolRelay
{
    namespace Relay
    {
        using SteadyClock = std::chrono::steady_clock;
        using ClockFunction = std::function<SteadyClock::time_point()>;

        /**
         * @class DebounceGate
         * @brief Chống gửi lặp: mỗi MAC chỉ được chấp nhận một lần trong debounce window
         *
         * Ledger được chia thành nhiều shard, mỗi shard có mutex riêng. Mọi
         * thao tác đọc-sửa-ghi của một key đều nằm trong khóa của shard đó.
         */
        class DebounceGate
        {
        public:
            static constexpr size_t SHARD_COUNT = 16;

            /**
             * @brief Constructor
             * @param window Khoảng thời gian từ chối gửi lặp
             * @param expiration Tuổi tối đa của một entry trước khi bị sweep() xóa
             * @param clock Nguồn thời gian (mặc định steady_clock::now)
             */
            DebounceGate(std::chrono::milliseconds window,
                         std::chrono::milliseconds expiration,
                         ClockFunction clock = nullptr);

            DebounceGate(const DebounceGate &) = delete;
            DebounceGate &operator=(const DebounceGate &) = delete;

            /**
             * @brief Thử chấp nhận key
             * @return true nếu key chưa được chấp nhận trong window (timestamp được cập nhật),
             *         false nếu vẫn đang trong window (timestamp giữ nguyên)
             */
            bool tryAccept(const std::string &key);

            /**
             * @brief Xóa các entry có tuổi >= expiration
             * @return Số entry đã xóa
             */
            size_t sweep();

            size_t size() const;
            bool contains(const std::string &key) const;

            std::chrono::milliseconds getWindow() const { return window_; }
            std::chrono::milliseconds getExpiration() const { return expiration_; }

        private:
            struct Shard
            {
                mutable std::mutex mutex;
                std::unordered_map<std::string, SteadyClock::time_point> entries;
            };

            Shard &shardFor(const std::string &key);
            const Shard &shardFor(const std::string &key) const;

            std::chrono::milliseconds window_;
            std::chrono::milliseconds expiration_;
            ClockFunction clock_;
            std::array<Shard, SHARD_COUNT> shards_;
        };

    } // namespace Relay
} // namespace WolRelay

#endif // DEBOUNCE_GATE_HPP
