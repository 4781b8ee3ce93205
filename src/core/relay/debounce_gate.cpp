// src/core/relay/debounce_gate.cpp

#include "debounce_gate.hpp"
#include <spdlog/spdlog.h>
#include <utility>

namespace WolRelay
{
    namespace Relay
    {
        DebounceGate::DebounceGate(std::chrono::milliseconds window,
                                   std::chrono::milliseconds expiration,
                                   ClockFunction clock)
            : window_(window),
              expiration_(expiration),
              clock_(clock ? std::move(clock) : ClockFunction([]() { return SteadyClock::now(); }))
        {
            if (expiration_ < window_)
            {
                spdlog::warn("Debounce expiration ({} ms) is shorter than the debounce window ({} ms)",
                             expiration_.count(), window_.count());
            }
        }

        DebounceGate::Shard &DebounceGate::shardFor(const std::string &key)
        {
            return shards_[std::hash<std::string>{}(key) % SHARD_COUNT];
        }

        const DebounceGate::Shard &DebounceGate::shardFor(const std::string &key) const
        {
            return shards_[std::hash<std::string>{}(key) % SHARD_COUNT];
        }

        bool DebounceGate::tryAccept(const std::string &key)
        {
            Shard &shard = shardFor(key);
            auto now = clock_();

            std::lock_guard<std::mutex> lock(shard.mutex);

            auto it = shard.entries.find(key);
            if (it != shard.entries.end() && now - it->second < window_)
            {
                return false;
            }

            shard.entries[key] = now;
            return true;
        }

        size_t DebounceGate::sweep()
        {
            auto now = clock_();
            size_t removed_count = 0;

            for (auto &shard : shards_)
            {
                std::lock_guard<std::mutex> lock(shard.mutex);

                for (auto it = shard.entries.begin(); it != shard.entries.end();)
                {
                    if (now - it->second >= expiration_)
                    {
                        spdlog::debug("Removing {} from debounce ledger", it->first);
                        it = shard.entries.erase(it);
                        removed_count++;
                    }
                    else
                    {
                        ++it;
                    }
                }
            }

            return removed_count;
        }

        size_t DebounceGate::size() const
        {
            size_t total = 0;
            for (const auto &shard : shards_)
            {
                std::lock_guard<std::mutex> lock(shard.mutex);
                total += shard.entries.size();
            }
            return total;
        }

        bool DebounceGate::contains(const std::string &key) const
        {
            const Shard &shard = shardFor(key);
            std::lock_guard<std::mutex> lock(shard.mutex);
            return shard.entries.count(key) > 0;
        }

    } // namespace Relay
} // namespace WolRelay
