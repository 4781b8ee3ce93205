// src/common/utils.cpp
#include "utils.hpp"
#include <algorithm>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace WolRelay
{
    namespace Common
    {
        // ==================== Time utilities ====================

        uint64_t Utils::getCurrentTimestampMs()
        {
            return std::chrono::duration_cast<std::chrono::milliseconds>(
                       std::chrono::system_clock::now().time_since_epoch())
                .count();
        }

        std::string Utils::formatTimestamp(uint64_t timestamp)
        {
            std::time_t seconds = static_cast<std::time_t>(timestamp / 1000);
            auto ms = timestamp % 1000;

            struct tm timeinfo;
            localtime_r(&seconds, &timeinfo);

            std::stringstream ss;
            ss << std::put_time(&timeinfo, "%Y-%m-%d %H:%M:%S");
            ss << '.' << std::setfill('0') << std::setw(3) << ms;
            return ss.str();
        }

        std::string Utils::formatDuration(uint64_t duration_ms)
        {
            if (duration_ms < 1000)
            {
                return std::to_string(duration_ms) + " ms";
            }

            uint64_t total_seconds = duration_ms / 1000;
            uint64_t hours = total_seconds / 3600;
            uint64_t minutes = (total_seconds % 3600) / 60;
            uint64_t seconds = total_seconds % 60;

            std::stringstream ss;
            if (hours > 0)
            {
                ss << hours << "h " << std::setfill('0') << std::setw(2) << minutes << "m "
                   << std::setw(2) << seconds << "s";
            }
            else if (minutes > 0)
            {
                ss << minutes << "m " << std::setfill('0') << std::setw(2) << seconds << "s";
            }
            else
            {
                ss << seconds << "s";
            }
            return ss.str();
        }

        // ==================== String utilities ====================

        std::vector<std::string> Utils::split(const std::string &str, char delimiter)
        {
            std::vector<std::string> tokens;
            std::stringstream ss(str);
            std::string token;

            while (std::getline(ss, token, delimiter))
            {
                tokens.push_back(token);
            }
            return tokens;
        }

        std::string Utils::trim(const std::string &str)
        {
            return trim(str, " \t\n\r\f\v");
        }

        std::string Utils::trim(const std::string &str, const std::string &chars)
        {
            size_t start = str.find_first_not_of(chars);
            if (start == std::string::npos)
                return "";

            size_t end = str.find_last_not_of(chars);
            return str.substr(start, end - start + 1);
        }

        std::string Utils::toLowerCase(const std::string &str)
        {
            std::string result = str;
            std::transform(result.begin(), result.end(), result.begin(), ::tolower);
            return result;
        }

        std::string Utils::toUpperCase(const std::string &str)
        {
            std::string result = str;
            std::transform(result.begin(), result.end(), result.begin(), ::toupper);
            return result;
        }

        bool Utils::startsWith(const std::string &str, const std::string &prefix)
        {
            return str.length() >= prefix.length() &&
                   str.compare(0, prefix.length(), prefix) == 0;
        }

        std::string Utils::removeChars(const std::string &str, const std::string &chars)
        {
            std::string result;
            result.reserve(str.size());
            for (char c : str)
            {
                if (chars.find(c) == std::string::npos)
                {
                    result += c;
                }
            }
            return result;
        }

        std::string Utils::join(const std::vector<std::string> &strings, const std::string &delimiter)
        {
            if (strings.empty())
                return "";

            std::stringstream ss;
            for (size_t i = 0; i < strings.size(); ++i)
            {
                if (i > 0)
                    ss << delimiter;
                ss << strings[i];
            }
            return ss.str();
        }

        // ==================== Hex utilities ====================

        std::string Utils::bytesToHex(const void *data, size_t length)
        {
            static const char digits[] = "0123456789abcdef";
            const uint8_t *bytes = static_cast<const uint8_t *>(data);

            std::string result;
            result.reserve(length * 2);
            for (size_t i = 0; i < length; ++i)
            {
                result += digits[bytes[i] >> 4];
                result += digits[bytes[i] & 0x0F];
            }
            return result;
        }

        bool Utils::hexToBytes(const std::string &hex_str, std::vector<uint8_t> &out)
        {
            if (hex_str.length() % 2 != 0 || !isHexString(hex_str))
            {
                return false;
            }

            out.clear();
            out.reserve(hex_str.length() / 2);
            for (size_t i = 0; i < hex_str.length(); i += 2)
            {
                out.push_back(static_cast<uint8_t>(std::stoul(hex_str.substr(i, 2), nullptr, 16)));
            }
            return true;
        }

        bool Utils::isHexString(const std::string &str)
        {
            return std::all_of(str.begin(), str.end(), [](unsigned char c) {
                return std::isxdigit(c) != 0;
            });
        }

        // ==================== ScopeGuard ====================

        ScopeGuard::ScopeGuard(std::function<void()> cleanup_func)
            : cleanup_func_(std::move(cleanup_func)), dismissed_(false)
        {
        }

        ScopeGuard::~ScopeGuard()
        {
            if (!dismissed_ && cleanup_func_)
            {
                cleanup_func_();
            }
        }

        void ScopeGuard::dismiss()
        {
            dismissed_ = true;
        }

    } // namespace Common
} // namespace WolRelay
