// src/common/config_manager.hpp
#ifndef CONFIG_MANAGER_HPP
#define CONFIG_MANAGER_HPP

#include "utils.hpp"
#include <string>
#include <unordered_map>
#include <vector>
#include <shared_mutex>

#include <nlohmann/json.hpp>

namespace WolRelay
{
    namespace Common
    {
        /**
         * @brief Thread-safe Configuration Manager
         *
         * Giá trị được lưu phẳng theo key dạng "section.name", mỗi giá trị là
         * một JSON scalar hoặc array. Thứ tự nạp thông thường:
         * defaults -> file JSON -> environment -> command line, nguồn sau ghi
         * đè nguồn trước.
         */
        class ConfigManager : public Singleton<ConfigManager>
        {
            friend class Singleton<ConfigManager>;

        public:
            /**
             * @brief Load cấu hình từ file JSON
             * @param config_file Đường dẫn file cấu hình
             * @return true nếu load thành công
             */
            bool loadFromFile(const std::string &config_file);

            /**
             * @brief Load cấu hình từ JSON string
             * @param json_content Nội dung JSON (cho phép comment // và block comment)
             * @return true nếu load thành công
             */
            bool loadFromJson(const std::string &json_content);

            /**
             * @brief Load cấu hình từ environment variables
             * @param prefix Prefix cho env vars (VD: "WOLRELAY_")
             *
             * "__" trong tên biến được đổi thành "." để giữ được "_" trong key:
             * WOLRELAY_DEBOUNCE__WINDOW_MS -> debounce.window_ms
             */
            void loadFromEnvironment(const std::string &prefix);

            /**
             * @brief Load cấu hình từ command line arguments
             *
             * Chỉ nhận các option có dạng --section.key=value hoặc --section.key value.
             * Các option khác bị bỏ qua.
             */
            void loadFromCommandLine(int argc, char *argv[]);

            // ==================== Set methods ====================
            bool setString(const std::string &key, const std::string &value);
            bool setInt(const std::string &key, int value);
            bool setBool(const std::string &key, bool value);
            bool setStringArray(const std::string &key, const std::vector<std::string> &value);

            // ==================== Get methods ====================
            std::string getString(const std::string &key, const std::string &default_value = "") const;
            int getInt(const std::string &key, int default_value = 0) const;
            bool getBool(const std::string &key, bool default_value = false) const;

            /**
             * @brief Get array of strings
             *
             * Giá trị kiểu string được tách theo dấu phẩy.
             */
            std::vector<std::string> getStringArray(const std::string &key, const std::vector<std::string> &default_value = {}) const;

            bool hasKey(const std::string &key) const;

            /**
             * @brief Clear tất cả cấu hình (kể cả defaults)
             */
            void clear();

            /**
             * @brief Xóa toàn bộ và nạp lại giá trị mặc định
             */
            void resetToDefaults();

            size_t size() const;

        protected:
            ConfigManager();
            virtual ~ConfigManager() = default;

        private:
            bool setValue(const std::string &key, nlohmann::json value);
            bool flatten(const nlohmann::json &node, const std::string &prefix);
            void setFromText(const std::string &key, const std::string &text);

            void initializeDefaults();

            static bool isValidKey(const std::string &key);

            mutable std::shared_mutex config_mutex_;
            std::unordered_map<std::string, nlohmann::json> values_;
        };

#define CONFIG ConfigManager::getInstance()

        // ==================== Predefined config keys ====================
        namespace ConfigKeys
        {
            // Relay settings
            constexpr const char *RELAY_OUTGOING_PORT = "relay.outgoing_port";
            constexpr const char *RELAY_REPEAT_SEND = "relay.repeat_send";
            constexpr const char *RELAY_SEND_BACK_TO_ADAPTER = "relay.send_back_to_adapter";

            // Listener settings
            constexpr const char *LISTENER_UDP_ENABLED = "listener.udp_enabled";
            constexpr const char *LISTENER_UDP_PORT = "listener.udp_port";
            constexpr const char *LISTENER_TCP_ENABLED = "listener.tcp_enabled";
            constexpr const char *LISTENER_TCP_PORT = "listener.tcp_port";

            // Packet matching
            constexpr const char *PACKET_WOL_PATTERN = "packet.wol_pattern";
            constexpr const char *PACKET_MAC_PATTERN = "packet.mac_pattern";

            // Debounce settings
            constexpr const char *DEBOUNCE_ENABLED = "debounce.enabled";
            constexpr const char *DEBOUNCE_WINDOW_MS = "debounce.window_ms";
            constexpr const char *DEBOUNCE_EXPIRATION_MS = "debounce.expiration_ms";
            constexpr const char *DEBOUNCE_CLEANUP_INTERVAL_MS = "debounce.cleanup_interval_ms";

            // Adapter selection
            constexpr const char *ADAPTERS_PRIMARY = "adapters.primary";
            constexpr const char *ADAPTERS_PRIMARY_ONLY = "adapters.primary_only";
            constexpr const char *ADAPTERS_INCOMING = "adapters.incoming";
            constexpr const char *ADAPTERS_OUTGOING = "adapters.outgoing";

            // Security
            constexpr const char *SECURITY_TRUSTED_SOURCES = "security.trusted_sources";

            // Logging
            constexpr const char *LOGGING_LEVEL = "logging.level";
            constexpr const char *LOGGING_FILE = "logging.file";
        }

    } // namespace Common
} // namespace WolRelay

#endif // CONFIG_MANAGER_HPP
