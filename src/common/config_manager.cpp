// src/common/config_manager.cpp
#include "config_manager.hpp"
#include <iostream>
#include <fstream>
#include <sstream>
#include <regex>
#include <mutex>

extern char **environ;

using json = nlohmann::json;

namespace WolRelay
{
    namespace Common
    {
        namespace
        {
            std::string scalarToString(const json &value)
            {
                if (value.is_string())
                {
                    return value.get<std::string>();
                }
                if (value.is_boolean())
                {
                    return value.get<bool>() ? "true" : "false";
                }
                if (value.is_number_integer())
                {
                    return std::to_string(value.get<long long>());
                }
                return value.dump();
            }

            bool lookup(const std::unordered_map<std::string, json> &values, std::shared_mutex &mutex,
                        const std::string &key, json &out)
            {
                std::shared_lock<std::shared_mutex> lock(mutex);

                auto it = values.find(key);
                if (it == values.end())
                {
                    return false;
                }
                out = it->second;
                return true;
            }
        }

        ConfigManager::ConfigManager()
        {
            initializeDefaults();
        }

        // ==================== Initialization ====================
        void ConfigManager::initializeDefaults()
        {
            // Relay
            setInt(ConfigKeys::RELAY_OUTGOING_PORT, 9);
            setInt(ConfigKeys::RELAY_REPEAT_SEND, 1);
            setBool(ConfigKeys::RELAY_SEND_BACK_TO_ADAPTER, true);

            // Listeners
            setBool(ConfigKeys::LISTENER_UDP_ENABLED, true);
            setInt(ConfigKeys::LISTENER_UDP_PORT, 9);
            setBool(ConfigKeys::LISTENER_TCP_ENABLED, false);
            setInt(ConfigKeys::LISTENER_TCP_PORT, 9);

            // Debounce
            setBool(ConfigKeys::DEBOUNCE_ENABLED, true);
            setInt(ConfigKeys::DEBOUNCE_WINDOW_MS, 1000);
            setInt(ConfigKeys::DEBOUNCE_EXPIRATION_MS, 60000);
            setInt(ConfigKeys::DEBOUNCE_CLEANUP_INTERVAL_MS, 60000);

            // Adapters
            setString(ConfigKeys::ADAPTERS_PRIMARY, "");
            setBool(ConfigKeys::ADAPTERS_PRIMARY_ONLY, false);
            setStringArray(ConfigKeys::ADAPTERS_INCOMING, {});
            setStringArray(ConfigKeys::ADAPTERS_OUTGOING, {});

            setStringArray(ConfigKeys::SECURITY_TRUSTED_SOURCES, {});

            // Logging
            setString(ConfigKeys::LOGGING_LEVEL, "info");
            setString(ConfigKeys::LOGGING_FILE, "");
        }

        // ==================== File operations ====================
        bool ConfigManager::loadFromFile(const std::string &config_file)
        {
            std::ifstream file(config_file);
            if (!file.is_open())
            {
                std::cerr << "Cannot open config file: " << config_file << std::endl;
                return false;
            }

            std::stringstream buffer;
            buffer << file.rdbuf();
            if (file.bad())
            {
                std::cerr << "Error reading config file: " << config_file << std::endl;
                return false;
            }

            return loadFromJson(buffer.str());
        }

        bool ConfigManager::loadFromJson(const std::string &json_content)
        {
            try
            {
                // ignore_comments: bỏ qua // và /* */
                json root = json::parse(json_content, nullptr, true, true);
                if (!root.is_object())
                {
                    std::cerr << "Config root must be a JSON object" << std::endl;
                    return false;
                }

                return flatten(root, "");
            }
            catch (const json::parse_error &e)
            {
                std::cerr << "JSON parse error: " << e.what() << std::endl;
                return false;
            }
        }

        bool ConfigManager::flatten(const json &node, const std::string &prefix)
        {
            bool all_ok = true;

            for (auto it = node.begin(); it != node.end(); ++it)
            {
                std::string key = prefix.empty() ? it.key() : prefix + "." + it.key();
                const json &value = it.value();

                if (value.is_object())
                {
                    all_ok = flatten(value, key) && all_ok;
                }
                else if (!value.is_null())
                {
                    all_ok = setValue(key, value) && all_ok;
                }
            }

            return all_ok;
        }

        // ==================== Environment Variables ====================
        void ConfigManager::loadFromEnvironment(const std::string &prefix)
        {
            if (environ == nullptr)
            {
                std::cerr << "Environment variables not available" << std::endl;
                return;
            }

            for (char **env = environ; *env != nullptr; ++env)
            {
                std::string env_var(*env);
                size_t eq_pos = env_var.find('=');
                if (eq_pos == std::string::npos) continue;

                std::string name = env_var.substr(0, eq_pos);
                if (!Utils::startsWith(name, prefix) || name.length() == prefix.length())
                {
                    continue;
                }
                name = Utils::toLowerCase(name.substr(prefix.length()));

                // "__" -> "."
                std::string key;
                for (size_t i = 0; i < name.size(); ++i)
                {
                    if (name[i] == '_' && i + 1 < name.size() && name[i + 1] == '_')
                    {
                        key += '.';
                        ++i;
                    }
                    else
                    {
                        key += name[i];
                    }
                }

                setFromText(key, env_var.substr(eq_pos + 1));
            }
        }

        // ==================== Command Line Arguments ====================
        void ConfigManager::loadFromCommandLine(int argc, char *argv[])
        {
            for (int i = 1; i < argc; ++i)
            {
                std::string arg(argv[i]);
                if (!Utils::startsWith(arg, "--"))
                {
                    continue;
                }

                size_t eq_pos = arg.find('=');
                if (eq_pos != std::string::npos)
                {
                    // --key=value
                    std::string key = arg.substr(2, eq_pos - 2);
                    if (key.find('.') != std::string::npos)
                    {
                        setFromText(key, arg.substr(eq_pos + 1));
                    }
                }
                else if (arg.find('.') != std::string::npos && i + 1 < argc)
                {
                    // --key value
                    setFromText(arg.substr(2), argv[i + 1]);
                    i++;
                }
            }
        }

        void ConfigManager::setFromText(const std::string &key, const std::string &text)
        {
            static const std::regex int_regex(R"(^-?\d+$)");
            static const std::regex double_regex(R"(^-?\d+\.\d+$)");

            if (text == "true" || text == "false")
            {
                setBool(key, text == "true");
            }
            else if (std::regex_match(text, int_regex))
            {
                try
                {
                    setInt(key, std::stoi(text));
                }
                catch (const std::out_of_range &)
                {
                    setString(key, text);
                }
            }
            else if (std::regex_match(text, double_regex))
            {
                setValue(key, std::stod(text));
            }
            else
            {
                setString(key, text);
            }
        }

        // ==================== Set Methods ====================
        bool ConfigManager::setString(const std::string &key, const std::string &value)
        {
            return setValue(key, value);
        }

        bool ConfigManager::setInt(const std::string &key, int value)
        {
            return setValue(key, value);
        }

        bool ConfigManager::setBool(const std::string &key, bool value)
        {
            return setValue(key, value);
        }

        bool ConfigManager::setStringArray(const std::string &key, const std::vector<std::string> &value)
        {
            return setValue(key, json(value));
        }

        bool ConfigManager::setValue(const std::string &key, json value)
        {
            if (!isValidKey(key))
            {
                std::cerr << "Invalid key: " << key << std::endl;
                return false;
            }

            std::unique_lock<std::shared_mutex> lock(config_mutex_);
            values_[key] = std::move(value);
            return true;
        }

        // ==================== Get Methods ====================
        std::string ConfigManager::getString(const std::string &key, const std::string &default_value) const
        {
            json value;
            if (!lookup(values_, config_mutex_, key, value))
            {
                return default_value;
            }

            if (value.is_array())
            {
                std::vector<std::string> items;
                for (const auto &item : value)
                {
                    items.push_back(scalarToString(item));
                }
                return Utils::join(items, ",");
            }
            return scalarToString(value);
        }

        int ConfigManager::getInt(const std::string &key, int default_value) const
        {
            json value;
            if (!lookup(values_, config_mutex_, key, value))
            {
                return default_value;
            }

            try
            {
                if (value.is_number_integer())
                {
                    return value.get<int>();
                }
                if (value.is_number_float())
                {
                    return static_cast<int>(value.get<double>());
                }
                if (value.is_string())
                {
                    return std::stoi(value.get<std::string>());
                }
            }
            catch (const std::exception &e)
            {
                std::cerr << "Error converting to int for key: " << key << " - " << e.what() << std::endl;
            }

            return default_value;
        }

        bool ConfigManager::getBool(const std::string &key, bool default_value) const
        {
            json value;
            if (!lookup(values_, config_mutex_, key, value))
            {
                return default_value;
            }

            if (value.is_boolean())
            {
                return value.get<bool>();
            }
            if (value.is_string())
            {
                std::string text = Utils::toLowerCase(value.get<std::string>());
                return text == "true" || text == "1" || text == "yes" || text == "on";
            }
            if (value.is_number_integer())
            {
                return value.get<long long>() != 0;
            }

            return default_value;
        }

        std::vector<std::string> ConfigManager::getStringArray(const std::string &key, const std::vector<std::string> &default_value) const
        {
            json value;
            if (!lookup(values_, config_mutex_, key, value))
            {
                return default_value;
            }

            std::vector<std::string> result;
            if (value.is_array())
            {
                for (const auto &item : value)
                {
                    result.push_back(scalarToString(item));
                }
                return result;
            }

            if (value.is_string())
            {
                // "a, b, c"
                for (const auto &item : Utils::split(value.get<std::string>(), ','))
                {
                    std::string trimmed = Utils::trim(item);
                    if (!trimmed.empty())
                    {
                        result.push_back(trimmed);
                    }
                }
                return result;
            }

            return default_value;
        }

        // ==================== Utility methods ====================
        bool ConfigManager::hasKey(const std::string &key) const
        {
            std::shared_lock<std::shared_mutex> lock(config_mutex_);
            return values_.find(key) != values_.end();
        }

        void ConfigManager::clear()
        {
            std::unique_lock<std::shared_mutex> lock(config_mutex_);
            values_.clear();
        }

        void ConfigManager::resetToDefaults()
        {
            clear();
            initializeDefaults();
        }

        size_t ConfigManager::size() const
        {
            std::shared_lock<std::shared_mutex> lock(config_mutex_);
            return values_.size();
        }

        // ==================== Validation helpers ====================
        bool ConfigManager::isValidKey(const std::string &key)
        {
            if (key.empty() || key.front() == '.' || key.back() == '.')
            {
                return false;
            }

            if (key.find("..") != std::string::npos)
            {
                return false;
            }

            static const std::regex key_regex(R"(^[a-zA-Z0-9._-]+$)");
            return std::regex_match(key, key_regex);
        }

    } // namespace Common
} // namespace WolRelay
