// src/common/config/ConfigFile.cpp
#include "common/config/ConfigFile.hpp"
#include "common/utils/logger/Logger.hpp"
#include <fstream>
#include <sstream>
#include <algorithm>
#include <cctype>

namespace data_engine::config
{
    namespace
    {
        void Trim(std::string& value)
        {
            value.erase(0, value.find_first_not_of(" \t\r\n"));
            value.erase(value.find_last_not_of(" \t\r\n") + 1);
        }
    }

    ConfigFile ConfigFile::LoadFromFile(const std::string& file_path)
    {
        std::ifstream file(file_path);
        if (!file.is_open())
        {
            throw ConfigException("failed to open config file: " + file_path);
        }

        std::stringstream buffer;
        buffer << file.rdbuf();

        ConfigFile config;
        config.source_path = file_path;
        config.ParseContent(buffer.str());

        LOG_INFOF("Config", "Loaded %zu configuration entries from %s",
                  config.config_map.size(), file_path.c_str());
        return config;
    }

    ConfigFile ConfigFile::LoadFromString(const std::string& content, const std::string& source_name)
    {
        ConfigFile config;
        config.source_path = source_name;
        config.ParseContent(content);
        return config;
    }

    void ConfigFile::ParseContent(const std::string& content)
    {
        std::istringstream stream(content);
        std::string line;
        size_t line_number = 0;

        while (std::getline(stream, line))
        {
            ++line_number;
            if (!ParseLine(line))
            {
                throw ConfigException("invalid line " + std::to_string(line_number) +
                                      " in " + source_path + " (expected KEY=VALUE): " + line);
            }
        }
    }

    std::string ConfigFile::GetString(const std::string& key, const std::string& default_value) const
    {
        auto it = config_map.find(key);
        if (it == config_map.end()) {
            return default_value;
        }
        return it->second;
    }

    bool ConfigFile::GetBool(const std::string& key, bool default_value) const
    {
        auto it = config_map.find(key);
        if (it == config_map.end()) {
            return default_value;
        }

        std::string value = it->second;
        std::transform(value.begin(), value.end(), value.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

        if (value == "true" || value == "1" || value == "yes" || value == "on") {
            return true;
        } else if (value == "false" || value == "0" || value == "no" || value == "off") {
            return false;
        } else {
            throw ConfigException("invalid boolean value for key '" + key + "': " + it->second);
        }
    }

    char ConfigFile::GetChar(const std::string& key, char default_value) const
    {
        auto it = config_map.find(key);
        if (it == config_map.end()) {
            return default_value;
        }

        // 공백 제거 후라 탭은 "\t"로 적는다
        if (it->second == "\\t") {
            return '\t';
        }
        if (it->second.size() != 1) {
            throw ConfigException("expected a single character for key '" + key + "': " + it->second);
        }
        return it->second[0];
    }

    bool ConfigFile::HasKey(const std::string& key) const
    {
        return config_map.find(key) != config_map.end();
    }

    bool ConfigFile::ParseLine(const std::string& line)
    {
        std::string trimmed = line;
        Trim(trimmed);

        // 빈 줄이나 주석은 무시
        if (trimmed.empty() || trimmed[0] == '#')
        {
            return true;
        }

        size_t eq_pos = trimmed.find('=');
        if (eq_pos == std::string::npos)
        {
            return false;
        }

        std::string key = trimmed.substr(0, eq_pos);
        std::string value = trimmed.substr(eq_pos + 1);
        Trim(key);
        Trim(value);

        if (key.empty())
        {
            return false;
        }

        if (config_map.find(key) == config_map.end()) {
            key_order.push_back(key);
        }
        config_map[key] = value;
        return true;
    }
} // namespace data_engine::config
