// src/common/config/ConfigFile.hpp
#pragma once
#include <string>
#include <unordered_map>
#include <vector>
#include <stdexcept>

namespace data_engine::config
{
    // 설정 오류 (누락, 잘못된 값, 검증 실패)
    class ConfigException : public std::runtime_error {
    public:
        explicit ConfigException(const std::string& msg)
            : std::runtime_error("Config error: " + msg) {}
    };

    /**
     * @brief KEY=VALUE 형식 설정 파일
     *
     * '#'으로 시작하는 줄과 빈 줄은 무시하고, 키/값 앞뒤 공백은 제거한다.
     * 값 조회 시 키가 없으면 기본값을 돌려주지만, 값이 있는데 형식이 잘못되면 예외를 던진다.
     */
    class ConfigFile
    {
    private:
        std::unordered_map<std::string, std::string> config_map;
        std::vector<std::string> key_order;
        std::string source_path;

    public:
        ConfigFile() = default;

        // 파일을 열 수 없으면 ConfigException
        static ConfigFile LoadFromFile(const std::string& file_path);
        static ConfigFile LoadFromString(const std::string& content, const std::string& source_name = "<memory>");

        std::string GetString(const std::string& key, const std::string& default_value) const;
        bool GetBool(const std::string& key, bool default_value) const;
        char GetChar(const std::string& key, char default_value) const;

        bool HasKey(const std::string& key) const;
        const std::vector<std::string>& Keys() const { return key_order; }
        const std::string& SourcePath() const { return source_path; }

    private:
        // 잘못된 줄이 있으면 줄 번호와 함께 ConfigException
        void ParseContent(const std::string& content);
        bool ParseLine(const std::string& line);
    };
} // namespace data_engine::config
