// src/common/config/ContextConfig.hpp
#pragma once
#include "common/config/ConfigFile.hpp"
#include <string>

namespace data_engine::config
{
    /**
     * @brief DataContext 설정
     *
     * 모든 필드는 기본값을 가진다. 설정 파일(KEY=VALUE)에서 지정한 키만 덮어쓴다.
     *
     * | 키                          | 필드                    | 기본값                              |
     * |-----------------------------|-------------------------|-------------------------------------|
     * | CONTEXT_NAME                | context_name            | GameDataContext                     |
     * | GENERATED_NAMESPACE         | generated_namespace     | data_engine::generated              |
     * | BASE_PATH                   | base_path               | (빈 문자열)                          |
     * | LOCALIZATION_ENABLED        | localization_enabled    | false                               |
     * | LOCALIZATION_KEY_PATH       | localization_key_path   | Localizations/LocalizationKeys.csv  |
     * | LOCALIZATION_DATA_PATH      | localization_data_path  | Localizations/                      |
     * | DEFAULT_LANGUAGE            | default_language        | en                                  |
     * | LANGUAGE_FILE_PATTERN       | language_file_pattern   | *.csv                               |
     * | PRELOAD_ALL_LANGUAGES       | preload_all_languages   | true                                |
     * | LOAD_CONCURRENTLY           | load_concurrently       | true                                |
     * | ENABLE_DEBUG_LOGGING        | enable_debug_logging    | false                               |
     * | CSV_FIELD_DELIMITER         | csv_field_delimiter     | ,                                   |
     * | CSV_ARRAY_DELIMITER         | csv_array_delimiter     | \|                                  |
     */
    struct ContextConfig
    {
        std::string context_name = "GameDataContext";
        std::string generated_namespace = "data_engine::generated";
        std::string base_path;

        bool localization_enabled = false;
        std::string localization_key_path = "Localizations/LocalizationKeys.csv";
        std::string localization_data_path = "Localizations/";
        std::string default_language = "en";
        std::string language_file_pattern = "*.csv";
        bool preload_all_languages = true;

        bool load_concurrently = true;
        bool enable_debug_logging = false;

        char csv_field_delimiter = ',';
        char csv_array_delimiter = '|';

        /**
         * @brief 필드 검증
         * @throws ConfigException 잘못된 조합이 있을 때 (모든 문제를 한 메시지로)
         */
        void Validate() const;

        static ContextConfig FromConfigFile(const ConfigFile& file);
        static ContextConfig LoadFromFile(const std::string& file_path);
    };
} // namespace data_engine::config
