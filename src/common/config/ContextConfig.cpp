// src/common/config/ContextConfig.cpp
#include "common/config/ContextConfig.hpp"
#include "common/types/DataFormat.hpp"
#include <sstream>
#include <vector>

namespace data_engine::config
{
    void ContextConfig::Validate() const
    {
        std::vector<std::string> problems;

        if (context_name.empty()) {
            problems.push_back("context_name is empty");
        }
        if (default_language.empty()) {
            problems.push_back("default_language is empty");
        } else if (default_language.find_first_of("/\\") != std::string::npos ||
                   default_language.find("..") != std::string::npos) {
            problems.push_back("default_language must be a plain language code: " + default_language);
        }
        if (localization_data_path.empty()) {
            problems.push_back("localization_data_path is empty");
        }
        if (localization_key_path.empty()) {
            problems.push_back("localization_key_path is empty");
        } else if (DetectFormatFromPath(localization_key_path) == DataFormat::UNKNOWN) {
            problems.push_back("localization_key_path has no supported extension: " + localization_key_path);
        }
        if (language_file_pattern.empty()) {
            problems.push_back("language_file_pattern is empty");
        }
        if (csv_field_delimiter == csv_array_delimiter) {
            problems.push_back("csv_field_delimiter and csv_array_delimiter must differ");
        }
        if (csv_field_delimiter == '"' || csv_array_delimiter == '"') {
            problems.push_back("'\"' cannot be used as a CSV delimiter");
        }

        if (!problems.empty()) {
            std::stringstream ss;
            ss << "invalid context configuration '" << context_name << "': ";
            for (size_t i = 0; i < problems.size(); ++i) {
                ss << problems[i];
                if (i < problems.size() - 1) {
                    ss << ", ";
                }
            }
            throw ConfigException(ss.str());
        }
    }

    ContextConfig ContextConfig::FromConfigFile(const ConfigFile& file)
    {
        ContextConfig config;

        config.context_name = file.GetString("CONTEXT_NAME", config.context_name);
        config.generated_namespace = file.GetString("GENERATED_NAMESPACE", config.generated_namespace);
        config.base_path = file.GetString("BASE_PATH", config.base_path);

        config.localization_enabled = file.GetBool("LOCALIZATION_ENABLED", config.localization_enabled);
        config.localization_key_path = file.GetString("LOCALIZATION_KEY_PATH", config.localization_key_path);
        config.localization_data_path = file.GetString("LOCALIZATION_DATA_PATH", config.localization_data_path);
        config.default_language = file.GetString("DEFAULT_LANGUAGE", config.default_language);
        config.language_file_pattern = file.GetString("LANGUAGE_FILE_PATTERN", config.language_file_pattern);
        config.preload_all_languages = file.GetBool("PRELOAD_ALL_LANGUAGES", config.preload_all_languages);

        config.load_concurrently = file.GetBool("LOAD_CONCURRENTLY", config.load_concurrently);
        config.enable_debug_logging = file.GetBool("ENABLE_DEBUG_LOGGING", config.enable_debug_logging);

        config.csv_field_delimiter = file.GetChar("CSV_FIELD_DELIMITER", config.csv_field_delimiter);
        config.csv_array_delimiter = file.GetChar("CSV_ARRAY_DELIMITER", config.csv_array_delimiter);

        return config;
    }

    ContextConfig ContextConfig::LoadFromFile(const std::string& file_path)
    {
        ContextConfig config = FromConfigFile(ConfigFile::LoadFromFile(file_path));
        config.Validate();
        return config;
    }
} // namespace data_engine::config
