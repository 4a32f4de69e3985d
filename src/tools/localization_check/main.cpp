// src/tools/localization_check/main.cpp
#include "common/config/ContextConfig.hpp"
#include "common/errors/DataException.hpp"
#include "common/storage/include/StorageProviderFactory.hpp"
#include "context/include/DataContext.hpp"
#include "localization/include/LanguageCode.hpp"
#include "localization/include/LocalizationContext.hpp"
#include "common/utils/logger/Logger.hpp"
#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

using namespace data_engine;
using namespace data_engine::config;
using namespace data_engine::localization;

namespace
{
    constexpr int kExitComplete = 0;
    constexpr int kExitMissing = 1;
    constexpr int kExitError = 2;

    void PrintUsage(const char* program_name)
    {
        std::cout << "Usage: " << program_name << " <base_path> [config_file] [language]\n"
                  << "\n"
                  << "  base_path    Data root directory (overrides BASE_PATH in config)\n"
                  << "  config_file  KEY=VALUE context config (default settings if omitted)\n"
                  << "  language     Check a single language (all discovered languages if omitted)\n"
                  << "\n"
                  << "Exit code: 0 complete, 1 missing translations, 2 error\n"
                  << "Set DATA_ENGINE_LOG_FILE to also write logs to a file\n";
    }

    size_t ReportLanguage(const LocalizationContext& localization, const std::string& language)
    {
        std::vector<std::string> missing;
        for (const std::string& key : localization.GetAllKeys()) {
            if (!localization.HasTranslation(key, language)) {
                missing.push_back(key);
            }
        }

        std::cout << "[" << language << "] " << GetDisplayName(language);
        if (!localization.IsLanguageLoaded(language)) {
            std::cout << " (no table)";
        }
        std::cout << ": " << missing.size() << " missing\n";

        for (const std::string& key : missing) {
            std::cout << "    " << key << "\n";
        }
        return missing.size();
    }
}

int main(int argc, char* argv[])
{
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            PrintUsage(argv[0]);
            return kExitComplete;
        }
        args.push_back(arg);
    }

    if (args.empty() || args.size() > 3) {
        PrintUsage(argv[0]);
        return kExitError;
    }

    if (const char* log_file = std::getenv("DATA_ENGINE_LOG_FILE")) {
        utils::Logger::Instance().Initialize(log_file);
    }

    try {
        ContextConfig config = (args.size() >= 2 && !args[1].empty())
            ? ContextConfig::LoadFromFile(args[1])
            : ContextConfig();
        config.base_path = args[0];
        config.localization_enabled = true;
        config.Validate();

        auto provider = storage::StorageProviderFactory::Create("file", config.base_path);
        auto factory = context::DataContext::CreateSerializerFactory(config);

        LocalizationContext localization(*provider, *factory, config);
        localization.Load();

        std::vector<std::string> languages;
        if (args.size() == 3) {
            localization.SetActiveLanguage(args[2]);
            languages.push_back(args[2]);
        } else {
            languages = localization.GetAvailableLanguages();
        }

        std::cout << "Keys: " << localization.GetAllKeys().size() << "\n";
        std::cout << "Languages:";
        for (const std::string& language : languages) {
            std::cout << " " << language;
        }
        std::cout << "\n";

        size_t total_missing = 0;
        for (const std::string& language : languages) {
            total_missing += ReportLanguage(localization, language);
        }

        return total_missing == 0 ? kExitComplete : kExitMissing;

    } catch (const ConfigException& e) {
        LOG_ERRORF("LocalizationCheck", "%s", e.what());
    } catch (const DataException& e) {
        LOG_ERRORF("LocalizationCheck", "[%s] %s", ErrorKindToString(e.Kind()), e.what());
    } catch (const std::exception& e) {
        LOG_ERRORF("LocalizationCheck", "Unexpected error: %s", e.what());
    }

    return kExitError;
}
