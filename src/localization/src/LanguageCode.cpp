// src/localization/src/LanguageCode.cpp
#include "localization/include/LanguageCode.hpp"
#include <algorithm>
#include <cctype>

namespace data_engine::localization
{
    namespace
    {
        struct LanguageInfo
        {
            LanguageCode code;
            const char* iso;
            const char* display_name;
        };

        const LanguageInfo kLanguages[] = {
            { LanguageCode::EN, "en", "English" },
            { LanguageCode::KO, "ko", "한국어" },
            { LanguageCode::JA, "ja", "日本語" },
            { LanguageCode::ZH_CN, "zh-CN", "简体中文" },
            { LanguageCode::ZH_TW, "zh-TW", "繁體中文" },
            { LanguageCode::ES, "es", "Español" },
            { LanguageCode::FR, "fr", "Français" },
            { LanguageCode::DE, "de", "Deutsch" },
            { LanguageCode::IT, "it", "Italiano" },
            { LanguageCode::PT, "pt", "Português" },
            { LanguageCode::RU, "ru", "Русский" },
            { LanguageCode::AR, "ar", "العربية" },
            { LanguageCode::NL, "nl", "Nederlands" },
            { LanguageCode::PL, "pl", "Polski" },
            { LanguageCode::TR, "tr", "Türkçe" },
            { LanguageCode::TH, "th", "ไทย" },
            { LanguageCode::VI, "vi", "Tiếng Việt" },
            { LanguageCode::ID, "id", "Bahasa Indonesia" },
            { LanguageCode::HI, "hi", "हिन्दी" },
            { LanguageCode::SV, "sv", "Svenska" }
        };

        std::string ToLower(std::string text)
        {
            std::transform(text.begin(), text.end(), text.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return text;
        }

        const LanguageInfo* FindInfo(LanguageCode code)
        {
            for (const auto& info : kLanguages) {
                if (info.code == code) {
                    return &info;
                }
            }
            return nullptr;
        }
    }

    std::string ToIsoCode(LanguageCode code)
    {
        const LanguageInfo* info = FindInfo(code);
        return info ? info->iso : "en";
    }

    std::optional<LanguageCode> FromIsoCode(const std::string& iso_code)
    {
        if (iso_code.empty()) {
            return std::nullopt;
        }

        std::string lower = ToLower(iso_code);
        std::replace(lower.begin(), lower.end(), '_', '-');

        for (const auto& info : kLanguages) {
            if (ToLower(info.iso) == lower) {
                return info.code;
            }
        }
        return std::nullopt;
    }

    std::string GetDisplayName(LanguageCode code)
    {
        const LanguageInfo* info = FindInfo(code);
        return info ? info->display_name : ToIsoCode(code);
    }

    std::string GetDisplayName(const std::string& iso_code)
    {
        auto code = FromIsoCode(iso_code);
        return code ? GetDisplayName(*code) : iso_code;
    }

    std::string GetLanguageFileName(LanguageCode code, const std::string& extension)
    {
        return ToIsoCode(code) + extension;
    }

    bool IsKnownLanguageCode(const std::string& iso_code)
    {
        return FromIsoCode(iso_code).has_value();
    }

    std::vector<LanguageCode> GetAllLanguageCodes()
    {
        std::vector<LanguageCode> codes;
        for (const auto& info : kLanguages) {
            codes.push_back(info.code);
        }
        return codes;
    }
}
