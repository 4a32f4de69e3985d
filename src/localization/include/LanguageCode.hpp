// src/localization/include/LanguageCode.hpp
#pragma once
#include <optional>
#include <string>
#include <vector>

namespace data_engine::localization
{
    // ISO 639-1 기반 언어 코드 (중국어는 지역 포함)
    enum class LanguageCode
    {
        EN = 0,
        KO,
        JA,
        ZH_CN,
        ZH_TW,
        ES,
        FR,
        DE,
        IT,
        PT,
        RU,
        AR,
        NL,
        PL,
        TR,
        TH,
        VI,
        ID,
        HI,
        SV
    };

    // LanguageCode::KO -> "ko"
    std::string ToIsoCode(LanguageCode code);

    // "ko" / "KO" / "zh-cn" -> LanguageCode, 모르는 코드면 nullopt
    std::optional<LanguageCode> FromIsoCode(const std::string& iso_code);

    // 원어 표기 이름 (LanguageCode::KO -> "한국어")
    std::string GetDisplayName(LanguageCode code);

    // 알려진 코드면 원어 이름, 아니면 입력 그대로
    std::string GetDisplayName(const std::string& iso_code);

    // "ko" + ".csv" -> "ko.csv"
    std::string GetLanguageFileName(LanguageCode code, const std::string& extension = ".csv");

    bool IsKnownLanguageCode(const std::string& iso_code);

    std::vector<LanguageCode> GetAllLanguageCodes();
}
