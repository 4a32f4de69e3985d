// src/localization/include/LocalizationTypes.hpp
#pragma once
#include "serialization/include/RecordSchema.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace data_engine::localization
{
    /**
     * @brief 키 테이블 행 (유효한 로컬라이제이션 키의 기준)
     */
    struct LocalizationKeyData
    {
        std::string Id;
        std::string Description;
        std::string Category;
        bool IsFixedKey = false;

        static const serialization::RecordSchema& Schema();
    };

    /**
     * @brief 언어 테이블 행 (한 언어의 번역 텍스트)
     */
    struct LocalizationEntry
    {
        std::string Id;
        std::string Text;
        std::string Context;

        static const serialization::RecordSchema& Schema();
    };

    void to_json(nlohmann::json& j, const LocalizationKeyData& data);
    void from_json(const nlohmann::json& j, LocalizationKeyData& data);

    void to_json(nlohmann::json& j, const LocalizationEntry& entry);
    void from_json(const nlohmann::json& j, LocalizationEntry& entry);
}
