// src/serialization/include/FieldCodec.hpp
#pragma once
#include "serialization/include/RecordSchema.hpp"
#include <string>

namespace data_engine::serialization
{
    /**
     * @brief 필드 값 변환 (JSON 값 / CSV 셀 텍스트 <-> 스키마 타입)
     *
     * 변환 실패는 std::invalid_argument 로 알리고, 호출하는 Serializer가
     * 경로와 줄 번호를 붙여 MalformedDataException 으로 바꾼다.
     */
    class FieldCodec
    {
    public:
        // JSON 값을 스키마 타입으로 정규화 (null -> 기본값, INT 는 int64, FLOAT 는 double)
        static nlohmann::json NormalizeJsonValue(const nlohmann::json& value, FieldType type);

        // CSV 셀 -> 값. 빈 셀은 기본값, 배열 원소 중 빈 항목은 버린다.
        static nlohmann::json ParseCell(const std::string& cell, FieldType type, char array_delimiter);

        // 값 -> CSV 셀 (quoting 전 원문)
        static std::string FormatCell(const nlohmann::json& value, FieldType type, char array_delimiter);

    private:
        FieldCodec() = delete;

        static nlohmann::json ParseScalar(const std::string& text, FieldType element_type);
        static std::string FormatScalar(const nlohmann::json& value, FieldType element_type);
        static FieldType ElementType(FieldType array_type);
    };

} // namespace data_engine::serialization
