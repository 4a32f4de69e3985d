// src/serialization/include/RecordSchema.hpp
#pragma once
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace data_engine::serialization
{
    /**
     * @brief 포맷 중립 레코드 표현
     *
     * 스키마 필드만 담은 평면 JSON object. Record 타입과는
     * ADL to_json / from_json 으로 변환된다.
     */
    using Row = nlohmann::json;

    enum class FieldType
    {
        STRING = 0,
        INT,
        FLOAT,
        BOOL,
        STRING_ARRAY,
        INT_ARRAY,
        FLOAT_ARRAY
    };

    const char* FieldTypeToString(FieldType type);
    bool IsArrayType(FieldType type);

    struct FieldDescriptor
    {
        std::string name;
        FieldType type = FieldType::STRING;
    };

    /**
     * @brief 한 엔티티 타입의 필드 목록 + 기본 키 필드
     *
     * 필드 순서는 CSV 컬럼 순서 / JSON 멤버 순서로 그대로 쓰인다.
     * 키 필드는 STRING 또는 INT 타입이어야 한다.
     */
    class RecordSchema
    {
    public:
        /**
         * @throws std::invalid_argument 빈 필드 목록, 중복 필드명,
         *         존재하지 않는 키 필드, STRING/INT 가 아닌 키 필드
         */
        RecordSchema(std::string key_field, std::vector<FieldDescriptor> fields);

        const std::string& KeyField() const { return key_field_; }
        FieldType KeyType() const { return fields_[key_index_].type; }
        size_t KeyIndex() const { return key_index_; }

        const std::vector<FieldDescriptor>& Fields() const { return fields_; }
        size_t FieldCount() const { return fields_.size(); }

        // 대소문자 구분 없이 검색, 없으면 nullptr
        const FieldDescriptor* FindField(const std::string& name) const;
        bool HasField(const std::string& name) const { return FindField(name) != nullptr; }

        // 누락된 필드의 기본값 ("" / 0 / 0.0 / false / [])
        static nlohmann::json DefaultValue(FieldType type);

        // 키 값의 비교용 문자열 ("potion" / "42")
        static std::string KeyToString(const nlohmann::json& key_value);

    private:
        std::string key_field_;
        std::vector<FieldDescriptor> fields_;
        size_t key_index_ = 0;
    };

} // namespace data_engine::serialization
