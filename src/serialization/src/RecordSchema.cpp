// src/serialization/src/RecordSchema.cpp
#include "serialization/include/RecordSchema.hpp"
#include <algorithm>
#include <cstdint>
#include <cctype>
#include <stdexcept>

namespace data_engine::serialization
{
    namespace
    {
        bool EqualsIgnoreCase(const std::string& a, const std::string& b)
        {
            if (a.size() != b.size()) {
                return false;
            }
            return std::equal(a.begin(), a.end(), b.begin(), [](unsigned char x, unsigned char y) {
                return std::tolower(x) == std::tolower(y);
            });
        }
    }

    const char* FieldTypeToString(FieldType type)
    {
        switch (type) {
            case FieldType::STRING: return "STRING";
            case FieldType::INT: return "INT";
            case FieldType::FLOAT: return "FLOAT";
            case FieldType::BOOL: return "BOOL";
            case FieldType::STRING_ARRAY: return "STRING_ARRAY";
            case FieldType::INT_ARRAY: return "INT_ARRAY";
            case FieldType::FLOAT_ARRAY: return "FLOAT_ARRAY";
            default: return "UNKNOWN";
        }
    }

    bool IsArrayType(FieldType type)
    {
        return type == FieldType::STRING_ARRAY ||
               type == FieldType::INT_ARRAY ||
               type == FieldType::FLOAT_ARRAY;
    }

    RecordSchema::RecordSchema(std::string key_field, std::vector<FieldDescriptor> fields)
        : key_field_(std::move(key_field)), fields_(std::move(fields))
    {
        if (fields_.empty()) {
            throw std::invalid_argument("RecordSchema requires at least one field");
        }

        bool key_found = false;
        for (size_t i = 0; i < fields_.size(); ++i)
        {
            if (fields_[i].name.empty()) {
                throw std::invalid_argument("RecordSchema field name must not be empty");
            }
            for (size_t j = 0; j < i; ++j) {
                if (EqualsIgnoreCase(fields_[i].name, fields_[j].name)) {
                    throw std::invalid_argument("Duplicate field name in RecordSchema: " + fields_[i].name);
                }
            }
            if (fields_[i].name == key_field_) {
                key_index_ = i;
                key_found = true;
            }
        }

        if (!key_found) {
            throw std::invalid_argument("Key field '" + key_field_ + "' is not part of the schema");
        }

        FieldType key_type = fields_[key_index_].type;
        if (key_type != FieldType::STRING && key_type != FieldType::INT) {
            throw std::invalid_argument("Key field '" + key_field_ + "' must be STRING or INT, got " +
                                        FieldTypeToString(key_type));
        }
    }

    const FieldDescriptor* RecordSchema::FindField(const std::string& name) const
    {
        for (const auto& field : fields_) {
            if (EqualsIgnoreCase(field.name, name)) {
                return &field;
            }
        }
        return nullptr;
    }

    nlohmann::json RecordSchema::DefaultValue(FieldType type)
    {
        switch (type) {
            case FieldType::STRING: return "";
            case FieldType::INT: return static_cast<int64_t>(0);
            case FieldType::FLOAT: return 0.0;
            case FieldType::BOOL: return false;
            default: return nlohmann::json::array();
        }
    }

    std::string RecordSchema::KeyToString(const nlohmann::json& key_value)
    {
        if (key_value.is_string()) {
            return key_value.get<std::string>();
        }
        return key_value.dump();
    }

} // namespace data_engine::serialization
