// src/serialization/src/FieldCodec.cpp
#include "serialization/include/FieldCodec.hpp"
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <stdexcept>

using json = nlohmann::json;

namespace data_engine::serialization
{
    namespace
    {
        std::string ToLower(std::string text)
        {
            std::transform(text.begin(), text.end(), text.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return text;
        }

        std::string DescribeJsonType(const json& value)
        {
            return std::string(value.type_name());
        }
    }

    // ========================================
    // JSON 값 정규화
    // ========================================

    json FieldCodec::NormalizeJsonValue(const json& value, FieldType type)
    {
        if (value.is_null()) {
            return RecordSchema::DefaultValue(type);
        }

        if (IsArrayType(type))
        {
            if (!value.is_array()) {
                throw std::invalid_argument(std::string("expected array for ") + FieldTypeToString(type) +
                                            ", got " + DescribeJsonType(value));
            }
            FieldType element_type = ElementType(type);
            json result = json::array();
            for (const auto& element : value) {
                if (element.is_null()) {
                    throw std::invalid_argument("null element in array");
                }
                result.push_back(NormalizeJsonValue(element, element_type));
            }
            return result;
        }

        switch (type) {
            case FieldType::STRING:
                if (value.is_string()) {
                    return value;
                }
                break;
            case FieldType::INT:
                if (value.is_number_unsigned()) {
                    uint64_t raw = value.get<uint64_t>();
                    if (raw > static_cast<uint64_t>(INT64_MAX)) {
                        throw std::invalid_argument("integer out of range: " + value.dump());
                    }
                    return static_cast<int64_t>(raw);
                }
                if (value.is_number_integer()) {
                    return value.get<int64_t>();
                }
                break;
            case FieldType::FLOAT:
                if (value.is_number()) {
                    return value.get<double>();
                }
                break;
            case FieldType::BOOL:
                if (value.is_boolean()) {
                    return value;
                }
                break;
            default:
                break;
        }

        throw std::invalid_argument(std::string("expected ") + FieldTypeToString(type) +
                                    ", got " + DescribeJsonType(value) + " " + value.dump());
    }

    // ========================================
    // CSV 셀 변환
    // ========================================

    json FieldCodec::ParseCell(const std::string& cell, FieldType type, char array_delimiter)
    {
        if (!IsArrayType(type)) {
            if (cell.empty()) {
                return RecordSchema::DefaultValue(type);
            }
            return ParseScalar(cell, type);
        }

        FieldType element_type = ElementType(type);
        json result = json::array();

        size_t start = 0;
        while (start <= cell.size())
        {
            size_t end = cell.find(array_delimiter, start);
            if (end == std::string::npos) {
                end = cell.size();
            }
            std::string item = cell.substr(start, end - start);
            if (!item.empty()) {
                result.push_back(ParseScalar(item, element_type));
            }
            start = end + 1;
        }
        return result;
    }

    std::string FieldCodec::FormatCell(const json& value, FieldType type, char array_delimiter)
    {
        if (!IsArrayType(type)) {
            return FormatScalar(value, type);
        }

        if (!value.is_array()) {
            throw std::invalid_argument(std::string("expected array for ") + FieldTypeToString(type));
        }

        FieldType element_type = ElementType(type);
        std::string result;
        for (size_t i = 0; i < value.size(); ++i) {
            if (i > 0) {
                result += array_delimiter;
            }
            result += FormatScalar(value[i], element_type);
        }
        return result;
    }

    json FieldCodec::ParseScalar(const std::string& text, FieldType element_type)
    {
        switch (element_type) {
            case FieldType::STRING:
                return text;

            case FieldType::INT: {
                errno = 0;
                char* end = nullptr;
                long long parsed = std::strtoll(text.c_str(), &end, 10);
                if (end == text.c_str() || *end != '\0') {
                    throw std::invalid_argument("invalid integer '" + text + "'");
                }
                if (errno == ERANGE) {
                    throw std::invalid_argument("integer out of range '" + text + "'");
                }
                return static_cast<int64_t>(parsed);
            }

            case FieldType::FLOAT: {
                errno = 0;
                char* end = nullptr;
                double parsed = std::strtod(text.c_str(), &end);
                if (end == text.c_str() || *end != '\0') {
                    throw std::invalid_argument("invalid number '" + text + "'");
                }
                if (errno == ERANGE) {
                    throw std::invalid_argument("number out of range '" + text + "'");
                }
                return parsed;
            }

            case FieldType::BOOL: {
                std::string lower = ToLower(text);
                if (lower == "true" || lower == "1") {
                    return true;
                }
                if (lower == "false" || lower == "0") {
                    return false;
                }
                throw std::invalid_argument("invalid boolean '" + text + "'");
            }

            default:
                throw std::invalid_argument(std::string("unexpected element type ") +
                                            FieldTypeToString(element_type));
        }
    }

    std::string FieldCodec::FormatScalar(const json& value, FieldType element_type)
    {
        switch (element_type) {
            case FieldType::STRING:
                if (!value.is_string()) {
                    throw std::invalid_argument("expected string, got " + DescribeJsonType(value));
                }
                return value.get<std::string>();

            case FieldType::INT:
                if (!value.is_number_integer()) {
                    throw std::invalid_argument("expected integer, got " + DescribeJsonType(value));
                }
                return std::to_string(value.get<int64_t>());

            case FieldType::FLOAT:
                if (!value.is_number()) {
                    throw std::invalid_argument("expected number, got " + DescribeJsonType(value));
                }
                // nlohmann 의 출력은 최단 왕복 표현
                return json(value.get<double>()).dump();

            case FieldType::BOOL:
                if (!value.is_boolean()) {
                    throw std::invalid_argument("expected boolean, got " + DescribeJsonType(value));
                }
                return value.get<bool>() ? "true" : "false";

            default:
                throw std::invalid_argument(std::string("unexpected element type ") +
                                            FieldTypeToString(element_type));
        }
    }

    FieldType FieldCodec::ElementType(FieldType array_type)
    {
        switch (array_type) {
            case FieldType::STRING_ARRAY: return FieldType::STRING;
            case FieldType::INT_ARRAY: return FieldType::INT;
            case FieldType::FLOAT_ARRAY: return FieldType::FLOAT;
            default: return array_type;
        }
    }

} // namespace data_engine::serialization
