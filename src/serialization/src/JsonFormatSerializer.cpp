// src/serialization/src/JsonFormatSerializer.cpp
#include "serialization/include/JsonFormatSerializer.hpp"
#include "serialization/include/FieldCodec.hpp"
#include "common/errors/DataException.hpp"
#include "common/utils/logger/Logger.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <unordered_set>

using json = nlohmann::json;

namespace data_engine::serialization
{
    namespace
    {
        bool IsBlank(const std::string& text)
        {
            return std::all_of(text.begin(), text.end(),
                               [](unsigned char c) { return std::isspace(c) != 0; });
        }

        const json* FindMember(const json& object, const std::string& name)
        {
            auto it = object.find(name);
            if (it != object.end()) {
                return &(*it);
            }

            for (auto member = object.begin(); member != object.end(); ++member)
            {
                const std::string& key = member.key();
                if (key.size() == name.size() &&
                    std::equal(key.begin(), key.end(), name.begin(), [](unsigned char a, unsigned char b) {
                        return std::tolower(a) == std::tolower(b);
                    })) {
                    return &member.value();
                }
            }
            return nullptr;
        }
    }

    std::vector<Row> JsonFormatSerializer::Parse(const std::string& text,
                                                 const RecordSchema& schema,
                                                 const std::string& source_path) const
    {
        std::vector<Row> rows;
        if (IsBlank(text)) {
            LOG_DEBUGF("Serializer", "Empty JSON source: %s", source_path.c_str());
            return rows;
        }

        json root;
        try {
            root = json::parse(text);
        } catch (const json::parse_error& e) {
            throw MalformedDataException(source_path, LineFromOffset(text, e.byte), e.what());
        }

        if (!root.is_array()) {
            throw MalformedDataException(source_path, 1,
                                         std::string("root must be an array of objects, got ") + root.type_name());
        }

        std::vector<size_t> entry_lines = FindEntryLines(text);
        std::unordered_set<std::string> seen_keys;
        rows.reserve(root.size());

        for (size_t index = 0; index < root.size(); ++index)
        {
            const json& entry = root[index];
            size_t line = index < entry_lines.size() ? entry_lines[index] : 0;

            if (!entry.is_object()) {
                throw MalformedDataException(source_path, line,
                                             "entry #" + std::to_string(index) + " is not an object");
            }

            Row row = json::object();
            for (const auto& field : schema.Fields())
            {
                const json* value = FindMember(entry, field.name);
                bool is_key = field.name == schema.KeyField();

                if (value == nullptr || value->is_null()) {
                    if (is_key) {
                        throw MalformedDataException(source_path, line,
                                                     "missing key field '" + field.name + "'");
                    }
                    row[field.name] = RecordSchema::DefaultValue(field.type);
                    continue;
                }

                try {
                    row[field.name] = FieldCodec::NormalizeJsonValue(*value, field.type);
                } catch (const std::invalid_argument& e) {
                    throw MalformedDataException(source_path, line,
                                                 "field '" + field.name + "': " + e.what());
                }
            }

            const json& key_value = row[schema.KeyField()];
            if (key_value.is_string() && key_value.get<std::string>().empty()) {
                throw MalformedDataException(source_path, line,
                                             "empty key field '" + schema.KeyField() + "'");
            }

            std::string key_text = RecordSchema::KeyToString(key_value);
            if (!seen_keys.insert(key_text).second) {
                throw DuplicateKeyException(source_path, line, key_text);
            }

            rows.push_back(std::move(row));
        }

        LOG_DEBUGF("Serializer", "Parsed %zu JSON rows from %s", rows.size(), source_path.c_str());
        return rows;
    }

    std::string JsonFormatSerializer::Render(const std::vector<Row>& rows,
                                             const RecordSchema& schema) const
    {
        // 스키마 필드 순서를 유지하기 위해 직접 조립
        std::string out = "[";

        for (size_t i = 0; i < rows.size(); ++i)
        {
            const Row& row = rows[i];
            out += (i == 0) ? "\n  {" : ",\n  {";

            const auto& fields = schema.Fields();
            for (size_t f = 0; f < fields.size(); ++f)
            {
                const auto& field = fields[f];
                json value;
                try {
                    auto it = row.find(field.name);
                    value = (it == row.end())
                        ? RecordSchema::DefaultValue(field.type)
                        : FieldCodec::NormalizeJsonValue(*it, field.type);
                } catch (const std::invalid_argument& e) {
                    throw MalformedDataException("<render json>", i + 1,
                                                 "field '" + field.name + "': " + e.what());
                }

                if (f > 0) {
                    out += ", ";
                }
                out += json(field.name).dump();
                out += ": ";
                out += value.dump();
            }
            out += "}";
        }

        out += rows.empty() ? "]\n" : "\n]\n";
        return out;
    }

    Row JsonFormatSerializer::ParseObject(const std::string& text, const std::string& source_path) const
    {
        if (IsBlank(text)) {
            throw MalformedDataException(source_path, 1, "empty JSON source, expected an object");
        }

        json root;
        try {
            root = json::parse(text);
        } catch (const json::parse_error& e) {
            throw MalformedDataException(source_path, LineFromOffset(text, e.byte), e.what());
        }

        if (!root.is_object()) {
            throw MalformedDataException(source_path, 1,
                                         std::string("root must be an object, got ") + root.type_name());
        }

        LOG_DEBUGF("Serializer", "Parsed JSON object with %zu members from %s", root.size(), source_path.c_str());
        return root;
    }

    std::string JsonFormatSerializer::RenderObject(const Row& object) const
    {
        if (!object.is_object()) {
            throw MalformedDataException("<render json>", 0,
                                         std::string("expected an object, got ") + object.type_name());
        }
        return object.dump(2) + "\n";
    }

    size_t JsonFormatSerializer::LineFromOffset(const std::string& text, size_t byte_offset)
    {
        // parse_error::byte 는 마지막으로 읽은 문자 다음 위치 (1부터)
        size_t end = std::min(byte_offset > 0 ? byte_offset - 1 : 0, text.size());
        return 1 + static_cast<size_t>(std::count(text.begin(), text.begin() + static_cast<std::ptrdiff_t>(end), '\n'));
    }

    std::vector<size_t> JsonFormatSerializer::FindEntryLines(const std::string& text)
    {
        std::vector<size_t> lines;
        size_t line = 1;
        int depth = 0;
        bool in_string = false;
        bool escaped = false;
        bool expect_entry = false;

        for (char c : text)
        {
            if (c == '\n') {
                ++line;
            }

            if (in_string) {
                if (escaped) {
                    escaped = false;
                } else if (c == '\\') {
                    escaped = true;
                } else if (c == '"') {
                    in_string = false;
                }
                continue;
            }

            if (std::isspace(static_cast<unsigned char>(c))) {
                continue;
            }

            if (depth == 1 && expect_entry && c != ']') {
                lines.push_back(line);
                expect_entry = false;
            }

            switch (c) {
                case '"':
                    in_string = true;
                    break;
                case '[':
                case '{':
                    ++depth;
                    if (depth == 1) {
                        expect_entry = true;
                    }
                    break;
                case ']':
                case '}':
                    --depth;
                    break;
                case ',':
                    if (depth == 1) {
                        expect_entry = true;
                    }
                    break;
                default:
                    break;
            }
        }
        return lines;
    }

} // namespace data_engine::serialization
