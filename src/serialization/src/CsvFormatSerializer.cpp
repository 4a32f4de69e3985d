// src/serialization/src/CsvFormatSerializer.cpp
#include "serialization/include/CsvFormatSerializer.hpp"
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
        const std::string kUtf8Bom = "\xEF\xBB\xBF";

        std::string Trim(const std::string& text)
        {
            size_t start = text.find_first_not_of(" \t");
            if (start == std::string::npos) {
                return "";
            }
            size_t end = text.find_last_not_of(" \t");
            return text.substr(start, end - start + 1);
        }
    }

    CsvFormatSerializer::CsvFormatSerializer(CsvOptions options)
        : options_(options)
    {
        if (options_.field_delimiter == options_.array_delimiter) {
            throw std::invalid_argument("CSV field and array delimiters must differ");
        }
        if (options_.field_delimiter == '"' || options_.field_delimiter == '\n' ||
            options_.field_delimiter == '\r') {
            throw std::invalid_argument("Invalid CSV field delimiter");
        }
    }

    // ========================================
    // Parse
    // ========================================

    std::vector<Row> CsvFormatSerializer::Parse(const std::string& text,
                                                const RecordSchema& schema,
                                                const std::string& source_path) const
    {
        std::vector<Row> rows;
        std::vector<CsvRecord> records = Tokenize(text, source_path);

        records.erase(std::remove_if(records.begin(), records.end(), IsBlankRecord), records.end());
        if (records.empty()) {
            LOG_DEBUGF("Serializer", "Empty CSV source: %s", source_path.c_str());
            return rows;
        }

        // 헤더 -> 스키마 필드 인덱스
        const CsvRecord& header = records.front();
        const auto& fields = schema.Fields();
        std::vector<int> field_columns(fields.size(), -1);

        for (size_t col = 0; col < header.cells.size(); ++col)
        {
            std::string name = Trim(header.cells[col]);
            if (!name.empty() && name[0] == '~') {
                continue;
            }

            const FieldDescriptor* field = schema.FindField(name);
            if (field == nullptr) {
                LOG_DEBUGF("Serializer", "Ignoring unknown column '%s' in %s", name.c_str(), source_path.c_str());
                continue;
            }

            size_t field_index = static_cast<size_t>(field - fields.data());
            if (field_columns[field_index] >= 0) {
                throw MalformedDataException(source_path, header.line,
                                             "duplicate column '" + name + "'");
            }
            field_columns[field_index] = static_cast<int>(col);
        }

        if (field_columns[schema.KeyIndex()] < 0) {
            throw MalformedDataException(source_path, header.line,
                                         "missing key column '" + schema.KeyField() + "'");
        }

        std::unordered_set<std::string> seen_keys;
        rows.reserve(records.size() - 1);

        for (size_t r = 1; r < records.size(); ++r)
        {
            const CsvRecord& record = records[r];
            if (record.cells.size() != header.cells.size()) {
                throw MalformedDataException(source_path, record.line,
                                             "expected " + std::to_string(header.cells.size()) +
                                             " columns, got " + std::to_string(record.cells.size()));
            }

            Row row = json::object();
            for (size_t f = 0; f < fields.size(); ++f)
            {
                const auto& field = fields[f];
                if (field_columns[f] < 0) {
                    row[field.name] = RecordSchema::DefaultValue(field.type);
                    continue;
                }

                const std::string& cell = record.cells[static_cast<size_t>(field_columns[f])];
                if (f == schema.KeyIndex() && cell.empty()) {
                    throw MalformedDataException(source_path, record.line,
                                                 "empty key field '" + field.name + "'");
                }

                try {
                    row[field.name] = FieldCodec::ParseCell(cell, field.type, options_.array_delimiter);
                } catch (const std::invalid_argument& e) {
                    throw MalformedDataException(source_path, record.line,
                                                 "field '" + field.name + "': " + e.what());
                }
            }

            std::string key_text = RecordSchema::KeyToString(row[schema.KeyField()]);
            if (!seen_keys.insert(key_text).second) {
                throw DuplicateKeyException(source_path, record.line, key_text);
            }

            rows.push_back(std::move(row));
        }

        LOG_DEBUGF("Serializer", "Parsed %zu CSV rows from %s", rows.size(), source_path.c_str());
        return rows;
    }

    // ========================================
    // Render
    // ========================================

    std::string CsvFormatSerializer::Render(const std::vector<Row>& rows,
                                            const RecordSchema& schema) const
    {
        const auto& fields = schema.Fields();
        std::string out;

        for (size_t f = 0; f < fields.size(); ++f) {
            if (f > 0) {
                out += options_.field_delimiter;
            }
            out += EscapeCell(fields[f].name);
        }
        out += '\n';

        for (size_t i = 0; i < rows.size(); ++i)
        {
            const Row& row = rows[i];
            for (size_t f = 0; f < fields.size(); ++f)
            {
                const auto& field = fields[f];
                std::string cell;
                try {
                    auto it = row.find(field.name);
                    if (it != row.end() && !it->is_null()) {
                        cell = FieldCodec::FormatCell(*it, field.type, options_.array_delimiter);
                    } else {
                        cell = FieldCodec::FormatCell(RecordSchema::DefaultValue(field.type),
                                                      field.type, options_.array_delimiter);
                    }
                } catch (const std::invalid_argument& e) {
                    throw MalformedDataException("<render csv>", i + 2,
                                                 "field '" + field.name + "': " + e.what());
                }

                if (f > 0) {
                    out += options_.field_delimiter;
                }
                out += EscapeCell(cell);
            }
            out += '\n';
        }

        return out;
    }

    // ========================================
    // Tokenizer
    // ========================================

    std::vector<CsvFormatSerializer::CsvRecord> CsvFormatSerializer::Tokenize(
        const std::string& text, const std::string& source_path) const
    {
        std::vector<CsvRecord> records;

        size_t start = 0;
        if (text.compare(0, kUtf8Bom.size(), kUtf8Bom) == 0) {
            start = kUtf8Bom.size();
        }

        CsvRecord record;
        record.line = 1;
        std::string cell;
        bool in_quotes = false;
        size_t line = 1;
        size_t quote_line = 0;

        for (size_t i = start; i < text.size(); ++i)
        {
            char c = text[i];

            if (in_quotes)
            {
                if (c == '"') {
                    if (i + 1 < text.size() && text[i + 1] == '"') {
                        cell += '"';
                        ++i;
                    } else {
                        in_quotes = false;
                    }
                } else {
                    if (c == '\n') {
                        ++line;
                    }
                    cell += c;
                }
                continue;
            }

            if (c == '"') {
                in_quotes = true;
                record.quoted = true;
                quote_line = line;
            } else if (c == options_.field_delimiter) {
                record.cells.push_back(std::move(cell));
                cell.clear();
            } else if (c == '\r' && i + 1 < text.size() && text[i + 1] == '\n') {
                // CRLF 의 CR
            } else if (c == '\n') {
                record.cells.push_back(std::move(cell));
                cell.clear();
                records.push_back(std::move(record));

                ++line;
                record = CsvRecord();
                record.line = line;
            } else {
                cell += c;
            }
        }

        if (in_quotes) {
            throw MalformedDataException(source_path, quote_line, "unterminated quoted field");
        }

        // 마지막 줄에 개행이 없는 경우
        if (!cell.empty() || !record.cells.empty() || record.quoted) {
            record.cells.push_back(std::move(cell));
            records.push_back(std::move(record));
        }

        return records;
    }

    std::string CsvFormatSerializer::EscapeCell(const std::string& value) const
    {
        bool needs_quotes = value.find(options_.field_delimiter) != std::string::npos ||
                            value.find_first_of("\"\r\n") != std::string::npos;
        if (!needs_quotes) {
            return value;
        }

        std::string escaped = "\"";
        for (char c : value) {
            if (c == '"') {
                escaped += "\"\"";
            } else {
                escaped += c;
            }
        }
        escaped += '"';
        return escaped;
    }

    bool CsvFormatSerializer::IsBlankRecord(const CsvRecord& record)
    {
        if (record.quoted || record.cells.size() != 1) {
            return false;
        }
        const std::string& only = record.cells.front();
        return std::all_of(only.begin(), only.end(),
                           [](unsigned char c) { return std::isspace(c) != 0; });
    }

} // namespace data_engine::serialization
