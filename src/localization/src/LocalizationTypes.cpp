// src/localization/src/LocalizationTypes.cpp
#include "localization/include/LocalizationTypes.hpp"

using json = nlohmann::json;

namespace data_engine::localization
{
    using serialization::FieldType;
    using serialization::RecordSchema;

    const RecordSchema& LocalizationKeyData::Schema()
    {
        static const RecordSchema schema("Id", {
            { "Id", FieldType::STRING },
            { "Description", FieldType::STRING },
            { "Category", FieldType::STRING },
            { "IsFixedKey", FieldType::BOOL }
        });
        return schema;
    }

    const RecordSchema& LocalizationEntry::Schema()
    {
        static const RecordSchema schema("Id", {
            { "Id", FieldType::STRING },
            { "Text", FieldType::STRING },
            { "Context", FieldType::STRING }
        });
        return schema;
    }

    void to_json(json& j, const LocalizationKeyData& data)
    {
        j = json{
            {"Id", data.Id},
            {"Description", data.Description},
            {"Category", data.Category},
            {"IsFixedKey", data.IsFixedKey}
        };
    }

    void from_json(const json& j, LocalizationKeyData& data)
    {
        j.at("Id").get_to(data.Id);
        j.at("Description").get_to(data.Description);
        j.at("Category").get_to(data.Category);
        j.at("IsFixedKey").get_to(data.IsFixedKey);
    }

    void to_json(json& j, const LocalizationEntry& entry)
    {
        j = json{
            {"Id", entry.Id},
            {"Text", entry.Text},
            {"Context", entry.Context}
        };
    }

    void from_json(const json& j, LocalizationEntry& entry)
    {
        j.at("Id").get_to(entry.Id);
        j.at("Text").get_to(entry.Text);
        j.at("Context").get_to(entry.Context);
    }
}
