// src/serialization/src/SerializerFactory.cpp
#include "serialization/include/SerializerFactory.hpp"
#include "serialization/include/JsonFormatSerializer.hpp"
#include "common/errors/DataException.hpp"
#include "common/utils/logger/Logger.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace data_engine::serialization
{
    SerializerFactory::SerializerFactory(CsvOptions csv_options)
        : csv_options_(csv_options)
    {
        Register(".json", std::make_shared<JsonFormatSerializer>());
        Register(".csv", std::make_shared<CsvFormatSerializer>(csv_options_));
    }

    SerializerFactory& SerializerFactory::Register(const std::string& extension,
                                                   std::shared_ptr<const IFormatSerializer> serializer)
    {
        if (!serializer) {
            throw std::invalid_argument("Cannot register null serializer for " + extension);
        }

        std::string normalized = NormalizeExtension(extension);
        if (normalized.size() < 2) {
            throw std::invalid_argument("Invalid serializer extension: '" + extension + "'");
        }

        LOG_DEBUGF("Serializer", "Registered %s serializer for %s",
                   serializer->Name().c_str(), normalized.c_str());
        serializers_[normalized] = std::move(serializer);
        return *this;
    }

    std::shared_ptr<const IFormatSerializer> SerializerFactory::GetSerializer(const std::string& path,
                                                                              DataFormat format) const
    {
        std::string extension;
        if (format == DataFormat::AUTO) {
            extension = GetLowerExtension(path);
        } else {
            extension = DataFormatToExtension(format);
        }

        auto it = serializers_.find(extension);
        if (it == serializers_.end())
        {
            std::string requested = (format == DataFormat::AUTO)
                ? (extension.empty() ? "'" + path + "' (no extension)" : extension)
                : DataFormatToString(format);
            LOG_ERRORF("Serializer", "No serializer for %s", requested.c_str());
            throw UnsupportedFormatException(requested);
        }
        return it->second;
    }

    std::vector<std::string> SerializerFactory::GetSupportedExtensions() const
    {
        std::vector<std::string> extensions;
        extensions.reserve(serializers_.size());
        for (const auto& entry : serializers_) {
            extensions.push_back(entry.first);
        }
        return extensions;
    }

    bool SerializerFactory::IsSupported(const std::string& path) const
    {
        return serializers_.find(GetLowerExtension(path)) != serializers_.end();
    }

    std::string SerializerFactory::NormalizeExtension(const std::string& extension)
    {
        std::string normalized = extension;
        std::transform(normalized.begin(), normalized.end(), normalized.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (!normalized.empty() && normalized[0] != '.') {
            normalized.insert(normalized.begin(), '.');
        }
        return normalized;
    }

} // namespace data_engine::serialization
