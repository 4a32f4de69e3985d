// src/common/types/DataFormat.hpp
#pragma once
#include <string>
#include <algorithm>
#include <cctype>

namespace data_engine
{
    enum class DataFormat
    {
        AUTO = 0,   // 파일 확장자로 판단
        JSON,
        CSV,
        UNKNOWN = 99
    };

    inline std::string DataFormatToString(DataFormat format) {
        switch (format) {
            case DataFormat::AUTO: return "AUTO";
            case DataFormat::JSON: return "JSON";
            case DataFormat::CSV: return "CSV";
            default: return "UNKNOWN";
        }
    }

    /**
     * @brief 경로에서 소문자 확장자 추출 ("Data/Items.JSON" -> ".json")
     * @return 확장자가 없으면 빈 문자열
     */
    inline std::string GetLowerExtension(const std::string& path) {
        size_t slash = path.find_last_of("/\\");
        size_t dot = path.find_last_of('.');
        if (dot == std::string::npos || (slash != std::string::npos && dot < slash)) {
            return "";
        }
        std::string ext = path.substr(dot);
        std::transform(ext.begin(), ext.end(), ext.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return ext;
    }

    inline DataFormat DetectFormatFromPath(const std::string& path) {
        std::string ext = GetLowerExtension(path);
        if (ext == ".json") return DataFormat::JSON;
        if (ext == ".csv") return DataFormat::CSV;
        return DataFormat::UNKNOWN;
    }

    // JSON -> ".json", AUTO/UNKNOWN -> ""
    inline std::string DataFormatToExtension(DataFormat format) {
        switch (format) {
            case DataFormat::JSON: return ".json";
            case DataFormat::CSV: return ".csv";
            default: return "";
        }
    }
}
