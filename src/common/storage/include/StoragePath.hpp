// src/common/storage/include/StoragePath.hpp
#pragma once

#include <fnmatch.h>
#include <string>

namespace data_engine::storage
{
    // '\' -> '/', 앞쪽 "./" 제거, 연속된 '/' 하나로
    inline std::string NormalizeLogicalPath(const std::string& path)
    {
        std::string result;
        result.reserve(path.size());

        for (char c : path) {
            char ch = (c == '\\') ? '/' : c;
            if (ch == '/' && !result.empty() && result.back() == '/') {
                continue;
            }
            result += ch;
        }

        while (result.size() >= 2 && result[0] == '.' && result[1] == '/') {
            result.erase(0, 2);
        }
        return result;
    }

    inline std::string JoinLogicalPath(const std::string& folder, const std::string& name)
    {
        std::string base = NormalizeLogicalPath(folder);
        if (base.empty() || base == ".") {
            return NormalizeLogicalPath(name);
        }
        if (base.back() != '/') {
            base += '/';
        }
        return NormalizeLogicalPath(base + name);
    }

    inline std::string GetFileName(const std::string& path)
    {
        std::string normalized = NormalizeLogicalPath(path);
        size_t slash = normalized.find_last_of('/');
        return slash == std::string::npos ? normalized : normalized.substr(slash + 1);
    }

    // "Localizations/zh-CN.csv" -> "zh-CN"
    inline std::string GetFileStem(const std::string& path)
    {
        std::string name = GetFileName(path);
        size_t dot = name.find_last_of('.');
        return (dot == std::string::npos || dot == 0) ? name : name.substr(0, dot);
    }

    inline bool MatchesPattern(const std::string& file_name, const std::string& pattern)
    {
        if (pattern.empty() || pattern == "*" || pattern == "*.*") {
            return true;
        }
        return fnmatch(pattern.c_str(), file_name.c_str(), 0) == 0;
    }

} // namespace data_engine::storage
