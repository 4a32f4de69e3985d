// src/common/storage/src/FileStorageProvider.cpp
#include "common/storage/include/FileStorageProvider.hpp"
#include "common/storage/include/StoragePath.hpp"
#include "common/errors/DataException.hpp"
#include "common/utils/logger/Logger.hpp"
#include <algorithm>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace data_engine::storage
{
    FileStorageProvider::FileStorageProvider(const std::string& base_path)
        : base_path_(base_path)
    {
        LOG_DEBUGF("Storage", "FileStorageProvider created with base path: %s", base_path.c_str());
    }

    std::future<std::string> FileStorageProvider::LoadTextAsync(const std::string& path)
    {
        return std::async(std::launch::async, [this, path]() {
            return LoadText(path);
        });
    }

    std::future<void> FileStorageProvider::SaveTextAsync(const std::string& path, const std::string& content)
    {
        return std::async(std::launch::async, [this, path, content]() {
            SaveText(path, content);
        });
    }

    std::future<std::map<std::string, std::string>> FileStorageProvider::LoadMultipleTextAsync(
        const std::string& folder, const std::string& pattern)
    {
        return std::async(std::launch::async, [this, folder, pattern]() {
            return LoadMultipleText(folder, pattern);
        });
    }

    std::future<bool> FileStorageProvider::DeleteAsync(const std::string& path)
    {
        return std::async(std::launch::async, [this, path]() {
            return Delete(path);
        });
    }

    std::string FileStorageProvider::LoadText(const std::string& path) const
    {
        fs::path full_path = GetFullPath(path);

        if (!Exists(path))
        {
            throw NotFoundException("file " + full_path.string());
        }

        std::ifstream file(full_path, std::ios::in | std::ios::binary);
        if (!file.is_open())
        {
            throw IOFailureException("failed to open " + full_path.string());
        }

        std::stringstream buffer;
        buffer << file.rdbuf();

        if (file.bad())
        {
            throw IOFailureException("failed to read " + full_path.string());
        }

        LOG_DEBUGF("Storage", "Loaded %s (%zu bytes)", full_path.string().c_str(), buffer.str().size());
        return buffer.str();
    }

    void FileStorageProvider::SaveText(const std::string& path, const std::string& content) const
    {
        fs::path full_path = GetFullPath(path);

        std::error_code ec;
        fs::path directory = full_path.parent_path();
        if (!directory.empty() && !fs::exists(directory, ec))
        {
            fs::create_directories(directory, ec);
            if (ec)
            {
                throw IOFailureException("failed to create directory " + directory.string() + ": " + ec.message());
            }
        }

        std::ofstream file(full_path, std::ios::out | std::ios::binary | std::ios::trunc);
        if (!file.is_open())
        {
            throw IOFailureException("failed to open for writing " + full_path.string());
        }

        file.write(content.data(), static_cast<std::streamsize>(content.size()));
        file.flush();
        if (!file)
        {
            throw IOFailureException("failed to write " + full_path.string());
        }

        LOG_DEBUGF("Storage", "Saved %s (%zu bytes)", full_path.string().c_str(), content.size());
    }

    bool FileStorageProvider::Exists(const std::string& path) const noexcept
    {
        try
        {
            std::error_code ec;
            fs::path full_path = GetFullPath(path);
            return fs::is_regular_file(full_path, ec);
        }
        catch (const std::exception&)
        {
            return false;
        }
    }

    std::string FileStorageProvider::ResolveFilePath(const std::string& path) const
    {
        fs::path full_path = GetFullPath(path);

        std::error_code ec;
        fs::path absolute_path = fs::absolute(full_path, ec);
        if (ec)
        {
            return full_path.lexically_normal().string();
        }
        return absolute_path.lexically_normal().string();
    }

    std::vector<std::string> FileStorageProvider::ListFiles(const std::string& folder,
                                                            const std::string& pattern) const
    {
        std::vector<std::string> result;
        fs::path full_folder = GetFullPath(folder);

        std::error_code ec;
        if (!fs::is_directory(full_folder, ec))
        {
            return result;
        }

        for (fs::directory_iterator it(full_folder, ec), end; !ec && it != end; it.increment(ec))
        {
            if (!it->is_regular_file(ec))
            {
                continue;
            }
            std::string file_name = it->path().filename().string();
            if (MatchesPattern(file_name, pattern))
            {
                result.push_back(JoinLogicalPath(folder, file_name));
            }
        }

        if (ec)
        {
            throw IOFailureException("failed to list " + full_folder.string() + ": " + ec.message());
        }

        std::sort(result.begin(), result.end());
        return result;
    }

    std::map<std::string, std::string> FileStorageProvider::LoadMultipleText(const std::string& folder,
                                                                              const std::string& pattern) const
    {
        std::map<std::string, std::string> result;

        for (const std::string& file : ListFiles(folder, pattern))
        {
            result[file] = LoadText(file);
        }

        LOG_DEBUGF("Storage", "Loaded %zu files from %s (%s)", result.size(), folder.c_str(), pattern.c_str());
        return result;
    }

    bool FileStorageProvider::Delete(const std::string& path) const
    {
        fs::path full_path = GetFullPath(path);

        std::error_code ec;
        if (!fs::is_regular_file(full_path, ec))
        {
            return false;
        }

        if (!fs::remove(full_path, ec) || ec)
        {
            throw IOFailureException("failed to delete " + full_path.string() +
                                     (ec ? ": " + ec.message() : std::string()));
        }
        return true;
    }

    fs::path FileStorageProvider::GetFullPath(const std::string& path) const
    {
        std::string normalized = NormalizeLogicalPath(path);
        if (base_path_.empty())
        {
            return fs::path(normalized);
        }
        return base_path_ / fs::path(normalized);
    }

} // namespace data_engine::storage
