// src/common/storage/src/InMemoryStorageProvider.cpp
#include "common/storage/include/InMemoryStorageProvider.hpp"
#include "common/storage/include/StoragePath.hpp"
#include "common/errors/DataException.hpp"
#include <exception>
#include <type_traits>

namespace data_engine::storage
{
    namespace
    {
        template<typename T, typename TFunc>
        std::future<T> RunReady(TFunc func)
        {
            std::promise<T> promise;
            try {
                if constexpr (std::is_void_v<T>) {
                    func();
                    promise.set_value();
                } else {
                    promise.set_value(func());
                }
            } catch (const std::exception&) {
                promise.set_exception(std::current_exception());
            }
            return promise.get_future();
        }
    }

    InMemoryStorageProvider::InMemoryStorageProvider(std::map<std::string, std::string> files)
    {
        for (auto& entry : files) {
            files_[NormalizeLogicalPath(entry.first)] = std::move(entry.second);
        }
    }

    std::future<std::string> InMemoryStorageProvider::LoadTextAsync(const std::string& path)
    {
        return RunReady<std::string>([this, &path]() {
            return GetFile(path);
        });
    }

    std::future<void> InMemoryStorageProvider::SaveTextAsync(const std::string& path, const std::string& content)
    {
        return RunReady<void>([this, &path, &content]() {
            PutFile(path, content);
        });
    }

    std::future<std::map<std::string, std::string>> InMemoryStorageProvider::LoadMultipleTextAsync(
        const std::string& folder, const std::string& pattern)
    {
        return RunReady<std::map<std::string, std::string>>([this, &folder, &pattern]() {
            std::map<std::string, std::string> result;
            for (const std::string& file : ListFiles(folder, pattern)) {
                result[file] = GetFile(file);
            }
            return result;
        });
    }

    std::future<bool> InMemoryStorageProvider::DeleteAsync(const std::string& path)
    {
        return RunReady<bool>([this, &path]() {
            std::lock_guard<std::mutex> lock(files_mutex_);
            if (read_only_) {
                throw IOFailureException("storage is read-only: " + path);
            }
            return files_.erase(NormalizeLogicalPath(path)) > 0;
        });
    }

    bool InMemoryStorageProvider::Exists(const std::string& path) const noexcept
    {
        try {
            std::lock_guard<std::mutex> lock(files_mutex_);
            return files_.find(NormalizeLogicalPath(path)) != files_.end();
        } catch (const std::exception&) {
            return false;
        }
    }

    std::string InMemoryStorageProvider::ResolveFilePath(const std::string& path) const
    {
        return "memory://" + NormalizeLogicalPath(path);
    }

    std::vector<std::string> InMemoryStorageProvider::ListFiles(const std::string& folder,
                                                                const std::string& pattern) const
    {
        std::string prefix = NormalizeLogicalPath(folder);
        if (prefix == ".") {
            prefix.clear();
        }
        if (!prefix.empty() && prefix.back() != '/') {
            prefix += '/';
        }

        std::vector<std::string> result;
        std::lock_guard<std::mutex> lock(files_mutex_);

        for (auto it = files_.lower_bound(prefix); it != files_.end(); ++it)
        {
            const std::string& path = it->first;
            if (path.compare(0, prefix.size(), prefix) != 0) {
                break;
            }

            std::string rest = path.substr(prefix.size());
            // 하위 폴더 제외
            if (rest.empty() || rest.find('/') != std::string::npos) {
                continue;
            }
            if (MatchesPattern(rest, pattern)) {
                result.push_back(path);
            }
        }
        return result;
    }

    void InMemoryStorageProvider::PutFile(const std::string& path, const std::string& content)
    {
        std::lock_guard<std::mutex> lock(files_mutex_);
        if (read_only_) {
            throw IOFailureException("storage is read-only: " + path);
        }
        files_[NormalizeLogicalPath(path)] = content;
    }

    std::string InMemoryStorageProvider::GetFile(const std::string& path) const
    {
        std::lock_guard<std::mutex> lock(files_mutex_);
        auto it = files_.find(NormalizeLogicalPath(path));
        if (it == files_.end()) {
            throw NotFoundException("file " + ResolveFilePath(path));
        }
        return it->second;
    }

    size_t InMemoryStorageProvider::FileCount() const
    {
        std::lock_guard<std::mutex> lock(files_mutex_);
        return files_.size();
    }

    void InMemoryStorageProvider::SetReadOnly(bool read_only)
    {
        std::lock_guard<std::mutex> lock(files_mutex_);
        read_only_ = read_only;
    }

    bool InMemoryStorageProvider::IsReadOnly() const
    {
        std::lock_guard<std::mutex> lock(files_mutex_);
        return read_only_;
    }

} // namespace data_engine::storage
