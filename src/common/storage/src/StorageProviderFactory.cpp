// src/common/storage/src/StorageProviderFactory.cpp
#include "common/storage/include/StorageProviderFactory.hpp"
#include "common/storage/include/FileStorageProvider.hpp"
#include "common/storage/include/InMemoryStorageProvider.hpp"
#include "common/utils/logger/Logger.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace data_engine::storage
{
    std::unique_ptr<IStorageProvider> StorageProviderFactory::Create(
        const std::string& backend,
        const std::string& base_path
    )
    {
        std::string normalized = NormalizeBackend(backend);

        if (normalized == "file")
        {
            LOG_DEBUGF("Storage", "Creating FileStorageProvider with base path: %s", base_path.c_str());
            return std::make_unique<FileStorageProvider>(base_path);
        }
        else if (normalized == "memory")
        {
            LOG_DEBUG("Storage", "Creating InMemoryStorageProvider");
            return std::make_unique<InMemoryStorageProvider>();
        }

        std::string supported;
        auto backends = GetSupportedBackends();
        for (size_t i = 0; i < backends.size(); ++i) {
            supported += backends[i];
            if (i < backends.size() - 1) {
                supported += ", ";
            }
        }
        LOG_ERRORF("Storage", "Invalid storage backend: %s (supported: %s)", backend.c_str(), supported.c_str());

        throw std::invalid_argument("Invalid storage backend: " + backend);
    }

    std::vector<std::string> StorageProviderFactory::GetSupportedBackends()
    {
        return {
            "file",
            "memory"
        };
    }

    bool StorageProviderFactory::IsValidBackend(const std::string& backend)
    {
        std::string normalized = NormalizeBackend(backend);
        auto backends = GetSupportedBackends();

        return std::find(backends.begin(), backends.end(), normalized) != backends.end();
    }

    std::string StorageProviderFactory::NormalizeBackend(const std::string& backend)
    {
        std::string normalized = backend;

        std::transform(normalized.begin(), normalized.end(), normalized.begin(),
                      [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

        size_t start = normalized.find_first_not_of(" \t\r\n");
        if (start == std::string::npos) {
            return "";
        }

        size_t end = normalized.find_last_not_of(" \t\r\n");
        return normalized.substr(start, end - start + 1);
    }
}
