// src/common/storage/include/StorageProviderFactory.hpp
#pragma once
#include "common/storage/include/IStorageProvider.hpp"
#include <memory>
#include <string>
#include <vector>

namespace data_engine::storage
{
    /**
     * @brief 설정 문자열로 Storage Provider 생성
     *
     * 각 DataContext는 자신의 provider를 독점 소유하므로 매번 새 인스턴스를 만든다.
     */
    class StorageProviderFactory
    {
    public:
        /**
         * @param backend "file" 또는 "memory" (대소문자/앞뒤 공백 무시)
         * @param base_path file 백엔드의 기준 디렉토리 (memory는 무시)
         * @throws std::invalid_argument 알 수 없는 backend
         */
        static std::unique_ptr<IStorageProvider> Create(
            const std::string& backend,
            const std::string& base_path = ""
        );

        static std::vector<std::string> GetSupportedBackends();
        static bool IsValidBackend(const std::string& backend);

    private:
        StorageProviderFactory() = delete;

        static std::string NormalizeBackend(const std::string& backend);
    };
}
