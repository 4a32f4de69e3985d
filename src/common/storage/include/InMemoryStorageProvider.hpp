// src/common/storage/include/InMemoryStorageProvider.hpp
#pragma once

#include "common/storage/include/IStorageProvider.hpp"
#include <mutex>

namespace data_engine::storage
{
    /**
     * @brief 메모리 저장소 (리소스 번들 / 테스트용 가상 파일 시스템)
     *
     * 모든 연산은 호출 스레드에서 즉시 끝나고 준비된 future를 돌려준다.
     * read_only 모드는 읽기 전용 번들을 흉내내며, 쓰기/삭제 시 IOFailureException.
     */
    class InMemoryStorageProvider : public IStorageProvider
    {
    public:
        InMemoryStorageProvider() = default;
        explicit InMemoryStorageProvider(std::map<std::string, std::string> files);
        ~InMemoryStorageProvider() override = default;

        std::future<std::string> LoadTextAsync(const std::string& path) override;
        std::future<void> SaveTextAsync(const std::string& path, const std::string& content) override;
        bool Exists(const std::string& path) const noexcept override;
        std::string ResolveFilePath(const std::string& path) const override;
        std::future<std::map<std::string, std::string>> LoadMultipleTextAsync(
            const std::string& folder, const std::string& pattern = "*.json") override;
        std::vector<std::string> ListFiles(const std::string& folder,
                                           const std::string& pattern = "*") const override;
        std::future<bool> DeleteAsync(const std::string& path) override;
        std::string Name() const override { return "memory"; }

        // 동기 헬퍼 (번들 구성 / 테스트 검증용)
        void PutFile(const std::string& path, const std::string& content);
        std::string GetFile(const std::string& path) const;
        size_t FileCount() const;

        void SetReadOnly(bool read_only);
        bool IsReadOnly() const;

    private:
        std::map<std::string, std::string> files_;
        bool read_only_ = false;
        mutable std::mutex files_mutex_;
    };

} // namespace data_engine::storage
