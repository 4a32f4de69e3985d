// src/common/storage/include/FileStorageProvider.hpp
#pragma once

#include "common/storage/include/IStorageProvider.hpp"
#include <filesystem>

namespace data_engine::storage
{
    /**
     * @brief 로컬 파일 시스템 저장소
     *
     * 표준 C++ filesystem 사용. 모든 논리 경로는 base_path 기준으로 해석한다.
     * 비동기 호출은 각각 std::async 작업으로 실행되며, 작업 수명은 반환된 future에 묶인다.
     */
    class FileStorageProvider : public IStorageProvider
    {
    public:
        explicit FileStorageProvider(const std::string& base_path);
        ~FileStorageProvider() override = default;

        std::future<std::string> LoadTextAsync(const std::string& path) override;
        std::future<void> SaveTextAsync(const std::string& path, const std::string& content) override;
        bool Exists(const std::string& path) const noexcept override;
        std::string ResolveFilePath(const std::string& path) const override;
        std::future<std::map<std::string, std::string>> LoadMultipleTextAsync(
            const std::string& folder, const std::string& pattern = "*.json") override;
        std::vector<std::string> ListFiles(const std::string& folder,
                                           const std::string& pattern = "*") const override;
        std::future<bool> DeleteAsync(const std::string& path) override;
        std::string Name() const override { return "file"; }

        const std::filesystem::path& BasePath() const { return base_path_; }

    private:
        std::string LoadText(const std::string& path) const;
        void SaveText(const std::string& path, const std::string& content) const;
        std::map<std::string, std::string> LoadMultipleText(const std::string& folder,
                                                            const std::string& pattern) const;
        bool Delete(const std::string& path) const;

        /**
         * @brief 논리 경로 -> 실제 경로 (base_path 결합)
         */
        std::filesystem::path GetFullPath(const std::string& path) const;

        std::filesystem::path base_path_;
    };

} // namespace data_engine::storage
