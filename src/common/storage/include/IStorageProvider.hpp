// src/common/storage/include/IStorageProvider.hpp
#pragma once

#include <future>
#include <map>
#include <string>
#include <vector>

namespace data_engine::storage
{
    /**
     * @brief 논리 경로 기반 텍스트 저장소 인터페이스
     *
     * 데이터 형태는 알지 못하며, 텍스트 읽기/쓰기와 폴더 단위 조회만 담당한다.
     * 논리 경로는 항상 '/' 구분자를 사용하는 상대 경로 ("Localizations/en.csv").
     *
     * 구현체:
     * - FileStorageProvider: 로컬 파일 시스템 (base_path 기준)
     * - InMemoryStorageProvider: 메모리 리소스 번들 / 테스트용 가상 파일 시스템
     *
     * 비동기 메서드의 예외는 future.get() 시점에 전달된다.
     * 반환된 future가 끝나기 전에 provider를 파괴하면 안 된다.
     *
     * 사용 예시:
     * ```cpp
     * auto provider = std::make_unique<FileStorageProvider>("Resources");
     * std::string csv = provider->LoadTextAsync("Characters.csv").get();
     * auto languages = provider->LoadMultipleTextAsync("Localizations", "*.csv").get();
     * ```
     */
    class IStorageProvider
    {
    public:
        virtual ~IStorageProvider() = default;

        /**
         * @brief 텍스트 읽기
         * @throws NotFoundException 경로에 내용이 없을 때
         * @throws IOFailureException 읽기 실패 시
         */
        virtual std::future<std::string> LoadTextAsync(const std::string& path) = 0;

        /**
         * @brief 텍스트 저장 (중간 디렉토리 생성, 기존 내용 덮어쓰기)
         * @throws IOFailureException 쓰기 실패 시
         */
        virtual std::future<void> SaveTextAsync(const std::string& path, const std::string& content) = 0;

        /**
         * @brief 존재 확인. 예외를 던지지 않는다.
         */
        virtual bool Exists(const std::string& path) const noexcept = 0;

        /**
         * @brief 진단용 절대 경로. I/O 없음.
         */
        virtual std::string ResolveFilePath(const std::string& path) const = 0;

        /**
         * @brief 폴더 최상위의 패턴 일치 파일을 모두 읽기 (하위 폴더 제외)
         * @param folder 논리 폴더 경로
         * @param pattern glob 패턴 ('*', '?')
         * @return 논리 경로 -> 내용. 폴더가 없으면 빈 map (오류 아님)
         */
        virtual std::future<std::map<std::string, std::string>> LoadMultipleTextAsync(
            const std::string& folder, const std::string& pattern = "*.json") = 0;

        /**
         * @brief 폴더 최상위의 패턴 일치 파일 목록 (내용 없이)
         * @return 정렬된 논리 경로 목록. 폴더가 없으면 빈 목록
         */
        virtual std::vector<std::string> ListFiles(const std::string& folder,
                                                   const std::string& pattern = "*") const = 0;

        /**
         * @brief 파일 삭제
         * @return 삭제했으면 true, 없었으면 false
         * @throws IOFailureException 삭제 실패 시
         */
        virtual std::future<bool> DeleteAsync(const std::string& path) = 0;

        /**
         * @brief 로그 / 진단용 이름 ("file", "memory")
         */
        virtual std::string Name() const = 0;
    };

} // namespace data_engine::storage
