// src/localization/include/LocalizationContext.hpp
#pragma once
#include "localization/include/LocalizationTypes.hpp"
#include "repository/include/Repository.hpp"
#include "common/config/ContextConfig.hpp"
#include "common/storage/include/IStorageProvider.hpp"
#include "serialization/include/SerializerFactory.hpp"
#include <atomic>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace data_engine::localization
{
    using KeyRepository = repository::Repository<std::string, LocalizationKeyData>;
    using LanguageRepository = repository::Repository<std::string, LocalizationEntry>;

    enum class MissingKind
    {
        UNKNOWN_KEY = 0,           // 키 테이블에 없는 키
        MISSING_TRANSLATION        // 요청 언어에 번역이 없거나 빈 텍스트
    };

    const char* MissingKindToString(MissingKind kind);

    // (key, language, kind). Resolve 호출 스레드에서 내부 잠금 없이 호출된다.
    using MissingTranslationHandler =
        std::function<void(const std::string&, const std::string&, MissingKind)>;

    /**
     * @brief 키 테이블 + 언어별 테이블 + 폴백 체인
     *
     * 해석 순서: 요청 언어 -> 기본 언어 -> 키 문자열 그대로.
     * Resolve 는 예외를 던지지 않는다. 누락은 WARN 로그와
     * MissingTranslationHandler 로 알린다.
     *
     * 언어 코드는 파일 이름에서 얻는다 (Localizations/ko.csv -> "ko").
     * 키 테이블 파일은 언어 파일 목록에서 제외된다.
     *
     * preload_all_languages = false 이면 Load 는 기본 언어만 읽고,
     * 다른 언어는 SetActiveLanguage / Resolve 에서 처음 쓸 때 읽어 계속 보관한다.
     * Load 때 발견하지 못한 언어는 파일을 읽지 않고 누락으로 처리한다.
     * 파일이 없는 언어도 한 번 확인한 뒤에는 다시 읽지 않는다.
     *
     * 사용 예시:
     * ```cpp
     * LocalizationContext loc(provider, factory, config);
     * loc.Load();
     * loc.SetActiveLanguage("ko");
     * std::string title = loc.Resolve("UI_Title");
     * ```
     */
    class LocalizationContext
    {
    public:
        LocalizationContext(storage::IStorageProvider& provider,
                            const serialization::SerializerFactory& factory,
                            const config::ContextConfig& config);

        /**
         * @brief 키 테이블과 언어 테이블 로드
         *
         * 키 테이블이 먼저, 그 다음 언어 테이블. 모두 성공했을 때만 교체한다.
         * 기본 언어 파일이 없는 것은 오류가 아니다 (키 문자열로 폴백).
         *
         * @return cancelled 로 중단되면 false
         * @throws DataException 키 테이블 없음 / 파싱 오류 / I/O 오류
         */
        bool Load(const std::atomic<bool>* cancelled = nullptr);
        bool IsLoaded() const;

        // ========================================
        // 해석
        // ========================================

        std::string Resolve(const std::string& key, const std::string& language) const;
        std::string Resolve(const std::string& key) const;

        // 키 테이블 전체에 대한 language 기준 해석 결과
        std::map<std::string, std::string> GetResolvedView(const std::string& language) const;

        void SetMissingTranslationHandler(MissingTranslationHandler handler);

        // ========================================
        // 언어
        // ========================================

        /**
         * @brief 활성 언어 변경, 필요하면 그 언어 파일을 처음 읽는다
         * @throws std::invalid_argument 빈 코드 또는 경로 문자가 들어간 코드
         * @throws MalformedDataException 언어 파일 파싱 실패 (활성 언어는 그대로)
         */
        void SetActiveLanguage(const std::string& language);
        std::string ActiveLanguage() const;

        // 비어 있지 않고 경로 구분자('/', '\\')나 ".." 가 없는 코드만 허용
        static bool IsValidLanguageCode(const std::string& language);
        const std::string& DefaultLanguage() const { return default_language_; }

        // 저장소에서 발견된 언어 + 메모리에 만든 언어 (정렬)
        std::vector<std::string> GetAvailableLanguages() const;
        std::vector<std::string> GetLoadedLanguages() const;
        bool IsLanguageLoaded(const std::string& language) const;

        // ========================================
        // 키 / 번역 조회
        // ========================================

        std::vector<std::string> GetAllKeys() const;
        // 복사본을 돌려준다 (다음 Load 와 무관)
        std::optional<LocalizationKeyData> GetKeyData(const std::string& key) const;
        bool HasKey(const std::string& key) const;

        // 로드된 언어에 비어 있지 않은 텍스트가 있는지 (파일을 읽지는 않는다)
        bool HasTranslation(const std::string& key, const std::string& language) const;

        // ========================================
        // 편집 / 저장
        // ========================================

        /**
         * @brief 활성 언어의 텍스트 설정 (기존 Context 유지)
         *
         * 활성 언어 테이블이 없으면 새로 만든다.
         * @throws std::invalid_argument 빈 키
         */
        void SetText(const std::string& key, const std::string& text);

        /**
         * @throws NotFoundException 메모리에 없는 언어
         * @throws IOFailureException 저장 실패
         */
        void SaveLanguage(const std::string& language);

        // 키 테이블 + 메모리에 있는 모든 언어 저장
        void SaveAll();

        std::string GetLanguageFilePath(const std::string& language) const;

    private:
        struct MissingReport
        {
            std::string key;
            std::string language;
            MissingKind kind;
        };

        std::string ResolveLocked(const std::string& key, const std::string& language,
                                  std::vector<MissingReport>& reports) const;
        void Report(const std::vector<MissingReport>& reports) const;

        // 로드된 언어 테이블, lazy 모드면 여기서 처음 읽는다. 없으면 nullptr (예외 없음)
        const LanguageRepository* FindLanguageLocked(const std::string& language) const;

        // 파일이 없으면 nullptr 를 돌려주고 missing 으로 기록, 파싱 오류는 그대로 던진다
        LanguageRepository* LoadLanguageLocked(const std::string& language) const;

        // 키 테이블과 지원하지 않는 확장자를 뺀 언어 파일 목록
        std::vector<std::string> DiscoverLanguageFiles() const;
        bool IsKeyTablePath(const std::string& path) const;
        std::string LanguageExtension() const;

        storage::IStorageProvider& provider_;
        const serialization::SerializerFactory& factory_;

        std::string key_path_;
        std::string data_path_;
        std::string file_pattern_;
        std::string default_language_;
        bool preload_all_;

        std::unique_ptr<KeyRepository> key_repository_;

        // 아래는 mutex_ 로 보호 (Resolve 의 lazy 로드 포함)
        mutable std::mutex mutex_;
        mutable std::map<std::string, std::unique_ptr<LanguageRepository>> languages_;
        mutable std::set<std::string> missing_languages_;
        std::map<std::string, std::string> language_files_;   // 발견된 언어 -> 파일 경로
        std::string active_language_;
        bool loaded_ = false;

        MissingTranslationHandler missing_handler_;
    };

} // namespace data_engine::localization
