// src/localization/src/LocalizationContext.cpp
#include "localization/include/LocalizationContext.hpp"
#include "common/storage/include/StoragePath.hpp"
#include "common/errors/DataException.hpp"
#include "common/types/DataFormat.hpp"
#include "common/utils/logger/Logger.hpp"
#include <stdexcept>

namespace data_engine::localization
{
    namespace
    {
        const char* kKeyRepositoryName = "LocalizationKeys";
    }

    bool LocalizationContext::IsValidLanguageCode(const std::string& language)
    {
        return !language.empty() &&
               language.find_first_of("/\\") == std::string::npos &&
               language.find("..") == std::string::npos;
    }

    const char* MissingKindToString(MissingKind kind)
    {
        switch (kind) {
            case MissingKind::UNKNOWN_KEY: return "UNKNOWN_KEY";
            case MissingKind::MISSING_TRANSLATION: return "MISSING_TRANSLATION";
            default: return "UNKNOWN";
        }
    }

    LocalizationContext::LocalizationContext(storage::IStorageProvider& provider,
                                             const serialization::SerializerFactory& factory,
                                             const config::ContextConfig& config)
        : provider_(provider),
          factory_(factory),
          key_path_(storage::NormalizeLogicalPath(config.localization_key_path)),
          data_path_(storage::NormalizeLogicalPath(config.localization_data_path)),
          file_pattern_(config.language_file_pattern),
          default_language_(config.default_language),
          preload_all_(config.preload_all_languages),
          key_repository_(std::make_unique<KeyRepository>(kKeyRepositoryName, key_path_,
                                                          LocalizationKeyData::Schema())),
          active_language_(config.default_language)
    {
    }

    // ========================================
    // 로드
    // ========================================

    bool LocalizationContext::Load(const std::atomic<bool>* cancelled)
    {
        LOG_INFOF("Localization", "Loading localization keys from %s", key_path_.c_str());

        auto keys = std::make_unique<KeyRepository>(kKeyRepositoryName, key_path_,
                                                    LocalizationKeyData::Schema());
        if (!keys->Load(provider_, factory_, cancelled)) {
            return false;
        }

        std::map<std::string, std::unique_ptr<LanguageRepository>> languages;
        std::map<std::string, std::string> language_files;
        std::set<std::string> missing;

        if (preload_all_)
        {
            auto files = provider_.LoadMultipleTextAsync(data_path_, file_pattern_).get();
            for (const auto& [path, text] : files)
            {
                if (IsKeyTablePath(path)) {
                    continue;
                }
                if (!factory_.IsSupported(path)) {
                    LOG_WARNF("Localization", "Skipping unsupported language file: %s", path.c_str());
                    continue;
                }

                std::string language = storage::GetFileStem(path);
                auto repo = std::make_unique<LanguageRepository>(language, path, LocalizationEntry::Schema());
                if (!repo->LoadFromText(text, factory_, cancelled)) {
                    return false;
                }

                language_files[language] = path;
                languages[language] = std::move(repo);
            }
        }
        else
        {
            for (const std::string& path : DiscoverLanguageFiles()) {
                language_files[storage::GetFileStem(path)] = path;
            }

            auto file_it = language_files.find(default_language_);
            std::string path = (file_it != language_files.end())
                ? file_it->second
                : GetLanguageFilePath(default_language_);

            auto repo = std::make_unique<LanguageRepository>(default_language_, path, LocalizationEntry::Schema());
            try {
                if (!repo->Load(provider_, factory_, cancelled)) {
                    return false;
                }
                languages[default_language_] = std::move(repo);
            } catch (const NotFoundException&) {
                missing.insert(default_language_);
            }
        }

        if (languages.find(default_language_) == languages.end()) {
            LOG_WARNF("Localization", "Default language '%s' has no table in %s, keys will resolve to themselves",
                      default_language_.c_str(), data_path_.c_str());
            missing.insert(default_language_);
        }

        if (cancelled != nullptr && cancelled->load()) {
            return false;
        }

        size_t key_count = keys->Count();
        size_t language_count = languages.size();
        {
            std::lock_guard<std::mutex> lock(mutex_);
            key_repository_ = std::move(keys);
            languages_ = std::move(languages);
            language_files_ = std::move(language_files);
            missing_languages_ = std::move(missing);
            loaded_ = true;
        }

        LOG_INFOF("Localization", "Loaded %zu keys and %zu language tables (%s mode)",
                  key_count, language_count, preload_all_ ? "preload" : "lazy");
        return true;
    }

    bool LocalizationContext::IsLoaded() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return loaded_;
    }

    // ========================================
    // 해석
    // ========================================

    std::string LocalizationContext::Resolve(const std::string& key, const std::string& language) const
    {
        if (key.empty()) {
            return "";
        }

        std::vector<MissingReport> reports;
        std::string result;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            result = ResolveLocked(key, language, reports);
        }
        Report(reports);
        return result;
    }

    std::string LocalizationContext::Resolve(const std::string& key) const
    {
        return Resolve(key, ActiveLanguage());
    }

    std::map<std::string, std::string> LocalizationContext::GetResolvedView(const std::string& language) const
    {
        std::map<std::string, std::string> view;
        std::vector<MissingReport> reports;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            for (const auto& entry : *key_repository_) {
                view[entry.first] = ResolveLocked(entry.first, language, reports);
            }
        }
        Report(reports);
        return view;
    }

    void LocalizationContext::SetMissingTranslationHandler(MissingTranslationHandler handler)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        missing_handler_ = std::move(handler);
    }

    std::string LocalizationContext::ResolveLocked(const std::string& key, const std::string& language,
                                                   std::vector<MissingReport>& reports) const
    {
        if (!key_repository_->Contains(key)) {
            reports.push_back({key, language, MissingKind::UNKNOWN_KEY});
            return key;
        }

        const LanguageRepository* target = FindLanguageLocked(language);
        if (target != nullptr) {
            const LocalizationEntry* entry = target->TryGet(key);
            if (entry != nullptr && !entry->Text.empty()) {
                return entry->Text;
            }
        }
        reports.push_back({key, language, MissingKind::MISSING_TRANSLATION});

        if (language != default_language_)
        {
            const LanguageRepository* fallback = FindLanguageLocked(default_language_);
            if (fallback != nullptr) {
                const LocalizationEntry* entry = fallback->TryGet(key);
                if (entry != nullptr && !entry->Text.empty()) {
                    return entry->Text;
                }
            }
            reports.push_back({key, default_language_, MissingKind::MISSING_TRANSLATION});
        }

        return key;
    }

    void LocalizationContext::Report(const std::vector<MissingReport>& reports) const
    {
        if (reports.empty()) {
            return;
        }

        // 핸들러는 잠금 밖에서 호출
        MissingTranslationHandler handler;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            handler = missing_handler_;
        }

        for (const auto& report : reports)
        {
            if (report.kind == MissingKind::UNKNOWN_KEY) {
                LOG_WARNF("Localization", "Unknown localization key '%s' (language: %s)",
                          report.key.c_str(), report.language.c_str());
            } else {
                LOG_WARNF("Localization", "Missing translation for '%s' in '%s'",
                          report.key.c_str(), report.language.c_str());
            }

            if (handler)
            {
                try {
                    handler(report.key, report.language, report.kind);
                } catch (const std::exception& e) {
                    LOG_ERRORF("Localization", "Missing translation handler threw: %s", e.what());
                }
            }
        }
    }

    // ========================================
    // 언어
    // ========================================

    void LocalizationContext::SetActiveLanguage(const std::string& language)
    {
        if (!IsValidLanguageCode(language)) {
            throw std::invalid_argument("Invalid language code: '" + language + "'");
        }

        std::lock_guard<std::mutex> lock(mutex_);

        const LanguageRepository* table = nullptr;
        auto it = languages_.find(language);
        if (it != languages_.end()) {
            table = it->second.get();
        } else if (loaded_) {
            table = LoadLanguageLocked(language);
        }

        if (table == nullptr && loaded_) {
            LOG_WARNF("Localization", "Language '%s' has no table, falling back to '%s'",
                      language.c_str(), default_language_.c_str());
        }

        active_language_ = language;
        LOG_INFOF("Localization", "Active language: %s", language.c_str());
    }

    std::string LocalizationContext::ActiveLanguage() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return active_language_;
    }

    std::vector<std::string> LocalizationContext::GetAvailableLanguages() const
    {
        std::lock_guard<std::mutex> lock(mutex_);

        std::set<std::string> languages;
        for (const auto& entry : language_files_) {
            languages.insert(entry.first);
        }
        for (const auto& entry : languages_) {
            languages.insert(entry.first);
        }
        return std::vector<std::string>(languages.begin(), languages.end());
    }

    std::vector<std::string> LocalizationContext::GetLoadedLanguages() const
    {
        std::lock_guard<std::mutex> lock(mutex_);

        std::vector<std::string> languages;
        for (const auto& entry : languages_) {
            languages.push_back(entry.first);
        }
        return languages;
    }

    bool LocalizationContext::IsLanguageLoaded(const std::string& language) const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return languages_.find(language) != languages_.end();
    }

    const LanguageRepository* LocalizationContext::FindLanguageLocked(const std::string& language) const
    {
        auto it = languages_.find(language);
        if (it != languages_.end()) {
            return it->second.get();
        }
        if (!loaded_ || !IsValidLanguageCode(language)) {
            return nullptr;
        }

        try {
            return LoadLanguageLocked(language);
        } catch (const DataException& e) {
            // 해석 중에는 던지지 않는다. 같은 파일을 반복해서 읽지 않도록 missing 처리
            LOG_ERRORF("Localization", "Failed to load language '%s': %s", language.c_str(), e.what());
            missing_languages_.insert(language);
            return nullptr;
        }
    }

    LanguageRepository* LocalizationContext::LoadLanguageLocked(const std::string& language) const
    {
        if (missing_languages_.count(language) > 0) {
            return nullptr;
        }

        // Load 때 발견한 언어 파일만 읽는다
        auto file_it = language_files_.find(language);
        if (file_it == language_files_.end()) {
            LOG_DEBUGF("Localization", "No language file discovered for '%s'", language.c_str());
            return nullptr;
        }
        const std::string& path = file_it->second;

        auto repo = std::make_unique<LanguageRepository>(language, path, LocalizationEntry::Schema());
        try {
            repo->Load(provider_, factory_);
        } catch (const NotFoundException&) {
            LOG_WARNF("Localization", "Language file not found for '%s': %s", language.c_str(), path.c_str());
            missing_languages_.insert(language);
            return nullptr;
        }

        LOG_INFOF("Localization", "Loaded language '%s' (%zu entries)", language.c_str(), repo->Count());

        LanguageRepository* raw = repo.get();
        languages_[language] = std::move(repo);
        return raw;
    }

    // ========================================
    // 키 / 번역 조회
    // ========================================

    std::vector<std::string> LocalizationContext::GetAllKeys() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return key_repository_->Keys();
    }

    std::optional<LocalizationKeyData> LocalizationContext::GetKeyData(const std::string& key) const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const LocalizationKeyData* data = key_repository_->TryGet(key);
        if (data == nullptr) {
            return std::nullopt;
        }
        return *data;
    }

    bool LocalizationContext::HasKey(const std::string& key) const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return key_repository_->Contains(key);
    }

    bool LocalizationContext::HasTranslation(const std::string& key, const std::string& language) const
    {
        std::lock_guard<std::mutex> lock(mutex_);

        auto it = languages_.find(language);
        if (it == languages_.end()) {
            return false;
        }
        const LocalizationEntry* entry = it->second->TryGet(key);
        return entry != nullptr && !entry->Text.empty();
    }

    // ========================================
    // 편집 / 저장
    // ========================================

    void LocalizationContext::SetText(const std::string& key, const std::string& text)
    {
        if (key.empty()) {
            throw std::invalid_argument("Localization key must not be empty");
        }

        std::lock_guard<std::mutex> lock(mutex_);

        LanguageRepository* table = nullptr;
        auto it = languages_.find(active_language_);
        if (it != languages_.end()) {
            table = it->second.get();
        } else if (loaded_) {
            table = LoadLanguageLocked(active_language_);
        }

        if (table == nullptr)
        {
            auto repo = std::make_unique<LanguageRepository>(active_language_,
                                                             GetLanguageFilePath(active_language_),
                                                             LocalizationEntry::Schema());
            table = repo.get();
            languages_[active_language_] = std::move(repo);
            missing_languages_.erase(active_language_);
            LOG_INFOF("Localization", "Created language table '%s'", active_language_.c_str());
        }

        if (!key_repository_->Contains(key)) {
            LOG_WARNF("Localization", "Setting text for unknown key '%s' in '%s'",
                      key.c_str(), active_language_.c_str());
        }

        LocalizationEntry entry;
        entry.Id = key;
        entry.Text = text;
        if (const LocalizationEntry* existing = table->TryGet(key)) {
            entry.Context = existing->Context;
        }
        table->Upsert(std::move(entry));
    }

    void LocalizationContext::SaveLanguage(const std::string& language)
    {
        std::lock_guard<std::mutex> lock(mutex_);

        auto it = languages_.find(language);
        if (it == languages_.end()) {
            throw NotFoundException("language table '" + language + "'");
        }

        it->second->Save(provider_, factory_);
        LOG_INFOF("Localization", "Saved language '%s' to %s", language.c_str(), it->second->Path().c_str());
    }

    void LocalizationContext::SaveAll()
    {
        std::lock_guard<std::mutex> lock(mutex_);

        key_repository_->Save(provider_, factory_);
        for (const auto& entry : languages_) {
            entry.second->Save(provider_, factory_);
        }

        LOG_INFOF("Localization", "Saved %zu keys and %zu language tables",
                  key_repository_->Count(), languages_.size());
    }

    std::string LocalizationContext::GetLanguageFilePath(const std::string& language) const
    {
        return storage::JoinLogicalPath(data_path_, language + LanguageExtension());
    }

    // ========================================
    // 내부
    // ========================================

    std::vector<std::string> LocalizationContext::DiscoverLanguageFiles() const
    {
        std::vector<std::string> result;
        for (const std::string& path : provider_.ListFiles(data_path_, file_pattern_))
        {
            if (IsKeyTablePath(path) || !factory_.IsSupported(path)) {
                continue;
            }
            result.push_back(path);
        }
        return result;
    }

    bool LocalizationContext::IsKeyTablePath(const std::string& path) const
    {
        return storage::NormalizeLogicalPath(path) == key_path_;
    }

    std::string LocalizationContext::LanguageExtension() const
    {
        std::string extension = GetLowerExtension(file_pattern_);
        if (extension.empty() || extension.find_first_of("*?[") != std::string::npos) {
            extension = GetLowerExtension(key_path_);
        }
        return extension.empty() ? ".csv" : extension;
    }

} // namespace data_engine::localization
