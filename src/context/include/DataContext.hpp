// src/context/include/DataContext.hpp
#pragma once
#include "context/include/ContextOperationException.hpp"
#include "repository/include/IRepository.hpp"
#include "localization/include/LocalizationContext.hpp"
#include "common/config/ContextConfig.hpp"
#include "common/storage/include/IStorageProvider.hpp"
#include "serialization/include/SerializerFactory.hpp"
#include <atomic>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace data_engine::context
{
    enum class ContextState
    {
        NOT_LOADED = 0,
        LOADED,
        FAILED      // 마지막 LoadAll 실패, 데이터를 신뢰할 수 없음
    };

    const char* ContextStateToString(ContextState state);

    /**
     * @brief 한 데이터 세트의 Repository 묶음
     *
     * Storage Provider 는 Context 가 독점 소유하고, SerializerFactory 는 공유한다.
     * 파생 클래스가 Repository 멤버를 선언하고 생성자에서 순서대로 등록한다.
     * 첫 LoadAll / SaveAll 이후에는 등록할 수 없다.
     *
     * LoadAll 은 첫 실패에서 중단한다. 공유 취소 플래그를 각 Repository 시작 전과
     * 교체 직전에 확인하고, 실패는 ContextOperationException 으로 다시 던진다.
     * 실패한 Context 는 FAILED 상태가 된다.
     *
     * 사용 예시:
     * ```cpp
     * class GameDataContext : public DataContext
     * {
     * public:
     *     GameDataContext(std::unique_ptr<IStorageProvider> provider,
     *                     std::shared_ptr<const SerializerFactory> factory,
     *                     ContextConfig config)
     *         : DataContext(std::move(provider), std::move(factory), std::move(config))
     *     {
     *         RegisterRepository(characters);
     *     }
     *
     *     Repository<std::string, Character> characters{"Character", "Characters.csv", Character::Schema()};
     * };
     * ```
     */
    class DataContext
    {
    public:
        /**
         * @throws std::invalid_argument null provider / factory
         * @throws config::ConfigException 설정 검증 실패
         */
        DataContext(std::unique_ptr<storage::IStorageProvider> provider,
                    std::shared_ptr<const serialization::SerializerFactory> factory,
                    config::ContextConfig config);
        virtual ~DataContext();

        DataContext(const DataContext&) = delete;
        DataContext& operator=(const DataContext&) = delete;

        /**
         * @brief 등록된 모든 Repository 로드 (로컬라이제이션은 마지막)
         * @throws ContextOperationException 첫 실패
         */
        void LoadAll();
        std::future<void> LoadAllAsync();

        /**
         * @brief 등록 순서대로 저장, 첫 실패에서 중단 (상태는 바뀌지 않음)
         * @throws ContextOperationException
         */
        void SaveAll();
        std::future<void> SaveAllAsync();

        /**
         * @brief Repository 하나만 다시 로드. 실패하면 그 Repository 는 이전 상태 유지
         * @throws NotFoundException 등록되지 않은 이름
         * @throws ContextOperationException 로드 실패
         */
        void Reload(const std::string& repository_name);

        /**
         * @throws NotFoundException 등록되지 않은 이름
         */
        repository::IRepository& GetRepository(const std::string& name) const;
        std::vector<std::string> GetRepositoryNames() const;

        ContextState GetState() const { return state_.load(); }
        bool IsLoaded() const { return state_.load() == ContextState::LOADED; }

        const std::string& Name() const { return config_.context_name; }
        const config::ContextConfig& Config() const { return config_; }
        storage::IStorageProvider& StorageProvider() const { return *provider_; }
        const serialization::SerializerFactory& Serializers() const { return *factory_; }

        // 설정의 CSV 구분자로 만든 기본 SerializerFactory
        static std::shared_ptr<const serialization::SerializerFactory> CreateSerializerFactory(
            const config::ContextConfig& config);

        // localization_enabled 가 false 면 nullptr
        localization::LocalizationContext* Localization() const { return localization_.get(); }

    protected:
        /**
         * @throws std::logic_error 첫 LoadAll / SaveAll 이후 등록
         * @throws std::invalid_argument 같은 이름이 이미 등록됨
         */
        void RegisterRepository(repository::IRepository& repository);

    private:
        void LoadRepositoriesConcurrently(std::atomic<bool>& cancelled);
        void LoadRepositoriesSequentially(std::atomic<bool>& cancelled);
        void LoadLocalization(std::atomic<bool>& cancelled);

        // 실패하면 cancelled 를 세우고 ContextOperationException 으로 감싸서 던진다
        void LoadRepository(repository::IRepository& repository, std::atomic<bool>& cancelled);

        ContextOperationException MakeFailure(const std::string& operation,
                                              const std::string& repository_name,
                                              const std::string& path,
                                              std::optional<ErrorKind> cause_kind,
                                              const char* cause_message) const;

        config::ContextConfig config_;
        std::unique_ptr<storage::IStorageProvider> provider_;
        std::shared_ptr<const serialization::SerializerFactory> factory_;
        std::unique_ptr<localization::LocalizationContext> localization_;

        std::vector<repository::IRepository*> repositories_;
        std::atomic<ContextState> state_{ContextState::NOT_LOADED};
        std::atomic<bool> registration_closed_{false};

        // 같은 Context 에 대한 LoadAll / SaveAll / Reload 는 순서대로 실행
        std::mutex operation_mutex_;
    };

} // namespace data_engine::context
