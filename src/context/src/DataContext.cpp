// src/context/src/DataContext.cpp
#include "context/include/DataContext.hpp"
#include "common/errors/DataException.hpp"
#include "common/utils/logger/Logger.hpp"
#include <chrono>
#include <stdexcept>
#include <system_error>

namespace data_engine::context
{
    const char* ContextStateToString(ContextState state)
    {
        switch (state) {
            case ContextState::NOT_LOADED: return "NOT_LOADED";
            case ContextState::LOADED: return "LOADED";
            case ContextState::FAILED: return "FAILED";
            default: return "UNKNOWN";
        }
    }

    DataContext::DataContext(std::unique_ptr<storage::IStorageProvider> provider,
                             std::shared_ptr<const serialization::SerializerFactory> factory,
                             config::ContextConfig config)
        : config_(std::move(config)),
          provider_(std::move(provider)),
          factory_(std::move(factory))
    {
        if (!provider_) {
            throw std::invalid_argument("DataContext requires a storage provider");
        }
        if (!factory_) {
            throw std::invalid_argument("DataContext requires a serializer factory");
        }

        config_.Validate();

        if (config_.enable_debug_logging) {
            utils::Logger::Instance().SetMinLevel(utils::LogLevel::DEBUG);
        }

        const auto& csv = factory_->GetCsvOptions();
        if (csv.field_delimiter != config_.csv_field_delimiter ||
            csv.array_delimiter != config_.csv_array_delimiter) {
            LOG_WARNF("Context", "[%s] Serializer factory CSV delimiters differ from context config",
                      config_.context_name.c_str());
        }

        if (config_.localization_enabled) {
            localization_ = std::make_unique<localization::LocalizationContext>(*provider_, *factory_, config_);
        }

        LOG_INFOF("Context", "[%s] Created (storage: %s, localization: %s)",
                  config_.context_name.c_str(), provider_->Name().c_str(),
                  config_.localization_enabled ? "enabled" : "disabled");
    }

    DataContext::~DataContext() = default;

    std::shared_ptr<const serialization::SerializerFactory> DataContext::CreateSerializerFactory(
        const config::ContextConfig& config)
    {
        serialization::CsvOptions options;
        options.field_delimiter = config.csv_field_delimiter;
        options.array_delimiter = config.csv_array_delimiter;
        return std::make_shared<const serialization::SerializerFactory>(options);
    }

    void DataContext::RegisterRepository(repository::IRepository& repository)
    {
        if (registration_closed_.load()) {
            throw std::logic_error("Cannot register repository '" + repository.Name() +
                                   "' after context '" + Name() + "' was loaded or saved");
        }

        for (const auto* existing : repositories_) {
            if (existing->Name() == repository.Name()) {
                throw std::invalid_argument("Repository '" + repository.Name() +
                                            "' is already registered in context '" + Name() + "'");
            }
        }

        repositories_.push_back(&repository);
        LOG_DEBUGF("Context", "[%s] Registered repository %s (%s)",
                   Name().c_str(), repository.Name().c_str(), repository.Path().c_str());
    }

    // ========================================
    // Load
    // ========================================

    void DataContext::LoadAll()
    {
        std::lock_guard<std::mutex> lock(operation_mutex_);
        registration_closed_.store(true);

        bool concurrent = config_.load_concurrently && repositories_.size() > 1;
        LOG_INFOF("Context", "[%s] Loading %zu repositories (%s)",
                  Name().c_str(), repositories_.size(), concurrent ? "concurrent" : "sequential");

        auto start = std::chrono::steady_clock::now();
        std::atomic<bool> cancelled{false};

        try {
            if (concurrent) {
                LoadRepositoriesConcurrently(cancelled);
            } else {
                LoadRepositoriesSequentially(cancelled);
            }

            if (localization_) {
                LoadLocalization(cancelled);
            }
        } catch (const ContextOperationException& e) {
            state_.store(ContextState::FAILED);
            LOG_ERRORF("Context", "[%s] LoadAll aborted: %s", Name().c_str(), e.what());
            throw;
        } catch (const std::exception& e) {
            // 작업 스레드 생성 실패 (std::system_error) 등
            state_.store(ContextState::FAILED);
            LOG_ERRORF("Context", "[%s] LoadAll failed: %s", Name().c_str(), e.what());
            throw;
        }

        state_.store(ContextState::LOADED);

        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start);
        LOG_INFOF("Context", "[%s] Loaded in %lld ms", Name().c_str(),
                  static_cast<long long>(elapsed.count()));
    }

    std::future<void> DataContext::LoadAllAsync()
    {
        return std::async(std::launch::async, [this]() {
            LoadAll();
        });
    }

    void DataContext::LoadRepositoriesConcurrently(std::atomic<bool>& cancelled)
    {
        // 가장 먼저 실패한 Repository 의 오류를 보고
        std::mutex failure_mutex;
        std::exception_ptr first_failure;

        std::vector<std::pair<std::string, std::future<void>>> futures;
        futures.reserve(repositories_.size());

        for (repository::IRepository* repository : repositories_)
        {
            std::future<void> future;
            try {
                future = std::async(std::launch::async, [this, repository, &cancelled, &failure_mutex, &first_failure]() {
                    try {
                        LoadRepository(*repository, cancelled);
                    } catch (const std::exception&) {
                        cancelled.store(true);
                        std::lock_guard<std::mutex> lock(failure_mutex);
                        if (!first_failure) {
                            first_failure = std::current_exception();
                        }
                    }
                });
            } catch (const std::system_error& e) {
                // 이미 시작한 작업은 커밋하지 않고 끝나기를 기다린다
                cancelled.store(true);
                LOG_ERRORF("Context", "[%s] Failed to start load task for %s: %s",
                           Name().c_str(), repository->Name().c_str(), e.what());
                for (auto& pair : futures) {
                    pair.second.wait();
                }
                throw;
            }

            futures.emplace_back(repository->Name(), std::move(future));
        }

        // 모든 작업이 끝날 때까지 대기 (cancelled 와 first_failure 가 이 스택에 있음)
        for (auto& pair : futures) {
            pair.second.get();
        }

        if (first_failure) {
            std::rethrow_exception(first_failure);
        }
    }

    void DataContext::LoadRepositoriesSequentially(std::atomic<bool>& cancelled)
    {
        for (repository::IRepository* repository : repositories_) {
            LoadRepository(*repository, cancelled);
        }
    }

    void DataContext::LoadRepository(repository::IRepository& repository, std::atomic<bool>& cancelled)
    {
        if (cancelled.load()) {
            LOG_DEBUGF("Context", "[%s] Skipping %s (load cancelled)", Name().c_str(), repository.Name().c_str());
            return;
        }

        try {
            if (repository.Load(*provider_, *factory_, &cancelled)) {
                LOG_INFOF("Context", "[%s] %s: %zu records",
                          Name().c_str(), repository.Name().c_str(), repository.Count());
            }
        } catch (const DataException& e) {
            cancelled.store(true);
            throw MakeFailure("load", repository.Name(), repository.Path(), e.Kind(), e.what());
        } catch (const std::exception& e) {
            cancelled.store(true);
            throw MakeFailure("load", repository.Name(), repository.Path(), std::nullopt, e.what());
        }
    }

    void DataContext::LoadLocalization(std::atomic<bool>& cancelled)
    {
        if (cancelled.load()) {
            return;
        }

        try {
            localization_->Load(&cancelled);
        } catch (const DataException& e) {
            cancelled.store(true);
            throw MakeFailure("load", "Localization", config_.localization_key_path, e.Kind(), e.what());
        } catch (const std::exception& e) {
            cancelled.store(true);
            throw MakeFailure("load", "Localization", config_.localization_key_path, std::nullopt, e.what());
        }
    }

    void DataContext::Reload(const std::string& repository_name)
    {
        std::lock_guard<std::mutex> lock(operation_mutex_);

        repository::IRepository& repository = GetRepository(repository_name);
        std::atomic<bool> cancelled{false};

        LOG_INFOF("Context", "[%s] Reloading %s", Name().c_str(), repository_name.c_str());
        LoadRepository(repository, cancelled);
    }

    // ========================================
    // Save
    // ========================================

    void DataContext::SaveAll()
    {
        std::lock_guard<std::mutex> lock(operation_mutex_);
        registration_closed_.store(true);

        LOG_INFOF("Context", "[%s] Saving %zu repositories", Name().c_str(), repositories_.size());

        for (repository::IRepository* repository : repositories_)
        {
            try {
                repository->Save(*provider_, *factory_);
            } catch (const DataException& e) {
                LOG_ERRORF("Context", "[%s] SaveAll aborted at %s: %s",
                           Name().c_str(), repository->Name().c_str(), e.what());
                throw MakeFailure("save", repository->Name(), repository->Path(), e.Kind(), e.what());
            } catch (const std::exception& e) {
                LOG_ERRORF("Context", "[%s] SaveAll aborted at %s: %s",
                           Name().c_str(), repository->Name().c_str(), e.what());
                throw MakeFailure("save", repository->Name(), repository->Path(), std::nullopt, e.what());
            }
        }

        if (localization_ && localization_->IsLoaded())
        {
            try {
                localization_->SaveAll();
            } catch (const DataException& e) {
                throw MakeFailure("save", "Localization", config_.localization_key_path, e.Kind(), e.what());
            }
        }

        LOG_INFOF("Context", "[%s] Saved", Name().c_str());
    }

    std::future<void> DataContext::SaveAllAsync()
    {
        return std::async(std::launch::async, [this]() {
            SaveAll();
        });
    }

    // ========================================
    // 조회
    // ========================================

    repository::IRepository& DataContext::GetRepository(const std::string& name) const
    {
        for (repository::IRepository* repository : repositories_) {
            if (repository->Name() == name) {
                return *repository;
            }
        }
        throw NotFoundException("repository '" + name + "' in context '" + Name() + "'");
    }

    std::vector<std::string> DataContext::GetRepositoryNames() const
    {
        std::vector<std::string> names;
        names.reserve(repositories_.size());
        for (const auto* repository : repositories_) {
            names.push_back(repository->Name());
        }
        return names;
    }

    ContextOperationException DataContext::MakeFailure(const std::string& operation,
                                                       const std::string& repository_name,
                                                       const std::string& path,
                                                       std::optional<ErrorKind> cause_kind,
                                                       const char* cause_message) const
    {
        return ContextOperationException(operation, Name(), repository_name, path, cause_kind, cause_message);
    }

} // namespace data_engine::context
