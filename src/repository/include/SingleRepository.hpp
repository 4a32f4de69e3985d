// src/repository/include/SingleRepository.hpp
#pragma once
#include "repository/include/IRepository.hpp"
#include "common/errors/DataException.hpp"
#include "common/utils/logger/Logger.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <utility>

namespace data_engine::repository
{
    /**
     * @brief 파일 하나에 object 하나만 있는 데이터 (GameConfig.json 등)
     *
     * 키가 없으므로 스키마 대신 Record 의 ADL from_json / to_json 만 쓴다.
     * 로드는 Repository 와 같이 새 값을 만든 뒤 성공했을 때만 교체한다.
     * Count() 는 값이 있으면 1, 없으면 0.
     */
    template<typename Record>
    class SingleRepository : public IRepository
    {
    public:
        SingleRepository(std::string name,
                         std::string path,
                         DataFormat format = DataFormat::AUTO)
            : name_(std::move(name)),
              path_(std::move(path)),
              format_(format)
        {
        }

        const std::string& Name() const override { return name_; }
        const std::string& Path() const override { return path_; }
        DataFormat Format() const override { return format_; }

        size_t Count() const override { return data_.has_value() ? 1 : 0; }
        bool IsLoaded() const override { return loaded_; }

        bool Load(storage::IStorageProvider& provider,
                  const serialization::SerializerFactory& factory,
                  const std::atomic<bool>* cancelled = nullptr) override
        {
            auto serializer = factory.GetSerializer(path_, format_);
            std::string text = provider.LoadTextAsync(path_).get();
            serialization::Row object = serializer->ParseObject(text, path_);

            std::optional<Record> staged;
            try {
                staged = object.template get<Record>();
            } catch (const nlohmann::json::exception& e) {
                throw MalformedDataException(path_, 0, e.what());
            }

            if (cancelled != nullptr && cancelled->load()) {
                LOG_DEBUGF("Repository", "%s: load cancelled before commit", name_.c_str());
                return false;
            }

            data_ = std::move(staged);
            loaded_ = true;

            LOG_DEBUGF("Repository", "%s: loaded single record from %s", name_.c_str(), path_.c_str());
            return true;
        }

        // 값이 없으면 아무것도 쓰지 않는다
        void Save(storage::IStorageProvider& provider,
                  const serialization::SerializerFactory& factory) const override
        {
            if (!data_.has_value()) {
                LOG_DEBUGF("Repository", "%s: nothing to save", name_.c_str());
                return;
            }

            auto serializer = factory.GetSerializer(path_, format_);
            std::string text = serializer->RenderObject(serialization::Row(*data_));
            provider.SaveTextAsync(path_, text).get();

            LOG_DEBUGF("Repository", "%s: saved single record to %s", name_.c_str(), path_.c_str());
        }

        /**
         * @throws NotFoundException 아직 값이 없음
         */
        const Record& Get() const
        {
            if (!data_.has_value()) {
                throw NotFoundException("data of repository " + name_);
            }
            return *data_;
        }

        // 없으면 nullptr
        const Record* TryGet() const { return data_.has_value() ? &(*data_) : nullptr; }

        void Set(Record record) { data_ = std::move(record); }

    private:
        std::string name_;
        std::string path_;
        DataFormat format_;

        std::optional<Record> data_;
        bool loaded_ = false;
    };

} // namespace data_engine::repository
