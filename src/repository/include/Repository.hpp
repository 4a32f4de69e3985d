// src/repository/include/Repository.hpp
#pragma once
#include "repository/include/IRepository.hpp"
#include "repository/include/KeyedCollection.hpp"
#include "serialization/include/RecordSchema.hpp"
#include "common/errors/DataException.hpp"
#include "common/utils/logger/Logger.hpp"
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace data_engine::repository
{
    /**
     * @brief 한 엔티티 타입의 key -> Record 테이블
     *
     * Record 는 nlohmann ADL to_json / from_json 을 제공해야 하며,
     * 키는 스키마의 key field 값을 Key 로 변환해 얻는다.
     * 경로와 포맷은 생성 후 바뀌지 않는다.
     *
     * 로드된 Repository 를 여러 스레드가 읽는 것은 안전하지만,
     * 재로드와 읽기를 동시에 하는 것은 지원하지 않는다.
     */
    template<typename Key, typename Record>
    class Repository : public IRepository
    {
    public:
        using Collection = KeyedCollection<Key, Record>;
        using const_iterator = typename Collection::const_iterator;

        Repository(std::string name,
                   std::string path,
                   serialization::RecordSchema schema,
                   DataFormat format = DataFormat::AUTO)
            : name_(std::move(name)),
              path_(std::move(path)),
              schema_(std::move(schema)),
              format_(format)
        {
        }

        const std::string& Name() const override { return name_; }
        const std::string& Path() const override { return path_; }
        DataFormat Format() const override { return format_; }
        const serialization::RecordSchema& Schema() const { return schema_; }

        size_t Count() const override { return items_.Size(); }
        bool IsLoaded() const override { return loaded_; }

        bool Load(storage::IStorageProvider& provider,
                  const serialization::SerializerFactory& factory,
                  const std::atomic<bool>* cancelled = nullptr) override
        {
            // 지원하지 않는 포맷이면 I/O 전에 실패
            auto serializer = factory.GetSerializer(path_, format_);
            std::string text = provider.LoadTextAsync(path_).get();
            return ParseAndCommit(text, *serializer, cancelled);
        }

        /**
         * @brief 이미 읽어온 텍스트로 로드 (LoadMultipleTextAsync 결과 등)
         */
        bool LoadFromText(const std::string& text,
                          const serialization::SerializerFactory& factory,
                          const std::atomic<bool>* cancelled = nullptr)
        {
            auto serializer = factory.GetSerializer(path_, format_);
            return ParseAndCommit(text, *serializer, cancelled);
        }

        void Save(storage::IStorageProvider& provider,
                  const serialization::SerializerFactory& factory) const override
        {
            auto serializer = factory.GetSerializer(path_, format_);
            std::string text = serializer->Render(ToRows(), schema_);
            provider.SaveTextAsync(path_, text).get();

            LOG_DEBUGF("Repository", "%s: saved %zu records to %s",
                       name_.c_str(), items_.Size(), path_.c_str());
        }

        /**
         * @throws NotFoundException 키 없음
         */
        const Record& Get(const Key& key) const
        {
            const Record* record = items_.Find(key);
            if (record == nullptr) {
                throw NotFoundException("key '" + KeyText(key) + "' in repository " + name_);
            }
            return *record;
        }

        // 없으면 nullptr
        const Record* TryGet(const Key& key) const { return items_.Find(key); }

        bool Contains(const Key& key) const { return items_.Contains(key); }

        const Collection& LoadedItems() const { return items_; }

        const_iterator begin() const { return items_.begin(); }
        const_iterator end() const { return items_.end(); }

        std::vector<Key> Keys() const
        {
            std::vector<Key> keys;
            keys.reserve(items_.Size());
            for (const auto& entry : items_) {
                keys.push_back(entry.first);
            }
            return keys;
        }

        template<typename Predicate>
        std::vector<const Record*> Find(Predicate predicate) const
        {
            std::vector<const Record*> result;
            for (const auto& entry : items_) {
                if (predicate(entry.second)) {
                    result.push_back(&entry.second);
                }
            }
            return result;
        }

        // ========================================
        // 편집 (저장할 데이터 구성용)
        // ========================================

        /**
         * @throws DuplicateKeyException 이미 있는 키
         * @throws std::invalid_argument Record 를 Row 로 바꿀 수 없거나 키 필드가 없음
         */
        void Add(Record record)
        {
            Key key = ExtractKey(record);
            if (items_.Contains(key)) {
                throw DuplicateKeyException(path_, 0, KeyText(key));
            }
            items_.Insert(std::move(key), std::move(record));
        }

        // 같은 키가 있으면 순서를 유지한 채 교체
        void Upsert(Record record)
        {
            Key key = ExtractKey(record);
            items_.InsertOrAssign(std::move(key), std::move(record));
        }

        bool Remove(const Key& key) { return items_.Erase(key); }

        void Clear() { items_.Clear(); }

        std::vector<serialization::Row> ToRows() const
        {
            std::vector<serialization::Row> rows;
            rows.reserve(items_.Size());
            for (const auto& entry : items_) {
                rows.push_back(serialization::Row(entry.second));
            }
            return rows;
        }

    private:
        bool ParseAndCommit(const std::string& text,
                            const serialization::IFormatSerializer& serializer,
                            const std::atomic<bool>* cancelled)
        {
            std::vector<serialization::Row> rows = serializer.Parse(text, schema_, path_);

            // 새 컬렉션을 만든 뒤 성공했을 때만 교체
            Collection staged;
            staged.Reserve(rows.size());

            for (size_t i = 0; i < rows.size(); ++i)
            {
                Key key;
                Record record;
                try {
                    key = rows[i].at(schema_.KeyField()).template get<Key>();
                    record = rows[i].template get<Record>();
                } catch (const nlohmann::json::exception& e) {
                    throw MalformedDataException(path_, 0,
                                                 "record #" + std::to_string(i) + ": " + e.what());
                }

                if (!staged.Insert(key, std::move(record))) {
                    throw DuplicateKeyException(path_, 0, KeyText(key));
                }
            }

            if (cancelled != nullptr && cancelled->load()) {
                LOG_DEBUGF("Repository", "%s: load cancelled before commit", name_.c_str());
                return false;
            }

            items_ = std::move(staged);
            loaded_ = true;

            LOG_DEBUGF("Repository", "%s: loaded %zu records from %s",
                       name_.c_str(), items_.Size(), path_.c_str());
            return true;
        }

        Key ExtractKey(const Record& record) const
        {
            try {
                serialization::Row row = record;
                return row.at(schema_.KeyField()).template get<Key>();
            } catch (const nlohmann::json::exception& e) {
                throw std::invalid_argument("Cannot extract key '" + schema_.KeyField() +
                                            "' for repository " + name_ + ": " + e.what());
            }
        }

        static std::string KeyText(const Key& key)
        {
            return serialization::RecordSchema::KeyToString(nlohmann::json(key));
        }

        std::string name_;
        std::string path_;
        serialization::RecordSchema schema_;
        DataFormat format_;

        Collection items_;
        bool loaded_ = false;
    };

} // namespace data_engine::repository
