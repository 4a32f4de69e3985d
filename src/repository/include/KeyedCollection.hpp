// src/repository/include/KeyedCollection.hpp
#pragma once
#include <cstddef>
#include <unordered_map>
#include <utility>
#include <vector>

namespace data_engine::repository
{
    /**
     * @brief 삽입 순서를 유지하는 key -> value 컬렉션
     *
     * 순회는 삽입 순서, 조회는 해시 인덱스. Remove 는 인덱스를 다시 만든다.
     */
    template<typename Key, typename Value>
    class KeyedCollection
    {
    public:
        using value_type = std::pair<Key, Value>;
        using const_iterator = typename std::vector<value_type>::const_iterator;

        // 이미 있는 키면 false, 컬렉션은 그대로
        bool Insert(Key key, Value value)
        {
            if (index_.find(key) != index_.end()) {
                return false;
            }
            index_.emplace(key, entries_.size());
            entries_.emplace_back(std::move(key), std::move(value));
            return true;
        }

        // 있으면 제자리에서 교체, 없으면 뒤에 추가
        void InsertOrAssign(Key key, Value value)
        {
            auto it = index_.find(key);
            if (it != index_.end()) {
                entries_[it->second].second = std::move(value);
                return;
            }
            index_.emplace(key, entries_.size());
            entries_.emplace_back(std::move(key), std::move(value));
        }

        bool Erase(const Key& key)
        {
            auto it = index_.find(key);
            if (it == index_.end()) {
                return false;
            }
            entries_.erase(entries_.begin() + static_cast<std::ptrdiff_t>(it->second));
            RebuildIndex();
            return true;
        }

        const Value* Find(const Key& key) const
        {
            auto it = index_.find(key);
            if (it == index_.end()) {
                return nullptr;
            }
            return &entries_[it->second].second;
        }

        bool Contains(const Key& key) const { return index_.find(key) != index_.end(); }

        void Clear()
        {
            entries_.clear();
            index_.clear();
        }

        void Reserve(size_t count)
        {
            entries_.reserve(count);
            index_.reserve(count);
        }

        size_t Size() const { return entries_.size(); }
        bool Empty() const { return entries_.empty(); }

        const_iterator begin() const { return entries_.begin(); }
        const_iterator end() const { return entries_.end(); }

    private:
        void RebuildIndex()
        {
            index_.clear();
            for (size_t i = 0; i < entries_.size(); ++i) {
                index_.emplace(entries_[i].first, i);
            }
        }

        std::vector<value_type> entries_;
        std::unordered_map<Key, size_t> index_;
    };

} // namespace data_engine::repository
