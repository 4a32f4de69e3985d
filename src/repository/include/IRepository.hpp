// src/repository/include/IRepository.hpp
#pragma once
#include "common/storage/include/IStorageProvider.hpp"
#include "common/types/DataFormat.hpp"
#include "serialization/include/SerializerFactory.hpp"
#include <atomic>
#include <string>

namespace data_engine::repository
{
    /**
     * @brief 타입을 모르는 쪽(DataContext)에서 쓰는 Repository 공통 인터페이스
     */
    class IRepository
    {
    public:
        virtual ~IRepository() = default;

        virtual const std::string& Name() const = 0;
        virtual const std::string& Path() const = 0;
        virtual DataFormat Format() const = 0;

        virtual size_t Count() const = 0;
        virtual bool IsLoaded() const = 0;

        /**
         * @brief 저장소에서 읽어 파싱한 뒤 성공했을 때만 통째로 교체
         *
         * @param cancelled 교체 직전에 확인. true 면 교체하지 않고 false 반환
         * @return 교체했으면 true
         * @throws NotFoundException / IOFailureException (provider 오류 그대로)
         * @throws MalformedDataException / DuplicateKeyException / UnsupportedFormatException
         */
        virtual bool Load(storage::IStorageProvider& provider,
                          const serialization::SerializerFactory& factory,
                          const std::atomic<bool>* cancelled = nullptr) = 0;

        /**
         * @brief 현재 내용을 삽입 순서대로 출력해 저장
         */
        virtual void Save(storage::IStorageProvider& provider,
                          const serialization::SerializerFactory& factory) const = 0;
    };

} // namespace data_engine::repository
