// src/serialization/include/SerializerFactory.hpp
#pragma once
#include "serialization/include/IFormatSerializer.hpp"
#include "serialization/include/CsvFormatSerializer.hpp"
#include "common/types/DataFormat.hpp"
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace data_engine::serialization
{
    /**
     * @brief 확장자 / DataFormat -> Serializer 조회
     *
     * 생성 시 JSON(.json), CSV(.csv) 가 등록된다. 추가 포맷은 공유하기 전에
     * Register 로 붙이고, 그 뒤에는 shared_ptr<const SerializerFactory> 로
     * 여러 Context 가 읽기 전용으로 함께 쓴다.
     */
    class SerializerFactory
    {
    public:
        explicit SerializerFactory(CsvOptions csv_options = CsvOptions());

        /**
         * @brief 확장자에 Serializer 등록 (기존 등록은 교체)
         * @param extension ".yaml" 또는 "yaml" (대소문자 무시)
         * @return 체이닝용 자기 자신
         * @throws std::invalid_argument 빈 확장자 / null serializer
         */
        SerializerFactory& Register(const std::string& extension,
                                    std::shared_ptr<const IFormatSerializer> serializer);

        /**
         * @brief 명시 포맷 또는 경로 확장자로 Serializer 선택
         * @param format AUTO 면 path 확장자로 판단
         * @throws UnsupportedFormatException 등록된 Serializer 없음
         */
        std::shared_ptr<const IFormatSerializer> GetSerializer(const std::string& path,
                                                               DataFormat format = DataFormat::AUTO) const;

        std::vector<std::string> GetSupportedExtensions() const;
        bool IsSupported(const std::string& path) const;

        const CsvOptions& GetCsvOptions() const { return csv_options_; }

    private:
        static std::string NormalizeExtension(const std::string& extension);

        CsvOptions csv_options_;
        std::map<std::string, std::shared_ptr<const IFormatSerializer>> serializers_;
    };

} // namespace data_engine::serialization
