// src/serialization/include/IFormatSerializer.hpp
#pragma once
#include "serialization/include/RecordSchema.hpp"
#include "common/errors/DataException.hpp"
#include <string>
#include <vector>

namespace data_engine::serialization
{
    /**
     * @brief 원시 텍스트 <-> 순서가 보존된 Row 목록 변환 인터페이스
     *
     * 구현체는 상태가 없어야 하며 여러 스레드에서 동시에 호출될 수 있다.
     */
    class IFormatSerializer
    {
    public:
        virtual ~IFormatSerializer() = default;

        /**
         * @brief 텍스트를 스키마에 맞춘 Row 목록으로 파싱
         *
         * 각 Row는 스키마의 모든 필드를 스키마 타입으로 담는다.
         * 빈 텍스트는 빈 목록.
         *
         * @param source_path 오류 메시지에 들어갈 경로
         * @throws MalformedDataException 구조 오류 / 타입 변환 실패 / 키 누락
         * @throws DuplicateKeyException 파일 안에서 키 중복
         */
        virtual std::vector<Row> Parse(const std::string& text,
                                       const RecordSchema& schema,
                                       const std::string& source_path) const = 0;

        /**
         * @brief Row 목록을 텍스트로 출력 (Parse의 역변환)
         */
        virtual std::string Render(const std::vector<Row>& rows,
                                   const RecordSchema& schema) const = 0;

        /**
         * @brief 단일 object 파일 파싱 (GameConfig.json 같은 설정 한 건)
         *
         * 스키마 없이 object 를 그대로 돌려준다. 지원하지 않는 포맷은 기본 구현이 던진다.
         * @throws MalformedDataException 구조 오류 / object 가 아님 / 빈 텍스트
         * @throws UnsupportedFormatException 단일 object 를 표현할 수 없는 포맷
         */
        virtual Row ParseObject(const std::string& text, const std::string& source_path) const
        {
            (void)text;
            (void)source_path;
            throw UnsupportedFormatException(Name() + " (single object)");
        }

        virtual std::string RenderObject(const Row& object) const
        {
            (void)object;
            throw UnsupportedFormatException(Name() + " (single object)");
        }

        virtual std::string Name() const = 0;
    };

} // namespace data_engine::serialization
