// src/serialization/include/JsonFormatSerializer.hpp
#pragma once
#include "serialization/include/IFormatSerializer.hpp"

namespace data_engine::serialization
{
    /**
     * @brief JSON 포맷: 평면 object 배열
     *
     * 멤버 이름은 정확히 일치하는 것을 먼저 찾고, 없으면 대소문자 무시로 찾는다.
     * 스키마에 없는 멤버는 무시하고, 없는 필드는 기본값으로 채운다.
     */
    class JsonFormatSerializer : public IFormatSerializer
    {
    public:
        std::vector<Row> Parse(const std::string& text,
                               const RecordSchema& schema,
                               const std::string& source_path) const override;

        std::string Render(const std::vector<Row>& rows,
                           const RecordSchema& schema) const override;

        // 최상위가 object 인 파일. 멤버는 그대로 둔다
        Row ParseObject(const std::string& text, const std::string& source_path) const override;
        std::string RenderObject(const Row& object) const override;

        std::string Name() const override { return "json"; }

        // parse_error 의 byte 위치 -> 1부터 시작하는 줄 번호
        static size_t LineFromOffset(const std::string& text, size_t byte_offset);

    private:
        // 최상위 배열 원소 각각이 시작하는 줄 번호 (유효한 JSON 에서만 호출)
        static std::vector<size_t> FindEntryLines(const std::string& text);
    };

} // namespace data_engine::serialization
