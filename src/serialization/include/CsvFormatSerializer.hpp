// src/serialization/include/CsvFormatSerializer.hpp
#pragma once
#include "serialization/include/IFormatSerializer.hpp"
#include <string>
#include <vector>

namespace data_engine::serialization
{
    struct CsvOptions
    {
        char field_delimiter = ',';
        char array_delimiter = '|';
    };

    /**
     * @brief CSV 포맷: 헤더 한 줄 + 데이터 행
     *
     * - RFC 4180 quoting (따옴표 안의 구분자, "" 이스케이프, 줄바꿈 허용)
     * - 헤더가 '~' 로 시작하는 컬럼은 주석 컬럼으로 보고 건너뜀
     * - 빈 줄과 UTF-8 BOM 무시
     * - 헤더 이름은 대소문자 무시로 스키마 필드와 매칭, 모르는 컬럼은 무시
     * - 배열 필드는 array_delimiter 로 이어 붙인 한 셀
     */
    class CsvFormatSerializer : public IFormatSerializer
    {
    public:
        explicit CsvFormatSerializer(CsvOptions options = CsvOptions());

        std::vector<Row> Parse(const std::string& text,
                               const RecordSchema& schema,
                               const std::string& source_path) const override;

        std::string Render(const std::vector<Row>& rows,
                           const RecordSchema& schema) const override;

        std::string Name() const override { return "csv"; }

        const CsvOptions& Options() const { return options_; }

        struct CsvRecord
        {
            size_t line = 0;                // 레코드가 시작하는 줄 (1부터)
            std::vector<std::string> cells;
            bool quoted = false;            // 따옴표 셀이 하나라도 있었는지
        };

        /**
         * @brief 텍스트를 물리 줄이 아닌 CSV 레코드 단위로 분리
         * @throws MalformedDataException 닫히지 않은 따옴표
         */
        std::vector<CsvRecord> Tokenize(const std::string& text, const std::string& source_path) const;

        // 필요할 때만 따옴표로 감싼 셀 텍스트
        std::string EscapeCell(const std::string& value) const;

    private:
        static bool IsBlankRecord(const CsvRecord& record);

        CsvOptions options_;
    };

} // namespace data_engine::serialization
