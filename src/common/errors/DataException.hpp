// src/common/errors/DataException.hpp
#pragma once
#include <stdexcept>
#include <string>
#include <cstddef>

namespace data_engine
{
    enum class ErrorKind
    {
        NOT_FOUND = 0,
        MALFORMED_DATA = 1,
        UNSUPPORTED_FORMAT = 2,
        IO_FAILURE = 3,
        DUPLICATE_KEY = 4
    };

    inline const char* ErrorKindToString(ErrorKind kind)
    {
        switch (kind) {
            case ErrorKind::NOT_FOUND: return "NOT_FOUND";
            case ErrorKind::MALFORMED_DATA: return "MALFORMED_DATA";
            case ErrorKind::UNSUPPORTED_FORMAT: return "UNSUPPORTED_FORMAT";
            case ErrorKind::IO_FAILURE: return "IO_FAILURE";
            case ErrorKind::DUPLICATE_KEY: return "DUPLICATE_KEY";
            default: return "UNKNOWN";
        }
    }

    /**
     * @brief 데이터 계층 기본 예외 클래스
     *
     * Storage / Serializer / Repository 에서 발생하는 모든 오류의 부모.
     * Kind()로 오류 분류를 확인할 수 있다.
     */
    class DataException : public std::runtime_error
    {
    public:
        DataException(ErrorKind kind, const std::string& msg)
            : std::runtime_error(msg), kind_(kind) {}

        ErrorKind Kind() const noexcept { return kind_; }

    private:
        ErrorKind kind_;
    };

    /**
     * @brief 파일 또는 키를 찾을 수 없을 때 발생
     */
    class NotFoundException : public DataException
    {
    public:
        explicit NotFoundException(const std::string& what)
            : DataException(ErrorKind::NOT_FOUND, "Not found: " + what) {}
    };

    /**
     * @brief 구조적 파싱 오류 (닫히지 않은 따옴표, 컬럼 수 불일치 등)
     *
     * line은 1부터 시작하며, 0이면 위치 정보가 없음을 의미한다.
     */
    class MalformedDataException : public DataException
    {
    public:
        MalformedDataException(const std::string& source_path, size_t line, const std::string& detail)
            : MalformedDataException(ErrorKind::MALFORMED_DATA, source_path, line, detail) {}

        const std::string& SourcePath() const noexcept { return source_path_; }
        size_t Line() const noexcept { return line_; }
        const std::string& Detail() const noexcept { return detail_; }

    protected:
        MalformedDataException(ErrorKind kind, const std::string& source_path, size_t line,
                               const std::string& detail)
            : DataException(kind, FormatMessage(source_path, line, detail)),
              source_path_(source_path), line_(line), detail_(detail) {}

    private:
        static std::string FormatMessage(const std::string& source_path, size_t line,
                                         const std::string& detail)
        {
            std::string msg = "Malformed data in '" + source_path + "'";
            if (line > 0) {
                msg += " at line " + std::to_string(line);
            }
            return msg + ": " + detail;
        }

        std::string source_path_;
        size_t line_;
        std::string detail_;
    };

    /**
     * @brief 한 소스 안에서 같은 기본 키가 두 번 나타날 때 발생
     */
    class DuplicateKeyException : public MalformedDataException
    {
    public:
        DuplicateKeyException(const std::string& source_path, size_t line, const std::string& key)
            : MalformedDataException(ErrorKind::DUPLICATE_KEY, source_path, line,
                                     "duplicate key '" + key + "'"),
              key_(key) {}

        const std::string& Key() const noexcept { return key_; }

    private:
        std::string key_;
    };

    /**
     * @brief 등록된 Serializer가 없는 포맷 / 확장자
     */
    class UnsupportedFormatException : public DataException
    {
    public:
        explicit UnsupportedFormatException(const std::string& format)
            : DataException(ErrorKind::UNSUPPORTED_FORMAT, "Unsupported data format: " + format) {}
    };

    /**
     * @brief 읽기/쓰기/디렉토리 생성 실패
     */
    class IOFailureException : public DataException
    {
    public:
        explicit IOFailureException(const std::string& msg)
            : DataException(ErrorKind::IO_FAILURE, "I/O failure: " + msg) {}
    };

} // namespace data_engine
