// src/context/include/ContextOperationException.hpp
#pragma once
#include "common/errors/DataException.hpp"
#include <optional>
#include <stdexcept>
#include <string>

namespace data_engine::context
{
    /**
     * @brief DataContext 의 LoadAll / SaveAll / Reload 실패
     *
     * 어느 Context 의 어느 Repository 에서 실패했는지와 원래 오류 분류를 담는다.
     * 원인이 DataException 이 아니면 CauseKind() 는 비어 있다.
     */
    class ContextOperationException : public std::runtime_error
    {
    public:
        ContextOperationException(const std::string& operation,
                                  const std::string& context_name,
                                  const std::string& repository_name,
                                  const std::string& path,
                                  std::optional<ErrorKind> cause_kind,
                                  const std::string& cause_message)
            : std::runtime_error(FormatMessage(operation, context_name, repository_name, path,
                                               cause_kind, cause_message)),
              operation_(operation),
              context_name_(context_name),
              repository_name_(repository_name),
              path_(path),
              cause_kind_(cause_kind),
              cause_message_(cause_message) {}

        const std::string& Operation() const noexcept { return operation_; }
        const std::string& ContextName() const noexcept { return context_name_; }
        const std::string& RepositoryName() const noexcept { return repository_name_; }
        const std::string& Path() const noexcept { return path_; }
        const std::optional<ErrorKind>& CauseKind() const noexcept { return cause_kind_; }
        const std::string& CauseMessage() const noexcept { return cause_message_; }

    private:
        static std::string FormatMessage(const std::string& operation,
                                         const std::string& context_name,
                                         const std::string& repository_name,
                                         const std::string& path,
                                         const std::optional<ErrorKind>& cause_kind,
                                         const std::string& cause_message)
        {
            std::string msg = "Context '" + context_name + "' " + operation + " failed at repository '" +
                              repository_name + "' (" + path + ")";
            if (cause_kind) {
                msg += " [" + std::string(ErrorKindToString(*cause_kind)) + "]";
            }
            return msg + ": " + cause_message;
        }

        std::string operation_;
        std::string context_name_;
        std::string repository_name_;
        std::string path_;
        std::optional<ErrorKind> cause_kind_;
        std::string cause_message_;
    };

} // namespace data_engine::context
