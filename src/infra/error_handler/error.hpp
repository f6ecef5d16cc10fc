#pragma once

#include <string>
#include <string_view>
#include <system_error>
#include <source_location>
#include <expected>
#include <spdlog/spdlog.h>

namespace gtxfer::infra {

enum class ErrorCode {
    // Фатальные ошибки (вся операция прерывается)
    DiscoveryFailed,
    InvalidConfig,
    InvalidArgument,

    // Ошибки отдельного элемента (retry, затем failed)
    TransferFailed,
    SpawnFailed,
    VerificationMismatch,
    RetryExhausted,
    Timeout,

    // Некритичные
    CheckpointWriteFailed,
    NotFound,
    Interrupted,

    Unknown,
};

struct Error {
    ErrorCode code;
    std::string message;
    std::string file;
    int line;
    std::string function;

    Error(ErrorCode c, std::string_view msg,
          const std::source_location& loc = std::source_location::current())
        : code(c)
        , message(msg)
        , file(loc.file_name())
        , line(static_cast<int>(loc.line()))
        , function(loc.function_name())
    {}

    [[nodiscard]] auto is_fatal() const -> bool;
    [[nodiscard]] auto to_exit_code() const -> int;

    // Ошибки, после которых имеет смысл повторить попытку
    [[nodiscard]] auto is_transient() const -> bool {
        return code == ErrorCode::TransferFailed ||
               code == ErrorCode::SpawnFailed ||
               code == ErrorCode::VerificationMismatch ||
               code == ErrorCode::Timeout;
    }
};

template<typename T>
using Result = std::expected<T, Error>;

using VoidResult = Result<void>;

[[nodiscard]] auto error_code_name(ErrorCode code) -> std::string_view;

[[nodiscard]] auto make_error(
    ErrorCode code,
    std::string_view message,
    const std::source_location& loc = std::source_location::current()
) -> Error;

// Логирование ошибки и возврат
[[nodiscard]] auto log_and_return(Error&& err) -> Error;

} // namespace gtxfer::infra
