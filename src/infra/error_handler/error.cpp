#include "error.hpp"
#include <cstdlib>
#include <fmt/core.h>

namespace gtxfer::infra {

bool Error::is_fatal() const {
    switch (code) {
        case ErrorCode::DiscoveryFailed:
        case ErrorCode::InvalidConfig:
        case ErrorCode::InvalidArgument:
            return true;
        default:
            return false;
    }
}

int Error::to_exit_code() const {
    if (is_fatal()) return EXIT_FAILURE;
    switch (code) {
        case ErrorCode::Interrupted: return 130; // SIGINT
        default:                     return EXIT_FAILURE;
    }
}

std::string_view error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::DiscoveryFailed:       return "DiscoveryFailed";
        case ErrorCode::InvalidConfig:         return "InvalidConfig";
        case ErrorCode::InvalidArgument:       return "InvalidArgument";
        case ErrorCode::TransferFailed:        return "TransferFailed";
        case ErrorCode::SpawnFailed:           return "SpawnFailed";
        case ErrorCode::VerificationMismatch:  return "VerificationMismatch";
        case ErrorCode::RetryExhausted:        return "RetryExhausted";
        case ErrorCode::Timeout:               return "Timeout";
        case ErrorCode::CheckpointWriteFailed: return "CheckpointWriteFailed";
        case ErrorCode::NotFound:              return "NotFound";
        case ErrorCode::Interrupted:           return "Interrupted";
        case ErrorCode::Unknown:               return "Unknown";
    }
    return "Unknown";
}

Error make_error(ErrorCode code, std::string_view message,
                 const std::source_location& loc) {
    return Error{code, std::string(message), loc};
}

Error log_and_return(Error&& err) {
    auto level = err.is_fatal() ? spdlog::level::err : spdlog::level::warn;
    spdlog::log(level,
        "[{}:{} in {}] {}: {}",
        err.file, err.line, err.function,
        error_code_name(err.code), err.message
    );
    return std::move(err);
}

} // namespace gtxfer::infra
