#pragma once

#include <expected>
#include <string>
#include <string_view>

namespace wdserver {

enum class ErrorCode {
    InvalidArgument = 1,
    NotFound,
    UnsupportedCommand,
    UnsupportedOperation,
    SessionNotFound,
    SessionCreationFailed,
    DriverRegistrationFailed,
    HandlerConstructionFailed,
    ModuleLoadFailed,
    DriverError,
    InternalError,
};

class Error {
public:
    Error(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    Error(ErrorCode code, std::string message, std::string detail)
        : code_(code), message_(std::move(message)), detail_(std::move(detail)) {}

    [[nodiscard]] auto code() const noexcept -> ErrorCode { return code_; }
    [[nodiscard]] auto message() const noexcept -> std::string_view { return message_; }
    [[nodiscard]] auto detail() const noexcept -> std::string_view { return detail_; }

    [[nodiscard]] auto what() const -> std::string {
        if (detail_.empty()) return message_;
        return message_ + ": " + detail_;
    }

private:
    ErrorCode code_;
    std::string message_;
    std::string detail_;
};

template <typename T>
using Result = std::expected<T, Error>;

using VoidResult = std::expected<void, Error>;

inline auto make_error(ErrorCode code, std::string message) -> Error {
    return Error(code, std::move(message));
}

inline auto make_error(ErrorCode code, std::string message, std::string detail) -> Error {
    return Error(code, std::move(message), std::move(detail));
}

/// Convert ErrorCode to the string reported to protocol clients.
inline auto error_code_to_string(ErrorCode code) -> std::string_view {
    switch (code) {
        case ErrorCode::InvalidArgument: return "INVALID_ARGUMENT";
        case ErrorCode::NotFound: return "NOT_FOUND";
        case ErrorCode::UnsupportedCommand: return "UNSUPPORTED_COMMAND";
        case ErrorCode::UnsupportedOperation: return "UNSUPPORTED_OPERATION";
        case ErrorCode::SessionNotFound: return "SESSION_NOT_FOUND";
        case ErrorCode::SessionCreationFailed: return "SESSION_CREATION_FAILED";
        case ErrorCode::DriverRegistrationFailed: return "DRIVER_REGISTRATION_FAILED";
        case ErrorCode::HandlerConstructionFailed: return "HANDLER_CONSTRUCTION_FAILED";
        case ErrorCode::ModuleLoadFailed: return "MODULE_LOAD_FAILED";
        case ErrorCode::DriverError: return "DRIVER_ERROR";
        case ErrorCode::InternalError: return "INTERNAL_ERROR";
        default: return "UNKNOWN";
    }
}

/// Use return ok_result() instead of return VoidResult{}.
inline auto ok_result() -> VoidResult { return {}; }

} // namespace wdserver
