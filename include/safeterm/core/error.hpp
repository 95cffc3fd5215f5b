#pragma once

#include <expected>
#include <string>
#include <string_view>

namespace safeterm {

enum class ErrorCode {
    InvalidConfig = 1,
    InvalidArgument,
    NotFound,
    SandboxViolation,
    PermissionDenied,
    DeleteFailed,
    ArgumentRejected,
    ParseError,
    IoError,
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

/// Stable upper-case name of an ErrorCode, used in log lines.
inline auto error_code_to_string(ErrorCode code) -> std::string_view {
    switch (code) {
        case ErrorCode::InvalidConfig: return "INVALID_CONFIG";
        case ErrorCode::InvalidArgument: return "INVALID_ARGUMENT";
        case ErrorCode::NotFound: return "NOT_FOUND";
        case ErrorCode::SandboxViolation: return "SANDBOX_VIOLATION";
        case ErrorCode::PermissionDenied: return "PERMISSION_DENIED";
        case ErrorCode::DeleteFailed: return "DELETE_FAILED";
        case ErrorCode::ArgumentRejected: return "ARGUMENT_REJECTED";
        case ErrorCode::ParseError: return "PARSE_ERROR";
        case ErrorCode::IoError: return "IO_ERROR";
        default: return "UNKNOWN";
    }
}

} // namespace safeterm
