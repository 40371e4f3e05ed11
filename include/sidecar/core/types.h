#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

namespace sidecar {

// Error kinds surfaced by the client
enum class ErrorCode {
    Success = 0,
    InvalidArgument,
    SidecarNotPresent,
    SidecarError,
    OperationCancelled,
    InvalidData,
    Unknown
};

constexpr const char* errorToString(ErrorCode error) {
    switch (error) {
        case ErrorCode::Success: return "Success";
        case ErrorCode::InvalidArgument: return "Invalid argument";
        case ErrorCode::SidecarNotPresent: return "Sidecar not present";
        case ErrorCode::SidecarError: return "Sidecar error";
        case ErrorCode::OperationCancelled: return "Operation cancelled";
        case ErrorCode::InvalidData: return "Invalid data";
        case ErrorCode::Unknown: return "Unknown error";
    }
    return "Unknown error";
}

// Machine tokens reported alongside sidecar errors
namespace error_codes {
inline constexpr const char* kSidecarDoesNotExist = "ERR_SIDECAR_DOES_NOT_EXIST";
inline constexpr const char* kRequestFailed = "ERR_REQUEST_FAILED";
inline constexpr const char* kDoesNotExist = "ERR_DOES_NOT_EXIST";
inline constexpr const char* kUnknown = "ERR_UNKNOWN";
inline constexpr const char* kInvalidJson = "ERR_INVALID_JSON";
} // namespace error_codes

// Error struct for detailed error information.
// For SidecarNotPresent and SidecarError, httpStatus and errorCode are always populated.
struct Error {
    ErrorCode code;
    std::string message;
    int httpStatus{0};
    std::string errorCode;
    std::optional<std::string> cause;

    Error() : code(ErrorCode::Success), message("") {}
    Error(ErrorCode c, std::string msg) : code(c), message(std::move(msg)) {}
    Error(ErrorCode c) : code(c), message(errorToString(c)) {}
    Error(ErrorCode c, int status, std::string token, std::string msg,
          std::optional<std::string> causeText = std::nullopt)
        : code(c), message(std::move(msg)), httpStatus(status), errorCode(std::move(token)),
          cause(std::move(causeText)) {}

    // "Status Code: 404; Error Code: ERR_DOES_NOT_EXIST; Message: ..."
    std::string describe() const;

    bool operator==(ErrorCode c) const { return code == c; }
    bool operator!=(ErrorCode c) const { return code != c; }
    friend bool operator==(ErrorCode c, const Error& error) { return error.code == c; }
    friend bool operator!=(ErrorCode c, const Error& error) { return error.code != c; }
};

// Simple Result type for operations that can fail
template <typename T> class Result {
public:
    Result(T&& value) : data_(std::move(value)) {}
    Result(const T& value) : data_(value) {}
    Result(ErrorCode error) : data_(Error{error}) {}
    Result(Error error) : data_(std::move(error)) {}

    bool has_value() const noexcept { return std::holds_alternative<T>(data_); }

    explicit operator bool() const noexcept { return has_value(); }

    const T& value() const& {
        if (!has_value()) {
            throw std::runtime_error("Result contains error");
        }
        return std::get<T>(data_);
    }

    T&& value() && {
        if (!has_value()) {
            throw std::runtime_error("Result contains error");
        }
        return std::get<T>(std::move(data_));
    }

    const Error& error() const {
        if (has_value()) {
            throw std::runtime_error("Result contains value");
        }
        return std::get<Error>(data_);
    }

private:
    std::variant<T, Error> data_;
};

// Specialization for void
template <> class Result<void> {
public:
    Result() : error_() {}
    Result(ErrorCode error) : error_(Error{error}) {}
    Result(Error error) : error_(std::move(error)) {}

    bool has_value() const noexcept { return error_.code == ErrorCode::Success; }

    explicit operator bool() const noexcept { return has_value(); }

    void value() const {
        if (!has_value()) {
            throw std::runtime_error("Result contains error");
        }
    }

    const Error& error() const {
        if (has_value()) {
            throw std::runtime_error("Result contains value");
        }
        return error_;
    }

private:
    Error error_{ErrorCode::Success, ""};
};

} // namespace sidecar

// fmt library support for ErrorCode (for spdlog)
#include <fmt/format.h>
template <> struct fmt::formatter<sidecar::ErrorCode> {
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template <typename FormatContext>
    auto format(sidecar::ErrorCode error, FormatContext& ctx) const {
        return fmt::format_to(ctx.out(), "{}", sidecar::errorToString(error));
    }
};
