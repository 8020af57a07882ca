#pragma once

#include <chrono>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <variant>

#include <spdlog/fmt/fmt.h>

namespace pdfledger {

// Type aliases
using Hash = std::string;
using TimePoint = std::chrono::system_clock::time_point;

// Error types
enum class ErrorCode {
    Success = 0,
    FileNotFound,
    PermissionDenied,
    CorruptedData,
    InvalidArgument,
    InvalidState,
    InvalidData,
    InternalError,
    NotFound,
    OperationInProgress,
    WriteError,
    ReadError,
    ToolUnavailable,
    ExtractionFailed,
    SchemaMismatch,
    Timeout,
    Unknown
};

// Convert error code to string
constexpr const char* errorToString(ErrorCode error) {
    switch (error) {
        case ErrorCode::Success: return "Success";
        case ErrorCode::FileNotFound: return "File not found";
        case ErrorCode::PermissionDenied: return "Permission denied";
        case ErrorCode::CorruptedData: return "Corrupted data";
        case ErrorCode::InvalidArgument: return "Invalid argument";
        case ErrorCode::InvalidState: return "Invalid state";
        case ErrorCode::InvalidData: return "Invalid data";
        case ErrorCode::InternalError: return "Internal error";
        case ErrorCode::NotFound: return "Not found";
        case ErrorCode::OperationInProgress: return "Operation in progress";
        case ErrorCode::WriteError: return "Write error";
        case ErrorCode::ReadError: return "Read error";
        case ErrorCode::ToolUnavailable: return "Tool unavailable";
        case ErrorCode::ExtractionFailed: return "Extraction failed";
        case ErrorCode::SchemaMismatch: return "Schema mismatch";
        case ErrorCode::Timeout: return "Operation timed out";
        case ErrorCode::Unknown: return "Unknown error";
    }
    return "Unknown error";
}

// Error struct for detailed error information
struct Error {
    ErrorCode code;
    std::string message;

    Error() : code(ErrorCode::Success), message("") {}
    Error(ErrorCode c, std::string msg) : code(c), message(std::move(msg)) {}
    Error(ErrorCode c) : code(c), message(errorToString(c)) {}

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

// Errors in these classes compromise the append-only tables and stop the invocation.
constexpr bool isFatal(ErrorCode code) {
    switch (code) {
        case ErrorCode::WriteError:
        case ErrorCode::PermissionDenied:
        case ErrorCode::CorruptedData:
        case ErrorCode::SchemaMismatch:
            return true;
        default:
            return false;
    }
}

// Common constants
inline constexpr size_t HASH_SIZE = 32;        // SHA-256
inline constexpr size_t HASH_STRING_SIZE = 64; // Hex encoded
inline constexpr size_t DEFAULT_BUFFER_SIZE = 64 * 1024;

} // namespace pdfledger

// fmt library support for ErrorCode (for spdlog)
template <> struct fmt::formatter<pdfledger::ErrorCode> {
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template <typename FormatContext>
    auto format(pdfledger::ErrorCode error, FormatContext& ctx) const {
        return fmt::format_to(ctx.out(), "{}", pdfledger::errorToString(error));
    }
};
