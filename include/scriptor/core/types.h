#pragma once

#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

namespace scriptor {

// Error types
enum class ErrorCode {
    Success = 0,
    FileNotFound,
    InvalidArgument,
    InvalidOperation,
    NotFound,
    IOError,
    HashMismatch,
    MissingEntrypoint,
    ExecutionError,
    ContractViolation,
    RegistrationError,
    PackageFormatError,
    InternalError,
    Unknown
};

// Convert error code to string
constexpr const char* errorToString(ErrorCode error) {
    switch (error) {
        case ErrorCode::Success: return "Success";
        case ErrorCode::FileNotFound: return "File not found";
        case ErrorCode::InvalidArgument: return "Invalid argument";
        case ErrorCode::InvalidOperation: return "Invalid operation";
        case ErrorCode::NotFound: return "Not found";
        case ErrorCode::IOError: return "I/O error";
        case ErrorCode::HashMismatch: return "Hash mismatch";
        case ErrorCode::MissingEntrypoint: return "Missing plugin entrypoint";
        case ErrorCode::ExecutionError: return "Plugin execution error";
        case ErrorCode::ContractViolation: return "Plugin contract violation";
        case ErrorCode::RegistrationError: return "Plugin registration error";
        case ErrorCode::PackageFormatError: return "Invalid plugin package";
        case ErrorCode::InternalError: return "Internal error";
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

// Value-or-error return type used across the plugin subsystem
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
            throw std::runtime_error("Result contains error: " + std::get<Error>(data_).message);
        }
        return std::get<T>(data_);
    }

    T&& value() && {
        if (!has_value()) {
            throw std::runtime_error("Result contains error: " + std::get<Error>(data_).message);
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
            throw std::runtime_error("Result contains error: " + error_.message);
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

} // namespace scriptor

// fmt library support for ErrorCode (for spdlog)
#if defined(SPDLOG_FMT_EXTERNAL) || defined(FMT_VERSION)
#include <fmt/format.h>
template <> struct fmt::formatter<scriptor::ErrorCode> {
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template <typename FormatContext>
    auto format(scriptor::ErrorCode error, FormatContext& ctx) const {
        return fmt::format_to(ctx.out(), "{}", scriptor::errorToString(error));
    }
};
#endif
