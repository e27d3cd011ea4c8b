#pragma once

#include <variant>
#include <string>
#include <stdexcept>
#include <utility>

namespace biotok {

// Error codes for configuration resolution and document I/O
enum class ErrorCode {
    OK = 0,
    INVALID_ARGUMENT,   // Option value outside its allowed set
    MISSING_ARGUMENT,   // Required companion option not given
    PARSE_ERROR,        // Malformed configuration file
    IO_ERROR,
    INTERNAL_ERROR
};

// Error with code and message
class Error {
public:
    Error(ErrorCode code, std::string message = "")
        : code_(code), message_(std::move(message)) {}

    ErrorCode code() const { return code_; }
    const std::string& message() const { return message_; }

    std::string to_string() const {
        if (message_.empty()) {
            return std::string(error_code_name(code_));
        }
        return std::string(error_code_name(code_)) + ": " + message_;
    }

    static const char* error_code_name(ErrorCode code) {
        switch (code) {
            case ErrorCode::OK: return "OK";
            case ErrorCode::INVALID_ARGUMENT: return "INVALID_ARGUMENT";
            case ErrorCode::MISSING_ARGUMENT: return "MISSING_ARGUMENT";
            case ErrorCode::PARSE_ERROR: return "PARSE_ERROR";
            case ErrorCode::IO_ERROR: return "IO_ERROR";
            case ErrorCode::INTERNAL_ERROR: return "INTERNAL_ERROR";
            default: return "UNKNOWN";
        }
    }

private:
    ErrorCode code_;
    std::string message_;
};

// Value-or-error return type for operations that can fail
template<typename T>
class Result {
public:
    Result(T value) : data_(std::move(value)) {}

    Result(Error error) : data_(std::move(error)) {}

    bool ok() const { return std::holds_alternative<T>(data_); }

    // Access value (throws if error)
    T& value() & {
        if (!ok()) {
            throw std::runtime_error(error().to_string());
        }
        return std::get<T>(data_);
    }

    const T& value() const& {
        if (!ok()) {
            throw std::runtime_error(error().to_string());
        }
        return std::get<T>(data_);
    }

    // Access error (throws if success)
    const Error& error() const {
        if (ok()) {
            throw std::logic_error("Result has no error");
        }
        return std::get<Error>(data_);
    }

    ErrorCode error_code() const {
        if (ok()) {
            return ErrorCode::OK;
        }
        return error().code();
    }

    T* operator->() { return &value(); }
    const T* operator->() const { return &value(); }

private:
    std::variant<T, Error> data_;
};

}  // namespace biotok
