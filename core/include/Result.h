#pragma once

/**
 * @file Result.h
 * @brief Error handling types for BehaviorSentinel
 *
 * Result<T, E> holds either a success value or an Error. Persistence,
 * config loading and state decoding return it instead of throwing.
 */

#include <variant>
#include <string>
#include <optional>
#include <utility>

namespace BehaviorSentinel {

    /**
     * @brief Error codes for BehaviorSentinel operations
     */
    enum class ErrorCode {
        Success = 0,

        // Input errors (100-199)
        InvalidArgument = 100,
        ParseError = 101,

        // File errors (200-299)
        FileNotFound = 200,
        FileWriteError = 201,

        // Storage errors (300-399)
        DatabaseError = 300,
        DatabaseOpenFailed = 301,
        QueryFailed = 302,
        NotFound = 303,

        // Configuration errors (600-699)
        ConfigError = 600,

        // Scoring errors (700-799)
        ExternalScorerFailed = 700,

        InternalError = 999
    };

    inline const char* errorCodeToString(ErrorCode code) {
        switch (code) {
            case ErrorCode::Success: return "Success";
            case ErrorCode::InvalidArgument: return "Invalid argument";
            case ErrorCode::ParseError: return "Parse error";
            case ErrorCode::FileNotFound: return "File not found";
            case ErrorCode::FileWriteError: return "File write error";
            case ErrorCode::DatabaseError: return "Database error";
            case ErrorCode::DatabaseOpenFailed: return "Database open failed";
            case ErrorCode::QueryFailed: return "Query failed";
            case ErrorCode::NotFound: return "Not found";
            case ErrorCode::ConfigError: return "Configuration error";
            case ErrorCode::ExternalScorerFailed: return "External scorer failed";
            case ErrorCode::InternalError: return "Internal error";
            default: return "Unknown error";
        }
    }

    struct Error {
        ErrorCode code;
        std::string message;

        Error(ErrorCode c) : code(c), message(errorCodeToString(c)) {}
        Error(ErrorCode c, std::string msg) : code(c), message(std::move(msg)) {}

        bool operator==(const Error& other) const { return code == other.code; }
        bool operator!=(const Error& other) const { return code != other.code; }
    };

    /**
     * @brief Success value or Error
     *
     * @code
     * auto state = TouchAgent::State::decode(text);
     * if (!state) {
     *     LOG_WARN_COMP(state.error().message, "AgentSuite");
     * }
     * @endcode
     */
    template<typename T, typename E = Error>
    class Result {
    public:
        Result(T value) : data_(std::move(value)) {}
        Result(E error) : data_(std::move(error)) {}

        bool ok() const { return std::holds_alternative<T>(data_); }
        explicit operator bool() const { return ok(); }
        bool isError() const { return std::holds_alternative<E>(data_); }

        /// Throws std::bad_variant_access on error
        T& value() & { return std::get<T>(data_); }
        const T& value() const& { return std::get<T>(data_); }
        T&& value() && { return std::get<T>(std::move(data_)); }

        T valueOr(T defaultValue) const {
            if (ok()) return std::get<T>(data_);
            return defaultValue;
        }

        E& error() & { return std::get<E>(data_); }
        const E& error() const& { return std::get<E>(data_); }

        T& operator*() & { return value(); }
        const T& operator*() const& { return value(); }
        T&& operator*() && { return std::move(value()); }

        T* operator->() { return &value(); }
        const T* operator->() const { return &value(); }

    private:
        std::variant<T, E> data_;
    };

    template<typename E>
    class Result<void, E> {
    public:
        Result() : error_(std::nullopt) {}
        Result(E error) : error_(std::move(error)) {}

        bool ok() const { return !error_.has_value(); }
        explicit operator bool() const { return ok(); }
        bool isError() const { return error_.has_value(); }

        E& error() { return *error_; }
        const E& error() const { return *error_; }

    private:
        std::optional<E> error_;
    };

    template<typename T>
    Result<T> Ok(T value) {
        return Result<T>(std::move(value));
    }

    inline Result<void> Ok() {
        return Result<void>();
    }

    template<typename T = void>
    Result<T> Err(ErrorCode code) {
        return Result<T>(Error{code});
    }

    template<typename T = void>
    Result<T> Err(ErrorCode code, std::string message) {
        return Result<T>(Error{code, std::move(message)});
    }

}
