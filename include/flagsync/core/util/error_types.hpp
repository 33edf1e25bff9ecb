/**
 * @file error_types.hpp
 * @brief Error type definitions for flagsync.
 *
 * Provides the error taxonomy shared by every component and the Result<T>
 * return type used on fallible operations (transport calls, enqueue, flush,
 * retry and circuit breaker execution).
 */
#pragma once
#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <variant>
#include <stdexcept>

namespace flagsync {

    /**
     * @enum ErrorKind
     * @brief Error categories.
     *
     * - Network: transport failure or non-2xx response
     * - Validation: malformed queue item or config entry
     * - CircuitOpen: breaker rejected the call without running it
     * - MaxAttemptsExceeded: retry budget exhausted, cause holds the last error
     * - Cancelled: caller stopped the operation
     * - Timeout: operation did not complete in time (network category)
     * - Internal: unexpected failure inside the engine
     */
    enum class ErrorKind : int {
        Network = 1,         ///< Transport failure, non-2xx
        Validation,          ///< Rejected input
        CircuitOpen,         ///< Fast-fail from an open breaker
        MaxAttemptsExceeded, ///< Retry exhaustion
        Cancelled,           ///< Cancelled by caller
        Timeout,             ///< Deadline reached
        Internal = 99        ///< Unexpected engine failure
    };

    inline const char* toString(ErrorKind k) {
        switch (k) {
            case ErrorKind::Network:             return "Network";
            case ErrorKind::Validation:          return "Validation";
            case ErrorKind::CircuitOpen:         return "CircuitOpen";
            case ErrorKind::MaxAttemptsExceeded: return "MaxAttemptsExceeded";
            case ErrorKind::Cancelled:           return "Cancelled";
            case ErrorKind::Timeout:             return "Timeout";
            case ErrorKind::Internal:            return "Internal";
        }
        return "Unknown";
    }

    /**
     * @struct Error
     * @brief Error object returned through Result<T>.
     */
    struct Error {
        ErrorKind                     kind{ ErrorKind::Internal }; ///< Error category
        std::string                   message;                     ///< Human readable message
        int                           httpStatus{ 0 };             ///< HTTP status when known
        std::shared_ptr<const Error>  cause;                       ///< Wrapped error, if any

        static Error network(std::string msg, int status = 0) {
            return Error{ ErrorKind::Network, std::move(msg), status, nullptr };
        }
        static Error validation(std::string msg) {
            return Error{ ErrorKind::Validation, std::move(msg), 0, nullptr };
        }
        static Error internal(std::string msg) {
            return Error{ ErrorKind::Internal, std::move(msg), 0, nullptr };
        }
        static Error cancelled(std::string msg = "cancelled") {
            return Error{ ErrorKind::Cancelled, std::move(msg), 0, nullptr };
        }
        static Error timeout(std::string msg) {
            return Error{ ErrorKind::Timeout, std::move(msg), 0, nullptr };
        }
        static Error circuitOpen(const std::string& name) {
            return Error{ ErrorKind::CircuitOpen, "circuit '" + name + "' is open", 0, nullptr };
        }
        static Error maxAttempts(uint32_t attempts, Error last) {
            auto msg = "gave up after " + std::to_string(attempts) + " attempts: " + last.message;
            return Error{ ErrorKind::MaxAttemptsExceeded, std::move(msg), last.httpStatus,
                          std::make_shared<const Error>(std::move(last)) };
        }

        /// Innermost error (unwraps MaxAttemptsExceeded chains).
        const Error& root() const {
            const Error* e = this;
            while (e->cause) e = e->cause.get();
            return *e;
        }

        std::string describe() const {
            return std::string(toString(kind)) + ": " + message;
        }
    };

    /// Network-category errors are the ones worth retrying against a remote.
    inline bool isNetworkError(const Error& e) {
        return e.kind == ErrorKind::Network || e.kind == ErrorKind::Timeout;
    }

    /**
     * @class Result
     * @brief Holds either a value of type T or an Error.
     */
    template<typename T>
    class Result {
    public:
        Result(T value) : v_(std::move(value)) {}
        Result(Error err) : v_(std::move(err)) {}

        bool ok() const { return std::holds_alternative<T>(v_); }
        explicit operator bool() const { return ok(); }

        T& value() {
            if (!ok()) throw std::logic_error("Result::value on error: " + error().describe());
            return std::get<T>(v_);
        }
        const T& value() const {
            if (!ok()) throw std::logic_error("Result::value on error: " + error().describe());
            return std::get<T>(v_);
        }
        const Error& error() const { return std::get<Error>(v_); }

        T valueOr(T fallback) const { return ok() ? std::get<T>(v_) : std::move(fallback); }

    private:
        std::variant<T, Error> v_;
    };

    /**
     * @brief Result specialisation for operations without a value.
     */
    template<>
    class Result<void> {
    public:
        Result() = default;
        Result(Error err) : err_(std::make_shared<const Error>(std::move(err))) {}

        static Result success() { return Result{}; }

        bool ok() const { return err_ == nullptr; }
        explicit operator bool() const { return ok(); }
        const Error& error() const {
            if (!err_) throw std::logic_error("Result<void>::error on success");
            return *err_;
        }

    private:
        std::shared_ptr<const Error> err_;
    };

}
