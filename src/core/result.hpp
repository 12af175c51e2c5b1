/**
 * @file result.hpp
 * @brief Monadic error handling type for SandboxGate.
 *
 * Result<T, E> is the error channel for every fallible operation. Errors
 * carry an ErrorKind so callers can tell a sandbox that failed to start
 * from a submission that was rejected, without string matching.
 */

#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>

namespace sandbox_gate {

// ─────────────────────────────────────────────
// Error taxonomy
// ─────────────────────────────────────────────

enum class ErrorKind : uint8_t {
    ValidationError,        ///< Malformed request or failed blocking check
    InputTooLarge,
    SecurityRejected,
    InfrastructureError,    ///< Sandbox could not be provisioned / driven
    TimeoutExceeded,
    ResourceExceeded,
    RuntimeError,
    BackpressureRejected,
    Cancelled,
    NotFound,
    Internal
};

[[nodiscard]] constexpr std::string_view to_string(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::ValidationError:      return "validation_error";
        case ErrorKind::InputTooLarge:        return "input_too_large";
        case ErrorKind::SecurityRejected:     return "security_rejected";
        case ErrorKind::InfrastructureError:  return "infrastructure_error";
        case ErrorKind::TimeoutExceeded:      return "timeout_exceeded";
        case ErrorKind::ResourceExceeded:     return "resource_exceeded";
        case ErrorKind::RuntimeError:         return "runtime_error";
        case ErrorKind::BackpressureRejected: return "backpressure_rejected";
        case ErrorKind::Cancelled:            return "cancelled";
        case ErrorKind::NotFound:             return "not_found";
        case ErrorKind::Internal:             return "internal";
    }
    return "unknown";
}

/**
 * @brief Error type carrying a kind and a descriptive message.
 */
struct Error {
    ErrorKind kind{ErrorKind::Internal};
    std::string message;

    explicit Error(std::string msg)
        : message(std::move(msg)) {}

    Error(ErrorKind k, std::string msg)
        : kind(k), message(std::move(msg)) {}

    [[nodiscard]] const std::string& what() const noexcept { return message; }
};

/**
 * @brief Result<T, E> — holds either a success value or an error.
 */
template <typename T, typename E = Error>
class Result {
public:
    Result(T value) : storage_(std::move(value)) {}  // NOLINT(implicit)
    Result(E error) : storage_(std::move(error)) {}  // NOLINT(implicit)

    [[nodiscard]] bool has_value() const noexcept {
        return std::holds_alternative<T>(storage_);
    }

    [[nodiscard]] explicit operator bool() const noexcept {
        return has_value();
    }

    [[nodiscard]] T& value() & {
        if (!has_value()) throw std::runtime_error("Result has no value: " + error_text());
        return std::get<T>(storage_);
    }

    [[nodiscard]] const T& value() const& {
        if (!has_value()) throw std::runtime_error("Result has no value: " + error_text());
        return std::get<T>(storage_);
    }

    [[nodiscard]] T&& value() && {
        if (!has_value()) throw std::runtime_error("Result has no value: " + error_text());
        return std::get<T>(std::move(storage_));
    }

    [[nodiscard]] T& operator*() & { return value(); }
    [[nodiscard]] const T& operator*() const& { return value(); }
    [[nodiscard]] T&& operator*() && { return std::move(*this).value(); }
    [[nodiscard]] T* operator->() { return &value(); }
    [[nodiscard]] const T* operator->() const { return &value(); }

    [[nodiscard]] E& error() & {
        if (has_value()) throw std::runtime_error("Result has no error");
        return std::get<E>(storage_);
    }

    [[nodiscard]] const E& error() const& {
        if (has_value()) throw std::runtime_error("Result has no error");
        return std::get<E>(storage_);
    }

    /// Transform the success value.
    template <typename F>
    auto map(F&& func) const -> Result<std::invoke_result_t<F, const T&>, E> {
        if (has_value()) {
            return func(value());
        }
        return error();
    }

    /// Chain with a function that returns a Result.
    template <typename F>
    auto and_then(F&& func) const -> std::invoke_result_t<F, const T&> {
        if (has_value()) {
            return func(value());
        }
        return error();
    }

    [[nodiscard]] T value_or(T default_value) const& {
        if (has_value()) return value();
        return default_value;
    }

private:
    std::string error_text() const {
        if constexpr (std::is_same_v<E, Error>) {
            return std::get<E>(storage_).message;
        } else {
            return {};
        }
    }

    std::variant<T, E> storage_;
};

/**
 * @brief Specialization of Result for operations with no success value.
 */
template <typename E>
class Result<void, E> {
public:
    Result() : has_value_(true) {}
    Result(E error) : error_(std::move(error)), has_value_(false) {}  // NOLINT(implicit)

    [[nodiscard]] bool has_value() const noexcept { return has_value_; }
    [[nodiscard]] explicit operator bool() const noexcept { return has_value_; }

    [[nodiscard]] E& error() & {
        if (has_value_) throw std::runtime_error("Result has no error");
        return *error_;
    }

    [[nodiscard]] const E& error() const& {
        if (has_value_) throw std::runtime_error("Result has no error");
        return *error_;
    }

private:
    std::optional<E> error_;
    bool has_value_;
};

/// Convenience factory for error results.
template <typename T, typename E = Error>
Result<T, E> make_error(ErrorKind kind, std::string message) {
    return Result<T, E>(E{kind, std::move(message)});
}

}  // namespace sandbox_gate
