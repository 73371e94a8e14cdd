#pragma once

/// @file error.hpp
/// @brief Error values and Result<T, E> for keystone_core
///
/// Store-level failures are values, not exceptions: an Error carries a
/// category code, a message (or a structured kind) and a string context map
/// that ends up in log lines through build_error_chain().

#include "fwd.hpp"
#include <cstdint>
#include <map>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace keystone_core {

// =============================================================================
// ErrorCode
// =============================================================================

/// Category of an Error
enum class ErrorCode : std::uint8_t {
    Unknown = 0,
    NotFound,           ///< Missing file or key
    InvalidArgument,
    InvalidState,
    IOError,            ///< File could not be read
    ParseError,         ///< Malformed JSON, wrong field type, bad dice notation
    ValidationError,    ///< Well-formed but unacceptable value
    TransactionFailed,  ///< A mutation batch was rejected
};

/// Name of an error code, e.g. "ParseError"
[[nodiscard]] const char* error_code_name(ErrorCode code);

// =============================================================================
// TransactionError
// =============================================================================

/// Structured payload of a rejected mutation batch
struct TransactionError {
    enum class Kind : std::uint8_t {
        MutationFailed,
    };

    Kind kind{Kind::MutationFailed};
    std::string message;
    /// Descriptions of every mutation in the batch, joined with "; "
    std::string action;
    std::string reason;
    std::string failed_mutation;

    /// "Transaction failed: <reason>"
    [[nodiscard]] static TransactionError mutation_failed(
        std::string action, std::string failed_mutation, const std::string& reason);
};

// =============================================================================
// Error
// =============================================================================

class Error {
public:
    using Payload = std::variant<std::string, TransactionError>;
    using Context = std::map<std::string, std::string>;

    Error() : Error(ErrorCode::Unknown, std::string("Unknown error")) {}
    Error(const char* message) : Error(ErrorCode::Unknown, std::string(message)) {}
    Error(std::string message) : Error(ErrorCode::Unknown, std::move(message)) {}
    Error(ErrorCode code, std::string message)
        : m_code(code), m_payload(std::in_place_type<std::string>, std::move(message)) {}
    Error(TransactionError error)
        : m_code(ErrorCode::TransactionFailed)
        , m_payload(std::in_place_type<TransactionError>, std::move(error)) {}

    [[nodiscard]] ErrorCode code() const noexcept { return m_code; }

    /// Human-readable message (the kind's message for structured payloads)
    [[nodiscard]] const std::string& message() const {
        if (const auto* tx = std::get_if<TransactionError>(&m_payload)) {
            return tx->message;
        }
        return std::get<std::string>(m_payload);
    }

    template<typename T>
    [[nodiscard]] bool is() const noexcept { return std::holds_alternative<T>(m_payload); }

    template<typename T>
    [[nodiscard]] const T* as() const noexcept { return std::get_if<T>(&m_payload); }

    [[nodiscard]] const Payload& payload() const noexcept { return m_payload; }

    /// Attach a key/value pair; an existing key is overwritten
    Error& with_context(const std::string& key, std::string value) {
        m_context[key] = std::move(value);
        return *this;
    }

    /// Context value or nullptr
    [[nodiscard]] const std::string* get_context(const std::string& key) const {
        auto it = m_context.find(key);
        return it == m_context.end() ? nullptr : &it->second;
    }

    [[nodiscard]] const Context& context() const noexcept { return m_context; }

private:
    ErrorCode m_code;
    Payload m_payload;
    Context m_context;
};

/// Code, message and every context entry on its own indented line
[[nodiscard]] std::string build_error_chain(const Error& error);

// =============================================================================
// Result<T, E>
// =============================================================================

/// Holds either a T or an E
template<typename T, typename E>
class Result {
public:
    using value_type = T;
    using error_type = E;

    Result(T value) : m_storage(std::in_place_index<0>, std::move(value)) {}
    Result(E error) : m_storage(std::in_place_index<1>, std::move(error)) {}

    [[nodiscard]] bool is_ok() const noexcept { return m_storage.index() == 0; }
    [[nodiscard]] bool is_err() const noexcept { return m_storage.index() == 1; }
    explicit operator bool() const noexcept { return is_ok(); }

    // Unchecked access
    [[nodiscard]] T& value() & { return *std::get_if<0>(&m_storage); }
    [[nodiscard]] const T& value() const& { return *std::get_if<0>(&m_storage); }
    [[nodiscard]] T&& value() && { return std::move(*std::get_if<0>(&m_storage)); }

    [[nodiscard]] E& error() & { return *std::get_if<1>(&m_storage); }
    [[nodiscard]] const E& error() const& { return *std::get_if<1>(&m_storage); }

    [[nodiscard]] T& operator*() & { return value(); }
    [[nodiscard]] const T& operator*() const& { return value(); }
    [[nodiscard]] T* operator->() { return &value(); }
    [[nodiscard]] const T* operator->() const { return &value(); }

    [[nodiscard]] T value_or(T fallback) const {
        return is_ok() ? value() : std::move(fallback);
    }

    /// Checked access
    /// @throws std::runtime_error carrying the error message
    [[nodiscard]] T& unwrap() & {
        check();
        return value();
    }

    [[nodiscard]] T&& unwrap() && {
        check();
        return std::move(*this).value();
    }

    /// Transform the value, passing errors through
    template<typename F>
    auto map(F&& func) -> Result<std::invoke_result_t<F, T&>, E> {
        using U = std::invoke_result_t<F, T&>;
        if (is_ok()) {
            return Result<U, E>(std::forward<F>(func)(value()));
        }
        return Result<U, E>(error());
    }

    /// Chain a fallible step, passing errors through
    template<typename F>
    auto and_then(F&& func) -> std::invoke_result_t<F, T&> {
        using R = std::invoke_result_t<F, T&>;
        if (is_ok()) {
            return std::forward<F>(func)(value());
        }
        return R(error());
    }

private:
    void check() const {
        if (is_err()) {
            if constexpr (std::is_same_v<E, Error>) {
                throw std::runtime_error("Result contains error: " + error().message());
            } else {
                throw std::runtime_error("Result contains error");
            }
        }
    }

    std::variant<T, E> m_storage;
};

/// Result without a value
template<typename E>
class Result<void, E> {
public:
    using value_type = void;
    using error_type = E;

    Result() = default;
    Result(E error) : m_error(std::move(error)), m_failed(true) {}

    [[nodiscard]] bool is_ok() const noexcept { return !m_failed; }
    [[nodiscard]] bool is_err() const noexcept { return m_failed; }
    explicit operator bool() const noexcept { return !m_failed; }

    [[nodiscard]] E& error() & { return m_error; }
    [[nodiscard]] const E& error() const& { return m_error; }

    /// @throws std::runtime_error when failed
    void unwrap() const {
        if (m_failed) {
            throw std::runtime_error("Result contains error");
        }
    }

private:
    E m_error{};
    bool m_failed{false};
};

template<typename T>
[[nodiscard]] Result<T> Ok(T value) {
    return Result<T>(std::move(value));
}

[[nodiscard]] inline Result<void> Ok() {
    return Result<void>();
}

template<typename T = void>
[[nodiscard]] Result<T> Err(Error error) {
    return Result<T>(std::move(error));
}

template<typename T = void>
[[nodiscard]] Result<T> Err(ErrorCode code, std::string message) {
    return Result<T>(Error(code, std::move(message)));
}

} // namespace keystone_core
