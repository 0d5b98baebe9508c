#pragma once

#include <variant>
#include <string>
#include <functional>
#include <stdexcept>
#include <type_traits>

namespace airshare {

/**
 * ErrorCode - Failure classes surfaced to callers.
 *
 * The first four are the protocol-level failures every caller has to
 * distinguish; the rest describe where a transfer broke.
 */
enum class ErrorCode : int {
    Generic = 0,
    InvalidInput,
    NameAlreadyRegistered,
    ServiceNotFound,
    RoleMismatch,
    Io,
    Network,
    Protocol,
    DiscoveryUnavailable,
};

[[nodiscard]] constexpr const char* error_code_name(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Generic: return "Error";
        case ErrorCode::InvalidInput: return "InvalidInputError";
        case ErrorCode::NameAlreadyRegistered: return "NameAlreadyRegisteredError";
        case ErrorCode::ServiceNotFound: return "ServiceNotFoundError";
        case ErrorCode::RoleMismatch: return "RoleMismatchError";
        case ErrorCode::Io: return "IoError";
        case ErrorCode::Network: return "NetworkError";
        case ErrorCode::Protocol: return "ProtocolError";
        case ErrorCode::DiscoveryUnavailable: return "DiscoveryUnavailableError";
    }
    return "Error";
}

/**
 * Error type for Result - a failure with a message and a code.
 */
struct Error {
    std::string message;
    ErrorCode code{ErrorCode::Generic};

    Error() = default;
    explicit Error(std::string msg, ErrorCode c = ErrorCode::Generic)
        : message(std::move(msg)), code(c) {}

    bool operator==(const Error& other) const {
        return message == other.message && code == other.code;
    }
};

/**
 * Result<T, E> - Either a successful value (Ok) or an error (Err).
 *
 * Usage:
 *   Result<int> parse_port(std::string_view s);
 *
 *   auto port = parse_port(text)
 *       .and_then([](int p) { return validate(p); });
 */
template<typename T, typename E = Error>
class Result {
public:
    using value_type = T;
    using error_type = E;

    [[nodiscard]] static Result ok(T value) {
        return Result(std::in_place_index<0>, std::move(value));
    }

    [[nodiscard]] static Result err(E error) {
        return Result(std::in_place_index<1>, std::move(error));
    }

    [[nodiscard]] bool is_ok() const noexcept {
        return data_.index() == 0;
    }

    [[nodiscard]] bool is_err() const noexcept {
        return data_.index() == 1;
    }

    /**
     * Get the success value, throwing if this is an error.
     */
    [[nodiscard]] T& unwrap() & {
        throw_if_err();
        return std::get<0>(data_);
    }

    [[nodiscard]] const T& unwrap() const& {
        throw_if_err();
        return std::get<0>(data_);
    }

    [[nodiscard]] T unwrap() && {
        throw_if_err();
        return std::get<0>(std::move(data_));
    }

    [[nodiscard]] E& unwrap_err() & {
        if (is_ok()) {
            throw std::runtime_error("Result::unwrap_err() called on success");
        }
        return std::get<1>(data_);
    }

    [[nodiscard]] const E& unwrap_err() const& {
        if (is_ok()) {
            throw std::runtime_error("Result::unwrap_err() called on success");
        }
        return std::get<1>(data_);
    }

    [[nodiscard]] T value_or(T default_value) const& {
        if (is_ok()) {
            return std::get<0>(data_);
        }
        return default_value;
    }

    /**
     * map : Result<T, E> -> (T -> U) -> Result<U, E>
     */
    template<typename F>
    [[nodiscard]] auto map(F&& f) && -> Result<std::invoke_result_t<F, T>, E> {
        using U = std::invoke_result_t<F, T>;
        if (is_ok()) {
            return Result<U, E>::ok(std::invoke(std::forward<F>(f), std::get<0>(std::move(data_))));
        }
        return Result<U, E>::err(std::get<1>(std::move(data_)));
    }

    /**
     * and_then : Result<T, E> -> (T -> Result<U, E>) -> Result<U, E>
     */
    template<typename F>
    [[nodiscard]] auto and_then(F&& f) && -> std::invoke_result_t<F, T> {
        using ResultU = std::invoke_result_t<F, T>;
        if (is_ok()) {
            return std::invoke(std::forward<F>(f), std::get<0>(std::move(data_)));
        }
        return ResultU::err(std::get<1>(std::move(data_)));
    }

    /**
     * Execute a function on error, returning this Result unchanged.
     */
    template<typename F>
    const Result& inspect_err(F&& f) const& {
        if (is_err()) {
            std::invoke(std::forward<F>(f), std::get<1>(data_));
        }
        return *this;
    }

private:
    template<size_t I, typename... Args>
    explicit Result(std::in_place_index_t<I> idx, Args&&... args)
        : data_(idx, std::forward<Args>(args)...) {}

    void throw_if_err() const {
        if (is_ok()) return;
        if constexpr (std::is_same_v<E, Error>) {
            throw std::runtime_error("Result::unwrap() called on error: " +
                                     std::get<1>(data_).message);
        } else {
            throw std::runtime_error("Result::unwrap() called on error");
        }
    }

    // Indexed rather than typed so Result<E, E> stays well-formed.
    std::variant<T, E> data_;
};

/**
 * Specialization for operations that succeed without a value.
 */
template<typename E>
class Result<void, E> {
public:
    using value_type = void;
    using error_type = E;

    [[nodiscard]] static Result ok() {
        return Result(true);
    }

    [[nodiscard]] static Result err(E error) {
        return Result(std::move(error));
    }

    [[nodiscard]] bool is_ok() const noexcept { return is_ok_; }
    [[nodiscard]] bool is_err() const noexcept { return !is_ok_; }

    void unwrap() const {
        if (is_err()) {
            if constexpr (std::is_same_v<E, Error>) {
                throw std::runtime_error("Result::unwrap() called on error: " + error_.message);
            } else {
                throw std::runtime_error("Result::unwrap() called on error");
            }
        }
    }

    [[nodiscard]] E& unwrap_err() & {
        if (is_ok()) {
            throw std::runtime_error("Result::unwrap_err() called on success");
        }
        return error_;
    }

    [[nodiscard]] const E& unwrap_err() const& {
        if (is_ok()) {
            throw std::runtime_error("Result::unwrap_err() called on success");
        }
        return error_;
    }

    template<typename F>
    [[nodiscard]] auto and_then(F&& f) const -> std::invoke_result_t<F> {
        using ResultU = std::invoke_result_t<F>;
        if (is_ok()) {
            return std::invoke(std::forward<F>(f));
        }
        return ResultU::err(error_);
    }

private:
    explicit Result(bool ok) : is_ok_(ok) {}
    explicit Result(E error) : is_ok_(false), error_(std::move(error)) {}

    bool is_ok_;
    E error_{};
};

template<typename T>
using Res = Result<T, Error>;

} // namespace airshare
