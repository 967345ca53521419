#pragma once

#include <cassert>
#include <optional>
#include <sstream>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace toolhost {

// ---------------------------------------------------------------------------
// Result<T, E>: either a value or an error, never both.
// ---------------------------------------------------------------------------
template <typename T, typename E>
class Result {
public:
    static Result Ok(const T& value) { return Result(OkTag{}, value); }
    static Result Ok(T&& value) { return Result(OkTag{}, std::move(value)); }

    static Result Err(const E& error) { return Result(ErrTag{}, error); }
    static Result Err(E&& error) { return Result(ErrTag{}, std::move(error)); }

    [[nodiscard]] bool IsOk() const noexcept { return storage_.index() == 0; }
    [[nodiscard]] bool IsErr() const noexcept { return storage_.index() == 1; }
    explicit operator bool() const noexcept { return IsOk(); }

    [[nodiscard]] const T& Value() const& {
        assert(IsOk() && "Value() called on an Err Result");
        return std::get<0>(storage_);
    }

    [[nodiscard]] T Value() && {
        assert(IsOk() && "Value() called on an Err Result");
        return std::get<0>(std::move(storage_));
    }

    [[nodiscard]] const E& Error() const& {
        assert(IsErr() && "Error() called on an Ok Result");
        return std::get<1>(storage_);
    }

    [[nodiscard]] E Error() && {
        assert(IsErr() && "Error() called on an Ok Result");
        return std::get<1>(std::move(storage_));
    }

    [[nodiscard]] T ValueOr(T fallback) const& {
        return IsOk() ? std::get<0>(storage_) : std::move(fallback);
    }

    // fn: const T& -> Result<U, E>
    template <typename Fn>
    auto AndThen(Fn&& fn) const& -> std::invoke_result_t<Fn, const T&> {
        using Next = std::invoke_result_t<Fn, const T&>;
        if (IsErr()) {
            return Next::Err(std::get<1>(storage_));
        }
        return std::forward<Fn>(fn)(std::get<0>(storage_));
    }

    // fn: T&& -> Result<U, E>
    template <typename Fn>
    auto AndThen(Fn&& fn) && -> std::invoke_result_t<Fn, T&&> {
        using Next = std::invoke_result_t<Fn, T&&>;
        if (IsErr()) {
            return Next::Err(std::get<1>(std::move(storage_)));
        }
        return std::forward<Fn>(fn)(std::get<0>(std::move(storage_)));
    }

    // fn: const T& -> U
    template <typename Fn>
    auto Map(Fn&& fn) const& -> Result<std::invoke_result_t<Fn, const T&>, E> {
        using U = std::invoke_result_t<Fn, const T&>;
        if (IsErr()) {
            return Result<U, E>::Err(std::get<1>(storage_));
        }
        return Result<U, E>::Ok(std::forward<Fn>(fn)(std::get<0>(storage_)));
    }

private:
    struct OkTag {};
    struct ErrTag {};

    Result(OkTag, const T& value) : storage_(std::in_place_index<0>, value) {}
    Result(OkTag, T&& value) : storage_(std::in_place_index<0>, std::move(value)) {}
    Result(ErrTag, const E& error) : storage_(std::in_place_index<1>, error) {}
    Result(ErrTag, E&& error) : storage_(std::in_place_index<1>, std::move(error)) {}

    std::variant<T, E> storage_;
};

// ---------------------------------------------------------------------------
// Result<void, E>: success carries no value.
// ---------------------------------------------------------------------------
template <typename E>
class Result<void, E> {
public:
    static Result Ok() { return Result(); }
    static Result Err(const E& error) { return Result(error); }
    static Result Err(E&& error) { return Result(std::move(error)); }

    [[nodiscard]] bool IsOk() const noexcept { return !error_.has_value(); }
    [[nodiscard]] bool IsErr() const noexcept { return error_.has_value(); }
    explicit operator bool() const noexcept { return IsOk(); }

    [[nodiscard]] const E& Error() const& {
        assert(IsErr() && "Error() called on an Ok Result");
        return *error_;
    }

    [[nodiscard]] E Error() && {
        assert(IsErr() && "Error() called on an Ok Result");
        return std::move(*error_);
    }

private:
    Result() = default;
    explicit Result(const E& error) : error_(error) {}
    explicit Result(E&& error) : error_(std::move(error)) {}

    std::optional<E> error_;
};

// ---------------------------------------------------------------------------
// ErrorCategory: what kind of operational failure occurred.
// ---------------------------------------------------------------------------
enum class ErrorCategory {
    Io,
    Connection,
    Timeout,
    Http,
    Config,
    Internal,
};

// ---------------------------------------------------------------------------
// Error: operational failure reported by the filesystem, HTTP and config
// layers. The tool layer turns these into ToolError at the MCP boundary.
// ---------------------------------------------------------------------------
struct Error {
    std::string operation;              // e.g. "ReadFile", "HttpClient"
    std::string target;                 // path or URL, may be empty
    std::optional<int> http_status;
    std::string message;
    ErrorCategory category = ErrorCategory::Internal;

    /// Build an Io error from an errno value; message is the OS text.
    static Error FromErrno(const std::string& operation,
                           const std::string& target,
                           int errno_value);

    [[nodiscard]] std::string CategoryName() const {
        switch (category) {
            case ErrorCategory::Io:         return "io";
            case ErrorCategory::Connection: return "connection";
            case ErrorCategory::Timeout:    return "timeout";
            case ErrorCategory::Http:       return "http";
            case ErrorCategory::Config:     return "config";
            case ErrorCategory::Internal:   return "internal";
        }
        return "internal";
    }

    [[nodiscard]] std::string ToString() const {
        std::ostringstream oss;
        oss << operation;
        if (!target.empty()) {
            oss << " [" << target << "]";
        }
        if (http_status.has_value()) {
            oss << " (HTTP " << *http_status << ")";
        }
        oss << ": " << message;
        return oss.str();
    }

    friend std::ostream& operator<<(std::ostream& os, const Error& e) {
        return os << e.ToString();
    }

    bool operator==(const Error& other) const {
        return operation == other.operation &&
               target == other.target &&
               http_status == other.http_status &&
               message == other.message &&
               category == other.category;
    }

    bool operator!=(const Error& other) const { return !(*this == other); }
};

} // namespace toolhost
