// File: src/support/result.hpp
// Purpose: Value-or-error container used by fallible editor operations.
// Key invariants: A Result holds exactly one of a value or an error message.
// Ownership/Lifetime: Result owns contained value or error.
// Links: src/ui/Document.hpp, src/config/Config.hpp
#pragma once

#include <optional>
#include <string>
#include <type_traits>
#include <utility>

namespace ite::support
{

/// @brief Tag type used to construct successful Result values explicitly.
struct SuccessTag
{
    constexpr SuccessTag() = default;
};

/// @brief Sentinel instance for success construction convenience.
inline constexpr SuccessTag kSuccessTag{};

/// @brief Minimal expected-like container.
/// @invariant Either holds a value or an error string.
template <typename T> class Result
{
  public:
    /// @brief Creates a successful result containing @p value.
    template <typename U = T> Result(SuccessTag /*tag*/, U &&value) : value_(std::forward<U>(value))
    {
    }

    /// @brief Creates a successful result from a value without an explicit tag.
    template <typename U = T,
              typename = std::enable_if_t<!std::is_same_v<std::decay_t<U>, Result>>>
    Result(U &&value) : Result(kSuccessTag, std::forward<U>(value))
    {
    }

    /// @brief Factory that constructs a successful result.
    template <typename U = T> static Result success(U &&value)
    {
        return Result(kSuccessTag, std::forward<U>(value));
    }

    /// @brief Factory that constructs an error result with a message.
    static Result error(std::string message)
    {
        return Result(ErrorTag{}, std::move(message));
    }

    /// @brief Indicates whether the Result currently holds a value.
    bool isOk() const
    {
        return value_.has_value();
    }

    explicit operator bool() const
    {
        return isOk();
    }

    /// @pre @c isOk() must return true.
    T &value()
    {
        return *value_;
    }

    /// @pre @c isOk() must return true.
    const T &value() const
    {
        return *value_;
    }

    /// @pre @c isOk() must return false.
    const std::string &error() const
    {
        return error_;
    }

  private:
    struct ErrorTag
    {
        constexpr ErrorTag() = default;
    };

    Result(ErrorTag /*tag*/, std::string message) : error_(std::move(message)) {}

    std::optional<T> value_;
    std::string error_;
};

/// @brief Result specialization for operations that only report success or failure.
template <> class Result<void>
{
  public:
    /// @brief Construct a successful result with no payload.
    Result() = default;

    static Result success()
    {
        return Result();
    }

    static Result error(std::string message)
    {
        Result r;
        r.error_ = std::move(message);
        return r;
    }

    bool isOk() const
    {
        return !error_.has_value();
    }

    explicit operator bool() const
    {
        return isOk();
    }

    /// @pre @c isOk() must return false.
    const std::string &error() const
    {
        return *error_;
    }

  private:
    std::optional<std::string> error_;
};

} // namespace ite::support
