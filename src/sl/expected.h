#pragma once

/// @file expected.h
/// @brief Generic expected<T, E> type for error handling without exceptions
///
/// Modeled after C++23's std::expected. Every fallible StringList operation
/// returns one of these instead of throwing.
///
/// Example:
/// @code
/// expected<std::string> second(const std::vector<std::string> &v) {
///     if (v.size() < 2) {
///         return expected<std::string>::failure(ResultError::OUT_OF_RANGE, "too short");
///     }
///     return expected<std::string>::success(v[1]);
/// }
///
/// auto result = second(items);
/// if (result.ok()) {
///     const std::string &value = result.value();
/// } else {
///     ResultError err = result.error();
/// }
/// @endcode

#include <stdint.h>

#include <string>
#include <utility>

namespace sl {

/// @brief Error codes for expected
enum class ResultError : uint8_t {
    OK,               ///< No error (not typically used)
    OUT_OF_RANGE,     ///< Index outside the valid bounds
    INVALID_PATTERN,  ///< Regular expression failed to compile
};

/// @brief Name of an error code, e.g. "OUT_OF_RANGE"
inline const char *to_string(ResultError err) {
    switch (err) {
    case ResultError::OK:
        return "OK";
    case ResultError::OUT_OF_RANGE:
        return "OUT_OF_RANGE";
    case ResultError::INVALID_PATTERN:
        return "INVALID_PATTERN";
    }
    return "INVALID";
}

template <typename T, typename E = ResultError> class expected;

/// @brief Error information for expected type
template <typename E> struct ErrorInfo {
    E code;
    std::string message;

    ErrorInfo(E err, const char *msg = nullptr)
        : code(err), message(msg ? msg : "") {}
    ErrorInfo(E err, const std::string &msg) : code(err), message(msg) {}
};

/// @brief expected type for operations that can fail
/// @details T must be default constructible. A failed expected still holds a
/// default-constructed T, so value() on a failure yields an empty value
/// rather than garbage.
template <typename T, typename E> class expected {
  public:
    /// @brief Check if operation succeeded
    bool ok() const { return mOk; }

    /// @brief Get error code (E{} when ok())
    E error() const { return mError.code; }

    /// @brief Get error message ("" when ok())
    const char *message() const { return mError.message.c_str(); }

    T &value() { return mValue; }
    const T &value() const { return mValue; }

    explicit operator bool() const { return ok(); }

    /// @brief Create successful result
    static expected success(T value) {
        expected r;
        r.mOk = true;
        r.mValue = std::move(value);
        return r;
    }

    /// @brief Create error result
    static expected failure(E err, const char *msg = nullptr) {
        expected r;
        r.mError = ErrorInfo<E>(err, msg);
        return r;
    }

    static expected failure(E err, const std::string &msg) {
        expected r;
        r.mError = ErrorInfo<E>(err, msg);
        return r;
    }

    /// @brief Default constructor (creates error state)
    expected() : mOk(false), mValue(), mError(E{}) {}

    expected(expected &&other) = default;
    expected &operator=(expected &&other) = default;
    ~expected() = default;

  private:
    bool mOk;
    T mValue;
    ErrorInfo<E> mError;

    // Non-copyable
    expected(const expected &) = delete;
    expected &operator=(const expected &) = delete;
};

/// @brief Specialization for void (no value to return)
template <typename E> class expected<void, E> {
  public:
    bool ok() const { return mOk; }

    E error() const { return mError.code; }

    const char *message() const { return mError.message.c_str(); }

    explicit operator bool() const { return ok(); }

    static expected success() {
        expected r;
        r.mOk = true;
        return r;
    }

    static expected failure(E err, const char *msg = nullptr) {
        expected r;
        r.mError = ErrorInfo<E>(err, msg);
        return r;
    }

    static expected failure(E err, const std::string &msg) {
        expected r;
        r.mError = ErrorInfo<E>(err, msg);
        return r;
    }

    /// @brief Default constructor (creates error state)
    expected() : mOk(false), mError(E{}) {}

    expected(const expected &other) = default;
    expected &operator=(const expected &other) = default;
    expected(expected &&other) = default;
    expected &operator=(expected &&other) = default;
    ~expected() = default;

  private:
    bool mOk;
    ErrorInfo<E> mError;
};

} // namespace sl
