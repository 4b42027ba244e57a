#pragma once

#include <cstdint>
#include <optional>
#include <ostream>
#include <utility>

namespace saorsa_logic {

/**
 * LogicError - closed set of structural failures
 *
 * A verification mismatch is never a LogicError; it is a `false` result.
 */
enum class LogicError : uint8_t {
    InvalidLength = 1,   // input buffer is not the required fixed size
    MalformedProof = 2,  // wrong proof length or out-of-range leaf index
    HashingFailed = 3,   // digest library reported an internal failure
};

const char* to_string(LogicError error);

std::ostream& operator<<(std::ostream& os, LogicError error);

/**
 * LogicResult - either a value or a LogicError
 *
 * Built with the `ok` / `err` factories. `value()` on an error result throws
 * std::bad_optional_access; callers check `is_ok()` first.
 */
template <typename T>
class LogicResult {
public:
    static LogicResult ok(T value) {
        LogicResult r;
        r.value_ = std::move(value);
        return r;
    }

    static LogicResult err(LogicError error) {
        LogicResult r;
        r.error_ = error;
        return r;
    }

    bool is_ok() const { return value_.has_value(); }
    bool is_error() const { return !value_.has_value(); }
    explicit operator bool() const { return is_ok(); }

    // Only meaningful when is_error()
    LogicError error() const { return error_; }

    const T& value() const& { return value_.value(); }
    T& value() & { return value_.value(); }
    T&& value() && { return std::move(value_).value(); }

    T value_or(T fallback) const {
        return value_.has_value() ? *value_ : std::move(fallback);
    }

private:
    LogicResult() : value_(), error_(LogicError::HashingFailed) {}

    std::optional<T> value_;
    LogicError error_;
};

} // namespace saorsa_logic
