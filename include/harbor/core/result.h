#pragma once

#include <optional>
#include <utility>

#include "harbor/core/error.h"

namespace harbor::core {

/// @brief Minimal Result type used to avoid exceptions across module boundaries.
///
/// The error type defaults to core::Error; storage operations whose callers
/// need structured failure data (sizes, offsets) supply their own.
template <typename T, typename E = Error>
class Result {
public:
    Result(const T& value) : value_(value) {}
    Result(T&& value) : value_(std::move(value)) {}
    Result(const E& error) : value_(std::nullopt), error_(error) {}
    Result(E&& error) : value_(std::nullopt), error_(std::move(error)) {}

    bool ok() const { return value_.has_value(); }
    const T& value() const { return value_.value(); }
    T& value() { return value_.value(); }
    const E& error() const { return error_; }

private:
    std::optional<T> value_;
    E error_{};
};

template <typename E>
class Result<void, E> {
public:
    Result() : ok_(true) {}
    Result(const E& error) : ok_(false), error_(error) {}
    Result(E&& error) : ok_(false), error_(std::move(error)) {}

    bool ok() const { return ok_; }
    void value() const {}
    const E& error() const { return error_; }

private:
    bool ok_{false};
    E error_{};
};

/// @brief Convenience helper for a successful empty result.
inline Result<void> Ok() { return Result<void>(); }

}  // namespace harbor::core
