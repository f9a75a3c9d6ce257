// include/storage_error/result.h
#pragma once

#include "storage_error.h"
#include <optional>
#include <stdexcept>
#include <utility>

namespace mapstore {

/**
 * @brief Result type that can contain either a value or an error
 */
template<typename T>
class Result {
private:
    std::optional<T> value_;
    std::optional<StorageError> error_;

public:
    Result(T val) : value_(std::move(val)) {}
    Result(StorageError err) : error_(std::move(err)) {}

    Result(const Result&) = default;
    Result(Result&&) = default;
    Result& operator=(const Result&) = default;
    Result& operator=(Result&&) = default;

    bool hasValue() const { return value_.has_value(); }
    bool hasError() const { return error_.has_value(); }
    bool isOk() const { return hasValue(); }
    explicit operator bool() const { return isOk(); }

    const T& value() const& {
        if (!hasValue()) throw std::runtime_error("Result has no value (const access)");
        return *value_;
    }

    T& value() & {
        if (!hasValue()) throw std::runtime_error("Result has no value (non-const access)");
        return *value_;
    }

    T&& value() && {
        if (!hasValue()) throw std::runtime_error("Result has no value (rvalue access)");
        return std::move(*value_);
    }

    const T* operator->() const { return &value(); }
    T* operator->() { return &value(); }

    const T& operator*() const& { return value(); }
    T& operator*() & { return value(); }

    const StorageError& error() const& {
        if (!hasError()) throw std::runtime_error("Result has no error (const access)");
        return *error_;
    }
    StorageError& error() & {
        if (!hasError()) throw std::runtime_error("Result has no error (non-const access)");
        return *error_;
    }
    StorageError&& error() && {
        if (!hasError()) throw std::runtime_error("Result has no error (rvalue access)");
        return std::move(*error_);
    }

    T valueOr(T default_value) const& {
        return hasValue() ? *value_ : std::move(default_value);
    }

    // Rethrows the carried error; used where a Result crosses into throwing code.
    const T& valueOrThrow() const& {
        if (hasError()) throw *error_;
        return *value_;
    }

    // Map: if Ok, applies func to value; if Error, propagates error
    template<typename F>
    auto map(F&& func) const& -> Result<decltype(func(std::declval<const T&>()))> {
        if (hasValue()) {
            return Result<decltype(func(*value_))>(func(*value_));
        }
        return Result<decltype(func(*value_))>(*error_);
    }

    template<typename F>
    Result<T> mapError(F&& func) && {
        if (hasError()) {
            return Result<T>(func(std::move(*error_)));
        }
        return std::move(*this);
    }
};

// Specialization for void
template<>
class Result<void> {
private:
    std::optional<StorageError> error_;

public:
    Result() = default; // Represents success
    Result(StorageError err) : error_(std::move(err)) {}

    Result(const Result&) = default;
    Result(Result&&) = default;
    Result& operator=(const Result&) = default;
    Result& operator=(Result&&) = default;

    bool hasError() const { return error_.has_value(); }
    bool isOk() const { return !hasError(); }
    explicit operator bool() const { return isOk(); }

    const StorageError& error() const& {
        if (!hasError()) throw std::runtime_error("Result<void> has no error (const access)");
        return *error_;
    }
    StorageError& error() & {
        if (!hasError()) throw std::runtime_error("Result<void> has no error (non-const access)");
        return *error_;
    }
    StorageError&& error() && {
        if (!hasError()) throw std::runtime_error("Result<void> has no error (rvalue access)");
        return std::move(*error_);
    }

    void throwIfError() const {
        if (hasError()) throw *error_;
    }

    template<typename F>
    Result<void> mapError(F&& func) && {
        if (hasError()) {
            return Result<void>(func(std::move(*error_)));
        }
        return std::move(*this);
    }
};

// Operations that don't return a value but can fail
using Status = Result<void>;

} // namespace mapstore
