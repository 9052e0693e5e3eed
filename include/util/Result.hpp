#pragma once
#include <new>
#include <utility>
#include <type_traits>

namespace util {

// Result<T, E> for error handling without exceptions.
// Driver accessors return one of these instead of throwing.
template<typename T, typename E>
class Result {
public:
    static Result Ok(T value) {
        Result r;
        r.isOk_ = true;
        new (&r.value_) T(std::move(value));
        return r;
    }

    static Result Err(E error) {
        Result r;
        r.isOk_ = false;
        new (&r.error_) E(std::move(error));
        return r;
    }

    Result(const Result& other) : isOk_(other.isOk_) {
        if (isOk_) {
            new (&value_) T(other.value_);
        } else {
            new (&error_) E(other.error_);
        }
    }

    Result(Result&& other) noexcept : isOk_(other.isOk_) {
        if (isOk_) {
            new (&value_) T(std::move(other.value_));
        } else {
            new (&error_) E(std::move(other.error_));
        }
    }

    Result& operator=(const Result&) = delete;
    Result& operator=(Result&&) = delete;

    ~Result() {
        if (isOk_) {
            value_.~T();
        } else {
            error_.~E();
        }
    }

    bool isOk() const { return isOk_; }
    bool isErr() const { return !isOk_; }
    explicit operator bool() const { return isOk_; }

    T& value() { return value_; }
    const T& value() const { return value_; }
    E& error() { return error_; }
    const E& error() const { return error_; }

    // Transform the success value, pass errors through
    template<typename F>
    auto map(F&& f) const -> Result<decltype(f(std::declval<const T&>())), E> {
        using U = decltype(f(std::declval<const T&>()));
        if (isOk_) {
            return Result<U, E>::Ok(f(value_));
        }
        return Result<U, E>::Err(error_);
    }

    // Convert the error type, e.g. a transport error into a device error
    template<typename F>
    auto mapErr(F&& f) const -> Result<T, decltype(f(std::declval<const E&>()))> {
        using E2 = decltype(f(std::declval<const E&>()));
        if (isOk_) {
            return Result<T, E2>::Ok(value_);
        }
        return Result<T, E2>::Err(f(error_));
    }

private:
    Result() : isOk_(false) {}

    bool isOk_;
    union {
        T value_;
        E error_;
    };
};

// Specialization for operations that only report success or failure
template<typename E>
class Result<void, E> {
public:
    static Result Ok() {
        Result r;
        r.isOk_ = true;
        return r;
    }

    static Result Err(E error) {
        Result r;
        r.isOk_ = false;
        new (&r.error_) E(std::move(error));
        return r;
    }

    Result(const Result& other) : isOk_(other.isOk_) {
        if (!isOk_) {
            new (&error_) E(other.error_);
        }
    }

    Result(Result&& other) noexcept : isOk_(other.isOk_) {
        if (!isOk_) {
            new (&error_) E(std::move(other.error_));
        }
    }

    Result& operator=(const Result&) = delete;
    Result& operator=(Result&&) = delete;

    ~Result() {
        if (!isOk_) {
            error_.~E();
        }
    }

    bool isOk() const { return isOk_; }
    bool isErr() const { return !isOk_; }
    explicit operator bool() const { return isOk_; }

    E& error() { return error_; }
    const E& error() const { return error_; }

    template<typename F>
    auto mapErr(F&& f) const -> Result<void, decltype(f(std::declval<const E&>()))> {
        using E2 = decltype(f(std::declval<const E&>()));
        if (isOk_) {
            return Result<void, E2>::Ok();
        }
        return Result<void, E2>::Err(f(error_));
    }

private:
    Result() : isOk_(false) {}

    bool isOk_;
    union {
        char dummy_;
        E error_;
    };
};

} // namespace util
