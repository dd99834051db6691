#pragma once

#include <new>
#include <stdexcept>
#include <type_traits>
#include <utility>

namespace Parfetch {

template<typename E>
class Unexpected {
public:
    constexpr explicit Unexpected(const E& error) : error_(error) {}
    constexpr explicit Unexpected(E&& error) : error_(std::move(error)) {}

    constexpr const E& error() const& { return error_; }
    constexpr E& error() & { return error_; }
    constexpr E&& error() && { return std::move(error_); }

private:
    E error_;
};

template<typename>
struct IsUnexpected : std::false_type {};

template<typename E>
struct IsUnexpected<Unexpected<E>> : std::true_type {};

template<typename E>
constexpr Unexpected<std::decay_t<E>> makeUnexpected(E&& error) {
    return Unexpected<std::decay_t<E>>(std::forward<E>(error));
}

// Value-or-error result, modelled on std::expected (C++23).
// Errors are always constructed through Unexpected so T and E may overlap.
template<typename T, typename E>
class Expected {
public:
    template<typename U = T, typename = std::enable_if_t<std::is_default_constructible_v<U>>>
    Expected() : hasValue_(true) {
        new (&value_) T();
    }

    template<typename U, typename = std::enable_if_t<
        !std::is_same_v<std::decay_t<U>, Expected> &&
        !IsUnexpected<std::decay_t<U>>::value &&
        std::is_constructible_v<T, U&&>>>
    Expected(U&& value) : hasValue_(true) {
        new (&value_) T(std::forward<U>(value));
    }

    template<typename G, typename = std::enable_if_t<std::is_constructible_v<E, const G&>>>
    Expected(const Unexpected<G>& unexpected) : hasValue_(false) {
        new (&error_) E(unexpected.error());
    }

    template<typename G, typename = std::enable_if_t<std::is_constructible_v<E, G&&>>>
    Expected(Unexpected<G>&& unexpected) : hasValue_(false) {
        new (&error_) E(std::move(unexpected).error());
    }

    Expected(const Expected& other) : hasValue_(other.hasValue_) {
        if (hasValue_) {
            new (&value_) T(other.value_);
        } else {
            new (&error_) E(other.error_);
        }
    }

    Expected(Expected&& other) noexcept : hasValue_(other.hasValue_) {
        if (hasValue_) {
            new (&value_) T(std::move(other.value_));
        } else {
            new (&error_) E(std::move(other.error_));
        }
    }

    ~Expected() { destroy(); }

    Expected& operator=(const Expected& other) {
        if (this != &other) {
            Expected copy(other);
            *this = std::move(copy);
        }
        return *this;
    }

    Expected& operator=(Expected&& other) noexcept {
        if (this != &other) {
            destroy();
            hasValue_ = other.hasValue_;
            if (hasValue_) {
                new (&value_) T(std::move(other.value_));
            } else {
                new (&error_) E(std::move(other.error_));
            }
        }
        return *this;
    }

    bool hasValue() const noexcept { return hasValue_; }
    bool hasError() const noexcept { return !hasValue_; }
    explicit operator bool() const noexcept { return hasValue_; }

    const T& value() const& {
        if (!hasValue_) {
            throw std::runtime_error("Expected contains error, not value");
        }
        return value_;
    }

    T& value() & {
        if (!hasValue_) {
            throw std::runtime_error("Expected contains error, not value");
        }
        return value_;
    }

    T&& value() && {
        if (!hasValue_) {
            throw std::runtime_error("Expected contains error, not value");
        }
        return std::move(value_);
    }

    const E& error() const& {
        if (hasValue_) {
            throw std::runtime_error("Expected contains value, not error");
        }
        return error_;
    }

    E& error() & {
        if (hasValue_) {
            throw std::runtime_error("Expected contains value, not error");
        }
        return error_;
    }

    template<typename U>
    T valueOr(U&& defaultValue) const& {
        return hasValue_ ? value_ : static_cast<T>(std::forward<U>(defaultValue));
    }

    template<typename F>
    auto transform(F&& f) const& -> Expected<std::invoke_result_t<F, const T&>, E> {
        if (hasValue_) {
            return std::forward<F>(f)(value_);
        }
        return makeUnexpected(error_);
    }

private:
    void destroy() noexcept {
        if (hasValue_) {
            value_.~T();
        } else {
            error_.~E();
        }
    }

    bool hasValue_;
    union {
        T value_;
        E error_;
    };
};

template<typename E>
class Expected<void, E> {
public:
    Expected() noexcept : hasValue_(true) {}

    template<typename G, typename = std::enable_if_t<std::is_constructible_v<E, const G&>>>
    Expected(const Unexpected<G>& unexpected) : hasValue_(false) {
        new (&error_) E(unexpected.error());
    }

    template<typename G, typename = std::enable_if_t<std::is_constructible_v<E, G&&>>>
    Expected(Unexpected<G>&& unexpected) : hasValue_(false) {
        new (&error_) E(std::move(unexpected).error());
    }

    Expected(const Expected& other) : hasValue_(other.hasValue_) {
        if (!hasValue_) {
            new (&error_) E(other.error_);
        }
    }

    Expected(Expected&& other) noexcept : hasValue_(other.hasValue_) {
        if (!hasValue_) {
            new (&error_) E(std::move(other.error_));
        }
    }

    ~Expected() {
        if (!hasValue_) {
            error_.~E();
        }
    }

    Expected& operator=(const Expected& other) {
        if (this != &other) {
            Expected copy(other);
            *this = std::move(copy);
        }
        return *this;
    }

    Expected& operator=(Expected&& other) noexcept {
        if (this != &other) {
            if (!hasValue_) {
                error_.~E();
            }
            hasValue_ = other.hasValue_;
            if (!hasValue_) {
                new (&error_) E(std::move(other.error_));
            }
        }
        return *this;
    }

    bool hasValue() const noexcept { return hasValue_; }
    bool hasError() const noexcept { return !hasValue_; }
    explicit operator bool() const noexcept { return hasValue_; }

    void value() const {
        if (!hasValue_) {
            throw std::runtime_error("Expected contains error, not value");
        }
    }

    const E& error() const& {
        if (hasValue_) {
            throw std::runtime_error("Expected contains value, not error");
        }
        return error_;
    }

private:
    bool hasValue_;
    union {
        E error_;
    };
};

} // namespace Parfetch
