#pragma once

#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace tmappa {

//=============================================================================
// Error - message with an optional chain of causes
//=============================================================================
class Error {
public:
    Error() = default;
    explicit Error(std::string message) : _message(std::move(message)) {}
    Error(std::string message, const Error& cause)
        : _message(std::move(message)), _cause(std::make_shared<Error>(cause)) {}

    const std::string& message() const { return _message; }
    const Error* cause() const { return _cause.get(); }

    // "outer: inner: innermost"
    std::string to_string() const {
        std::string out = _message;
        for (const Error* e = cause(); e; e = e->cause()) {
            out += ": ";
            out += e->message();
        }
        return out;
    }

private:
    std::string _message;
    std::shared_ptr<const Error> _cause;
};

//=============================================================================
// Result<T> - value or Error
//=============================================================================
template<typename T>
class [[nodiscard]] Result {
public:
    using value_type = T;

    Result(T value) : _data(std::in_place_index<0>, std::move(value)) {}
    Result(Error error) : _data(std::in_place_index<1>, std::move(error)) {}

    explicit operator bool() const { return _data.index() == 0; }
    bool has_value() const { return _data.index() == 0; }

    T& value() & { return std::get<0>(_data); }
    const T& value() const& { return std::get<0>(_data); }
    T&& value() && { return std::get<0>(std::move(_data)); }

    T& operator*() & { return value(); }
    const T& operator*() const& { return value(); }
    T&& operator*() && { return std::move(*this).value(); }
    T* operator->() { return &value(); }
    const T* operator->() const { return &value(); }

    const Error& error() const { return std::get<1>(_data); }

private:
    std::variant<T, Error> _data;
};

template<>
class [[nodiscard]] Result<void> {
public:
    using value_type = void;

    Result() = default;
    Result(Error error) : _error(std::move(error)) {}

    explicit operator bool() const { return !_error.has_value(); }
    bool has_value() const { return !_error.has_value(); }

    const Error& error() const { return *_error; }

private:
    std::optional<Error> _error;
};

//=============================================================================
// Constructors
//=============================================================================
inline Result<void> Ok() { return Result<void>(); }

template<typename T>
Result<std::decay_t<T>> Ok(T&& value) {
    return Result<std::decay_t<T>>(std::forward<T>(value));
}

template<typename T = void>
Result<T> Err(std::string message) {
    return Result<T>(Error(std::move(message)));
}

// Wrap the error of a failed result as the cause of a new one
template<typename T = void, typename U>
Result<T> Err(std::string message, const Result<U>& cause) {
    return Result<T>(Error(std::move(message), cause.error()));
}

template<typename T>
std::string error_msg(const Result<T>& result) {
    return result ? std::string() : result.error().to_string();
}

} // namespace tmappa
