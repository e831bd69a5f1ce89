#pragma once

#include <string>
#include <utility>
#include <variant>

namespace xarb {

// Value-or-error. E defaults to a human readable message; domain code may use an enum.
template<typename T, typename E = std::string>
class Result {
private:
    std::variant<T, E> value_;

    template<typename... Args>
    explicit Result(std::in_place_index_t<0> tag, Args&&... args) : value_(tag, std::forward<Args>(args)...) {}
    template<typename... Args>
    explicit Result(std::in_place_index_t<1> tag, Args&&... args) : value_(tag, std::forward<Args>(args)...) {}

public:
    static Result success(T value) {
        return Result(std::in_place_index<0>, std::move(value));
    }

    static Result error(E error) {
        return Result(std::in_place_index<1>, std::move(error));
    }

    bool is_success() const {
        return value_.index() == 0;
    }

    bool is_error() const {
        return value_.index() == 1;
    }

    const T& value() const {
        return std::get<0>(value_);
    }

    T& value() {
        return std::get<0>(value_);
    }

    const E& error() const {
        return std::get<1>(value_);
    }

    T value_or(T default_value) const {
        if (is_success()) {
            return value();
        }
        return default_value;
    }

    template<typename F>
    auto map(F&& f) const -> Result<decltype(f(std::declval<const T&>())), E> {
        using U = decltype(f(std::declval<const T&>()));
        if (is_success()) {
            return Result<U, E>::success(f(value()));
        }
        return Result<U, E>::error(error());
    }
};

} // namespace xarb
