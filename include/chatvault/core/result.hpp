#pragma once
#include <variant>
#include <utility>
#include <type_traits>
#include <stdexcept>

namespace chatvault {

struct Unit {
    constexpr bool operator==(const Unit&) const noexcept { return true; }
    constexpr bool operator!=(const Unit&) const noexcept { return false; }
};

inline constexpr Unit unit{};

/**
 * @brief Value-or-failure return type used across the vault
 *
 * Unwrap on the wrong alternative throws std::runtime_error; callers are
 * expected to test IsOk()/IsErr() first.
 */
template<typename T, typename E>
class Result {
public:
    using value_type = T;
    using error_type = E;

    static Result Ok(T value) {
        return Result(std::in_place_index<0>, std::move(value));
    }

    static Result Err(E error) {
        return Result(std::in_place_index<1>, std::move(error));
    }

    [[nodiscard]] bool IsOk() const noexcept { return value_.index() == 0; }
    [[nodiscard]] bool IsErr() const noexcept { return value_.index() == 1; }

    [[nodiscard]] T& Unwrap() & {
        RequireOk();
        return std::get<0>(value_);
    }

    [[nodiscard]] const T& Unwrap() const& {
        RequireOk();
        return std::get<0>(value_);
    }

    [[nodiscard]] T&& Unwrap() && {
        RequireOk();
        return std::get<0>(std::move(value_));
    }

    [[nodiscard]] E& UnwrapErr() & {
        RequireErr();
        return std::get<1>(value_);
    }

    [[nodiscard]] const E& UnwrapErr() const& {
        RequireErr();
        return std::get<1>(value_);
    }

    [[nodiscard]] E&& UnwrapErr() && {
        RequireErr();
        return std::get<1>(std::move(value_));
    }

    template<typename F>
    [[nodiscard]] auto Map(F&& func) && -> Result<std::invoke_result_t<F, T>, E> {
        using U = std::invoke_result_t<F, T>;
        if (IsOk()) {
            return Result<U, E>::Ok(std::forward<F>(func)(std::get<0>(std::move(value_))));
        }
        return Result<U, E>::Err(std::get<1>(std::move(value_)));
    }

    template<typename F>
    [[nodiscard]] auto MapErr(F&& func) && -> Result<T, std::invoke_result_t<F, E>> {
        using U = std::invoke_result_t<F, E>;
        if (IsErr()) {
            return Result<T, U>::Err(std::forward<F>(func)(std::get<1>(std::move(value_))));
        }
        return Result<T, U>::Ok(std::get<0>(std::move(value_)));
    }

    /// Chain a step that can itself fail with the same error type
    template<typename F>
    [[nodiscard]] auto Bind(F&& func) && -> std::invoke_result_t<F, T> {
        using Next = std::invoke_result_t<F, T>;
        static_assert(std::is_same_v<typename Next::error_type, E>,
                      "Bind requires a step with the same error type");
        if (IsOk()) {
            return std::forward<F>(func)(std::get<0>(std::move(value_)));
        }
        return Next::Err(std::get<1>(std::move(value_)));
    }

private:
    template<std::size_t I, typename Arg>
    Result(std::in_place_index_t<I> index, Arg&& arg)
        : value_(index, std::forward<Arg>(arg)) {}

    void RequireOk() const {
        if (IsErr()) {
            throw std::runtime_error("Called Unwrap() on an Err Result");
        }
    }

    void RequireErr() const {
        if (IsOk()) {
            throw std::runtime_error("Called UnwrapErr() on an Ok Result");
        }
    }

    std::variant<T, E> value_;
};

} // namespace chatvault
