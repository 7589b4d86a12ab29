#pragma once
#include <cstddef>
#include <stdexcept>
#include <type_traits>
#include <utility>
#include <variant>
namespace zkeb {

/// Empty success payload for operations that only report failure
struct Unit {
    constexpr bool operator==(const Unit&) const noexcept = default;
};
inline constexpr Unit unit{};

/// Thrown when Unwrap/UnwrapErr is called on the wrong alternative
class BadResultAccess : public std::logic_error {
public:
    using std::logic_error::logic_error;
};

/**
 * @brief Success value or failure, never both
 *
 * Every fallible call in the library returns one of these instead of
 * throwing. Inspect with IsOk()/IsErr() before unwrapping; unwrapping the
 * wrong side throws BadResultAccess, which is a programming error.
 */
template<typename T, typename E>
class Result {
    static constexpr std::size_t OK_INDEX = 0;
    static constexpr std::size_t ERR_INDEX = 1;

public:
    using value_type = T;
    using error_type = E;

    static Result Ok(T value) {
        return Result(std::in_place_index<OK_INDEX>, std::move(value));
    }
    static Result Err(E error) {
        return Result(std::in_place_index<ERR_INDEX>, std::move(error));
    }

    [[nodiscard]] bool IsOk() const noexcept { return storage_.index() == OK_INDEX; }
    [[nodiscard]] bool IsErr() const noexcept { return storage_.index() == ERR_INDEX; }

    template<typename Pred>
    [[nodiscard]] bool IsErrAnd(Pred&& pred) const {
        return IsErr() && std::forward<Pred>(pred)(std::get<ERR_INDEX>(storage_));
    }

    [[nodiscard]] T& Unwrap() & {
        RequireOk();
        return std::get<OK_INDEX>(storage_);
    }
    [[nodiscard]] const T& Unwrap() const& {
        RequireOk();
        return std::get<OK_INDEX>(storage_);
    }
    [[nodiscard]] T&& Unwrap() && {
        RequireOk();
        return std::get<OK_INDEX>(std::move(storage_));
    }

    [[nodiscard]] E& UnwrapErr() & {
        RequireErr();
        return std::get<ERR_INDEX>(storage_);
    }
    [[nodiscard]] const E& UnwrapErr() const& {
        RequireErr();
        return std::get<ERR_INDEX>(storage_);
    }
    [[nodiscard]] E&& UnwrapErr() && {
        RequireErr();
        return std::get<ERR_INDEX>(std::move(storage_));
    }

    [[nodiscard]] T UnwrapOr(T fallback) && {
        return IsOk() ? std::get<OK_INDEX>(std::move(storage_)) : std::move(fallback);
    }

    /// Transform the success value; errors pass through untouched
    template<typename F>
    [[nodiscard]] auto Map(F&& func) && {
        using Mapped = Result<std::invoke_result_t<F, T>, E>;
        if (IsErr()) {
            return Mapped::Err(std::get<ERR_INDEX>(std::move(storage_)));
        }
        return Mapped::Ok(std::forward<F>(func)(std::get<OK_INDEX>(std::move(storage_))));
    }

    template<typename F>
    [[nodiscard]] auto MapErr(F&& func) && {
        using Mapped = Result<T, std::invoke_result_t<F, E>>;
        if (IsOk()) {
            return Mapped::Ok(std::get<OK_INDEX>(std::move(storage_)));
        }
        return Mapped::Err(std::forward<F>(func)(std::get<ERR_INDEX>(std::move(storage_))));
    }

    /// Chain another fallible step; func must return Result<U, E>
    template<typename F>
    [[nodiscard]] auto Bind(F&& func) && {
        using Next = std::invoke_result_t<F, T>;
        static_assert(std::is_same_v<typename Next::error_type, E>,
                      "Bind continuation must keep the error type");
        if (IsErr()) {
            return Next::Err(std::get<ERR_INDEX>(std::move(storage_)));
        }
        return std::forward<F>(func)(std::get<OK_INDEX>(std::move(storage_)));
    }

private:
    template<std::size_t I, typename V>
    Result(std::in_place_index_t<I> tag, V&& value)
        : storage_(tag, std::forward<V>(value)) {}

    void RequireOk() const {
        if (!IsOk()) {
            throw BadResultAccess("Unwrap() called on an Err result");
        }
    }
    void RequireErr() const {
        if (!IsErr()) {
            throw BadResultAccess("UnwrapErr() called on an Ok result");
        }
    }

    std::variant<T, E> storage_;
};

}
