//
// Created by gregorian-rayne on 2/3/26.
//

#ifndef PINCH_RESULT_HPP
#define PINCH_RESULT_HPP

/**
 * @file result.hpp
 * @brief Value-or-error return type.
 *
 * Loaders, the resolver and the config layer return Result<T, E>; the
 * graph algorithms never fail and return plain values.
 *
 * @code
 *     auto parsed = sources::load_records_file("app.deps.json");
 *     if (parsed.is_err()) {
 *         std::cerr << parsed.error() << std::endl;
 *         return 1;
 *     }
 *     auto count = parsed.map([](const auto& p) { return p.records.size(); });
 * @endcode
 */

#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace pinch {

    namespace detail {

        [[noreturn]] inline void bad_result_access(const char* accessor) {
            throw std::logic_error(std::string("Result::") + accessor + " on the wrong alternative");
        }

    }  // namespace detail

    /**
     * Holds either a value of type T or an error of type E, never neither.
     *
     * Reading the alternative that is not held throws std::logic_error.
     * That is a programming error; data errors travel as E.
     */
    template<typename T, typename E>
    class Result {
        static constexpr std::size_t kValue = 0;
        static constexpr std::size_t kError = 1;

    public:
        using value_type = T;
        using error_type = E;

        static Result success(T value) {
            return Result(std::in_place_index<kValue>, std::move(value));
        }

        static Result failure(E error) {
            return Result(std::in_place_index<kError>, std::move(error));
        }

        [[nodiscard]] bool is_ok() const noexcept { return state_.index() == kValue; }
        [[nodiscard]] bool is_err() const noexcept { return state_.index() == kError; }

        explicit operator bool() const noexcept { return is_ok(); }

        T& value() & {
            require(kValue, "value()");
            return std::get<kValue>(state_);
        }

        const T& value() const& {
            require(kValue, "value()");
            return std::get<kValue>(state_);
        }

        T&& value() && {
            require(kValue, "value()");
            return std::get<kValue>(std::move(state_));
        }

        const E& error() const& {
            require(kError, "error()");
            return std::get<kError>(state_);
        }

        T value_or(T fallback) const& {
            return is_ok() ? std::get<kValue>(state_) : std::move(fallback);
        }

        /**
         * Transforms the value; an error passes through untouched.
         */
        template<typename F>
        auto map(F&& f) const& -> Result<std::invoke_result_t<F, const T&>, E> {
            using Mapped = Result<std::invoke_result_t<F, const T&>, E>;
            if (is_err()) {
                return Mapped::failure(std::get<kError>(state_));
            }
            return Mapped::success(std::invoke(std::forward<F>(f), std::get<kValue>(state_)));
        }

        /**
         * Continues with a step that can itself fail.
         */
        template<typename F>
        auto and_then(F&& f) const& -> std::invoke_result_t<F, const T&> {
            using Next = std::invoke_result_t<F, const T&>;
            if (is_err()) {
                return Next::failure(std::get<kError>(state_));
            }
            return std::invoke(std::forward<F>(f), std::get<kValue>(state_));
        }

    private:
        template<std::size_t I, typename U>
        Result(std::in_place_index_t<I> tag, U&& payload) : state_(tag, std::forward<U>(payload)) {}

        void require(const std::size_t index, const char* accessor) const {
            if (state_.index() != index) {
                detail::bad_result_access(accessor);
            }
        }

        std::variant<T, E> state_;
    };

    /**
     * Outcome of an operation with nothing to return on success.
     */
    template<typename E>
    class Result<void, E> {
    public:
        using value_type = void;
        using error_type = E;

        static Result success() { return Result(std::nullopt); }
        static Result failure(E error) { return Result(std::move(error)); }

        [[nodiscard]] bool is_ok() const noexcept { return !error_; }
        [[nodiscard]] bool is_err() const noexcept { return error_.has_value(); }

        explicit operator bool() const noexcept { return is_ok(); }

        const E& error() const& {
            if (!error_) {
                detail::bad_result_access("error()");
            }
            return *error_;
        }

    private:
        explicit Result(std::optional<E> error) : error_(std::move(error)) {}

        std::optional<E> error_;
    };

}  // namespace pinch

#endif //PINCH_RESULT_HPP
