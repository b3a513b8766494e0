#pragma once

#include <cassert>
#include <type_traits>
#include <utility>
#include <variant>

#include "error.hpp"

namespace netcall {

    /// @brief Result<T> holds either the value of a successful operation or
    /// the Error that stopped it.
    /// @tparam T The type of the successful value.
    /// @note Comparable to std::expected<T, Error>; the library never throws
    /// across its public API and reports through this type instead.
    template <typename T>
    class [[nodiscard]] Result {
       public:
        /// @brief Create a successful Result, constructing T in place.
        template <typename... Args, typename = std::enable_if_t<
                                        std::is_constructible_v<T, Args&&...>>>
        static Result ok(Args&&... args) {
            return Result(std::in_place_type<T>, std::forward<Args>(args)...);
        }

        /// @brief Create a failed Result holding a copy of @p error.
        static Result err(const Error& error) {
            return Result(std::in_place_type<Error>, error);
        }

        /// @brief Create a failed Result taking ownership of @p error.
        static Result err(Error&& error) {
            return Result(std::in_place_type<Error>, std::move(error));
        }

        /// @brief Create a failed Result from a code and message.
        static Result err(Error::Code code, std::string message) {
            return Result(std::in_place_type<Error>,
                          Error{code, std::move(message)});
        }

        /// @brief `if (result)` means "if success".
        explicit operator bool() const noexcept { return has_value(); }

        bool has_value() const noexcept {
            return std::holds_alternative<T>(m_state);
        }

        bool has_error() const noexcept {
            return std::holds_alternative<Error>(m_state);
        }

        const T& value() const& {
            const T* p = value_ptr();
            assert(p &&
                   "Result::value() called but this Result holds an Error");
            return *p;
        }

        T& value() & {
            T* p = value_ptr();
            assert(p &&
                   "Result::value() called but this Result holds an Error");
            return *p;
        }

        /// @brief Move the value out of an expiring Result.
        T&& value() && {
            T* p = value_ptr();
            assert(p &&
                   "Result::value() called but this Result holds an Error");
            return std::move(*p);
        }

        [[nodiscard]] const T* value_ptr() const noexcept {
            return std::get_if<T>(&m_state);
        }

        [[nodiscard]] T* value_ptr() noexcept { return std::get_if<T>(&m_state); }

        const Error& error() const& {
            const Error* p = error_ptr();
            assert(p && "Result::error() called but this Result holds a value");
            return *p;
        }

        Error& error() & {
            Error* p = error_ptr();
            assert(p && "Result::error() called but this Result holds a value");
            return *p;
        }

        Error&& error() && {
            Error* p = error_ptr();
            assert(p && "Result::error() called but this Result holds a value");
            return std::move(*p);
        }

        [[nodiscard]] const Error* error_ptr() const noexcept {
            return std::get_if<Error>(&m_state);
        }

        [[nodiscard]] Error* error_ptr() noexcept {
            return std::get_if<Error>(&m_state);
        }

        /// @brief Return the value, or the result of @p make_fallback when
        /// this Result holds an Error. The fallback is only built when needed.
        template <typename F,
                  typename = std::enable_if_t<std::is_invocable_r_v<T, F&&>>>
        T value_or_else(F&& make_fallback) const& {
            return has_value() ? value() : std::forward<F>(make_fallback)();
        }

        template <typename F,
                  typename = std::enable_if_t<std::is_invocable_r_v<T, F&&>>>
        T value_or_else(F&& make_fallback) && {
            return has_value() ? std::move(*this).value()
                               : std::forward<F>(make_fallback)();
        }

        T value_or(T fallback) const& {
            return value_or_else([&] { return std::move(fallback); });
        }

        T value_or(T fallback) && {
            return std::move(*this).value_or_else(
                [&] { return std::move(fallback); });
        }

        /// @brief Reference to the stored error, or @p fallback on success.
        const Error& error_or(const Error& fallback) const noexcept {
            return has_error() ? *error_ptr() : fallback;
        }

        /// @brief Re-wrap the error of this Result into a Result<U>.
        /// @note Only valid when has_error() is true.
        template <typename U>
        Result<U> propagate() const& {
            return Result<U>::err(error());
        }

        template <typename U>
        Result<U> propagate() && {
            return Result<U>::err(std::move(*this).error());
        }

       private:
        template <typename... Args>
        explicit Result(std::in_place_type_t<T>, Args&&... args)
            : m_state(std::in_place_type<T>, std::forward<Args>(args)...) {}

        explicit Result(std::in_place_type_t<Error>, const Error& error)
            : m_state(std::in_place_type<Error>, error) {}

        explicit Result(std::in_place_type_t<Error>, Error&& error)
            : m_state(std::in_place_type<Error>, std::move(error)) {}

        /// @brief Exactly one of {T, Error} is active at any time.
        std::variant<T, Error> m_state;
    };

    /// @brief Result of an operation that produces no value.
    using Status = Result<std::monostate>;

    inline Status ok_status() { return Status::ok(); }

}  // namespace netcall
