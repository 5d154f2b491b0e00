//
// Created by gregorian-rayne on 1/12/26.
//

#ifndef LPA_RESULT_HPP
#define LPA_RESULT_HPP

/**
 * @file result.hpp
 * @brief Success value or Error, returned by every fallible operation.
 *
 * Configuration loading, registry building, parsing and exporting report
 * failures through Result instead of throwing. Callers test is_err() and
 * forward the error unchanged or with extra context:
 *
 * @code
 *     auto config = Config::load_from_file(path);
 *     if (config.is_err()) {
 *         return Result<Report, Error>::failure(config.error().with_context(path.string()));
 *     }
 *     run(std::move(config).value());
 * @endcode
 */

#include <optional>
#include <stdexcept>
#include <utility>
#include <variant>

namespace lpa {

    template<typename T, typename E>
    class Result {
    public:
        using value_type = T;
        using error_type = E;

        static Result success(T value) {
            return Result(std::in_place_index<0>, std::move(value));
        }

        static Result failure(E error) {
            return Result(std::in_place_index<1>, std::move(error));
        }

        [[nodiscard]] bool is_ok() const noexcept {
            return data_.index() == 0;
        }

        [[nodiscard]] bool is_err() const noexcept {
            return data_.index() == 1;
        }

        explicit operator bool() const noexcept {
            return is_ok();
        }

        /**
         * Returns the success value.
         * @throws std::logic_error if the Result holds an error.
         */
        T& value() & {
            ensure_ok();
            return std::get<0>(data_);
        }

        const T& value() const& {
            ensure_ok();
            return std::get<0>(data_);
        }

        T&& value() && {
            ensure_ok();
            return std::get<0>(std::move(data_));
        }

        /**
         * Returns the error.
         * @throws std::logic_error if the Result holds a value.
         */
        E& error() & {
            ensure_err();
            return std::get<1>(data_);
        }

        const E& error() const& {
            ensure_err();
            return std::get<1>(data_);
        }

    private:
        template<std::size_t I, typename U>
        Result(std::in_place_index_t<I> index, U&& content) : data_(index, std::forward<U>(content)) {}

        void ensure_ok() const {
            if (is_err()) {
                throw std::logic_error("Result::value() called on error result");
            }
        }

        void ensure_err() const {
            if (is_ok()) {
                throw std::logic_error("Result::error() called on success result");
            }
        }

        std::variant<T, E> data_;
    };

    /**
     * Outcome of an operation that only reports failure.
     */
    template<typename E>
    class Result<void, E> {
    public:
        using value_type = void;
        using error_type = E;

        static Result success() {
            return Result(std::nullopt);
        }

        static Result failure(E error) {
            return Result(std::move(error));
        }

        [[nodiscard]] bool is_ok() const noexcept {
            return !error_.has_value();
        }

        [[nodiscard]] bool is_err() const noexcept {
            return error_.has_value();
        }

        explicit operator bool() const noexcept {
            return is_ok();
        }

        E& error() & {
            ensure_err();
            return *error_;
        }

        const E& error() const& {
            ensure_err();
            return *error_;
        }

    private:
        explicit Result(std::optional<E> error) : error_(std::move(error)) {}

        void ensure_err() const {
            if (is_ok()) {
                throw std::logic_error("Result::error() called on success result");
            }
        }

        std::optional<E> error_;
    };

}  // namespace lpa

#endif //LPA_RESULT_HPP
