// StreamHub - Real-time event fan-out server
// Result type for error handling without exceptions

#ifndef STREAMHUB_CORE_RESULT_HPP
#define STREAMHUB_CORE_RESULT_HPP

#include <stdexcept>
#include <type_traits>
#include <utility>
#include <variant>

namespace streamhub {
namespace core {

/**
 * @brief Either a success value or an error.
 *
 * Every fallible StreamHub operation (admission, transport writes,
 * configuration loading, timer scheduling) reports its outcome through
 * this type instead of throwing.
 *
 * @tparam T The success value type
 * @tparam E The error type
 */
template<typename T, typename E>
class Result {
public:
    static Result success(T value) {
        return Result(std::in_place_index<0>, std::move(value));
    }

    static Result error(E err) {
        return Result(std::in_place_index<1>, std::move(err));
    }

    [[nodiscard]] bool isSuccess() const noexcept {
        return storage_.index() == 0;
    }

    [[nodiscard]] bool isError() const noexcept {
        return storage_.index() == 1;
    }

    /**
     * @brief Access the success value.
     * @throws std::logic_error if this holds an error
     */
    [[nodiscard]] T& value() & {
        requireSuccess();
        return std::get<0>(storage_);
    }

    [[nodiscard]] const T& value() const& {
        requireSuccess();
        return std::get<0>(storage_);
    }

    [[nodiscard]] T&& value() && {
        requireSuccess();
        return std::get<0>(std::move(storage_));
    }

    /**
     * @brief Access the error value.
     * @throws std::logic_error if this holds a success value
     */
    [[nodiscard]] E& error() & {
        requireError();
        return std::get<1>(storage_);
    }

    [[nodiscard]] const E& error() const& {
        requireError();
        return std::get<1>(storage_);
    }

    /**
     * @brief Success value, or @p fallback when this holds an error.
     */
    [[nodiscard]] T valueOr(T fallback) const& {
        return isSuccess() ? std::get<0>(storage_) : fallback;
    }

    [[nodiscard]] T valueOr(T fallback) && {
        return isSuccess() ? std::get<0>(std::move(storage_)) : fallback;
    }

    Result(Result&&) noexcept = default;
    Result& operator=(Result&&) noexcept = default;
    Result(const Result&) = default;
    Result& operator=(const Result&) = default;

private:
    template<std::size_t I, typename V>
    Result(std::in_place_index_t<I> tag, V&& v)
        : storage_(tag, std::forward<V>(v)) {}

    void requireSuccess() const {
        if (!isSuccess()) {
            throw std::logic_error("Attempted to access value on error result");
        }
    }

    void requireError() const {
        if (!isError()) {
            throw std::logic_error("Attempted to access error on success result");
        }
    }

    // Index-based storage keeps Result<T, T> unambiguous.
    std::variant<T, E> storage_;
};

/**
 * @brief Result for operations that produce no value on success.
 */
template<typename E>
class Result<void, E> {
public:
    static Result success() {
        return Result();
    }

    static Result error(E err) {
        return Result(std::move(err));
    }

    [[nodiscard]] bool isSuccess() const noexcept {
        return !failed_;
    }

    [[nodiscard]] bool isError() const noexcept {
        return failed_;
    }

    [[nodiscard]] E& error() & {
        if (!failed_) {
            throw std::logic_error("Attempted to access error on success result");
        }
        return error_;
    }

    [[nodiscard]] const E& error() const& {
        if (!failed_) {
            throw std::logic_error("Attempted to access error on success result");
        }
        return error_;
    }

    Result(Result&&) noexcept = default;
    Result& operator=(Result&&) noexcept = default;
    Result(const Result&) = default;
    Result& operator=(const Result&) = default;

private:
    Result() : error_{}, failed_(false) {}

    explicit Result(E err) : error_(std::move(err)), failed_(true) {}

    E error_;
    bool failed_;
};

} // namespace core
} // namespace streamhub

#endif // STREAMHUB_CORE_RESULT_HPP
