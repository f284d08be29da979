#pragma once

#include <utility>
#include <variant>

namespace CellGa {

/**
 * Value-or-error return type for fallible operations.
 *
 * Example:
 *   Result<int, std::string> parse(const std::string& s);
 *   auto result = parse("42");
 *   if (result.isError()) {
 *       SLOG_ERROR("{}", result.errorValue());
 *   }
 *
 * Use Result<std::monostate, E> for operations with no value on success.
 */
template <typename T, typename E>
class Result {
public:
    using ValueType = T;
    using ErrorType = E;

    static Result okay(T value) { return Result(std::in_place_index<0>, std::move(value)); }

    static Result error(E error) { return Result(std::in_place_index<1>, std::move(error)); }

    bool isValue() const { return data_.index() == 0; }
    bool isError() const { return data_.index() == 1; }

    T& value() { return std::get<0>(data_); }
    const T& value() const { return std::get<0>(data_); }

    E& errorValue() { return std::get<1>(data_); }
    const E& errorValue() const { return std::get<1>(data_); }

private:
    template <std::size_t I, typename U>
    Result(std::in_place_index_t<I> index, U&& payload) : data_(index, std::forward<U>(payload))
    {}

    std::variant<T, E> data_;
};

} // namespace CellGa
