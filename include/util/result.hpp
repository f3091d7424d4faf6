#ifndef RESULT_HPP
#define RESULT_HPP

#include "util/error.hpp"

#include <cassert>
#include <optional>
#include <string>
#include <utility>
#include <variant>

template <typename T>
class Result {
public:
    Result(const T& value) : m_data{ value } {}
    Result(T&& value) : m_data{ std::move(value) } {}
    Result(const Error& error) : m_data{ error } {}
    Result(Error&& error) : m_data{ std::move(error) } {}

    bool isValue() const {
        return std::holds_alternative<T>(m_data);
    }

    bool isError() const {
        return std::holds_alternative<Error>(m_data);
    }

    const T& getValue() const {
        assert(isValue());
        return std::get<T>(m_data);
    }

    T& getValue() {
        assert(isValue());
        return std::get<T>(m_data);
    }

    const Error& getError() const {
        assert(isError());
        return std::get<Error>(m_data);
    }

private:
    std::variant<T, Error> m_data;
};

// Outcome of an operation that only reports failure
template <>
class Result<void> {
public:
    Result() = default;
    Result(const Error& error) : m_error{ error } {}
    Result(Error&& error) : m_error{ std::move(error) } {}

    bool isValue() const {
        return !m_error.has_value();
    }

    bool isError() const {
        return m_error.has_value();
    }

    const Error& getError() const {
        assert(isError());
        return *m_error;
    }

private:
    std::optional<Error> m_error;
};

#endif // RESULT_HPP
