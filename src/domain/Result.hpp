/**
 * @file Result.hpp
 * @brief Value-or-error carrier used across the decoding pipeline.
 */

#pragma once

#include <utility>
#include <variant>

#include "domain/DecodeError.hpp"

namespace dobdecoder::domain {

/**
 * @class Result
 * @brief Holds either a successfully produced value or the DecodeError that stopped it.
 */
template <typename T>
class Result {
public:
    Result(T value) : m_state(std::move(value)) {}
    Result(DecodeError error) : m_state(error) {}

    bool ok() const { return std::holds_alternative<T>(m_state); }
    explicit operator bool() const { return ok(); }

    /** @brief Access the value. Only valid when ok() is true. */
    const T& value() const& { return std::get<T>(m_state); }
    T& value() & { return std::get<T>(m_state); }
    T&& value() && { return std::get<T>(std::move(m_state)); }

    /** @brief Access the error. Only valid when ok() is false. */
    DecodeError error() const { return std::get<DecodeError>(m_state); }

private:
    std::variant<T, DecodeError> m_state;
};

} // namespace dobdecoder::domain
