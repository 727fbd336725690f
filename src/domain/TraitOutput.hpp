/**
 * @file TraitOutput.hpp
 * @brief Value objects for already-resolved trait values produced by the upstream decoder.
 */

#pragma once

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace dobdecoder::domain {

/**
 * @brief A single resolved trait value: either text or an unsigned number.
 */
using ScalarTraitValue = std::variant<std::string, std::uint64_t>;

inline bool IsString(const ScalarTraitValue& value) {
    return std::holds_alternative<std::string>(value);
}

inline bool IsNumber(const ScalarTraitValue& value) {
    return std::holds_alternative<std::uint64_t>(value);
}

/**
 * @struct TraitOutput
 * @brief One named trait with its ordered values. Only the first value is ever consulted.
 */
struct TraitOutput {
    std::string name;
    std::vector<ScalarTraitValue> traits;
};

/** @brief Resolved-traits table. Names may repeat; lookups honour the first occurrence. */
using TraitTable = std::vector<TraitOutput>;

} // namespace dobdecoder::domain
