/**
 * @file LayerResolver.hpp
 * @brief Looks up the trait value a schema entry depends on.
 */

#pragma once

#include <optional>
#include <string>

#include "domain/TraitOutput.hpp"

namespace dobdecoder::domain {

class LayerResolver {
public:
    /**
     * @brief First value of the first trait named @p sourceTrait.
     * @return nullopt when the trait is absent or carries no values. Absence is not an error.
     */
    static std::optional<ScalarTraitValue> Resolve(const std::string& sourceTrait, const TraitTable& table);
};

} // namespace dobdecoder::domain
