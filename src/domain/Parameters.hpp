/**
 * @file Parameters.hpp
 * @brief Fully decoded and validated input of one decoding run.
 */

#pragma once

#include <vector>

#include "domain/ImageSchema.hpp"
#include "domain/TraitOutput.hpp"

namespace dobdecoder::domain {

struct Parameters {
    TraitTable traitOutput;
    std::vector<SchemaEntry> schema; ///< Declaration order is significant.
};

} // namespace dobdecoder::domain
