/**
 * @file ParameterParser.hpp
 * @brief Turns the two raw input buffers into validated Parameters.
 */

#pragma once

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "domain/Parameters.hpp"
#include "domain/Result.hpp"

namespace dobdecoder::application {

/**
 * @class ParameterParser
 * @brief Pure parser for [trait output, trait schema] buffers.
 *
 * Buffer 0: [{"name": str, "traits": [{"String": str} | {"Number": u64}]}]
 * Buffer 1: [[name, kind, source_trait, pattern, match_table?], ...]
 */
class ParameterParser {
public:
    static constexpr size_t ExpectedInputCount = 2;

    /**
     * @brief Parses and validates both buffers.
     * @param inputs Exactly two UTF-8 JSON buffers.
     * @return Decoded parameters or the first error encountered.
     */
    static domain::Result<domain::Parameters> ParseParameters(const std::vector<std::string>& inputs);

    /** @brief Parses buffer 0 alone. */
    static domain::Result<domain::TraitTable> ParseTraitOutput(const std::string& buffer);

    /** @brief Serializes a trait table back into the buffer 0 layout. */
    static nlohmann::json EncodeTraitOutput(const domain::TraitTable& table);
};

} // namespace dobdecoder::application
