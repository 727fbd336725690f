/**
 * @file SchemaDecoder.hpp
 * @brief Decodes the untrusted trait-schema table into typed schema entries.
 */

#pragma once

#include <vector>

#include <nlohmann/json.hpp>

#include "domain/ImageSchema.hpp"
#include "domain/Result.hpp"

namespace dobdecoder::application {

/**
 * @class SchemaDecoder
 * @brief Validates schema rows of the form [name, kind, source_trait, pattern, match_table?].
 *
 * Checks run in a fixed order per row and the first failure is reported.
 * Entry order and match-table order are preserved exactly.
 */
class SchemaDecoder {
public:
    /**
     * @brief Decodes every row of @p rows.
     * @param rows JSON array of arrays.
     * @return Entries in row order, or the first validation error.
     */
    static domain::Result<std::vector<domain::SchemaEntry>> DecodeSchema(const nlohmann::json& rows);

    /** @brief Decodes a single row. */
    static domain::Result<domain::SchemaEntry> DecodeRow(const nlohmann::json& row);

    /** @brief Re-encodes an entry into the row layout accepted by DecodeRow. */
    static nlohmann::json EncodeSchemaEntry(const domain::SchemaEntry& entry);

    /** @brief Re-encodes a whole schema. */
    static nlohmann::json EncodeSchema(const std::vector<domain::SchemaEntry>& entries);

private:
    static domain::Result<domain::MatchTable> DecodeMatchTable(const nlohmann::json& args);
    static domain::Result<domain::MatchKey> DecodeMatchKey(const nlohmann::json& key);
};

} // namespace dobdecoder::application
