/**
 * @file SchemaDecoder.cpp
 * @brief Implementation of SchemaDecoder.
 */

#include "application/SchemaDecoder.hpp"

#include <string>
#include <type_traits>
#include <utility>

namespace dobdecoder::application {

using json = nlohmann::json;
using namespace dobdecoder::domain;

namespace {

constexpr size_t kMinRowElements = 4;
const char* const kWildcardToken = "*";

bool IsUnsigned(const json& value) {
    return value.is_number_unsigned();
}

json EncodeMatchKey(const MatchKey& key) {
    return std::visit([](const auto& k) -> json {
        using K = std::decay_t<decltype(k)>;
        if constexpr (std::is_same_v<K, ExactString>) {
            return k.text;
        } else if constexpr (std::is_same_v<K, ExactNumber>) {
            return k.value;
        } else if constexpr (std::is_same_v<K, NumericRange>) {
            return json::array({k.start, k.end});
        } else {
            return json::array({kWildcardToken});
        }
    }, key);
}

} // namespace

Result<std::vector<SchemaEntry>> SchemaDecoder::DecodeSchema(const json& rows) {
    if (!rows.is_array()) {
        return DecodeError::ParseInvalidTraitsBase;
    }
    for (const auto& row : rows) {
        if (!row.is_array()) {
            return DecodeError::ParseInvalidTraitsBase;
        }
    }

    std::vector<SchemaEntry> entries;
    entries.reserve(rows.size());
    for (const auto& row : rows) {
        auto entry = DecodeRow(row);
        if (!entry) {
            return entry.error();
        }
        entries.push_back(std::move(entry).value());
    }
    return entries;
}

Result<SchemaEntry> SchemaDecoder::DecodeRow(const json& row) {
    if (!row.is_array() || row.size() < kMinRowElements) {
        return DecodeError::SchemaInsufficientElements;
    }

    SchemaEntry entry;

    // 1) Image name
    if (!row[0].is_string()) {
        return DecodeError::SchemaInvalidName;
    }
    entry.imageName = row[0].get<std::string>();

    // 2) Kind keyword
    if (!row[1].is_string()) {
        return DecodeError::SchemaInvalidType;
    }
    auto kind = ImageKindFromKeyword(row[1].get<std::string>());
    if (!kind) {
        return DecodeError::SchemaTypeMismatch;
    }
    entry.kind = *kind;

    // 3) Source trait
    if (!row[2].is_string()) {
        return DecodeError::SchemaInvalidTraitName;
    }
    entry.sourceTrait = row[2].get<std::string>();

    // 4) Pattern keyword, checked against the kind
    if (!row[3].is_string()) {
        return DecodeError::SchemaInvalidPattern;
    }
    auto pattern = MatchPatternFromKeyword(row[3].get<std::string>());
    if (!pattern || !IsCompatible(entry.kind, *pattern)) {
        return DecodeError::SchemaPatternMismatch;
    }
    entry.pattern = *pattern;

    // 5) Optional match table
    if (row.size() > kMinRowElements) {
        auto table = DecodeMatchTable(row[kMinRowElements]);
        if (!table) {
            return table.error();
        }
        entry.matchTable = std::move(table).value();
    }

    return entry;
}

Result<MatchTable> SchemaDecoder::DecodeMatchTable(const json& args) {
    if (!args.is_array()) {
        return DecodeError::SchemaInvalidArgs;
    }

    MatchTable table;
    table.reserve(args.size());
    for (const auto& element : args) {
        if (!element.is_array() || element.size() != 2) {
            return DecodeError::SchemaInvalidArgsElement;
        }
        auto key = DecodeMatchKey(element[0]);
        if (!key) {
            return key.error();
        }
        if (!element[1].is_string()) {
            return DecodeError::SchemaInvalidArgsElement;
        }
        table.emplace_back(std::move(key).value(), element[1].get<std::string>());
    }
    return table;
}

Result<MatchKey> SchemaDecoder::DecodeMatchKey(const json& key) {
    if (key.is_number()) {
        if (!IsUnsigned(key)) {
            return DecodeError::SchemaInvalidArgsElement;
        }
        return MatchKey(ExactNumber{key.get<std::uint64_t>()});
    }
    if (key.is_string()) {
        return MatchKey(ExactString{key.get<std::string>()});
    }
    if (key.is_array()) {
        if (key.size() == 1 && key[0].is_string() && key[0].get<std::string>() == kWildcardToken) {
            return MatchKey(Wildcard{});
        }
        if (key.size() == 2 && IsUnsigned(key[0]) && IsUnsigned(key[1])) {
            return MatchKey(NumericRange{key[0].get<std::uint64_t>(), key[1].get<std::uint64_t>()});
        }
    }
    return DecodeError::SchemaInvalidArgsElement;
}

json SchemaDecoder::EncodeSchemaEntry(const SchemaEntry& entry) {
    json row = json::array({
        entry.imageName,
        ImageKindKeyword(entry.kind),
        entry.sourceTrait,
        MatchPatternKeyword(entry.pattern)
    });
    if (entry.matchTable) {
        json args = json::array();
        for (const auto& [key, content] : *entry.matchTable) {
            args.push_back(json::array({EncodeMatchKey(key), content}));
        }
        row.push_back(std::move(args));
    }
    return row;
}

json SchemaDecoder::EncodeSchema(const std::vector<SchemaEntry>& entries) {
    json rows = json::array();
    for (const auto& entry : entries) {
        rows.push_back(EncodeSchemaEntry(entry));
    }
    return rows;
}

} // namespace dobdecoder::application
