/**
 * @file ParameterParser.cpp
 * @brief Implementation of ParameterParser.
 */

#include "application/ParameterParser.hpp"
#include "application/SchemaDecoder.hpp"

#include <iostream>
#include <optional>
#include <utility>

namespace dobdecoder::application {

using json = nlohmann::json;
using namespace dobdecoder::domain;

namespace {

const char* const kStringVariant = "String";
const char* const kNumberVariant = "Number";

std::optional<json> ParseJson(const std::string& buffer, const char* label) {
    try {
        return json::parse(buffer);
    } catch (const json::exception& e) {
        std::cerr << "[ParameterParser] Malformed " << label << ": " << e.what() << std::endl;
        return std::nullopt;
    }
}

// Externally tagged scalar: exactly one of {"String": str} or {"Number": u64}.
std::optional<ScalarTraitValue> DecodeScalar(const json& value) {
    if (!value.is_object() || value.size() != 1) return std::nullopt;
    auto it = value.begin();
    const std::string& tag = it.key();
    const json& payload = it.value();
    if (tag == kStringVariant && payload.is_string()) {
        return ScalarTraitValue(payload.get<std::string>());
    }
    if (tag == kNumberVariant && payload.is_number_unsigned()) {
        return ScalarTraitValue(payload.get<std::uint64_t>());
    }
    return std::nullopt;
}

std::optional<TraitOutput> DecodeTraitOutput(const json& entry) {
    if (!entry.is_object()) return std::nullopt;
    if (!entry.contains("name") || !entry["name"].is_string()) return std::nullopt;
    if (!entry.contains("traits") || !entry["traits"].is_array()) return std::nullopt;

    TraitOutput output;
    output.name = entry["name"].get<std::string>();
    output.traits.reserve(entry["traits"].size());
    for (const auto& value : entry["traits"]) {
        auto scalar = DecodeScalar(value);
        if (!scalar) return std::nullopt;
        output.traits.push_back(std::move(*scalar));
    }
    return output;
}

} // namespace

Result<TraitTable> ParameterParser::ParseTraitOutput(const std::string& buffer) {
    if (buffer.empty()) {
        return DecodeError::ParseInvalidDob0Output;
    }
    auto document = ParseJson(buffer, "trait output");
    if (!document || !document->is_array()) {
        return DecodeError::ParseInvalidDob0Output;
    }

    TraitTable table;
    table.reserve(document->size());
    for (const auto& entry : *document) {
        auto output = DecodeTraitOutput(entry);
        if (!output) {
            return DecodeError::ParseInvalidDob0Output;
        }
        table.push_back(std::move(*output));
    }
    return table;
}

Result<Parameters> ParameterParser::ParseParameters(const std::vector<std::string>& inputs) {
    if (inputs.size() != ExpectedInputCount) {
        return DecodeError::ParseInvalidArgCount;
    }

    auto traits = ParseTraitOutput(inputs[0]);
    if (!traits) {
        return traits.error();
    }

    auto rows = ParseJson(inputs[1], "trait schema");
    if (!rows) {
        return DecodeError::ParseInvalidTraitsBase;
    }
    auto schema = SchemaDecoder::DecodeSchema(*rows);
    if (!schema) {
        return schema.error();
    }

    Parameters parameters;
    parameters.traitOutput = std::move(traits).value();
    parameters.schema = std::move(schema).value();
    return parameters;
}

json ParameterParser::EncodeTraitOutput(const TraitTable& table) {
    json out = json::array();
    for (const auto& output : table) {
        json traits = json::array();
        for (const auto& value : output.traits) {
            if (const auto* text = std::get_if<std::string>(&value)) {
                traits.push_back(json::object({{kStringVariant, *text}}));
            } else {
                traits.push_back(json::object({{kNumberVariant, std::get<std::uint64_t>(value)}}));
            }
        }
        out.push_back(json::object({{"name", output.name}, {"traits", std::move(traits)}}));
    }
    return out;
}

} // namespace dobdecoder::application
