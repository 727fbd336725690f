/**
 * @file DecodeError.hpp
 * @brief Closed error taxonomy shared by every decoding stage.
 *
 * The numeric values are part of the process contract: they are returned
 * unchanged as the exit status of the decoder binary.
 */

#pragma once

#include <cstdint>
#include <string>

namespace dobdecoder::domain {

/**
 * @enum DecodeError
 * @brief Every fatal condition the decoder can report, with a stable code.
 */
enum class DecodeError : std::uint64_t {
    ParseInvalidArgCount = 1,       ///< Not exactly two input buffers.
    ParseInvalidDob0Output,         ///< Trait output buffer empty or malformed.
    ParseInvalidTraitsBase,         ///< Schema buffer is not an array of arrays.

    SchemaInsufficientElements,     ///< Row shorter than 4 elements.
    SchemaInvalidName,              ///< Image name is not a string.
    SchemaInvalidTraitName,         ///< Source trait is not a string.
    SchemaInvalidType,              ///< Kind keyword is not a string.
    SchemaTypeMismatch,             ///< Kind keyword is unknown.
    SchemaInvalidPattern,           ///< Pattern keyword is not a string.
    SchemaPatternMismatch,          ///< Pattern unknown or incompatible with the kind.
    SchemaInvalidArgs,              ///< Match table present but not an array.
    SchemaInvalidArgsElement,       ///< Malformed match table element.
    SchemaInvalidParsedTraitType,   ///< Match key scalar kind differs from the trait value.

    DecodeInvalidOptionArgs,        ///< Options/Range entry without a match table.
    DecodeInvalidRawValue,          ///< Raw pattern applied to a numeric trait.
    DecodeBadUtf8Format,            ///< Reserved.
    DecodeBadColorCodeFormat,       ///< Reserved.

    ComposeFailed                   ///< Compose collaborator returned no payload.
};

/** @brief Numeric code of an error, as surfaced to the host process. */
inline std::uint64_t ErrorCode(DecodeError error) {
    return static_cast<std::uint64_t>(error);
}

/**
 * @brief Symbolic name for logging.
 */
inline std::string DecodeErrorToString(DecodeError error) {
    switch (error) {
        case DecodeError::ParseInvalidArgCount: return "ParseInvalidArgCount";
        case DecodeError::ParseInvalidDob0Output: return "ParseInvalidDob0Output";
        case DecodeError::ParseInvalidTraitsBase: return "ParseInvalidTraitsBase";
        case DecodeError::SchemaInsufficientElements: return "SchemaInsufficientElements";
        case DecodeError::SchemaInvalidName: return "SchemaInvalidName";
        case DecodeError::SchemaInvalidTraitName: return "SchemaInvalidTraitName";
        case DecodeError::SchemaInvalidType: return "SchemaInvalidType";
        case DecodeError::SchemaTypeMismatch: return "SchemaTypeMismatch";
        case DecodeError::SchemaInvalidPattern: return "SchemaInvalidPattern";
        case DecodeError::SchemaPatternMismatch: return "SchemaPatternMismatch";
        case DecodeError::SchemaInvalidArgs: return "SchemaInvalidArgs";
        case DecodeError::SchemaInvalidArgsElement: return "SchemaInvalidArgsElement";
        case DecodeError::SchemaInvalidParsedTraitType: return "SchemaInvalidParsedTraitType";
        case DecodeError::DecodeInvalidOptionArgs: return "DecodeInvalidOptionArgs";
        case DecodeError::DecodeInvalidRawValue: return "DecodeInvalidRawValue";
        case DecodeError::DecodeBadUtf8Format: return "DecodeBadUtf8Format";
        case DecodeError::DecodeBadColorCodeFormat: return "DecodeBadColorCodeFormat";
        case DecodeError::ComposeFailed: return "ComposeFailed";
    }
    return "Unknown";
}

} // namespace dobdecoder::domain
