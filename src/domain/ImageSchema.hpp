/**
 * @file ImageSchema.hpp
 * @brief Strongly-typed schema entries describing how traits map to image layers.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace dobdecoder::domain {

/**
 * @enum ImageKind
 * @brief How the matched content string must be interpreted by the compose step.
 */
enum class ImageKind {
    ColorCode,  ///< "#RRGGBB"-style colour fill.
    URI,        ///< Reference to external content (btcfs://, ipfs://, http...).
    RawImage    ///< Inline image payload.
};

/**
 * @enum MatchPattern
 * @brief Strategy used to turn a resolved trait value into content.
 */
enum class MatchPattern {
    Options,    ///< Exact lookup in the match table.
    Range,      ///< Numeric range lookup in the match table.
    Raw         ///< Trait string passed through unchanged.
};

/** @brief Match key accepting one exact string. */
struct ExactString {
    std::string text;
    bool operator==(const ExactString& other) const { return text == other.text; }
};

/** @brief Match key accepting one exact number. */
struct ExactNumber {
    std::uint64_t value;
    bool operator==(const ExactNumber& other) const { return value == other.value; }
};

/** @brief Match key accepting any number in [start, end]. */
struct NumericRange {
    std::uint64_t start;
    std::uint64_t end;
    bool operator==(const NumericRange& other) const { return start == other.start && end == other.end; }
};

/** @brief Match key accepting anything. */
struct Wildcard {
    bool operator==(const Wildcard&) const { return true; }
};

using MatchKey = std::variant<ExactString, ExactNumber, NumericRange, Wildcard>;

/**
 * @brief Ordered (key, content) pairs. Declaration order decides which key wins.
 */
using MatchTable = std::vector<std::pair<MatchKey, std::string>>;

/**
 * @struct SchemaEntry
 * @brief One declared layer of a named output image.
 */
struct SchemaEntry {
    std::string imageName;              ///< Target image; adjacent entries with the same name stack.
    ImageKind kind;
    std::string sourceTrait;            ///< Trait consulted in the trait output.
    MatchPattern pattern;
    std::optional<MatchTable> matchTable; ///< Required for Options/Range, unused for Raw.

    bool operator==(const SchemaEntry& other) const {
        return imageName == other.imageName && kind == other.kind &&
               sourceTrait == other.sourceTrait && pattern == other.pattern &&
               matchTable == other.matchTable;
    }
};

/** @brief Schema keyword for a kind ("color", "uri", "image"). */
inline const char* ImageKindKeyword(ImageKind kind) {
    switch (kind) {
        case ImageKind::ColorCode: return "color";
        case ImageKind::URI: return "uri";
        case ImageKind::RawImage: return "image";
    }
    return "color";
}

/** @brief Schema keyword for a pattern ("options", "range", "raw"). */
inline const char* MatchPatternKeyword(MatchPattern pattern) {
    switch (pattern) {
        case MatchPattern::Options: return "options";
        case MatchPattern::Range: return "range";
        case MatchPattern::Raw: return "raw";
    }
    return "options";
}

inline std::optional<ImageKind> ImageKindFromKeyword(const std::string& keyword) {
    if (keyword == "color") return ImageKind::ColorCode;
    if (keyword == "uri") return ImageKind::URI;
    if (keyword == "image") return ImageKind::RawImage;
    return std::nullopt;
}

inline std::optional<MatchPattern> MatchPatternFromKeyword(const std::string& keyword) {
    if (keyword == "options") return MatchPattern::Options;
    if (keyword == "range") return MatchPattern::Range;
    if (keyword == "raw") return MatchPattern::Raw;
    return std::nullopt;
}

/**
 * @brief Legal (kind, pattern) combinations.
 *
 * Options and Range select colours or URIs; Raw passes through image payloads or URIs.
 */
inline bool IsCompatible(ImageKind kind, MatchPattern pattern) {
    switch (pattern) {
        case MatchPattern::Options:
        case MatchPattern::Range:
            return kind == ImageKind::ColorCode || kind == ImageKind::URI;
        case MatchPattern::Raw:
            return kind == ImageKind::RawImage || kind == ImageKind::URI;
    }
    return false;
}

} // namespace dobdecoder::domain
