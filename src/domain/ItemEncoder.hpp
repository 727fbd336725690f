/**
 * @file ItemEncoder.hpp
 * @brief Type-tagged binary records handed to the compose step.
 *
 * Wire layout (little-endian, molecule compatible):
 *  - Bytes   : u32 length, then the raw bytes.
 *  - Item    : u32 tag (ColorCode=0, URI=1, RawImage=2), then a Bytes payload.
 *  - ItemVec : u32 total size, one u32 offset per item (from the start of the
 *              vector), then the items back to back. Empty list = 04 00 00 00.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "domain/ImageSchema.hpp"

namespace dobdecoder::domain {

/**
 * @enum ItemTag
 * @brief Union tag of an encoded item, mirrors ImageKind.
 */
enum class ItemTag : std::uint32_t {
    ColorCode = 0,
    URI = 1,
    RawImage = 2
};

inline ItemTag TagForKind(ImageKind kind) {
    switch (kind) {
        case ImageKind::ColorCode: return ItemTag::ColorCode;
        case ImageKind::URI: return ItemTag::URI;
        case ImageKind::RawImage: return ItemTag::RawImage;
    }
    return ItemTag::ColorCode;
}

/**
 * @struct EncodedItem
 * @brief One resolved layer: a tag plus the matched content's raw bytes.
 */
struct EncodedItem {
    ItemTag tag;
    std::string payload;

    bool operator==(const EncodedItem& other) const { return tag == other.tag && payload == other.payload; }
};

using ItemList = std::vector<EncodedItem>;

class ItemEncoder {
public:
    /** @brief Wraps a matched content string into an item tagged by @p kind. */
    static EncodedItem Wrap(ImageKind kind, const std::string& content);

    /** @brief Largest list the u32 total-size header can describe. */
    static constexpr std::uint64_t MaxListSize = UINT32_MAX;

    /** @brief Size in bytes of the encoded list, computed without u32 wrap-around. */
    static std::uint64_t EncodedSize(const ItemList& items);

    /**
     * @brief Serializes an ordered item list into its binary form.
     * @throws std::length_error if EncodedSize(items) exceeds MaxListSize.
     */
    static std::vector<std::uint8_t> EncodeItemList(const ItemList& items);

    /**
     * @brief Parses a binary item list, checking every size and offset.
     * @return nullopt if the buffer is not a well-formed item list.
     */
    static std::optional<ItemList> DecodeItemList(const std::vector<std::uint8_t>& bytes);
};

} // namespace dobdecoder::domain
