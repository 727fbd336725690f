/**
 * @file ImageComposer.hpp
 * @brief Interface for the external step that turns an item list into a rendered image.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <vector>

namespace dobdecoder::domain {

/**
 * @class ImageComposer
 * @brief Abstract compose collaborator. Buffer sizing is the implementation's concern.
 */
class ImageComposer {
public:
    virtual ~ImageComposer() = default;

    /**
     * @brief Composes one image from its encoded item list.
     * @param itemBytes Output of ItemEncoder::EncodeItemList.
     * @return Rendered payload (format opaque to the decoder), or nullopt on failure.
     */
    virtual std::optional<std::vector<std::uint8_t>> compose(const std::vector<std::uint8_t>& itemBytes) = 0;
};

} // namespace dobdecoder::domain
